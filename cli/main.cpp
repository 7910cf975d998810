/**
 * @file main.cpp
 * @brief netbeacon-cli: one-shot operator tool around netbeacon::BeaconingEngine.
 *
 * Subcommands:
 *  - send     Bind an ephemeral port, send one solicitation round on every enabled (or the
 *             named) interfaces, listen for --timeout seconds, print the hints as JSON.
 *             With --verbose the beacons seen are printed as well.
 *  - observe  Read observer JSON lines (stdin or --input-file), feed them to an engine
 *             without a socket, print the hints.
 *  - decode   Decode one hex-encoded beacon datagram and print it as JSON.
 *
 * Notes:
 *  - Output goes to stdout as JSON; failures go to stderr as `status=error reason=...`.
 *  - Exit codes: 1 runtime failure, 2 usage/input error, 3 socket unavailable.
 */

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <poll.h> // poll()

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "netbeacon/beacon.hpp"
#include "netbeacon/config.hpp"
#include "netbeacon/engine.hpp"
#include "netbeacon/interfaces.hpp"
#include "netbeacon/log.hpp"
#include "netbeacon/observer.hpp"
#include "netbeacon/transport/transport_udp_multicast.hpp"
#include "netbeacon/uuid.hpp"

using namespace netbeacon;

// ---------- small utilities ----------

static uint64_t now_ms_system() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static int fail(const std::string& reason, const std::string& detail, int code) {
  std::cerr << "status=error reason=" << reason;
  if (!detail.empty()) std::cerr << " detail=\"" << detail << "\"";
  std::cerr << "\n";
  return code;
}

// Inventory from a JSON file if given, the live system otherwise; then narrowed to `only`.
static bool load_inventory(const std::string& file, const std::vector<std::string>& only,
                           InterfaceMap& out, std::string& err) {
  InterfaceMap all;
  if (file.empty()) {
    if (!read_system_interfaces(all, err)) return false;
  } else {
    json j;
    if (!read_json_file(file, j, err)) return false;
    if (!interfaces_from_json(j, all, err)) return false;
  }
  if (only.empty()) { out = std::move(all); return true; }

  out.clear();
  for (const auto& name : only) {
    auto it = all.find(name);
    if (it == all.end()) {
      err = "unknown interface: " + name;
      return false;
    }
    out.insert(*it);
  }
  return true;
}

// "0x" prefix and whitespace are tolerated.
static bool parse_hex(const std::string& text, std::vector<uint8_t>& out) {
  std::string digits;
  for (char c : text) if (!std::isspace(static_cast<unsigned char>(c))) digits.push_back(c);
  if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) digits.erase(0, 2);
  if (digits.size() % 2 != 0) return false;

  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  out.clear();
  for (size_t i = 0; i < digits.size(); i += 2) {
    const int hi = nibble(digits[i]), lo = nibble(digits[i + 1]);
    if (hi < 0 || lo < 0) return false;
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return true;
}

static json seen_beacons(const BeaconingEngine& engine) {
  json arr = json::array();
  for (const auto& e : engine.rx_queue())
    for (const auto& rx : e.value) arr.push_back(rx.observation);
  return arr;
}

static void print_result(BeaconingEngine& engine, uint64_t now_ms, bool verbose) {
  json hints = engine.topology_hints_json(now_ms);
  if (!verbose) {
    std::cout << hints.dump(2) << "\n";
    return;
  }
  json out;
  out["hints"]   = std::move(hints);
  out["beacons"] = seen_beacons(engine);
  const auto& c  = engine.counters();
  out["counters"] = {{"sent", c.beacons_sent}, {"send_failures", c.send_failures},
                     {"received", c.beacons_received}, {"rejected", c.beacons_rejected}};
  std::cout << out.dump(2) << "\n";
}

// ---------- send ----------

struct SendArgs {
  std::vector<std::string> interfaces;
  std::string interfaces_file;
  std::string bind_address{"::"};
  uint16_t    port{BEACON_PORT};
  uint16_t    source_port{0};
  double      timeout_s{5.0};
  bool        loopback{false};
  bool        verbose{false};
};

static int run_send(const SendArgs& a) {
  InterfaceMap ifs;
  std::string err;
  if (!load_inventory(a.interfaces_file, a.interfaces, ifs, err)) return fail("interfaces", err, 2);

  transport::Config tc;
  tc.bind_address = a.bind_address;
  tc.port         = a.source_port;
  tc.group_port   = a.port;
  tc.loopback     = a.loopback;

  auto udp = std::make_unique<transport::UdpMulticast>();
  if (!udp->begin(tc)) return fail("socket_unavailable", udp->last_error(), 3);
  logger()->info("transport: bound to [{}]:{}", a.bind_address, udp->local_port());

  BeaconingEngine::Options opts;
  opts.process_socket_beacons   = true;
  opts.solicitation_interval_ms = 0;          // exactly one round

  BeaconingEngine engine(std::move(udp), opts);
  uint64_t now = now_ms_system();
  engine.update_interfaces(ifs, now);         // queues the solicitation round
  engine.tick(now);

  const uint64_t deadline = now + static_cast<uint64_t>(a.timeout_s * 1000.0);
  while (now < deadline) {
    pollfd p{engine.transport()->fd(), POLLIN, 0};
    const int rc = ::poll(&p, 1, static_cast<int>(engine.next_timeout_ms(now, deadline - now)));
    if (rc < 0 && errno != EINTR) return fail("poll", std::strerror(errno), 1);
    now = now_ms_system();
    engine.poll_transport(now);
    do {
      engine.tick(now);
    } while (engine.inbox_size() > 0);
  }

  if (engine.counters().beacons_sent == 0) {
    logger()->warn("beaconing: no beacon could be sent");
  }
  print_result(engine, now, a.verbose);
  engine.stop();
  return 0;
}

// ---------- observe ----------

struct ObserveArgs {
  std::string input_file;
  std::string interface;
  std::string interfaces_file;
  bool        replay{false};
  bool        verbose{false};
};

static int run_observe(const ObserveArgs& a) {
  BeaconingEngine engine(nullptr);
  uint64_t now = now_ms_system();

  if (!a.interfaces_file.empty()) {
    InterfaceMap ifs;
    std::string err;
    if (!load_inventory(a.interfaces_file, {}, ifs, err)) return fail("interfaces", err, 2);
    engine.update_interfaces(ifs, now);
    engine.tick(now);
  }

  size_t dropped = 0;
  auto on_object = [&](json obs) {
    if (a.replay) {
      // Old captures: the beacon's own creation time is the clock.
      int64_t t = 0;
      auto p = obs.find("payload");
      if (p != obs.end() && p->is_object()) {
        auto u = p->find("uuid");
        if (u != p->end() && u->is_string() && uuid_to_timestamp(u->get<std::string>(), t) && t > 0)
          now = std::max(now, static_cast<uint64_t>(t));
      }
    }
    if (!engine.add_event(Event::observation_received(std::move(obs)))) { ++dropped; return; }
    while (engine.inbox_size() > 0) engine.tick(now);
  };
  if (a.replay) now = 0;

  ObserverLineBuffer lines(a.interface, on_object);

  std::ifstream file;
  if (!a.input_file.empty()) {
    file.open(a.input_file);
    if (!file) return fail("input", a.input_file + ": " + std::strerror(errno), 2);
  }
  std::istream& in = a.input_file.empty() ? std::cin : file;

  char chunk[4096];
  while (in.read(chunk, sizeof(chunk)) || in.gcount() > 0) {
    lines.feed(chunk, static_cast<size_t>(in.gcount()));
  }
  lines.flush();

  if (dropped) logger()->warn("beaconing: {} observation(s) dropped", dropped);
  if (lines.malformed()) logger()->warn("monitor: {} malformed line(s) skipped", lines.malformed());

  print_result(engine, now, a.verbose);
  return 0;
}

// ---------- decode ----------

static int run_decode(const std::string& hex) {
  std::vector<uint8_t> bytes;
  if (!parse_hex(hex, bytes)) return fail("bad_hex", "", 2);

  BeaconPayload beacon;
  std::string err;
  if (!decode_beacon(bytes, beacon, err)) return fail("decode_failed", err, 1);
  std::cout << beacon_to_json(beacon).dump(2) << "\n";
  return 0;
}

int main(int argc, char** argv) {
  CLI::App app{"netbeacon-cli: send, observe and decode network beacons"};
  app.require_subcommand(1);

  std::string log_level = "warn";
  app.add_option("--log-level", log_level, "Log level")
     ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));

  SendArgs sa;
  CLI::App* send = app.add_subcommand("send", "Send a solicitation round and collect hints");
  send->add_option("-i,--interface", sa.interfaces, "Interface to send on (repeatable, default all enabled)");
  send->add_option("--interfaces-file", sa.interfaces_file, "Interface inventory JSON instead of the system");
  send->add_option("--bind", sa.bind_address, "Bind address");
  send->add_option("-p,--port", sa.port, "Destination port of the multicast group");
  send->add_option("--source-port", sa.source_port, "Local port (0 = ephemeral)");
  send->add_option("-t,--timeout", sa.timeout_s, "Seconds to listen for replies")->check(CLI::NonNegativeNumber);
  send->add_flag("--loopback", sa.loopback, "Also receive our own multicast");
  send->add_flag("-v,--verbose", sa.verbose, "Print beacons seen and counters");

  ObserveArgs oa;
  CLI::App* observe = app.add_subcommand("observe", "Compute hints from observer JSON lines");
  observe->add_option("--input-file", oa.input_file, "Read lines from a file instead of stdin");
  observe->add_option("-i,--interface", oa.interface, "Stamp this receiving interface on every line");
  observe->add_option("--interfaces-file", oa.interfaces_file, "Interface inventory JSON");
  observe->add_flag("--replay", oa.replay, "Use each beacon's UUID time as the clock (old captures)");
  observe->add_flag("-v,--verbose", oa.verbose, "Print beacons seen and counters");

  std::string hex;
  CLI::App* decode = app.add_subcommand("decode", "Decode a hex-encoded beacon datagram");
  decode->add_option("hex", hex, "Datagram bytes as hex")->required();

  CLI11_PARSE(app, argc, argv);

  if (!set_log_level(log_level)) return fail("bad_log_level", log_level, 2);

  if (send->parsed())    return run_send(sa);
  if (observe->parsed()) return run_observe(oa);
  if (decode->parsed())  return run_decode(hex);

  std::cerr << "status=error reason=need_exactly_one_command\n";
  return 2;
}
