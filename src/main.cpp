/**
 * @file main.cpp
 * @brief netbeacond: long-running beaconing daemon.
 *
 * Responsibilities:
 *  - Merge configuration: defaults, then `--config <file>`, then command line options.
 *  - Open the multicast socket, build the engine and the interface monitor.
 *  - Run one poll(2) loop over the socket and the observer pipes; every wakeup drains
 *    the socket, services the monitor and ticks the engine until its inbox is empty.
 *  - After every multicast round, write the current hints to `hints_path` (if set).
 *  - On SIGINT/SIGTERM: stop the monitor (observers die, interfaces clear), stop the
 *    engine (groups left, socket closed), exit 0.
 *
 * Exit codes: 0 clean stop, 1 runtime failure, 2 usage/config error, 3 socket unavailable.
 */

#include <algorithm>        // std::min
#include <cerrno>
#include <chrono>
#include <csignal>          // sigaction
#include <cstdint>
#include <cstring>          // strerror
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <poll.h>           // poll()

#include "CLI/CLI11.hpp"

#include "netbeacon/config.hpp"
#include "netbeacon/engine.hpp"
#include "netbeacon/interface_monitor.hpp"
#include "netbeacon/interfaces.hpp"
#include "netbeacon/log.hpp"
#include "netbeacon/observer.hpp"
#include "netbeacon/transport/transport_udp_multicast.hpp"

using namespace netbeacon;

static constexpr uint64_t LOOP_CAP_MS = 1000;   // longest poll() sleep

static volatile std::sig_atomic_t g_stop = 0;

static void on_signal(int) { g_stop = 1; }

static bool install_signal_handlers() {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  return ::sigaction(SIGINT, &sa, nullptr) == 0 && ::sigaction(SIGTERM, &sa, nullptr) == 0;
}

static uint64_t now_ms_system() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

// CLI11 has already range-checked `s` against MAX_DURATION_SECONDS.
static uint64_t seconds_opt(double s) {
  return s <= 0 ? 0 : static_cast<uint64_t>(s * 1000.0 + 0.5);
}

static void write_hints(const std::string& path, BeaconingEngine& engine, uint64_t now_ms) {
  if (path.empty()) return;
  std::string err;
  if (!write_json_atomic(path, engine.topology_hints_json(now_ms), err)) {
    logger()->error("beaconing: cannot write hints: {}", err);
  }
}

int main(int argc, char** argv) {
  CLI::App app{"netbeacond: network fabric discovery by multicast beaconing"};

  std::string config_path;
  std::string bind_address, observer_command, interfaces_file, lock_path, hints_path, log_level;
  uint16_t port = 0;
  double aging_s = 0, min_interval_s = 0, solicit_s = 0, refresh_s = 0;
  std::vector<std::string> monitor_ifs;
  bool loopback = false, process_socket = false, no_lock = false;

  app.add_option("--config", config_path, "JSON config file")->check(CLI::ExistingFile);
  auto* o_bind     = app.add_option("--bind", bind_address, "Bind address (default ::)");
  auto* o_port     = app.add_option("--port", port, "UDP port (default 5240, 0 = ephemeral)");
  auto* o_if       = app.add_option("--interface", monitor_ifs, "Only monitor these interfaces (repeatable)");
  auto* o_iffile   = app.add_option("--interfaces-file", interfaces_file,
                                    "Read the interface inventory from a JSON file instead of the system");
  auto* o_observer = app.add_option("--observer-command", observer_command,
                                    "Observer command template, {ifname} is substituted (\"\" = none)");
  auto* o_lock     = app.add_option("--lock-file", lock_path, "Host lock file for interface monitoring");
  auto* o_hints    = app.add_option("--hints-file", hints_path, "Write topology hints JSON here");
  auto* o_level    = app.add_option("--log-level", log_level, "Log level")
                        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
  auto* o_aging    = app.add_option("--aging-window", aging_s, "Aging window (seconds)")
                        ->check(CLI::PositiveNumber & CLI::Range(0.0, MAX_DURATION_SECONDS));
  auto* o_min      = app.add_option("--min-interval", min_interval_s, "Minimum multicast interval (seconds)")
                        ->check(CLI::Range(0.0, MAX_DURATION_SECONDS));
  auto* o_solicit  = app.add_option("--solicitation-interval", solicit_s,
                                    "Periodic solicitation interval (seconds, 0 disables)")
                        ->check(CLI::Range(0.0, MAX_DURATION_SECONDS));
  auto* o_refresh  = app.add_option("--refresh-interval", refresh_s, "Interface refresh interval (seconds)")
                        ->check(CLI::PositiveNumber & CLI::Range(0.0, MAX_DURATION_SECONDS));
  app.add_flag("--loopback", loopback, "Loop own multicast back to this host");
  app.add_flag("--process-socket-beacons", process_socket, "Process beacons read from the socket");
  app.add_flag("--no-lock", no_lock, "Do not take the host lock");

  CLI11_PARSE(app, argc, argv);

  // -------- configuration: defaults < file < options --------
  Config cfg;
  if (!config_path.empty()) {
    std::string err;
    if (!load_config(config_path, cfg, err)) {
      std::cerr << "status=error reason=bad_config detail=\"" << err << "\"\n";
      return 2;
    }
  }
  if (o_bind->count())     cfg.bind_address = bind_address;
  if (o_port->count())     cfg.port = port;
  if (o_if->count())       cfg.monitor_interfaces = monitor_ifs;
  if (o_iffile->count())   cfg.interfaces_file = interfaces_file;
  if (o_observer->count()) cfg.observer_command = observer_command;
  if (o_lock->count())     cfg.lock_path = lock_path;
  if (o_hints->count())    cfg.hints_path = hints_path;
  if (o_level->count())    cfg.log_level = log_level;
  if (o_aging->count())    cfg.aging_window_ms = seconds_opt(aging_s);
  if (o_min->count())      cfg.min_broadcast_interval_ms = seconds_opt(min_interval_s);
  if (o_solicit->count())  cfg.solicitation_interval_ms = seconds_opt(solicit_s);
  if (o_refresh->count())  cfg.interface_refresh_ms = seconds_opt(refresh_s);
  if (loopback)            cfg.loopback = true;
  if (process_socket)      cfg.process_socket_beacons = true;
  if (no_lock)             cfg.lock_path.clear();

  if (!set_log_level(cfg.log_level)) {
    std::cerr << "status=error reason=bad_log_level level=" << cfg.log_level << "\n";
    return 2;
  }
  if (!install_signal_handlers()) {
    std::cerr << "status=error reason=sigaction detail=\"" << std::strerror(errno) << "\"\n";
    return 1;
  }

  // -------- transport --------
  auto udp = std::make_unique<transport::UdpMulticast>();
  if (!udp->begin(cfg.transport_config())) {
    std::cerr << "status=error reason=socket_unavailable detail=\"" << udp->last_error() << "\"\n";
    return 3;
  }
  logger()->info("transport: listening on [{}]:{}", cfg.bind_address, udp->local_port());

  // -------- engine + monitor --------
  BeaconingEngine engine(std::move(udp), cfg.engine_options());

  auto inventory = [&cfg](InterfaceMap& out, std::string& err) {
    if (cfg.interfaces_file.empty()) return read_system_interfaces(out, err);
    json j;
    if (!read_json_file(cfg.interfaces_file, j, err)) return false;
    return interfaces_from_json(j, out, err);
  };

  auto on_observation = [&engine](json obs) {
    if (!engine.add_event(Event::observation_received(std::move(obs)))) {
      logger()->debug("beaconing: inbox full, dropping observation");
    }
  };

  auto factory = [&cfg, on_observation](const std::string& ifname) -> std::unique_ptr<IObserver> {
    if (cfg.observer_command.empty()) return nullptr;
    return std::make_unique<ObserverProcess>(ifname, expand_observer_command(cfg.observer_command, ifname),
                                             cfg.observer_restart_ms, on_observation);
  };

  auto sink = [&engine](Event ev) { return engine.add_event(std::move(ev)); };

  InterfaceMonitor monitor(inventory, factory, sink, cfg.monitor_options());

  // -------- main loop --------
  int exit_code = 0;
  uint64_t rounds_written = 0;

  while (!g_stop) {
    uint64_t now = now_ms_system();

    std::vector<pollfd> pfds;
    if (auto* t = engine.transport(); t && t->fd() >= 0) pfds.push_back({t->fd(), POLLIN, 0});
    for (int fd : monitor.fds()) pfds.push_back({fd, POLLIN, 0});

    uint64_t wait = engine.next_timeout_ms(now, LOOP_CAP_MS);
    const uint64_t refresh_at = monitor.next_refresh_ms();
    wait = std::min(wait, refresh_at > now ? refresh_at - now : 0);

    const int rc = ::poll(pfds.data(), pfds.size(), static_cast<int>(wait));
    if (rc < 0 && errno != EINTR) {
      logger()->error("poll: {}", std::strerror(errno));
      exit_code = 1;
      break;
    }

    now = now_ms_system();
    engine.poll_transport(now);
    monitor.service(now);
    do {
      engine.tick(now);
    } while (engine.inbox_size() > 0);

    if (engine.counters().multicast_rounds != rounds_written) {
      rounds_written = engine.counters().multicast_rounds;
      write_hints(cfg.hints_path, engine, now);
    }
  }

  // -------- shutdown --------
  logger()->info("beaconing: shutting down");
  monitor.stop();
  const uint64_t now = now_ms_system();
  while (engine.inbox_size() > 0) engine.tick(now);
  write_hints(cfg.hints_path, engine, now);
  engine.stop();

  const auto& c = engine.counters();
  logger()->info("beaconing: sent={} failed={} received={} rejected={} rounds={}",
                 c.beacons_sent, c.send_failures, c.beacons_received, c.beacons_rejected,
                 c.multicast_rounds);
  return exit_code;
}
