// ============================================================================
// config.cpp - implementation for config.hpp
// For the key table see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "netbeacon/config.hpp"
#include "netbeacon/log.hpp"

#include <cmath>          // std::isfinite for the seconds keys
#include <cstdio>         // std::rename
#include <cstring>        // strerror
#include <filesystem>     // parent directory creation
#include <fstream>        // file read/write
#include <system_error>   // non-throwing filesystem ops

namespace fs = std::filesystem;
namespace netbeacon {

// ---------- derived option sets ----------

transport::Config Config::transport_config() const {
  transport::Config t;
  t.bind_address = bind_address;
  t.port         = port;
  t.ipv4_group   = ipv4_group;
  t.ipv6_group   = ipv6_group;
  t.loopback     = loopback;
  return t;
}

BeaconingEngine::Options Config::engine_options() const {
  BeaconingEngine::Options o;
  o.aging_window_ms           = aging_window_ms;
  o.min_broadcast_interval_ms = min_broadcast_interval_ms;
  o.solicitation_interval_ms  = solicitation_interval_ms;
  o.process_socket_beacons    = process_socket_beacons;
  return o;
}

InterfaceMonitor::Options Config::monitor_options() const {
  InterfaceMonitor::Options o;
  o.refresh_interval_ms = interface_refresh_ms;
  o.monitor_interfaces  = monitor_interfaces;
  o.lock_path           = lock_path;
  return o;
}

// -------- helpers --------

static bool seconds_to_ms(const json& v, const char* key, uint64_t& out, std::string& err) {
  if (!v.is_number()) {
    err = std::string(key) + ": expected a number of seconds";
    return false;
  }
  const double s = v.get<double>();
  if (!std::isfinite(s) || s < 0) {
    err = std::string(key) + ": must be a non-negative number";
    return false;
  }
  if (s > MAX_DURATION_SECONDS) {
    err = std::string(key) + ": more than a year";
    return false;
  }
  out = static_cast<uint64_t>(s * 1000.0 + 0.5);
  return true;
}

static bool valid_log_level(const std::string& s) {
  static const char* LEVELS[] = {"trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};
  for (const char* l : LEVELS) if (s == l) return true;
  return false;
}

// ---------------------------------------------------------------------------
// apply_config_json()
// -------------------
// Works on a copy and only commits when every key checked out, so a bad file
// never leaves a half-applied config behind.
// ---------------------------------------------------------------------------
bool apply_config_json(const json& j, Config& cfg, std::string& err) {
  if (!j.is_object()) {
    err = "config: root must be an object";
    return false;
  }

  Config c = cfg;
  try {
    for (auto it = j.begin(); it != j.end(); ++it) {
      const std::string& k = it.key();
      const json& v = it.value();

      if      (k == "bind_address") c.bind_address = v.get<std::string>();
      else if (k == "port") {
        if (!v.is_number_unsigned() || v.get<uint64_t>() > 0xFFFF) {
          err = "config: port: expected an integer in 0..65535";
          return false;
        }
        c.port = static_cast<uint16_t>(v.get<uint64_t>());
      }
      else if (k == "ipv4_group")   c.ipv4_group = v.get<std::string>();
      else if (k == "ipv6_group")   c.ipv6_group = v.get<std::string>();
      else if (k == "loopback")     c.loopback = v.get<bool>();
      else if (k == "aging_window_seconds") {
        if (!seconds_to_ms(v, k.c_str(), c.aging_window_ms, err)) return false;
      }
      else if (k == "min_broadcast_interval_seconds") {
        if (!seconds_to_ms(v, k.c_str(), c.min_broadcast_interval_ms, err)) return false;
      }
      else if (k == "solicitation_interval_seconds") {
        if (!seconds_to_ms(v, k.c_str(), c.solicitation_interval_ms, err)) return false;
      }
      else if (k == "interface_refresh_seconds") {
        if (!seconds_to_ms(v, k.c_str(), c.interface_refresh_ms, err)) return false;
      }
      else if (k == "observer_restart_seconds") {
        if (!seconds_to_ms(v, k.c_str(), c.observer_restart_ms, err)) return false;
      }
      else if (k == "observer_command")       c.observer_command = v.get<std::string>();
      else if (k == "process_socket_beacons") c.process_socket_beacons = v.get<bool>();
      else if (k == "monitor_interfaces")     c.monitor_interfaces = v.get<std::vector<std::string>>();
      else if (k == "interfaces_file")        c.interfaces_file = v.get<std::string>();
      else if (k == "lock_path")              c.lock_path = v.get<std::string>();
      else if (k == "hints_path")             c.hints_path = v.get<std::string>();
      else if (k == "log_level") {
        c.log_level = v.get<std::string>();
        if (!valid_log_level(c.log_level)) {
          err = "config: log_level: unknown level '" + c.log_level + "'";
          return false;
        }
      }
      else {
        logger()->warn("config: ignoring unknown key '{}'", k);
      }
    }
  } catch (const json::type_error& e) {
    err = std::string("config: ") + e.what();
    return false;
  }

  if (c.aging_window_ms == 0) {
    err = "config: aging_window_seconds must be greater than zero";
    return false;
  }

  cfg = std::move(c);
  return true;
}

bool read_json_file(const std::string& path, json& out, std::string& err) {
  std::ifstream in(path);
  if (!in) {
    err = "cannot open " + path + ": " + std::strerror(errno);
    return false;
  }
  try {
    in >> out;
  } catch (const json::parse_error& e) {
    err = path + ": " + e.what();
    return false;
  }
  return true;
}

bool load_config(const std::string& path, Config& cfg, std::string& err) {
  json j;
  if (!read_json_file(path, j, err)) return false;
  return apply_config_json(j, cfg, err);
}

json config_to_json(const Config& c) {
  json j = json::object();
  j["bind_address"]                   = c.bind_address;
  j["port"]                           = c.port;
  j["ipv4_group"]                     = c.ipv4_group;
  j["ipv6_group"]                     = c.ipv6_group;
  j["loopback"]                       = c.loopback;
  j["aging_window_seconds"]           = c.aging_window_ms / 1000.0;
  j["min_broadcast_interval_seconds"] = c.min_broadcast_interval_ms / 1000.0;
  j["solicitation_interval_seconds"]  = c.solicitation_interval_ms / 1000.0;
  j["interface_refresh_seconds"]      = c.interface_refresh_ms / 1000.0;
  j["observer_restart_seconds"]       = c.observer_restart_ms / 1000.0;
  j["observer_command"]               = c.observer_command;
  j["process_socket_beacons"]         = c.process_socket_beacons;
  j["monitor_interfaces"]             = c.monitor_interfaces;
  j["interfaces_file"]                = c.interfaces_file;
  j["lock_path"]                      = c.lock_path;
  j["hints_path"]                     = c.hints_path;
  j["log_level"]                      = c.log_level;
  return j;
}

// ---------------------------------------------------------------------------
// write_json_atomic()
// -------------------
// Readers never see a half-written file: write the temp file fully, then
// rename(2) over the target (atomic within one filesystem).
// ---------------------------------------------------------------------------
bool write_json_atomic(const std::string& path, const json& j, std::string& err) {
  const fs::path p(path);
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
    if (ec) {
      err = "create " + p.parent_path().string() + ": " + ec.message();
      return false;
    }
  }

  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      err = "cannot open " + tmp + ": " + std::strerror(errno);
      return false;
    }
    out << j.dump(2) << "\n";
    out.flush();
    if (!out) {
      err = "write failed: " + tmp;
      return false;
    }
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    err = "rename " + tmp + " -> " + path + ": " + std::strerror(errno);
    return false;
  }
  return true;
}

} // namespace netbeacon
