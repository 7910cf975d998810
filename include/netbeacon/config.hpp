/**
 * @file config.hpp
 * @brief Runtime configuration: defaults, JSON file loading, atomic JSON writes.
 *
 * @details
 * Precedence, lowest to highest: built-in defaults, the JSON config file, command
 * line options. Executables load the file first and let CLI11 overwrite fields.
 *
 * ### Config file keys
 *
 * | Key                              | Type     | Default                                  |
 * |----------------------------------|----------|------------------------------------------|
 * | bind_address                     | string   | `::`                                     |
 * | port                             | integer  | 5240                                     |
 * | ipv4_group / ipv6_group          | string   | 224.0.0.118 / ff02::15a                  |
 * | loopback                         | bool     | false                                    |
 * | aging_window_seconds             | number   | 120                                      |
 * | min_broadcast_interval_seconds   | number   | 5                                        |
 * | solicitation_interval_seconds    | number   | 60 (0 disables)                          |
 * | interface_refresh_seconds        | number   | 30                                       |
 * | observer_restart_seconds         | number   | 60                                       |
 * | observer_command                 | string   | `netbeacon-observe-beacons {ifname}`     |
 * | process_socket_beacons           | bool     | false                                    |
 * | monitor_interfaces               | [string] | [] (all enabled)                         |
 * | interfaces_file                  | string   | "" (read the live inventory)             |
 * | lock_path                        | string   | /run/netbeacon/networks-monitoring.lock  |
 * | hints_path                       | string   | "" (do not write hints)                  |
 * | log_level                        | string   | info                                     |
 *
 * Unknown keys are logged and ignored. A known key with the wrong type is an error.
 * Durations above MAX_DURATION_SECONDS are rejected.
 */
#ifndef NETBEACON_CONFIG_HPP
#define NETBEACON_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "netbeacon/engine.hpp"
#include "netbeacon/interface_monitor.hpp"
#include "netbeacon/observer.hpp"
#include "netbeacon/transport/transport_base.hpp"

namespace netbeacon {

/// Upper bound for every `*_seconds` setting (one year).
static constexpr double MAX_DURATION_SECONDS = 365.0 * 24 * 3600;

struct Config {
  std::string bind_address{"::"};
  uint16_t    port{BEACON_PORT};
  std::string ipv4_group{BEACON_IPV4_MULTICAST};
  std::string ipv6_group{BEACON_IPV6_MULTICAST};
  bool        loopback{false};

  uint64_t aging_window_ms{DEFAULT_AGING_WINDOW_MS};
  uint64_t min_broadcast_interval_ms{5000};
  uint64_t solicitation_interval_ms{60000};
  uint64_t interface_refresh_ms{30000};
  uint64_t observer_restart_ms{60000};

  std::string              observer_command{DEFAULT_OBSERVER_COMMAND};
  bool                     process_socket_beacons{false};
  std::vector<std::string> monitor_interfaces;
  std::string              interfaces_file;
  std::string              lock_path{DEFAULT_LOCK_PATH};
  std::string              hints_path;
  std::string              log_level{"info"};

  transport::Config          transport_config() const;
  BeaconingEngine::Options   engine_options() const;
  InterfaceMonitor::Options  monitor_options() const;
};

/// Overlay the keys present in `j` onto `cfg`. `cfg` is untouched on error.
bool apply_config_json(const json& j, Config& cfg, std::string& err);

/// Read and apply a JSON config file.
bool load_config(const std::string& path, Config& cfg, std::string& err);

/// Current values, in config file form.
json config_to_json(const Config& cfg);

/// Write `j` to `<path>.tmp`, then rename over `path`.
bool write_json_atomic(const std::string& path, const json& j, std::string& err);

/// Read a whole JSON file.
bool read_json_file(const std::string& path, json& out, std::string& err);

} // namespace netbeacon

#endif // NETBEACON_CONFIG_HPP
