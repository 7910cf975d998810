/**
 * @file interfaces.hpp
 * @brief Local network interface inventory.
 *
 * @details
 * The inventory is a snapshot, keyed by interface name, of everything the beaconing
 * code needs to know about local interfaces: OS index (for IPv6 multicast), enabled
 * state, MAC, VLAN tag, parent, and the configured subnet links.
 *
 * Two sources fill it:
 * - read_system_interfaces(): the live Linux view (getifaddrs + sysfs + procfs).
 * - interfaces_from_json():   the JSON map format the region controller exchanges.
 *
 * Loopback interfaces never appear in an inventory.
 */
#ifndef NETBEACON_INTERFACES_HPP
#define NETBEACON_INTERFACES_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "netbeacon/beacon.hpp"

namespace netbeacon {

enum class AddressFamily { IPv4, IPv6 };

/// One configured subnet on an interface.
struct InterfaceLink {
  std::string   address;                  ///< CIDR, e.g. "192.168.1.5/24"
  AddressFamily family{AddressFamily::IPv4};

  /// Address without the prefix length.
  std::string ip() const;

  /// Network in CIDR form ("192.168.1.0/24"); the address itself if it does not parse.
  std::string subnet() const;

  bool operator==(const InterfaceLink& o) const {
    return address == o.address && family == o.family;
  }
};

struct InterfaceInfo {
  std::string name;
  unsigned    index{0};                   ///< OS interface index, 0 if unknown
  bool        enabled{true};
  std::string mac_address;
  std::optional<int>         vid;
  std::optional<std::string> parent;
  std::optional<std::string> vendor;
  std::optional<std::string> product;
  std::optional<bool>        link_connected;
  std::vector<InterfaceLink> links;

  /// Reduced descriptor carried in beacons sent from this interface.
  RemoteInterface to_remote() const;

  json to_json() const;

  bool operator==(const InterfaceInfo& o) const;
  bool operator!=(const InterfaceInfo& o) const { return !(*this == o); }
};

using InterfaceMap = std::map<std::string, InterfaceInfo>;

/// Guess the family from the textual address (':' means IPv6).
AddressFamily family_of(const std::string& address);

/**
 * @brief Read the live interface inventory from the kernel.
 *
 * PRE: Linux. Uses getifaddrs(), /sys/class/net/<if>/{address,operstate} and
 * /proc/net/vlan/config (absent when the 8021q module is not loaded).
 *
 * @retval false getifaddrs() failed; `err` carries the reason.
 */
bool read_system_interfaces(InterfaceMap& out, std::string& err);

/**
 * @brief Parse an inventory from JSON.
 *
 * Expected shape:
 * @code
 * { "eth0": { "index": 2, "enabled": true, "mac_address": "00:11:22:33:44:55",
 *             "vid": 100, "parents": ["eth0"], "vendor": "...", "product": "...",
 *             "link_connected": true,
 *             "links": [ { "address": "192.168.1.5/24" } ] } }
 * @endcode
 * Every field other than the name is optional.
 */
bool interfaces_from_json(const json& j, InterfaceMap& out, std::string& err);

/// Inverse of interfaces_from_json().
json interfaces_to_json(const InterfaceMap& interfaces);

} // namespace netbeacon

#endif // NETBEACON_INTERFACES_HPP
