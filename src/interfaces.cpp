// ============================================================================
// interfaces.cpp - implementation for interfaces.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "netbeacon/interfaces.hpp"

#include <arpa/inet.h>        // inet_pton/inet_ntop for CIDR math
#include <ifaddrs.h>          // getifaddrs(3) for the live inventory
#include <net/if.h>           // IFF_* flags, if_nametoindex()
#include <netinet/in.h>       // sockaddr_in / sockaddr_in6

#include <cerrno>             // errno for diagnostics
#include <cstdlib>            // strtol
#include <cstring>            // strerror
#include <fstream>            // sysfs / procfs reads
#include <sstream>            // line splitting for /proc/net/vlan/config

namespace netbeacon {

// -------- helpers --------

/*
 * read_first_line()
 * -----------------
 * Return the first line of a small sysfs/procfs file, trimmed. Empty on any failure:
 * a missing attribute just means "unknown".
 */
static std::string read_first_line(const std::string& path) {
  std::ifstream in(path);
  if (!in) return {};
  std::string line;
  std::getline(in, line);
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r' || line.back() == ' '))
    line.pop_back();
  return line;
}

static std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

/*
 * prefix_len()
 * ------------
 * Count leading one bits of a netmask. Non-contiguous masks stop at the first zero.
 */
static int prefix_len(const uint8_t* mask, size_t n) {
  int bits = 0;
  for (size_t i = 0; i < n; ++i) {
    for (int b = 7; b >= 0; --b) {
      if (mask[i] & (1u << b)) ++bits;
      else return bits;
    }
  }
  return bits;
}

/*
 * read_vlan_config()
 * ------------------
 * Parse /proc/net/vlan/config:
 *
 *   VLAN Dev name    | VLAN ID
 *   Name-Type: VLAN_NAME_TYPE_RAW_PLUS_VID_NO_PAD
 *   eth0.100       | 100  | eth0
 *
 * Returns name -> (vid, parent). Empty when 8021q is not loaded.
 */
static std::map<std::string, std::pair<int, std::string>> read_vlan_config() {
  std::map<std::string, std::pair<int, std::string>> out;
  std::ifstream in("/proc/net/vlan/config");
  if (!in) return out;
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    if (++lineno <= 2) continue;                       // two header lines
    std::istringstream ss(line);
    std::string name, vid, parent;
    if (!std::getline(ss, name, '|')) continue;
    if (!std::getline(ss, vid, '|')) continue;
    if (!std::getline(ss, parent)) continue;
    name = trim(name); vid = trim(vid); parent = trim(parent);
    if (name.empty() || vid.empty()) continue;
    char* end = nullptr;
    const long v = std::strtol(vid.c_str(), &end, 10);
    if (!end || *end != '\0') continue;                // not a number: skip the line
    out[name] = {static_cast<int>(v), parent};
  }
  return out;
}

static bool is_ipv6_link_local(const in6_addr& a) {
  return a.s6_addr[0] == 0xfe && (a.s6_addr[1] & 0xc0) == 0x80;
}

// ---------- InterfaceLink ----------

std::string InterfaceLink::ip() const {
  const auto slash = address.find('/');
  return slash == std::string::npos ? address : address.substr(0, slash);
}

std::string InterfaceLink::subnet() const {
  const auto slash = address.find('/');
  if (slash == std::string::npos) return address;
  const std::string host = address.substr(0, slash);
  char* end = nullptr;
  const long plen = std::strtol(address.c_str() + slash + 1, &end, 10);
  if (!end || *end != '\0' || plen < 0) return address;

  uint8_t raw[16] = {0};
  size_t  nbytes  = 0;
  const int af = (family == AddressFamily::IPv6) ? AF_INET6 : AF_INET;
  if (inet_pton(af, host.c_str(), raw) != 1) return address;
  nbytes = (af == AF_INET6) ? 16 : 4;
  if (static_cast<size_t>(plen) > nbytes * 8) return address;

  // clear host bits
  for (size_t i = 0; i < nbytes; ++i) {
    const long lo = static_cast<long>(i) * 8;
    if (plen >= lo + 8) continue;
    if (plen <= lo) { raw[i] = 0; continue; }
    const int keep = static_cast<int>(plen - lo);
    raw[i] &= static_cast<uint8_t>(0xFF << (8 - keep));
  }

  char buf[INET6_ADDRSTRLEN] = {0};
  if (!inet_ntop(af, raw, buf, sizeof(buf))) return address;
  return std::string(buf) + "/" + std::to_string(plen);
}

AddressFamily family_of(const std::string& address) {
  return address.find(':') != std::string::npos ? AddressFamily::IPv6 : AddressFamily::IPv4;
}

// ---------- InterfaceInfo ----------

RemoteInterface InterfaceInfo::to_remote() const {
  RemoteInterface r;
  r.name = name;
  if (!mac_address.empty()) r.mac_address = mac_address;
  r.vid            = vid;
  r.vendor         = vendor;
  r.product        = product;
  r.link_connected = link_connected;
  return r;
}

json InterfaceInfo::to_json() const {
  json j = json::object();
  j["index"]       = index;
  j["enabled"]     = enabled;
  j["mac_address"] = mac_address;
  if (vid)            j["vid"]            = *vid;
  if (parent)         j["parents"]        = json::array({*parent});
  if (vendor)         j["vendor"]         = *vendor;
  if (product)        j["product"]        = *product;
  if (link_connected) j["link_connected"] = *link_connected;
  json links = json::array();
  for (const auto& l : this->links) links.push_back({{"address", l.address}});
  j["links"] = links;
  return j;
}

bool InterfaceInfo::operator==(const InterfaceInfo& o) const {
  return name == o.name && index == o.index && enabled == o.enabled &&
         mac_address == o.mac_address && vid == o.vid && parent == o.parent &&
         vendor == o.vendor && product == o.product &&
         link_connected == o.link_connected && links == o.links;
}

// ---------------------------------------------------------------------------
// read_system_interfaces()
// ------------------------
// Phases:
//   1) walk getifaddrs() once, creating an entry per non-loopback name and
//      collecting IPv4/IPv6 addresses as CIDR links (IPv6 link-local skipped),
//   2) fill MAC and operstate from sysfs,
//   3) fill vid/parent from /proc/net/vlan/config.
// ---------------------------------------------------------------------------
bool read_system_interfaces(InterfaceMap& out, std::string& err) {
  struct ifaddrs* ifap = nullptr;
  if (getifaddrs(&ifap) != 0) {
    err = std::string("getifaddrs failed: ") + std::strerror(errno);
    return false;
  }

  InterfaceMap result;
  for (struct ifaddrs* ifa = ifap; ifa; ifa = ifa->ifa_next) {
    if (!ifa->ifa_name) continue;
    if (ifa->ifa_flags & IFF_LOOPBACK) continue;

    const std::string name = ifa->ifa_name;
    auto& info = result[name];
    if (info.name.empty()) {
      info.name    = name;
      info.index   = if_nametoindex(name.c_str());
      info.enabled = (ifa->ifa_flags & IFF_UP) != 0;
    }

    if (!ifa->ifa_addr) continue;
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ifa->ifa_addr->sa_family == AF_INET) {
      const auto* a = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
      if (!inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf))) continue;
      int plen = 32;
      if (ifa->ifa_netmask) {
        const auto* m = reinterpret_cast<const sockaddr_in*>(ifa->ifa_netmask);
        plen = prefix_len(reinterpret_cast<const uint8_t*>(&m->sin_addr), 4);
      }
      info.links.push_back({std::string(buf) + "/" + std::to_string(plen), AddressFamily::IPv4});
    } else if (ifa->ifa_addr->sa_family == AF_INET6) {
      const auto* a = reinterpret_cast<const sockaddr_in6*>(ifa->ifa_addr);
      if (is_ipv6_link_local(a->sin6_addr)) continue;
      if (!inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf))) continue;
      int plen = 128;
      if (ifa->ifa_netmask) {
        const auto* m = reinterpret_cast<const sockaddr_in6*>(ifa->ifa_netmask);
        plen = prefix_len(m->sin6_addr.s6_addr, 16);
      }
      info.links.push_back({std::string(buf) + "/" + std::to_string(plen), AddressFamily::IPv6});
    }
  }
  freeifaddrs(ifap);

  const auto vlans = read_vlan_config();
  for (auto& kv : result) {
    auto& info = kv.second;
    const std::string sys = "/sys/class/net/" + info.name + "/";
    info.mac_address = read_first_line(sys + "address");
    const std::string oper = read_first_line(sys + "operstate");
    if (oper == "up")        info.link_connected = true;
    else if (oper == "down") info.link_connected = false;

    auto v = vlans.find(info.name);
    if (v != vlans.end()) {
      info.vid    = v->second.first;
      info.parent = v->second.second;
    }
  }

  out = std::move(result);
  return true;
}

// ---------------------------------------------------------------------------
// interfaces_from_json()
// ----------------------
// Strict on shape (root must be an object of objects), lenient on content:
// absent fields fall back to defaults. Wrong-typed fields are errors.
// ---------------------------------------------------------------------------
bool interfaces_from_json(const json& j, InterfaceMap& out, std::string& err) {
  if (!j.is_object()) {
    err = "interfaces: expected an object keyed by interface name";
    return false;
  }

  InterfaceMap result;
  try {
    for (auto it = j.begin(); it != j.end(); ++it) {
      const json& d = it.value();
      if (!d.is_object()) {
        err = "interfaces: definition of '" + it.key() + "' is not an object";
        return false;
      }
      InterfaceInfo info;
      info.name        = it.key();
      info.index       = d.value("index", 0u);
      info.enabled     = d.value("enabled", true);
      info.mac_address = d.value("mac_address", std::string());
      if (d.contains("vid") && !d["vid"].is_null())        info.vid = d["vid"].get<int>();
      if (d.contains("vendor") && !d["vendor"].is_null())  info.vendor = d["vendor"].get<std::string>();
      if (d.contains("product") && !d["product"].is_null()) info.product = d["product"].get<std::string>();
      if (d.contains("link_connected") && !d["link_connected"].is_null())
        info.link_connected = d["link_connected"].get<bool>();
      if (d.contains("parents")) {
        const auto& p = d["parents"];
        if (p.is_array() && !p.empty()) info.parent = p[0].get<std::string>();
      }
      if (d.contains("links")) {
        for (const auto& l : d["links"]) {
          if (!l.contains("address")) continue;       // e.g. {"mode": "dhcp"} without a lease
          InterfaceLink link;
          link.address = l["address"].get<std::string>();
          link.family  = family_of(link.address);
          info.links.push_back(std::move(link));
        }
      }
      result[info.name] = std::move(info);
    }
  } catch (const json::type_error& e) {
    err = std::string("interfaces: ") + e.what();
    return false;
  } catch (const json::out_of_range& e) {
    err = std::string("interfaces: ") + e.what();
    return false;
  }

  out = std::move(result);
  return true;
}

json interfaces_to_json(const InterfaceMap& interfaces) {
  json j = json::object();
  for (const auto& kv : interfaces) j[kv.first] = kv.second.to_json();
  return j;
}

} // namespace netbeacon
