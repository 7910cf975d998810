#pragma once
/**
 * @file transport_base.hpp
 * @brief Engine-agnostic multicast datagram transport interface.
 *
 * Header-only. The engine owns one transport; tests substitute a recording one.
 */

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "netbeacon/beacon.hpp"
#include "netbeacon/interfaces.hpp"

namespace netbeacon::transport {

// Return codes kept simple; callers only branch on Ok.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

struct Config {
  std::string bind_address{"::"};
  uint16_t    port{BEACON_PORT};          // 0 = ephemeral (tests)
  uint16_t    group_port{0};              // multicast destination port, 0 = the bound port
  std::string ipv4_group{BEACON_IPV4_MULTICAST};
  std::string ipv6_group{BEACON_IPV6_MULTICAST};
  bool        loopback{false};            // receive our own multicast
};

/**
 * @brief One multicast group membership.
 *
 * IPv6 memberships are per interface index. IPv4 memberships are per local address,
 * which is how the kernel picks the interface for IPv4.
 */
struct Membership {
  AddressFamily family{AddressFamily::IPv6};
  unsigned      ifindex{0};
  std::string   ipv4_address;             // IPv4 only
  std::string   ifname;                   // for logs

  bool operator<(const Membership& o) const {
    return std::tie(family, ifindex, ipv4_address, ifname) <
           std::tie(o.family, o.ifindex, o.ipv4_address, o.ifname);
  }
  bool operator==(const Membership& o) const {
    return family == o.family && ifindex == o.ifindex &&
           ipv4_address == o.ipv4_address && ifname == o.ifname;
  }
};

/// Outbound interface selector for a multicast send.
struct MulticastSource {
  AddressFamily family{AddressFamily::IPv6};
  unsigned      ifindex{0};               // IPv6 selector
  std::string   ipv4_address;             // IPv4 selector
};

/// One received datagram plus the socket metadata recvmsg() recovered.
struct Datagram {
  std::vector<uint8_t> bytes;
  std::string source_ip;                  // IPv4 as dotted quad, IPv6 as text
  uint16_t    source_port{0};
  std::string destination_ip;             // empty if pktinfo was unavailable
  unsigned    ifindex{0};                 // receiving interface, 0 if unknown
};

/**
 * @brief Memberships wanted for an inventory.
 *
 * Every enabled interface gets the IPv6 group on its index, and the IPv4 group on
 * its first IPv4 address (joining twice on one interface only yields EADDRINUSE).
 * Interfaces with index 0 get no IPv6 membership.
 */
inline std::set<Membership> plan_memberships(const InterfaceMap& interfaces) {
  std::set<Membership> out;
  for (const auto& kv : interfaces) {
    const InterfaceInfo& info = kv.second;
    if (!info.enabled) continue;
    if (info.index != 0) {
      Membership m;
      m.family  = AddressFamily::IPv6;
      m.ifindex = info.index;
      m.ifname  = info.name;
      out.insert(m);
    }
    for (const auto& link : info.links) {
      if (link.family != AddressFamily::IPv4) continue;
      Membership m;
      m.family       = AddressFamily::IPv4;
      m.ifindex      = info.index;
      m.ipv4_address = link.ip();
      m.ifname       = info.name;
      out.insert(m);
      break;                              // first IPv4 address only
    }
  }
  return out;
}

/**
 * @brief Transport trait the beaconing engine relies on.
 *
 * Contract:
 *  - begin(cfg) opens and binds the socket; false on failure (see last_error()).
 *  - end() closes it; safe to call twice.
 *  - join_group()/leave_group() are idempotent; "already joined" is success.
 *  - send_*() never block; anything but Ok means the datagram did not leave.
 *  - recv() is non-blocking; RxResult::None when nothing is queued.
 *  - fd() is pollable, or -1 when closed.
 */
class IMulticastTransport {
public:
  virtual ~IMulticastTransport() = default;
  virtual bool        begin(const Config& cfg) = 0;
  virtual void        end() = 0;
  virtual bool        is_open() const = 0;
  virtual bool        join_group(const Membership& m) = 0;
  virtual bool        leave_group(const Membership& m) = 0;
  virtual TxResult    send_multicast(const MulticastSource& src, const uint8_t* data, std::size_t len) = 0;
  virtual TxResult    send_unicast(const std::string& ip, uint16_t port, const uint8_t* data, std::size_t len) = 0;
  virtual RxResult    recv(Datagram& out) = 0;
  virtual int         fd() const = 0;
  virtual uint16_t    local_port() const = 0;
  virtual const std::string& last_error() const = 0;
  virtual const char* name() const = 0;
};

} // namespace netbeacon::transport
