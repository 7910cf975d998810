// ============================================================================
// topology.cpp - implementation for topology.hpp
// For the rule table see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "netbeacon/topology.hpp"
#include "netbeacon/uuid.hpp"

#include <arpa/inet.h>   // inet_pton for multicast classification
#include <netinet/in.h>  // in_addr / in6_addr

#include <tuple>         // std::tie for hint ordering

namespace netbeacon {

// ---------- HintKind ----------

const char* to_string(HintKind k) {
  switch (k) {
    case HintKind::SameLocalFabricAs:           return "same_local_fabric_as";
    case HintKind::OnRemoteNetwork:             return "on_remote_network";
    case HintKind::RoutableTo:                  return "routable_to";
    case HintKind::RxOwnBeaconOnTxInterface:    return "rx_own_beacon_on_tx_interface";
    case HintKind::RxOwnBeaconOnOtherInterface: return "rx_own_beacon_on_other_interface";
  }
  return "unknown";
}

bool hint_kind_from_string(const std::string& s, HintKind& out) {
  static const HintKind ALL[] = {
    HintKind::SameLocalFabricAs, HintKind::OnRemoteNetwork, HintKind::RoutableTo,
    HintKind::RxOwnBeaconOnTxInterface, HintKind::RxOwnBeaconOnOtherInterface,
  };
  for (HintKind k : ALL) {
    if (s == to_string(k)) { out = k; return true; }
  }
  return false;
}

// ---------- TopologyHint ----------

bool TopologyHint::operator<(const TopologyHint& o) const {
  return std::tie(ifname, vid, hint, related_ifname, related_vid, related_mac) <
         std::tie(o.ifname, o.vid, o.hint, o.related_ifname, o.related_vid, o.related_mac);
}

bool TopologyHint::operator==(const TopologyHint& o) const {
  return std::tie(ifname, vid, hint, related_ifname, related_vid, related_mac) ==
         std::tie(o.ifname, o.vid, o.hint, o.related_ifname, o.related_vid, o.related_mac);
}

json TopologyHint::to_json() const {
  json j = json::object();
  j["ifname"]         = ifname;
  j["hint"]           = to_string(hint);
  j["related_ifname"] = related_ifname;
  if (vid)         j["vid"]         = *vid;           // absent means untagged
  if (related_vid) j["related_vid"] = *related_vid;
  if (related_mac) j["related_mac"] = *related_mac;
  return j;
}

json hints_to_json(const HintSet& hints) {
  json arr = json::array();
  for (const auto& h : hints) arr.push_back(h.to_json());
  return arr;
}

// ---------- addresses ----------

bool is_multicast_address(const std::string& ip) {
  in_addr v4{};
  if (inet_pton(AF_INET, ip.c_str(), &v4) == 1) {
    const uint8_t first = reinterpret_cast<const uint8_t*>(&v4.s_addr)[0];
    return (first & 0xF0) == 0xE0;                   // 224.0.0.0/4
  }
  in6_addr v6{};
  if (inet_pton(AF_INET6, ip.c_str(), &v6) == 1) {
    if (v6.s6_addr[0] == 0xFF) return true;          // ff00::/8
    // ::ffff:a.b.c.d
    bool mapped = true;
    for (int i = 0; i < 10; ++i) mapped = mapped && v6.s6_addr[i] == 0;
    mapped = mapped && v6.s6_addr[10] == 0xFF && v6.s6_addr[11] == 0xFF;
    return mapped && (v6.s6_addr[12] & 0xF0) == 0xE0;
  }
  return false;
}

std::string to_reply_address(const std::string& ip) {
  if (ip.empty() || ip.find(':') != std::string::npos) return ip;
  return "::ffff:" + ip;                             // the socket is AF_INET6
}

// ---------------------------------------------------------------------------
// received_beacon_from_json()
// ---------------------------
// PRE:    `observation` is one normalized beacon, from the socket path or an
//         observer process.
// POLICY: the UUID is the only hard requirement beyond a well-formed beacon.
//         Socket context fields are taken when present and well-typed.
// ---------------------------------------------------------------------------
bool received_beacon_from_json(const json& observation, const InterfaceMap& interfaces,
                               ReceivedBeacon& out, std::string& err) {
  ReceivedBeacon rx;
  if (!beacon_from_json(observation, rx.beacon, err)) return false;

  if (rx.beacon.uuid.empty()) {
    err = "no UUID found";
    return false;
  }
  Uuid parsed;
  if (!Uuid::parse(rx.beacon.uuid, parsed)) {
    err = "malformed UUID: " + rx.beacon.uuid;
    return false;
  }
  rx.uuid        = rx.beacon.uuid;
  rx.observation = observation;

  auto src = observation.find("source_ip");
  if (src != observation.end() && src->is_string()) rx.reply_ip = to_reply_address(src->get<std::string>());

  auto port = observation.find("source_port");
  if (port != observation.end() && port->is_number_unsigned() && port->get<uint64_t>() <= 0xFFFF)
    rx.reply_port = static_cast<uint16_t>(port->get<uint64_t>());

  auto dst = observation.find("destination_ip");
  if (dst != observation.end() && dst->is_string()) rx.multicast = is_multicast_address(dst->get<std::string>());

  auto ifn = observation.find("interface");
  if (ifn != observation.end() && ifn->is_string() && !ifn->get<std::string>().empty()) {
    rx.ifname = ifn->get<std::string>();
    auto info = interfaces.find(*rx.ifname);
    if (info != interfaces.end()) rx.ifinfo = info->second;
  }

  auto vid = observation.find("vid");
  if (vid != observation.end() && vid->is_number_integer()) rx.vid = vid->get<int>();

  out = std::move(rx);
  return true;
}

// ---------------------------------------------------------------------------
// Rules
// ---------------------------------------------------------------------------

void infer_own_beacon_hints(const BeaconPayload& sent, const ReceivedBeacon& rx, HintSet& out) {
  if (!rx.ifname || !sent.remote) return;           // cannot attribute either side
  const RemoteInterface& tx = *sent.remote;

  TopologyHint h;
  h.ifname         = *rx.ifname;
  h.vid            = rx.vid;
  h.hint           = (tx.name == *rx.ifname) ? HintKind::RxOwnBeaconOnTxInterface
                                             : HintKind::RxOwnBeaconOnOtherInterface;
  h.related_ifname = tx.name;
  h.related_vid    = tx.vid;
  h.related_mac    = tx.mac_address;
  out.insert(std::move(h));
}

void infer_duplicate_hints(const std::vector<ReceivedBeacon>& seen, HintSet& out) {
  for (size_t i = 0; i < seen.size(); ++i) {
    const ReceivedBeacon& a = seen[i];
    if (!a.ifname) continue;
    for (size_t k = i + 1; k < seen.size(); ++k) {
      const ReceivedBeacon& b = seen[k];
      if (!b.ifname) continue;
      if (*a.ifname == *b.ifname && a.vid == b.vid) continue;   // same attachment point

      TopologyHint ab;
      ab.ifname = *a.ifname;  ab.vid = a.vid;
      ab.hint   = HintKind::SameLocalFabricAs;
      ab.related_ifname = *b.ifname;  ab.related_vid = b.vid;

      TopologyHint ba;
      ba.ifname = *b.ifname;  ba.vid = b.vid;
      ba.hint   = HintKind::SameLocalFabricAs;
      ba.related_ifname = *a.ifname;  ba.related_vid = a.vid;

      out.insert(std::move(ab));                    // always as a pair
      out.insert(std::move(ba));
    }
  }
}

void infer_remote_hints(const ReceivedBeacon& rx, HintSet& out) {
  if (!rx.ifname || !rx.beacon.remote) return;
  const RemoteInterface& remote = *rx.beacon.remote;
  if (remote.name.empty() || !remote.mac_address) return;

  TopologyHint h;
  h.ifname         = *rx.ifname;
  h.vid            = rx.vid;
  h.hint           = rx.multicast ? HintKind::OnRemoteNetwork : HintKind::RoutableTo;
  h.related_ifname = remote.name;
  h.related_vid    = remote.vid;
  h.related_mac    = remote.mac_address;
  out.insert(std::move(h));
}

HintSet infer_hints(const ReceivedBeacon& rx, const BeaconPayload* sent,
                    const std::vector<ReceivedBeacon>* seen, bool is_dup) {
  HintSet hints;
  if (sent) {
    infer_own_beacon_hints(*sent, rx, hints);
    return hints;                                   // the other rules are for foreign beacons
  }
  if (is_dup && seen) infer_duplicate_hints(*seen, hints);
  infer_remote_hints(rx, hints);
  return hints;
}

} // namespace netbeacon
