/**
 * @file topology.hpp
 * @brief Topology hints and the rules that infer them from received beacons.
 *
 * @details
 * PURPOSE
 * -------
 * Beacons by themselves say little. What matters is *where* a beacon shows up:
 * on the interface that sent it, on two local interfaces at once, or from a peer
 * that declared its own interface. Each of those patterns turns into a
 * TopologyHint, a fact about how two (interface, VLAN) pairs relate.
 *
 * RULES
 * -----
 * | Pattern                                         | Hint                               |
 * |-------------------------------------------------|------------------------------------|
 * | our beacon back on the interface it left from   | `rx_own_beacon_on_tx_interface`    |
 * | our beacon back on a different interface        | `rx_own_beacon_on_other_interface` |
 * | one foreign beacon on two local (ifname, vid)   | `same_local_fabric_as` (both ways) |
 * | foreign beacon naming its sender, multicast dst | `on_remote_network`                |
 * | foreign beacon naming its sender, unicast dst   | `routable_to`                      |
 *
 * Everything here is pure: inputs in, hints out. The engine owns the queues and
 * decides which history to pass in.
 */
#ifndef NETBEACON_TOPOLOGY_HPP
#define NETBEACON_TOPOLOGY_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "netbeacon/beacon.hpp"
#include "netbeacon/interfaces.hpp"

namespace netbeacon {

enum class HintKind {
  SameLocalFabricAs,
  OnRemoteNetwork,
  RoutableTo,
  RxOwnBeaconOnTxInterface,
  RxOwnBeaconOnOtherInterface,
};

/// Wire/JSON name of a hint kind, e.g. "same_local_fabric_as".
const char* to_string(HintKind k);

/// Inverse of to_string(HintKind).
bool hint_kind_from_string(const std::string& s, HintKind& out);

/**
 * @struct TopologyHint
 * @brief `(ifname, vid) --hint--> (related_ifname, related_vid, related_mac)`.
 *
 * Identity is the full tuple. Absent VLAN ids mean untagged.
 */
struct TopologyHint {
  std::string                ifname;
  std::optional<int>         vid;
  HintKind                   hint{HintKind::SameLocalFabricAs};
  std::string                related_ifname;
  std::optional<int>         related_vid;
  std::optional<std::string> related_mac;

  bool operator<(const TopologyHint& o) const;
  bool operator==(const TopologyHint& o) const;

  json to_json() const;
};

using HintSet = std::set<TopologyHint>;

/**
 * @struct ReceivedBeacon
 * @brief One inbound beacon plus the context it arrived in.
 *
 * Built per packet, consumed by the inference rules and kept in the receive queue
 * for duplicate detection.
 */
struct ReceivedBeacon {
  std::string                  uuid;
  json                         observation;   ///< normalized JSON as received
  BeaconPayload                beacon;
  std::optional<std::string>   ifname;        ///< receiving interface, if known
  std::optional<InterfaceInfo> ifinfo;        ///< its inventory entry, if known
  std::optional<int>           vid;           ///< VLAN the beacon arrived on
  std::string                  reply_ip;      ///< IPv6 or IPv4-mapped form
  uint16_t                     reply_port{0};
  bool                         multicast{false};
};

/// True for 224.0.0.0/4, ff00::/8 and IPv4-mapped multicast. False if unparsable.
bool is_multicast_address(const std::string& ip);

/// IPv4 dotted quads become `::ffff:a.b.c.d`; everything else passes through.
std::string to_reply_address(const std::string& ip);

/**
 * @brief Build a ReceivedBeacon from a normalized observation.
 *
 * The observation is beacon_to_json() output plus `source_ip`, `source_port`,
 * `destination_ip`, and optionally `interface` and `vid`.
 *
 * @retval false Not a beacon (bad type/version/payload), or no usable UUID. The
 *               caller counts it as rejected and does nothing else with it.
 */
bool received_beacon_from_json(const json& observation, const InterfaceMap& interfaces,
                               ReceivedBeacon& out, std::string& err);

/// Own-beacon rule. `sent` is our transmitted beacon with the same UUID.
void infer_own_beacon_hints(const BeaconPayload& sent, const ReceivedBeacon& rx, HintSet& out);

/**
 * @brief Duplicate rule: symmetric `same_local_fabric_as` for every pair of
 *        distinct (ifname, vid) among `seen`.
 */
void infer_duplicate_hints(const std::vector<ReceivedBeacon>& seen, HintSet& out);

/// Remote rule: needs a receiving ifname and a `remote` with name and MAC.
void infer_remote_hints(const ReceivedBeacon& rx, HintSet& out);

/**
 * @brief Run every rule that applies to one received beacon.
 *
 * @param rx        The beacon just received.
 * @param sent      Our transmitted beacon with the same UUID, or nullptr.
 * @param seen      Everything recorded for this UUID, `rx` included (may be nullptr).
 * @param is_dup    True if `seen` already held an entry before `rx` was recorded.
 */
HintSet infer_hints(const ReceivedBeacon& rx, const BeaconPayload* sent,
                    const std::vector<ReceivedBeacon>* seen, bool is_dup);

/// JSON list of hints; `vid`, `related_vid`, `related_mac` only when present.
json hints_to_json(const HintSet& hints);

} // namespace netbeacon

#endif // NETBEACON_TOPOLOGY_HPP
