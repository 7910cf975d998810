// -----------------------------------------------------------------------------
// engine.cpp - Implementation of the beaconing engine
//
// API & field descriptions:
//   see include/netbeacon/engine.hpp
//
// Runnable examples & usage tests:
//   see tests/test_engine.cpp
//
// NOTE: This file focuses on *how* the logic is implemented: ordering of aging
// versus lookups, what gets recorded when, and the rate limiter.
// -----------------------------------------------------------------------------
#include "netbeacon/engine.hpp"
#include "netbeacon/log.hpp"

#include <algorithm>

namespace netbeacon {

// ---------- Event ----------

Event Event::observation_received(json obs) {
  Event e;
  e.kind        = Kind::ObservationReceived;
  e.observation = std::move(obs);
  return e;
}

Event Event::datagram_received(transport::Datagram d) {
  Event e;
  e.kind     = Kind::DatagramReceived;
  e.datagram = std::move(d);
  return e;
}

Event Event::interfaces_updated(InterfaceMap interfaces) {
  Event e;
  e.kind       = Kind::InterfacesUpdated;
  e.interfaces = std::move(interfaces);
  return e;
}

Event Event::stop_requested() {
  Event e;
  e.kind = Kind::StopRequested;
  return e;
}

// ---------- construction ----------

BeaconingEngine::BeaconingEngine(std::unique_ptr<transport::IMulticastTransport> transport,
                                 const Options& opts)
: transport_(std::move(transport)),
  opts_(opts),
  tx_queue_(opts.aging_window_ms),
  rx_queue_(opts.aging_window_ms),
  hint_queue_(opts.aging_window_ms) {
}

BeaconingEngine::~BeaconingEngine() {
  stop();
}

// ---------- main loop ----------

// add_event() - Try to enqueue an event in the inbox; fail if full.
bool BeaconingEngine::add_event(Event ev) {
  if (inbox_.full()) return false;
  inbox_.push_back(std::move(ev));
  return true;
}

// tick() - one event, then timers.
void BeaconingEngine::tick(uint64_t now_ms) {
  rebase_timers(now_ms);
  process_one(now_ms);
  fire_timers(now_ms);
}

size_t BeaconingEngine::poll_transport(uint64_t now_ms) {
  (void)now_ms;  // datagrams are timestamped when their event is processed
  if (!transport_ready()) return 0;

  size_t n = 0;
  // Bounded: at most one inbox worth per call so a flood cannot starve tick().
  while (n < INBOX_CAP) {
    transport::Datagram d;
    const auto r = transport_->recv(d);
    if (r == transport::RxResult::None) break;
    if (r == transport::RxResult::Error) {
      logger()->warn("transport: receive failed: {}", transport_->last_error());
      break;
    }
    ++n;
    if (!opts_.process_socket_beacons) continue;   // read only so the queue drains
    if (!add_event(Event::datagram_received(std::move(d)))) {
      logger()->debug("beaconing: inbox full, dropping datagram");
    }
  }
  return n;
}

uint64_t BeaconingEngine::next_timeout_ms(uint64_t now_ms, uint64_t cap_ms) const {
  if (!inbox_.empty()) return 0;
  uint64_t wait = cap_ms;
  if (pending_) {
    wait = std::min(wait, pending_deadline_ms_ > now_ms ? pending_deadline_ms_ - now_ms : 0);
  }
  if (state_ == State::Active && opts_.solicitation_interval_ms > 0) {
    wait = std::min(wait, next_solicitation_ms_ > now_ms ? next_solicitation_ms_ - now_ms : 0);
  }
  return wait;
}

// process_one() - Pull the next inbox event and route it.
void BeaconingEngine::process_one(uint64_t now_ms) {
  if (inbox_.empty()) return;

  Event ev = std::move(inbox_.front());
  inbox_.pop_front();
  if (stopped_) return;                           // drained, not acted on

  switch (ev.kind) {
    case Event::Kind::ObservationReceived: beacon_received(ev.observation, now_ms); break;
    case Event::Kind::DatagramReceived:    datagram_received(ev.datagram, now_ms); break;
    case Event::Kind::InterfacesUpdated:   update_interfaces(ev.interfaces, now_ms); break;
    case Event::Kind::StopRequested:       stop(); break;
  }
}

// -----------------------------------------------------------------------------
// rebase_timers()
// POLICY:
//   - No deadline lies further out than its interval from `now_ms`, and the last
//     round is never in the future. A wall clock stepped backwards would
//     otherwise hold every timer until it caught up again.
// -----------------------------------------------------------------------------
void BeaconingEngine::rebase_timers(uint64_t now_ms) {
  if (have_last_broadcast_ && last_broadcast_ms_ > now_ms) {
    logger()->warn("beaconing: clock went back {} ms, rebasing timers", last_broadcast_ms_ - now_ms);
    last_broadcast_ms_ = now_ms;
  }
  if (pending_) {
    pending_deadline_ms_ = std::min(pending_deadline_ms_, now_ms + opts_.min_broadcast_interval_ms);
  }
  if (state_ == State::Active) {
    next_solicitation_ms_ = std::min(next_solicitation_ms_, now_ms + opts_.solicitation_interval_ms);
  }
}

// -----------------------------------------------------------------------------
// fire_timers()
// POLICY:
//   - The pending round fires first; its deadline already honors the minimum
//     interval.
//   - The periodic solicitation only queues a request, so it goes through the
//     same limiter as everything else.
// -----------------------------------------------------------------------------
void BeaconingEngine::fire_timers(uint64_t now_ms) {
  if (stopped_) return;

  if (pending_ && now_ms >= pending_deadline_ms_) {
    pending_ = false;
    have_last_broadcast_ = true;
    last_broadcast_ms_   = now_ms;
    send_multicast_beacons(pending_type_, now_ms);
  }

  if (state_ == State::Active && opts_.solicitation_interval_ms > 0 &&
      now_ms >= next_solicitation_ms_) {
    next_solicitation_ms_ = now_ms + opts_.solicitation_interval_ms;
    queue_multicast_beaconing(true, now_ms);
  }
}

// ---------- interfaces ----------

// -----------------------------------------------------------------------------
// update_interfaces()
// PRE:  `interfaces` is a full snapshot, not a delta.
// OUT:
//   - memberships reconciled against the new plan (only differences touched),
//   - state recomputed,
//   - a solicitation round queued if an enabled interface appeared.
// -----------------------------------------------------------------------------
void BeaconingEngine::update_interfaces(const InterfaceMap& interfaces, uint64_t now_ms) {
  bool added = false;
  for (const auto& kv : interfaces) {
    if (!kv.second.enabled) continue;
    auto old = interfaces_.find(kv.first);
    if (old == interfaces_.end() || !old->second.enabled) added = true;
  }

  interfaces_ = interfaces;
  reconcile_memberships();

  const bool any_enabled = std::any_of(interfaces_.begin(), interfaces_.end(),
                                       [](const auto& kv) { return kv.second.enabled; });
  const State next = any_enabled ? State::Active : State::Idle;
  if (next != state_) {
    logger()->info("beaconing: {} ({} interface(s))",
                   next == State::Active ? "active" : "idle", interfaces_.size());
    if (next == State::Active) next_solicitation_ms_ = now_ms + opts_.solicitation_interval_ms;
    state_ = next;
  }

  if (state_ == State::Active && added && !stopped_) {
    queue_multicast_beaconing(true, now_ms);
  }
}

void BeaconingEngine::reconcile_memberships() {
  const std::set<transport::Membership> wanted = transport::plan_memberships(interfaces_);

  if (!transport_ready()) {
    joined_.clear();
    return;
  }

  for (auto it = joined_.begin(); it != joined_.end(); ) {
    if (wanted.count(*it)) { ++it; continue; }
    if (!transport_->leave_group(*it)) {
      logger()->warn("transport: leave {} on {} failed: {}",
                     it->family == AddressFamily::IPv4 ? it->ipv4_address : "ipv6",
                     it->ifname, transport_->last_error());
    }
    it = joined_.erase(it);                       // forget it either way
  }

  for (const auto& m : wanted) {
    if (joined_.count(m)) continue;
    if (transport_->join_group(m)) {
      joined_.insert(m);
      logger()->debug("transport: joined {} group on {}",
                      m.family == AddressFamily::IPv4 ? "IPv4" : "IPv6", m.ifname);
    } else {
      logger()->warn("transport: join on {} failed: {}", m.ifname, transport_->last_error());
    }
  }
}

// ---------- receive path ----------

void BeaconingEngine::datagram_received(const transport::Datagram& d, uint64_t now_ms) {
  BeaconPayload beacon;
  std::string err;
  if (!decode_beacon(d.bytes, beacon, err)) {
    ++counters_.beacons_rejected;
    logger()->debug("beaconing: dropping datagram from {}: {}", d.source_ip, err);
    return;
  }

  json obs = beacon_to_json(beacon);
  obs["source_ip"]   = d.source_ip;
  obs["source_port"] = d.source_port;
  if (!d.destination_ip.empty()) obs["destination_ip"] = d.destination_ip;
  if (d.ifindex != 0) {
    for (const auto& kv : interfaces_) {
      if (kv.second.index == d.ifindex) { obs["interface"] = kv.first; break; }
    }
  }
  beacon_received(obs, now_ms);
}

// -----------------------------------------------------------------------------
// beacon_received()
// PRE:  `observation` is normalized JSON (socket or observer process).
// POLICY (order matters):
//   1) reject if not a beacon or no usable UUID (before touching any queue),
//   2) age tx, then own-beacon lookup,
//   3) age rx, duplicate check, then record,
//   4) infer hints and merge them under the UUID,
//   5) foreign solicitations get a unicast advertisement and queue a round.
// -----------------------------------------------------------------------------
void BeaconingEngine::beacon_received(const json& observation, uint64_t now_ms) {
  ReceivedBeacon rx;
  std::string err;
  if (!received_beacon_from_json(observation, interfaces_, rx, err)) {
    ++counters_.beacons_rejected;
    logger()->debug("beaconing: rejecting incoming beacon: {}: {}", err, observation.dump());
    return;
  }

  tx_queue_.age_out(static_cast<int64_t>(now_ms));
  const BeaconPayload* own = tx_queue_.find(rx.uuid);

  const std::vector<ReceivedBeacon>* seen = nullptr;
  const bool is_dup = remember_beacon_and_check_duplicate(rx, now_ms, &seen);
  if (!seen) {
    ++counters_.beacons_rejected;
    logger()->debug("beaconing: rejecting incoming beacon: UUID {} outside aging window", rx.uuid);
    return;
  }
  ++counters_.beacons_received;

  logger()->debug("beaconing: {} {}received: {}", own ? "own beacon" : "beacon",
                  is_dup ? "(duplicate) " : "", observation.dump());

  const HintSet hints = infer_hints(rx, own, seen, is_dup);
  if (!hints.empty()) remember_hints(rx.uuid, hints, now_ms);

  if (rx.beacon.type == BeaconType::Solicitation && !own) {
    reply_to_solicitation(rx, now_ms);
    queue_multicast_beaconing(false, now_ms);
  }
}

bool BeaconingEngine::remember_beacon_and_check_duplicate(const ReceivedBeacon& rx, uint64_t now_ms,
                                                          const std::vector<ReceivedBeacon>** seen) {
  const int64_t now = static_cast<int64_t>(now_ms);
  rx_queue_.age_out(now);                         // never match something about to expire

  std::vector<ReceivedBeacon> list;
  bool duplicate = false;
  if (const auto* existing = rx_queue_.find(rx.uuid)) {
    duplicate = !existing->empty();               // check before insert
    list = *existing;
  }
  list.push_back(rx);

  if (!rx_queue_.remember(rx.uuid, std::move(list), now)) {
    *seen = nullptr;
    return false;
  }
  *seen = rx_queue_.find(rx.uuid);
  return duplicate;
}

void BeaconingEngine::remember_hints(const std::string& uuid, const HintSet& hints, uint64_t now_ms) {
  const int64_t now = static_cast<int64_t>(now_ms);
  HintSet merged = hints;
  if (const HintSet* existing = hint_queue_.find(uuid)) merged.insert(existing->begin(), existing->end());
  if (!hint_queue_.remember(uuid, std::move(merged), now)) {
    logger()->debug("beaconing: hints for {} not recorded (outside aging window)", uuid);
  }
}

// -----------------------------------------------------------------------------
// reply_to_solicitation()
// OUT: one advertisement with `acks` = the solicitation's UUID, sent to the
//      solicitor's source address. The remote descriptor is the interface the
//      solicitation arrived on, so the solicitor can attribute the reply.
// -----------------------------------------------------------------------------
void BeaconingEngine::reply_to_solicitation(const ReceivedBeacon& rx, uint64_t now_ms) {
  if (rx.reply_ip.empty() || rx.reply_port == 0) {
    logger()->debug("beaconing: no reply address for solicitation {}", rx.uuid);
    return;
  }

  RemoteInterface remote;
  if (rx.ifinfo) {
    remote = rx.ifinfo->to_remote();
  } else if (rx.ifname) {
    remote.name = *rx.ifname;
  }
  if (rx.vid) remote.vid = rx.vid;

  std::optional<RemoteInterface> r;
  if (!remote.name.empty()) r = remote;

  std::vector<uint8_t> bytes;
  const BeaconPayload reply = create_beacon(BeaconType::Advertisement, r, rx.uuid, now_ms, bytes);
  send_beacon(reply, bytes, rx.reply_ip, rx.reply_port, now_ms);
}

// ---------- send path ----------

bool BeaconingEngine::transport_ready() const {
  return transport_ && transport_->is_open();
}

bool BeaconingEngine::send_beacon(const BeaconPayload& beacon, const std::vector<uint8_t>& bytes,
                                  const std::string& ip, uint16_t port, uint64_t now_ms) {
  if (!transport_ready() || bytes.empty()) return false;

  const auto r = transport_->send_unicast(ip, port, bytes.data(), bytes.size());
  if (r != transport::TxResult::Ok) {
    ++counters_.send_failures;
    logger()->warn("transport: error while sending beacon to [{}]:{}: {}", ip, port, transport_->last_error());
    return false;
  }
  // Only beacons that actually left are recorded.
  if (!tx_queue_.remember(beacon.uuid, beacon, static_cast<int64_t>(now_ms))) {
    logger()->debug("beaconing: sent beacon {} not recorded", beacon.uuid);
  }
  ++counters_.beacons_sent;
  return true;
}

bool BeaconingEngine::send_multicast_beacon(const transport::MulticastSource& src,
                                            const BeaconPayload& beacon,
                                            const std::vector<uint8_t>& bytes, uint64_t now_ms) {
  if (!transport_ready() || bytes.empty()) return false;

  const auto r = transport_->send_multicast(src, bytes.data(), bytes.size());
  if (r != transport::TxResult::Ok) {
    ++counters_.send_failures;
    logger()->warn("transport: error while sending multicast beacon via {}: {}",
                   src.family == AddressFamily::IPv4 ? src.ipv4_address
                                                     : "ifindex " + std::to_string(src.ifindex),
                   transport_->last_error());
    return false;
  }
  if (!tx_queue_.remember(beacon.uuid, beacon, static_cast<int64_t>(now_ms))) {
    logger()->debug("beaconing: sent beacon {} not recorded", beacon.uuid);
  }
  ++counters_.beacons_sent;
  return true;
}

// -----------------------------------------------------------------------------
// queue_multicast_beaconing()
// POLICY:
//   - One pending round at most. A new request only upgrades an advertisement
//     round to a solicitation.
//   - Deadline = last round + minimum interval, or now if that already passed
//     (or nothing was ever sent).
// -----------------------------------------------------------------------------
void BeaconingEngine::queue_multicast_beaconing(bool solicitation, uint64_t now_ms) {
  if (stopped_) return;

  if (pending_) {
    if (solicitation) pending_type_ = BeaconType::Solicitation;   // never downgraded
    return;
  }

  rebase_timers(now_ms);
  pending_      = true;
  pending_type_ = solicitation ? BeaconType::Solicitation : BeaconType::Advertisement;

  uint64_t deadline = now_ms;
  if (have_last_broadcast_) {
    const uint64_t earliest = last_broadcast_ms_ + opts_.min_broadcast_interval_ms;
    if (earliest > now_ms) deadline = earliest;
  }
  pending_deadline_ms_ = deadline;
  logger()->debug("beaconing: {} round queued in {} ms", to_string(pending_type_), deadline - now_ms);
}

// -----------------------------------------------------------------------------
// send_multicast_beacons()
// OUT (per enabled interface):
//   - no links: one untagged beacon via the IPv6 interface index,
//   - otherwise one beacon per link with `remote.subnet` stamped (IPv4 links
//     select the source address, IPv6 links the interface index), plus one
//     untagged IPv6 beacon when none of the links were IPv6.
//   - IPv6 beacons need an interface index. Without one (index 0, as in an
//     inventory file that omits it) they are skipped, matching the memberships.
// -----------------------------------------------------------------------------
void BeaconingEngine::send_multicast_beacons(BeaconType type, uint64_t now_ms) {
  ++counters_.multicast_rounds;
  size_t sent = 0;

  for (const auto& kv : interfaces_) {
    const InterfaceInfo& info = kv.second;
    if (!info.enabled) continue;

    transport::MulticastSource v6;
    v6.family  = AddressFamily::IPv6;
    v6.ifindex = info.index;

    const bool can_v6 = info.index != 0;
    if (!can_v6) logger()->debug("beaconing: {} has no interface index, no IPv6 beacons", info.name);

    std::vector<uint8_t> bytes;
    if (info.links.empty()) {
      if (!can_v6) continue;
      const BeaconPayload b = create_beacon(type, info.to_remote(), std::nullopt, now_ms, bytes);
      if (send_multicast_beacon(v6, b, bytes, now_ms)) ++sent;
      continue;
    }

    bool sent_v6 = false;
    for (const auto& link : info.links) {
      if (link.family == AddressFamily::IPv6 && !can_v6) continue;
      RemoteInterface remote = info.to_remote();
      remote.subnet = link.subnet();
      const BeaconPayload b = create_beacon(type, remote, std::nullopt, now_ms, bytes);

      transport::MulticastSource src = v6;
      if (link.family == AddressFamily::IPv4) {
        src.family       = AddressFamily::IPv4;
        src.ipv4_address = link.ip();
      } else {
        sent_v6 = true;
      }
      if (send_multicast_beacon(src, b, bytes, now_ms)) ++sent;
    }

    if (!sent_v6 && can_v6) {
      const BeaconPayload b = create_beacon(type, info.to_remote(), std::nullopt, now_ms, bytes);
      if (send_multicast_beacon(v6, b, bytes, now_ms)) ++sent;
    }
  }

  logger()->debug("beaconing: {} round sent {} beacon(s)", to_string(type), sent);
}

// ---------- shutdown ----------

void BeaconingEngine::stop() {
  if (stopped_) return;

  interfaces_.clear();
  reconcile_memberships();                        // leaves every joined group
  state_   = State::Idle;
  pending_ = false;

  tx_queue_.clear();
  rx_queue_.clear();
  hint_queue_.clear();

  if (transport_) {
    transport_->end();
    logger()->info("beaconing: stopped");
  }
  stopped_ = true;
}

// ---------- queries ----------

HintSet BeaconingEngine::topology_hints(uint64_t now_ms) {
  hint_queue_.age_out(static_cast<int64_t>(now_ms));
  HintSet all;
  for (const auto& e : hint_queue_) all.insert(e.value.begin(), e.value.end());
  return all;
}

json BeaconingEngine::topology_hints_json(uint64_t now_ms) {
  return hints_to_json(topology_hints(now_ms));
}

} // namespace netbeacon
