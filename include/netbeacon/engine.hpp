/**
 * @file engine.hpp
 * @brief BeaconingEngine: the single-owner event loop behind fabric discovery.
 *
 * @details
 * ## Operational Model
 * ```
 *  [observer processes / CLI]       [BeaconingEngine]                 [transport]
 *            │                              │                              │
 *   normalized JSON ── add_event() ──►  inbox (bounded)                    │
 *            │                              │  ◄── poll_transport() ── recv() datagrams
 *  [interface monitor]                      │                              │
 *   inventory ──────── add_event() ──►  inbox                              │
 *                                           │                              │
 *                                  tick(now_ms)                            │
 *                                      ├─ process one event                │
 *                                      │    ├─ age, own/dup checks         │
 *                                      │    ├─ remember, infer hints       │
 *                                      │    └─ reply to solicitations ─────► send_unicast()
 *                                      ├─ pending multicast round due? ────► send_multicast() x N
 *                                      └─ periodic solicitation due?       │
 *                                           │
 *                          topology_hints(now_ms) ──► region / hints file
 * ```
 *
 * - Everything that mutates engine state runs on the caller's thread, inside
 *   tick() or the handlers it calls. Collaborators only push events.
 * - At most one inbound event is processed per tick(), as in a tick-driven core.
 *   Drive tick() faster for more throughput.
 *
 * @par States
 * `Idle` while no enabled interface is configured, `Active` otherwise. Periodic
 * solicitations only run while Active.
 *
 * @par Rate limiting
 * Broadcast requests coalesce into one pending round. A pending advertisement
 * round is upgraded to a solicitation when one is requested, never the reverse.
 * The round fires once `min_broadcast_interval_ms` has passed since the last one.
 *
 * @par Failure Model
 * - Inbox full: add_event() returns false; the caller drops or retries.
 * - Undecodable datagram, malformed observation, missing or stale UUID: counted
 *   as rejected and logged at debug level. Nothing else happens.
 * - Send failure: counted and logged at warn level. The beacon is not recorded as
 *   transmitted.
 * - Join/leave failure: logged; the membership is retried on the next update.
 */
#ifndef NETBEACON_ENGINE_HPP
#define NETBEACON_ENGINE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "etl/deque.h"
#include "nlohmann/json.hpp"
#include "netbeacon/aging_queue.hpp"
#include "netbeacon/beacon.hpp"
#include "netbeacon/interfaces.hpp"
#include "netbeacon/topology.hpp"
#include "netbeacon/transport/transport_base.hpp"

namespace netbeacon {

/**
 * @struct Event
 * @brief One inbound item for the engine. Immutable once queued.
 */
struct Event {
  enum class Kind : uint8_t {
    ObservationReceived,   ///< normalized beacon JSON (observer process, CLI)
    DatagramReceived,      ///< raw datagram from the engine's own socket
    InterfacesUpdated,     ///< fresh inventory snapshot
    StopRequested,         ///< shut down: leave groups, clear state, close socket
  };

  Kind                kind{Kind::StopRequested};
  json                observation;
  transport::Datagram datagram;
  InterfaceMap        interfaces;

  static Event observation_received(json obs);
  static Event datagram_received(transport::Datagram d);
  static Event interfaces_updated(InterfaceMap interfaces);
  static Event stop_requested();
};

class BeaconingEngine {
public:
  /// @name Capacities
  ///@{
  static constexpr size_t INBOX_CAP = 64;           ///< Max inbound events queued
  ///@}

  enum class State : uint8_t { Idle, Active };

  struct Options {
    uint64_t aging_window_ms{DEFAULT_AGING_WINDOW_MS};
    uint64_t min_broadcast_interval_ms{5000};
    uint64_t solicitation_interval_ms{60000};       ///< 0 disables periodic solicitation
    bool     process_socket_beacons{false};         ///< false: socket datagrams are read and dropped
  };

  struct Counters {
    uint64_t beacons_sent{0};
    uint64_t send_failures{0};
    uint64_t beacons_received{0};
    uint64_t beacons_rejected{0};
    uint64_t multicast_rounds{0};
  };

  /**
   * @brief Construct an engine.
   *
   * @param transport Already-begun transport, or nullptr for an engine that only
   *                  consumes observations (nothing is ever sent).
   * @param opts      Timing knobs.
   */
  explicit BeaconingEngine(std::unique_ptr<transport::IMulticastTransport> transport,
                           const Options& opts = Options{});
  ~BeaconingEngine();

  BeaconingEngine(const BeaconingEngine&) = delete;
  BeaconingEngine& operator=(const BeaconingEngine&) = delete;

  // ---- main loop ----

  /// Enqueue an event. false when the inbox is full.
  bool add_event(Event ev);

  /// Process at most one event, then fire due timers.
  void tick(uint64_t now_ms);

  /**
   * @brief Drain readable datagrams from the socket into the inbox.
   * @return Datagrams read (including ones dropped because processing is off).
   */
  size_t poll_transport(uint64_t now_ms);

  /// Milliseconds until the next timer is due (capped at `cap_ms`); 0 if overdue.
  uint64_t next_timeout_ms(uint64_t now_ms, uint64_t cap_ms) const;

  // ---- operations (also reachable through events) ----

  /// Record a new inventory, reconcile memberships, update state.
  void update_interfaces(const InterfaceMap& interfaces, uint64_t now_ms);

  /// Process one normalized beacon observation.
  void beacon_received(const json& observation, uint64_t now_ms);

  /// Decode a datagram from the socket and process it.
  void datagram_received(const transport::Datagram& d, uint64_t now_ms);

  /**
   * @brief Request a multicast round, rate limited and coalesced.
   * @param solicitation true for a solicitation round, false for an advertisement.
   */
  void queue_multicast_beaconing(bool solicitation, uint64_t now_ms);

  /// Send one multicast round now, bypassing the rate limiter.
  void send_multicast_beacons(BeaconType type, uint64_t now_ms);

  /**
   * @brief Unicast one beacon. Records it as transmitted only on success.
   * @return true if the datagram left the socket.
   */
  bool send_beacon(const BeaconPayload& beacon, const std::vector<uint8_t>& bytes,
                   const std::string& ip, uint16_t port, uint64_t now_ms);

  /// Leave groups, cancel the pending round, clear queues, close the transport. Idempotent.
  void stop();

  // ---- queries ----

  /// Union of all live hints (ages the hint queue first).
  HintSet topology_hints(uint64_t now_ms);
  json    topology_hints_json(uint64_t now_ms);

  State state() const { return state_; }
  bool  stopped() const { return stopped_; }
  const Counters& counters() const { return counters_; }
  const Options&  options() const { return opts_; }
  const InterfaceMap& interfaces() const { return interfaces_; }
  const std::set<transport::Membership>& memberships() const { return joined_; }
  size_t inbox_size() const { return inbox_.size(); }

  bool       broadcast_pending() const { return pending_; }
  BeaconType pending_type() const { return pending_type_; }
  uint64_t   pending_deadline_ms() const { return pending_deadline_ms_; }

  const AgingQueue<BeaconPayload>&               tx_queue() const { return tx_queue_; }
  const AgingQueue<std::vector<ReceivedBeacon>>& rx_queue() const { return rx_queue_; }
  const AgingQueue<HintSet>&                     hint_queue() const { return hint_queue_; }

  transport::IMulticastTransport* transport() const { return transport_.get(); }

private:
  void process_one(uint64_t now_ms);
  void fire_timers(uint64_t now_ms);
  void rebase_timers(uint64_t now_ms);

  // Ages rx first, then checks for an existing list before appending.
  bool remember_beacon_and_check_duplicate(const ReceivedBeacon& rx, uint64_t now_ms,
                                           const std::vector<ReceivedBeacon>** seen);
  void remember_hints(const std::string& uuid, const HintSet& hints, uint64_t now_ms);
  void reply_to_solicitation(const ReceivedBeacon& rx, uint64_t now_ms);
  bool send_multicast_beacon(const transport::MulticastSource& src, const BeaconPayload& beacon,
                             const std::vector<uint8_t>& bytes, uint64_t now_ms);
  void reconcile_memberships();
  bool transport_ready() const;

  std::unique_ptr<transport::IMulticastTransport> transport_;
  Options   opts_;
  Counters  counters_{};
  State     state_{State::Idle};
  bool      stopped_{false};

  etl::deque<Event, INBOX_CAP> inbox_;

  InterfaceMap                    interfaces_;
  std::set<transport::Membership> joined_;

  AgingQueue<BeaconPayload>               tx_queue_;
  AgingQueue<std::vector<ReceivedBeacon>> rx_queue_;
  AgingQueue<HintSet>                     hint_queue_;

  // rate limiter
  bool       pending_{false};
  BeaconType pending_type_{BeaconType::Advertisement};
  uint64_t   pending_deadline_ms_{0};
  bool       have_last_broadcast_{false};
  uint64_t   last_broadcast_ms_{0};

  uint64_t   next_solicitation_ms_{0};
};

} // namespace netbeacon

#endif // NETBEACON_ENGINE_HPP
