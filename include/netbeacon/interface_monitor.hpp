/**
 * @file interface_monitor.hpp
 * @brief Keeps the engine and the observer processes in step with the interface inventory.
 *
 * @details
 * On every refresh (default every 30 s) the monitor:
 *  1. takes the host-wide lock if it does not hold it yet (skip the round otherwise),
 *  2. reads the inventory,
 *  3. if it changed, pushes an `InterfacesUpdated` event into the engine,
 *  4. starts an observer for each newly monitored interface and stops the observers
 *     of interfaces that went away.
 *
 * The monitored set is the enabled interfaces, optionally narrowed to an explicit
 * name list. stop() tears every observer down and hands the engine an empty
 * inventory.
 */
#ifndef NETBEACON_INTERFACE_MONITOR_HPP
#define NETBEACON_INTERFACE_MONITOR_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "netbeacon/engine.hpp"
#include "netbeacon/interfaces.hpp"
#include "netbeacon/observer.hpp"

namespace netbeacon {

/// Default host lock file.
static constexpr const char* DEFAULT_LOCK_PATH = "/run/netbeacon/networks-monitoring.lock";

/**
 * @class HostLock
 * @brief Exclusive, non-blocking flock(2) on a file. Released on destruction.
 */
class HostLock {
public:
  HostLock() = default;
  ~HostLock() { release(); }

  HostLock(const HostLock&) = delete;
  HostLock& operator=(const HostLock&) = delete;

  /**
   * @brief Try to take the lock; creates parent directory and file as needed.
   * @retval false Held by someone else, or the file could not be opened (`err`).
   */
  bool try_acquire(const std::string& path, std::string& err);
  void release();
  bool held() const { return fd_ >= 0; }

private:
  int fd_{-1};
};

class InterfaceMonitor {
public:
  using InventoryFn     = std::function<bool(InterfaceMap&, std::string&)>;
  using ObserverFactory = std::function<std::unique_ptr<IObserver>(const std::string& ifname)>;
  using EventSink       = std::function<bool(Event)>;

  struct Options {
    uint64_t refresh_interval_ms{30000};
    std::vector<std::string> monitor_interfaces;   ///< empty = every enabled interface
    std::string lock_path;                         ///< empty = no host lock
  };

  InterfaceMonitor(InventoryFn inventory, ObserverFactory factory, EventSink sink,
                   const Options& opts);
  ~InterfaceMonitor();

  InterfaceMonitor(const InterfaceMonitor&) = delete;
  InterfaceMonitor& operator=(const InterfaceMonitor&) = delete;

  /// Refresh if due, then service every observer, including stopped ones still exiting.
  void service(uint64_t now_ms);

  /**
   * @brief One reconciliation round, regardless of the refresh timer.
   * @retval false Lock not held or the inventory could not be read.
   */
  bool refresh(uint64_t now_ms);

  /// Stop every observer, push an empty inventory, release the lock. Idempotent.
  void stop();

  /// Observers stopped but not yet exited.
  size_t retiring() const { return retiring_.size(); }

  /// Interface names that currently have an observer.
  std::set<std::string> monitored() const;

  /// Pollable fds of every observer.
  std::vector<int> fds() const;

  const InterfaceMap& inventory() const { return inventory_; }
  bool lock_held() const { return lock_.held(); }
  uint64_t next_refresh_ms() const { return next_refresh_ms_; }

private:
  std::set<std::string> wanted(const InterfaceMap& inv) const;

  InventoryFn     inventory_fn_;
  ObserverFactory factory_;
  EventSink       sink_;
  Options         opts_;

  HostLock        lock_;
  InterfaceMap    inventory_;
  bool            have_inventory_{false};
  bool            stopped_{false};
  uint64_t        next_refresh_ms_{0};

  std::map<std::string, std::unique_ptr<IObserver>> observers_;
  std::vector<std::unique_ptr<IObserver>>            retiring_;
};

} // namespace netbeacon

#endif // NETBEACON_INTERFACE_MONITOR_HPP
