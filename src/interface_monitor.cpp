// ============================================================================
// interface_monitor.cpp - implementation for interface_monitor.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "netbeacon/interface_monitor.hpp"
#include "netbeacon/log.hpp"

#include <fcntl.h>        // open()
#include <sys/file.h>     // flock()
#include <unistd.h>       // close()

#include <cerrno>
#include <cstring>
#include <filesystem>     // create the lock directory
#include <system_error>   // non-throwing filesystem ops

namespace fs = std::filesystem;
namespace netbeacon {

// ---------- HostLock ----------

bool HostLock::try_acquire(const std::string& path, std::string& err) {
  if (held()) return true;

  std::error_code ec;
  const fs::path p(path);
  if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);   // best effort; open() reports

  const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    err = "open " + path + ": " + std::strerror(errno);
    return false;
  }
  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    err = (errno == EWOULDBLOCK) ? "held by another process" : std::string("flock: ") + std::strerror(errno);
    ::close(fd);
    return false;
  }
  fd_ = fd;
  return true;
}

void HostLock::release() {
  if (fd_ < 0) return;
  if (::flock(fd_, LOCK_UN) != 0) {
    // closing below releases it anyway
    logger()->debug("monitor: unlock: {}", std::strerror(errno));
  }
  ::close(fd_);
  fd_ = -1;
}

// ---------- InterfaceMonitor ----------

InterfaceMonitor::InterfaceMonitor(InventoryFn inventory, ObserverFactory factory, EventSink sink,
                                   const Options& opts)
: inventory_fn_(std::move(inventory)),
  factory_(std::move(factory)),
  sink_(std::move(sink)),
  opts_(opts) {}

InterfaceMonitor::~InterfaceMonitor() {
  stop();
}

void InterfaceMonitor::service(uint64_t now_ms) {
  if (stopped_) return;
  if (now_ms >= next_refresh_ms_) refresh(now_ms);
  for (auto& kv : observers_) kv.second->service(now_ms);

  for (auto it = retiring_.begin(); it != retiring_.end(); ) {
    (*it)->service(now_ms);
    if ((*it)->running()) { ++it; continue; }
    it = retiring_.erase(it);
  }
}

std::set<std::string> InterfaceMonitor::wanted(const InterfaceMap& inv) const {
  std::set<std::string> out;
  for (const auto& kv : inv) {
    if (!kv.second.enabled) continue;
    if (!opts_.monitor_interfaces.empty()) {
      bool listed = false;
      for (const auto& n : opts_.monitor_interfaces) listed = listed || n == kv.first;
      if (!listed) continue;
    }
    out.insert(kv.first);
  }
  return out;
}

// ---------------------------------------------------------------------------
// refresh()
// ---------
// PRE:    not stopped.
// POLICY:
//   - Without the host lock nothing is touched; the next round retries.
//   - The engine is only told about real changes. If its inbox is full the
//     inventory is not marked as delivered, so the next round tries again.
//   - Observers follow the monitored set by set difference.
// ---------------------------------------------------------------------------
bool InterfaceMonitor::refresh(uint64_t now_ms) {
  next_refresh_ms_ = now_ms + opts_.refresh_interval_ms;
  if (stopped_) return false;

  if (!opts_.lock_path.empty() && !lock_.held()) {
    std::string err;
    if (!lock_.try_acquire(opts_.lock_path, err)) {
      logger()->debug("monitor: not monitoring interfaces: lock {}: {}", opts_.lock_path, err);
      return false;
    }
    logger()->info("monitor: acquired {}", opts_.lock_path);
  }

  InterfaceMap inv;
  std::string err;
  if (!inventory_fn_ || !inventory_fn_(inv, err)) {
    logger()->warn("monitor: failed to read interfaces: {}", err);
    return false;
  }

  if (!have_inventory_ || inv != inventory_) {
    if (sink_ && sink_(Event::interfaces_updated(inv))) {
      inventory_      = inv;
      have_inventory_ = true;
      logger()->info("monitor: interfaces changed ({} total)", inv.size());
    } else {
      logger()->warn("monitor: engine inbox full; interface update deferred");
    }
  }

  const std::set<std::string> want = wanted(inv);

  for (auto it = observers_.begin(); it != observers_.end(); ) {
    if (want.count(it->first)) { ++it; continue; }
    logger()->info("monitor: stopping beacon observer on {}", it->first);
    it->second->stop();
    if (it->second->running()) retiring_.push_back(std::move(it->second));
    it = observers_.erase(it);
  }

  for (const auto& name : want) {
    if (observers_.count(name)) continue;
    std::unique_ptr<IObserver> obs = factory_ ? factory_(name) : nullptr;
    if (!obs) continue;
    logger()->info("monitor: starting beacon observer on {}", name);
    obs->start(now_ms);                          // a failed start retries on its own
    observers_.emplace(name, std::move(obs));
  }
  return true;
}

void InterfaceMonitor::stop() {
  if (stopped_) return;
  stopped_ = true;

  for (auto& kv : observers_) kv.second->stop();
  observers_.clear();
  retiring_.clear();

  if (have_inventory_ && sink_ && !sink_(Event::interfaces_updated(InterfaceMap{}))) {
    logger()->warn("monitor: engine inbox full; could not clear interfaces");
  }
  inventory_.clear();
  have_inventory_ = false;
  lock_.release();
}

std::set<std::string> InterfaceMonitor::monitored() const {
  std::set<std::string> out;
  for (const auto& kv : observers_) out.insert(kv.first);
  return out;
}

std::vector<int> InterfaceMonitor::fds() const {
  std::vector<int> out;
  for (const auto& kv : observers_) {
    const auto f = kv.second->fds();
    out.insert(out.end(), f.begin(), f.end());
  }
  for (const auto& obs : retiring_) {
    const auto f = obs->fds();
    out.insert(out.end(), f.begin(), f.end());
  }
  return out;
}

} // namespace netbeacon
