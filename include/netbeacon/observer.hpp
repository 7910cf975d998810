/**
 * @file observer.hpp
 * @brief Per-interface observer processes and their line-oriented JSON feed.
 *
 * @details
 * PURPOSE
 * -------
 * Raw capture of beacons on the wire is done by an external program, one per
 * interface. It prints one JSON object per line on stdout, each describing one
 * observed beacon, and diagnostics on stderr. This module runs that program, keeps
 * it running, and turns its stdout into JSON objects for the engine.
 *
 * WHAT THIS DOES
 * --------------
 * - ObserverLineBuffer: byte stream in, complete lines out, incomplete tail kept
 *   for the next read. Each line is parsed as JSON and stamped with `interface`.
 *   Lines that are not JSON objects are logged and skipped.
 * - ObserverProcess: fork/exec of the command in its own process group, stdin from
 *   /dev/null, stdout and stderr through non-blocking pipes. stderr lines are logged
 *   as `observe-beacons[<ifname>]: ...`. If the program exits it is restarted after
 *   the restart interval.
 *
 * HOW IT FITS IN
 * --------------
 * The interface monitor creates one observer per monitored interface through a
 * factory, so tests substitute observers that spawn nothing. The daemon polls the
 * fds() of every observer and calls service() from its single loop.
 */
#ifndef NETBEACON_OBSERVER_HPP
#define NETBEACON_OBSERVER_HPP

#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace netbeacon {

using json = nlohmann::json;

/// Default observer command; `{ifname}` is replaced by the interface name.
static constexpr const char* DEFAULT_OBSERVER_COMMAND = "netbeacon-observe-beacons {ifname}";

/**
 * @brief Split `buffer` into complete lines.
 *
 * Complete lines (without their `\n`, trailing `\r` stripped) are returned; the
 * incomplete tail stays in `buffer`.
 */
std::vector<std::string> split_lines(std::string& buffer);

/// Split a command template on whitespace and substitute `{ifname}` in each word.
std::vector<std::string> expand_observer_command(const std::string& tmpl, const std::string& ifname);

class ObserverLineBuffer {
public:
  using ObjectCallback = std::function<void(json)>;

  /// An empty `ifname` leaves each object's own `interface` field alone.
  ObserverLineBuffer(std::string ifname, ObjectCallback cb);

  /// Append bytes; emits one callback per complete, well-formed line.
  void feed(const char* data, size_t len);

  /// Process a final unterminated line, if any (call when the stream ends).
  void flush();

  const std::string& pending() const { return buf_; }
  size_t objects() const   { return objects_; }
  size_t malformed() const { return malformed_; }

private:
  void line_received(const std::string& line);

  std::string    ifname_;
  ObjectCallback cb_;
  std::string    buf_;
  size_t         objects_{0};
  size_t         malformed_{0};
};

/**
 * @brief Something that watches one interface. fds() feeds the daemon's poll set.
 */
class IObserver {
public:
  virtual ~IObserver() = default;
  virtual bool start(uint64_t now_ms) = 0;
  /// Ask the observer to end. It may keep running() until later service() calls.
  virtual void stop() = 0;
  virtual void service(uint64_t now_ms) = 0;
  virtual bool running() const = 0;
  virtual std::vector<int> fds() const { return {}; }
  virtual const std::string& ifname() const = 0;
};

class ObserverProcess : public IObserver {
public:
  static constexpr uint64_t STOP_GRACE_MS = 2000;   ///< SIGTERM -> SIGKILL delay

  /**
   * @param ifname      Interface this observer watches.
   * @param argv        Command and arguments (already expanded).
   * @param restart_ms  Delay before restarting an exited command.
   * @param cb          Receives each parsed object, `interface` already stamped.
   */
  ObserverProcess(std::string ifname, std::vector<std::string> argv,
                  uint64_t restart_ms, ObserverLineBuffer::ObjectCallback cb);
  ~ObserverProcess() override;

  ObserverProcess(const ObserverProcess&) = delete;
  ObserverProcess& operator=(const ObserverProcess&) = delete;

  /// Spawn the command. false if pipe/fork failed (a retry is scheduled).
  bool start(uint64_t now_ms) override;

  /**
   * @brief SIGTERM the process group and return. No restart.
   *
   * Never waits. running() stays true until service() has reaped the child, which
   * it SIGKILLs after the grace period. The destructor kills and reaps whatever is
   * left.
   */
  void stop() override;

  /// Drain pipes, reap an exited child, restart when due, escalate a stop.
  void service(uint64_t now_ms) override;

  bool running() const override { return pid_ > 0; }
  bool stopping() const { return stopped_ && pid_ > 0; }
  std::vector<int> fds() const override;
  const std::string& ifname() const override { return ifname_; }

  pid_t pid() const { return pid_; }
  const ObserverLineBuffer& stdout_buffer() const { return out_; }

private:
  void drain(uint64_t now_ms);
  void drain_stderr();
  bool reap(bool block);
  void close_pipes();
  void signal_group(int sig);
  void escalate(uint64_t now_ms);

  std::string              ifname_;
  std::vector<std::string> argv_;
  uint64_t                 restart_ms_;
  ObserverLineBuffer       out_;
  std::string              err_buf_;

  pid_t    pid_{-1};
  int      out_fd_{-1};
  int      err_fd_{-1};
  bool     stopped_{false};
  bool     restart_pending_{false};
  uint64_t restart_at_ms_{0};
  bool     have_kill_at_{false};
  uint64_t kill_at_ms_{0};
  bool     killed_{false};
};

} // namespace netbeacon

#endif // NETBEACON_OBSERVER_HPP
