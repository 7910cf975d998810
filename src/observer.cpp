// ============================================================================
// observer.cpp - implementation for observer.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "netbeacon/observer.hpp"
#include "netbeacon/log.hpp"

#include <fcntl.h>         // open(), fcntl(), O_* flags
#include <signal.h>        // kill(), SIGTERM/SIGKILL
#include <sys/wait.h>      // waitpid()
#include <unistd.h>        // fork(), execvp(), pipe2(), dup2(), read(), close()

#include <cerrno>          // errno
#include <cstring>         // strerror
#include <sstream>         // whitespace split of the command template

namespace netbeacon {

static constexpr size_t READ_CHUNK = 4096;

// -------- helpers --------

std::vector<std::string> split_lines(std::string& buffer) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (true) {
    const size_t nl = buffer.find('\n', start);
    if (nl == std::string::npos) break;
    std::string line = buffer.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(std::move(line));
    start = nl + 1;
  }
  buffer.erase(0, start);                       // keep the incomplete tail
  return lines;
}

std::vector<std::string> expand_observer_command(const std::string& tmpl, const std::string& ifname) {
  static const std::string TOKEN = "{ifname}";
  std::vector<std::string> argv;
  std::istringstream ss(tmpl);
  std::string word;
  while (ss >> word) {
    size_t pos = 0;
    while ((pos = word.find(TOKEN, pos)) != std::string::npos) {
      word.replace(pos, TOKEN.size(), ifname);
      pos += ifname.size();
    }
    argv.push_back(word);
  }
  return argv;
}

static bool set_nonblocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// ---------- ObserverLineBuffer ----------

ObserverLineBuffer::ObserverLineBuffer(std::string ifname, ObjectCallback cb)
: ifname_(std::move(ifname)), cb_(std::move(cb)) {}

void ObserverLineBuffer::feed(const char* data, size_t len) {
  if (!data || !len) return;
  buf_.append(data, len);
  for (const auto& line : split_lines(buf_)) line_received(line);
}

void ObserverLineBuffer::flush() {
  if (buf_.empty()) return;
  std::string last;
  last.swap(buf_);
  line_received(last);
}

void ObserverLineBuffer::line_received(const std::string& line) {
  if (line.find_first_not_of(" \t") == std::string::npos) return;   // blank
  json obj;
  try {
    obj = json::parse(line);
  } catch (const json::parse_error& e) {
    ++malformed_;
    logger()->warn("monitor: observe-beacons[{}]: failed to parse JSON: {}", ifname_, e.what());
    return;
  }
  if (!obj.is_object()) {
    ++malformed_;
    logger()->warn("monitor: observe-beacons[{}]: expected a JSON object: {}", ifname_, line);
    return;
  }
  if (!ifname_.empty()) obj["interface"] = ifname_;
  ++objects_;
  if (cb_) cb_(std::move(obj));
}

// ---------- ObserverProcess ----------

ObserverProcess::ObserverProcess(std::string ifname, std::vector<std::string> argv,
                                 uint64_t restart_ms, ObserverLineBuffer::ObjectCallback cb)
: ifname_(ifname),
  argv_(std::move(argv)),
  restart_ms_(restart_ms),
  out_(std::move(ifname), std::move(cb)) {}

ObserverProcess::~ObserverProcess() {
  stop();
  if (pid_ > 0) {                               // no later service() will reap it
    signal_group(SIGKILL);
    if (!reap(true)) pid_ = -1;
  }
  close_pipes();
}

std::vector<int> ObserverProcess::fds() const {
  std::vector<int> v;
  if (out_fd_ >= 0) v.push_back(out_fd_);
  if (err_fd_ >= 0) v.push_back(err_fd_);
  return v;
}

// ---------------------------------------------------------------------------
// start()
// -------
// Phases:
//   1) two pipes (stdout, stderr), close-on-exec so siblings don't inherit them,
//   2) fork; the child moves into its own process group, takes /dev/null as
//      stdin, wires the pipe write ends to 1/2 and execs,
//   3) the parent keeps the read ends, non-blocking.
// On failure a restart is scheduled, same as if the child had exited.
// ---------------------------------------------------------------------------
bool ObserverProcess::start(uint64_t now_ms) {
  if (running()) return true;
  stopped_ = false;
  restart_pending_ = false;
  have_kill_at_ = false;
  killed_ = false;

  if (argv_.empty()) {
    logger()->error("monitor: observe-beacons[{}]: empty command", ifname_);
    return false;
  }

  int outp[2] = {-1, -1};
  int errp[2] = {-1, -1};
  if (::pipe2(outp, O_CLOEXEC) != 0) {
    logger()->error("monitor: observe-beacons[{}]: pipe: {}", ifname_, std::strerror(errno));
    restart_pending_ = true;
    restart_at_ms_   = now_ms + restart_ms_;
    return false;
  }
  if (::pipe2(errp, O_CLOEXEC) != 0) {
    logger()->error("monitor: observe-beacons[{}]: pipe: {}", ifname_, std::strerror(errno));
    ::close(outp[0]); ::close(outp[1]);
    restart_pending_ = true;
    restart_at_ms_   = now_ms + restart_ms_;
    return false;
  }

  std::vector<char*> args;
  for (auto& a : argv_) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    logger()->error("monitor: observe-beacons[{}]: fork: {}", ifname_, std::strerror(errno));
    ::close(outp[0]); ::close(outp[1]);
    ::close(errp[0]); ::close(errp[1]);
    restart_pending_ = true;
    restart_at_ms_   = now_ms + restart_ms_;
    return false;
  }

  if (pid == 0) {
    // child: only async-signal-safe calls from here on
    ::setpgid(0, 0);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(outp[1], STDOUT_FILENO);
    ::dup2(errp[1], STDERR_FILENO);
    ::execvp(args[0], args.data());
    ::_exit(127);
  }

  // parent
  if (::setpgid(pid, pid) != 0 && errno != EACCES) {
    // EACCES: the child already exec'd and set its own group
    logger()->debug("monitor: observe-beacons[{}]: setpgid: {}", ifname_, std::strerror(errno));
  }
  ::close(outp[1]);
  ::close(errp[1]);
  out_fd_ = outp[0];
  err_fd_ = errp[0];
  if (!set_nonblocking(out_fd_) || !set_nonblocking(err_fd_)) {
    logger()->warn("monitor: observe-beacons[{}]: cannot make pipes non-blocking", ifname_);
  }
  pid_ = pid;

  logger()->info("monitor: started {} for {} (pid {})", argv_.front(), ifname_, pid_);
  return true;
}

void ObserverProcess::drain(uint64_t now_ms) {
  (void)now_ms;
  if (out_fd_ < 0) return;
  char chunk[READ_CHUNK];
  while (true) {
    const ssize_t n = ::read(out_fd_, chunk, sizeof(chunk));
    if (n > 0) { out_.feed(chunk, static_cast<size_t>(n)); continue; }
    if (n < 0 && errno == EINTR) continue;
    break;                                      // EAGAIN, EOF or error
  }
}

void ObserverProcess::drain_stderr() {
  if (err_fd_ < 0) return;
  char chunk[READ_CHUNK];
  while (true) {
    const ssize_t n = ::read(err_fd_, chunk, sizeof(chunk));
    if (n > 0) { err_buf_.append(chunk, static_cast<size_t>(n)); continue; }
    if (n < 0 && errno == EINTR) continue;
    break;
  }
  for (const auto& line : split_lines(err_buf_)) {
    logger()->info("observe-beacons[{}]: {}", ifname_, line);
  }
}

bool ObserverProcess::reap(bool block) {
  if (pid_ <= 0) return true;
  int status = 0;
  const pid_t r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
  if (r == 0) return false;                     // still running
  if (r < 0 && errno != ECHILD) {
    logger()->warn("monitor: observe-beacons[{}]: waitpid: {}", ifname_, std::strerror(errno));
    return false;
  }
  if (r == pid_) {
    if (WIFEXITED(status))
      logger()->info("monitor: observe-beacons[{}] exited with status {}", ifname_, WEXITSTATUS(status));
    else if (WIFSIGNALED(status))
      logger()->info("monitor: observe-beacons[{}] killed by signal {}", ifname_, WTERMSIG(status));
  }
  pid_ = -1;
  return true;
}

void ObserverProcess::close_pipes() {
  if (out_fd_ >= 0) { ::close(out_fd_); out_fd_ = -1; }
  if (err_fd_ >= 0) { ::close(err_fd_); err_fd_ = -1; }
  out_.flush();
  if (!err_buf_.empty()) {
    logger()->info("observe-beacons[{}]: {}", ifname_, err_buf_);
    err_buf_.clear();
  }
}

void ObserverProcess::signal_group(int sig) {
  if (::kill(-pid_, sig) != 0 && ::kill(pid_, sig) != 0 && errno != ESRCH) {
    logger()->warn("monitor: observe-beacons[{}]: {}: {}", ifname_,
                   sig == SIGKILL ? "SIGKILL" : "SIGTERM", std::strerror(errno));
  }
}

// escalate() - SIGKILL a stopped child still alive STOP_GRACE_MS after the
// first service() that saw it.
void ObserverProcess::escalate(uint64_t now_ms) {
  if (killed_) return;
  if (!have_kill_at_) {
    have_kill_at_ = true;
    kill_at_ms_   = now_ms + STOP_GRACE_MS;
    return;
  }
  if (now_ms < kill_at_ms_) return;
  logger()->warn("monitor: observe-beacons[{}] ignored SIGTERM, killing", ifname_);
  signal_group(SIGKILL);
  killed_ = true;
}

// ---------------------------------------------------------------------------
// service()
// ---------
// Called from the daemon loop. Never blocks.
// ---------------------------------------------------------------------------
void ObserverProcess::service(uint64_t now_ms) {
  if (running()) {
    drain(now_ms);
    drain_stderr();
    if (reap(false)) {
      drain(now_ms);                            // whatever was written before exit
      drain_stderr();
      close_pipes();
      if (!stopped_) {
        restart_pending_ = true;
        restart_at_ms_   = now_ms + restart_ms_;
        logger()->info("monitor: restarting observe-beacons[{}] in {} ms", ifname_, restart_ms_);
      } else {
        logger()->info("monitor: stopped observe-beacons[{}]", ifname_);
      }
      return;
    }
    if (stopped_) escalate(now_ms);
    return;
  }

  if (restart_pending_ && !stopped_ && now_ms >= restart_at_ms_) {
    start(now_ms);
  }
}

// ---------------------------------------------------------------------------
// stop()
// ------
// POLICY: TERM the whole group so helpers the command spawned go too, and
//         return. A child that does not exit right away is reaped by service(),
//         which sends KILL once STOP_GRACE_MS have passed.
// ---------------------------------------------------------------------------
void ObserverProcess::stop() {
  const bool first = !stopped_;
  stopped_ = true;
  restart_pending_ = false;

  if (pid_ <= 0) {
    close_pipes();
    return;
  }
  if (first) signal_group(SIGTERM);
  if (reap(false)) {
    drain(0);
    drain_stderr();
    close_pipes();
    logger()->info("monitor: stopped observe-beacons[{}]", ifname_);
  }
}

} // namespace netbeacon
