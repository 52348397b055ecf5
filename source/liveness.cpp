#include <svcman/liveness.hpp>

#include <spdlog/spdlog.h>

#include <signal.h>
#include <sys/sysinfo.h>
#include <sys/wait.h>

#include <cerrno>
#include <cstring>

namespace svcman {

std::optional<std::chrono::seconds> system_uptime() {
  struct sysinfo si{};
  if (::sysinfo(&si) != 0) {
    spdlog::warn("sysinfo failed: {}", std::strerror(errno));
    return std::nullopt;
  }
  return std::chrono::seconds(si.uptime);
}

static int kill_errno(pid_t pid, int sig) {
  return ::kill(pid, sig) == 0 ? 0 : errno;
}

LivenessResolver::LivenessResolver() : LivenessResolver(system_uptime, kill_errno) {}

LivenessResolver::LivenessResolver(UptimeFn uptime, SignalFn signal)
  : uptime_fn_(std::move(uptime)), signal_fn_(std::move(signal)) {
  if (!signal_fn_) signal_fn_ = kill_errno;
}

LivenessResolver& LivenessResolver::system() {
  static LivenessResolver r;
  return r;
}

std::optional<std::chrono::system_clock::time_point> LivenessResolver::boot_time() {
  std::call_once(boot_once_, [this] {
    if (!uptime_fn_) return;
    if (auto up = uptime_fn_()) boot_ = std::chrono::system_clock::now() - *up;
  });
  return boot_;
}

std::optional<Process> LivenessResolver::resolve(pid_t pid,
                                                 std::chrono::system_clock::time_point recorded_at) {
  // leave init alone
  if (pid < 2) return std::nullopt;

  if (auto boot = boot_time()) {
    if (recorded_at < *boot) {
      spdlog::debug("pid {} was recorded before the last boot", pid);
      return std::nullopt;
    }
  }

  int err = signal_fn_(pid, 0);
  if (err != 0) {
    spdlog::debug("pid {} not reachable: {}", pid, std::strerror(err));
    return std::nullopt;
  }

  // signal 0 still reaches a zombie child of ours
  int st = 0;
  if (::waitpid(pid, &st, WNOHANG) == pid) {
    spdlog::debug("pid {} exited", pid);
    return std::nullopt;
  }
  return Process::attach(pid);
}

} // namespace svcman
