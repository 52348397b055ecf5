#pragma once
#include <svcman/process.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <sys/types.h>

namespace svcman {

// Decides whether a recorded pid still names the process that was started.
//
// A pid below 2 never resolves. A record older than the last boot may name a
// reused pid and does not resolve either. Otherwise signal 0 tells whether
// the pid exists and is ours to signal; an exited child of this process that
// has not been reaped yet is reaped here and does not resolve.
class LivenessResolver {
public:
  using UptimeFn = std::function<std::optional<std::chrono::seconds>()>;
  // returns 0 on success or an errno value, like kill(2)
  using SignalFn = std::function<int(pid_t, int)>;

  LivenessResolver();
  LivenessResolver(UptimeFn uptime, SignalFn signal);

  // shared resolver backed by sysinfo(2) and kill(2)
  static LivenessResolver& system();

  std::optional<Process> resolve(pid_t pid,
                                 std::chrono::system_clock::time_point recorded_at);

  // now minus uptime, computed on the first call and cached
  std::optional<std::chrono::system_clock::time_point> boot_time();

private:
  UptimeFn uptime_fn_;
  SignalFn signal_fn_;
  std::once_flag boot_once_;
  std::optional<std::chrono::system_clock::time_point> boot_;
};

std::optional<std::chrono::seconds> system_uptime();

} // namespace svcman
