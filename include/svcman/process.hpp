#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace svcman {

struct LaunchSpec {
  std::string executable;
  std::vector<std::string> args;
  std::vector<std::string> env; // KEY=VALUE, appended to the inherited environment
  std::filesystem::path dir;
};

// Handle to an OS process. A spawned handle owns its process and kills it on
// destruction until release() is called; attached handles never own.
class Process {
public:
  static Process spawn(const LaunchSpec& spec);
  static Process attach(pid_t pid) { return Process(pid, false); }

  Process(Process&& o) noexcept;
  Process& operator=(Process&& o) noexcept;
  Process(const Process&) = delete;
  Process& operator=(const Process&) = delete;
  ~Process();

  pid_t pid() const { return pid_; }
  bool owning() const { return terminate_on_end_; }

  // let the process outlive this handle
  void release() { terminate_on_end_ = false; }

  // throws std::system_error
  void signal(int sig) const;

  // reaps the process if it is an exited child of ours
  bool alive();

  // SIGKILL and reap; throws std::system_error when the signal fails
  void kill();

  // blocks until exit. Returns the exit status, or nothing when the process
  // is not our child and cannot be waited on.
  std::optional<int> wait();

  // polls for exit until `timeout`; true once the process is gone
  bool wait_for(std::chrono::milliseconds timeout);

  std::optional<int> exit_code() const { return exit_code_; }

private:
  Process(pid_t pid, bool owning) : pid_(pid), terminate_on_end_(owning) {}
  void terminate_if_owned() noexcept;

  pid_t pid_ = 0;
  bool terminate_on_end_ = false;
  std::optional<int> exit_code_;
};

} // namespace svcman
