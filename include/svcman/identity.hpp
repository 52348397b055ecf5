#pragma once
#include <chrono>
#include <filesystem>
#include <sys/types.h>

namespace svcman {

struct Identity {
  pid_t pid{0};
  std::chrono::system_clock::time_point recorded_at{};
  bool known() const { return pid != 0; }
};

// PID file access. A record that is missing or cannot be parsed reads as
// unknown (pid 0); only write() reports failures.
class IdentityStore {
public:
  explicit IdentityStore(std::filesystem::path path) : path_(std::move(path)) {}

  Identity read() const;
  void write(pid_t pid) const;
  void remove() const noexcept;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace svcman
