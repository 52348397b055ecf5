#pragma once
#include <filesystem>
#include <string>

namespace svcman {
namespace io {

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { reset(); }
  UniqueFd(UniqueFd&& o) noexcept : fd_(o.release()) {}
  UniqueFd& operator=(UniqueFd&& o) noexcept {
    if (this != &o) reset(o.release());
    return *this;
  }
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  int get() const { return fd_; }
  explicit operator bool() const { return fd_ >= 0; }
  int release() { int f = fd_; fd_ = -1; return f; }
  void reset(int fd = -1);

private:
  int fd_ = -1;
};

// throws std::system_error
void ensure_dir(const std::filesystem::path& p);

int make_cloexec_pipe(int pfd[2]);

// writes `data` to a temporary sibling, fsyncs and renames it over `path`.
// throws std::system_error
void write_file_atomic(const std::filesystem::path& path, const std::string& data,
                       unsigned mode);

} // namespace io
} // namespace svcman
