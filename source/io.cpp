#include <svcman/io.hpp>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace fs = std::filesystem;

namespace svcman {
namespace io {

void UniqueFd::reset(int fd) {
  if (fd_ >= 0) ::close(fd_);
  fd_ = fd;
}

void ensure_dir(const fs::path& p) {
  if (p.empty()) return;
  std::error_code ec;
  if (fs::is_directory(p, ec)) return;
  fs::create_directories(p, ec);
  if (ec) throw std::system_error(ec, "create_directories " + p.string());
  fs::permissions(p, fs::perms::owner_all, fs::perm_options::replace, ec);
}

int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) == 0) return 0;
#endif
  if (::pipe(pfd) != 0) return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

static std::system_error errno_error(const std::string& what) {
  return std::system_error(errno, std::generic_category(), what);
}

void write_file_atomic(const fs::path& path, const std::string& data, unsigned mode) {
  fs::path tmp = path;
  tmp += ".tmp." + std::to_string(::getpid());

  UniqueFd fd(::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC,
                     static_cast<mode_t>(mode)));
  if (!fd) throw errno_error("open " + tmp.string());

  const char* p = data.data();
  size_t left = data.size();
  while (left > 0) {
    ssize_t n = ::write(fd.get(), p, left);
    if (n < 0) {
      if (errno == EINTR) continue;
      auto e = errno_error("write " + tmp.string());
      ::unlink(tmp.c_str());
      throw e;
    }
    p += n;
    left -= static_cast<size_t>(n);
  }
  if (::fsync(fd.get()) != 0) {
    auto e = errno_error("fsync " + tmp.string());
    ::unlink(tmp.c_str());
    throw e;
  }
  fd.reset();

  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    auto e = errno_error("rename " + path.string());
    ::unlink(tmp.c_str());
    throw e;
  }
}

} // namespace io
} // namespace svcman
