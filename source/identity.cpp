#include <svcman/identity.hpp>
#include <svcman/io.hpp>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <limits>
#include <string>

namespace fs = std::filesystem;

namespace svcman {

// the whole buffer must be one positive decimal number, optionally padded by whitespace
static pid_t parse_pid(const std::string& s) {
  size_t i = 0, n = s.size();
  auto space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
  while (i < n && space(s[i])) ++i;
  while (n > i && space(s[n - 1])) --n;
  if (i == n) return 0;

  std::int64_t v = 0;
  for (; i < n; ++i) {
    char c = s[i];
    if (c < '0' || c > '9') return 0;
    v = v * 10 + (c - '0');
    if (v > std::numeric_limits<pid_t>::max()) return 0;
  }
  return static_cast<pid_t>(v);
}

Identity IdentityStore::read() const {
  Identity id{};
  io::UniqueFd fd(::open(path_.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd) return id; // no pidfile

  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) return id;

  std::string data;
  char buf[64];
  for (;;) {
    ssize_t n = ::read(fd.get(), buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      return id;
    }
    if (n == 0) break;
    data.append(buf, static_cast<size_t>(n));
    if (data.size() > 64) return id; // not a pid file
  }

  id.pid = parse_pid(data);
  if (id.pid == 0) {
    spdlog::debug("ignoring unparsable pid file {}", path_.string());
    return id;
  }
  id.recorded_at = std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::seconds(st.st_mtim.tv_sec) +
          std::chrono::nanoseconds(st.st_mtim.tv_nsec)));
  return id;
}

void IdentityStore::write(pid_t pid) const {
  io::ensure_dir(path_.parent_path());
  io::write_file_atomic(path_, std::to_string(pid), 0600);
}

void IdentityStore::remove() const noexcept {
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) spdlog::debug("remove {}: {}", path_.string(), ec.message());
}

} // namespace svcman
