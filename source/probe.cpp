#include <svcman/io.hpp>
#include <svcman/process.hpp>
#include <svcman/probe.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <system_error>

using namespace std::chrono_literals;

namespace svcman {

namespace {

struct Dialed {
  io::UniqueFd fd;
  bool hard = false; // retrying cannot help
  std::string error;
};

Dialed soft_fail(std::string why) { return Dialed{io::UniqueFd{}, false, std::move(why)}; }
Dialed hard_fail(std::string why) { return Dialed{io::UniqueFd{}, true, std::move(why)}; }

using steady = std::chrono::steady_clock;

// waits for `events` on fd until `deadline`, checking the context between slices
bool wait_fd(int fd, short events, const Context& ctx, steady::time_point deadline) {
  for (;;) {
    if (ctx.done()) return false;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - steady::now());
    if (left.count() <= 0) return false;
    int slice = static_cast<int>(std::min<long long>(left.count(), 50));
    pollfd p{fd, events, 0};
    int r = ::poll(&p, 1, slice);
    if (r > 0) return true;
    if (r < 0 && errno != EINTR) return false;
  }
}

Dialed connect_fd(io::UniqueFd fd, const sockaddr* addr, socklen_t len, const Context& ctx,
                  steady::time_point deadline) {
  if (::connect(fd.get(), addr, len) == 0) return Dialed{std::move(fd), false, {}};
  if (errno != EINPROGRESS && errno != EINTR) return soft_fail(std::strerror(errno));

  if (!wait_fd(fd.get(), POLLOUT, ctx, deadline)) return soft_fail("i/o timeout");
  int err = 0;
  socklen_t elen = sizeof(err);
  if (::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &err, &elen) != 0) err = errno;
  if (err != 0) return soft_fail(std::strerror(err));
  return Dialed{std::move(fd), false, {}};
}

// "host:port" or "[v6]:port"
std::pair<std::string, std::string> split_host_port(const std::string& address) {
  auto colon = address.rfind(':');
  if (colon == std::string::npos)
    throw std::invalid_argument(fmt::format("address {}: missing port in address", address));
  std::string host = address.substr(0, colon);
  std::string port = address.substr(colon + 1);
  if (!host.empty() && host.front() == '[') {
    if (host.back() != ']')
      throw std::invalid_argument(fmt::format("address {}: missing ']' in address", address));
    host = host.substr(1, host.size() - 2);
  } else if (host.find(':') != std::string::npos) {
    throw std::invalid_argument(fmt::format("address {}: too many colons in address", address));
  }
  if (port.empty())
    throw std::invalid_argument(fmt::format("address {}: missing port in address", address));
  return {host, port};
}

Dialed dial_tcp(const std::string& host, const std::string& port, int family, const Context& ctx,
                std::chrono::milliseconds io_timeout) {
  auto deadline = steady::now() + ctx.remaining(io_timeout);

  addrinfo hints{};
  hints.ai_family = family;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0) {
    std::string why = fmt::format("lookup {}:{}: {}", host, port, ::gai_strerror(rc));
    // an unknown service name stays unknown
    if (rc == EAI_SERVICE || rc == EAI_FAMILY || rc == EAI_SOCKTYPE) return hard_fail(why);
    return soft_fail(why);
  }
  std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res, ::freeaddrinfo);

  Dialed last = soft_fail("no addresses");
  for (auto* ai = res; ai; ai = ai->ai_next) {
    io::UniqueFd fd(::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                             ai->ai_protocol));
    if (!fd) {
      last = soft_fail(std::strerror(errno));
      continue;
    }
    last = connect_fd(std::move(fd), ai->ai_addr, ai->ai_addrlen, ctx, deadline);
    if (last.fd) return last;
  }
  return last;
}

Dialed dial_unix(const std::string& path, const Context& ctx, std::chrono::milliseconds io_timeout) {
  sockaddr_un sa{};
  if (path.empty() || path.size() >= sizeof(sa.sun_path))
    return hard_fail(fmt::format("unix address {}: invalid socket path", path));
  sa.sun_family = AF_UNIX;
  std::memcpy(sa.sun_path, path.c_str(), path.size());

  io::UniqueFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
  if (!fd) return soft_fail(std::strerror(errno));
  auto deadline = steady::now() + ctx.remaining(io_timeout);
  return connect_fd(std::move(fd), reinterpret_cast<const sockaddr*>(&sa), sizeof(sa), ctx,
                    deadline);
}

Dialed dial(const std::string& network, const std::string& address, const Context& ctx,
            std::chrono::milliseconds io_timeout) {
  if (network == "unix") return dial_unix(address, ctx, io_timeout);

  int family;
  if (network == "tcp") family = AF_UNSPEC;
  else if (network == "tcp4") family = AF_INET;
  else if (network == "tcp6") family = AF_INET6;
  else return hard_fail(fmt::format("dial {}: unknown network {}", address, network));

  std::pair<std::string, std::string> hp;
  try {
    hp = split_host_port(address);
  } catch (const std::invalid_argument& e) {
    return hard_fail(e.what());
  }
  return dial_tcp(hp.first, hp.second, family, ctx, io_timeout);
}

bool send_all(int fd, const std::string& data, const Context& ctx, steady::time_point deadline) {
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
    if (n > 0) {
      off += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      if (!wait_fd(fd, POLLOUT, ctx, deadline)) return false;
      continue;
    }
    return false;
  }
  return true;
}

// header block of the response; the body is read and discarded
struct HttpReply {
  int status = 0;
  bool complete = false;
};

std::optional<long long> content_length(const std::string& head) {
  std::string lower(head);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  auto pos = lower.find("\r\ncontent-length:");
  if (pos == std::string::npos) return std::nullopt;
  long long v = -1;
  if (std::sscanf(lower.c_str() + pos + 17, " %lld", &v) != 1 || v < 0) return std::nullopt;
  return v;
}

bool is_chunked(const std::string& head) {
  std::string lower(head);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  auto pos = lower.find("\r\ntransfer-encoding:");
  return pos != std::string::npos && lower.find("chunked", pos) != std::string::npos;
}

HttpReply read_reply(int fd, const Context& ctx, steady::time_point deadline) {
  HttpReply rep;
  std::string head;
  std::string tail; // last bytes of a chunked body
  std::optional<long long> want;
  bool chunked = false, have_head = false;
  long long body = 0;
  char buf[4096];

  for (;;) {
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        if (!wait_fd(fd, POLLIN, ctx, deadline)) return rep;
        continue;
      }
      return rep;
    }
    if (n == 0) {
      rep.complete = have_head;
      return rep;
    }

    const char* p = buf;
    size_t len = static_cast<size_t>(n);
    if (!have_head) {
      head.append(p, len);
      auto end = head.find("\r\n\r\n");
      if (end == std::string::npos) {
        if (head.size() > 64 * 1024) return rep;
        continue;
      }
      have_head = true;
      body = static_cast<long long>(head.size() - end - 4);
      tail = head.substr(end + 4);
      head.resize(end + 2);
      if (std::sscanf(head.c_str(), "HTTP/%*s %d", &rep.status) != 1) return rep;
      want = content_length(head);
      chunked = !want && is_chunked(head);
    } else {
      body += static_cast<long long>(len);
      if (chunked) tail.append(p, len);
    }

    if (want && body >= *want) {
      rep.complete = true;
      return rep;
    }
    if (chunked) {
      if (tail.size() > 16) tail.erase(0, tail.size() - 16);
      if (tail.size() >= 5 && tail.compare(tail.size() - 5, 5, "0\r\n\r\n") == 0) {
        rep.complete = true;
        return rep;
      }
    }
  }
}

} // namespace

HttpUrl parse_http_url(const std::string& url) {
  const std::string scheme = "http://";
  if (url.compare(0, scheme.size(), scheme) != 0) {
    auto sep = url.find("://");
    if (sep == std::string::npos)
      throw std::invalid_argument(fmt::format("parse {}: missing scheme", url));
    throw std::invalid_argument(
        fmt::format("parse {}: unsupported protocol scheme {}", url, url.substr(0, sep)));
  }
  std::string rest = url.substr(scheme.size());
  auto slash = rest.find_first_of("/?#");
  std::string authority = rest.substr(0, slash);
  std::string target = slash == std::string::npos ? "/" : rest.substr(slash);
  if (auto hash = target.find('#'); hash != std::string::npos) target.resize(hash);
  if (target.empty() || target.front() != '/') target.insert(target.begin(), '/');

  if (authority.find('@') != std::string::npos)
    throw std::invalid_argument(fmt::format("parse {}: userinfo is not supported", url));
  if (authority.empty()) throw std::invalid_argument(fmt::format("parse {}: missing host", url));

  HttpUrl u;
  u.target = target;
  if (authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos)
      throw std::invalid_argument(fmt::format("parse {}: missing ']' in host", url));
    u.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':')
        throw std::invalid_argument(fmt::format("parse {}: invalid port", url));
      u.port = authority.substr(close + 2);
    }
  } else {
    auto colon = authority.find(':');
    u.host = authority.substr(0, colon);
    if (colon != std::string::npos) u.port = authority.substr(colon + 1);
  }
  if (u.port.empty()) u.port = "80";
  if (u.host.empty() ||
      !std::all_of(u.port.begin(), u.port.end(), [](char c) { return c >= '0' && c <= '9'; }) ||
      u.port.size() > 5 || std::stoi(u.port) > 65535)
    throw std::invalid_argument(fmt::format("parse {}: invalid host or port", url));
  return u;
}

Probe dial_probe(std::string network, std::string address, std::chrono::milliseconds io_timeout) {
  return [network = std::move(network), address = std::move(address),
          io_timeout](const Context& ctx) -> Outcome {
    if (ctx.done()) return NotReady{};
    auto d = dial(network, address, ctx, io_timeout);
    if (d.fd) return Ready{};
    if (d.hard) return ProbeFailure{d.error};
    spdlog::debug("dial {} {}: {}", network, address, d.error);
    return NotReady{};
  };
}

Probe http_probe(std::string url, int status, std::chrono::milliseconds io_timeout) {
  return [url = std::move(url), status, io_timeout](const Context& ctx) -> Outcome {
    HttpUrl u;
    try {
      u = parse_http_url(url);
    } catch (const std::invalid_argument& e) {
      return ProbeFailure{e.what()};
    }
    if (ctx.done()) return NotReady{};

    auto deadline = steady::now() + ctx.remaining(io_timeout);
    auto d = dial_tcp(u.host, u.port, AF_UNSPEC, ctx, io_timeout);
    if (!d.fd) {
      spdlog::debug("GET {}: {}", url, d.error);
      return NotReady{};
    }

    bool v6 = u.host.find(':') != std::string::npos;
    std::string host = v6 ? "[" + u.host + "]" : u.host;
    if (u.port != "80") host += ":" + u.port;
    std::string req = fmt::format("GET {} HTTP/1.1\r\nHost: {}\r\nUser-Agent: svcman\r\n"
                                  "Accept: */*\r\nConnection: close\r\n\r\n",
                                  u.target, host);
    if (!send_all(d.fd.get(), req, ctx, deadline)) {
      spdlog::debug("GET {}: send failed", url);
      return NotReady{};
    }

    auto rep = read_reply(d.fd.get(), ctx, deadline);
    if (!rep.complete) {
      spdlog::debug("GET {}: incomplete response", url);
      return NotReady{};
    }
    if (rep.status != status) {
      spdlog::debug("GET {}: status {} (want {})", url, rep.status, status);
      return NotReady{};
    }
    return Ready{};
  };
}

Probe exec_probe(std::vector<std::string> argv) {
  return [argv = std::move(argv)](const Context& ctx) -> Outcome {
    if (argv.empty()) return ProbeFailure{"exec probe: empty command"};
    LaunchSpec spec;
    spec.executable = argv.front();
    spec.args.assign(argv.begin() + 1, argv.end());

    try {
      Process p = Process::spawn(spec);
      while (p.alive()) {
        if (!ctx.sleep_for(20ms)) return NotReady{}; // owning handle kills it
      }
      return p.exit_code().value_or(1) == 0 ? Outcome{Ready{}} : Outcome{NotReady{}};
    } catch (const std::system_error& e) {
      return ProbeFailure{e.what()};
    }
  };
}

} // namespace svcman
