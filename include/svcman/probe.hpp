#pragma once
#include <svcman/context.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace svcman {

struct Ready {};
struct NotReady {};
struct ProbeFailure {
  std::string cause;
};

// NotReady is retried by the wait loop, ProbeFailure aborts it.
using Outcome = std::variant<Ready, NotReady, ProbeFailure>;

using Probe = std::function<Outcome(const Context&)>;

inline bool is_ready(const Outcome& o) { return std::holds_alternative<Ready>(o); }

constexpr std::chrono::milliseconds kProbeIoTimeout{1000};

// network is one of tcp, tcp4, tcp6, unix; address is host:port or a socket path
Probe dial_probe(std::string network, std::string address,
                 std::chrono::milliseconds io_timeout = kProbeIoTimeout);

// GET `url` (http:// only) and expect exactly `status`
Probe http_probe(std::string url, int status,
                 std::chrono::milliseconds io_timeout = kProbeIoTimeout);

// exit status 0 means ready
Probe exec_probe(std::vector<std::string> argv);

struct HttpUrl {
  std::string host;
  std::string port;
  std::string target;
};

// parses http://host[:port][/path]; throws std::invalid_argument
HttpUrl parse_http_url(const std::string& url);

} // namespace svcman
