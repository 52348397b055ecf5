#include <svcman/status.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <cstdio>
#include <ctime>

namespace svcman {

std::string describe(const StatusSnapshot& s) {
  if (s.pid == 0) return fmt::format("{} is not running", s.name);
  if (!s.running) return fmt::format("{} had pid {} and is not running", s.name, s.pid);
  return fmt::format("{} has pid {} and is {}", s.name, s.pid,
                     s.ready ? "ready" : "running but not ready");
}

static std::string json_quote(const std::string& v) {
  std::string out = "\"";
  for (unsigned char c : v) {
    switch (c) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (c < 0x20) out += fmt::format("\\u{:04x}", c);
      else out.push_back(static_cast<char>(c));
    }
  }
  out += '"';
  return out;
}

static std::string rfc3339(std::chrono::system_clock::time_point t) {
  std::time_t tt = std::chrono::system_clock::to_time_t(t);
  std::tm tm{};
  ::gmtime_r(&tt, &tm);
  return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", tm);
}

std::string to_json(const StatusSnapshot& s) {
  return fmt::format(R"({{"name":{},"pid":{},"started":{},"running":{},"ready":{}}})",
                     json_quote(s.name), s.pid,
                     s.pid == 0 ? std::string("null") : json_quote(rfc3339(s.started)),
                     s.running ? "true" : "false", s.ready ? "true" : "false");
}

void print(const StatusSnapshot& s) { fmt::print(stderr, "{}\n", describe(s)); }

} // namespace svcman
