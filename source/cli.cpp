#include <cstdlib>
#include <svcman/cli.hpp>
#include <string_view>

namespace svcman {

static bool eq(std::string_view a, std::string_view b) { return a == b; }
static bool has_arg(int i, int argc) { return i + 1 < argc; }

static std::optional<int> parse_seconds(const char *s) {
  char *end = nullptr;
  long v = std::strtol(s, &end, 10);
  if (end == s || *end != '\0' || v <= 0 || v > 24 * 3600)
    return std::nullopt;
  return static_cast<int>(v);
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  if (argc < 2) {
    r.cmd = CmdHelp{};
    return r;
  }

  std::string cmd = argv[1];
  if (eq(cmd, "--help") || eq(cmd, "help")) {
    r.cmd = CmdHelp{};
    return r;
  }
  if (eq(cmd, "--version") || eq(cmd, "version")) {
    r.cmd = CmdVersion{};
    return r;
  }

  if (cmd != "start" && cmd != "stop" && cmd != "restart" && cmd != "status") {
    r.error = "unknown command: " + cmd;
    return r;
  }
  if (argc < 3 || std::string_view(argv[2]).rfind("--", 0) == 0) {
    r.error = cmd + ": target required";
    return r;
  }
  Target tgt{argv[2]};

  bool json = false;
  std::optional<int> timeout;
  for (int i = 3; i < argc; i++) {
    std::string_view a = argv[i];
    if (a == "--json" && cmd == "status") {
      json = true;
    } else if (a == "--timeout-sec" && has_arg(i, argc) &&
               (cmd == "start" || cmd == "restart")) {
      timeout = parse_seconds(argv[++i]);
      if (!timeout) {
        r.error = cmd + ": --timeout-sec expects a positive number of seconds";
        return r;
      }
    } else {
      r.error = cmd + ": unexpected argument " + std::string(a);
      return r;
    }
  }

  if (cmd == "start")
    r.cmd = CmdStart{tgt, timeout};
  else if (cmd == "restart")
    r.cmd = CmdRestart{tgt, timeout};
  else if (cmd == "stop")
    r.cmd = CmdStop{tgt};
  else
    r.cmd = CmdStatus{tgt, json};
  return r;
}

} // namespace svcman
