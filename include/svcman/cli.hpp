#pragma once
#include <optional>
#include <string>
#include <variant>

namespace svcman {

struct Target {
  std::string value; // unit path or a name looked up under services/
};

struct CmdStart {
  Target target;
  std::optional<int> timeout_sec;
};
struct CmdStop {
  Target target;
};
struct CmdRestart {
  Target target;
  std::optional<int> timeout_sec;
};
struct CmdStatus {
  Target target;
  bool json = false;
};

struct CmdHelp {};
struct CmdVersion {};

using Command =
    std::variant<CmdStart, CmdStop, CmdRestart, CmdStatus, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace svcman
