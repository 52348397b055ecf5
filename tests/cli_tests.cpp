#include <catch2/catch_all.hpp>
#include <svcman/app.hpp>
#include <svcman/cli.hpp>
#include "test_support.hpp"

#include <filesystem>
#include <string>
#include <vector>

using namespace svcman;
using namespace svcman_test;
namespace fs = std::filesystem;

static ParseResult parse(std::vector<std::string> args) {
  args.insert(args.begin(), "svcman");
  std::vector<char*> argv;
  for (auto& a : args) argv.push_back(a.data());
  argv.push_back(nullptr);
  return parse_cli(static_cast<int>(args.size()), argv.data());
}

static int run(std::vector<std::string> args) {
  args.insert(args.begin(), "svcman");
  std::vector<char*> argv;
  for (auto& a : args) argv.push_back(a.data());
  argv.push_back(nullptr);
  return App{}.run(static_cast<int>(args.size()), argv.data());
}

TEST_CASE("no arguments and help print usage") {
  for (auto args : {std::vector<std::string>{}, std::vector<std::string>{"help"},
                    std::vector<std::string>{"--help"}}) {
    auto r = parse(args);
    REQUIRE(r.cmd);
    REQUIRE(std::holds_alternative<CmdHelp>(*r.cmd));
  }
  REQUIRE(std::holds_alternative<CmdVersion>(*parse({"version"}).cmd));
}

TEST_CASE("start takes a target and an optional timeout") {
  auto r = parse({"start", "web"});
  REQUIRE(r.cmd);
  auto& s = std::get<CmdStart>(*r.cmd);
  REQUIRE(s.target.value == "web");
  REQUIRE_FALSE(s.timeout_sec);

  r = parse({"restart", "services/web.service", "--timeout-sec", "15"});
  auto& rs = std::get<CmdRestart>(*r.cmd);
  REQUIRE(rs.target.value == "services/web.service");
  REQUIRE(rs.timeout_sec == 15);
}

TEST_CASE("status accepts --json") {
  auto r = parse({"status", "web", "--json"});
  REQUIRE(std::get<CmdStatus>(*r.cmd).json);
  REQUIRE_FALSE(std::get<CmdStatus>(*parse({"status", "web"}).cmd).json);
  REQUIRE(std::holds_alternative<CmdStop>(*parse({"stop", "web"}).cmd));
}

TEST_CASE("usage errors") {
  for (auto args : {std::vector<std::string>{"launch", "web"},
                    std::vector<std::string>{"start"},
                    std::vector<std::string>{"start", "--json"},
                    std::vector<std::string>{"start", "web", "--json"},
                    std::vector<std::string>{"stop", "web", "--timeout-sec", "3"},
                    std::vector<std::string>{"start", "web", "--timeout-sec"},
                    std::vector<std::string>{"start", "web", "--timeout-sec", "0"},
                    std::vector<std::string>{"start", "web", "--timeout-sec", "soon"}}) {
    auto r = parse(args);
    REQUIRE_FALSE(r.cmd);
    REQUIRE_FALSE(r.error.empty());
  }
}

TEST_CASE("app exit codes") {
  REQUIRE(run({"help"}) == 0);
  REQUIRE(run({"version"}) == 0);
  REQUIRE(run({"bogus"}) == 2);

  auto d = mkd("cli_app");
  REQUIRE(run({"status", (d / "missing.service").string()}) == 1);

  write_text(d / "nap.service",
             "[Service]\nExecStart=/bin/sleep 30\nPIDFile=nap.pid\nReadyTimeoutSec=5\n");
  auto unit = (d / "nap.service").string();
  REQUIRE(run({"start", unit}) == 0);
  REQUIRE(fs::exists(d / "nap.pid"));
  REQUIRE(run({"status", unit, "--json"}) == 0);
  REQUIRE(run({"restart", unit}) == 0);
  REQUIRE(fs::exists(d / "nap.pid"));
  REQUIRE(run({"stop", unit}) == 0);
  REQUIRE_FALSE(fs::exists(d / "nap.pid"));

  write_text(d / "crash.service",
             "[Service]\nExecStart=/bin/sh -c 'exit 1'\nPIDFile=crash.pid\nReadyExec=/bin/false\n");
  REQUIRE(run({"start", (d / "crash.service").string(), "--timeout-sec", "5"}) == 1);
}
