#include <svcman/app.hpp>
#include <svcman/cli.hpp>
#include <svcman/errors.hpp>
#include <svcman/service.hpp>
#include <svcman/status.hpp>
#include <svcman/unit.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>
#include <variant>

#ifndef SVCMAN_VERSION
#define SVCMAN_VERSION "unknown"
#endif
#ifndef SVCMAN_COMMIT
#define SVCMAN_COMMIT "unknown"
#endif
#ifndef SVCMAN_BUILD_TIME
#define SVCMAN_BUILD_TIME "unknown"
#endif

namespace fs = std::filesystem;

namespace svcman {

static void print_help() {
  std::cout <<
      R"(svcman - start, stop and inspect local services

Usage:
  svcman start   <name|unit_path> [--timeout-sec N]
  svcman stop    <name|unit_path>
  svcman restart <name|unit_path> [--timeout-sec N]
  svcman status  <name|unit_path> [--json]
  svcman help | version

A bare name is looked up as services/<name>.service or services/<name>.unit.
)";
}

static fs::path resolve_target_to_unit(const std::string &target) {
  fs::path t(target);
  if (t.is_absolute() || t.string().find('/') != std::string::npos ||
      t.extension() == ".unit" || t.extension() == ".service") {
    return t;
  }
  fs::path cand1 = fs::path("services") / (target + ".service");
  fs::path cand2 = fs::path("services") / (target + ".unit");
  if (fs::exists(cand1))
    return cand1;
  if (fs::exists(cand2))
    return cand2;
  return cand2;
}

static Context ready_context(const ServiceConfig &cfg, std::optional<int> timeout_sec) {
  auto limit = timeout_sec ? std::chrono::milliseconds(*timeout_sec * 1000)
                           : cfg.ready_timeout();
  return Context::background().with_timeout(limit);
}

static int do_start(Service &svc, std::optional<int> timeout_sec) {
  svc.start(ready_context(svc.config(), timeout_sec));
  print(svc.status(Context::background()));
  return 0;
}

static int dispatch(const Command &command) {
  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help();
          return 0;

        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          std::cout << fmt::format("svcman {} ({}, built {})\n", SVCMAN_VERSION,
                                   SVCMAN_COMMIT, SVCMAN_BUILD_TIME);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdStart>) {
          Service svc(load_unit(resolve_target_to_unit(c.target.value)));
          return do_start(svc, c.timeout_sec);

        } else if constexpr (std::is_same_v<T, CmdStop>) {
          Service svc(load_unit(resolve_target_to_unit(c.target.value)));
          svc.stop(Context::background());
          return 0;

        } else if constexpr (std::is_same_v<T, CmdRestart>) {
          Service svc(load_unit(resolve_target_to_unit(c.target.value)));
          svc.stop(Context::background());
          return do_start(svc, c.timeout_sec);

        } else {
          Service svc(load_unit(resolve_target_to_unit(c.target.value)));
          auto st = svc.status(Context::background().with_timeout(svc.config().ready_timeout()));
          std::cout << (c.json ? to_json(st) : describe(st)) << "\n";
          return 0;
        }
      },
      command);
}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  try {
    return dispatch(*pr.cmd);
  } catch (const ConfigError &e) {
    spdlog::error("configuration: {}", e.what());
  } catch (const ProcessExitedError &e) {
    spdlog::error("{}", e.what());
  } catch (const CancelledError &e) {
    spdlog::error("gave up waiting for readiness: {}", e.what());
  } catch (const ProbeError &e) {
    spdlog::error("{}", e.what());
  } catch (const std::system_error &e) {
    spdlog::error("{}", e.what());
  }
  return 1;
}

} // namespace svcman
