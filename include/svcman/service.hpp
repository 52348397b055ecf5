#pragma once
#include <svcman/context.hpp>
#include <svcman/identity.hpp>
#include <svcman/liveness.hpp>
#include <svcman/probe.hpp>
#include <svcman/process.hpp>
#include <svcman/status.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace svcman {

// Describes one managed service. Built with the chained setters, then handed
// to a Service which keeps it unchanged.
class ServiceConfig {
public:
  explicit ServiceConfig(std::string name);

  // the command to launch; configuring a second one throws ConfigError
  ServiceConfig& run(std::string executable, std::vector<std::string> args = {});
  // working directory, created when missing
  ServiceConfig& dir(std::filesystem::path dir);
  // KEY=VALUE entries added to the inherited environment
  ServiceConfig& env(std::vector<std::string> entries);
  // defaults to <dir>/<name>.pid, or <name>.pid when no dir is set
  ServiceConfig& pid_file(std::filesystem::path path);

  ServiceConfig& check(Probe probe);
  ServiceConfig& dial_check(std::string network, std::string address);
  ServiceConfig& http_check(std::string url, int status);
  ServiceConfig& exec_check(std::vector<std::string> argv);

  ServiceConfig& poll_interval(std::chrono::milliseconds d);
  ServiceConfig& stop_timeout(std::chrono::milliseconds d);
  ServiceConfig& ready_timeout(std::chrono::milliseconds d);

  const std::string& name() const { return name_; }
  bool has_launch() const { return has_run_; }
  const LaunchSpec& launch() const { return launch_; }
  std::filesystem::path pid_file() const;
  const std::vector<Probe>& probes() const { return probes_; }
  std::chrono::milliseconds poll_interval() const { return poll_interval_; }
  std::chrono::milliseconds stop_timeout() const { return stop_timeout_; }
  std::chrono::milliseconds ready_timeout() const { return ready_timeout_; }

private:
  std::string name_;
  bool has_run_ = false;
  LaunchSpec launch_;
  std::filesystem::path pid_file_;
  std::vector<Probe> probes_;
  std::chrono::milliseconds poll_interval_{100};
  std::chrono::milliseconds stop_timeout_{5000};
  std::chrono::milliseconds ready_timeout_{30000};
};

// Starts, stops and inspects one service through its pid file.
class Service {
public:
  explicit Service(ServiceConfig cfg, LivenessResolver& resolver = LivenessResolver::system());

  // Launches the command unless the recorded process is alive, then waits for
  // every check to pass. On failure the launched process is killed and the
  // pid file removed. Throws CancelledError, ProbeError, ProcessExitedError,
  // ConfigError or std::system_error.
  void start(const Context& ctx);

  // SIGTERM, wait up to stop_timeout, then SIGKILL. Stopping a service that is
  // not running succeeds. Throws std::system_error when SIGTERM fails.
  void stop(const Context& ctx);

  // Reads state and runs each check once. Never touches the pid file.
  StatusSnapshot status(const Context& ctx) const;

  const ServiceConfig& config() const { return cfg_; }
  const IdentityStore& identity() const { return store_; }

private:
  std::optional<Process> current() const;
  void wait_ready(const Context& ctx, Process& ps) const;

  const ServiceConfig cfg_;
  IdentityStore store_;
  LivenessResolver* resolver_;
};

} // namespace svcman
