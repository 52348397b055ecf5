#include <svcman/errors.hpp>
#include <svcman/service.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <signal.h>

#include <system_error>
#include <variant>

using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace svcman {

// ------------------------ ServiceConfig ------------------------

ServiceConfig::ServiceConfig(std::string name) : name_(std::move(name)) {}

ServiceConfig& ServiceConfig::run(std::string executable, std::vector<std::string> args) {
  if (has_run_) throw ConfigError("services expect exactly one run option");
  has_run_ = true;
  launch_.executable = std::move(executable);
  launch_.args = std::move(args);
  return *this;
}

ServiceConfig& ServiceConfig::dir(fs::path dir) {
  launch_.dir = std::move(dir);
  return *this;
}

ServiceConfig& ServiceConfig::env(std::vector<std::string> entries) {
  for (auto& e : entries) launch_.env.push_back(std::move(e));
  return *this;
}

ServiceConfig& ServiceConfig::pid_file(fs::path path) {
  pid_file_ = std::move(path);
  return *this;
}

ServiceConfig& ServiceConfig::check(Probe probe) {
  probes_.push_back(std::move(probe));
  return *this;
}

ServiceConfig& ServiceConfig::dial_check(std::string network, std::string address) {
  return check(dial_probe(std::move(network), std::move(address)));
}

ServiceConfig& ServiceConfig::http_check(std::string url, int status) {
  return check(http_probe(std::move(url), status));
}

ServiceConfig& ServiceConfig::exec_check(std::vector<std::string> argv) {
  return check(exec_probe(std::move(argv)));
}

ServiceConfig& ServiceConfig::poll_interval(std::chrono::milliseconds d) {
  poll_interval_ = d;
  return *this;
}

ServiceConfig& ServiceConfig::stop_timeout(std::chrono::milliseconds d) {
  stop_timeout_ = d;
  return *this;
}

ServiceConfig& ServiceConfig::ready_timeout(std::chrono::milliseconds d) {
  ready_timeout_ = d;
  return *this;
}

fs::path ServiceConfig::pid_file() const {
  if (!pid_file_.empty()) return pid_file_;
  if (!launch_.dir.empty()) return launch_.dir / (name_ + ".pid");
  return fs::path(name_ + ".pid");
}

// ------------------------ Service ------------------------

Service::Service(ServiceConfig cfg, LivenessResolver& resolver)
  : cfg_(std::move(cfg)), store_(cfg_.pid_file()), resolver_(&resolver) {}

std::optional<Process> Service::current() const {
  auto id = store_.read();
  return resolver_->resolve(id.pid, id.recorded_at);
}

static void kill_quietly(const std::string& name, Process& p) {
  try {
    p.kill();
  } catch (const std::system_error& e) {
    spdlog::warn("[svc={}] rollback kill pid={} failed: {}", name, p.pid(), e.what());
  }
}

void Service::wait_ready(const Context& ctx, Process& ps) const {
  const auto& probes = cfg_.probes();
  std::vector<bool> ready(probes.size(), false);
  size_t unready = probes.size();

  for (int round = 1;; ++round) {
    if (auto why = ctx.err()) throw CancelledError(*why);

    for (size_t i = 0; i < probes.size(); ++i) {
      if (ready[i]) continue;
      Outcome o = probes[i](ctx);
      if (auto* f = std::get_if<ProbeFailure>(&o))
        throw ProbeError(fmt::format("readiness check {} of {}: {}", i + 1, probes.size(), f->cause));
      if (is_ready(o)) {
        ready[i] = true;
        --unready;
      }
    }
    // checked even when nothing is pending: a dead process is never ready
    if (!ps.alive()) throw ProcessExitedError(ps.pid());
    if (unready == 0) return;

    spdlog::debug("[svc={}] round {}: {}/{} checks pending", cfg_.name(), round, unready,
                  probes.size());
    if (!ctx.sleep_for(cfg_.poll_interval()))
      throw CancelledError(ctx.err().value_or(CancelReason::Canceled));
  }
}

void Service::start(const Context& ctx) {
  const auto& name = cfg_.name();

  if (auto ps = current()) {
    spdlog::info("[svc={}] already running pid={}", name, ps->pid());
    wait_ready(ctx, *ps);
    return;
  }
  if (!cfg_.has_launch()) throw ConfigError(fmt::format("service {} has no command", name));

  Process child = Process::spawn(cfg_.launch());
  spdlog::info("[svc={}] launched pid={}", name, child.pid());

  try {
    store_.write(child.pid());
  } catch (const std::system_error& e) {
    spdlog::error("[svc={}] cannot record pid in {}: {}", name, store_.path().string(), e.what());
    kill_quietly(name, child);
    throw;
  }

  // from here on the process must survive this handle
  child.release();

  auto rollback = [&](const char* why) {
    spdlog::error("[svc={}] not ready: {}; killing pid={}", name, why, child.pid());
    kill_quietly(name, child);
    store_.remove();
  };
  try {
    wait_ready(ctx, child);
  } catch (const std::exception& e) {
    rollback(e.what());
    throw;
  } catch (...) {
    rollback("unknown error");
    throw;
  }
  spdlog::info("[svc={}] ready pid={}", name, child.pid());
}

namespace {
struct RemoveRecord {
  const IdentityStore& store;
  ~RemoveRecord() { store.remove(); }
};
} // namespace

void Service::stop(const Context& ctx) {
  const auto& name = cfg_.name();
  auto ps = current();
  if (!ps) {
    store_.remove();
    spdlog::info("[svc={}] not running", name);
    return;
  }

  spdlog::info("[svc={}] stopping pid={} (SIGTERM, timeout={}ms)", name, ps->pid(),
               cfg_.stop_timeout().count());
  ps->signal(SIGTERM);
  RemoveRecord cleanup{store_};

  // a process we did not start cannot be reaped; wait_for falls back to polling
  if (ps->wait_for(ctx.remaining(cfg_.stop_timeout()))) {
    if (auto code = ps->exit_code())
      spdlog::info("[svc={}] stopped exit={}", name, *code);
    else
      spdlog::info("[svc={}] stopped", name);
    return;
  }

  spdlog::warn("[svc={}] force kill pid={}", name, ps->pid());
  try {
    ps->signal(SIGKILL);
  } catch (const std::system_error& e) {
    spdlog::warn("[svc={}] SIGKILL pid={}: {}", name, ps->pid(), e.what());
    return;
  }
  if (!ps->wait_for(1s)) spdlog::warn("[svc={}] pid={} still alive after SIGKILL", name, ps->pid());
}

StatusSnapshot Service::status(const Context& ctx) const {
  StatusSnapshot s;
  s.name = cfg_.name();

  auto id = store_.read();
  if (!id.known()) return s;
  s.pid = id.pid;
  s.started = id.recorded_at;

  s.running = resolver_->resolve(id.pid, id.recorded_at).has_value();
  if (!s.running) return s;

  s.ready = true;
  for (const auto& probe : cfg_.probes()) {
    if (ctx.done() || !is_ready(probe(ctx))) {
      s.ready = false;
      break;
    }
  }
  return s;
}

} // namespace svcman
