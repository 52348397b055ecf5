#include <catch2/catch_all.hpp>
#include <svcman/liveness.hpp>

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <memory>
#include <thread>

using namespace svcman;
using namespace std::chrono_literals;

namespace {
using sys_clock = std::chrono::system_clock;

LivenessResolver::UptimeFn fixed_uptime(std::chrono::seconds s,
                                        std::shared_ptr<std::atomic<int>> calls = nullptr) {
  return [s, calls]() -> std::optional<std::chrono::seconds> {
    if (calls) ++*calls;
    return s;
  };
}

LivenessResolver::SignalFn answering(int err, std::shared_ptr<std::atomic<int>> calls = nullptr) {
  return [err, calls](pid_t, int) {
    if (calls) ++*calls;
    return err;
  };
}
} // namespace

TEST_CASE("pids below 2 never resolve") {
  auto signals = std::make_shared<std::atomic<int>>(0);
  LivenessResolver r(fixed_uptime(24h), answering(0, signals));

  REQUIRE_FALSE(r.resolve(0, sys_clock::now()));
  REQUIRE_FALSE(r.resolve(1, sys_clock::now()));
  REQUIRE_FALSE(r.resolve(-7, sys_clock::now()));
  REQUIRE(signals->load() == 0);
}

TEST_CASE("record older than the uptime predates the boot") {
  auto signals = std::make_shared<std::atomic<int>>(0);
  LivenessResolver r(fixed_uptime(60s), answering(0, signals));

  REQUIRE_FALSE(r.resolve(::getpid(), sys_clock::now() - 1h));
  REQUIRE(signals->load() == 0);

  auto ps = r.resolve(::getpid(), sys_clock::now() - 10s);
  REQUIRE(ps);
  REQUIRE(ps->pid() == ::getpid());
  REQUIRE_FALSE(ps->owning());
}

TEST_CASE("signal errors mean not running") {
  SECTION("no such process") {
    LivenessResolver r(fixed_uptime(24h), answering(ESRCH));
    REQUIRE_FALSE(r.resolve(4242, sys_clock::now()));
  }
  SECTION("not permitted") {
    LivenessResolver r(fixed_uptime(24h), answering(EPERM));
    REQUIRE_FALSE(r.resolve(4242, sys_clock::now()));
  }
}

TEST_CASE("uptime is queried once per resolver") {
  auto calls = std::make_shared<std::atomic<int>>(0);
  auto before = sys_clock::now();
  LivenessResolver r(fixed_uptime(24h, calls), answering(0));

  for (int i = 0; i < 5; ++i) r.resolve(4242, sys_clock::now());
  auto boot = r.boot_time();
  REQUIRE(boot);
  REQUIRE(*boot >= before - 24h);
  REQUIRE(*boot <= sys_clock::now() - 24h);
  REQUIRE(calls->load() == 1);
}

TEST_CASE("records written after the first uptime query keep resolving") {
  LivenessResolver r(fixed_uptime(1s), answering(0));
  REQUIRE(r.boot_time());

  auto recorded = sys_clock::now();
  std::this_thread::sleep_for(1500ms);
  // older than the uptime seen at the first query, but still after the boot
  REQUIRE(r.resolve(4242, recorded));
}

TEST_CASE("unknown uptime skips the boot comparison") {
  LivenessResolver r([] { return std::optional<std::chrono::seconds>(); }, answering(0));
  REQUIRE(r.resolve(4242, sys_clock::now() - 24h * 365));
}

TEST_CASE("system resolver sees live and reaped processes") {
  auto& r = LivenessResolver::system();
  REQUIRE(r.boot_time());
  REQUIRE(r.resolve(::getpid(), sys_clock::now()));

  pid_t gone;
  {
    Process p = Process::spawn(LaunchSpec{"/bin/true", {}, {}, {}});
    gone = p.pid();
    p.wait();
  }
  REQUIRE_FALSE(r.resolve(gone, sys_clock::now()));
}

TEST_CASE("exited child that nobody reaped does not resolve") {
  pid_t pid;
  {
    Process p = Process::spawn(LaunchSpec{"/bin/sh", {"-c", "exit 3"}, {}, {}});
    pid = p.pid();
    p.release();
  }
  std::this_thread::sleep_for(300ms);
  // the zombie still answers signal 0
  REQUIRE(::kill(pid, 0) == 0);

  REQUIRE_FALSE(LivenessResolver::system().resolve(pid, sys_clock::now()));
  REQUIRE(::kill(pid, 0) != 0);
}
