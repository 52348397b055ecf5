#include <catch2/catch_all.hpp>
#include <svcman/process.hpp>
#include "test_support.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <system_error>

using namespace svcman;
using namespace svcman_test;
using namespace std::chrono_literals;

static bool pid_exists(pid_t pid) { return ::kill(pid, 0) == 0; }

TEST_CASE("spawned process can be killed and reaped") {
  Process p = Process::spawn(LaunchSpec{"/bin/sleep", {"30"}, {}, {}});
  REQUIRE(p.pid() > 1);
  REQUIRE(p.owning());
  REQUIRE(p.alive());

  p.kill();
  REQUIRE_FALSE(p.alive());
  REQUIRE(p.exit_code() == 128 + SIGKILL);
  REQUIRE_FALSE(pid_exists(p.pid()));
}

TEST_CASE("exit status is reported") {
  Process p = Process::spawn(LaunchSpec{"/bin/sh", {"-c", "exit 7"}, {}, {}});
  REQUIRE(p.wait() == 7);
  REQUIRE_FALSE(p.alive());
}

TEST_CASE("exec failure surfaces as system_error") {
  try {
    Process::spawn(LaunchSpec{"/nonexistent/svcman-binary", {}, {}, {}});
    FAIL("spawn should have thrown");
  } catch (const std::system_error& e) {
    REQUIRE(e.code().value() == ENOENT);
  }
}

TEST_CASE("owning handle kills its process on destruction") {
  pid_t pid;
  {
    Process p = Process::spawn(LaunchSpec{"/bin/sleep", {"30"}, {}, {}});
    pid = p.pid();
  }
  REQUIRE_FALSE(pid_exists(pid));
}

TEST_CASE("released process outlives its handle") {
  pid_t pid;
  {
    Process p = Process::spawn(LaunchSpec{"/bin/sleep", {"30"}, {}, {}});
    pid = p.pid();
    p.release();
    REQUIRE_FALSE(p.owning());
  }
  REQUIRE(pid_exists(pid));

  auto again = Process::attach(pid);
  again.kill();
  REQUIRE(again.exit_code() == 128 + SIGKILL);
}

TEST_CASE("moving transfers ownership") {
  Process a = Process::spawn(LaunchSpec{"/bin/sleep", {"30"}, {}, {}});
  pid_t pid = a.pid();
  Process b = std::move(a);
  REQUIRE(b.pid() == pid);
  REQUIRE(b.owning());
  REQUIRE_FALSE(a.owning());
  REQUIRE(b.alive());
}

TEST_CASE("wait_for times out on a running process") {
  Process p = Process::spawn(LaunchSpec{"/bin/sleep", {"30"}, {}, {}});
  auto t0 = std::chrono::steady_clock::now();
  REQUIRE_FALSE(p.wait_for(150ms));
  REQUIRE(std::chrono::steady_clock::now() - t0 >= 150ms);

  p.signal(SIGTERM);
  REQUIRE(p.wait_for(5s));
  REQUIRE(p.exit_code() == 128 + SIGTERM);
}

TEST_CASE("environment and working directory are applied") {
  auto dir = mkd("proc_env");
  auto work = dir / "a" / "b";
  LaunchSpec spec{"/bin/sh", {"-c", "printf '%s' \"$SVCMAN_GREETING\" > out.txt"},
                  {"SVCMAN_GREETING=hi there"}, work};

  Process p = Process::spawn(spec);
  REQUIRE(p.wait() == 0);
  REQUIRE(read_text(work / "out.txt") == "hi there");
}

TEST_CASE("later environment entries override inherited ones") {
  auto dir = mkd("proc_env_override");
  ::setenv("SVCMAN_OVERRIDE", "old", 1);
  LaunchSpec spec{"/bin/sh", {"-c", "printf '%s' \"$SVCMAN_OVERRIDE\" > out.txt"},
                  {"SVCMAN_OVERRIDE=new"}, dir};

  Process p = Process::spawn(spec);
  REQUIRE(p.wait() == 0);
  REQUIRE(read_text(dir / "out.txt") == "new");
  ::unsetenv("SVCMAN_OVERRIDE");
}

TEST_CASE("waiting on a foreign process returns nothing") {
  auto parent = Process::attach(::getppid());
  REQUIRE_FALSE(parent.wait());
  REQUIRE_FALSE(parent.owning());
}
