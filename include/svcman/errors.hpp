#pragma once
#include <svcman/context.hpp>

#include <stdexcept>
#include <string>
#include <sys/types.h>

namespace svcman {

// Misuse of the configuration API or a broken unit file. Not recoverable.
struct ConfigError : std::logic_error {
  using std::logic_error::logic_error;
};

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

class CancelledError : public Error {
public:
  explicit CancelledError(CancelReason r) : Error(to_string(r)), reason_(r) {}
  CancelReason reason() const { return reason_; }

private:
  CancelReason reason_;
};

struct ProbeError : Error {
  using Error::Error;
};

class ProcessExitedError : public Error {
public:
  explicit ProcessExitedError(pid_t pid)
    : Error("process " + std::to_string(pid) + " exited before checks were satisfied"),
      pid_(pid) {}
  pid_t pid() const { return pid_; }

private:
  pid_t pid_;
};

} // namespace svcman
