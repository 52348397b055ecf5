#pragma once
#include <chrono>
#include <string>
#include <sys/types.h>

namespace svcman {

// Point-in-time view of a service. ready implies running implies pid != 0.
struct StatusSnapshot {
  std::string name;
  pid_t pid{0};
  std::chrono::system_clock::time_point started{}; // pid file mtime
  bool running{false};
  bool ready{false};
};

// "<name> has pid <pid> and is ready" and friends
std::string describe(const StatusSnapshot& s);

// {"name":..,"pid":..,"started":..,"running":..,"ready":..}
std::string to_json(const StatusSnapshot& s);

// describe() to stderr
void print(const StatusSnapshot& s);

} // namespace svcman
