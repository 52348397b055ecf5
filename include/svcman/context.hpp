#pragma once
#include <chrono>
#include <memory>
#include <optional>

namespace svcman {

enum class CancelReason { Canceled, DeadlineExceeded };

const char* to_string(CancelReason r);

// Cooperative cancellation handle. Copies share state; derived contexts are
// cancelled together with their parent.
class Context {
public:
  using clock = std::chrono::steady_clock;

  static Context background();

  Context with_cancel() const;
  Context with_deadline(clock::time_point deadline) const;
  Context with_timeout(std::chrono::milliseconds timeout) const;

  void cancel() const;
  std::optional<CancelReason> err() const;
  bool done() const { return err().has_value(); }

  std::optional<clock::time_point> deadline() const;
  std::chrono::milliseconds remaining(std::chrono::milliseconds cap) const;

  // false when the context ended before the full duration elapsed
  bool sleep_for(std::chrono::milliseconds d) const;

private:
  struct State;
  explicit Context(std::shared_ptr<State> st);
  Context derive(std::optional<clock::time_point> deadline) const;
  static void cancel_state(const std::shared_ptr<State>& st, CancelReason why);
  static std::optional<CancelReason> poll_locked(State& st);

  std::shared_ptr<State> st_;
};

} // namespace svcman
