#include <svcman/context.hpp>

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace svcman {

struct Context::State {
  std::mutex mu;
  std::condition_variable cv;
  std::optional<CancelReason> reason;
  std::optional<clock::time_point> deadline;
  std::vector<std::weak_ptr<State>> children;
};

const char* to_string(CancelReason r) {
  switch (r) {
  case CancelReason::Canceled: return "context canceled";
  case CancelReason::DeadlineExceeded: return "context deadline exceeded";
  }
  return "context ended";
}

void Context::cancel_state(const std::shared_ptr<State>& st, CancelReason why) {
  std::vector<std::weak_ptr<State>> kids;
  {
    std::lock_guard<std::mutex> lk(st->mu);
    if (st->reason) return;
    st->reason = why;
    kids.swap(st->children);
  }
  st->cv.notify_all();
  for (auto& w : kids)
    if (auto k = w.lock()) cancel_state(k, why);
}

// caller holds st.mu
std::optional<CancelReason> Context::poll_locked(State& st) {
  if (!st.reason && st.deadline && clock::now() >= *st.deadline)
    st.reason = CancelReason::DeadlineExceeded;
  return st.reason;
}

Context::Context(std::shared_ptr<State> st) : st_(std::move(st)) {}

Context Context::background() { return Context(std::make_shared<State>()); }

Context Context::derive(std::optional<clock::time_point> deadline) const {
  auto child = std::make_shared<State>();
  std::optional<CancelReason> inherited;
  {
    std::lock_guard<std::mutex> lk(st_->mu);
    inherited = poll_locked(*st_);
    child->deadline = st_->deadline;
    if (!inherited) {
      // drop expired children so long-lived parents don't accumulate them
      auto& v = st_->children;
      v.erase(std::remove_if(v.begin(), v.end(),
                             [](const std::weak_ptr<State>& w) { return w.expired(); }),
              v.end());
      v.push_back(child);
    }
  }
  if (deadline && (!child->deadline || *deadline < *child->deadline))
    child->deadline = deadline;
  if (inherited) child->reason = inherited;
  return Context(child);
}

Context Context::with_cancel() const { return derive(std::nullopt); }

Context Context::with_deadline(clock::time_point deadline) const { return derive(deadline); }

Context Context::with_timeout(std::chrono::milliseconds timeout) const {
  return derive(clock::now() + timeout);
}

void Context::cancel() const { cancel_state(st_, CancelReason::Canceled); }

std::optional<CancelReason> Context::err() const {
  std::lock_guard<std::mutex> lk(st_->mu);
  return poll_locked(*st_);
}

std::optional<Context::clock::time_point> Context::deadline() const {
  std::lock_guard<std::mutex> lk(st_->mu);
  return st_->deadline;
}

std::chrono::milliseconds Context::remaining(std::chrono::milliseconds cap) const {
  auto dl = deadline();
  if (!dl) return cap;
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*dl - clock::now());
  if (left.count() < 0) return std::chrono::milliseconds(0);
  return std::min(left, cap);
}

bool Context::sleep_for(std::chrono::milliseconds d) const {
  std::unique_lock<std::mutex> lk(st_->mu);
  auto until = clock::now() + d;
  if (st_->deadline && *st_->deadline < until) until = *st_->deadline;
  st_->cv.wait_until(lk, until, [&] { return st_->reason.has_value(); });
  return !poll_locked(*st_).has_value();
}

} // namespace svcman
