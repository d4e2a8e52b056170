#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace mwclient {

/// Thrown when a context is cancelled or its deadline passes.
class cancelled_error : public std::runtime_error {
public:
  explicit cancelled_error(bool deadline_exceeded)
      : std::runtime_error(deadline_exceeded ? "context deadline exceeded"
                                             : "context canceled"),
        deadline_exceeded_(deadline_exceeded) {}

  bool deadline_exceeded() const { return deadline_exceeded_; }

private:
  bool deadline_exceeded_;
};

/// Cancellation signal and optional deadline shared by a call tree.
///
/// Copies share state. Children created with with_cancel()/with_timeout()
/// are cancelled together with their parent, never the other way round.
class context {
public:
  using clock = std::chrono::steady_clock;

  context() : state_(std::make_shared<state>()) {}

  static context background() { return context(); }

  context with_cancel() const { return with_deadline(clock::time_point::max()); }

  context with_timeout(clock::duration timeout) const {
    return with_deadline(clock::now() + timeout);
  }

  context with_deadline(clock::time_point deadline) const {
    context child;
    child.state_->deadline = std::min(deadline, state_->deadline);
    std::lock_guard<std::mutex> lock(state_->mu);
    if (state_->cancelled) {
      child.state_->cancelled = true;
    } else {
      prune_children();
      state_->children.push_back(child.state_);
    }
    return child;
  }

  void cancel() const { cancel_state(state_); }

  bool cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mu);
    return state_->cancelled;
  }

  bool deadline_passed() const { return clock::now() >= state_->deadline; }

  bool done() const { return cancelled() || deadline_passed(); }

  clock::time_point deadline() const { return state_->deadline; }

  bool has_deadline() const {
    return state_->deadline != clock::time_point::max();
  }

  /// Throws cancelled_error when the context is done.
  void check() const {
    if (cancelled())
      throw cancelled_error(false);
    if (deadline_passed())
      throw cancelled_error(true);
  }

  /// Sleeps for `duration`, waking immediately on cancellation.
  void sleep_for(clock::duration duration) const {
    auto until = clock::now() + duration;
    std::unique_lock<std::mutex> lock(state_->mu);
    state_->cv.wait_until(lock, std::min(until, state_->deadline),
                          [this]() { return state_->cancelled; });
    lock.unlock();
    check();
  }

  /// Waits on a foreign condition variable until `pred` holds or `until`
  /// passes. Returns false on timeout, throws cancelled_error when done.
  /// Cancellation is observed within one polling slice.
  template <typename Pred>
  bool wait(std::condition_variable &cv, std::unique_lock<std::mutex> &lock,
            Pred pred,
            clock::time_point until = clock::time_point::max()) const {
    while (!pred()) {
      if (done()) {
        lock.unlock();
        check();
        lock.lock();
      }
      auto now = clock::now();
      if (now >= until)
        return false;
      auto slice =
          std::min({until, state_->deadline, now + kPollSlice});
      cv.wait_until(lock, slice);
    }
    return true;
  }

private:
  static constexpr std::chrono::milliseconds kPollSlice{20};

  struct state {
    std::mutex mu;
    std::condition_variable cv;
    bool cancelled = false;
    clock::time_point deadline = clock::time_point::max();
    std::vector<std::weak_ptr<state>> children;
  };

  static void cancel_state(const std::shared_ptr<state> &s) {
    std::vector<std::weak_ptr<state>> children;
    {
      std::lock_guard<std::mutex> lock(s->mu);
      if (s->cancelled)
        return;
      s->cancelled = true;
      children.swap(s->children);
    }
    s->cv.notify_all();
    for (auto &weak : children) {
      if (auto child = weak.lock())
        cancel_state(child);
    }
  }

  // Caller holds state_->mu.
  void prune_children() const {
    auto &c = state_->children;
    c.erase(std::remove_if(c.begin(), c.end(),
                           [](const std::weak_ptr<state> &w) {
                             return w.expired();
                           }),
            c.end());
  }

  std::shared_ptr<state> state_;
};

} // namespace mwclient
