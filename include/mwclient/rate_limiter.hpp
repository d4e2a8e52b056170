#pragma once

#include <algorithm>
#include <chrono>
#include <mutex>

#include "context.hpp"

namespace mwclient {

/// Token bucket with a burst of one: callers are spaced at least
/// `60s / calls_per_minute` apart.
class token_bucket {
public:
  static constexpr int kDefaultCallsPerMinute = 300;

  explicit token_bucket(int calls_per_minute = kDefaultCallsPerMinute)
      : calls_per_minute_(calls_per_minute > 0 ? calls_per_minute
                                               : kDefaultCallsPerMinute),
        interval_(std::chrono::duration_cast<context::clock::duration>(
                      std::chrono::minutes(1)) /
                  calls_per_minute_) {}

  token_bucket(const token_bucket &) = delete;
  token_bucket &operator=(const token_bucket &) = delete;

  /// Blocks until a token is available. Throws cancelled_error when `ctx`
  /// ends first; the reserved slot is handed back if nobody queued behind.
  void wait(const context &ctx) {
    ctx.check();
    context::clock::time_point slot;
    {
      std::lock_guard<std::mutex> lock(mu_);
      slot = std::max(context::clock::now(), next_);
      next_ = slot + interval_;
    }

    auto delay = slot - context::clock::now();
    if (delay <= context::clock::duration::zero())
      return;
    try {
      ctx.sleep_for(delay);
    } catch (const cancelled_error &) {
      std::lock_guard<std::mutex> lock(mu_);
      if (next_ == slot + interval_)
        next_ = slot;
      throw;
    }
  }

  /// Takes a token only if one is free right now.
  bool try_acquire() {
    std::lock_guard<std::mutex> lock(mu_);
    auto now = context::clock::now();
    if (next_ > now)
      return false;
    next_ = now + interval_;
    return true;
  }

  int calls_per_minute() const { return calls_per_minute_; }
  context::clock::duration interval() const { return interval_; }

private:
  const int calls_per_minute_;
  const context::clock::duration interval_;
  std::mutex mu_;
  context::clock::time_point next_{};
};

} // namespace mwclient
