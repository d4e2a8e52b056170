#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

#include "context.hpp"

namespace mwclient {

/// Bounded multi-producer queue. A full mailbox blocks the producer;
/// try_push() is the only non-blocking way in.
template <typename T> class mailbox {
public:
  using clock = context::clock;

  explicit mailbox(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0)
      throw std::invalid_argument("mailbox capacity must be positive");
  }

  mailbox(const mailbox &) = delete;
  mailbox &operator=(const mailbox &) = delete;

  /// Returns false when the mailbox is closed.
  bool push(T value) {
    std::unique_lock<std::mutex> lock(mu_);
    not_full_.wait(lock,
                   [this]() { return closed_ || items_.size() < capacity_; });
    if (closed_)
      return false;
    items_.push_back(std::move(value));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  /// Like push(), but gives up with cancelled_error when `ctx` is done.
  bool push(const context &ctx, T value) {
    std::unique_lock<std::mutex> lock(mu_);
    ctx.wait(not_full_, lock,
             [this]() { return closed_ || items_.size() < capacity_; });
    if (closed_)
      return false;
    items_.push_back(std::move(value));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  bool try_push(T value) {
    std::unique_lock<std::mutex> lock(mu_);
    if (closed_ || items_.size() >= capacity_)
      return false;
    items_.push_back(std::move(value));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  /// Waits until an item arrives or `deadline` passes. Items queued before
  /// close() are still delivered.
  std::optional<T> pop_until(clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mu_);
    auto ready = [this]() { return closed_ || !items_.empty(); };
    if (deadline == clock::time_point::max())
      not_empty_.wait(lock, ready);
    else
      not_empty_.wait_until(lock, deadline, ready);
    return take(lock);
  }

  /// Cancellable pop; nullopt on `until` timeout or when closed and drained.
  std::optional<T> pop(const context &ctx,
                       clock::time_point until = clock::time_point::max()) {
    std::unique_lock<std::mutex> lock(mu_);
    ctx.wait(not_empty_, lock,
             [this]() { return closed_ || !items_.empty(); }, until);
    return take(lock);
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return items_.size();
  }

private:
  std::optional<T> take(std::unique_lock<std::mutex> &lock) {
    if (items_.empty())
      return std::nullopt;
    T value = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return value;
  }

  const std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  bool closed_ = false;
};

/// Counting semaphore bounding concurrent remote sessions.
class session_semaphore {
public:
  explicit session_semaphore(int permits) : capacity_(permits), available_(permits) {
    if (permits <= 0)
      throw std::invalid_argument("semaphore needs at least one permit");
  }

  session_semaphore(const session_semaphore &) = delete;
  session_semaphore &operator=(const session_semaphore &) = delete;

  void acquire(const context &ctx) {
    std::unique_lock<std::mutex> lock(mu_);
    ctx.wait(cv_, lock, [this]() { return available_ > 0; });
    --available_;
  }

  void release() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (available_ < capacity_)
        ++available_;
    }
    cv_.notify_one();
  }

  int capacity() const { return capacity_; }

  int available() const {
    std::lock_guard<std::mutex> lock(mu_);
    return available_;
  }

private:
  const int capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  int available_;
};

/// Holds one permit for its lifetime.
class session_permit {
public:
  session_permit(session_semaphore &sem, const context &ctx) : sem_(sem) {
    sem_.acquire(ctx);
  }
  ~session_permit() { sem_.release(); }

  session_permit(const session_permit &) = delete;
  session_permit &operator=(const session_permit &) = delete;

private:
  session_semaphore &sem_;
};

} // namespace mwclient
