#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "context.hpp"

namespace mwclient {

enum class job_state { running, waiting, success, failed, aborted, unknown };

inline job_state parse_job_state(const std::string &s) {
  if (s == "RUNNING")
    return job_state::running;
  if (s == "WAITING")
    return job_state::waiting;
  if (s == "SUCCESS")
    return job_state::success;
  if (s == "FAILED")
    return job_state::failed;
  if (s == "ABORTED")
    return job_state::aborted;
  return job_state::unknown;
}

inline const char *to_string(job_state s) {
  switch (s) {
  case job_state::running:
    return "RUNNING";
  case job_state::waiting:
    return "WAITING";
  case job_state::success:
    return "SUCCESS";
  case job_state::failed:
    return "FAILED";
  case job_state::aborted:
    return "ABORTED";
  case job_state::unknown:
    break;
  }
  return "UNKNOWN";
}

inline bool is_terminal(job_state s) {
  return s == job_state::success || s == job_state::failed ||
         s == job_state::aborted;
}

/// Asynchronous unit of work tracked by the middleware.
struct job {
  int64_t id = 0;
  job_state state = job_state::unknown;
  nlohmann::json result;
  std::string error;
  std::string logs_excerpt;
  std::string logs_path;
};

namespace detail {

inline std::string string_field(const nlohmann::json &obj, const char *key) {
  if (obj.contains(key) && obj[key].is_string())
    return obj[key].get<std::string>();
  return "";
}

} // namespace detail

/// Decodes one entry of a core.get_jobs listing.
inline job job_from_json(const nlohmann::json &j) {
  job out;
  if (!j.is_object())
    return out;
  if (j.contains("id") && j["id"].is_number_integer())
    out.id = j["id"].get<int64_t>();
  out.state = parse_job_state(detail::string_field(j, "state"));
  if (j.contains("result"))
    out.result = j["result"];
  out.error = detail::string_field(j, "error");
  out.logs_excerpt = detail::string_field(j, "logs_excerpt");
  out.logs_path = detail::string_field(j, "logs_path");
  return out;
}

/// Many middleware operations answer with just the job ID.
inline std::optional<int64_t> parse_job_id(const nlohmann::json &result) {
  if (result.is_number_integer())
    return result.get<int64_t>();
  return std::nullopt;
}

/// Filter selecting one job in core.get_jobs: [["id", "=", id]].
inline nlohmann::json job_filter(int64_t job_id) {
  return nlohmann::json::array({nlohmann::json::array({"id", "=", job_id})});
}

enum class job_event_kind {
  progress,
  /// Synthetic: the connection carrying job events was lost.
  disconnected,
  /// Synthetic: the connection was restored after a loss.
  reconnected,
};

struct job_event {
  int64_t id = 0;
  job_event_kind kind = job_event_kind::progress;
  job_state state = job_state::unknown;
  nlohmann::json result;
  std::string error;

  bool terminal() const {
    return kind == job_event_kind::progress && is_terminal(state);
  }

  static job_event synthetic(int64_t id, job_event_kind kind) {
    job_event e;
    e.id = id;
    e.kind = kind;
    return e;
  }
};

/// Recent terminal events, so a subscriber that registers late still sees
/// an outcome that arrived first. Oldest entries are evicted first.
class job_event_buffer {
public:
  static constexpr std::size_t kDefaultCapacity = 100;

  explicit job_event_buffer(std::size_t capacity = kDefaultCapacity)
      : capacity_(capacity) {}

  void add(job_event event) {
    if (capacity_ == 0)
      return;
    if (events_.size() >= capacity_)
      events_.pop_front();
    events_.push_back(std::move(event));
  }

  /// Newest terminal event for `job_id`, if still buffered.
  std::optional<job_event> find_terminal(int64_t job_id) const {
    for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
      if (it->id == job_id && it->terminal())
        return *it;
    }
    return std::nullopt;
  }

  std::size_t size() const { return events_.size(); }
  std::size_t capacity() const { return capacity_; }

private:
  std::size_t capacity_;
  std::deque<job_event> events_;
};

/// Event queue of one job subscriber. deliver() never blocks: when the feed
/// is full the oldest progress update is evicted, connectivity events
/// collapse into the latest one, and a terminal event is always accepted.
class job_feed {
public:
  using clock = context::clock;

  static constexpr std::size_t kDefaultCapacity = 10;

  explicit job_feed(std::size_t capacity = kDefaultCapacity)
      : capacity_(std::max<std::size_t>(capacity, 3)) {}

  job_feed(const job_feed &) = delete;
  job_feed &operator=(const job_feed &) = delete;

  /// Returns false once closed. A progress update that finds no room is
  /// dropped.
  bool deliver(job_event event) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (closed_)
        return false;
      if (event.kind != job_event_kind::progress) {
        auto prior = std::find_if(items_.begin(), items_.end(), is_synthetic);
        if (prior != items_.end())
          items_.erase(prior);
      }
      if (items_.size() >= capacity_) {
        auto oldest = std::find_if(items_.begin(), items_.end(), is_progress);
        if (oldest != items_.end()) {
          items_.erase(oldest);
          ++evicted_;
        } else if (!event.terminal()) {
          ++evicted_;
          return true;
        }
      }
      items_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
  }

  /// Next event; nullopt when `until` passes or the feed is closed and
  /// drained. Throws cancelled_error when `ctx` is done.
  std::optional<job_event> next(const context &ctx,
                                clock::time_point until = clock::time_point::max()) {
    std::unique_lock<std::mutex> lock(mu_);
    ctx.wait(cv_, lock, [this]() { return closed_ || !items_.empty(); }, until);
    if (items_.empty())
      return std::nullopt;
    job_event event = std::move(items_.front());
    items_.pop_front();
    return event;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return items_.size();
  }

  /// Progress updates discarded for lack of room.
  std::size_t evicted() const {
    std::lock_guard<std::mutex> lock(mu_);
    return evicted_;
  }

  std::size_t capacity() const { return capacity_; }

private:
  static bool is_synthetic(const job_event &e) {
    return e.kind != job_event_kind::progress;
  }
  static bool is_progress(const job_event &e) {
    return e.kind == job_event_kind::progress && !e.terminal();
  }

  const std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<job_event> items_;
  std::size_t evicted_ = 0;
  bool closed_ = false;
};

} // namespace mwclient
