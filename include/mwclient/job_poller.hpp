#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include "context.hpp"
#include "errors.hpp"
#include "job.hpp"
#include "log.hpp"
#include "transport.hpp"

namespace mwclient {

struct job_poller_config {
  std::chrono::milliseconds initial_interval{500};
  std::chrono::milliseconds max_interval{10000};
  double multiplier = 1.5;
};

/// Builds the error raised for a FAILED or ABORTED job, enriched with the
/// app lifecycle log when the failure points at one.
inline middleware_error job_failure_error(const context &ctx, int64_t job_id,
                                          const std::string &error_text,
                                          const std::string &logs_excerpt,
                                          const log_reader &read) {
  auto err = parse_error(error_text);
  err.set_job_id(job_id);
  if (!logs_excerpt.empty())
    err.set_logs_excerpt(logs_excerpt);
  enrich_app_lifecycle_error(ctx, err, read);
  return err;
}

/// Reads a remote file through filesystem.file_get_contents.
inline log_reader middleware_log_reader(caller call) {
  return [call = std::move(call)](const context &ctx, const std::string &path) {
    auto result = call(ctx, "filesystem.file_get_contents", json::array({path}));
    if (!result.is_string())
      throw std::runtime_error("file_get_contents returned a non-string result");
    return result.get<std::string>();
  };
}

/// Waits for a job by querying core.get_jobs with a growing interval.
class job_poller {
public:
  explicit job_poller(caller call, job_poller_config config = {})
      : call_(std::move(call)), config_(config) {
    if (config_.initial_interval.count() <= 0)
      config_.initial_interval = std::chrono::milliseconds(500);
    if (config_.max_interval < config_.initial_interval)
      config_.max_interval = config_.initial_interval;
    if (config_.multiplier < 1.0)
      config_.multiplier = 1.0;
  }

  /// Returns the job result on SUCCESS. Throws middleware_error for a failed
  /// job, a missing job, or when `timeout` elapses.
  json wait(const context &ctx, int64_t job_id, std::chrono::milliseconds timeout) {
    auto deadline = context::clock::now() + timeout;
    auto interval = config_.initial_interval;

    for (;;) {
      if (context::clock::now() >= deadline)
        throw make_timeout_error(job_id, timeout);
      ctx.check();

      auto current = fetch(ctx, job_id);
      switch (current.state) {
      case job_state::success:
        return current.result;
      case job_state::failed:
      case job_state::aborted:
        throw job_failure_error(ctx, job_id, current.error,
                                current.logs_excerpt,
                                middleware_log_reader(call_));
      case job_state::running:
      case job_state::waiting:
      case job_state::unknown:
        break;
      }

      MWCLIENT_LOG_TRACE("job {} is {}, next poll in {}ms", job_id,
                         to_string(current.state), interval.count());
      ctx.sleep_for(interval);

      auto next = std::chrono::milliseconds(static_cast<long long>(
          static_cast<double>(interval.count()) * config_.multiplier));
      interval = std::min(next, config_.max_interval);
    }
  }

  /// Current snapshot of one job. Throws ENOENT when the server has no such
  /// job.
  job fetch(const context &ctx, int64_t job_id) {
    auto result = call_(ctx, "core.get_jobs", json::array({job_filter(job_id)}));
    if (!result.is_array())
      throw std::runtime_error("failed to parse job response: expected array");
    if (result.empty())
      throw make_job_not_found_error(job_id);
    return job_from_json(result.front());
  }

  const job_poller_config &config() const { return config_; }

private:
  caller call_;
  job_poller_config config_;
};

} // namespace mwclient
