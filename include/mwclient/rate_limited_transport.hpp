#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "context.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "rate_limiter.hpp"
#include "retry.hpp"
#include "transport.hpp"

namespace mwclient {

/// Wraps a transport with a shared token bucket and classified retries.
///
/// call() and call_and_wait() take a token before every attempt and retry
/// transient failures with jittered exponential backoff. File primitives
/// take one token and are not retried.
class rate_limited_transport : public transport {
public:
  static constexpr int kDefaultMaxRetries = 3;

  rate_limited_transport(std::shared_ptr<transport> inner, int calls_per_minute,
                         int max_retries,
                         std::shared_ptr<const retry_classifier> classifier =
                             std::make_shared<ssh_retry_classifier>(),
                         backoff_policy backoff = {})
      : inner_(std::move(inner)), limiter_(calls_per_minute),
        max_retries_(max_retries < 0 ? kDefaultMaxRetries : max_retries),
        classifier_(std::move(classifier)), backoff_(backoff) {
    if (!inner_)
      throw std::invalid_argument("inner transport is required");
    if (!classifier_)
      classifier_ = std::make_shared<ssh_retry_classifier>();
  }

  ~rate_limited_transport() override = default;

  void connect(const context &ctx) override {
    limiter_.wait(ctx);
    inner_->connect(ctx);
  }

  server_version version() const override { return inner_->version(); }

  json call(const context &ctx, const std::string &method,
            const json &params) override {
    return with_retry(ctx, method, [&]() { return inner_->call(ctx, method, params); });
  }

  json call_and_wait(const context &ctx, const std::string &method,
                     const json &params) override {
    return with_retry(ctx, method,
                      [&]() { return inner_->call_and_wait(ctx, method, params); });
  }

  void write_file(const context &ctx, const std::string &path,
                  const write_file_params &params) override {
    limiter_.wait(ctx);
    inner_->write_file(ctx, path, params);
  }

  std::string read_file(const context &ctx, const std::string &path) override {
    limiter_.wait(ctx);
    return inner_->read_file(ctx, path);
  }

  void delete_file(const context &ctx, const std::string &path) override {
    limiter_.wait(ctx);
    inner_->delete_file(ctx, path);
  }

  bool file_exists(const context &ctx, const std::string &path) override {
    limiter_.wait(ctx);
    return inner_->file_exists(ctx, path);
  }

  void mkdir_all(const context &ctx, const std::string &path, int mode) override {
    limiter_.wait(ctx);
    inner_->mkdir_all(ctx, path, mode);
  }

  void remove_dir(const context &ctx, const std::string &path) override {
    limiter_.wait(ctx);
    inner_->remove_dir(ctx, path);
  }

  void remove_all(const context &ctx, const std::string &path) override {
    limiter_.wait(ctx);
    inner_->remove_all(ctx, path);
  }

  void chown(const context &ctx, const std::string &path, int uid,
             int gid) override {
    limiter_.wait(ctx);
    inner_->chown(ctx, path, uid, gid);
  }

  void chmod_recursive(const context &ctx, const std::string &path,
                       int mode) override {
    limiter_.wait(ctx);
    inner_->chmod_recursive(ctx, path, mode);
  }

  void close() override { inner_->close(); }

  const std::shared_ptr<transport> &inner() const { return inner_; }
  int max_retries() const { return max_retries_; }
  const token_bucket &limiter() const { return limiter_; }

private:
  template <typename Attempt>
  json with_retry(const context &ctx, const std::string &method, Attempt attempt) {
    for (int n = 0;; ++n) {
      limiter_.wait(ctx);
      try {
        return attempt();
      } catch (const cancelled_error &) {
        throw;
      } catch (const std::exception &e) {
        if (!classifier_->is_retriable(e) || max_retries_ == 0)
          throw;
        if (n == max_retries_) {
          MWCLIENT_LOG_WARN("{}: giving up after {} attempts: {}", method, n + 1,
                            e.what());
          throw retry_exhausted_error(n + 1, std::current_exception(), e.what());
        }
        auto delay = calculate_backoff(n, backoff_);
        MWCLIENT_LOG_DEBUG("{}: attempt {} failed ({}), retrying in {}ms",
                           method, n + 1, e.what(), delay.count());
        ctx.sleep_for(delay);
      }
    }
  }

  std::shared_ptr<transport> inner_;
  token_bucket limiter_;
  int max_retries_;
  std::shared_ptr<const retry_classifier> classifier_;
  backoff_policy backoff_;
};

} // namespace mwclient
