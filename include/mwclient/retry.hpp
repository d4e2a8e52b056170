#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <exception>
#include <mutex>
#include <random>
#include <string>

#include "context.hpp"
#include "errors.hpp"

namespace mwclient {

/// Exponential backoff parameters.
struct backoff_policy {
  std::chrono::milliseconds base{2000};
  std::chrono::milliseconds max{30000};
};

namespace detail {

inline double jitter_unit() {
  static std::mutex mu;
  static std::mt19937 rng{std::random_device{}()};
  std::lock_guard<std::mutex> lock(mu);
  return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
}

inline std::string lowercase(std::string s) {
  for (auto &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

} // namespace detail

/// Delay before retry `attempt` (0-indexed): base * 2^attempt capped at max,
/// then +/-25% jitter.
inline std::chrono::milliseconds calculate_backoff(int attempt,
                                                   const backoff_policy &policy = {}) {
  double base = static_cast<double>(policy.base.count());
  double cap = static_cast<double>(policy.max.count());
  double delay = std::min(base * std::pow(2.0, std::max(0, attempt)), cap);
  double jitter = delay * 0.5 * detail::jitter_unit() - delay / 4.0;
  auto ms = static_cast<long long>(delay + jitter);
  return std::chrono::milliseconds(std::max(0LL, ms));
}

/// Decides whether a failed attempt is safe to retry.
class retry_classifier {
public:
  virtual ~retry_classifier() = default;
  virtual bool is_retriable(const std::exception &err) const = 0;

  bool is_retriable(const std::exception_ptr &err) const {
    if (!err)
      return false;
    try {
      std::rethrow_exception(err);
    } catch (const std::exception &e) {
      return is_retriable(e);
    }
  }
};

/// Transient failures of the secure-shell transport, matched on message text.
class ssh_retry_classifier : public retry_classifier {
public:
  using retry_classifier::is_retriable;

  bool is_retriable(const std::exception &err) const override {
    if (dynamic_cast<const cancelled_error *>(&err) != nullptr)
      return false;
    static const char *const patterns[] = {
        "failed connection handshake",
        "unexpected closure of remote connection",
        "connection refused",
        "connection reset",
        "i/o timeout",
        "no route to host",
        "network is unreachable",
    };
    auto msg = detail::lowercase(err.what());
    for (const char *p : patterns) {
      if (msg.find(p) != std::string::npos)
        return true;
    }
    return false;
  }
};

/// Transient failures of the websocket transport.
class socket_retry_classifier : public retry_classifier {
public:
  using retry_classifier::is_retriable;

  bool is_retriable(const std::exception &err) const override {
    if (dynamic_cast<const cancelled_error *>(&err) != nullptr)
      return false;

    if (auto *rpc = dynamic_cast<const rpc_error *>(&err)) {
      switch (rpc->code()) {
      case rpc_codes::kInternal:
      case rpc_codes::kTooManyConcurrent:
        return true;
      case rpc_codes::kCallError:
        // EAGAIN, EBUSY, or an expired session that the next call re-auths
        return rpc->errno_value() == 11 || rpc->errno_value() == 16 ||
               rpc->reason().find("ENOTAUTHENTICATED") != std::string::npos;
      default:
        return false;
      }
    }

    if (dynamic_cast<const transport_error *>(&err) != nullptr)
      return true;

    static const char *const patterns[] = {
        "connection reset by peer", "broken pipe",
        "connection refused",       "no route to host",
        "network is unreachable",   "i/o timeout",
        "websocket: close",
    };
    std::string msg = err.what();
    for (const char *p : patterns) {
      if (msg.find(p) != std::string::npos)
        return true;
    }
    return false;
  }
};

} // namespace mwclient
