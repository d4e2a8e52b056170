#include "../include/mwclient/retry.hpp"

#include <cassert>
#include <chrono>
#include <cstdio>
#include <exception>
#include <stdexcept>

using std::chrono::milliseconds;

namespace {

bool within(milliseconds got, long long nominal) {
  return got.count() >= nominal * 3 / 4 && got.count() <= nominal * 5 / 4;
}

} // namespace

int main() {
  int passed = 0;

  // --- calculate_backoff ---
  for (int i = 0; i < 50; ++i) {
    assert(within(mwclient::calculate_backoff(0), 2000));
    assert(within(mwclient::calculate_backoff(1), 4000));
    assert(within(mwclient::calculate_backoff(2), 8000));
    assert(within(mwclient::calculate_backoff(3), 16000));
    // capped at 30s before jitter
    assert(within(mwclient::calculate_backoff(10), 30000));
  }
  ++passed;
  {
    mwclient::backoff_policy fast{milliseconds(10), milliseconds(40)};
    for (int i = 0; i < 50; ++i) {
      assert(within(mwclient::calculate_backoff(0, fast), 10));
      assert(within(mwclient::calculate_backoff(5, fast), 40));
    }
    ++passed;
  }

  // --- ssh_retry_classifier ---
  {
    mwclient::ssh_retry_classifier c;
    assert(c.is_retriable(std::runtime_error("ssh: Failed connection handshake")));
    ++passed;
    assert(c.is_retriable(std::runtime_error("Unexpected closure of remote connection")));
    ++passed;
    assert(c.is_retriable(std::runtime_error("dial tcp: connection refused")));
    ++passed;
    assert(c.is_retriable(std::runtime_error("read: connection reset by peer")));
    ++passed;
    assert(c.is_retriable(std::runtime_error("i/o timeout")));
    ++passed;
    assert(c.is_retriable(std::runtime_error("CONNECTION REFUSED")));
    ++passed;
    assert(!c.is_retriable(std::runtime_error("[EINVAL] name: invalid character")));
    ++passed;
    assert(!c.is_retriable(mwclient::parse_error("[ENOENT] resource not found")));
    ++passed;
    assert(!c.is_retriable(std::runtime_error("something went wrong")));
    ++passed;
    assert(!c.is_retriable(mwclient::cancelled_error(true)));
    ++passed;
    assert(!c.is_retriable(std::exception_ptr()));
    ++passed;
    assert(c.is_retriable(std::make_exception_ptr(
        mwclient::make_connection_error("nas", 22, "connection refused"))));
    ++passed;
  }

  // --- socket_retry_classifier ---
  {
    using mwclient::rpc_error;
    namespace rc = mwclient::rpc_codes;
    mwclient::socket_retry_classifier c;
    assert(c.is_retriable(rpc_error(rc::kInternal, "connection closed")));
    ++passed;
    assert(c.is_retriable(rpc_error(rc::kTooManyConcurrent, "Too many concurrent calls")));
    ++passed;
    assert(!c.is_retriable(rpc_error(rc::kCallError, "Validation error")));
    ++passed;
    assert(c.is_retriable(rpc_error(rc::kCallError, "Resource busy", {{"error", 11}})));
    ++passed;
    assert(c.is_retriable(rpc_error(rc::kCallError, "Device busy", {{"error", 16}})));
    ++passed;
    assert(!c.is_retriable(rpc_error(rc::kCallError, "Invalid argument", {{"error", 22}})));
    ++passed;
    assert(c.is_retriable(rpc_error(rc::kCallError, "Not authenticated",
                                    {{"reason", "[ENOTAUTHENTICATED] Not authenticated"}})));
    ++passed;
    assert(c.is_retriable(mwclient::transport_error("websocket: connection closed")));
    ++passed;
    assert(c.is_retriable(std::runtime_error("websocket: close sent")));
    ++passed;
    assert(c.is_retriable(std::runtime_error("write: broken pipe")));
    ++passed;
    assert(!c.is_retriable(std::runtime_error("something went wrong")));
    ++passed;
    assert(!c.is_retriable(mwclient::cancelled_error(false)));
    ++passed;
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
