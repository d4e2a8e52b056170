#include "../include/mwclient/job_poller.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

using nlohmann::json;
using namespace std::chrono_literals;

namespace {

mwclient::job_poller_config fast_config() {
  mwclient::job_poller_config cfg;
  cfg.initial_interval = 1ms;
  cfg.max_interval = 5ms;
  cfg.multiplier = 2.0;
  return cfg;
}

json job_list(const std::string &state, json result = nullptr,
              const std::string &error = "", const std::string &excerpt = "") {
  json j = {{"id", 123}, {"state", state}, {"result", result}};
  if (!error.empty())
    j["error"] = error;
  if (!excerpt.empty())
    j["logs_excerpt"] = excerpt;
  return json::array({j});
}

// Answers core.get_jobs from a script; the last entry repeats.
struct scripted_caller {
  std::vector<json> replies;
  std::vector<std::string> methods;
  std::vector<json> params;

  mwclient::caller fn() {
    return [this](const mwclient::context &, const std::string &method,
                  const json &p) -> json {
      methods.push_back(method);
      params.push_back(p);
      if (method == "filesystem.file_get_contents")
        return "[2026/01/20 17:00:00] (ERROR) app_lifecycle.compose_action():56 - "
               "Failed 'up' action for 'dns' app: bind: address already in use\n";
      std::size_t i = 0;
      for (const auto &m : methods)
        i += m == "core.get_jobs" ? 1 : 0;
      return replies[std::min(i, replies.size()) - 1];
    };
  }
};

} // namespace

int main() {
  int passed = 0;

  // --- RUNNING, RUNNING, SUCCESS ---
  {
    scripted_caller c;
    c.replies = {job_list("RUNNING"), job_list("RUNNING"),
                 job_list("SUCCESS", {{"id", 123}})};
    mwclient::job_poller poller(c.fn(), fast_config());
    auto result = poller.wait(mwclient::context::background(), 123, 10s);
    assert(result == json({{"id", 123}}));
    ++passed;
    assert(c.methods.size() == 3);
    ++passed;
    assert(c.params[0] == json::parse(R"([[["id", "=", 123]]])"));
    ++passed;
  }

  // --- WAITING and unknown states keep polling ---
  {
    scripted_caller c;
    c.replies = {job_list("WAITING"), job_list("PAUSED"), job_list("SUCCESS", nullptr)};
    mwclient::job_poller poller(c.fn(), fast_config());
    auto result = poller.wait(mwclient::context::background(), 123, 10s);
    assert(result.is_null());
    ++passed;
    assert(c.methods.size() == 3);
    ++passed;
  }

  // --- FAILED ---
  {
    scripted_caller c;
    c.replies = {job_list("FAILED", nullptr, "[EINVAL] x", "pull access denied")};
    mwclient::job_poller poller(c.fn(), fast_config());
    bool threw = false;
    try {
      poller.wait(mwclient::context::background(), 123, 10s);
    } catch (const mwclient::middleware_error &e) {
      threw = true;
      assert(e.code() == "EINVAL");
      assert(e.job_id() && *e.job_id() == 123);
      assert(e.logs_excerpt() == "pull access denied");
      assert(std::string(e.what()).find("Job logs:\npull access denied") !=
             std::string::npos);
    }
    assert(threw);
    ++passed;
  }

  // --- FAILED with an app lifecycle pointer reads the log ---
  {
    scripted_caller c;
    c.replies = {job_list("FAILED", nullptr,
                          "[EFAULT] Failed 'up' action for 'dns' app. Please check "
                          "/var/log/app_lifecycle.log for more details")};
    mwclient::job_poller poller(c.fn(), fast_config());
    bool threw = false;
    try {
      poller.wait(mwclient::context::background(), 123, 10s);
    } catch (const mwclient::middleware_error &e) {
      threw = true;
      assert(e.app_lifecycle_error() == "bind: address already in use");
    }
    assert(threw);
    ++passed;
    assert(c.methods.back() == "filesystem.file_get_contents");
    ++passed;
    assert(c.params.back() == json::array({"/var/log/app_lifecycle.log"}));
    ++passed;
  }

  // --- ABORTED ---
  {
    scripted_caller c;
    c.replies = {job_list("ABORTED", nullptr, "aborted by user")};
    mwclient::job_poller poller(c.fn(), fast_config());
    bool threw = false;
    try {
      poller.wait(mwclient::context::background(), 123, 10s);
    } catch (const mwclient::middleware_error &e) {
      threw = e.code() == mwclient::codes::kUnknown;
    }
    assert(threw);
    ++passed;
  }

  // --- RUNNING forever times out ---
  {
    scripted_caller c;
    c.replies = {job_list("RUNNING")};
    mwclient::job_poller poller(c.fn(), fast_config());
    bool threw = false;
    try {
      poller.wait(mwclient::context::background(), 123, 40ms);
    } catch (const mwclient::middleware_error &e) {
      threw = true;
      assert(e.code() == mwclient::codes::kTimedOut);
      assert(e.job_id() && *e.job_id() == 123);
    }
    assert(threw);
    ++passed;
    assert(c.methods.size() >= 2);
    ++passed;
  }

  // --- empty list ---
  {
    scripted_caller c;
    c.replies = {json::array()};
    mwclient::job_poller poller(c.fn(), fast_config());
    bool threw = false;
    try {
      poller.wait(mwclient::context::background(), 123, 10s);
    } catch (const mwclient::middleware_error &e) {
      threw = e.code() == mwclient::codes::kNotFound;
    }
    assert(threw);
    ++passed;
  }

  // --- malformed response ---
  {
    scripted_caller c;
    c.replies = {json{{"unexpected", true}}};
    mwclient::job_poller poller(c.fn(), fast_config());
    bool threw = false;
    try {
      poller.wait(mwclient::context::background(), 123, 10s);
    } catch (const std::runtime_error &) {
      threw = true;
    }
    assert(threw);
    ++passed;
  }

  // --- cancellation ---
  {
    scripted_caller c;
    c.replies = {job_list("RUNNING")};
    mwclient::job_poller poller(c.fn(), fast_config());
    auto ctx = mwclient::context::background().with_cancel();
    ctx.cancel();
    bool threw = false;
    try {
      poller.wait(ctx, 123, 10s);
    } catch (const mwclient::cancelled_error &) {
      threw = true;
    }
    assert(threw);
    ++passed;
    assert(c.methods.empty());
    ++passed;
  }

  // --- config defaults ---
  {
    mwclient::job_poller_config bad;
    bad.initial_interval = 0ms;
    bad.max_interval = 0ms;
    bad.multiplier = 0.5;
    mwclient::job_poller poller([](const mwclient::context &, const std::string &,
                                   const json &) { return json(); },
                                bad);
    assert(poller.config().initial_interval == 500ms);
    ++passed;
    assert(poller.config().max_interval == 500ms);
    ++passed;
    assert(poller.config().multiplier == 1.0);
    ++passed;
  }

  // --- parse_job_id ---
  assert(mwclient::parse_job_id(json(42)) == 42);
  ++passed;
  assert(!mwclient::parse_job_id(json("42")));
  ++passed;
  assert(!mwclient::parse_job_id(json{{"id", 1}}));
  ++passed;

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
