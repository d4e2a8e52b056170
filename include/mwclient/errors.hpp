#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "context.hpp"
#include "log.hpp"

namespace mwclient {

namespace codes {
constexpr const char *kUnknown = "unknown";
constexpr const char *kInvalid = "EINVAL";
constexpr const char *kNotFound = "ENOENT";
constexpr const char *kFault = "EFAULT";
constexpr const char *kExists = "EEXIST";
constexpr const char *kNotEmpty = "ENOTEMPTY";
constexpr const char *kConnRefused = "ECONNREFUSED";
constexpr const char *kTimedOut = "ETIMEDOUT";
constexpr const char *kHostKey = "EHOSTKEY";
constexpr const char *kNotSupported = "ENOTSUP";
} // namespace codes

/// Structured error derived from middleware error text.
class middleware_error : public std::exception {
public:
  middleware_error(std::string code, std::string message)
      : code_(std::move(code)), message_(std::move(message)) {
    render();
  }

  const char *what() const noexcept override { return rendered_.c_str(); }

  const std::string &code() const { return code_; }
  const std::string &message() const { return message_; }
  const std::string &field() const { return field_; }
  std::optional<int64_t> job_id() const { return job_id_; }
  const std::string &suggestion() const { return suggestion_; }
  const std::string &logs_excerpt() const { return logs_excerpt_; }
  const std::string &app_action() const { return app_action_; }
  const std::string &app_name() const { return app_name_; }
  const std::string &log_path() const { return log_path_; }
  const std::string &app_lifecycle_error() const { return app_lifecycle_error_; }

  middleware_error &set_field(std::string field) {
    field_ = std::move(field);
    return *this;
  }
  middleware_error &set_job_id(int64_t id) {
    job_id_ = id;
    return *this;
  }
  middleware_error &set_suggestion(std::string suggestion) {
    suggestion_ = std::move(suggestion);
    render();
    return *this;
  }
  middleware_error &set_logs_excerpt(std::string excerpt) {
    logs_excerpt_ = std::move(excerpt);
    render();
    return *this;
  }
  middleware_error &set_app_failure(std::string action, std::string app,
                                    std::string log_path) {
    app_action_ = std::move(action);
    app_name_ = std::move(app);
    log_path_ = std::move(log_path);
    return *this;
  }
  middleware_error &set_app_lifecycle_error(std::string text) {
    app_lifecycle_error_ = std::move(text);
    render();
    return *this;
  }

private:
  void render() {
    std::string out;
    if (!app_lifecycle_error_.empty()) {
      out = app_lifecycle_error_;
    } else {
      out = message_;
      if (!logs_excerpt_.empty())
        out += "\n\nJob logs:\n" + logs_excerpt_;
    }
    if (!suggestion_.empty())
      out += "\n\nSuggestion: " + suggestion_;
    rendered_ = std::move(out);
  }

  std::string code_;
  std::string message_;
  std::string field_;
  std::optional<int64_t> job_id_;
  std::string suggestion_;
  std::string logs_excerpt_;
  std::string app_action_;
  std::string app_name_;
  std::string log_path_;
  std::string app_lifecycle_error_;
  std::string rendered_;
};

/// JSON-RPC error codes used by the middleware.
namespace rpc_codes {
constexpr int kInternal = -1;
constexpr int kTooManyConcurrent = -32000;
constexpr int kCallError = -32001;
} // namespace rpc_codes

/// JSON-RPC error object returned over the socket transport.
class rpc_error : public std::runtime_error {
public:
  rpc_error(int code, const std::string &message,
            nlohmann::json data = nullptr)
      : std::runtime_error(describe(message, data)), code_(code),
        message_(message), data_(std::move(data)) {}

  int code() const { return code_; }
  const std::string &message() const { return message_; }
  const nlohmann::json &data() const { return data_; }

  std::string reason() const {
    if (data_.is_object() && data_.contains("reason") &&
        data_["reason"].is_string())
      return data_["reason"].get<std::string>();
    return "";
  }

  /// errno reported in data.error, 0 when absent.
  int errno_value() const {
    if (data_.is_object() && data_.contains("error") &&
        data_["error"].is_number_integer())
      return data_["error"].get<int>();
    return 0;
  }

  nlohmann::json extra() const {
    if (data_.is_object() && data_.contains("extra"))
      return data_["extra"];
    return nlohmann::json::array();
  }

  static rpc_error from_json(const nlohmann::json &err) {
    int code = err.contains("code") && err["code"].is_number_integer()
                   ? err["code"].get<int>()
                   : rpc_codes::kInternal;
    std::string message = err.contains("message") && err["message"].is_string()
                              ? err["message"].get<std::string>()
                              : "internal error";
    return rpc_error(code, message,
                     err.contains("data") ? err["data"] : nlohmann::json());
  }

private:
  static std::string describe(const std::string &message,
                              const nlohmann::json &data) {
    if (data.is_object() && data.contains("reason") &&
        data["reason"].is_string()) {
      auto reason = data["reason"].get<std::string>();
      if (!reason.empty())
        return reason;
    }
    return message;
  }

  int code_;
  std::string message_;
  nlohmann::json data_;
};

/// Connection-level failure: closed stream, failed write, lost session.
class transport_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Thrown by the retry decorator when every attempt failed transiently.
class retry_exhausted_error : public std::runtime_error {
public:
  retry_exhausted_error(int attempts, std::exception_ptr cause,
                        const std::string &cause_text)
      : std::runtime_error("after " + std::to_string(attempts) +
                           " attempts: " + cause_text),
        attempts_(attempts), cause_(std::move(cause)) {}

  int attempts() const { return attempts_; }
  std::exception_ptr cause() const { return cause_; }
  [[noreturn]] void rethrow_cause() const { std::rethrow_exception(cause_); }

private:
  int attempts_;
  std::exception_ptr cause_;
};

namespace detail {

inline std::string trim(const std::string &s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

inline std::string regex_escape(const std::string &s) {
  static const std::string special = R"(\^$.|?*+()[]{})";
  std::string out;
  out.reserve(s.size() * 2);
  for (char c : s) {
    if (special.find(c) != std::string::npos)
      out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

inline const char *suggestion_for(const std::string &code) {
  if (code == codes::kInvalid)
    return "Check the configuration schema. A field may be invalid or unexpected.";
  if (code == codes::kNotFound)
    return "Resource not found. It may have been deleted outside this client.";
  if (code == codes::kFault)
    return "Container failed to start. Check the compose configuration and image availability.";
  if (code == codes::kExists)
    return "Resource already exists. Import it or choose a different name.";
  if (code == codes::kNotEmpty)
    return "Directory or dataset has children. Delete the children first or force the removal.";
  return nullptr;
}

/// Renders a duration the way the middleware tooling prints it: 500ms, 45s, 5m0s.
inline std::string format_duration(std::chrono::milliseconds d) {
  auto ms = d.count();
  if (ms < 1000)
    return std::to_string(ms) + "ms";
  auto secs = ms / 1000;
  auto h = secs / 3600;
  auto m = (secs % 3600) / 60;
  auto s = secs % 60;
  std::string out;
  if (h > 0)
    out += std::to_string(h) + "h";
  if (h > 0 || m > 0)
    out += std::to_string(m) + "m";
  out += std::to_string(s) + "s";
  return out;
}

} // namespace detail

/// Parses raw middleware error text into a structured error.
///
/// Recognises "[CODE] field.path: message", strips process-exit prefixes and
/// Python tracebacks, and notes app-lifecycle failures for later enrichment.
inline middleware_error parse_error(const std::string &raw) {
  static const std::regex process_exit_re(R"(^Process exited with status \d+:\s*)");
  static const std::regex code_re(R"(^\s*\[([A-Z]+)\]\s*([\s\S]*))");
  static const std::regex field_re(R"(^([\w.]+):\s*([\s\S]*))");
  static const std::regex app_lifecycle_re(
      R"(Failed '(\w+)' action for '([^']+)' app.*(/var/log/app_lifecycle\.log))");

  std::string cleaned = std::regex_replace(raw, process_exit_re, "",
                                           std::regex_constants::format_first_only);
  auto tb = cleaned.find("\nTraceback");
  if (tb != std::string::npos)
    cleaned = detail::trim(cleaned.substr(0, tb));
  tb = cleaned.find("Traceback (most recent call last)");
  if (tb != std::string::npos)
    cleaned = detail::trim(cleaned.substr(0, tb));

  std::string code = codes::kUnknown;
  std::string message = cleaned;
  std::string field;

  std::smatch m;
  if (std::regex_search(cleaned, m, code_re)) {
    code = m[1].str();
    message = detail::trim(m[2].str());
    std::smatch fm;
    if (std::regex_search(message, fm, field_re))
      field = fm[1].str();
  }

  middleware_error err(code, message);
  if (!field.empty())
    err.set_field(field);
  if (auto suggestion = detail::suggestion_for(code))
    err.set_suggestion(suggestion);

  std::smatch am;
  if (std::regex_search(raw, am, app_lifecycle_re))
    err.set_app_failure(am[1].str(), am[2].str(), am[3].str());
  return err;
}

inline middleware_error make_connection_error(const std::string &host, int port,
                                              const std::string &cause) {
  middleware_error err(codes::kConnRefused, "Cannot connect to " + host + ":" +
                                                std::to_string(port) + ": " + cause);
  err.set_suggestion("Verify SSH credentials, network connectivity, and that "
                     "the server is running.");
  return err;
}

inline middleware_error make_timeout_error(int64_t job_id,
                                           std::chrono::milliseconds after) {
  middleware_error err(codes::kTimedOut,
                       "Operation timed out after " + detail::format_duration(after));
  err.set_job_id(job_id);
  err.set_suggestion("Increase the timeout or check the server for issues.");
  return err;
}

inline middleware_error make_host_key_error(const std::string &host,
                                            const std::string &expected,
                                            const std::string &actual) {
  middleware_error err(codes::kHostKey, "host key verification failed for " +
                                            host + ": expected " + expected +
                                            ", got " + actual);
  err.set_suggestion("Verify the fingerprint: ssh-keyscan <host> 2>/dev/null | "
                     "ssh-keygen -lf -");
  return err;
}

inline middleware_error make_job_not_found_error(int64_t job_id) {
  middleware_error err(codes::kNotFound,
                       "Job " + std::to_string(job_id) + " not found");
  err.set_job_id(job_id);
  err.set_suggestion("The job may have expired or the ID is incorrect.");
  return err;
}

/// Extracts the actionable error from app_lifecycle.log: the last non-empty
/// literal-"\n" separated segment of the most recent matching entry.
inline std::string parse_app_lifecycle_log(const std::string &content,
                                           const std::string &action,
                                           const std::string &app_name) {
  if (content.empty() || action.empty() || app_name.empty())
    return "";

  std::regex entry_re("Failed '" + detail::regex_escape(action) +
                      "' action for '" + detail::regex_escape(app_name) +
                      "' app: (.+)");
  std::string last;
  bool found = false;
  for (auto it = std::sregex_iterator(content.begin(), content.end(), entry_re);
       it != std::sregex_iterator(); ++it) {
    last = (*it)[1].str();
    found = true;
  }
  if (!found)
    return "";

  std::vector<std::string> parts;
  std::string::size_type start = 0;
  for (;;) {
    auto pos = last.find("\\n", start);
    if (pos == std::string::npos) {
      parts.push_back(last.substr(start));
      break;
    }
    parts.push_back(last.substr(start, pos - start));
    start = pos + 2;
  }
  for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
    auto trimmed = detail::trim(*it);
    if (!trimmed.empty())
      return trimmed;
  }
  return last;
}

/// Reads a remote file; used to fetch app lifecycle logs.
using log_reader =
    std::function<std::string(const context &, const std::string &path)>;

/// Best-effort: a failure to read or parse the log leaves `err` untouched.
inline void enrich_app_lifecycle_error(const context &ctx, middleware_error &err,
                                       const log_reader &read) {
  if (err.log_path().empty() || err.app_name().empty() ||
      err.app_action().empty() || !read)
    return;

  std::string content;
  try {
    content = read(ctx, err.log_path());
  } catch (const std::exception &e) {
    MWCLIENT_LOG_DEBUG("app lifecycle log {} unavailable: {}", err.log_path(),
                       e.what());
    return;
  }

  auto extracted = parse_app_lifecycle_log(content, err.app_action(), err.app_name());
  if (!extracted.empty())
    err.set_app_lifecycle_error(extracted);
}

} // namespace mwclient
