#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <mutex>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace mwclient {

enum class log_level : uint8_t { error = 0, warn = 1, info = 2, debug = 3, trace = 4 };

namespace detail {

inline log_level parse_log_level(const char *text) {
  if (text == nullptr)
    return log_level::info;
  std::string s(text);
  for (auto &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (s == "error")
    return log_level::error;
  if (s == "warn" || s == "warning")
    return log_level::warn;
  if (s == "debug")
    return log_level::debug;
  if (s == "trace")
    return log_level::trace;
  return log_level::info;
}

inline std::atomic<int> &current_level() {
  static std::atomic<int> level{
      static_cast<int>(parse_log_level(std::getenv("MWCLIENT_LOG_LEVEL")))};
  return level;
}

inline std::mutex &log_mutex() {
  static std::mutex mu;
  return mu;
}

inline const char *level_name(log_level level) {
  switch (level) {
  case log_level::error:
    return "ERROR";
  case log_level::warn:
    return "WARN ";
  case log_level::info:
    return "INFO ";
  case log_level::debug:
    return "DEBUG";
  case log_level::trace:
    return "TRACE";
  }
  return "UNKN ";
}

inline void write_line(log_level level, const std::string &message) noexcept {
  try {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;
    std::tm tm{};
    ::localtime_r(&t, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);

    auto line = fmt::format("[{}.{:03d}] [{}] [mwclient] {}\n", stamp,
                            static_cast<int>(ms.count()), level_name(level),
                            message);
    std::lock_guard<std::mutex> lock(log_mutex());
    std::fputs(line.c_str(), stderr);
  } catch (const std::exception &) {
    // logging must never take the caller down
  }
}

} // namespace detail

inline void set_log_level(log_level level) {
  detail::current_level().store(static_cast<int>(level));
}

inline log_level get_log_level() {
  return static_cast<log_level>(detail::current_level().load());
}

inline bool log_enabled(log_level level) {
  return static_cast<int>(level) <= detail::current_level().load();
}

template <typename... Args>
void log(log_level level, fmt::format_string<Args...> format, Args &&...args) {
  if (!log_enabled(level))
    return;
  std::string message;
  try {
    message = fmt::format(format, std::forward<Args>(args)...);
  } catch (const fmt::format_error &) {
    return;
  }
  detail::write_line(level, message);
}

} // namespace mwclient

#define MWCLIENT_LOG_ERROR(...) ::mwclient::log(::mwclient::log_level::error, __VA_ARGS__)
#define MWCLIENT_LOG_WARN(...) ::mwclient::log(::mwclient::log_level::warn, __VA_ARGS__)
#define MWCLIENT_LOG_INFO(...) ::mwclient::log(::mwclient::log_level::info, __VA_ARGS__)
#define MWCLIENT_LOG_DEBUG(...) ::mwclient::log(::mwclient::log_level::debug, __VA_ARGS__)
#define MWCLIENT_LOG_TRACE(...) ::mwclient::log(::mwclient::log_level::trace, __VA_ARGS__)
