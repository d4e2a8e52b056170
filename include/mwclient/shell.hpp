#pragma once

#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"

namespace mwclient {

/// POSIX shell quoting: safe words pass through, anything else is single
/// quoted with embedded quotes written as '"'"'.
inline std::string shell_quote(const std::string &s) {
  if (s.empty())
    return "''";

  bool safe = true;
  for (char c : s) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
              (c >= '0' && c <= '9') || c == '_' || c == '@' || c == '%' ||
              c == '+' || c == '=' || c == ':' || c == ',' || c == '.' ||
              c == '/' || c == '-';
    if (!ok) {
      safe = false;
      break;
    }
  }
  if (safe)
    return s;

  std::string out = "'";
  for (char c : s) {
    if (c == '\'')
      out += "'\"'\"'";
    else
      out.push_back(c);
  }
  out += "'";
  return out;
}

inline bool is_valid_method(const std::string &method) {
  static const std::regex method_re(R"(^[a-z][a-z0-9_.]*$)");
  return std::regex_match(method, method_re);
}

/// Positional arguments for midclt: one per element of an array, none for
/// null, otherwise the value itself.
inline std::vector<std::string> serialize_params(const nlohmann::json &params) {
  std::vector<std::string> args;
  if (params.is_null())
    return args;
  if (params.is_array()) {
    for (const auto &arg : params)
      args.push_back(shell_quote(arg.dump()));
    return args;
  }
  args.push_back(shell_quote(params.dump()));
  return args;
}

/// `sudo midclt call [-j] <method> <arg>...`. Throws std::invalid_argument
/// for a method name that is not a dotted lowercase identifier.
inline std::string build_command(const std::string &method,
                                 const nlohmann::json &params, bool wait_job) {
  if (!is_valid_method(method))
    throw std::invalid_argument("invalid method name: " + shell_quote(method));

  std::string cmd = "sudo midclt call ";
  if (wait_job)
    cmd += "-j ";
  cmd += method;
  for (const auto &arg : serialize_params(params)) {
    cmd += ' ';
    cmd += arg;
  }
  return cmd;
}

/// Removes terminal escape sequences left by midclt progress bars.
inline std::string strip_ansi(const std::string &s) {
  static const std::regex ansi_re("\x1b\\[[0-9;]*[a-zA-Z]|\x1b\\][^\x07]*\x07");
  return std::regex_replace(s, ansi_re, "");
}

/// The job result is the last line that looks like JSON; progress output
/// precedes it.
inline std::string extract_json_line(const std::string &output) {
  auto cleaned = strip_ansi(output);
  std::vector<std::string> lines;
  std::string::size_type start = 0;
  for (;;) {
    auto nl = cleaned.find('\n', start);
    lines.push_back(cleaned.substr(start, nl == std::string::npos
                                              ? std::string::npos
                                              : nl - start));
    if (nl == std::string::npos)
      break;
    start = nl + 1;
  }
  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    auto line = detail::trim(*it);
    if (!line.empty() && (line[0] == '{' || line[0] == '['))
      return line;
  }
  return detail::trim(cleaned);
}

/// midclt prints JSON for structured results and bare text for strings.
inline nlohmann::json parse_output(const std::string &output) {
  auto text = detail::trim(output);
  if (text.empty())
    return nullptr;
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded())
    return text;
  return parsed;
}

} // namespace mwclient
