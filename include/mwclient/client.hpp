#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "context.hpp"
#include "log.hpp"
#include "rate_limited_transport.hpp"
#include "retry.hpp"
#include "socket_transport.hpp"
#include "ssh_session.hpp"
#include "ssh_transport.hpp"
#include "transport.hpp"

namespace mwclient {

enum class auth_method { ssh, websocket };

inline auth_method parse_auth_method(const std::string &s) {
  if (s.empty() || s == "ssh")
    return auth_method::ssh;
  if (s == "websocket")
    return auth_method::websocket;
  throw std::invalid_argument("auth_method must be 'ssh' or 'websocket', got '" +
                              s + "'");
}

inline const char *to_string(auth_method m) {
  return m == auth_method::websocket ? "websocket" : "ssh";
}

/// Websocket block of the client configuration. The host is shared.
struct websocket_options {
  int port = 0;
  std::string username;
  std::string api_key;
  bool insecure_skip_verify = false;
  int max_concurrent = 0;
  std::chrono::seconds connect_timeout{0};
  /// Falls back to client_config::max_retries when unset.
  std::optional<int> max_retries;
};

struct client_config {
  std::string host;
  auth_method method = auth_method::ssh;
  /// Calls per minute; zero or negative means 300.
  int rate_limit = 0;
  int max_retries = -1;
  ssh_config ssh;
  std::optional<websocket_options> websocket;

  void validate() {
    if (host.empty())
      throw std::invalid_argument("host is required");
    if (ssh.private_key.empty())
      throw std::invalid_argument(
          method == auth_method::websocket
              ? "ssh block is required for fallback operations when "
                "auth_method is 'websocket'"
              : "ssh.private_key is required");
    if (method == auth_method::websocket) {
      if (!websocket)
        throw std::invalid_argument(
            "websocket block is required when auth_method is 'websocket'");
      if (websocket->username.empty())
        throw std::invalid_argument(
            "websocket.username is required when auth_method is 'websocket'");
      if (websocket->api_key.empty())
        throw std::invalid_argument(
            "websocket.api_key is required when auth_method is 'websocket'");
    }
    if (rate_limit <= 0)
      rate_limit = token_bucket::kDefaultCallsPerMinute;
    if (max_retries < 0)
      max_retries = rate_limited_transport::kDefaultMaxRetries;
  }
};

namespace detail {

inline std::string read_text_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw std::runtime_error("cannot open " + path);
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

template <typename T>
void read_optional(const nlohmann::json &obj, const char *key, T &out) {
  auto it = obj.find(key);
  if (it != obj.end() && !it->is_null())
    out = it->get<T>();
}

} // namespace detail

/// Parses the JSON configuration document. Throws std::invalid_argument on a
/// malformed document; defaults are applied by validate().
inline client_config parse_client_config(const nlohmann::json &doc) {
  if (!doc.is_object())
    throw std::invalid_argument("configuration must be a JSON object");

  client_config cfg;
  try {
    detail::read_optional(doc, "host", cfg.host);
    std::string method;
    detail::read_optional(doc, "auth_method", method);
    cfg.method = parse_auth_method(method);
    detail::read_optional(doc, "rate_limit", cfg.rate_limit);
    detail::read_optional(doc, "max_retries", cfg.max_retries);

    cfg.ssh.host = cfg.host;
    if (doc.contains("ssh") && doc["ssh"].is_object()) {
      const auto &s = doc["ssh"];
      detail::read_optional(s, "port", cfg.ssh.port);
      detail::read_optional(s, "user", cfg.ssh.user);
      detail::read_optional(s, "private_key", cfg.ssh.private_key);
      std::string key_file;
      detail::read_optional(s, "private_key_file", key_file);
      if (cfg.ssh.private_key.empty() && !key_file.empty())
        cfg.ssh.private_key = detail::read_text_file(key_file);
      detail::read_optional(s, "host_key_fingerprint", cfg.ssh.host_key_fingerprint);
      detail::read_optional(s, "max_sessions", cfg.ssh.max_sessions);
    }

    if (doc.contains("websocket") && doc["websocket"].is_object()) {
      const auto &w = doc["websocket"];
      websocket_options ws;
      detail::read_optional(w, "port", ws.port);
      detail::read_optional(w, "username", ws.username);
      detail::read_optional(w, "api_key", ws.api_key);
      detail::read_optional(w, "insecure_skip_verify", ws.insecure_skip_verify);
      detail::read_optional(w, "max_concurrent", ws.max_concurrent);
      int timeout = 0;
      detail::read_optional(w, "connect_timeout", timeout);
      ws.connect_timeout = std::chrono::seconds(timeout);
      if (w.contains("max_retries") && !w["max_retries"].is_null())
        ws.max_retries = w["max_retries"].get<int>();
      cfg.websocket = ws;
    }
  } catch (const nlohmann::json::exception &e) {
    throw std::invalid_argument(std::string("invalid configuration: ") + e.what());
  }
  return cfg;
}

inline client_config load_client_config(const std::string &path) {
  auto doc = nlohmann::json::parse(detail::read_text_file(path), nullptr, false);
  if (doc.is_discarded())
    throw std::invalid_argument(path + ": not valid JSON");
  return parse_client_config(doc);
}

/// Connection factories; tests swap in doubles.
struct client_factory {
  std::shared_ptr<ssh_connector> ssh = std::make_shared<libssh2_connector>();
  /// Null selects the TLS websocket dialer.
  std::shared_ptr<socket_dialer> socket;
};

/// Builds, connects and wraps the transport `config` describes.
inline std::shared_ptr<transport> make_client(client_config config,
                                              const context &ctx,
                                              const client_factory &factory = {}) {
  config.validate();
  config.ssh.host = config.host;

  auto shell = std::make_shared<ssh_transport>(config.ssh, factory.ssh);
  shell->connect(ctx);

  if (config.method == auth_method::ssh) {
    return std::make_shared<rate_limited_transport>(
        shell, config.rate_limit, config.max_retries,
        std::make_shared<ssh_retry_classifier>());
  }

  auto detected = shell->version();
  if (!detected.at_least(25, 0))
    throw middleware_error(codes::kNotSupported,
                           "WebSocket transport requires TrueNAS 25.0 or later. "
                           "Detected version " +
                               detected.raw + ". Use auth_method = \"ssh\" instead.");

  const auto &ws = *config.websocket;
  socket_config sc;
  sc.host = config.host;
  sc.port = ws.port;
  sc.username = ws.username;
  sc.api_key = ws.api_key;
  sc.insecure_skip_verify = ws.insecure_skip_verify;
  sc.max_concurrent = ws.max_concurrent;
  sc.connect_timeout = ws.connect_timeout;
  sc.max_retries = ws.max_retries.value_or(config.max_retries);
  sc.fallback = shell;

  auto socket = std::make_shared<socket_transport>(std::move(sc), factory.socket);
  socket->connect(ctx);
  MWCLIENT_LOG_INFO("using websocket transport to {} ({})", config.host,
                    detected.raw);

  return std::make_shared<rate_limited_transport>(
      socket, config.rate_limit, socket->config().max_retries,
      std::make_shared<socket_retry_classifier>());
}

} // namespace mwclient
