#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "context.hpp"
#include "errors.hpp"
#include "job.hpp"
#include "job_poller.hpp"
#include "log.hpp"
#include "shell.hpp"
#include "ssh_session.hpp"
#include "sync.hpp"
#include "transport.hpp"
#include "version.hpp"

namespace mwclient {

struct ssh_config {
  std::string host;
  int port = 0;
  std::string user;
  std::string private_key;
  std::string host_key_fingerprint;
  /// Concurrent remote commands.
  int max_sessions = 0;
  std::chrono::milliseconds connect_timeout{0};
  /// Upper bound for poll-based job waits on servers without `midclt -j`.
  std::chrono::milliseconds job_timeout{0};
  job_poller_config poller;

  /// Fills defaults. Throws std::invalid_argument for a missing field.
  void validate() {
    if (host.empty())
      throw std::invalid_argument("host is required");
    if (private_key.empty())
      throw std::invalid_argument("private_key is required");
    if (host_key_fingerprint.empty())
      throw std::invalid_argument("host_key_fingerprint is required");
    if (port <= 0)
      port = 22;
    if (user.empty())
      user = "root";
    if (max_sessions <= 0)
      max_sessions = 10;
    if (connect_timeout.count() <= 0)
      connect_timeout = std::chrono::seconds(30);
    if (job_timeout.count() <= 0)
      job_timeout = std::chrono::minutes(30);
  }
};

/// Runs `sudo midclt call` over a secure-shell session per operation.
class ssh_transport : public transport {
public:
  explicit ssh_transport(ssh_config config,
                         std::shared_ptr<ssh_connector> connector =
                             std::make_shared<libssh2_connector>())
      : config_(validated(std::move(config))),
        connector_(std::move(connector)), sessions_(config_.max_sessions),
        poller_(
            [this](const context &ctx, const std::string &method,
                   const json &params) { return call(ctx, method, params); },
            config_.poller) {
    if (!connector_)
      throw std::invalid_argument("ssh connector is required");
  }

  ~ssh_transport() override { close(); }

  ssh_transport(const ssh_transport &) = delete;
  ssh_transport &operator=(const ssh_transport &) = delete;

  void connect(const context &ctx) override {
    auto raw = call(ctx, "system.version", nullptr);
    if (!raw.is_string())
      throw std::runtime_error("system.version returned " + raw.dump());
    auto parsed = parse_version(raw.get<std::string>());
    {
      std::lock_guard<std::mutex> lock(mu_);
      version_ = parsed;
    }
    MWCLIENT_LOG_INFO("ssh: {} runs {}", config_.host, parsed.raw);
  }

  server_version version() const override {
    std::lock_guard<std::mutex> lock(mu_);
    if (!version_)
      throw std::logic_error("version() called before connect()");
    return *version_;
  }

  json call(const context &ctx, const std::string &method,
            const json &params) override {
    auto cmd = build_command(method, params, false);
    return parse_output(run(ctx, cmd));
  }

  json call_and_wait(const context &ctx, const std::string &method,
                     const json &params) override {
    if (supports_job_wait(ctx)) {
      auto cmd = build_command(method, params, true);
      return parse_output(extract_json_line(run(ctx, cmd)));
    }

    auto result = call(ctx, method, params);
    if (auto job_id = parse_job_id(result))
      return poller_.wait(ctx, *job_id, config_.job_timeout);
    return result;
  }

  void write_file(const context &ctx, const std::string &path,
                  const write_file_params &params) override {
    auto b64 = detail::base64_encode(params.content);
    call(ctx, "filesystem.file_receive",
         detail::file_receive_params(path, b64, params));
  }

  std::string read_file(const context &ctx, const std::string &path) override {
    return run(ctx, "sudo cat " + shell_quote(path));
  }

  void delete_file(const context &ctx, const std::string &path) override {
    run(ctx, "sudo rm " + shell_quote(path));
  }

  bool file_exists(const context &ctx, const std::string &path) override {
    try {
      call(ctx, "filesystem.stat", path);
      return true;
    } catch (const middleware_error &e) {
      if (e.code() == codes::kNotFound)
        return false;
      throw;
    }
  }

  void mkdir_all(const context &ctx, const std::string &path, int mode) override {
    try {
      call(ctx, "filesystem.mkdir", detail::mkdir_params(path, mode));
    } catch (const middleware_error &e) {
      if (e.code() != codes::kExists)
        throw;
    }
  }

  void remove_dir(const context &ctx, const std::string &path) override {
    run(ctx, "sudo rmdir " + shell_quote(path));
  }

  void remove_all(const context &ctx, const std::string &path) override {
    run(ctx, "sudo rm -rf " + shell_quote(path));
  }

  void chown(const context &ctx, const std::string &path, int uid,
             int gid) override {
    call_and_wait(ctx, "filesystem.chown", detail::chown_params(path, uid, gid));
  }

  void chmod_recursive(const context &ctx, const std::string &path,
                       int mode) override {
    call_and_wait(ctx, "filesystem.setperm", detail::setperm_params(path, mode));
  }

  /// Releases the shared session. Commands still running keep it alive;
  /// the last of them closes it.
  void close() override {
    std::shared_ptr<ssh_session> session;
    {
      std::lock_guard<std::mutex> lock(connect_mu_);
      session.swap(session_);
    }
    // dropped here, outside connect_mu_
  }

  const ssh_config &config() const { return config_; }

private:
  static ssh_config validated(ssh_config config) {
    config.validate();
    return config;
  }

  ssh_credentials credentials() const {
    ssh_credentials creds;
    creds.host = config_.host;
    creds.port = config_.port;
    creds.user = config_.user;
    creds.private_key = config_.private_key;
    creds.host_key_fingerprint = config_.host_key_fingerprint;
    creds.connect_timeout = config_.connect_timeout;
    return creds;
  }

  std::shared_ptr<ssh_session> ensure_session(const context &ctx) {
    std::lock_guard<std::mutex> lock(connect_mu_);
    if (session_)
      return session_;
    try {
      session_ = connector_->connect(ctx, credentials());
    } catch (const transport_error &e) {
      throw make_connection_error(config_.host, config_.port, e.what());
    }
    return session_;
  }

  // Other commands may still be reading from `broken`, so it is only
  // unpublished here and freed with its last holder.
  void drop_session(const std::shared_ptr<ssh_session> &broken) {
    std::lock_guard<std::mutex> lock(connect_mu_);
    if (session_ == broken)
      session_.reset();
  }

  /// -j needs midclt from 25.0 on; older servers are polled.
  bool supports_job_wait(const context &ctx) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (version_)
        return version_->at_least(25, 0);
    }
    connect(ctx);
    return version().at_least(25, 0);
  }

  /// Executes one command under a session permit. A non-zero exit becomes
  /// a parsed middleware_error.
  std::string run(const context &ctx, const std::string &cmd) {
    session_permit permit(sessions_, ctx);
    auto session = ensure_session(ctx);
    MWCLIENT_LOG_DEBUG("ssh: {}", cmd);

    exec_result res;
    try {
      res = session->exec(ctx, cmd);
    } catch (const transport_error &) {
      drop_session(session);
      throw;
    }

    if (res.exit_status != 0) {
      auto output = detail::trim(strip_ansi(res.output));
      auto err = parse_error("Process exited with status " +
                             std::to_string(res.exit_status) + ": " + output);
      if (err.code() == codes::kUnknown &&
          output.find("No such file or directory") != std::string::npos) {
        middleware_error not_found(codes::kNotFound, err.message());
        not_found.set_suggestion(detail::suggestion_for(codes::kNotFound));
        throw not_found;
      }
      throw err;
    }
    return res.output;
  }

  ssh_config config_;
  std::shared_ptr<ssh_connector> connector_;
  session_semaphore sessions_;
  job_poller poller_;

  std::mutex connect_mu_;
  std::shared_ptr<ssh_session> session_;

  mutable std::mutex mu_;
  std::optional<server_version> version_;
};

} // namespace mwclient
