#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <libssh2.h>
#include <openssl/evp.h>
#include <poll.h>

#include "context.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "net.hpp"

namespace mwclient {

/// Output of one remote command. stdout and stderr are combined.
struct exec_result {
  std::string output;
  int exit_status = 0;
};

/// Where and how to open a secure-shell session.
struct ssh_credentials {
  std::string host;
  int port = 22;
  std::string user = "root";
  std::string private_key;
  /// "SHA256:<base64>", as printed by ssh-keygen -lf.
  std::string host_key_fingerprint;
  std::chrono::milliseconds connect_timeout{30000};
};

/// An authenticated session able to run commands concurrently.
class ssh_session {
public:
  virtual ~ssh_session() = default;
  virtual exec_result exec(const context &ctx, const std::string &command) = 0;
  /// Commands still running on other threads fail with transport_error.
  virtual void close() = 0;
};

class ssh_connector {
public:
  virtual ~ssh_connector() = default;

  /// Throws middleware_error EHOSTKEY on fingerprint mismatch and
  /// transport_error for any other connection failure.
  virtual std::unique_ptr<ssh_session> connect(const context &ctx,
                                               const ssh_credentials &creds) = 0;
};

namespace detail {

inline void libssh2_global_init() {
  static std::once_flag once;
  std::call_once(once, []() {
    if (libssh2_init(0) != 0)
      throw transport_error("libssh2 initialisation failed");
  });
}

/// OpenSSH-style fingerprint: "SHA256:" + unpadded base64.
inline std::string sha256_fingerprint(const unsigned char *digest) {
  unsigned char encoded[64] = {};
  int n = EVP_EncodeBlock(encoded, digest, 32);
  std::string b64(reinterpret_cast<const char *>(encoded),
                  static_cast<std::size_t>(n > 0 ? n : 0));
  while (!b64.empty() && b64.back() == '=')
    b64.pop_back();
  return "SHA256:" + b64;
}

inline std::string normalize_fingerprint(std::string fp) {
  fp = trim(fp);
  if (fp.rfind("SHA256:", 0) != 0)
    fp = "SHA256:" + fp;
  while (!fp.empty() && fp.back() == '=')
    fp.pop_back();
  return fp;
}

} // namespace detail

/// libssh2 session over a non-blocking socket. Every libssh2 call happens
/// under a short io_mu_ hold so concurrent channels interleave; waiting for
/// the socket happens outside the lock.
class libssh2_session : public ssh_session {
public:
  libssh2_session(LIBSSH2_SESSION *session, unique_fd fd, std::string host)
      : session_(session), fd_(std::move(fd)), host_(std::move(host)) {
    libssh2_session_set_blocking(session_, 0);
  }

  ~libssh2_session() override { close(); }

  libssh2_session(const libssh2_session &) = delete;
  libssh2_session &operator=(const libssh2_session &) = delete;

  /// Handshake, host key verification, public key authentication.
  void establish(const context &ctx, const ssh_credentials &creds) {
    int rc = retry_io(ctx, [this]() {
      return libssh2_session_handshake(session_, fd_.get());
    });
    if (rc != 0)
      throw transport_error("ssh: failed connection handshake: " + last_error());

    std::string actual = "unavailable";
    {
      std::lock_guard<std::mutex> lock(io_mu_);
      const char *hash =
          libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256);
      if (hash != nullptr)
        actual = detail::sha256_fingerprint(
            reinterpret_cast<const unsigned char *>(hash));
    }
    auto expected = detail::normalize_fingerprint(creds.host_key_fingerprint);
    if (actual != expected)
      throw make_host_key_error(host_, expected, actual);

    rc = retry_io(ctx, [this, &creds]() {
      return libssh2_userauth_publickey_frommemory(
          session_, creds.user.c_str(), creds.user.size(), nullptr, 0,
          creds.private_key.c_str(), creds.private_key.size(), nullptr);
    });
    if (rc != 0)
      throw transport_error("ssh: unable to authenticate as " + creds.user +
                            ": " + last_error());
  }

  exec_result exec(const context &ctx, const std::string &command) override {
    LIBSSH2_CHANNEL *raw = open_channel(ctx);
    channel_guard guard(*this, raw);

    int rc = retry_io(ctx, [raw, &command]() {
      return libssh2_channel_exec(raw, command.c_str());
    });
    if (rc != 0)
      throw transport_error("ssh: exec failed: " + last_error());

    exec_result result;
    char buf[16384];
    for (;;) {
      ssize_t n_out = 0;
      ssize_t n_err = 0;
      int eof = 0;
      int dirs = 0;
      {
        std::lock_guard<std::mutex> lock(io_mu_);
        if (session_ == nullptr)
          throw transport_error("ssh: session closed");
        n_out = libssh2_channel_read(raw, buf, sizeof(buf));
        if (n_out > 0)
          result.output.append(buf, static_cast<std::size_t>(n_out));
        n_err = libssh2_channel_read_stderr(raw, buf, sizeof(buf));
        if (n_err > 0)
          result.output.append(buf, static_cast<std::size_t>(n_err));
        eof = libssh2_channel_eof(raw);
        dirs = libssh2_session_block_directions(session_);
      }
      if ((n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) ||
          (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN))
        throw transport_error("ssh: unexpected closure of remote connection: " +
                              last_error());
      if (n_out > 0 || n_err > 0)
        continue;
      if (eof)
        break;
      wait_socket(ctx, dirs);
    }

    rc = retry_io(ctx, [raw]() { return libssh2_channel_close(raw); });
    if (rc == 0)
      rc = retry_io(ctx, [raw]() { return libssh2_channel_wait_closed(raw); });
    if (rc != 0)
      throw transport_error("ssh: unexpected closure of remote connection: " +
                            last_error());
    {
      std::lock_guard<std::mutex> lock(io_mu_);
      if (session_ == nullptr)
        throw transport_error("ssh: session closed");
      result.exit_status = libssh2_channel_get_exit_status(raw);
    }
    return result;
  }

  void close() override {
    std::lock_guard<std::mutex> lock(io_mu_);
    if (session_ == nullptr)
      return;
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_disconnect(session_, "closing");
    libssh2_session_free(session_);
    session_ = nullptr;
    fd_.reset();
  }

private:
  /// Frees a channel on every exit path.
  class channel_guard {
  public:
    channel_guard(libssh2_session &owner, LIBSSH2_CHANNEL *channel)
        : owner_(owner), channel_(channel) {}
    ~channel_guard() {
      std::lock_guard<std::mutex> lock(owner_.io_mu_);
      if (owner_.session_ == nullptr)
        return;
      for (int i = 0; i < 50; ++i) {
        if (libssh2_channel_free(channel_) != LIBSSH2_ERROR_EAGAIN)
          return;
      }
      MWCLIENT_LOG_WARN("ssh: channel on {} not freed cleanly", owner_.host_);
    }
    channel_guard(const channel_guard &) = delete;
    channel_guard &operator=(const channel_guard &) = delete;

  private:
    libssh2_session &owner_;
    LIBSSH2_CHANNEL *channel_;
  };

  template <typename Op> int retry_io(const context &ctx, Op op) {
    for (;;) {
      int rc = 0;
      int dirs = 0;
      {
        std::lock_guard<std::mutex> lock(io_mu_);
        if (session_ == nullptr)
          throw transport_error("ssh: session closed");
        rc = op();
        if (rc != LIBSSH2_ERROR_EAGAIN)
          return rc;
        dirs = libssh2_session_block_directions(session_);
      }
      wait_socket(ctx, dirs);
    }
  }

  LIBSSH2_CHANNEL *open_channel(const context &ctx) {
    for (;;) {
      int dirs = 0;
      {
        std::lock_guard<std::mutex> lock(io_mu_);
        if (session_ == nullptr)
          throw transport_error("ssh: session closed");
        LIBSSH2_CHANNEL *ch = libssh2_channel_open_session(session_);
        if (ch != nullptr)
          return ch;
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN)
          throw transport_error("ssh: unable to open session channel: " +
                                last_error_locked());
        dirs = libssh2_session_block_directions(session_);
      }
      wait_socket(ctx, dirs);
    }
  }

  void wait_socket(const context &ctx, int dirs) {
    short events = 0;
    if (dirs & LIBSSH2_SESSION_BLOCK_INBOUND)
      events |= POLLIN;
    if (dirs & LIBSSH2_SESSION_BLOCK_OUTBOUND)
      events |= POLLOUT;
    if (events == 0)
      events = POLLIN;
    // One slice; the caller loops and re-checks.
    detail::wait_fd(ctx, fd_.get(), events,
                    context::clock::now() + std::chrono::milliseconds(50));
  }

  std::string last_error() {
    std::lock_guard<std::mutex> lock(io_mu_);
    return last_error_locked();
  }

  std::string last_error_locked() {
    if (session_ == nullptr)
      return "session closed";
    char *msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return msg != nullptr ? std::string(msg, static_cast<std::size_t>(len))
                          : "unknown error";
  }

  std::mutex io_mu_;
  LIBSSH2_SESSION *session_;
  unique_fd fd_;
  std::string host_;
};

/// Opens real sessions with libssh2.
class libssh2_connector : public ssh_connector {
public:
  std::unique_ptr<ssh_session> connect(const context &ctx,
                                       const ssh_credentials &creds) override {
    detail::libssh2_global_init();
    MWCLIENT_LOG_DEBUG("ssh: dialing {}@{}:{}", creds.user, creds.host,
                       creds.port);
    auto fd = dial_tcp(ctx, creds.host, creds.port, creds.connect_timeout);

    LIBSSH2_SESSION *raw = libssh2_session_init();
    if (raw == nullptr)
      throw transport_error("ssh: unable to allocate session");
    auto session = std::make_unique<libssh2_session>(raw, std::move(fd), creds.host);
    session->establish(ctx, creds);
    MWCLIENT_LOG_INFO("ssh: connected to {}:{}", creds.host, creds.port);
    return session;
  }
};

} // namespace mwclient
