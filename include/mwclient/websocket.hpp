#pragma once

#include <array>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/ssl.h>
#include <poll.h>
#include <sys/socket.h>

#include "context.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "net.hpp"
#include "transport.hpp"

namespace mwclient {

enum class frame_kind { text, pong, closed };

/// A message-oriented duplex connection. send_* may be called from one
/// thread while another blocks in read().
class message_stream {
public:
  virtual ~message_stream() = default;

  /// False once the connection is unusable.
  virtual bool send_text(const std::string &payload) = 0;
  virtual bool send_ping() = 0;

  /// Blocks until a text message or a pong arrives; `closed` when the peer
  /// goes away or shutdown() is called.
  virtual frame_kind read(std::string &out) = 0;

  /// Unblocks a pending read(). Idempotent.
  virtual void shutdown() = 0;
};

class socket_dialer {
public:
  virtual ~socket_dialer() = default;

  /// Throws transport_error when the connection cannot be opened.
  virtual std::unique_ptr<message_stream> dial(const context &ctx,
                                               const std::string &url) = 0;
};

namespace detail {

inline std::string openssl_error() {
  unsigned long code = ERR_get_error();
  if (code == 0)
    return "unknown TLS error";
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return buf;
}

/// Sec-WebSocket-Accept for a given key.
inline std::string websocket_accept(const std::string &key) {
  static const char *const guid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
  std::string input = key + guid;
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_Digest(input.data(), input.size(), digest, &len, EVP_sha1(),
                 nullptr) != 1)
    throw transport_error("websocket: sha1 failed");
  return base64_encode(std::string(reinterpret_cast<char *>(digest), len));
}

struct ssl_ctx_deleter {
  void operator()(SSL_CTX *ctx) const { SSL_CTX_free(ctx); }
};
struct ssl_deleter {
  void operator()(SSL *ssl) const { SSL_free(ssl); }
};

} // namespace detail

/// RFC 6455 client over a non-blocking TCP socket, optionally wrapped in
/// OpenSSL. Frames are masked; fragmented text messages are reassembled and
/// pings are answered.
class websocket_stream : public message_stream {
public:
  static constexpr std::size_t kMaxMessage = 64u << 20;

  websocket_stream(unique_fd fd, std::chrono::milliseconds io_timeout)
      : fd_(std::move(fd)), io_timeout_(io_timeout) {}

  ~websocket_stream() override { shutdown(); }

  websocket_stream(const websocket_stream &) = delete;
  websocket_stream &operator=(const websocket_stream &) = delete;

  void start_tls(const context &ctx, const std::string &host, bool verify,
                 context::clock::time_point until) {
    tls_ctx_.reset(SSL_CTX_new(TLS_client_method()));
    if (!tls_ctx_)
      throw transport_error("tls: " + detail::openssl_error());
    SSL_CTX_set_min_proto_version(tls_ctx_.get(), TLS1_2_VERSION);
    SSL_CTX_set_mode(tls_ctx_.get(), SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
    if (verify) {
      if (SSL_CTX_set_default_verify_paths(tls_ctx_.get()) != 1)
        throw transport_error("tls: " + detail::openssl_error());
      SSL_CTX_set_verify(tls_ctx_.get(), SSL_VERIFY_PEER, nullptr);
    } else {
      SSL_CTX_set_verify(tls_ctx_.get(), SSL_VERIFY_NONE, nullptr);
    }

    ssl_.reset(SSL_new(tls_ctx_.get()));
    if (!ssl_)
      throw transport_error("tls: " + detail::openssl_error());
    SSL_set_fd(ssl_.get(), fd_.get());
    SSL_set_tlsext_host_name(ssl_.get(), host.c_str());
    if (verify && SSL_set1_host(ssl_.get(), host.c_str()) != 1)
      throw transport_error("tls: " + detail::openssl_error());

    for (;;) {
      ERR_clear_error();
      int rc = SSL_connect(ssl_.get());
      if (rc == 1)
        return;
      int err = SSL_get_error(ssl_.get(), rc);
      short events = 0;
      if (err == SSL_ERROR_WANT_READ)
        events = POLLIN;
      else if (err == SSL_ERROR_WANT_WRITE)
        events = POLLOUT;
      else
        throw transport_error("tls: handshake with " + host +
                              " failed: " + detail::openssl_error());
      if (!detail::wait_fd(ctx, fd_.get(), events, until))
        throw transport_error("tls: handshake with " + host + ": i/o timeout");
    }
  }

  /// HTTP Upgrade request; the response must be 101 with a matching
  /// Sec-WebSocket-Accept.
  void upgrade(const context &ctx, const parsed_uri &uri,
               context::clock::time_point until) {
    unsigned char nonce[16];
    if (RAND_bytes(nonce, sizeof(nonce)) != 1)
      throw transport_error("websocket: " + detail::openssl_error());
    auto key = detail::base64_encode(
        std::string(reinterpret_cast<const char *>(nonce), sizeof(nonce)));

    std::ostringstream req;
    req << "GET " << (uri.path.empty() ? "/" : uri.path) << " HTTP/1.1\r\n";
    req << "Host: " << uri.host << ":" << uri.port << "\r\n";
    req << "Upgrade: websocket\r\n";
    req << "Connection: Upgrade\r\n";
    req << "Sec-WebSocket-Key: " << key << "\r\n";
    req << "Sec-WebSocket-Version: 13\r\n\r\n";

    auto req_str = req.str();
    if (!write_all(req_str.data(), req_str.size(), until, &ctx))
      throw transport_error("websocket: failed to send upgrade request");

    std::string headers;
    headers.reserve(1024);
    char ch = 0;
    while (headers.find("\r\n\r\n") == std::string::npos) {
      if (!read_exact(&ch, 1, until, &ctx))
        throw transport_error("websocket: connection closed during handshake");
      headers.push_back(ch);
      if (headers.size() > 16384)
        throw transport_error("websocket: handshake too large");
    }

    std::string lower = headers;
    for (auto &c : lower)
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    auto status_end = headers.find("\r\n");
    if (lower.find(" 101 ") == std::string::npos ||
        lower.find(" 101 ") > status_end)
      throw transport_error("websocket: bad handshake: " +
                            headers.substr(0, status_end));

    auto accept = detail::websocket_accept(key);
    std::string needle = "sec-websocket-accept:";
    auto pos = lower.find(needle);
    if (pos == std::string::npos)
      throw transport_error("websocket: bad handshake: missing accept header");
    auto value_end = headers.find("\r\n", pos);
    auto value = detail::trim(
        headers.substr(pos + needle.size(), value_end - pos - needle.size()));
    if (value != accept)
      throw transport_error("websocket: bad handshake: accept mismatch");
  }

  bool send_text(const std::string &payload) override {
    return send_frame(0x1, payload);
  }

  bool send_ping() override { return send_frame(0x9, std::string()); }

  frame_kind read(std::string &out) override {
    out.clear();
    std::string fragmented;
    bool reading_fragment = false;

    for (;;) {
      uint8_t header[2];
      if (!read_frame_bytes(header, 2))
        return frame_kind::closed;

      bool fin = (header[0] & 0x80) != 0;
      uint8_t opcode = static_cast<uint8_t>(header[0] & 0x0F);
      bool masked = (header[1] & 0x80) != 0;
      uint64_t len = static_cast<uint64_t>(header[1] & 0x7F);

      if (len == 126) {
        uint8_t ext[2];
        if (!read_frame_bytes(ext, 2))
          return frame_kind::closed;
        len = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
      } else if (len == 127) {
        uint8_t ext[8];
        if (!read_frame_bytes(ext, 8))
          return frame_kind::closed;
        len = 0;
        for (int i = 0; i < 8; ++i)
          len = (len << 8) | ext[i];
      }
      if (len > kMaxMessage || fragmented.size() + len > kMaxMessage) {
        MWCLIENT_LOG_WARN("websocket: message exceeds {} bytes", kMaxMessage);
        return frame_kind::closed;
      }

      std::array<uint8_t, 4> mask{};
      if (masked && !read_frame_bytes(mask.data(), mask.size()))
        return frame_kind::closed;

      std::string payload(static_cast<std::size_t>(len), '\0');
      if (len > 0 && !read_frame_bytes(&payload[0], payload.size()))
        return frame_kind::closed;
      if (masked) {
        for (std::size_t i = 0; i < payload.size(); ++i)
          payload[i] = static_cast<char>(payload[i] ^ mask[i % 4]);
      }

      switch (opcode) {
      case 0x8: // close
        (void)send_frame(0x8, payload.substr(0, 2));
        return frame_kind::closed;
      case 0x9: // ping
        if (!send_frame(0xA, payload))
          return frame_kind::closed;
        continue;
      case 0xA: // pong
        return frame_kind::pong;
      case 0x0: // continuation
      case 0x1: // text
      case 0x2: // binary
        if (opcode != 0x0 && !reading_fragment)
          fragmented.clear();
        fragmented.append(payload);
        reading_fragment = !fin;
        if (fin) {
          out.swap(fragmented);
          return frame_kind::text;
        }
        continue;
      default:
        continue;
      }
    }
  }

  void shutdown() override {
    if (closed_.exchange(true))
      return;
    ::shutdown(fd_.get(), SHUT_RDWR);
  }

private:
  bool send_frame(uint8_t opcode, const std::string &payload) {
    if (closed_.load())
      return false;

    std::vector<uint8_t> frame;
    frame.reserve(payload.size() + 16);
    frame.push_back(static_cast<uint8_t>(0x80 | (opcode & 0x0F)));

    uint64_t len = payload.size();
    if (len < 126) {
      frame.push_back(static_cast<uint8_t>(0x80 | len));
    } else if (len <= 0xFFFF) {
      frame.push_back(static_cast<uint8_t>(0x80 | 126));
      frame.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
      frame.push_back(static_cast<uint8_t>(len & 0xFF));
    } else {
      frame.push_back(static_cast<uint8_t>(0x80 | 127));
      for (int i = 7; i >= 0; --i)
        frame.push_back(static_cast<uint8_t>((len >> (i * 8)) & 0xFF));
    }

    std::array<uint8_t, 4> mask{};
    if (RAND_bytes(mask.data(), static_cast<int>(mask.size())) != 1)
      return false;
    frame.insert(frame.end(), mask.begin(), mask.end());
    for (std::size_t i = 0; i < payload.size(); ++i)
      frame.push_back(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]);

    std::lock_guard<std::mutex> lock(write_mu_);
    return write_all(frame.data(), frame.size(),
                     context::clock::now() + io_timeout_, nullptr);
  }

  bool read_frame_bytes(void *data, std::size_t size) {
    return read_exact(data, size, context::clock::time_point::max(), nullptr);
  }

  bool read_exact(void *data, std::size_t size, context::clock::time_point until,
                  const context *ctx) {
    auto *ptr = static_cast<char *>(data);
    std::size_t got = 0;
    while (got < size) {
      long n = read_some(ptr + got, size - got, until, ctx);
      if (n <= 0)
        return false;
      got += static_cast<std::size_t>(n);
    }
    return true;
  }

  /// Bytes read, or <= 0 on close, error, timeout.
  long read_some(char *buf, std::size_t len, context::clock::time_point until,
                 const context *ctx) {
    for (;;) {
      if (closed_.load())
        return -1;
      short events = POLLIN;
      if (ssl_) {
        std::lock_guard<std::mutex> lock(ssl_mu_);
        ERR_clear_error();
        int n = SSL_read(ssl_.get(), buf, static_cast<int>(len));
        if (n > 0)
          return n;
        int err = SSL_get_error(ssl_.get(), n);
        if (err == SSL_ERROR_WANT_WRITE)
          events = POLLOUT;
        else if (err != SSL_ERROR_WANT_READ)
          return 0;
      } else {
        ssize_t n = ::recv(fd_.get(), buf, len, 0);
        if (n >= 0)
          return static_cast<long>(n);
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
          return -1;
      }
      if (!wait(events, until, ctx))
        return -1;
    }
  }

  bool write_all(const void *data, std::size_t size,
                 context::clock::time_point until, const context *ctx) {
    const auto *ptr = static_cast<const char *>(data);
    std::size_t sent = 0;
    while (sent < size) {
      if (closed_.load())
        return false;
      short events = POLLOUT;
      if (ssl_) {
        std::lock_guard<std::mutex> lock(ssl_mu_);
        ERR_clear_error();
        int n = SSL_write(ssl_.get(), ptr + sent, static_cast<int>(size - sent));
        if (n > 0) {
          sent += static_cast<std::size_t>(n);
          continue;
        }
        int err = SSL_get_error(ssl_.get(), n);
        if (err == SSL_ERROR_WANT_READ)
          events = POLLIN;
        else if (err != SSL_ERROR_WANT_WRITE)
          return false;
      } else {
        ssize_t n = ::send(fd_.get(), ptr + sent, size - sent, MSG_NOSIGNAL);
        if (n > 0) {
          sent += static_cast<std::size_t>(n);
          continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
          return false;
      }
      if (!wait(events, until, ctx))
        return false;
    }
    return true;
  }

  /// One bounded poll; false when `until` passed or the stream closed.
  bool wait(short events, context::clock::time_point until, const context *ctx) {
    if (ctx != nullptr)
      ctx->check();
    if (closed_.load() || context::clock::now() >= until)
      return false;
    {
      std::lock_guard<std::mutex> lock(ssl_mu_);
      if (ssl_ && (events & POLLIN) && SSL_pending(ssl_.get()) > 0)
        return true;
    }
    pollfd pfd{};
    pfd.fd = fd_.get();
    pfd.events = events;
    int rc = ::poll(&pfd, 1, 100);
    return rc >= 0 || errno == EINTR;
  }

  unique_fd fd_;
  std::chrono::milliseconds io_timeout_;
  std::atomic<bool> closed_{false};
  std::mutex write_mu_;
  std::mutex ssl_mu_;
  std::unique_ptr<SSL_CTX, detail::ssl_ctx_deleter> tls_ctx_;
  std::unique_ptr<SSL, detail::ssl_deleter> ssl_;
};

/// Dials ws:// and wss:// URLs.
class websocket_dialer : public socket_dialer {
public:
  websocket_dialer(std::chrono::milliseconds connect_timeout,
                   bool insecure_skip_verify)
      : connect_timeout_(connect_timeout),
        insecure_skip_verify_(insecure_skip_verify) {}

  std::unique_ptr<message_stream> dial(const context &ctx,
                                       const std::string &url) override {
    parsed_uri uri;
    try {
      uri = parse_uri(url);
    } catch (const std::invalid_argument &e) {
      throw transport_error(e.what());
    }

    auto until = context::clock::now() + connect_timeout_;
    MWCLIENT_LOG_DEBUG("websocket: dialing {}", url);
    auto fd = dial_tcp(ctx, uri.host, uri.port, connect_timeout_);
    auto stream = std::make_unique<websocket_stream>(std::move(fd), connect_timeout_);
    if (uri.secure)
      stream->start_tls(ctx, uri.host, !insecure_skip_verify_, until);
    stream->upgrade(ctx, uri, until);
    return stream;
  }

private:
  std::chrono::milliseconds connect_timeout_;
  bool insecure_skip_verify_;
};

} // namespace mwclient
