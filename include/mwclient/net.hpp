#pragma once

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <tuple>
#include <unistd.h>
#include <utility>

#include "context.hpp"
#include "errors.hpp"

namespace mwclient {

/// Parsed ws:// or wss:// URL.
struct parsed_uri {
  std::string raw;
  std::string scheme;
  std::string host;
  int port = 0;
  std::string path;
  bool secure = false;
};

inline std::tuple<std::string, int> split_host_port(const std::string &addr,
                                                     int default_port) {
  if (addr.empty())
    throw std::invalid_argument("host is required");

  // [v6]:port
  if (addr.front() == '[') {
    auto close = addr.find(']');
    if (close == std::string::npos)
      throw std::invalid_argument("invalid address: " + addr);
    std::string host = addr.substr(1, close - 1);
    if (close + 1 < addr.size() && addr[close + 1] == ':')
      return {host, std::stoi(addr.substr(close + 2))};
    return {host, default_port};
  }

  auto pos = addr.rfind(':');
  if (pos == std::string::npos)
    return {addr, default_port};

  std::string host = addr.substr(0, pos);
  std::string port_text = addr.substr(pos + 1);
  int port = port_text.empty() ? default_port : std::stoi(port_text);
  return {host, port};
}

inline parsed_uri parse_uri(const std::string &uri) {
  auto sep = uri.find("://");
  std::string s = sep == std::string::npos ? "" : uri.substr(0, sep);
  if (s != "ws" && s != "wss")
    throw std::invalid_argument("unsupported websocket URL: " + uri);

  bool secure = s == "wss";
  std::string rest = uri.substr(sep + 3);
  auto slash = rest.find('/');
  std::string addr = slash == std::string::npos ? rest : rest.substr(0, slash);
  std::string path = slash == std::string::npos ? "/" : rest.substr(slash);

  auto [host, port] = split_host_port(addr, secure ? 443 : 80);
  return {uri, s, host, port, path, secure};
}

/// Owning socket descriptor.
class unique_fd {
public:
  unique_fd() = default;
  explicit unique_fd(int fd) : fd_(fd) {}
  ~unique_fd() { reset(); }

  unique_fd(unique_fd &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
  unique_fd &operator=(unique_fd &&other) noexcept {
    if (this != &other) {
      reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }
  unique_fd(const unique_fd &) = delete;
  unique_fd &operator=(const unique_fd &) = delete;

  int get() const { return fd_; }
  explicit operator bool() const { return fd_ >= 0; }

  void reset() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_ = -1;
};

namespace detail {

inline std::string errno_text(int err) { return std::strerror(err); }

/// "Connection refused" -> "connection refused".
inline std::string lowercase_first(std::string s) {
  if (!s.empty() && s[0] >= 'A' && s[0] <= 'Z')
    s[0] = static_cast<char>(s[0] - 'A' + 'a');
  return s;
}

inline void set_nonblocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
    throw transport_error("fcntl: " + errno_text(errno));
}

/// Polls `fd` in short slices so cancellation is observed. Returns false
/// when `until` passes first.
inline bool wait_fd(const context &ctx, int fd, short events,
                    context::clock::time_point until) {
  using namespace std::chrono;
  for (;;) {
    ctx.check();
    auto now = context::clock::now();
    if (now >= until)
      return false;
    auto left = duration_cast<milliseconds>(until - now).count();
    int slice = static_cast<int>(std::min<long long>(left + 1, 100));

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;
    int rc = ::poll(&pfd, 1, slice);
    if (rc > 0)
      return true;
    if (rc < 0 && errno != EINTR)
      throw transport_error("poll: " + errno_text(errno));
  }
}

} // namespace detail

/// Opens a non-blocking TCP connection, trying each resolved address until
/// one accepts. Throws transport_error with the last failure.
inline unique_fd dial_tcp(const context &ctx, const std::string &host, int port,
                          std::chrono::milliseconds timeout) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *res = nullptr;
  auto service = std::to_string(port);
  int gai = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
  if (gai != 0)
    throw transport_error("lookup " + host + ": " + ::gai_strerror(gai));

  std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> list(res, ::freeaddrinfo);
  auto until = context::clock::now() + timeout;
  std::string last_error = "no addresses";

  for (auto *ai = list.get(); ai != nullptr; ai = ai->ai_next) {
    unique_fd fd(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
    if (!fd) {
      last_error = detail::errno_text(errno);
      continue;
    }
    detail::set_nonblocking(fd.get());

    if (::connect(fd.get(), ai->ai_addr, ai->ai_addrlen) != 0) {
      if (errno != EINPROGRESS) {
        last_error = detail::errno_text(errno);
        continue;
      }
      if (!detail::wait_fd(ctx, fd.get(), POLLOUT, until)) {
        last_error = "i/o timeout";
        break;
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      ::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &so_error, &len);
      if (so_error != 0) {
        last_error = detail::errno_text(so_error);
        continue;
      }
    }

    int one = 1;
    ::setsockopt(fd.get(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return fd;
  }

  throw transport_error("dial tcp " + host + ":" + service + ": " +
                        detail::lowercase_first(last_error));
}

} // namespace mwclient
