#pragma once

#include <cstdint>
#include <cstdio>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include "context.hpp"
#include "version.hpp"

namespace mwclient {

using json = nlohmann::json;

/// Parameters of transport::write_file. An absent uid/gid leaves ownership
/// unchanged.
struct write_file_params {
  std::string content;
  int mode = 0644;
  std::optional<int> uid;
  std::optional<int> gid;
};

/// Uniform contract over the shell and socket transports.
///
/// Every operation honours `ctx` and throws cancelled_error once it is done.
class transport {
public:
  virtual ~transport() = default;

  /// One-time handshake plus cached version lookup.
  virtual void connect(const context &ctx) = 0;

  /// Cached server version. Throws std::logic_error before connect().
  virtual server_version version() const = 0;

  virtual json call(const context &ctx, const std::string &method,
                    const json &params) = 0;

  /// Like call(), but blocks until the job the method started finishes and
  /// returns the job result.
  virtual json call_and_wait(const context &ctx, const std::string &method,
                             const json &params) = 0;

  virtual void write_file(const context &ctx, const std::string &path,
                          const write_file_params &params) = 0;
  virtual std::string read_file(const context &ctx, const std::string &path) = 0;
  virtual void delete_file(const context &ctx, const std::string &path) = 0;
  virtual bool file_exists(const context &ctx, const std::string &path) = 0;
  virtual void mkdir_all(const context &ctx, const std::string &path,
                         int mode) = 0;
  virtual void remove_dir(const context &ctx, const std::string &path) = 0;
  virtual void remove_all(const context &ctx, const std::string &path) = 0;
  virtual void chown(const context &ctx, const std::string &path, int uid,
                     int gid) = 0;
  virtual void chmod_recursive(const context &ctx, const std::string &path,
                               int mode) = 0;

  /// Idempotent.
  virtual void close() = 0;
};

/// Issues one remote call; used by the job poller.
using caller =
    std::function<json(const context &, const std::string &, const json &)>;

namespace detail {

/// Octal mode string, e.g. 0755 -> "0755".
inline std::string format_mode(int mode) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04o", static_cast<unsigned>(mode) & 07777u);
  return buf;
}

inline std::string base64_encode(const std::string &data) {
  std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
  int n = EVP_EncodeBlock(out.data(),
                          reinterpret_cast<const unsigned char *>(data.data()),
                          static_cast<int>(data.size()));
  return std::string(reinterpret_cast<const char *>(out.data()),
                     static_cast<std::size_t>(n > 0 ? n : 0));
}

inline json file_receive_params(const std::string &path, const std::string &b64,
                                const write_file_params &params) {
  json options = {{"mode", params.mode},
                  {"uid", params.uid.value_or(-1)},
                  {"gid", params.gid.value_or(-1)}};
  return json::array({path, b64, options});
}

inline json mkdir_params(const std::string &path, int mode) {
  return {{"path", path}, {"options", {{"mode", format_mode(mode)}}}};
}

inline json chown_params(const std::string &path, int uid, int gid) {
  return {{"path", path}, {"uid", uid}, {"gid", gid}};
}

inline json setperm_params(const std::string &path, int mode) {
  return {{"path", path},
          {"mode", format_mode(mode)},
          {"options", {{"recursive", true}}}};
}

} // namespace detail

} // namespace mwclient
