#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "../include/mwclient/sync.hpp"
#include "../include/mwclient/websocket.hpp"

// In-memory middleware behind the socket_dialer seam. Requests are answered
// synchronously from send_text(); job events and drops are injected by the
// test.
class fake_middleware : public mwclient::socket_dialer {
public:
  using json = nlohmann::json;

  struct job_record {
    std::string state;
    json result;
    std::string error;
  };

  // Returns {"result": ...} or {"error": {...}}; null sends no reply.
  std::function<json(const std::string &method, const json &params)> handler;
  // Runs once the reply to `method` is queued; used to inject job events.
  std::function<void(const std::string &method)> after_reply;

  std::atomic<bool> refuse_dials{false};
  std::atomic<bool> answer_pings{true};
  std::atomic<bool> expire_session_once{false};
  std::atomic<bool> reject_auth{false};

  std::unique_ptr<mwclient::message_stream> dial(const mwclient::context &,
                                                 const std::string &url) override {
    std::lock_guard<std::mutex> lock(mu_);
    urls_.push_back(url);
    if (refuse_dials)
      throw mwclient::transport_error("dial tcp nas:443: connection refused");
    current_ = std::make_shared<connection>();
    return std::make_unique<stream>(*this, current_);
  }

  // Server-side close of the live connection.
  void drop() {
    std::shared_ptr<connection> conn;
    {
      std::lock_guard<std::mutex> lock(mu_);
      conn = current_;
    }
    if (conn)
      (void)conn->frames.try_push({mwclient::frame_kind::closed, ""});
  }

  void set_job(int64_t id, job_record record) {
    std::lock_guard<std::mutex> lock(mu_);
    jobs_[id] = std::move(record);
  }

  void forget_job(int64_t id) {
    std::lock_guard<std::mutex> lock(mu_);
    jobs_.erase(id);
  }

  // Sends a core.get_jobs collection_update on the live connection.
  void push_job_event(int64_t id, const std::string &state, json result = nullptr,
                      const std::string &error = "") {
    json fields = {{"state", state}, {"result", result}};
    if (!error.empty())
      fields["error"] = error;
    json params = {{"collection", "core.get_jobs"}, {"id", id}, {"fields", fields}};
    json msg = {{"jsonrpc", "2.0"}, {"method", "collection_update"}, {"params", params}};
    send(msg);
  }

  int dials() {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<int>(urls_.size());
  }

  std::string last_url() {
    std::lock_guard<std::mutex> lock(mu_);
    return urls_.empty() ? "" : urls_.back();
  }

  // Every request payload the client sent, handshake included.
  std::vector<json> received() {
    std::lock_guard<std::mutex> lock(mu_);
    return received_;
  }

  int count(const std::string &method) {
    std::lock_guard<std::mutex> lock(mu_);
    int n = 0;
    for (const auto &r : received_)
      n += r.value("method", "") == method ? 1 : 0;
    return n;
  }

  int shutdowns() const { return shutdowns_; }

private:
  struct connection {
    mwclient::mailbox<std::pair<mwclient::frame_kind, std::string>> frames{1000};
    std::atomic<bool> down{false};
  };

  class stream : public mwclient::message_stream {
  public:
    stream(fake_middleware &server, std::shared_ptr<connection> conn)
        : server_(server), conn_(std::move(conn)) {}
    ~stream() override { shutdown(); }

    bool send_text(const std::string &payload) override {
      if (conn_->down)
        return false;
      server_.handle(*conn_, payload);
      return true;
    }

    bool send_ping() override {
      if (conn_->down)
        return false;
      if (server_.answer_pings)
        (void)conn_->frames.try_push({mwclient::frame_kind::pong, ""});
      return true;
    }

    mwclient::frame_kind read(std::string &out) override {
      auto frame = conn_->frames.pop_until(mwclient::context::clock::time_point::max());
      if (!frame || frame->first == mwclient::frame_kind::closed) {
        conn_->down = true;
        return mwclient::frame_kind::closed;
      }
      out = std::move(frame->second);
      return frame->first;
    }

    void shutdown() override {
      conn_->down = true;
      if (!conn_->frames.closed()) {
        ++server_.shutdowns_;
        conn_->frames.close();
      }
    }

  private:
    fake_middleware &server_;
    std::shared_ptr<connection> conn_;
  };

  void send(const json &msg) {
    std::shared_ptr<connection> conn;
    {
      std::lock_guard<std::mutex> lock(mu_);
      conn = current_;
    }
    if (conn)
      (void)conn->frames.try_push({mwclient::frame_kind::text, msg.dump()});
  }

  void reply(connection &conn, const json &id, json body) {
    body["jsonrpc"] = "2.0";
    body["id"] = id;
    (void)conn.frames.try_push({mwclient::frame_kind::text, body.dump()});
  }

  void handle(connection &conn, const std::string &payload) {
    auto msg = json::parse(payload);
    {
      std::lock_guard<std::mutex> lock(mu_);
      received_.push_back(msg);
    }
    auto method = msg.value("method", "");
    auto params = msg.contains("params") ? msg["params"] : json();
    auto id = msg["id"];

    if (method == "auth.login_ex") {
      if (reject_auth) {
        reply(conn, id, {{"result", {{"response_type", "AUTH_ERR"}}}});
        return;
      }
      reply(conn, id, {{"result", {{"response_type", "SUCCESS"}}}});
      return;
    }
    if (method == "core.subscribe") {
      reply(conn, id, {{"result", "sub-1"}});
      return;
    }
    if (expire_session_once.exchange(false)) {
      json error = {{"code", -32001},
                    {"message", "Not authenticated"},
                    {"data", {{"reason", "[ENOTAUTHENTICATED] Not authenticated"}}}};
      reply(conn, id, {{"error", error}});
      return;
    }
    if (method == "core.get_jobs") {
      reply(conn, id, {{"result", jobs_matching(params)}});
      return;
    }
    json body = handler ? handler(method, params) : json{{"result", nullptr}};
    if (!body.is_null())
      reply(conn, id, std::move(body));
    if (after_reply)
      after_reply(method);
  }

  json jobs_matching(const json &params) {
    // params: [[["id", "=", N]]]
    int64_t id = params.at(0).at(0).at(2).get<int64_t>();
    std::lock_guard<std::mutex> lock(mu_);
    auto it = jobs_.find(id);
    if (it == jobs_.end())
      return json::array();
    json j = {{"id", id}, {"state", it->second.state}, {"result", it->second.result}};
    if (!it->second.error.empty())
      j["error"] = it->second.error;
    return json::array({j});
  }

  std::mutex mu_;
  std::vector<std::string> urls_;
  std::vector<json> received_;
  std::map<int64_t, job_record> jobs_;
  std::shared_ptr<connection> current_;
  std::atomic<int> shutdowns_{0};
};
