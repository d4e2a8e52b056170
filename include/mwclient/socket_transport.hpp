#pragma once

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "context.hpp"
#include "errors.hpp"
#include "job.hpp"
#include "job_poller.hpp"
#include "log.hpp"
#include "retry.hpp"
#include "sync.hpp"
#include "transport.hpp"
#include "version.hpp"
#include "websocket.hpp"

namespace mwclient {

struct socket_config {
  std::string host;
  int port = 0;
  std::string username;
  std::string api_key;
  /// "wss" unless talking to a plaintext test endpoint.
  std::string scheme = "wss";
  bool insecure_skip_verify = false;
  /// In-flight requests per transport.
  int max_concurrent = 0;
  std::chrono::milliseconds connect_timeout{0};
  /// Negative means 3.
  int max_retries = -1;
  /// Unset means 30s; zero disables keepalive pings.
  std::optional<std::chrono::milliseconds> ping_interval;
  std::chrono::milliseconds ping_timeout{0};
  /// How long a job wait tolerates a lost connection.
  std::chrono::milliseconds reconnect_timeout{0};
  /// Delay between catch-up polls while the connection is down.
  backoff_policy reconnect_backoff;
  /// Serves the operations the socket API does not expose.
  std::shared_ptr<transport> fallback;

  void validate() {
    if (host.empty())
      throw std::invalid_argument("host is required");
    if (username.empty())
      throw std::invalid_argument("username is required");
    if (api_key.empty())
      throw std::invalid_argument("api_key is required");
    if (!fallback)
      throw std::invalid_argument("fallback client is required");
    if (scheme != "ws" && scheme != "wss")
      throw std::invalid_argument("scheme must be ws or wss");
    if (port <= 0)
      port = 443;
    if (max_concurrent <= 0)
      max_concurrent = 20;
    if (connect_timeout.count() <= 0)
      connect_timeout = std::chrono::seconds(30);
    if (max_retries < 0)
      max_retries = 3;
    if (!ping_interval || ping_interval->count() < 0)
      ping_interval = std::chrono::seconds(30);
    if (ping_timeout.count() <= 0)
      ping_timeout = std::chrono::seconds(10);
    if (reconnect_timeout.count() <= 0)
      reconnect_timeout = std::chrono::minutes(5);
  }
};

/// Live feed of events for one job. Unregisters on destruction; it may
/// outlive the transport that issued it.
class job_subscription {
public:
  job_subscription(int64_t job_id, std::shared_ptr<job_feed> feed,
                   std::function<void()> release)
      : job_id_(job_id), feed_(std::move(feed)), release_(std::move(release)) {}

  ~job_subscription() {
    if (!feed_)
      return;
    feed_->close();
    if (release_)
      release_();
  }

  job_subscription(const job_subscription &) = delete;
  job_subscription &operator=(const job_subscription &) = delete;
  job_subscription(job_subscription &&other) noexcept
      : job_id_(other.job_id_), feed_(std::move(other.feed_)),
        release_(std::exchange(other.release_, nullptr)) {}
  job_subscription &operator=(job_subscription &&) = delete;

  /// Next event, or nullopt when `until` passes or the transport closed.
  std::optional<job_event>
  next(const context &ctx,
       context::clock::time_point until = context::clock::time_point::max()) {
    return feed_->next(ctx, until);
  }

  /// True once the transport stopped delivering and the feed is drained.
  bool closed() const { return feed_->closed() && feed_->size() == 0; }

  int64_t job_id() const { return job_id_; }

  /// Progress updates dropped because the feed was full.
  std::size_t evicted() const { return feed_->evicted(); }

private:
  int64_t job_id_;
  std::shared_ptr<job_feed> feed_;
  std::function<void()> release_;
};

/// JSON-RPC over one persistent websocket.
///
/// A single owner thread holds the stream, the pending table, the job
/// subscribers and the replay buffer. Callers and per-connection reader
/// threads only post messages to its inbox.
class socket_transport : public transport {
public:
  static constexpr std::size_t kInboxCapacity = 100;

  explicit socket_transport(socket_config config,
                            std::shared_ptr<socket_dialer> dialer = nullptr)
      : config_(validated(std::move(config))), dialer_(std::move(dialer)),
        inflight_(config_.max_concurrent),
        inbox_(std::make_shared<mailbox<owner_message>>(kInboxCapacity)) {
    if (!dialer_)
      dialer_ = std::make_shared<websocket_dialer>(config_.connect_timeout,
                                                   config_.insecure_skip_verify);
    owner_thread_ = std::thread([this]() { owner_loop(); });
  }

  ~socket_transport() override { close(); }

  socket_transport(const socket_transport &) = delete;
  socket_transport &operator=(const socket_transport &) = delete;

  /// Connects the fallback transport and caches its server version. The
  /// socket itself is dialed lazily by the first request.
  void connect(const context &ctx) override {
    config_.fallback->connect(ctx);
    auto v = config_.fallback->version();
    std::lock_guard<std::mutex> lock(version_mu_);
    version_ = v;
  }

  server_version version() const override {
    std::lock_guard<std::mutex> lock(version_mu_);
    if (!version_)
      throw std::logic_error("version() called before connect()");
    return *version_;
  }

  /// One attempt; retrying is the decorator's job.
  json call(const context &ctx, const std::string &method,
            const json &params) override {
    if (method.empty())
      throw std::invalid_argument("method is required");
    if (closed_.load())
      throw transport_error("websocket: client closed");

    session_permit permit(inflight_, ctx);
    auto slot = std::make_shared<pending_call>();
    if (!inbox_->push(ctx, request_msg{method, params, slot, ctx}))
      throw transport_error("websocket: client closed");

    std::unique_lock<std::mutex> lock(slot->mu);
    ctx.wait(slot->cv, lock, [&slot]() { return slot->done; });
    if (slot->error)
      std::rethrow_exception(slot->error);
    return slot->result;
  }

  json call_and_wait(const context &ctx, const std::string &method,
                     const json &params) override {
    auto result = call(ctx, method, params);
    auto job_id = parse_job_id(result);
    if (!job_id)
      return result;
    return wait_job(ctx, *job_id);
  }

  /// Registers for events of `job_id`. A terminal event that already
  /// arrived is replayed; a subscriber joining during an outage gets
  /// DISCONNECTED straight away.
  job_subscription subscribe_job(const context &ctx, int64_t job_id) {
    auto feed = std::make_shared<job_feed>();
    if (!inbox_->push(ctx, subscribe_msg{job_id, feed}))
      throw transport_error("websocket: client closed");
    // Never blocks; a lost unsubscribe is swept once the feed reads closed.
    auto release = [inbox = inbox_, job_id, feed]() {
      (void)inbox->try_push(unsubscribe_msg{job_id, feed});
    };
    return job_subscription(job_id, std::move(feed), std::move(release));
  }

  void write_file(const context &ctx, const std::string &path,
                  const write_file_params &params) override {
    auto b64 = detail::base64_encode(params.content);
    call(ctx, "filesystem.file_receive",
         detail::file_receive_params(path, b64, params));
  }

  std::string read_file(const context &ctx, const std::string &path) override {
    return config_.fallback->read_file(ctx, path);
  }

  void delete_file(const context &ctx, const std::string &path) override {
    config_.fallback->delete_file(ctx, path);
  }

  bool file_exists(const context &ctx, const std::string &path) override {
    try {
      call(ctx, "filesystem.stat", path);
      return true;
    } catch (const rpc_error &e) {
      if (e.errno_value() == ENOENT)
        return false;
      throw;
    }
  }

  void mkdir_all(const context &ctx, const std::string &path, int mode) override {
    try {
      call(ctx, "filesystem.mkdir", detail::mkdir_params(path, mode));
    } catch (const rpc_error &e) {
      if (e.errno_value() != EEXIST)
        throw;
    }
  }

  void remove_dir(const context &ctx, const std::string &path) override {
    config_.fallback->remove_dir(ctx, path);
  }

  void remove_all(const context &ctx, const std::string &path) override {
    config_.fallback->remove_all(ctx, path);
  }

  void chown(const context &ctx, const std::string &path, int uid,
             int gid) override {
    call_and_wait(ctx, "filesystem.chown", detail::chown_params(path, uid, gid));
  }

  void chmod_recursive(const context &ctx, const std::string &path,
                       int mode) override {
    call_and_wait(ctx, "filesystem.setperm", detail::setperm_params(path, mode));
  }

  void close() override {
    {
      std::lock_guard<std::mutex> lock(closed_mu_);
      if (closed_.exchange(true))
        return;
    }
    closed_cv_.notify_all();
    (void)inbox_->push(stop_msg{});
    if (owner_thread_.joinable())
      owner_thread_.join();
    config_.fallback->close();
  }

  const socket_config &config() const { return config_; }

  std::string endpoint() const {
    return config_.scheme + "://" + config_.host + ":" +
           std::to_string(config_.port) + "/api/current";
  }

private:
  struct pending_call {
    std::mutex mu;
    std::condition_variable cv;
    bool done = false;
    std::exception_ptr error;
    json result;
  };

  using channel_ptr = std::shared_ptr<job_feed>;

  struct request_msg {
    std::string method;
    json params;
    std::shared_ptr<pending_call> slot;
    context ctx;
  };
  struct subscribe_msg {
    int64_t job_id;
    channel_ptr channel;
  };
  struct unsubscribe_msg {
    int64_t job_id;
    channel_ptr channel;
  };
  struct inbound_msg {
    uint64_t generation;
    std::string text;
  };
  struct pong_msg {
    uint64_t generation;
  };
  struct read_failure_msg {
    uint64_t generation;
    std::string reason;
  };
  struct stop_msg {};

  using owner_message =
      std::variant<request_msg, subscribe_msg, unsubscribe_msg, inbound_msg,
                   pong_msg, read_failure_msg, stop_msg>;

  /// A reader thread and the stream it drains.
  struct reader_handle {
    std::shared_ptr<message_stream> stream;
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  static socket_config validated(socket_config config) {
    config.validate();
    return config;
  }

  static void complete(const std::shared_ptr<pending_call> &slot, json result) {
    {
      std::lock_guard<std::mutex> lock(slot->mu);
      slot->done = true;
      slot->result = std::move(result);
    }
    slot->cv.notify_all();
  }

  static void fail(const std::shared_ptr<pending_call> &slot,
                   std::exception_ptr error) {
    {
      std::lock_guard<std::mutex> lock(slot->mu);
      slot->done = true;
      slot->error = std::move(error);
    }
    slot->cv.notify_all();
  }

  /// Null omits params, arrays pass through, anything else is wrapped.
  static json wrap_params(const json &params) {
    if (params.is_null() || params.is_array())
      return params;
    return json::array({params});
  }

  // ---- caller side ---------------------------------------------------------

  log_reader fallback_reader() {
    return [this](const context &ctx, const std::string &path) {
      return config_.fallback->read_file(ctx, path);
    };
  }

  json wait_job(const context &ctx, int64_t job_id) {
    auto sub = subscribe_job(ctx, job_id);
    std::optional<context::clock::time_point> reconnect_deadline;

    for (;;) {
      auto until = reconnect_deadline.value_or(context::clock::time_point::max());
      auto event = sub.next(ctx, until);
      if (!event) {
        if (sub.closed())
          throw transport_error("websocket: client closed");
        throw reconnect_timeout_error(job_id);
      }

      switch (event->kind) {
      case job_event_kind::progress:
        if (event->state == job_state::success)
          return event->result;
        if (event->state == job_state::failed ||
            event->state == job_state::aborted) {
          if (event->error.empty()) {
            middleware_error err(codes::kUnknown,
                                 "job " + std::to_string(job_id) + " failed");
            err.set_job_id(job_id);
            throw err;
          }
          throw job_failure_error(ctx, job_id, event->error, "",
                                  fallback_reader());
        }
        break;

      case job_event_kind::disconnected: {
        if (!reconnect_deadline)
          reconnect_deadline =
              context::clock::now() + config_.reconnect_timeout;
        MWCLIENT_LOG_WARN("websocket: connection lost while waiting for job {}",
                          job_id);
        if (auto done = catch_up(ctx, job_id, *reconnect_deadline))
          return *done;
        break;
      }

      case job_event_kind::reconnected: {
        auto deadline = reconnect_deadline.value_or(
            context::clock::now() + config_.reconnect_timeout);
        if (auto done = catch_up(ctx, job_id, deadline))
          return *done;
        reconnect_deadline.reset();
        break;
      }
      }
    }
  }

  /// Polls the authoritative job state; the poll also reconnects. Transient
  /// failures are retried with backoff until `deadline` or close().
  std::optional<json> catch_up(const context &ctx, int64_t job_id,
                               context::clock::time_point deadline) {
    socket_retry_classifier classifier;
    for (int attempt = 0;; ++attempt) {
      try {
        return poll_once(ctx, job_id);
      } catch (const cancelled_error &) {
        throw;
      } catch (const std::exception &e) {
        // a closed transport never comes back
        if (closed_.load() || !classifier.is_retriable(e))
          throw;
        auto now = context::clock::now();
        if (now >= deadline)
          throw reconnect_timeout_error(job_id);
        MWCLIENT_LOG_DEBUG("websocket: catch-up poll for job {} failed: {}",
                           job_id, e.what());
        auto delay = calculate_backoff(attempt, config_.reconnect_backoff);
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - now);
        std::unique_lock<std::mutex> lock(closed_mu_);
        if (ctx.wait(closed_cv_, lock, [this]() { return closed_.load(); },
                     context::clock::now() + std::min(delay, left)))
          throw transport_error("websocket: client closed");
      }
    }
  }

  std::optional<json> poll_once(const context &ctx, int64_t job_id) {
    auto result = call(ctx, "core.get_jobs", json::array({job_filter(job_id)}));
    if (!result.is_array())
      throw std::runtime_error("failed to parse job response: expected array");
    if (result.empty()) {
      middleware_error err(codes::kNotFound,
                           "Job " + std::to_string(job_id) +
                               " no longer exists after reconnect");
      err.set_job_id(job_id);
      throw err;
    }

    auto current = job_from_json(result.front());
    switch (current.state) {
    case job_state::success:
      return current.result;
    case job_state::failed:
    case job_state::aborted:
      throw job_failure_error(ctx, job_id, current.error, current.logs_excerpt,
                              fallback_reader());
    case job_state::running:
    case job_state::waiting:
    case job_state::unknown:
      break;
    }
    return std::nullopt;
  }

  middleware_error reconnect_timeout_error(int64_t job_id) const {
    middleware_error err(codes::kTimedOut,
                         "reconnect timeout: connection not restored within " +
                             detail::format_duration(config_.reconnect_timeout));
    err.set_job_id(job_id);
    return err;
  }

  // ---- owner thread --------------------------------------------------------

  void owner_loop() {
    if (config_.ping_interval->count() > 0)
      next_ping_ = context::clock::now() + *config_.ping_interval;

    for (;;) {
      owner_message msg;
      if (!deferred_.empty()) {
        msg = std::move(deferred_.front());
        deferred_.pop_front();
      } else {
        auto popped = inbox_->pop_until(next_wakeup());
        if (!popped) {
          on_timer();
          continue;
        }
        msg = std::move(*popped);
      }

      if (std::holds_alternative<stop_msg>(msg))
        break;
      try {
        dispatch(msg);
      } catch (const std::exception &e) {
        MWCLIENT_LOG_ERROR("websocket: owner failed to handle message: {}",
                           e.what());
      }
      reap_readers();
      on_timer();
    }

    shutdown_owner();
  }

  context::clock::time_point next_wakeup() const {
    auto wake = context::clock::time_point::max();
    if (config_.ping_interval->count() > 0)
      wake = std::min(wake, next_ping_);
    if (awaiting_pong_)
      wake = std::min(wake, pong_deadline_);
    if (!retired_.empty())
      wake = std::min(wake, context::clock::now() + std::chrono::milliseconds(200));
    return wake;
  }

  void on_timer() {
    reap_readers();
    auto now = context::clock::now();
    if (config_.ping_interval->count() > 0 && now >= next_ping_) {
      next_ping_ = now + *config_.ping_interval;
      if (stream_ && !awaiting_pong_) {
        if (!stream_->send_ping()) {
          disconnect(std::make_exception_ptr(
              transport_error("websocket: ping failed")));
          return;
        }
        awaiting_pong_ = true;
        pong_deadline_ = now + config_.ping_timeout;
      }
    }
    if (awaiting_pong_ && now >= pong_deadline_)
      disconnect(std::make_exception_ptr(transport_error("websocket: pong timeout")));
  }

  void dispatch(owner_message &msg) {
    if (auto *req = std::get_if<request_msg>(&msg)) {
      handle_request(*req);
    } else if (auto *sub = std::get_if<subscribe_msg>(&msg)) {
      handle_subscribe(*sub);
    } else if (auto *unsub = std::get_if<unsubscribe_msg>(&msg)) {
      auto it = subscribers_.find(unsub->job_id);
      if (it != subscribers_.end() && it->second == unsub->channel)
        subscribers_.erase(it);
    } else if (auto *in = std::get_if<inbound_msg>(&msg)) {
      if (in->generation == generation_ && stream_)
        handle_inbound(in->text);
    } else if (auto *pong = std::get_if<pong_msg>(&msg)) {
      if (pong->generation == generation_)
        awaiting_pong_ = false;
    } else if (auto *failure = std::get_if<read_failure_msg>(&msg)) {
      if (failure->generation == generation_ && stream_)
        disconnect(std::make_exception_ptr(
            transport_error("websocket: " + failure->reason)));
    }
  }

  void handle_request(request_msg &req) {
    if (req.ctx.done()) {
      fail(req.slot, std::make_exception_ptr(cancelled_error(!req.ctx.cancelled())));
      return;
    }

    if (!stream_) {
      try {
        open_stream(req.ctx);
      } catch (const std::exception &e) {
        MWCLIENT_LOG_WARN("websocket: connect to {} failed: {}", config_.host,
                          e.what());
        fail(req.slot, std::current_exception());
        return;
      }
    }

    auto id = "req-" + std::to_string(next_id_++);
    json payload = {{"jsonrpc", "2.0"}, {"method", req.method}, {"id", id}};
    auto params = wrap_params(req.params);
    if (!params.is_null())
      payload["params"] = std::move(params);

    MWCLIENT_LOG_DEBUG("websocket: -> {} {}", id, req.method);
    if (!stream_->send_text(payload.dump())) {
      auto err = std::make_exception_ptr(transport_error("websocket: write failed"));
      fail(req.slot, err);
      disconnect(err);
      return;
    }
    pending_[id] = req.slot;
  }

  void handle_subscribe(subscribe_msg &sub) {
    prune_subscribers();
    if (auto replay = replay_.find_terminal(sub.job_id)) {
      (void)sub.channel->deliver(*replay);
      return;
    }
    subscribers_[sub.job_id] = sub.channel;
    if (notified_disconnect_)
      (void)sub.channel->deliver(
          job_event::synthetic(sub.job_id, job_event_kind::disconnected));
  }

  /// Drops subscribers whose feed was closed without an unsubscribe.
  void prune_subscribers() {
    for (auto it = subscribers_.begin(); it != subscribers_.end();) {
      if (it->second->closed())
        it = subscribers_.erase(it);
      else
        ++it;
    }
  }

  void handle_inbound(const std::string &text) {
    auto msg = json::parse(text, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
      MWCLIENT_LOG_DEBUG("websocket: ignoring non-object message");
      return;
    }

    if (msg.contains("id") && msg["id"].is_string() &&
        !msg["id"].get<std::string>().empty()) {
      handle_response(msg);
      return;
    }

    if (msg.value("method", "") == "collection_update" &&
        msg.contains("params") && msg["params"].is_object())
      handle_job_event(msg["params"]);
  }

  void handle_response(const json &msg) {
    auto id = msg["id"].get<std::string>();
    auto it = pending_.find(id);
    if (it == pending_.end())
      return;
    auto slot = it->second;
    pending_.erase(it);

    if (msg.contains("error") && !msg["error"].is_null()) {
      auto err = rpc_error::from_json(msg["error"]);
      MWCLIENT_LOG_DEBUG("websocket: <- {} error {}", id, err.what());
      auto ptr = std::make_exception_ptr(err);
      if (err.reason().find("ENOTAUTHENTICATED") != std::string::npos) {
        MWCLIENT_LOG_INFO("websocket: session expired, reconnecting");
        fail(slot, ptr);
        disconnect(ptr);
        return;
      }
      fail(slot, ptr);
      return;
    }
    MWCLIENT_LOG_TRACE("websocket: <- {}", id);
    complete(slot, msg.contains("result") ? msg["result"] : json());
  }

  void handle_job_event(const json &params) {
    if (params.value("collection", "") != "core.get_jobs")
      return;
    if (!params.contains("id") || !params["id"].is_number_integer())
      return;

    job_event event;
    event.id = params["id"].get<int64_t>();
    if (params.contains("fields") && params["fields"].is_object()) {
      const auto &fields = params["fields"];
      event.state = parse_job_state(detail::string_field(fields, "state"));
      if (fields.contains("result"))
        event.result = fields["result"];
      event.error = detail::string_field(fields, "error");
    }

    if (event.terminal())
      replay_.add(event);

    auto it = subscribers_.find(event.id);
    if (it == subscribers_.end())
      return;
    auto channel = it->second;
    bool terminal = event.terminal();
    if (!channel->deliver(std::move(event)) || terminal)
      subscribers_.erase(it);
  }

  void open_stream(const context &ctx) {
    server_version v;
    {
      std::lock_guard<std::mutex> lock(version_mu_);
      if (!version_)
        throw std::logic_error("call() before connect()");
      v = *version_;
    }
    if (!v.at_least(25, 0))
      throw middleware_error(
          codes::kNotSupported,
          "WebSocket transport requires TrueNAS 25.0 or later (detected "
          "version: " +
              v.raw + "). Use auth_method = \"ssh\" instead");

    auto url = endpoint();
    std::shared_ptr<message_stream> stream = dialer_->dial(ctx, url);
    auto gen = ++generation_;
    start_reader(stream, gen);

    try {
      handshake(ctx, *stream, gen);
    } catch (const std::exception &) {
      retire_current(stream);
      throw;
    }

    stream_ = std::move(stream);
    awaiting_pong_ = false;
    MWCLIENT_LOG_INFO("websocket: connected to {}", url);

    if (notified_disconnect_)
      notify_subscribers(job_event_kind::reconnected);
    notified_disconnect_ = false;
  }

  void handshake(const context &ctx, message_stream &stream, uint64_t gen) {
    auto until = context::clock::now() + config_.connect_timeout;

    json creds = {{"mechanism", "API_KEY_PLAIN"},
                  {"username", config_.username},
                  {"api_key", config_.api_key}};
    json auth = {{"jsonrpc", "2.0"},
                 {"method", "auth.login_ex"},
                 {"params", json::array({creds})},
                 {"id", "auth"}};
    if (!stream.send_text(auth.dump()))
      throw transport_error("websocket: auth write failed");

    auto reply = await_reply(ctx, gen, "auth", until);
    if (reply.contains("error") && !reply["error"].is_null())
      throw std::runtime_error("authentication failed: " +
                               std::string(rpc_error::from_json(reply["error"]).what()));
    std::string response_type;
    if (reply.contains("result") && reply["result"].is_object())
      response_type = detail::string_field(reply["result"], "response_type");
    if (response_type != "SUCCESS")
      throw std::runtime_error("authentication failed: " +
                               (response_type.empty() ? reply.dump() : response_type));

    json subscribe = {{"jsonrpc", "2.0"},
                      {"method", "core.subscribe"},
                      {"params", json::array({"core.get_jobs"})},
                      {"id", "job-sub"}};
    if (!stream.send_text(subscribe.dump()))
      throw transport_error("websocket: job subscription write failed");

    reply = await_reply(ctx, gen, "job-sub", until);
    if (reply.contains("error") && !reply["error"].is_null())
      throw std::runtime_error(
          "job subscription failed: " +
          std::string(rpc_error::from_json(reply["error"]).what()));
  }

  /// Drains the inbox until the reply with `id` arrives on generation `gen`.
  /// Caller requests seen meanwhile are deferred until the handshake ends.
  json await_reply(const context &ctx, uint64_t gen, const std::string &id,
                   context::clock::time_point until) {
    for (;;) {
      ctx.check();
      auto now = context::clock::now();
      if (now >= until)
        throw transport_error("websocket: handshake i/o timeout");
      auto popped = inbox_->pop_until(
          std::min(until, now + std::chrono::milliseconds(100)));
      if (!popped)
        continue;

      auto &msg = *popped;
      if (auto *in = std::get_if<inbound_msg>(&msg)) {
        if (in->generation != gen)
          continue;
        auto parsed = json::parse(in->text, nullptr, false);
        if (parsed.is_object() && parsed.contains("id") &&
            parsed["id"].is_string() && parsed["id"].get<std::string>() == id)
          return parsed;
        handle_inbound(in->text);
      } else if (auto *failure = std::get_if<read_failure_msg>(&msg)) {
        if (failure->generation == gen)
          throw transport_error("websocket: " + failure->reason);
      } else if (std::holds_alternative<pong_msg>(msg)) {
        continue;
      } else if (std::holds_alternative<stop_msg>(msg)) {
        deferred_.push_back(std::move(msg));
        throw transport_error("websocket: client closed");
      } else {
        deferred_.push_back(std::move(msg));
      }
    }
  }

  void start_reader(const std::shared_ptr<message_stream> &stream, uint64_t gen) {
    auto finished = std::make_shared<std::atomic<bool>>(false);
    reader_handle handle;
    handle.stream = stream;
    handle.finished = finished;
    handle.thread = std::thread([this, stream, gen, finished]() {
      read_loop(*stream, gen);
      finished->store(true);
    });
    readers_.push_back(std::move(handle));
  }

  void read_loop(message_stream &stream, uint64_t gen) {
    std::string text;
    try {
      for (;;) {
        auto kind = stream.read(text);
        if (kind == frame_kind::closed) {
          (void)inbox_->push(read_failure_msg{gen, "connection closed"});
          return;
        }
        bool delivered = kind == frame_kind::pong
                             ? inbox_->push(pong_msg{gen})
                             : inbox_->push(inbound_msg{gen, std::move(text)});
        if (!delivered)
          return;
      }
    } catch (const std::exception &e) {
      (void)inbox_->push(read_failure_msg{gen, e.what()});
    }
  }

  /// Shuts the stream down; its reader is joined once it notices.
  void retire_current(const std::shared_ptr<message_stream> &stream) {
    stream->shutdown();
    for (auto &r : readers_) {
      if (r.stream == stream) {
        retired_.push_back(std::move(r));
        break;
      }
    }
    readers_.erase(std::remove_if(readers_.begin(), readers_.end(),
                                  [](const reader_handle &r) {
                                    return !r.thread.joinable();
                                  }),
                   readers_.end());
  }

  void reap_readers() {
    auto it = retired_.begin();
    while (it != retired_.end()) {
      if (it->finished->load()) {
        it->thread.join();
        it = retired_.erase(it);
      } else {
        ++it;
      }
    }
  }

  void disconnect(const std::exception_ptr &cause) {
    if (stream_) {
      retire_current(stream_);
      stream_.reset();
      MWCLIENT_LOG_WARN("websocket: disconnected from {}", config_.host);
    }
    awaiting_pong_ = false;

    auto pending = std::move(pending_);
    pending_.clear();
    for (auto &kv : pending)
      fail(kv.second, cause);

    if (!notified_disconnect_) {
      notify_subscribers(job_event_kind::disconnected);
      notified_disconnect_ = true;
    }
  }

  /// Non-blocking fan-out. Closed feeds are swept on the way.
  void notify_subscribers(job_event_kind kind) {
    for (auto it = subscribers_.begin(); it != subscribers_.end();) {
      if (!it->second->deliver(job_event::synthetic(it->first, kind)))
        it = subscribers_.erase(it);
      else
        ++it;
    }
  }

  void shutdown_owner() {
    auto closed = std::make_exception_ptr(transport_error("websocket: client closed"));
    disconnect(closed);
    for (auto &kv : subscribers_)
      kv.second->close();
    subscribers_.clear();

    inbox_->close();
    for (;;) {
      auto left = inbox_->pop_until(context::clock::now());
      if (!left)
        break;
      if (auto *req = std::get_if<request_msg>(&*left))
        fail(req->slot, closed);
      else if (auto *sub = std::get_if<subscribe_msg>(&*left))
        sub->channel->close();
    }
    for (auto &msg : deferred_) {
      if (auto *req = std::get_if<request_msg>(&msg))
        fail(req->slot, closed);
      else if (auto *sub = std::get_if<subscribe_msg>(&msg))
        sub->channel->close();
    }
    deferred_.clear();

    for (auto &r : readers_)
      r.stream->shutdown();
    for (auto &r : readers_)
      retired_.push_back(std::move(r));
    readers_.clear();
    for (auto &r : retired_) {
      if (r.thread.joinable())
        r.thread.join();
    }
    retired_.clear();
  }

  socket_config config_;
  std::shared_ptr<socket_dialer> dialer_;
  session_semaphore inflight_;
  std::shared_ptr<mailbox<owner_message>> inbox_;
  std::atomic<bool> closed_{false};
  std::mutex closed_mu_;
  std::condition_variable closed_cv_;

  mutable std::mutex version_mu_;
  std::optional<server_version> version_;

  // Owned by the owner thread.
  std::shared_ptr<message_stream> stream_;
  uint64_t generation_ = 0;
  uint64_t next_id_ = 0;
  std::unordered_map<std::string, std::shared_ptr<pending_call>> pending_;
  std::unordered_map<int64_t, channel_ptr> subscribers_;
  job_event_buffer replay_;
  bool notified_disconnect_ = false;
  std::deque<owner_message> deferred_;
  std::vector<reader_handle> readers_;
  std::vector<reader_handle> retired_;
  context::clock::time_point next_ping_ = context::clock::time_point::max();
  bool awaiting_pong_ = false;
  context::clock::time_point pong_deadline_;

  std::thread owner_thread_;
};

} // namespace mwclient
