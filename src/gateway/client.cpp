#include "gateway/client.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/uuid.hpp"
#include "gateway/loopback_socket.hpp"
#include "net/url.hpp"

namespace openclaw::gateway {

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

namespace {

constexpr int kMinIntervalMs = 10;

milliseconds clamp_ms(int value) {
  return milliseconds(std::max(kMinIntervalMs, value));
}

}  // namespace

// ============================================================
// ConnectionState / options
// ============================================================

std::string to_string(ConnectionState state) {
  switch (state) {
    case ConnectionState::Idle:
      return "Idle";
    case ConnectionState::Connecting:
      return "Connecting";
    case ConnectionState::Connected:
      return "Connected";
    case ConnectionState::ReconnectWaiting:
      return "ReconnectWaiting";
  }
  return "Unknown";
}

GatewayClientOptions GatewayClientOptions::from_config(const GatewayConfig &config) {
  GatewayClientOptions options;
  options.tls = GatewayTlsSettings::from_config(config);
  options.tick_interval_ms = config.tick_interval_ms;
  options.initial_reconnect_backoff_ms = config.initial_reconnect_backoff_ms;
  options.max_reconnect_backoff_ms = config.max_reconnect_backoff_ms;
  return options;
}

// ============================================================
// GatewayClient::Impl
// ============================================================
//
// All connection state lives under mutex_, which is never held across a socket
// call, a promise resolution or the event handler. Every established connection
// gets a new generation number; receive loops and timers carry the generation
// they were started for and become inert once it is stale.
//
// Timers (watchdog tick, reconnect backoff) run on a private asio executor
// thread, which also performs reconnect attempts. Each connection has its own
// receive thread blocked in GatewaySocket::receive(); disconnect() joins them.

class GatewayClient::Impl : public std::enable_shared_from_this<GatewayClient::Impl> {
 public:
  explicit Impl(GatewayClientOptions options)
      : options_(std::move(options)),
        tick_interval_(clamp_ms(options_.tick_interval_ms)),
        initial_backoff_(clamp_ms(options_.initial_reconnect_backoff_ms)),
        max_backoff_(std::max(initial_backoff_, clamp_ms(options_.max_reconnect_backoff_ms))),
        work_(asio::make_work_guard(io_ctx_)),
        watchdog_timer_(io_ctx_),
        reconnect_timer_(io_ctx_),
        backoff_(initial_backoff_) {
    if (!options_.socket_factory) {
      options_.socket_factory = []() {
        return std::make_unique<LoopbackSocket>();
      };
    }

    io_thread_ = std::thread([this]() {
      run_executor();
    });
  }

  ~Impl() {
    work_.reset();
    io_ctx_.stop();
    if (io_thread_.joinable()) {
      io_thread_.join();
    }
    join_receivers();
  }

  void connect(const GatewayEndpoint &endpoint, const std::optional<GatewayTlsSettings> &tls) {
    std::lock_guard<std::mutex> connect_lock(connect_mutex_);

    uint64_t attempt = 0;
    GatewayTlsSettings settings = tls.value_or(options_.tls);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ == ConnectionState::Connected) return;

      // Abandon any reconnect cycle in flight; the explicit call takes over
      ++generation_;
      attempt = generation_;
      should_reconnect_ = false;
      state_ = ConnectionState::Connecting;
      endpoint_ = endpoint;
      tls_ = settings;
    }
    cancel_timers();

    std::shared_ptr<GatewaySocket> socket;
    try {
      socket = open_socket(endpoint, settings);
    } catch (const GatewayError &e) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation_ == attempt) {
          state_ = ConnectionState::Idle;
          endpoint_.reset();
        }
      }
      spdlog::error("[Gateway] {}", e.what());
      throw;
    }

    uint64_t generation = 0;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (generation_ != attempt || state_ != ConnectionState::Connecting) {
        lock.unlock();
        socket->close();
        throw GatewayError(GatewayErrorKind::NotConnected, "Gateway connect aborted by disconnect");
      }
      generation = install_locked(socket);
      should_reconnect_ = true;
    }

    spdlog::info("[Gateway] Connected to {}", endpoint.url);
    start_receive_loop(std::move(socket), generation);
    asio::post(io_ctx_, [this, generation]() {
      schedule_tick(generation);
    });
  }

  void disconnect() {
    Teardown teardown;
    bool was_active = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      was_active = state_ != ConnectionState::Idle || socket_ != nullptr;
      should_reconnect_ = false;
      endpoint_.reset();
      state_ = ConnectionState::Idle;
      teardown = take_connection_locked();
    }

    // Returns only after any reconnect attempt running on the executor has finished
    cancel_timers();
    finish_teardown(std::move(teardown), GatewayError(GatewayErrorKind::NotConnected));
    join_receivers();

    if (was_active) {
      spdlog::info("[Gateway] Disconnected");
    }
  }

  std::future<protocol::ResponseFrame> send(const std::string &method, const protocol::StringMap &params) {
    std::promise<protocol::ResponseFrame> promise;
    auto future = promise.get_future();

    protocol::RequestFrame request;
    request.method = method;
    if (!params.empty()) {
      request.params = params;
    }

    std::shared_ptr<GatewaySocket> socket;
    uint64_t generation = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ != ConnectionState::Connected || !socket_) {
        promise.set_exception(std::make_exception_ptr(GatewayError(GatewayErrorKind::NotConnected)));
        return future;
      }

      do {
        request.id = generate_uuid();
      } while (pending_.count(request.id) > 0);

      pending_.emplace(request.id, PendingRequest{std::move(promise), Clock::now()});
      socket = socket_;
      generation = generation_;
    }

    std::string raw;
    try {
      raw = request.to_json().dump();
    } catch (const protocol::json::exception &e) {
      fail_pending(request.id, GatewayError(GatewayErrorKind::InvalidFrame, std::string("Cannot encode request: ") + e.what()));
      return future;
    }

    try {
      std::lock_guard<std::mutex> write_lock(write_mutex_);
      socket->send(raw);
    } catch (const std::exception &e) {
      fail_pending(request.id, GatewayError(GatewayErrorKind::Transport, std::string("Gateway send failed: ") + e.what()));
      handle_connection_lost(generation, std::string("send failed: ") + e.what());
    }
    return future;
  }

  void set_event_handler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    event_handler_ = std::move(handler);
  }

  ConnectionState state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
  }

  size_t pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
  }

 private:
  struct PendingRequest {
    std::promise<protocol::ResponseFrame> promise;
    Clock::time_point created_at;
  };

  using PendingMap = std::unordered_map<std::string, PendingRequest>;

  // Connection resources detached from the client, to be released outside the lock
  struct Teardown {
    std::shared_ptr<GatewaySocket> socket;
    PendingMap pending;
  };

  struct ReceiveThread {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  void run_executor() {
    for (;;) {
      try {
        io_ctx_.run();
        return;
      } catch (const std::exception &e) {
        spdlog::error("[Gateway] Executor handler failed: {}", e.what());
      }
    }
  }

  // Run fn on the executor thread and wait for it
  template <typename Fn>
  void run_on_executor(Fn &&fn) {
    if (std::this_thread::get_id() == io_thread_.get_id()) {
      fn();
      return;
    }
    std::promise<void> done;
    auto finished = done.get_future();
    asio::post(io_ctx_, [&fn, &done]() {
      fn();
      done.set_value();
    });
    finished.wait();
  }

  void cancel_timers() {
    run_on_executor([this]() {
      watchdog_timer_.cancel();
      reconnect_timer_.cancel();
    });
  }

  // Factory, socket connect, then fingerprint pinning. Called without mutex_ held.
  std::shared_ptr<GatewaySocket> open_socket(const GatewayEndpoint &endpoint, const GatewayTlsSettings &tls) {
    auto url = net::ParsedUrl::parse(endpoint.url);
    if (!url || !url->is_websocket()) {
      throw GatewayError(GatewayErrorKind::InvalidEndpoint, "Invalid gateway endpoint '" + endpoint.url + "'");
    }

    std::shared_ptr<GatewaySocket> socket;
    try {
      socket = options_.socket_factory();
      if (!socket) {
        throw SocketError("socket factory returned no socket");
      }
      socket->connect(endpoint.url);
    } catch (const std::exception &e) {
      if (socket) socket->close();
      throw GatewayError(GatewayErrorKind::ConnectFailed, "Gateway connect to " + endpoint.url + " failed: " + e.what());
    }

    // The handshake's own fingerprint wins over the one the caller passed in
    GatewayEndpoint observed = endpoint;
    if (auto fingerprint = socket->server_fingerprint()) {
      observed.server_fingerprint = std::move(fingerprint);
    }

    if (!fingerprint_matches(tls, observed)) {
      socket->close();
      throw GatewayError(GatewayErrorKind::TlsFingerprintMismatch,
                         "Gateway TLS fingerprint mismatch (expected '" + tls.expected_fingerprint.value_or("") +
                             "', observed '" + observed.server_fingerprint.value_or("") + "')");
    }
    return socket;
  }

  uint64_t install_locked(std::shared_ptr<GatewaySocket> socket) {
    ++generation_;
    socket_ = std::move(socket);
    state_ = ConnectionState::Connected;
    last_inbound_ = Clock::now();
    backoff_ = initial_backoff_;
    return generation_;
  }

  Teardown take_connection_locked() {
    ++generation_;
    Teardown teardown;
    teardown.socket = std::move(socket_);
    socket_.reset();
    teardown.pending.swap(pending_);
    return teardown;
  }

  static void finish_teardown(Teardown teardown, const GatewayError &error) {
    if (teardown.socket) {
      teardown.socket->close();
    }

    auto now = Clock::now();
    for (auto &[id, entry] : teardown.pending) {
      auto age = std::chrono::duration_cast<milliseconds>(now - entry.created_at).count();
      spdlog::debug("[Gateway] Failing request {} after {}ms: {}", id, age, error.what());
      entry.promise.set_exception(std::make_exception_ptr(error));
    }
  }

  void fail_pending(const std::string &id, const GatewayError &error) {
    PendingMap::node_type node;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = pending_.find(id);
      if (it == pending_.end()) return;
      node = pending_.extract(it);
    }
    node.mapped().promise.set_exception(std::make_exception_ptr(error));
  }

  // Shared teardown path for receive failure, send failure and watchdog timeout
  void handle_connection_lost(uint64_t generation, const std::string &reason) {
    Teardown teardown;
    bool reconnect = false;
    uint64_t next = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (generation != generation_ || state_ != ConnectionState::Connected) return;

      teardown = take_connection_locked();
      reconnect = should_reconnect_ && endpoint_.has_value();
      state_ = reconnect ? ConnectionState::ReconnectWaiting : ConnectionState::Idle;
      next = generation_;
    }

    spdlog::warn("[Gateway] Connection lost: {} ({} pending requests failed)", reason, teardown.pending.size());
    finish_teardown(std::move(teardown), GatewayError(GatewayErrorKind::Transport, "Gateway connection lost: " + reason));

    if (reconnect) {
      asio::post(io_ctx_, [this, next]() {
        schedule_reconnect(next);
      });
    }
  }

  // ---------- receive loop ----------

  void start_receive_loop(std::shared_ptr<GatewaySocket> socket, uint64_t generation) {
    std::weak_ptr<Impl> weak = weak_from_this();
    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([weak, socket = std::move(socket), generation, finished]() {
      receive_loop(weak, socket, generation);
      finished->store(true);
    });

    std::lock_guard<std::mutex> lock(receivers_mutex_);
    // Threads of earlier connections that already returned
    auto done = std::partition(receivers_.begin(), receivers_.end(), [](const ReceiveThread &receiver) {
      return !receiver.finished->load();
    });
    for (auto it = done; it != receivers_.end(); ++it) {
      it->thread.join();
    }
    receivers_.erase(done, receivers_.end());
    receivers_.push_back(ReceiveThread{std::move(thread), std::move(finished)});
  }

  static void receive_loop(const std::weak_ptr<Impl> &weak, const std::shared_ptr<GatewaySocket> &socket, uint64_t generation) {
    for (;;) {
      std::string raw;
      try {
        raw = socket->receive();
      } catch (const std::exception &e) {
        if (auto self = weak.lock()) {
          self->handle_connection_lost(generation, std::string("receive failed: ") + e.what());
        }
        return;
      }

      auto self = weak.lock();
      if (!self || !self->handle_inbound(generation, raw)) {
        return;
      }
    }
  }

  // Every socket is closed before this runs, so each loop is on its way out.
  // A loop calling disconnect() from its event handler cannot wait for itself.
  void join_receivers() {
    std::vector<ReceiveThread> receivers;
    {
      std::lock_guard<std::mutex> lock(receivers_mutex_);
      receivers.swap(receivers_);
    }

    for (auto &receiver : receivers) {
      if (receiver.thread.get_id() == std::this_thread::get_id()) {
        receiver.thread.detach();
      } else {
        receiver.thread.join();
      }
    }
  }

  // Returns false once the connection this loop serves is gone
  bool handle_inbound(uint64_t generation, const std::string &raw) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (generation != generation_) return false;
      last_inbound_ = Clock::now();
    }

    protocol::Frame frame;
    try {
      frame = protocol::decode_frame(raw);
    } catch (const protocol::ProtocolError &e) {
      spdlog::warn("[Gateway] Dropping malformed frame: {}", e.what());
      return true;
    }

    if (auto *response = std::get_if<protocol::ResponseFrame>(&frame)) {
      resolve_pending(std::move(*response));
    } else if (auto *event = std::get_if<protocol::EventFrame>(&frame)) {
      dispatch_event(*event);
    } else {
      spdlog::debug("[Gateway] Ignoring inbound request frame");
    }
    return true;
  }

  void resolve_pending(protocol::ResponseFrame response) {
    PendingMap::node_type node;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = pending_.find(response.id);
      if (it != pending_.end()) {
        node = pending_.extract(it);
      }
    }

    if (node.empty()) {
      spdlog::debug("[Gateway] Dropping response for unknown request {}", response.id);
      return;
    }
    node.mapped().promise.set_value(std::move(response));
  }

  void dispatch_event(const protocol::EventFrame &event) {
    EventHandler handler;
    {
      std::lock_guard<std::mutex> lock(handler_mutex_);
      handler = event_handler_;
    }
    if (!handler) return;

    try {
      handler(event);
    } catch (const std::exception &e) {
      spdlog::error("[Gateway] Event handler failed on '{}': {}", event.event, e.what());
    }
  }

  // ---------- watchdog / reconnect (executor thread) ----------

  void schedule_tick(uint64_t generation) {
    watchdog_timer_.expires_after(tick_interval_);
    watchdog_timer_.async_wait([this, generation](const asio::error_code &ec) {
      if (ec) return;
      on_tick(generation);
    });
  }

  void on_tick(uint64_t generation) {
    milliseconds silence{0};
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (generation != generation_ || state_ != ConnectionState::Connected) return;
      silence = std::chrono::duration_cast<milliseconds>(Clock::now() - last_inbound_);
    }

    if (silence < tick_interval_) {
      schedule_tick(generation);
      return;
    }
    handle_connection_lost(generation, "no traffic for " + std::to_string(silence.count()) + "ms");
  }

  void schedule_reconnect(uint64_t generation) {
    milliseconds delay{0};
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (generation != generation_ || state_ != ConnectionState::ReconnectWaiting) return;
      delay = backoff_;
    }

    spdlog::info("[Gateway] Reconnecting in {}ms", delay.count());
    reconnect_timer_.expires_after(delay);
    reconnect_timer_.async_wait([this, generation](const asio::error_code &ec) {
      if (ec) return;
      attempt_reconnect(generation);
    });
  }

  void attempt_reconnect(uint64_t generation) {
    GatewayEndpoint endpoint;
    GatewayTlsSettings tls;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (generation != generation_ || state_ != ConnectionState::ReconnectWaiting || !endpoint_) return;
      state_ = ConnectionState::Connecting;
      endpoint = *endpoint_;
      tls = tls_;
    }

    std::shared_ptr<GatewaySocket> socket;
    try {
      socket = open_socket(endpoint, tls);
    } catch (const GatewayError &e) {
      bool retry = false;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || state_ != ConnectionState::Connecting) return;

        if (e.is_configuration_error()) {
          state_ = ConnectionState::Idle;
          should_reconnect_ = false;
        } else {
          backoff_ = std::min(backoff_ * 2, max_backoff_);
          state_ = ConnectionState::ReconnectWaiting;
          retry = true;
        }
      }

      if (!retry) {
        spdlog::error("[Gateway] Giving up reconnect: {}", e.what());
        return;
      }
      spdlog::warn("[Gateway] Reconnect attempt failed: {}", e.what());
      schedule_reconnect(generation);
      return;
    }

    uint64_t next = 0;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (generation != generation_ || state_ != ConnectionState::Connecting) {
        lock.unlock();
        socket->close();
        return;
      }
      next = install_locked(socket);
    }

    spdlog::info("[Gateway] Reconnected to {}", endpoint.url);
    start_receive_loop(std::move(socket), next);
    schedule_tick(next);
  }

  GatewayClientOptions options_;
  const milliseconds tick_interval_;
  const milliseconds initial_backoff_;
  const milliseconds max_backoff_;

  asio::io_context io_ctx_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  asio::steady_timer watchdog_timer_;
  asio::steady_timer reconnect_timer_;
  std::thread io_thread_;

  mutable std::mutex mutex_;
  ConnectionState state_ = ConnectionState::Idle;
  std::shared_ptr<GatewaySocket> socket_;
  std::optional<GatewayEndpoint> endpoint_;
  GatewayTlsSettings tls_;
  bool should_reconnect_ = false;
  uint64_t generation_ = 0;
  Clock::time_point last_inbound_;
  milliseconds backoff_;
  PendingMap pending_;

  std::mutex write_mutex_;
  std::mutex connect_mutex_;

  std::mutex handler_mutex_;
  EventHandler event_handler_;

  std::mutex receivers_mutex_;
  std::vector<ReceiveThread> receivers_;
};

// ============================================================
// GatewayClient — delegates to Impl
// ============================================================

GatewayClient::GatewayClient(GatewayClientOptions options) : impl_(std::make_shared<Impl>(std::move(options))) {}

GatewayClient::~GatewayClient() {
  impl_->disconnect();
}

void GatewayClient::connect(const GatewayEndpoint &endpoint, const std::optional<GatewayTlsSettings> &tls) {
  impl_->connect(endpoint, tls);
}

void GatewayClient::disconnect() {
  impl_->disconnect();
}

std::future<protocol::ResponseFrame> GatewayClient::send(const std::string &method, const protocol::StringMap &params) {
  return impl_->send(method, params);
}

void GatewayClient::set_event_handler(EventHandler handler) {
  impl_->set_event_handler(std::move(handler));
}

ConnectionState GatewayClient::state() const {
  return impl_->state();
}

bool GatewayClient::is_connected() const {
  return state() == ConnectionState::Connected;
}

size_t GatewayClient::pending_count() const {
  return impl_->pending_count();
}

}  // namespace openclaw::gateway
