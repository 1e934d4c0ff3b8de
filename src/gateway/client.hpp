#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "core/config.hpp"
#include "gateway/endpoint.hpp"
#include "gateway/error.hpp"
#include "gateway/socket.hpp"
#include "protocol/frame.hpp"

namespace openclaw::gateway {

enum class ConnectionState { Idle, Connecting, Connected, ReconnectWaiting };

std::string to_string(ConnectionState state);

struct GatewayClientOptions {
  // Invoked once per connect attempt. Empty means LoopbackSocket.
  SocketFactory socket_factory;
  GatewayTlsSettings tls;

  // Silence on the socket for this long counts as a dead connection
  int tick_interval_ms = 30000;
  int initial_reconnect_backoff_ms = 500;
  int max_reconnect_backoff_ms = 5000;

  static GatewayClientOptions from_config(const GatewayConfig& config);
};

// Persistent RPC channel to the local gateway process.
//
// Multiplexes concurrent requests over one socket, forwards server events to an
// event handler, watches the socket for silence and reconnects with exponential
// backoff until disconnect() is called. Every request returned by send() is
// resolved exactly once: by its response, or by a GatewayError when the
// connection goes away.
class GatewayClient {
 public:
  using EventHandler = std::function<void(const protocol::EventFrame& event)>;

  explicit GatewayClient(GatewayClientOptions options = {});
  ~GatewayClient();

  GatewayClient(const GatewayClient&) = delete;
  GatewayClient& operator=(const GatewayClient&) = delete;

  // Throws GatewayError (InvalidEndpoint, ConnectFailed, TlsFingerprintMismatch).
  // No-op when already connected. tls overrides GatewayClientOptions::tls for this
  // connection and every reconnect attempt made for it.
  void connect(const GatewayEndpoint& endpoint, const std::optional<GatewayTlsSettings>& tls = std::nullopt);

  // Idempotent. Stops the watchdog and reconnect cycle, fails all pending requests
  // and waits for the receive thread, including an event handler still running on it.
  // Called from the event handler itself, it does not wait for that handler.
  void disconnect();

  // Responses with ok=false are delivered as-is; the future only throws
  // GatewayError for transport-level failures.
  std::future<protocol::ResponseFrame> send(const std::string& method, const protocol::StringMap& params = {});

  // Called on the receive thread, in socket arrival order
  void set_event_handler(EventHandler handler);

  ConnectionState state() const;
  bool is_connected() const;
  size_t pending_count() const;

 private:
  class Impl;
  std::shared_ptr<Impl> impl_;
};

}  // namespace openclaw::gateway
