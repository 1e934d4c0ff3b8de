#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace openclaw::gateway {

// Thrown by socket implementations on connect/send/receive failure
class SocketError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Message-oriented duplex channel to the gateway process.
// One instance serves exactly one connection attempt; the client asks the
// factory for a fresh instance on every reconnect.
class GatewaySocket {
 public:
  virtual ~GatewaySocket() = default;

  virtual void connect(const std::string& url) = 0;

  // Certificate fingerprint seen during the handshake of the last connect().
  // When present it replaces GatewayEndpoint::server_fingerprint for pinning.
  virtual std::optional<std::string> server_fingerprint() const {
    return std::nullopt;
  }

  virtual void send(const std::string& text) = 0;

  // Blocks until the next text frame arrives. Throws once the socket fails or is closed.
  virtual std::string receive() = 0;

  // Best effort. Must wake a thread blocked in receive().
  virtual void close() noexcept = 0;
};

using SocketFactory = std::function<std::unique_ptr<GatewaySocket>()>;

}  // namespace openclaw::gateway
