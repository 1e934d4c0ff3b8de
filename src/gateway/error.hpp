#pragma once

#include <stdexcept>
#include <string>

namespace openclaw::gateway {

enum class GatewayErrorKind {
  NotConnected,            // No established connection, or torn down by disconnect()
  ConnectFailed,           // Socket-level connect failure
  InvalidEndpoint,         // URL is not a ws:// or wss:// endpoint
  TlsFingerprintMismatch,  // Pinned fingerprint did not match the observed one
  InvalidFrame,            // Outbound frame could not be encoded
  Transport,               // Write/read failure or watchdog timeout on a live connection
};

std::string to_string(GatewayErrorKind kind);

class GatewayError : public std::runtime_error {
 public:
  GatewayError(GatewayErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

  explicit GatewayError(GatewayErrorKind kind);

  GatewayErrorKind kind() const {
    return kind_;
  }

  // Configuration errors are never retried automatically
  bool is_configuration_error() const {
    return kind_ == GatewayErrorKind::InvalidEndpoint || kind_ == GatewayErrorKind::TlsFingerprintMismatch;
  }

 private:
  GatewayErrorKind kind_;
};

}  // namespace openclaw::gateway
