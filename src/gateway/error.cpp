#include "gateway/error.hpp"

namespace openclaw::gateway {

namespace {

std::string default_message(GatewayErrorKind kind) {
  switch (kind) {
    case GatewayErrorKind::NotConnected:
      return "Gateway is not connected";
    case GatewayErrorKind::ConnectFailed:
      return "Gateway connect failed";
    case GatewayErrorKind::InvalidEndpoint:
      return "Invalid gateway endpoint";
    case GatewayErrorKind::TlsFingerprintMismatch:
      return "Gateway TLS fingerprint mismatch";
    case GatewayErrorKind::InvalidFrame:
      return "Invalid gateway frame";
    case GatewayErrorKind::Transport:
      return "Gateway transport failure";
  }
  return "Gateway error";
}

}  // namespace

std::string to_string(GatewayErrorKind kind) {
  switch (kind) {
    case GatewayErrorKind::NotConnected:
      return "NotConnected";
    case GatewayErrorKind::ConnectFailed:
      return "ConnectFailed";
    case GatewayErrorKind::InvalidEndpoint:
      return "InvalidEndpoint";
    case GatewayErrorKind::TlsFingerprintMismatch:
      return "TlsFingerprintMismatch";
    case GatewayErrorKind::InvalidFrame:
      return "InvalidFrame";
    case GatewayErrorKind::Transport:
      return "Transport";
  }
  return "Unknown";
}

GatewayError::GatewayError(GatewayErrorKind kind) : GatewayError(kind, default_message(kind)) {}

}  // namespace openclaw::gateway
