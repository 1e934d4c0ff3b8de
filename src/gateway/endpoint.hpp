#pragma once

#include <optional>
#include <string>

#include "core/config.hpp"

namespace openclaw::gateway {

// Where to connect, plus the certificate fingerprint observed for this attempt.
// The fingerprint is only compared for pinning; it plays no part in transport.
struct GatewayEndpoint {
  std::string url;
  std::optional<std::string> server_fingerprint;

  static GatewayEndpoint from_config(const GatewayConfig& config);

  bool operator==(const GatewayEndpoint&) const = default;
};

struct GatewayTlsSettings {
  std::optional<std::string> expected_fingerprint;
  bool required = false;

  static GatewayTlsSettings from_config(const GatewayConfig& config);
};

// Pinning check run once per connect attempt.
// Not required: always passes. Required: exact string equality, and a missing
// fingerprint on either side fails.
bool fingerprint_matches(const GatewayTlsSettings& tls, const GatewayEndpoint& endpoint);

}  // namespace openclaw::gateway
