#include "gateway/endpoint.hpp"

namespace openclaw::gateway {

GatewayEndpoint GatewayEndpoint::from_config(const GatewayConfig &config) {
  return GatewayEndpoint{config.url(), std::nullopt};
}

GatewayTlsSettings GatewayTlsSettings::from_config(const GatewayConfig &config) {
  return GatewayTlsSettings{config.tls_fingerprint, config.tls_required};
}

bool fingerprint_matches(const GatewayTlsSettings &tls, const GatewayEndpoint &endpoint) {
  if (!tls.required) {
    return true;
  }
  if (!tls.expected_fingerprint || !endpoint.server_fingerprint) {
    return false;
  }
  return *tls.expected_fingerprint == *endpoint.server_fingerprint;
}

}  // namespace openclaw::gateway
