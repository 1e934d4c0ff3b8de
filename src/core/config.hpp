#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace openclaw {

using json = nlohmann::json;

// Gateway client connection settings
struct GatewayConfig {
  std::string host = "127.0.0.1";
  int port = 18789;
  std::string auth_mode = "token";
  bool secure = false;  // wss:// instead of ws://

  int tick_interval_ms = 30000;
  int initial_reconnect_backoff_ms = 500;
  int max_reconnect_backoff_ms = 5000;

  std::optional<std::string> tls_fingerprint;  // Expected server certificate fingerprint
  bool tls_required = false;

  std::string url() const;

  json to_json() const;
  static GatewayConfig from_json(const json& j);
};

// Root SDK configuration
struct Config {
  std::string log_level = "info";
  GatewayConfig gateway;

  // Load from a JSON file; missing file or keys keep their defaults
  static Config load(const std::filesystem::path& path);

  // Load from ~/.config/openclaw/config.json plus environment overrides
  static Config load_default();

  void save(const std::filesystem::path& path) const;

  json to_json() const;
  static Config from_json(const json& j);
};

namespace config_paths {

std::filesystem::path home_dir();

// ~/.config/openclaw
std::filesystem::path config_dir();

std::filesystem::path default_config_file();

}  // namespace config_paths

}  // namespace openclaw
