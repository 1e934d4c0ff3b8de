#include "core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace openclaw {

namespace fs = std::filesystem;

// ============================================================
// GatewayConfig
// ============================================================

std::string GatewayConfig::url() const {
  return std::string(secure ? "wss" : "ws") + "://" + host + ":" + std::to_string(port);
}

json GatewayConfig::to_json() const {
  json j;
  j["host"] = host;
  j["port"] = port;
  j["auth_mode"] = auth_mode;
  j["secure"] = secure;
  j["tick_interval_ms"] = tick_interval_ms;
  j["initial_reconnect_backoff_ms"] = initial_reconnect_backoff_ms;
  j["max_reconnect_backoff_ms"] = max_reconnect_backoff_ms;

  json tls;
  if (tls_fingerprint) {
    tls["expected_fingerprint"] = *tls_fingerprint;
  }
  tls["required"] = tls_required;
  j["tls"] = tls;
  return j;
}

GatewayConfig GatewayConfig::from_json(const json &j) {
  GatewayConfig cfg;
  cfg.host = j.value("host", cfg.host);
  cfg.port = j.value("port", cfg.port);
  cfg.auth_mode = j.value("auth_mode", cfg.auth_mode);
  cfg.secure = j.value("secure", cfg.secure);
  cfg.tick_interval_ms = j.value("tick_interval_ms", cfg.tick_interval_ms);
  cfg.initial_reconnect_backoff_ms = j.value("initial_reconnect_backoff_ms", cfg.initial_reconnect_backoff_ms);
  cfg.max_reconnect_backoff_ms = j.value("max_reconnect_backoff_ms", cfg.max_reconnect_backoff_ms);

  if (j.contains("tls") && j["tls"].is_object()) {
    auto &tls = j["tls"];
    if (tls.contains("expected_fingerprint") && tls["expected_fingerprint"].is_string()) {
      cfg.tls_fingerprint = tls["expected_fingerprint"].get<std::string>();
    }
    cfg.tls_required = tls.value("required", cfg.tls_required);
  }
  return cfg;
}

// ============================================================
// Config
// ============================================================

json Config::to_json() const {
  json j;
  j["log_level"] = log_level;
  j["gateway"] = gateway.to_json();
  return j;
}

Config Config::from_json(const json &j) {
  Config config;
  config.log_level = j.value("log_level", config.log_level);
  if (j.contains("gateway") && j["gateway"].is_object()) {
    config.gateway = GatewayConfig::from_json(j["gateway"]);
  }
  return config;
}

Config Config::load(const fs::path &path) {
  if (!fs::exists(path)) {
    return Config{};
  }

  std::ifstream file(path);
  if (!file) {
    spdlog::warn("[Config] Cannot open {}", path.string());
    return Config{};
  }

  try {
    auto j = json::parse(file);
    return Config::from_json(j);
  } catch (const json::exception &e) {
    spdlog::warn("[Config] Failed to parse {}: {}", path.string(), e.what());
    return Config{};
  }
}

Config Config::load_default() {
  auto config = load(config_paths::default_config_file());

  if (const char *level = std::getenv("OPENCLAW_LOG_LEVEL")) {
    config.log_level = level;
  }
  return config;
}

void Config::save(const fs::path &path) const {
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }

  std::ofstream file(path);
  if (!file) {
    throw std::runtime_error("Cannot write config file: " + path.string());
  }
  file << to_json().dump(2);
}

// ============================================================
// config_paths
// ============================================================

namespace config_paths {

fs::path home_dir() {
  if (const char *home = std::getenv("HOME")) {
    return fs::path(home);
  }
#ifdef _WIN32
  if (const char *profile = std::getenv("USERPROFILE")) {
    return fs::path(profile);
  }
#endif
  return fs::temp_directory_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "openclaw";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

}  // namespace config_paths

}  // namespace openclaw
