// SDK initialization
#include "openclaw/openclaw.hpp"

#include <spdlog/spdlog.h>

namespace openclaw {

void init(const Config &config) {
  auto level = spdlog::level::from_str(config.log_level);
  if (level == spdlog::level::off && config.log_level != "off") {
    spdlog::warn("Unknown log level '{}', using info", config.log_level);
    level = spdlog::level::info;
  }
  spdlog::set_level(level);
  spdlog::debug("openclaw {} initialized (gateway protocol v{})", kVersion, protocol::kGatewayProtocolVersion);
}

void shutdown() {
  spdlog::default_logger()->flush();
}

std::string version() {
  return kVersion;
}

}  // namespace openclaw
