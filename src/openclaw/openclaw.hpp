#pragma once

// Core types
#include "core/config.hpp"
#include "core/uuid.hpp"
#include "core/version.hpp"

// Wire protocol
#include "protocol/frame.hpp"

// Gateway transport
#include "gateway/client.hpp"
#include "gateway/endpoint.hpp"
#include "gateway/error.hpp"
#include "gateway/loopback_socket.hpp"
#include "gateway/socket.hpp"

namespace openclaw {

// Initialize the SDK: applies the configured log level
void init(const Config& config = Config::load_default());

// Flush logs
void shutdown();

// Get version string
std::string version();

}  // namespace openclaw
