#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>

#include "openclaw/openclaw.hpp"

using namespace openclaw;
using namespace openclaw::gateway;

int main() {
  // 1. 加载配置
  auto config = Config::load_default();
  openclaw::init(config);

  std::cout << "=== Gateway Ping (openclaw " << version() << ", protocol v" << protocol::kGatewayProtocolVersion << ") ===\n"
            << std::endl;

  // 2. 创建客户端（默认使用 loopback socket）
  GatewayClient client(GatewayClientOptions::from_config(config.gateway));
  client.set_event_handler([](const protocol::EventFrame& event) {
    std::cout << "[Event] " << event.event;
    if (event.seq) std::cout << " seq=" << *event.seq;
    std::cout << std::endl;
  });

  // 3. 连接
  auto endpoint = GatewayEndpoint::from_config(config.gateway);
  try {
    client.connect(endpoint);
  } catch (const GatewayError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  std::cout << "Connected to " << endpoint.url << std::endl;

  // 4. 发送 connect 请求，最多等待 5 秒
  auto future = client.send("connect", {{"client", "gateway_ping"}, {"authMode", config.gateway.auth_mode}});
  if (future.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
    std::cerr << "[Timeout] No response within 5 seconds." << std::endl;
    client.disconnect();
    return 1;
  }

  int exit_code = 0;
  try {
    auto response = future.get();
    std::cout << "Response ok=" << (response.ok ? "true" : "false") << std::endl;
    if (response.payload) {
      for (const auto& [key, value] : *response.payload) {
        std::cout << "  " << key << ": " << value << std::endl;
      }
    }
    if (response.error) {
      std::cout << "  error: " << protocol::to_string(response.error->code) << " " << response.error->message << std::endl;
      exit_code = 1;
    }
  } catch (const GatewayError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = 1;
  }

  // 5. 清理
  client.disconnect();
  openclaw::shutdown();
  return exit_code;
}
