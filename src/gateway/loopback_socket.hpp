#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>

#include "gateway/socket.hpp"

namespace openclaw::gateway {

// In-process socket that answers every request with an accepted response.
// Default product of the client's socket factory; also handy in tests and demos.
class LoopbackSocket : public GatewaySocket {
 public:
  LoopbackSocket() = default;
  ~LoopbackSocket() override;

  void connect(const std::string& url) override;
  void send(const std::string& text) override;
  std::string receive() override;
  void close() noexcept override;

  // Queue a server-originated frame (events, or arbitrary text)
  void inject(std::string text);

  bool is_open() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> inbox_;
  bool open_ = false;
};

}  // namespace openclaw::gateway
