#include "gateway/loopback_socket.hpp"

#include <spdlog/spdlog.h>

#include "protocol/frame.hpp"

namespace openclaw::gateway {

LoopbackSocket::~LoopbackSocket() {
  close();
}

void LoopbackSocket::connect(const std::string &url) {
  std::lock_guard<std::mutex> lock(mutex_);
  open_ = true;
  spdlog::debug("[Loopback] Connected to {}", url);
}

void LoopbackSocket::send(const std::string &text) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
      throw SocketError("Socket is not connected");
    }
  }

  protocol::Frame frame;
  try {
    frame = protocol::decode_frame(text);
  } catch (const protocol::ProtocolError &e) {
    throw SocketError(std::string("Loopback cannot answer frame: ") + e.what());
  }

  auto *request = std::get_if<protocol::RequestFrame>(&frame);
  if (request == nullptr) {
    throw SocketError("Loopback only answers request frames");
  }

  protocol::ResponseFrame response;
  response.id = request->id;
  response.ok = true;
  response.payload = protocol::StringMap{{"status", "accepted"}};
  inject(response.to_json().dump());
}

std::string LoopbackSocket::receive() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]() {
    return !inbox_.empty() || !open_;
  });

  // Frames queued before close() are still delivered
  if (!inbox_.empty()) {
    auto text = std::move(inbox_.front());
    inbox_.pop_front();
    return text;
  }
  throw SocketError("Socket is closed");
}

void LoopbackSocket::close() noexcept {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
  }
  cv_.notify_all();
}

void LoopbackSocket::inject(std::string text) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    inbox_.push_back(std::move(text));
  }
  cv_.notify_one();
}

bool LoopbackSocket::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_;
}

}  // namespace openclaw::gateway
