#include "core/uuid.hpp"

#include <array>
#include <cstdint>
#include <mutex>
#include <random>

namespace openclaw {

std::string generate_uuid() {
  static std::mutex mutex;
  static std::mt19937_64 engine{std::random_device{}()};

  std::array<uint8_t, 16> bytes;
  {
    std::lock_guard<std::mutex> lock(mutex);
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(engine);
    uint64_t lo = dist(engine);
    for (int i = 0; i < 8; ++i) {
      bytes[i] = static_cast<uint8_t>(hi >> (i * 8));
      bytes[i + 8] = static_cast<uint8_t>(lo >> (i * 8));
    }
  }

  bytes[6] = (bytes[6] & 0x0f) | 0x40;  // version 4
  bytes[8] = (bytes[8] & 0x3f) | 0x80;  // variant 10xx

  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[bytes[i] >> 4]);
    out.push_back(kHex[bytes[i] & 0x0f]);
  }
  return out;
}

}  // namespace openclaw
