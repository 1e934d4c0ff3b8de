#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace openclaw::protocol {

using json = nlohmann::json;

// Exposed for compatibility negotiation with the gateway process; not carried in frames
inline constexpr int kGatewayProtocolVersion = 3;

// Protocol v3 restricts params and payloads to flat string maps
using StringMap = std::map<std::string, std::string>;

// Raised when inbound text is not a well-formed gateway frame
class ProtocolError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class ErrorCode { NotLinked, NotPaired, AgentTimeout, InvalidRequest, Unavailable };

// Wire spelling, e.g. "NOT_LINKED"
std::string to_string(ErrorCode code);
std::optional<ErrorCode> error_code_from_string(std::string_view value);

// Error carried on a failed response
struct ErrorShape {
  ErrorCode code = ErrorCode::Unavailable;
  std::string message;

  json to_json() const;
  static ErrorShape from_json(const json& j);

  bool operator==(const ErrorShape&) const = default;
};

// {"type":"req","id":...,"method":...,"params":{...}?}
struct RequestFrame {
  std::string id;
  std::string method;
  std::optional<StringMap> params;

  json to_json() const;
  static RequestFrame from_json(const json& j);

  bool operator==(const RequestFrame&) const = default;
};

// {"type":"res","id":...,"ok":...,"payload":{...}?,"error":{...}?}
struct ResponseFrame {
  std::string id;
  bool ok = false;
  std::optional<StringMap> payload;
  std::optional<ErrorShape> error;

  json to_json() const;
  static ResponseFrame from_json(const json& j);

  bool operator==(const ResponseFrame&) const = default;
};

// {"type":"event","event":...,"payload":{...}?,"seq":N?}
// seq is assigned by the server per connection; gaps are for consumers to detect
struct EventFrame {
  std::string event;
  std::optional<StringMap> payload;
  std::optional<int64_t> seq;

  json to_json() const;
  static EventFrame from_json(const json& j);

  bool operator==(const EventFrame&) const = default;
};

using Frame = std::variant<RequestFrame, ResponseFrame, EventFrame>;

// Parse one text frame. Throws ProtocolError on malformed JSON, unknown "type",
// missing discriminators or a failed response carrying neither payload nor error.
Frame decode_frame(std::string_view raw);

std::string encode_frame(const Frame& frame);

// "req", "res" or "event"
std::string_view frame_type(const Frame& frame);

}  // namespace openclaw::protocol
