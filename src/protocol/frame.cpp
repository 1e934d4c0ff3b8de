#include "protocol/frame.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <utility>

namespace openclaw::protocol {

namespace {

constexpr std::array<std::pair<ErrorCode, std::string_view>, 5> kErrorCodeNames = {{
    {ErrorCode::NotLinked, "NOT_LINKED"},
    {ErrorCode::NotPaired, "NOT_PAIRED"},
    {ErrorCode::AgentTimeout, "AGENT_TIMEOUT"},
    {ErrorCode::InvalidRequest, "INVALID_REQUEST"},
    {ErrorCode::Unavailable, "UNAVAILABLE"},
}};

// A key holding JSON null is treated the same as a missing key
bool has_field(const json &j, const char *key) {
  auto it = j.find(key);
  return it != j.end() && !it->is_null();
}

std::string require_string(const json &j, const char *key, std::string_view frame) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    throw ProtocolError(std::string(frame) + " frame requires string field '" + key + "'");
  }
  return it->get<std::string>();
}

std::optional<StringMap> optional_string_map(const json &j, const char *key) {
  if (!has_field(j, key)) {
    return std::nullopt;
  }
  auto &value = j.at(key);
  if (!value.is_object()) {
    throw ProtocolError(std::string("field '") + key + "' must be an object");
  }

  StringMap map;
  for (auto it = value.begin(); it != value.end(); ++it) {
    if (!it.value().is_string()) {
      throw ProtocolError(std::string("field '") + key + "." + it.key() + "' must be a string");
    }
    map.emplace(it.key(), it.value().get<std::string>());
  }
  return map;
}

}  // namespace

// ============================================================
// ErrorCode
// ============================================================

std::string to_string(ErrorCode code) {
  for (const auto &[value, name] : kErrorCodeNames) {
    if (value == code) return std::string(name);
  }
  return "UNAVAILABLE";
}

std::optional<ErrorCode> error_code_from_string(std::string_view value) {
  for (const auto &[code, name] : kErrorCodeNames) {
    if (name == value) return code;
  }
  return std::nullopt;
}

// ============================================================
// ErrorShape
// ============================================================

json ErrorShape::to_json() const {
  return json{{"code", to_string(code)}, {"message", message}};
}

ErrorShape ErrorShape::from_json(const json &j) {
  if (!j.is_object()) {
    throw ProtocolError("error shape must be an object");
  }
  auto code_name = require_string(j, "code", "error");
  auto code = error_code_from_string(code_name);
  if (!code) {
    throw ProtocolError("unknown error code '" + code_name + "'");
  }
  return ErrorShape{*code, require_string(j, "message", "error")};
}

// ============================================================
// RequestFrame
// ============================================================

json RequestFrame::to_json() const {
  json j;
  j["type"] = "req";
  j["id"] = id;
  j["method"] = method;
  if (params) {
    j["params"] = *params;
  }
  return j;
}

RequestFrame RequestFrame::from_json(const json &j) {
  RequestFrame frame;
  frame.id = require_string(j, "id", "req");
  frame.method = require_string(j, "method", "req");
  frame.params = optional_string_map(j, "params");
  return frame;
}

// ============================================================
// ResponseFrame
// ============================================================

json ResponseFrame::to_json() const {
  json j;
  j["type"] = "res";
  j["id"] = id;
  j["ok"] = ok;
  if (payload) {
    j["payload"] = *payload;
  }
  if (error) {
    j["error"] = error->to_json();
  }
  return j;
}

ResponseFrame ResponseFrame::from_json(const json &j) {
  ResponseFrame frame;
  frame.id = require_string(j, "id", "res");

  auto ok_it = j.find("ok");
  if (ok_it == j.end() || !ok_it->is_boolean()) {
    throw ProtocolError("res frame requires boolean field 'ok'");
  }
  frame.ok = ok_it->get<bool>();

  frame.payload = optional_string_map(j, "payload");
  if (has_field(j, "error")) {
    frame.error = ErrorShape::from_json(j.at("error"));
  }

  if (frame.ok && frame.error) {
    throw ProtocolError("res frame with ok=true must not carry an error");
  }
  if (!frame.ok && !frame.payload && !frame.error) {
    throw ProtocolError("res frame with ok=false requires payload or error");
  }
  return frame;
}

// ============================================================
// EventFrame
// ============================================================

json EventFrame::to_json() const {
  json j;
  j["type"] = "event";
  j["event"] = event;
  if (payload) {
    j["payload"] = *payload;
  }
  if (seq) {
    j["seq"] = *seq;
  }
  return j;
}

EventFrame EventFrame::from_json(const json &j) {
  EventFrame frame;
  frame.event = require_string(j, "event", "event");
  frame.payload = optional_string_map(j, "payload");
  if (has_field(j, "seq")) {
    auto &seq = j.at("seq");
    if (!seq.is_number_integer()) {
      throw ProtocolError("event field 'seq' must be an integer");
    }
    if (seq.is_number_unsigned() && seq.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      throw ProtocolError("event field 'seq' is out of range");
    }
    frame.seq = seq.get<int64_t>();
  }
  return frame;
}

// ============================================================
// Frame
// ============================================================

Frame decode_frame(std::string_view raw) {
  json j;
  try {
    j = json::parse(raw);
  } catch (const json::parse_error &e) {
    throw ProtocolError(std::string("invalid JSON: ") + e.what());
  }

  if (!j.is_object()) {
    throw ProtocolError("frame must be a JSON object");
  }

  auto type = require_string(j, "type", "gateway");
  if (type == "req") {
    return RequestFrame::from_json(j);
  }
  if (type == "res") {
    return ResponseFrame::from_json(j);
  }
  if (type == "event") {
    return EventFrame::from_json(j);
  }
  throw ProtocolError("unknown frame type '" + type + "'");
}

std::string encode_frame(const Frame &frame) {
  return std::visit(
      [](const auto &f) {
        return f.to_json().dump();
      },
      frame);
}

std::string_view frame_type(const Frame &frame) {
  switch (frame.index()) {
    case 0:
      return "req";
    case 1:
      return "res";
    default:
      return "event";
  }
}

}  // namespace openclaw::protocol
