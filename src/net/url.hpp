#pragma once

#include <optional>
#include <string>

namespace openclaw::net {

// Minimal URL splitter for http(s) and ws(s) endpoints
struct ParsedUrl {
  std::string scheme;  // lowercase
  std::string host;
  std::string port;    // empty when not given
  std::string path;    // "/" when not given
  std::string query;   // includes leading '?', or empty

  static std::optional<ParsedUrl> parse(const std::string& url);

  bool is_secure() const {
    return scheme == "https" || scheme == "wss";
  }

  bool is_websocket() const {
    return scheme == "ws" || scheme == "wss";
  }

  std::string port_or_default() const;
};

}  // namespace openclaw::net
