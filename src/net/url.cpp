#include "net/url.hpp"

#include <algorithm>
#include <cctype>

namespace openclaw::net {

std::optional<ParsedUrl> ParsedUrl::parse(const std::string &url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = url.substr(0, scheme_end);
  std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  auto rest = url.substr(scheme_end + 3);
  auto path_start = rest.find_first_of("/?");
  std::string authority = rest.substr(0, path_start);
  if (authority.empty()) {
    return std::nullopt;
  }

  // IPv6 literal: [::1]:8080
  if (authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos) return std::nullopt;
    result.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') return std::nullopt;
      result.port = authority.substr(close + 2);
    }
  } else {
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
      result.host = authority.substr(0, colon);
      result.port = authority.substr(colon + 1);
    } else {
      result.host = authority;
    }
  }

  if (result.host.empty()) return std::nullopt;
  if (!std::all_of(result.port.begin(), result.port.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
      })) {
    return std::nullopt;
  }

  if (path_start == std::string::npos) {
    result.path = "/";
    return result;
  }

  auto target = rest.substr(path_start);
  auto query_start = target.find('?');
  if (query_start == std::string::npos) {
    result.path = target;
  } else {
    result.path = target.substr(0, query_start);
    result.query = target.substr(query_start);
  }
  if (result.path.empty()) {
    result.path = "/";
  }
  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_secure() ? "443" : "80";
}

}  // namespace openclaw::net
