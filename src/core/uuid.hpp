#pragma once

#include <string>

namespace openclaw {

// Random RFC 4122 version 4 UUID, lowercase hex with dashes
std::string generate_uuid();

}  // namespace openclaw
