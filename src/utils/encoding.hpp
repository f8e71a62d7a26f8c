#pragma once

#include <cstddef>
#include <string>

namespace agentbox::utils {

std::string Base64Encode(const std::string& data);

// Throws std::invalid_argument on malformed input.
std::string Base64Decode(const std::string& encoded);

bool IsValidUtf8(const std::string& data);

std::string RandomHex(std::size_t bytes);

// Percent-encodes everything outside the RFC 3986 unreserved set, keeping '/'.
std::string UrlEncodePath(const std::string& path);

}  // namespace agentbox::utils
