#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cs::crypto::hash {

// Lowercase hex SHA-256 of the bytes
std::string sha256(std::string_view data);

// Constant-time comparison of two hex digests
bool digestEquals(std::string_view a, std::string_view b);

}

namespace cs::crypto::encode {

std::string b64_encode(const std::vector<uint8_t>& data);
std::string b64_encode(std::string_view data);

std::vector<uint8_t> b64_decode(const std::string& b64);

}
