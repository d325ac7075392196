#include "crypto/util/hash.hpp"
#include "crypto/util/uuid.hpp"

#include <sodium.h>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cs::crypto::hash {

std::string sha256(const std::string_view data) {
    util::ensure_sodium_init();

    unsigned char digest[crypto_hash_sha256_BYTES];
    if (crypto_hash_sha256(digest, reinterpret_cast<const unsigned char*>(data.data()), data.size()) != 0)
        throw std::runtime_error("SHA-256 digest computation failed");

    std::ostringstream result;
    for (const unsigned char b : digest)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);

    return result.str();
}

bool digestEquals(const std::string_view a, const std::string_view b) {
    if (a.size() != b.size()) return false;
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

}

namespace cs::crypto::encode {

std::string b64_encode(const std::vector<uint8_t>& data) {
    util::ensure_sodium_init();

    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    result.resize(std::strlen(result.c_str())); // Trim null terminator
    return result;
}

std::string b64_encode(const std::string_view data) {
    return b64_encode(std::vector<uint8_t>(data.begin(), data.end()));
}

std::vector<uint8_t> b64_decode(const std::string& b64) {
    util::ensure_sodium_init();

    std::vector<uint8_t> decoded(b64.size() / 4 * 3 + 3);
    size_t out_len = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          b64.c_str(), b64.size(),
                          nullptr, &out_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0)
    {
        throw std::runtime_error("Invalid base64 payload");
    }
    decoded.resize(out_len);
    return decoded;
}

}
