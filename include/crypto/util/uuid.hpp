#pragma once

#include <sodium.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace cs::crypto::util {

// Crockford Base32 (no I, L, O, U)
// 32 symbols => each char encodes 5 bits
static inline constexpr char kBase32Crockford[] =
    "0123456789ABCDEFGHJKMNPQRSTVWXYZ"; // [0..31]

enum class Case { Upper, Lower };

// thread-safe, idempotent
inline void ensure_sodium_init() {
    static const int init = []{
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

inline std::string b32_crockford_encode(const uint8_t* data, const size_t len, const Case out_case = Case::Upper) {
    if (len == 0) return {};
    std::string out;
    out.reserve((len * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;

    for (size_t i = 0; i < len; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            const uint8_t idx = (buffer >> bits) & 0x1F;
            out.push_back(kBase32Crockford[idx]);
        }
    }

    if (bits > 0) {
        const uint8_t idx = (buffer << (5 - bits)) & 0x1F;
        out.push_back(kBase32Crockford[idx]);
    }

    if (out_case == Case::Lower)
        std::ranges::transform(out.begin(), out.end(), out.begin(),
            [](const unsigned char c){ return static_cast<char>(std::tolower(c)); });

    return out;
}

}
