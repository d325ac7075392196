#pragma once

#include "crypto/util/uuid.hpp"

#include <array>
#include <chrono>
#include <stdexcept>
#include <sodium.h>
#include <string>
#include <vector>

namespace cs::crypto {

struct IdOptions {
    // Short readable tag in front of every id, e.g. "op"
    std::string prefix = "op";

    // Random bytes per id. 10 bytes => 80 bits => 16 chars.
    size_t random_bytes = 10;

    char separator = '_';

    util::Case out_case = util::Case::Lower;
};

// Operation ids: "<prefix><sep><millis since epoch, base32><random body>".
// The time component keeps ids roughly sortable by creation time.
class IdGenerator {
public:
    explicit IdGenerator(IdOptions opt = {}) : options_(std::move(opt)) {
        util::ensure_sodium_init();
        if (options_.random_bytes == 0) throw std::invalid_argument("random_bytes must be > 0");
        if (options_.separator == ' ' || options_.separator == '\0' || options_.separator == '\n')
            throw std::invalid_argument("bad separator");
    }

    [[nodiscard]] std::string generate() const {
        std::string id;
        const auto body = time_component_() + random_body_();

        if (options_.prefix.empty()) return body;

        id.reserve(options_.prefix.size() + 1 + body.size());
        id.append(options_.prefix);
        id.push_back(options_.separator);
        id.append(body);
        return id;
    }

    [[nodiscard]] const IdOptions& options() const { return options_; }

private:
    [[nodiscard]] std::string time_component_() const {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();

        // 48-bit big-endian millis => 10 chars
        std::array<uint8_t, 6> buf{};
        for (size_t i = 0; i < buf.size(); ++i)
            buf[buf.size() - 1 - i] = static_cast<uint8_t>((static_cast<uint64_t>(ms) >> (8 * i)) & 0xFF);
        return util::b32_crockford_encode(buf.data(), buf.size(), options_.out_case);
    }

    [[nodiscard]] std::string random_body_() const {
        std::vector<uint8_t> buf(options_.random_bytes);
        randombytes_buf(buf.data(), buf.size());
        return util::b32_crockford_encode(buf.data(), buf.size(), options_.out_case);
    }

    IdOptions options_;
};

}
