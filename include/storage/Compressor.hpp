#pragma once

#include "config/Config.hpp"

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cs::storage {

// Stored blob layout:
//   {"encoding": "json",        "data": <value>}
//   {"encoding": "zlib+base64", "data": "<b64>", "originalSize": n}
class Compressor {
public:
    static constexpr const char* ENCODING_RAW = "json";
    static constexpr const char* ENCODING_ZLIB = "zlib+base64";

    explicit Compressor(config::CompressionConfig cfg = {});

    // Compresses unless the saving falls below minimum_compression_ratio
    [[nodiscard]] nlohmann::json pack(const nlohmann::json& data) const;

    // Accepts either encoding regardless of configuration. Compressed payloads
    // inflating past maxBytes are rejected as DataTooLarge.
    [[nodiscard]] static nlohmann::json unpack(const nlohmann::json& blob, size_t chunkSize = 64 * 1024,
                                               size_t maxBytes = config::MAX_SAVE_SIZE_BYTES);

    [[nodiscard]] static nlohmann::json raw(const nlohmann::json& data);

    [[nodiscard]] std::vector<uint8_t> deflate(const std::string& bytes) const;
    [[nodiscard]] static std::string inflate(const std::vector<uint8_t>& bytes, size_t expectedSize = 0,
                                             size_t chunkSize = 64 * 1024,
                                             size_t maxBytes = config::MAX_SAVE_SIZE_BYTES);

    [[nodiscard]] int zlibLevel() const;
    [[nodiscard]] const config::CompressionConfig& config() const { return cfg_; }

private:
    config::CompressionConfig cfg_;
};

}
