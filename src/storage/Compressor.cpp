#include "storage/Compressor.hpp"
#include "crypto/util/hash.hpp"
#include "error/CloudError.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <zlib.h>

using namespace cs::storage;
using namespace cs::error;
using namespace cs::log;

Compressor::Compressor(config::CompressionConfig cfg) : cfg_(cfg) {}

int Compressor::zlibLevel() const {
    switch (cfg_.level) {
        case config::CompressionConfig::Level::Fast: return Z_BEST_SPEED;
        case config::CompressionConfig::Level::Balanced: return 6;
        case config::CompressionConfig::Level::Max: return Z_BEST_COMPRESSION;
    }
    return Z_DEFAULT_COMPRESSION;
}

nlohmann::json Compressor::raw(const nlohmann::json& data) {
    return {{"encoding", ENCODING_RAW}, {"data", data}};
}

std::vector<uint8_t> Compressor::deflate(const std::string& bytes) const {
    uLongf outLen = compressBound(static_cast<uLong>(bytes.size()));
    std::vector<uint8_t> out(outLen);

    const int rc = compress2(out.data(), &outLen,
                             reinterpret_cast<const Bytef*>(bytes.data()), static_cast<uLong>(bytes.size()),
                             zlibLevel());
    if (rc != Z_OK)
        throw CloudError(ErrorCode::Internal, "zlib compress2 failed with code " + std::to_string(rc),
                         Severity::High, false);

    out.resize(outLen);
    return out;
}

std::string Compressor::inflate(const std::vector<uint8_t>& bytes, const size_t expectedSize,
                                const size_t chunkSize, const size_t maxBytes) {
    // originalSize comes from the stored blob, never reserve past the limit on its word
    if (expectedSize > maxBytes)
        throw OperationError(ErrorCode::DataCorrupted, fmt::format("Compressed save declares {} bytes, limit is {}",
                                                                   expectedSize, maxBytes), false, Severity::High);

    z_stream zs{};
    if (inflateInit(&zs) != Z_OK)
        throw CloudError(ErrorCode::Internal, "zlib inflateInit failed", Severity::High, false);

    zs.next_in = const_cast<Bytef*>(bytes.data());
    zs.avail_in = static_cast<uInt>(bytes.size());

    std::string out;
    out.reserve(expectedSize);
    std::vector<char> chunk(std::max<size_t>(chunkSize, 1024));

    int rc;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(chunk.data());
        zs.avail_out = static_cast<uInt>(chunk.size());
        rc = ::inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&zs);
            throw OperationError(ErrorCode::DataCorrupted, "Compressed save payload is corrupted (zlib code " +
                                 std::to_string(rc) + ")", false, Severity::High);
        }
        const size_t produced = chunk.size() - zs.avail_out;
        if (out.size() + produced > maxBytes) {
            inflateEnd(&zs);
            throw OperationError(ErrorCode::DataTooLarge, fmt::format("Decompressed save exceeds {} bytes", maxBytes),
                                 false, Severity::High);
        }
        out.append(chunk.data(), produced);
    } while (rc != Z_STREAM_END);

    inflateEnd(&zs);
    return out;
}

nlohmann::json Compressor::pack(const nlohmann::json& data) const {
    const auto text = data.dump();
    if (text.empty()) return raw(data);

    const auto compressed = deflate(text);
    const double saving = 1.0 - static_cast<double>(compressed.size()) / static_cast<double>(text.size());

    if (saving < cfg_.minimum_compression_ratio) {
        Registry::storage()->debug("[Compressor] Skipping compression, saving {:.2f} below threshold {:.2f}",
                                   saving, cfg_.minimum_compression_ratio);
        return raw(data);
    }

    return {
        {"encoding", ENCODING_ZLIB},
        {"data", crypto::encode::b64_encode(compressed)},
        {"originalSize", text.size()}
    };
}

nlohmann::json Compressor::unpack(const nlohmann::json& blob, const size_t chunkSize, const size_t maxBytes) {
    if (!blob.is_object() || !blob.contains("encoding"))
        throw OperationError(ErrorCode::DataInvalid, "Stored save payload has no encoding", false);

    const auto encoding = blob.at("encoding").get<std::string>();
    if (encoding == ENCODING_RAW) return blob.value("data", nlohmann::json());

    if (encoding == ENCODING_ZLIB) {
        std::vector<uint8_t> bytes;
        try {
            bytes = crypto::encode::b64_decode(blob.at("data").get<std::string>());
        } catch (const std::runtime_error& e) {
            throw OperationError(ErrorCode::DataCorrupted, std::string("Stored save payload: ") + e.what(), false);
        }

        const auto text = inflate(bytes, blob.value("originalSize", size_t{0}), chunkSize, maxBytes);
        try {
            return nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            throw OperationError(ErrorCode::DataCorrupted, std::string("Decompressed payload is not JSON: ") + e.what(), false);
        }
    }

    throw OperationError(ErrorCode::DataInvalid, "Unknown save payload encoding: " + encoding, false);
}
