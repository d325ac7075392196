#include <gtest/gtest.h>
#include "storage/Compressor.hpp"
#include "error/CloudError.hpp"

using namespace cs::storage;
using namespace cs::error;
using Level = cs::config::CompressionConfig::Level;
using json = nlohmann::json;

class CompressorTest : public ::testing::Test {
protected:
    static json repetitiveState() {
        json items = json::array();
        for (int i = 0; i < 400; ++i)
            items.push_back({{"id", "potion_of_minor_healing"}, {"quantity", 1}, {"rarity", "common"}});
        return {{"inventory", {{"items", items}}}, {"version", "1.0.0"}};
    }

    static ErrorCode unpackError(const json& blob) {
        try {
            (void)Compressor::unpack(blob);
        } catch (const OperationError& e) {
            return e.code();
        }
        ADD_FAILURE() << "unpack accepted " << blob.dump();
        return ErrorCode::Unknown;
    }
};

TEST_F(CompressorTest, Pack_CompressesRepetitiveData) {
    const Compressor compressor;
    const auto data = repetitiveState();

    const auto blob = compressor.pack(data);
    EXPECT_EQ(blob.at("encoding"), Compressor::ENCODING_ZLIB);
    EXPECT_EQ(blob.at("originalSize").get<size_t>(), data.dump().size());
    EXPECT_LT(blob.dump().size(), data.dump().size());

    EXPECT_EQ(Compressor::unpack(blob), data);
}

TEST_F(CompressorTest, Pack_SkipsCompressionBelowThreshold) {
    const Compressor compressor;
    const json tiny{{"a", 1}};

    const auto blob = compressor.pack(tiny);
    EXPECT_EQ(blob.at("encoding"), Compressor::ENCODING_RAW);
    EXPECT_EQ(blob.at("data"), tiny);
}

TEST_F(CompressorTest, Pack_RatioOfOneNeverCompresses) {
    const Compressor compressor({.minimum_compression_ratio = 1.0});
    EXPECT_EQ(compressor.pack(repetitiveState()).at("encoding"), Compressor::ENCODING_RAW);
}

TEST_F(CompressorTest, Unpack_SmallChunksStillInflateEverything) {
    const Compressor compressor;
    const auto data = repetitiveState();
    EXPECT_EQ(Compressor::unpack(compressor.pack(data), 16), data);
}

TEST_F(CompressorTest, Unpack_RawBlobReturnsData) {
    const json data{{"player", {{"name", "Aria"}}}};
    EXPECT_EQ(Compressor::unpack(Compressor::raw(data)), data);
}

TEST_F(CompressorTest, Unpack_RejectsMalformedBlobs) {
    EXPECT_EQ(unpackError(json{{"data", 1}}), ErrorCode::DataInvalid);
    EXPECT_EQ(unpackError(json{{"encoding", "lz4"}, {"data", "AAAA"}}), ErrorCode::DataInvalid);
    EXPECT_EQ(unpackError(json{{"encoding", Compressor::ENCODING_ZLIB}, {"data", "AAAA"}}), ErrorCode::DataCorrupted);
    EXPECT_EQ(unpackError(json{{"encoding", Compressor::ENCODING_ZLIB}, {"data", "not base64!"}}), ErrorCode::DataCorrupted);
}

TEST_F(CompressorTest, Level_MapsOntoZlibLevels) {
    EXPECT_EQ(Compressor({.level = Level::Fast}).zlibLevel(), 1);
    EXPECT_EQ(Compressor({.level = Level::Balanced}).zlibLevel(), 6);
    EXPECT_EQ(Compressor({.level = Level::Max}).zlibLevel(), 9);
}

TEST_F(CompressorTest, Deflate_InflateRestoresBytes) {
    const Compressor compressor({.level = Level::Max});
    const std::string text(10000, 'z');

    const auto packed = compressor.deflate(text);
    EXPECT_LT(packed.size(), text.size());
    EXPECT_EQ(Compressor::inflate(packed, text.size()), text);
}

TEST_F(CompressorTest, Unpack_RejectsDeclaredSizeAboveLimit) {
    const Compressor compressor;
    auto blob = compressor.pack(repetitiveState());
    ASSERT_EQ(blob.at("encoding"), Compressor::ENCODING_ZLIB);
    blob["originalSize"] = size_t{1} << 62;

    try {
        (void)Compressor::unpack(blob);
        FAIL() << "expected OperationError";
    } catch (const OperationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DataCorrupted);
        EXPECT_FALSE(e.retryable());
    }
}

TEST_F(CompressorTest, Inflate_StopsAtOutputLimit) {
    const Compressor compressor;
    const std::string zeros(4 * 1024 * 1024, '\0');
    const auto packed = compressor.deflate(zeros);
    ASSERT_LT(packed.size(), 64u * 1024);

    try {
        (void)Compressor::inflate(packed, 0, 16 * 1024, 64 * 1024);
        FAIL() << "expected OperationError";
    } catch (const OperationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DataTooLarge);
        EXPECT_FALSE(e.retryable());
    }

    // exactly at the limit is fine
    EXPECT_EQ(Compressor::inflate(packed, zeros.size(), 16 * 1024, zeros.size()).size(), zeros.size());
}
