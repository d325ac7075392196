#include <gtest/gtest.h>
#include "integrity/Validator.hpp"
#include "error/CloudError.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <thread>

using namespace cs::integrity;
using json = nlohmann::json;

class IntegrityValidatorTest : public ::testing::Test {
protected:
    Validator validator;

    static json validState() {
        return {
            {"player", {
                {"name", "Aria"},
                {"level", 12},
                {"experience", 3400},
                {"currentArea", "harbor"},
                {"stats", {{"health", 90}, {"mana", 40}, {"strength", 12}, {"agility", 9},
                           {"intelligence", 14}, {"defense", 8}}}
            }},
            {"inventory", {{"items", json::array({{{"id", "sword"}, {"quantity", 1}},
                                                   {{"id", "potion"}, {"quantity", 3}}})}}},
            {"story", {{"currentChapter", 2}, {"completedQuests", json::array({"intro"})}}},
            {"gameFlags", {{"metMerchant", true}}},
            {"version", "1.0.0"},
            {"timestamp", "2026-01-01T00:00:00.000Z"}
        };
    }

    static bool has(const std::vector<std::string>& v, const std::string& s) {
        return std::ranges::find(v, s) != v.end();
    }
};

TEST_F(IntegrityValidatorTest, Checksum_DeterministicAndContentSensitive) {
    const auto a = validState();
    const auto checksum = validator.generateChecksum(a);

    EXPECT_EQ(checksum.size(), 64u);
    EXPECT_EQ(checksum, validator.generateChecksum(validState()));

    auto b = a;
    b["player"]["level"] = 13;
    EXPECT_NE(checksum, validator.generateChecksum(b));
}

TEST_F(IntegrityValidatorTest, Checksum_IndependentOfKeyInsertionOrder) {
    json first = json::object();
    first["b"] = 2;
    first["a"] = 1;

    json second = json::object();
    second["a"] = 1;
    second["b"] = 2;

    EXPECT_EQ(validator.generateChecksum(first), validator.generateChecksum(second));
}

TEST_F(IntegrityValidatorTest, VerifyChecksum_MatchesOnlyTheExactDigest) {
    const auto data = validState();
    const auto checksum = validator.generateChecksum(data);
    EXPECT_TRUE(validator.verifyChecksum(data, checksum));
    EXPECT_FALSE(validator.verifyChecksum(data, std::string(64, '0')));
    EXPECT_FALSE(validator.verifyChecksum(data, checksum.substr(0, 32)));
}

TEST_F(IntegrityValidatorTest, Structure_ValidStatePasses) {
    const auto r = validator.validateStructure(validState(), {.deepValidation = true});
    EXPECT_TRUE(r.isValid) << (r.errors.empty() ? "" : r.errors.front());
    EXPECT_TRUE(r.corruptedFields.empty());
}

TEST_F(IntegrityValidatorTest, Structure_FlagsExactlyMissingAndMistypedFields) {
    auto data = validState();
    data.erase("story");
    data["player"]["level"] = "twelve";

    const auto r = validator.validateStructure(data);
    EXPECT_FALSE(r.isValid);
    EXPECT_TRUE(has(r.errors, "Missing required field: story"));
    EXPECT_TRUE(has(r.errors, "Invalid type for field player.level: expected number, got string"));
    EXPECT_EQ(r.corruptedFields, (std::vector<std::string>{"story", "player.level"}));
}

TEST_F(IntegrityValidatorTest, Structure_ConstraintsReportRanges) {
    auto data = validState();
    data["player"]["level"] = 0;
    data["story"]["currentChapter"] = 101;

    const auto r = validator.validateStructure(data);
    EXPECT_FALSE(r.isValid);
    EXPECT_TRUE(has(r.corruptedFields, "player.level"));
    EXPECT_TRUE(has(r.corruptedFields, "story.currentChapter"));
}

TEST_F(IntegrityValidatorTest, Structure_DeprecatedFieldsWarnAndFailOnlyInStrictMode) {
    auto data = validState();
    data["legacyFlags"] = json::object();

    const auto lenient = validator.validateStructure(data);
    EXPECT_TRUE(lenient.isValid);
    EXPECT_TRUE(has(lenient.warnings, "Deprecated field found: legacyFlags"));

    const auto strict = validator.validateStructure(data, {.strictMode = true});
    EXPECT_FALSE(strict.isValid);
}

TEST_F(IntegrityValidatorTest, Structure_DeepValidationChecksInventoryElements) {
    auto data = validState();
    data["inventory"]["items"][1]["quantity"] = -2;
    data["inventory"]["items"].push_back({{"quantity", 1}});

    const auto shallow = validator.validateStructure(data);
    EXPECT_TRUE(shallow.isValid);

    const auto deep = validator.validateStructure(data, {.deepValidation = true});
    EXPECT_FALSE(deep.isValid);
    EXPECT_TRUE(has(deep.corruptedFields, "inventory.items[1].quantity"));
    EXPECT_TRUE(has(deep.corruptedFields, "inventory.items[2].id"));
}

TEST_F(IntegrityValidatorTest, Structure_MaxDataSizeIsEnforced) {
    const auto r = validator.validateStructure(validState(), {.maxDataSize = 16});
    EXPECT_FALSE(r.isValid);
    ASSERT_FALSE(r.errors.empty());
    EXPECT_EQ(r.errors.back().rfind("Data size exceeds limit", 0), 0u);
}

TEST_F(IntegrityValidatorTest, Integrity_ChecksumMismatchMarksChecksumField) {
    const auto data = validState();
    const auto r = validator.validateDataIntegrity(data, std::string(64, 'a'));

    EXPECT_FALSE(r.isValid);
    EXPECT_EQ(r.errors.front(), "Data checksum mismatch - possible corruption detected");
    EXPECT_TRUE(has(r.corruptedFields, "_checksum"));
    EXPECT_FALSE(r.recoveredData.has_value());
}

TEST_F(IntegrityValidatorTest, Integrity_MatchingChecksumIsValid) {
    const auto data = validState();
    const auto r = validator.validateDataIntegrity(data, validator.generateChecksum(data));
    EXPECT_TRUE(r.isValid);
    EXPECT_EQ(r.checksum, validator.generateChecksum(data));
}

TEST_F(IntegrityValidatorTest, Recovery_TouchesOnlyCorruptedPaths) {
    auto data = validState();
    data["player"]["level"] = "broken";
    data["player"]["stats"]["mana"] = -5;

    const auto r = validator.validateDataIntegrity(data, std::nullopt, nullptr,
                                                   {.deepValidation = true, .enableRecovery = true});
    EXPECT_FALSE(r.isValid);
    ASSERT_TRUE(r.recoveredData.has_value());

    const auto& fixed = *r.recoveredData;
    EXPECT_EQ(fixed["player"]["level"], 1);
    EXPECT_EQ(fixed["player"]["name"], "Aria");
    EXPECT_EQ(fixed["player"]["experience"], 3400);
    EXPECT_EQ(fixed["inventory"], data["inventory"]);
    // player.stats.mana has no default of its own, so the stats object is left alone
    EXPECT_EQ(fixed["player"]["stats"]["mana"], -5);
}

TEST_F(IntegrityValidatorTest, Recovery_TimestampTakesTheTimeOfRecovery) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    const auto before = std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());

    auto data = validState();
    data["timestamp"] = 42;

    const auto r = validator.validateDataIntegrity(data, std::nullopt, nullptr, {.enableRecovery = true});
    ASSERT_TRUE(r.recoveredData.has_value());
    ASSERT_TRUE((*r.recoveredData)["timestamp"].is_string());
    EXPECT_GE(cs::util::parseIso8601((*r.recoveredData)["timestamp"].get<std::string>()), before);
}

TEST_F(IntegrityValidatorTest, Recovery_WithoutDefaultsLeavesDataUnrecovered) {
    const auto data = validState();
    DataIntegrityResult prior;
    prior.corruptedFields = {"_checksum"};

    const auto r = validator.attemptRecovery(data, prior);
    EXPECT_FALSE(r.recovered);
    EXPECT_EQ(r.data, data);
    EXPECT_TRUE(r.restoredFields.empty());
}

TEST_F(IntegrityValidatorTest, Sanitize_DropsTransientSectionsAndCapsInventory) {
    auto data = validState();
    data["temporaryData"] = {{"x", 1}};
    data["sessionData"] = {{"y", 2}};
    data["inventory"]["items"] = json::array();
    for (size_t i = 0; i < Validator::MAX_INVENTORY_ITEMS + 5; ++i)
        data["inventory"]["items"].push_back({{"id", "item" + std::to_string(i)}, {"quantity", 1}});

    const auto clean = validator.sanitizeForUpload(data);
    EXPECT_FALSE(clean.contains("temporaryData"));
    EXPECT_FALSE(clean.contains("sessionData"));
    EXPECT_EQ(clean["inventory"]["items"].size(), Validator::MAX_INVENTORY_ITEMS);
    EXPECT_NE(clean["timestamp"], data["timestamp"]);
}

TEST_F(IntegrityValidatorTest, Sanitize_RejectsNonObjects) {
    EXPECT_THROW((void)validator.sanitizeForUpload(json::array()), cs::error::IntegrityError);
    EXPECT_THROW((void)validator.sanitizeForUpload(nullptr), cs::error::IntegrityError);
}
