#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace cs::integrity {

enum class Kind { String, Number, Boolean, Object, Array };

std::string kindToString(Kind k);

// Runtime kind name of a json value, as used in error messages
std::string describeKind(const nlohmann::json& v);

bool matchesKind(const nlohmann::json& v, Kind k);

struct Constraint {
    std::optional<double> min, max;             // numbers
    std::optional<size_t> minLength, maxLength; // strings and arrays
};

// Each element of the array at `path` must be an object carrying these keys
struct ArrayElementRule {
    std::string path;
    std::vector<std::pair<std::string, Kind>> requiredKeys;
    std::vector<std::string> nonNegativeNumbers;
};

// Open-ended key/value object: keys non-empty, values expected to be primitives
struct RecordFieldRule {
    std::string path;
};

// Fixed-shape object whose listed keys must be non-negative numbers
struct ObjectShapeRule {
    std::string path;
    std::vector<std::string> nonNegativeNumbers;
};

struct Schema {
    std::string version = "1.0.0";
    std::vector<std::string> required;
    std::vector<std::pair<std::string, Kind>> kinds;
    std::map<std::string, Constraint> constraints;
    std::vector<std::string> deprecated;
    std::map<std::string, nlohmann::json> defaults;
    std::vector<std::string> nowDefaults; // restored with the ISO-8601 time of recovery

    // deep mode only
    std::vector<ArrayElementRule> arrayElements;
    std::vector<RecordFieldRule> recordFields;
    std::vector<ObjectShapeRule> objectShapes;
};

struct Options {
    bool deepValidation = false;
    bool strictMode = false;      // warnings fail validation
    bool enableRecovery = false;
    std::optional<size_t> maxDataSize;
};

// Game-state layout written by the client: player, inventory, story, flags
Schema defaultGameStateSchema();

}
