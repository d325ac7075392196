#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cs::integrity {

struct StructureReport {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<std::string> corruptedFields; // deduplicated, first-seen order
};

struct DataIntegrityResult {
    bool isValid = false;
    std::string checksum;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<std::string> corruptedFields;
    std::optional<nlohmann::json> recoveredData;
};

struct RecoveryResult {
    bool recovered = false;
    nlohmann::json data;
    std::vector<std::string> restoredFields;
    std::vector<std::string> warnings;
};

void to_json(nlohmann::json& j, const DataIntegrityResult& r);

}
