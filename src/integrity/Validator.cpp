#include "integrity/Validator.hpp"
#include "crypto/util/hash.hpp"
#include "error/CloudError.hpp"
#include "log/Registry.hpp"
#include "util/jsonPath.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace cs::integrity;
using namespace cs::log;
namespace jp = cs::util::jsonPath;

namespace {

void addCorrupted(std::vector<std::string>& fields, const std::string& path) {
    if (std::ranges::find(fields, path) == fields.end()) fields.push_back(path);
}

std::vector<std::string> checkConstraint(const nlohmann::json& v, const Constraint& c, const std::string& path) {
    std::vector<std::string> errors;

    if (v.is_number()) {
        const auto n = v.get<double>();
        if (c.min && n < *c.min)
            errors.push_back(fmt::format("Field {} value {} is below minimum {}", path, v.dump(), *c.min));
        if (c.max && n > *c.max)
            errors.push_back(fmt::format("Field {} value {} exceeds maximum {}", path, v.dump(), *c.max));
    }

    if (v.is_array() || v.is_string()) {
        const auto len = v.is_array() ? v.size() : v.get_ref<const std::string&>().size();
        const auto* what = v.is_array() ? "array length" : "length";
        if (c.minLength && len < *c.minLength)
            errors.push_back(fmt::format("Field {} {} {} is below minimum {}", path, what, len, *c.minLength));
        if (c.maxLength && len > *c.maxLength)
            errors.push_back(fmt::format("Field {} {} {} exceeds maximum {}", path, what, len, *c.maxLength));
    }

    return errors;
}

bool isNonNegativeNumber(const nlohmann::json& obj, const std::string& key) {
    const auto it = obj.find(key);
    return it != obj.end() && matchesKind(*it, Kind::Number) && it->get<double>() >= 0;
}

}

Validator::Validator(Schema defaultSchema) : schema_(std::move(defaultSchema)) {}

std::string Validator::generateChecksum(const nlohmann::json& data) const {
    try {
        // Strings hash as their raw text, everything else as its canonical dump
        return crypto::hash::sha256(data.is_string() ? data.get<std::string>() : data.dump());
    } catch (const std::exception& e) {
        throw error::IntegrityError(std::string("Failed to generate data checksum: ") + e.what());
    }
}

bool Validator::verifyChecksum(const nlohmann::json& data, const std::string& expected) const {
    try {
        return crypto::hash::digestEquals(generateChecksum(data), expected);
    } catch (const error::IntegrityError& e) {
        Registry::integrity()->warn("[Validator] Checksum verification failed: {}", e.what());
        return false;
    }
}

StructureReport Validator::validateStructure(const nlohmann::json& data, const Schema& schema,
                                             const Options& options) const {
    StructureReport r;

    for (const auto& field : schema.required) {
        if (jp::has(data, field)) continue;
        r.errors.push_back("Missing required field: " + field);
        addCorrupted(r.corruptedFields, field);
    }

    for (const auto& [path, kind] : schema.kinds) {
        const auto* v = jp::find(data, path);
        if (!v || matchesKind(*v, kind)) continue;
        r.errors.push_back(fmt::format("Invalid type for field {}: expected {}, got {}",
                                       path, kindToString(kind), describeKind(*v)));
        addCorrupted(r.corruptedFields, path);
    }

    for (const auto& [path, constraint] : schema.constraints) {
        const auto* v = jp::find(data, path);
        if (!v) continue;
        auto errs = checkConstraint(*v, constraint, path);
        if (errs.empty()) continue;
        r.errors.insert(r.errors.end(), errs.begin(), errs.end());
        addCorrupted(r.corruptedFields, path);
    }

    for (const auto& path : schema.deprecated)
        if (jp::has(data, path)) r.warnings.push_back("Deprecated field found: " + path);

    if (options.deepValidation) deepValidate(data, schema, r);

    if (options.maxDataSize) {
        const auto size = data.dump().size();
        if (size > *options.maxDataSize)
            r.errors.push_back(fmt::format("Data size exceeds limit: {} > {} bytes", size, *options.maxDataSize));
    }

    r.isValid = r.errors.empty() && (!options.strictMode || r.warnings.empty());
    return r;
}

void Validator::deepValidate(const nlohmann::json& data, const Schema& schema, StructureReport& r) const {
    for (const auto& rule : schema.arrayElements) {
        const auto* arr = jp::find(data, rule.path);
        if (!arr || !arr->is_array()) continue;

        for (size_t i = 0; i < arr->size(); ++i) {
            const auto& el = (*arr)[i];
            const auto base = fmt::format("{}[{}]", rule.path, i);

            if (!el.is_object()) {
                r.errors.push_back("Invalid element at " + base);
                addCorrupted(r.corruptedFields, base);
                continue;
            }

            for (const auto& [key, kind] : rule.requiredKeys) {
                const auto it = el.find(key);
                const bool emptyString = it != el.end() && it->is_string() && it->get_ref<const std::string&>().empty();
                if (it != el.end() && matchesKind(*it, kind) && !emptyString) continue;
                r.errors.push_back(fmt::format("Missing or invalid {} at {}", key, base));
                addCorrupted(r.corruptedFields, base + "." + key);
            }

            for (const auto& key : rule.nonNegativeNumbers) {
                if (isNonNegativeNumber(el, key)) continue;
                r.errors.push_back(fmt::format("Invalid {} at {}", key, base));
                addCorrupted(r.corruptedFields, base + "." + key);
            }
        }
    }

    for (const auto& rule : schema.recordFields) {
        const auto* obj = jp::find(data, rule.path);
        if (!obj || !obj->is_object()) continue;

        for (const auto& [key, value] : obj->items()) {
            if (key.empty()) {
                r.errors.push_back(fmt::format("Invalid key in {}: empty key", rule.path));
                addCorrupted(r.corruptedFields, rule.path + ".");
                continue;
            }
            if (!value.is_primitive() || value.is_null())
                r.warnings.push_back(fmt::format("Unusual value type in {} for {}: {}", rule.path, key, describeKind(value)));
        }
    }

    for (const auto& rule : schema.objectShapes) {
        const auto* obj = jp::find(data, rule.path);
        if (!obj || !obj->is_object()) continue;

        for (const auto& key : rule.nonNegativeNumbers) {
            if (isNonNegativeNumber(*obj, key)) continue;
            r.errors.push_back(fmt::format("Invalid or missing {} entry: {}", rule.path, key));
            addCorrupted(r.corruptedFields, rule.path + "." + key);
        }
    }
}

DataIntegrityResult Validator::validateDataIntegrity(const nlohmann::json& data,
                                                     const std::optional<std::string>& expectedChecksum,
                                                     const Schema* schema,
                                                     const Options& options) const {
    DataIntegrityResult result;
    result.checksum = generateChecksum(data);

    const bool checksumValid = !expectedChecksum || expectedChecksum->empty() ||
                               crypto::hash::digestEquals(result.checksum, *expectedChecksum);

    auto report = validateStructure(data, schema ? *schema : schema_, options);
    result.errors = std::move(report.errors);
    result.warnings = std::move(report.warnings);
    result.corruptedFields = std::move(report.corruptedFields);
    result.isValid = report.isValid && checksumValid;

    if (!checksumValid) {
        result.errors.insert(result.errors.begin(), "Data checksum mismatch - possible corruption detected");
        addCorrupted(result.corruptedFields, "_checksum");
    }

    if (!result.isValid) {
        Registry::integrity()->warn("[Validator] Integrity check failed: {} error(s), {} corrupted field(s)",
                                    result.errors.size(), result.corruptedFields.size());

        if (options.enableRecovery) {
            auto recovery = attemptRecovery(data, result, schema);
            if (recovery.recovered) result.recoveredData = std::move(recovery.data);
            result.warnings.insert(result.warnings.end(), recovery.warnings.begin(), recovery.warnings.end());
        }
    }

    return result;
}

RecoveryResult Validator::attemptRecovery(const nlohmann::json& data, const DataIntegrityResult& prior,
                                          const Schema* schema) const {
    const auto& s = schema ? *schema : schema_;

    RecoveryResult out;
    out.data = data.is_object() ? data : nlohmann::json::object();

    for (const auto& field : prior.corruptedFields) {
        if (const auto it = s.defaults.find(field); it != s.defaults.end())
            jp::set(out.data, field, it->second);
        else if (std::ranges::find(s.nowDefaults, field) != s.nowDefaults.end())
            jp::set(out.data, field, util::nowIso8601());
        else
            continue;
        out.restoredFields.push_back(field);
    }

    out.recovered = !out.restoredFields.empty();
    if (out.recovered) {
        out.warnings.emplace_back("Data recovery attempted - some data may have been restored from defaults");
        Registry::integrity()->info("[Validator] Restored {} field(s) from schema defaults", out.restoredFields.size());
    } else {
        out.warnings.emplace_back("Data recovery attempted - no corrupted field has a default, data left unchanged");
    }

    return out;
}

nlohmann::json Validator::sanitizeForUpload(const nlohmann::json& gameState) const {
    if (!gameState.is_object())
        throw error::IntegrityError("Invalid game state: must be a non-null object", error::ErrorCode::DataInvalid);

    auto sanitized = gameState;
    sanitized.erase("temporaryData");
    sanitized.erase("sessionData");
    sanitized["timestamp"] = util::nowIso8601();

    if (auto it = sanitized.find("inventory"); it != sanitized.end() && it->is_object()) {
        if (auto items = it->find("items"); items != it->end() && items->is_array() && items->size() > MAX_INVENTORY_ITEMS) {
            auto capped = nlohmann::json::array();
            for (size_t i = 0; i < MAX_INVENTORY_ITEMS; ++i) capped.push_back(std::move((*items)[i]));
            *items = std::move(capped);
        }
    }

    return sanitized;
}
