#pragma once

#include "integrity/Result.hpp"
#include "integrity/Schema.hpp"

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cs::integrity {

class Validator {
public:
    static constexpr size_t MAX_INVENTORY_ITEMS = 1000;

    explicit Validator(Schema defaultSchema = defaultGameStateSchema());

    // Hex SHA-256 of the canonical dump (object keys sorted). Throws IntegrityError
    // only when the digest itself cannot be computed.
    [[nodiscard]] std::string generateChecksum(const nlohmann::json& data) const;

    [[nodiscard]] bool verifyChecksum(const nlohmann::json& data, const std::string& expected) const;

    [[nodiscard]] StructureReport validateStructure(const nlohmann::json& data,
                                                    const Schema& schema,
                                                    const Options& options = {}) const;

    [[nodiscard]] StructureReport validateStructure(const nlohmann::json& data, const Options& options = {}) const {
        return validateStructure(data, schema_, options);
    }

    [[nodiscard]] DataIntegrityResult validateDataIntegrity(const nlohmann::json& data,
                                                            const std::optional<std::string>& expectedChecksum = std::nullopt,
                                                            const Schema* schema = nullptr,
                                                            const Options& options = {}) const;

    // Replaces exactly the corrupted paths that have a schema default. Never marks data valid.
    [[nodiscard]] RecoveryResult attemptRecovery(const nlohmann::json& data,
                                                 const DataIntegrityResult& prior,
                                                 const Schema* schema = nullptr) const;

    // Copy fit for upload: drops transient sections, stamps timestamp, caps inventory size
    [[nodiscard]] nlohmann::json sanitizeForUpload(const nlohmann::json& gameState) const;

    [[nodiscard]] const Schema& schema() const { return schema_; }

private:
    Schema schema_;

    void deepValidate(const nlohmann::json& data, const Schema& schema, StructureReport& report) const;
};

}
