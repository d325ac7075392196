#pragma once

#include "config/Config.hpp"
#include "queue/ExecutorRegistry.hpp"
#include "queue/Operation.hpp"

#include <memory>
#include <nlohmann/json.hpp>

namespace cs::storage { class Provider; class Compressor; struct SlotRecord; }
namespace cs::integrity { class Validator; }

namespace cs::sync {

// Queue executors for save slots. Outbound game state is sanitised, validated,
// checksummed and packed before upload; inbound state is unpacked,
// checksum-verified and schema-validated (with recovery) after download.
//
// Payloads:
//   save   {"gameState": {...}}
//   load   {}
//   delete {}
//   sync   {"gameState": {...}, "localUpdatedAt"?: ISO-8601}   last write wins
// The slot comes from metadata.slotNumber (or payload["slot"]).
class Executor {
public:
    Executor(std::shared_ptr<storage::Provider> provider,
             std::shared_ptr<integrity::Validator> validator,
             std::shared_ptr<storage::Compressor> compressor, // nullptr stores uncompressed
             config::SettingsConfig settings);

    nlohmann::json save(const nlohmann::json& payload, const queue::OperationMetadata& meta) const;
    nlohmann::json load(const nlohmann::json& payload, const queue::OperationMetadata& meta) const;
    nlohmann::json remove(const nlohmann::json& payload, const queue::OperationMetadata& meta) const;
    nlohmann::json sync(const nlohmann::json& payload, const queue::OperationMetadata& meta) const;

    // Binds save/load/delete/sync; keeps this executor alive through the registry
    static void registerAll(const std::shared_ptr<Executor>& self, queue::ExecutorRegistry& registry);

private:
    std::shared_ptr<storage::Provider> provider_;
    std::shared_ptr<integrity::Validator> validator_;
    std::shared_ptr<storage::Compressor> compressor_;
    config::SettingsConfig settings_;

    [[nodiscard]] unsigned int slotOf(const nlohmann::json& payload, const queue::OperationMetadata& meta) const;
    [[nodiscard]] static const std::string& ownerOf(const queue::OperationMetadata& meta);
    [[nodiscard]] static nlohmann::json gameStateOf(const nlohmann::json& payload);

    nlohmann::json upload(const nlohmann::json& gameState, unsigned int slot, const std::string& owner,
                          const std::string& saveName) const;
    nlohmann::json decode(const storage::SlotRecord& record) const;
};

}
