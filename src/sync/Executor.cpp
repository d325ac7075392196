#include "sync/Executor.hpp"
#include "storage/Provider.hpp"
#include "storage/Compressor.hpp"
#include "integrity/Validator.hpp"
#include "error/CloudError.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace cs::sync;
using namespace cs::queue;
using namespace cs::error;
using namespace cs::log;
using namespace cs::util;

cs::sync::Executor::Executor(std::shared_ptr<storage::Provider> provider,
                   std::shared_ptr<integrity::Validator> validator,
                   std::shared_ptr<storage::Compressor> compressor,
                   config::SettingsConfig settings)
    : provider_(std::move(provider)),
      validator_(std::move(validator)),
      compressor_(std::move(compressor)),
      settings_(std::move(settings)) {
    if (!provider_) throw std::invalid_argument("sync::Executor requires a storage provider");
    if (!validator_) throw std::invalid_argument("sync::Executor requires a validator");
}

void cs::sync::Executor::registerAll(const std::shared_ptr<cs::sync::Executor>& self, ExecutorRegistry& registry) {
    registry.registerExecutor(OperationType::Save, [self](const auto& p, const auto& m) { return self->save(p, m); });
    registry.registerExecutor(OperationType::Load, [self](const auto& p, const auto& m) { return self->load(p, m); });
    registry.registerExecutor(OperationType::Delete, [self](const auto& p, const auto& m) { return self->remove(p, m); });
    registry.registerExecutor(OperationType::Sync, [self](const auto& p, const auto& m) { return self->sync(p, m); });
}

unsigned int cs::sync::Executor::slotOf(const nlohmann::json& payload, const OperationMetadata& meta) const {
    std::optional<unsigned int> slot = meta.slotNumber;
    if (!slot && payload.is_object() && payload.contains("slot") && payload.at("slot").is_number_integer()
        && payload.at("slot").get<long long>() >= 0)
        slot = payload.at("slot").get<unsigned int>();

    if (!slot) throw OperationError(ErrorCode::DataInvalid, "Operation does not name a save slot", false);
    if (*slot >= settings_.max_saves)
        throw OperationError(ErrorCode::DataInvalid,
                             fmt::format("Slot {} is out of range (max {} saves)", *slot, settings_.max_saves), false);
    return *slot;
}

const std::string& cs::sync::Executor::ownerOf(const OperationMetadata& meta) {
    if (meta.ownerId.empty())
        throw OperationError(ErrorCode::AuthRequired, "Operation has no owner", false);
    return meta.ownerId;
}

nlohmann::json cs::sync::Executor::gameStateOf(const nlohmann::json& payload) {
    if (!payload.is_object() || !payload.contains("gameState"))
        throw OperationError(ErrorCode::DataInvalid, "Payload carries no gameState", false);
    return payload.at("gameState");
}

nlohmann::json cs::sync::Executor::upload(const nlohmann::json& gameState, const unsigned int slot,
                                const std::string& owner, const std::string& saveName) const {
    const auto clean = validator_->sanitizeForUpload(gameState);

    const auto report = validator_->validateStructure(clean, {
        .deepValidation = true,
        .maxDataSize = static_cast<size_t>(settings_.max_save_size)
    });
    if (!report.isValid)
        throw OperationError(ErrorCode::SaveValidationFailed,
                             fmt::format("Save rejected: {}", fmt::join(report.errors, "; ")), false, Severity::High);
    for (const auto& w : report.warnings)
        Registry::integrity()->warn("[SyncExecutor] slot {}: {}", slot, w);

    const auto checksum = validator_->generateChecksum(clean);
    const auto originalSize = clean.dump().size();
    auto blob = compressor_ ? compressor_->pack(clean) : storage::Compressor::raw(clean);
    const auto storedSize = blob.dump().size();

    if (storedSize > settings_.max_save_size)
        throw OperationError(ErrorCode::DataTooLarge,
                             fmt::format("Save is {} bytes, limit is {}", storedSize, settings_.max_save_size), false);

    storage::SlotRecord record{
        .slot = slot,
        .saveName = saveName,
        .blob = std::move(blob),
        .checksum = checksum,
        .updatedAt = std::chrono::system_clock::now(),
        .originalSize = originalSize,
        .storedSize = storedSize
    };
    provider_->putSlot(owner, record);

    Registry::storage()->info("[SyncExecutor] Saved slot {} to {} ({} -> {} bytes)",
                              slot, provider_->name(), originalSize, storedSize);

    return {
        {"slot", slot},
        {"saveName", saveName},
        {"checksum", checksum},
        {"originalSize", originalSize},
        {"storedSize", storedSize},
        {"updatedAt", toIso8601(record.updatedAt)}
    };
}

nlohmann::json cs::sync::Executor::decode(const storage::SlotRecord& record) const {
    const auto data = storage::Compressor::unpack(
        record.blob, compressor_ ? compressor_->config().chunk_size : 64 * 1024,
        static_cast<size_t>(settings_.max_save_size));

    const std::optional<std::string> expected =
        record.checksum.empty() ? std::nullopt : std::optional<std::string>(record.checksum);

    const auto result = validator_->validateDataIntegrity(data, expected, nullptr, {
        .deepValidation = true,
        .enableRecovery = true
    });

    nlohmann::json out{
        {"slot", record.slot},
        {"saveName", record.saveName},
        {"checksum", result.checksum},
        {"updatedAt", toIso8601(record.updatedAt)},
        {"warnings", result.warnings},
        {"recovered", false}
    };

    if (result.isValid) {
        out["gameState"] = data;
        return out;
    }

    if (result.recoveredData) {
        Registry::integrity()->warn("[SyncExecutor] Slot {} was corrupted, recovered fields from defaults: {}",
                                    record.slot, fmt::join(result.corruptedFields, ", "));
        out["gameState"] = *result.recoveredData;
        out["recovered"] = true;
        out["errors"] = result.errors;
        return out;
    }

    const bool checksumMismatch = std::ranges::find(result.corruptedFields, "_checksum") != result.corruptedFields.end();
    throw OperationError(checksumMismatch ? ErrorCode::DataChecksumMismatch : ErrorCode::DataCorrupted,
                         fmt::format("Slot {} is corrupted: {}", record.slot, fmt::join(result.errors, "; ")),
                         false, Severity::High);
}

nlohmann::json cs::sync::Executor::save(const nlohmann::json& payload, const OperationMetadata& meta) const {
    const auto& owner = ownerOf(meta);
    const auto slot = slotOf(payload, meta);
    const auto state = gameStateOf(payload);
    const auto saveName = meta.saveName.value_or(payload.value("saveName", fmt::format("Slot {}", slot)));
    return upload(state, slot, owner, saveName);
}

nlohmann::json cs::sync::Executor::load(const nlohmann::json& payload, const OperationMetadata& meta) const {
    const auto& owner = ownerOf(meta);
    const auto slot = slotOf(payload, meta);

    const auto record = provider_->getSlot(owner, slot);
    if (!record)
        throw OperationError(ErrorCode::StorageNotFound, fmt::format("Slot {} is empty", slot), false, Severity::Low);

    return decode(*record);
}

nlohmann::json cs::sync::Executor::remove(const nlohmann::json& payload, const OperationMetadata& meta) const {
    const auto& owner = ownerOf(meta);
    const auto slot = slotOf(payload, meta);

    const bool existed = provider_->deleteSlot(owner, slot);
    Registry::storage()->info("[SyncExecutor] Deleted slot {} ({})", slot, existed ? "existed" : "already empty");
    return {{"slot", slot}, {"deleted", existed}};
}

nlohmann::json cs::sync::Executor::sync(const nlohmann::json& payload, const OperationMetadata& meta) const {
    const auto& owner = ownerOf(meta);
    const auto slot = slotOf(payload, meta);
    const auto local = gameStateOf(payload);
    const auto saveName = meta.saveName.value_or(payload.value("saveName", fmt::format("Slot {}", slot)));

    const auto remote = provider_->getSlot(owner, slot);
    if (!remote) {
        auto out = upload(local, slot, owner, saveName);
        out["direction"] = "upload";
        return out;
    }

    if (remote->checksum == validator_->generateChecksum(local)) {
        return {{"slot", slot}, {"direction", "none"}, {"checksum", remote->checksum}};
    }

    // Last write wins. Without a local timestamp the local copy is treated as newest.
    std::optional<SystemTime> localTime;
    std::string stamp;
    if (payload.contains("localUpdatedAt") && payload.at("localUpdatedAt").is_string())
        stamp = payload.at("localUpdatedAt").get<std::string>();
    else if (local.is_object() && local.contains("timestamp") && local.at("timestamp").is_string())
        stamp = local.at("timestamp").get<std::string>();

    if (!stamp.empty()) {
        try {
            localTime = parseIso8601(stamp);
        } catch (const std::exception& e) {
            Registry::storage()->warn("[SyncExecutor] Ignoring unparseable local timestamp '{}': {}", stamp, e.what());
        }
    }

    if (!localTime || *localTime >= remote->updatedAt) {
        auto out = upload(local, slot, owner, saveName);
        out["direction"] = "upload";
        return out;
    }

    auto out = decode(*remote);
    out["direction"] = "download";
    return out;
}
