#pragma once

#include "error/CloudError.hpp"
#include "util/timestamp.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cs::queue {

enum class OperationType { Save, Load, Delete, Sync, Custom };

std::string to_string(OperationType type);
OperationType operationTypeFromString(const std::string& s);

struct OperationMetadata {
    std::string ownerId;
    std::optional<unsigned int> slotNumber;
    std::optional<std::string> saveName;
    std::optional<std::string> description;
};

// Durable half of a queued operation. Everything here survives a restart.
struct OperationRecord {
    std::string id;
    OperationType type = OperationType::Custom;
    util::SystemTime createdAt{};
    unsigned int retryCount = 0;
    unsigned int maxRetries = 3;
    int priority = 5;
    nlohmann::json payload;
    OperationMetadata metadata;
};

// In-memory half. Joined to the record by id, never persisted.
struct OperationHandle {
    std::function<void(const nlohmann::json&)> onSuccess;
    std::function<void(const error::OperationError&)> onError;
    std::function<void(unsigned int current, unsigned int total)> onProgress;
};

struct EnqueueOptions {
    int priority = 5;
    std::optional<unsigned int> maxRetries; // queue default when unset
    OperationMetadata metadata;
    OperationHandle handle;
};

struct QueueStatus {
    size_t total = 0;
    size_t pending = 0;     // waiting, including those in backoff
    size_t processing = 0;  // handed to an executor
    size_t failed = 0;      // failed at least once and awaiting retry
    bool isProcessing = false;
    std::optional<util::SystemTime> nextRetryAt;
};

// Result of one drain pass
struct DrainOutcome {
    size_t succeeded = 0;
    size_t failed = 0;      // removed after exhausting retries or a non-retryable error
    size_t retried = 0;     // put back into backoff
    bool skippedOffline = false;
};

void to_json(nlohmann::json& j, const OperationMetadata& m);
void from_json(const nlohmann::json& j, OperationMetadata& m);
void to_json(nlohmann::json& j, const OperationRecord& r);
void from_json(const nlohmann::json& j, OperationRecord& r);
void to_json(nlohmann::json& j, const QueueStatus& s);
void to_json(nlohmann::json& j, const DrainOutcome& o);

}
