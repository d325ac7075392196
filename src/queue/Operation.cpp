#include "queue/Operation.hpp"

#include <stdexcept>

using namespace cs::util;

namespace cs::queue {

std::string to_string(const OperationType type) {
    switch (type) {
        case OperationType::Save: return "save";
        case OperationType::Load: return "load";
        case OperationType::Delete: return "delete";
        case OperationType::Sync: return "sync";
        case OperationType::Custom: return "custom";
    }
    return "custom";
}

OperationType operationTypeFromString(const std::string& s) {
    if (s == "save") return OperationType::Save;
    if (s == "load") return OperationType::Load;
    if (s == "delete") return OperationType::Delete;
    if (s == "sync") return OperationType::Sync;
    if (s == "custom") return OperationType::Custom;
    throw std::invalid_argument("Unknown operation type: " + s);
}

void to_json(nlohmann::json& j, const OperationMetadata& m) {
    j = nlohmann::json{{"ownerId", m.ownerId}};
    if (m.slotNumber) j["slotNumber"] = *m.slotNumber;
    if (m.saveName) j["saveName"] = *m.saveName;
    if (m.description) j["description"] = *m.description;
}

void from_json(const nlohmann::json& j, OperationMetadata& m) {
    m.ownerId = j.value("ownerId", std::string{});
    if (j.contains("slotNumber") && !j.at("slotNumber").is_null()) m.slotNumber = j.at("slotNumber").get<unsigned int>();
    if (j.contains("saveName") && !j.at("saveName").is_null()) m.saveName = j.at("saveName").get<std::string>();
    if (j.contains("description") && !j.at("description").is_null()) m.description = j.at("description").get<std::string>();
}

void to_json(nlohmann::json& j, const OperationRecord& r) {
    j = nlohmann::json{
        {"id", r.id},
        {"type", to_string(r.type)},
        {"createdAt", toIso8601(r.createdAt)},
        {"retryCount", r.retryCount},
        {"maxRetries", r.maxRetries},
        {"priority", r.priority},
        {"payload", r.payload},
        {"metadata", r.metadata}
    };
}

void from_json(const nlohmann::json& j, OperationRecord& r) {
    r.id = j.at("id").get<std::string>();
    r.type = operationTypeFromString(j.at("type").get<std::string>());
    r.createdAt = parseIso8601(j.at("createdAt").get<std::string>());
    r.retryCount = j.value("retryCount", 0u);
    r.maxRetries = j.value("maxRetries", 3u);
    r.priority = j.value("priority", 5);
    r.payload = j.contains("payload") ? j.at("payload") : nlohmann::json{};
    r.metadata = j.contains("metadata") ? j.at("metadata").get<OperationMetadata>() : OperationMetadata{};
}

void to_json(nlohmann::json& j, const QueueStatus& s) {
    j = nlohmann::json{
        {"total", s.total},
        {"pending", s.pending},
        {"processing", s.processing},
        {"failed", s.failed},
        {"isProcessing", s.isProcessing},
        {"nextRetryAt", s.nextRetryAt ? nlohmann::json(toIso8601(*s.nextRetryAt)) : nlohmann::json(nullptr)}
    };
}

void to_json(nlohmann::json& j, const DrainOutcome& o) {
    j = nlohmann::json{
        {"succeeded", o.succeeded},
        {"failed", o.failed},
        {"retried", o.retried},
        {"skippedOffline", o.skippedOffline}
    };
}

}
