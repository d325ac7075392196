#pragma once

#include "queue/Operation.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace cs::queue {

// Performs the remote work for one operation. Throws on failure; anything that
// is not an OperationError is normalised by the queue.
using Executor = std::function<nlohmann::json(const nlohmann::json& payload, const OperationMetadata& metadata)>;

// Routes operations to executors by type. Custom operations name their
// executor in payload["executor"].
class ExecutorRegistry {
public:
    void registerExecutor(OperationType type, Executor fn);
    void registerCustom(const std::string& name, Executor fn);

    void unregister(OperationType type);
    void unregisterCustom(const std::string& name);

    [[nodiscard]] std::optional<Executor> find(OperationType type, const nlohmann::json& payload) const;
    [[nodiscard]] bool canExecute(OperationType type, const nlohmann::json& payload) const;

    static std::string customName(const nlohmann::json& payload);

private:
    mutable std::mutex mutex_;
    std::map<OperationType, Executor> byType_;
    std::unordered_map<std::string, Executor> custom_;
};

}
