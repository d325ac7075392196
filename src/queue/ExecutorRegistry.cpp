#include "queue/ExecutorRegistry.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace cs::queue;
using namespace cs::log;

void ExecutorRegistry::registerExecutor(const OperationType type, Executor fn) {
    if (type == OperationType::Custom)
        throw std::invalid_argument("Custom executors are registered by name");
    if (!fn) throw std::invalid_argument("Executor for " + to_string(type) + " is empty");

    std::scoped_lock lock(mutex_);
    byType_[type] = std::move(fn);
    Registry::queue()->debug("[ExecutorRegistry] Registered executor for '{}'", to_string(type));
}

void ExecutorRegistry::registerCustom(const std::string& name, Executor fn) {
    if (name.empty()) throw std::invalid_argument("Custom executor name is empty");
    if (!fn) throw std::invalid_argument("Executor for " + name + " is empty");

    std::scoped_lock lock(mutex_);
    custom_[name] = std::move(fn);
    Registry::queue()->debug("[ExecutorRegistry] Registered custom executor '{}'", name);
}

void ExecutorRegistry::unregister(const OperationType type) {
    std::scoped_lock lock(mutex_);
    byType_.erase(type);
}

void ExecutorRegistry::unregisterCustom(const std::string& name) {
    std::scoped_lock lock(mutex_);
    custom_.erase(name);
}

std::string ExecutorRegistry::customName(const nlohmann::json& payload) {
    if (payload.is_object() && payload.contains("executor") && payload.at("executor").is_string())
        return payload.at("executor").get<std::string>();
    return {};
}

std::optional<Executor> ExecutorRegistry::find(const OperationType type, const nlohmann::json& payload) const {
    std::scoped_lock lock(mutex_);

    if (type == OperationType::Custom) {
        if (const auto it = custom_.find(customName(payload)); it != custom_.end()) return it->second;
        return std::nullopt;
    }

    if (const auto it = byType_.find(type); it != byType_.end()) return it->second;
    return std::nullopt;
}

bool ExecutorRegistry::canExecute(const OperationType type, const nlohmann::json& payload) const {
    std::scoped_lock lock(mutex_);
    if (type == OperationType::Custom) return custom_.contains(customName(payload));
    return byType_.contains(type);
}
