#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace cs::config {

using EnvSource = std::function<std::optional<std::string>(std::string_view)>;

// Reads from the process environment
EnvSource processEnvironment();

struct ResolveOptions {
    std::optional<std::filesystem::path> configFile;
    nlohmann::json overrides = nlohmann::json::object();
    EnvSource env = processEnvironment();
};

struct ValidationResult {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

// Built-in defaults < config file < environment overlay < caller overrides
Config resolve(const ResolveOptions& opts);

nlohmann::json environmentOverlay(const EnvSource& env);

ValidationResult validate(const Config& config);

[[nodiscard]] bool hasRequiredCredentials(const Config& config);
[[nodiscard]] bool isCloudStorageEnabled(const Config& config);

std::vector<std::string> enabledFeatures(const Config& config);

// e.g. "firebase (enabled) | Features: compression, offline_queue"
std::string summary(const Config& config);

}
