#pragma once

#include "util/timestamp.hpp"

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace cs::runtime {

enum class Phase {
    Idle,
    LoadingConfig,
    ValidatingConfig,
    InitializingServices,
    TestingConnections,
    Finalizing,
    Ready,
    Failed
};

std::string to_string(Phase phase);

struct FeatureStatus {
    bool compression = false;
    bool offlineQueue = false;
    bool networkMonitoring = false;
};

struct InitializationStatus {
    bool isInitialized = false;
    bool isConfigured = false;
    bool isConnected = false;
    std::string provider = "none";
    FeatureStatus features;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::optional<util::SystemTime> timestamp;
    Phase phase = Phase::Idle;
};

struct ConfigurationSummary {
    std::string provider = "none";
    std::string status = "not initialized"; // ready | offline | not initialized | failed
    std::vector<std::string> features;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

void to_json(nlohmann::json& j, const FeatureStatus& f);
void to_json(nlohmann::json& j, const InitializationStatus& s);
void to_json(nlohmann::json& j, const ConfigurationSummary& s);

}
