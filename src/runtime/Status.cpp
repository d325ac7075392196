#include "runtime/Status.hpp"

#include <nlohmann/json.hpp>

using namespace cs::util;

namespace cs::runtime {

std::string to_string(const Phase phase) {
    switch (phase) {
        case Phase::Idle: return "idle";
        case Phase::LoadingConfig: return "loading-config";
        case Phase::ValidatingConfig: return "validating-config";
        case Phase::InitializingServices: return "initializing-services";
        case Phase::TestingConnections: return "testing-connections";
        case Phase::Finalizing: return "finalizing";
        case Phase::Ready: return "ready";
        case Phase::Failed: return "failed";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const FeatureStatus& f) {
    j = nlohmann::json{
        {"compression", f.compression},
        {"offlineQueue", f.offlineQueue},
        {"networkMonitoring", f.networkMonitoring}
    };
}

void to_json(nlohmann::json& j, const InitializationStatus& s) {
    j = nlohmann::json{
        {"isInitialized", s.isInitialized},
        {"isConfigured", s.isConfigured},
        {"isConnected", s.isConnected},
        {"provider", s.provider},
        {"features", s.features},
        {"errors", s.errors},
        {"warnings", s.warnings},
        {"timestamp", s.timestamp ? nlohmann::json(toIso8601(*s.timestamp)) : nlohmann::json(nullptr)},
        {"phase", to_string(s.phase)}
    };
}

void to_json(nlohmann::json& j, const ConfigurationSummary& s) {
    j = nlohmann::json{
        {"provider", s.provider},
        {"status", s.status},
        {"features", s.features},
        {"errors", s.errors},
        {"warnings", s.warnings}
    };
}

}
