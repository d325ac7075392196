#include "network/Status.hpp"

#include <nlohmann/json.hpp>

namespace cs::network {

std::string to_string(const Quality q) {
    switch (q) {
        case Quality::Excellent: return "excellent";
        case Quality::Good: return "good";
        case Quality::Fair: return "fair";
        case Quality::Poor: return "poor";
        case Quality::Unknown: return "unknown";
    }
    return "unknown";
}

std::string to_string(const ProbeState p) {
    switch (p) {
        case ProbeState::Unknown: return "unknown";
        case ProbeState::Reachable: return "reachable";
        case ProbeState::Unreachable: return "unreachable";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const NetworkStatus& s) {
    j = {
        {"isOnline", s.isOnline},
        {"connectionType", s.connectionType},
        {"effectiveType", s.effectiveType},
        {"downlink", s.downlink},
        {"rtt", s.rtt},
        {"saveData", s.saveData},
        {"probe", to_string(s.probe)}
    };
    j["lastOnline"] = s.lastOnline ? nlohmann::json(util::toIso8601(*s.lastOnline)) : nlohmann::json(nullptr);
    j["lastOffline"] = s.lastOffline ? nlohmann::json(util::toIso8601(*s.lastOffline)) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const Statistics& s) {
    j = {
        {"totalOnlineTime", s.totalOnlineTime.count()},
        {"totalOfflineTime", s.totalOfflineTime.count()},
        {"currentSessionDuration", s.currentSessionDuration.count()},
        {"connectionSwitches", s.connectionSwitches}
    };
}

}
