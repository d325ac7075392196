#pragma once

#include "util/timestamp.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace cs::network {

enum class Quality { Excellent, Good, Fair, Poor, Unknown };

// Verdict of the last active probe cycle
enum class ProbeState { Unknown, Reachable, Unreachable };

// Link details reported by the platform ("4g", "wifi", ...)
struct ConnectionInfo {
    std::string connectionType = "unknown";
    std::string effectiveType = "unknown";
    double downlink = 0.0;  // Mbit/s
    double rtt = 0.0;       // ms
    bool saveData = false;
};

struct NetworkStatus {
    bool isOnline = true;
    std::string connectionType = "unknown";
    std::string effectiveType = "unknown";
    double downlink = 0.0;
    double rtt = 0.0;
    bool saveData = false;
    std::optional<util::SystemTime> lastOnline;
    std::optional<util::SystemTime> lastOffline;
    ProbeState probe = ProbeState::Unknown;
};

struct Statistics {
    std::chrono::milliseconds totalOnlineTime{0};
    std::chrono::milliseconds totalOfflineTime{0};
    std::chrono::milliseconds currentSessionDuration{0};
    uint64_t connectionSwitches = 0;
};

std::string to_string(Quality q);
std::string to_string(ProbeState p);

void to_json(nlohmann::json& j, const NetworkStatus& s);
void to_json(nlohmann::json& j, const Statistics& s);

}
