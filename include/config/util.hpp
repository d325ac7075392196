#pragma once

#include "config/Config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <string>

namespace cs::config {

// Accepts "250ms", "30s", "5m", "2h" or a bare number of milliseconds.
inline std::chrono::milliseconds parseDuration(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Duration string cannot be empty");

    if (str.size() > 2 && str.substr(str.size() - 2) == "ms")
        return std::chrono::milliseconds(std::stoll(str.substr(0, str.size() - 2)));

    switch (str.back()) {
        case 's': case 'S': return std::chrono::seconds(std::stoll(str.substr(0, str.size() - 1)));
        case 'm': case 'M': return std::chrono::minutes(std::stoll(str.substr(0, str.size() - 1)));
        case 'h': case 'H': return std::chrono::hours(std::stoll(str.substr(0, str.size() - 1)));
        default: break;
    }

    return std::chrono::milliseconds(std::stoll(str));
}

inline uintmax_t parseMbOrGbToByte(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Size string cannot be empty");

    if (str.size() > 2 && (str.substr(str.size() - 2) == "GB" || str.substr(str.size() - 2) == "gb"))
        return std::stoull(str.substr(0, str.size() - 2)) * 1024 * 1024 * 1024;

    if (str.size() > 2 && (str.substr(str.size() - 2) == "MB" || str.substr(str.size() - 2) == "mb"))
        return std::stoull(str.substr(0, str.size() - 2)) * 1024 * 1024;

    if (str.size() > 2 && (str.substr(str.size() - 2) == "KB" || str.substr(str.size() - 2) == "kb"))
        return std::stoull(str.substr(0, str.size() - 2)) * 1024;

    // Bare numbers are bytes
    return std::stoull(str);
}

inline bool parseBool(std::string str) {
    std::ranges::transform(str, str.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (str == "true" || str == "1" || str == "yes" || str == "on") return true;
    if (str == "false" || str == "0" || str == "no" || str == "off") return false;
    throw std::invalid_argument("Invalid boolean value: " + str);
}

inline Environment parseEnvironment(const std::string& str) {
    if (str == "development") return Environment::Development;
    if (str == "staging") return Environment::Staging;
    if (str == "production") return Environment::Production;
    if (str == "test") return Environment::Test;
    throw std::invalid_argument("Invalid environment: " + str);
}

inline std::string environmentToString(const Environment e) {
    switch (e) {
        case Environment::Development: return "development";
        case Environment::Staging: return "staging";
        case Environment::Production: return "production";
        case Environment::Test: return "test";
    }
    return "unknown";
}

inline ProviderKind parseProvider(const std::string& str) {
    if (str == "firebase") return ProviderKind::Firebase;
    if (str == "supabase") return ProviderKind::Supabase;
    if (str == "none") return ProviderKind::None;
    throw std::invalid_argument("Invalid storage provider: " + str);
}

inline std::string providerToString(const ProviderKind p) {
    switch (p) {
        case ProviderKind::Firebase: return "firebase";
        case ProviderKind::Supabase: return "supabase";
        case ProviderKind::None: return "none";
    }
    return "unknown";
}

inline CompressionConfig::Level parseCompressionLevel(const std::string& str) {
    if (str == "fast") return CompressionConfig::Level::Fast;
    if (str == "balanced") return CompressionConfig::Level::Balanced;
    if (str == "max") return CompressionConfig::Level::Max;
    throw std::invalid_argument("Invalid compression level: " + str);
}

inline std::string compressionLevelToString(const CompressionConfig::Level l) {
    switch (l) {
        case CompressionConfig::Level::Fast: return "fast";
        case CompressionConfig::Level::Balanced: return "balanced";
        case CompressionConfig::Level::Max: return "max";
    }
    return "unknown";
}

}
