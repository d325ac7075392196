#pragma once

#include <chrono>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace cs::util {

using SystemTime = std::chrono::system_clock::time_point;

// "2024-03-01T12:34:56.789Z"
inline std::string toIso8601(const SystemTime tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(ms);
    auto rem = ms - secs;
    if (rem.count() < 0) {
        secs -= std::chrono::seconds(1);
        rem += std::chrono::seconds(1);
    }

    const std::time_t t = secs.count();
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << rem.count() << 'Z';
    return oss.str();
}

// Accepts "YYYY-MM-DDTHH:MM:SS[.fff]Z"; fractional digits beyond millis are dropped
inline SystemTime parseIso8601(const std::string& iso) {
    std::tm tm{};
    std::istringstream ss(iso.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + iso);

    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

    if (iso.size() > 20 && iso[19] == '.') {
        int millis = 0, digits = 0;
        for (size_t i = 20; i < iso.size() && std::isdigit(static_cast<unsigned char>(iso[i])); ++i) {
            if (digits < 3) {
                millis = millis * 10 + (iso[i] - '0');
                ++digits;
            }
        }
        while (digits++ < 3) millis *= 10;
        tp += std::chrono::milliseconds(millis);
    }

    return tp;
}

inline std::string nowIso8601() {
    return toIso8601(std::chrono::system_clock::now());
}

} // namespace cs::util
