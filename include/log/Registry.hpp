#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace cs::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cfg = {});

    // Re-apply levels after the full configuration is resolved; attaches the file sink if log_dir appeared.
    static void reconfigure(const config::LoggingConfig& cfg);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> cloudsave()  { return get("cloudsave"); }
    static std::shared_ptr<spdlog::logger> queue()      { return get("queue"); }
    static std::shared_ptr<spdlog::logger> network()    { return get("network"); }
    static std::shared_ptr<spdlog::logger> integrity()  { return get("integrity"); }
    static std::shared_ptr<spdlog::logger> storage()    { return get("storage"); }
    static std::shared_ptr<spdlog::logger> config()     { return get("config"); }
    static std::shared_ptr<spdlog::logger> runtime()    { return get("runtime"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    // shared by every subsystem logger
    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static void openMainLog_(const config::LoggingConfig& cfg);
    static void applyLevels_(const config::SubsystemLogLevelsConfig& levels);
};

}
