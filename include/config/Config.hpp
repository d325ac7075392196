#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace cs::config {

constexpr static uintmax_t MAX_SAVE_SIZE_BYTES = 50 * 1024 * 1024; // 50MB

enum class Environment { Development, Staging, Production, Test };

enum class ProviderKind { Firebase, Supabase, None };

struct EmulatorConfig {
    std::string host = "localhost";
    uint16_t port = 9000;
};

struct FirebaseConfig {
    std::string api_key;
    std::string auth_domain;
    std::string project_id;
    std::string storage_bucket;
    std::string messaging_sender_id;
    std::string app_id;
    std::string measurement_id;
    std::string database_url; // derived from project_id when empty
    bool use_emulator = false;
    std::optional<EmulatorConfig> emulator;
};

struct SupabaseConfig {
    std::string url;
    std::string anon_key;
    std::string service_role_key;
    std::string table = "cloud_saves";
};

struct ProviderConfig {
    ProviderKind provider = ProviderKind::Firebase;
    bool enabled = false; // must be explicitly enabled once credentials exist
    FirebaseConfig firebase;
    SupabaseConfig supabase;
};

struct FeaturesConfig {
    bool compression = true;
    bool offline_queue = true;
    bool network_monitoring = true;
    bool auto_retry = true;
    bool analytics = false;
    bool encryption = false;
};

struct SettingsConfig {
    unsigned int max_saves = 10;
    uintmax_t max_save_size = MAX_SAVE_SIZE_BYTES;
    std::chrono::milliseconds default_timeout{30000};
    unsigned int retry_attempts = 3;
    std::chrono::milliseconds retry_delay{1000};
    unsigned int batch_size = 5;
    std::chrono::minutes sync_interval{15};
};

struct CompressionConfig {
    enum class Level { Fast, Balanced, Max };

    Level level = Level::Balanced;
    double minimum_compression_ratio = 0.1; // skip compression when savings fall below this
    size_t chunk_size = 64 * 1024;
};

struct QueueConfig {
    size_t max_queue_size = 100;
    unsigned int max_retries = 3;
    std::chrono::milliseconds retry_delay{1000};
    std::chrono::milliseconds max_retry_delay{30000};
    bool enable_persistence = true;
    std::filesystem::path storage_path = "cloud_save_offline_queue.json";
    unsigned int processing_concurrency = 3;
    bool auto_process_online = true;
};

struct NetworkConfig {
    std::string ping_url = "https://www.google.com/favicon.ico";
    std::chrono::milliseconds ping_interval{30000};
    std::chrono::milliseconds ping_timeout{5000};
    unsigned int retry_attempts = 3;
    std::chrono::milliseconds retry_base_delay{1000};
    bool enable_detailed_info = true;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum cloudsave = spdlog::level::info;   // startup, shutdown, CLI
    spdlog::level::level_enum queue     = spdlog::level::info;   // enqueue, drain, retries
    spdlog::level::level_enum network   = spdlog::level::info;   // transitions, probe failures
    spdlog::level::level_enum integrity = spdlog::level::warn;   // corruption, recovery
    spdlog::level::level_enum storage   = spdlog::level::warn;   // provider errors
    spdlog::level::level_enum config    = spdlog::level::info;
    spdlog::level::level_enum runtime   = spdlog::level::info;   // initializer phases
};

struct LoggingConfig {
    std::filesystem::path log_dir; // empty => console only
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    Environment environment = Environment::Development;
    bool debug = true;

    ProviderConfig provider;
    FeaturesConfig features;
    SettingsConfig settings;
    CompressionConfig compression;
    QueueConfig offline_queue;
    NetworkConfig network_monitoring;

    LoggingConfig logging;
};

// Reads a YAML config file and returns it as a JSON overlay (only the keys present in the file).
nlohmann::json loadConfigOverlay(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const EmulatorConfig& c);
void from_json(const nlohmann::json& j, EmulatorConfig& c);
void to_json(nlohmann::json& j, const FirebaseConfig& c);
void from_json(const nlohmann::json& j, FirebaseConfig& c);
void to_json(nlohmann::json& j, const SupabaseConfig& c);
void from_json(const nlohmann::json& j, SupabaseConfig& c);
void to_json(nlohmann::json& j, const ProviderConfig& c);
void from_json(const nlohmann::json& j, ProviderConfig& c);
void to_json(nlohmann::json& j, const FeaturesConfig& c);
void from_json(const nlohmann::json& j, FeaturesConfig& c);
void to_json(nlohmann::json& j, const SettingsConfig& c);
void from_json(const nlohmann::json& j, SettingsConfig& c);
void to_json(nlohmann::json& j, const CompressionConfig& c);
void from_json(const nlohmann::json& j, CompressionConfig& c);
void to_json(nlohmann::json& j, const QueueConfig& c);
void from_json(const nlohmann::json& j, QueueConfig& c);
void to_json(nlohmann::json& j, const NetworkConfig& c);
void from_json(const nlohmann::json& j, NetworkConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);

} // namespace cs::config
