#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace cs::config {

namespace {

nlohmann::json scalarToJson(const YAML::Node& node) {
    // Quoted scalars stay strings
    if (node.Tag() == "!") return node.Scalar();

    bool b;
    if (YAML::convert<bool>::decode(node, b)) return b;

    int64_t i;
    if (YAML::convert<int64_t>::decode(node, i)) return i;

    double d;
    if (YAML::convert<double>::decode(node, d)) return d;

    return node.Scalar();
}

nlohmann::json yamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            auto obj = nlohmann::json::object();
            for (const auto& kv : node) obj[kv.first.as<std::string>()] = yamlToJson(kv.second);
            return obj;
        }
        case YAML::NodeType::Sequence: {
            auto arr = nlohmann::json::array();
            for (const auto& n : node) arr.push_back(yamlToJson(n));
            return arr;
        }
        case YAML::NodeType::Scalar:
            return scalarToJson(node);
        default:
            return nullptr;
    }
}

template <typename Duration>
Duration readDuration(const nlohmann::json& j, const char* key, const Duration def) {
    if (!j.contains(key) || j.at(key).is_null()) return def;
    const auto& v = j.at(key);
    if (v.is_string()) return std::chrono::duration_cast<Duration>(parseDuration(v.get<std::string>()));
    return std::chrono::duration_cast<Duration>(std::chrono::milliseconds(v.get<int64_t>()));
}

template <typename Duration>
int64_t toMillis(const Duration d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

spdlog::level::level_enum readLevel(const nlohmann::json& j, const char* key, const spdlog::level::level_enum def) {
    if (!j.contains(key)) return def;
    return spdlog::level::from_str(j.at(key).get<std::string>());
}

std::string levelToString(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

uintmax_t readSize(const nlohmann::json& j, const char* key, const uintmax_t def) {
    if (!j.contains(key)) return def;
    const auto& v = j.at(key);
    if (v.is_string()) return parseMbOrGbToByte(v.get<std::string>());
    return v.get<uintmax_t>();
}

}

nlohmann::json loadConfigOverlay(const std::filesystem::path& path) {
    const YAML::Node root = YAML::LoadFile(path.string());
    if (!root.IsMap()) throw std::runtime_error("Config file root must be a map: " + path.string());
    return yamlToJson(root);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"environment", environmentToString(c.environment)},
        {"debug", c.debug},
        {"provider", c.provider},
        {"features", c.features},
        {"settings", c.settings},
        {"compression", c.compression},
        {"offline_queue", c.offline_queue},
        {"network_monitoring", c.network_monitoring},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("environment")) c.environment = parseEnvironment(j.at("environment").get<std::string>());
    c.debug = j.value("debug", c.debug);
    if (j.contains("provider")) j.at("provider").get_to(c.provider);
    if (j.contains("features")) j.at("features").get_to(c.features);
    if (j.contains("settings")) j.at("settings").get_to(c.settings);
    if (j.contains("compression")) j.at("compression").get_to(c.compression);
    if (j.contains("offline_queue")) j.at("offline_queue").get_to(c.offline_queue);
    if (j.contains("network_monitoring")) j.at("network_monitoring").get_to(c.network_monitoring);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const EmulatorConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port}
    };
}

void from_json(const nlohmann::json& j, EmulatorConfig& c) {
    c.host = j.value("host", c.host);
    c.port = j.value("port", c.port);
}

void to_json(nlohmann::json& j, const FirebaseConfig& c) {
    j = {
        {"api_key", c.api_key},
        {"auth_domain", c.auth_domain},
        {"project_id", c.project_id},
        {"storage_bucket", c.storage_bucket},
        {"messaging_sender_id", c.messaging_sender_id},
        {"app_id", c.app_id},
        {"measurement_id", c.measurement_id},
        {"database_url", c.database_url},
        {"use_emulator", c.use_emulator}
    };
    if (c.emulator) j["emulator"] = *c.emulator;
    else j["emulator"] = nullptr;
}

void from_json(const nlohmann::json& j, FirebaseConfig& c) {
    c.api_key = j.value("api_key", c.api_key);
    c.auth_domain = j.value("auth_domain", c.auth_domain);
    c.project_id = j.value("project_id", c.project_id);
    c.storage_bucket = j.value("storage_bucket", c.storage_bucket);
    c.messaging_sender_id = j.value("messaging_sender_id", c.messaging_sender_id);
    c.app_id = j.value("app_id", c.app_id);
    c.measurement_id = j.value("measurement_id", c.measurement_id);
    c.database_url = j.value("database_url", c.database_url);
    c.use_emulator = j.value("use_emulator", c.use_emulator);
    if (j.contains("emulator") && !j.at("emulator").is_null()) {
        EmulatorConfig e = c.emulator.value_or(EmulatorConfig{});
        j.at("emulator").get_to(e);
        c.emulator = e;
    }
}

void to_json(nlohmann::json& j, const SupabaseConfig& c) {
    j = {
        {"url", c.url},
        {"anon_key", c.anon_key},
        {"service_role_key", c.service_role_key},
        {"table", c.table}
    };
}

void from_json(const nlohmann::json& j, SupabaseConfig& c) {
    c.url = j.value("url", c.url);
    c.anon_key = j.value("anon_key", c.anon_key);
    c.service_role_key = j.value("service_role_key", c.service_role_key);
    c.table = j.value("table", c.table);
}

void to_json(nlohmann::json& j, const ProviderConfig& c) {
    j = {
        {"provider", providerToString(c.provider)},
        {"enabled", c.enabled},
        {"firebase", c.firebase},
        {"supabase", c.supabase}
    };
}

void from_json(const nlohmann::json& j, ProviderConfig& c) {
    if (j.contains("provider")) c.provider = parseProvider(j.at("provider").get<std::string>());
    c.enabled = j.value("enabled", c.enabled);
    if (j.contains("firebase")) j.at("firebase").get_to(c.firebase);
    if (j.contains("supabase")) j.at("supabase").get_to(c.supabase);
}

void to_json(nlohmann::json& j, const FeaturesConfig& c) {
    j = {
        {"compression", c.compression},
        {"offline_queue", c.offline_queue},
        {"network_monitoring", c.network_monitoring},
        {"auto_retry", c.auto_retry},
        {"analytics", c.analytics},
        {"encryption", c.encryption}
    };
}

void from_json(const nlohmann::json& j, FeaturesConfig& c) {
    c.compression = j.value("compression", c.compression);
    c.offline_queue = j.value("offline_queue", c.offline_queue);
    c.network_monitoring = j.value("network_monitoring", c.network_monitoring);
    c.auto_retry = j.value("auto_retry", c.auto_retry);
    c.analytics = j.value("analytics", c.analytics);
    c.encryption = j.value("encryption", c.encryption);
}

void to_json(nlohmann::json& j, const SettingsConfig& c) {
    j = {
        {"max_saves", c.max_saves},
        {"max_save_size", c.max_save_size},
        {"default_timeout", toMillis(c.default_timeout)},
        {"retry_attempts", c.retry_attempts},
        {"retry_delay", toMillis(c.retry_delay)},
        {"batch_size", c.batch_size},
        {"sync_interval", toMillis(c.sync_interval)}
    };
}

void from_json(const nlohmann::json& j, SettingsConfig& c) {
    c.max_saves = j.value("max_saves", c.max_saves);
    c.max_save_size = readSize(j, "max_save_size", c.max_save_size);
    c.default_timeout = readDuration(j, "default_timeout", c.default_timeout);
    c.retry_attempts = j.value("retry_attempts", c.retry_attempts);
    c.retry_delay = readDuration(j, "retry_delay", c.retry_delay);
    c.batch_size = j.value("batch_size", c.batch_size);
    c.sync_interval = readDuration(j, "sync_interval", c.sync_interval);
}

void to_json(nlohmann::json& j, const CompressionConfig& c) {
    j = {
        {"level", compressionLevelToString(c.level)},
        {"minimum_compression_ratio", c.minimum_compression_ratio},
        {"chunk_size", c.chunk_size}
    };
}

void from_json(const nlohmann::json& j, CompressionConfig& c) {
    if (j.contains("level")) c.level = parseCompressionLevel(j.at("level").get<std::string>());
    c.minimum_compression_ratio = j.value("minimum_compression_ratio", c.minimum_compression_ratio);
    c.chunk_size = static_cast<size_t>(readSize(j, "chunk_size", c.chunk_size));
}

void to_json(nlohmann::json& j, const QueueConfig& c) {
    j = {
        {"max_queue_size", c.max_queue_size},
        {"max_retries", c.max_retries},
        {"retry_delay", toMillis(c.retry_delay)},
        {"max_retry_delay", toMillis(c.max_retry_delay)},
        {"enable_persistence", c.enable_persistence},
        {"storage_path", c.storage_path.string()},
        {"processing_concurrency", c.processing_concurrency},
        {"auto_process_online", c.auto_process_online}
    };
}

void from_json(const nlohmann::json& j, QueueConfig& c) {
    c.max_queue_size = j.value("max_queue_size", c.max_queue_size);
    c.max_retries = j.value("max_retries", c.max_retries);
    c.retry_delay = readDuration(j, "retry_delay", c.retry_delay);
    c.max_retry_delay = readDuration(j, "max_retry_delay", c.max_retry_delay);
    c.enable_persistence = j.value("enable_persistence", c.enable_persistence);
    if (j.contains("storage_path")) c.storage_path = j.at("storage_path").get<std::string>();
    c.processing_concurrency = j.value("processing_concurrency", c.processing_concurrency);
    c.auto_process_online = j.value("auto_process_online", c.auto_process_online);
}

void to_json(nlohmann::json& j, const NetworkConfig& c) {
    j = {
        {"ping_url", c.ping_url},
        {"ping_interval", toMillis(c.ping_interval)},
        {"ping_timeout", toMillis(c.ping_timeout)},
        {"retry_attempts", c.retry_attempts},
        {"retry_base_delay", toMillis(c.retry_base_delay)},
        {"enable_detailed_info", c.enable_detailed_info}
    };
}

void from_json(const nlohmann::json& j, NetworkConfig& c) {
    c.ping_url = j.value("ping_url", c.ping_url);
    c.ping_interval = readDuration(j, "ping_interval", c.ping_interval);
    c.ping_timeout = readDuration(j, "ping_timeout", c.ping_timeout);
    c.retry_attempts = j.value("retry_attempts", c.retry_attempts);
    c.retry_base_delay = readDuration(j, "retry_base_delay", c.retry_base_delay);
    c.enable_detailed_info = j.value("enable_detailed_info", c.enable_detailed_info);
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"cloudsave", levelToString(c.cloudsave)},
        {"queue", levelToString(c.queue)},
        {"network", levelToString(c.network)},
        {"integrity", levelToString(c.integrity)},
        {"storage", levelToString(c.storage)},
        {"config", levelToString(c.config)},
        {"runtime", levelToString(c.runtime)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.cloudsave = readLevel(j, "cloudsave", c.cloudsave);
    c.queue = readLevel(j, "queue", c.queue);
    c.network = readLevel(j, "network", c.network);
    c.integrity = readLevel(j, "integrity", c.integrity);
    c.storage = readLevel(j, "storage", c.storage);
    c.config = readLevel(j, "config", c.config);
    c.runtime = readLevel(j, "runtime", c.runtime);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"console_log_level", levelToString(c.console_log_level)},
        {"file_log_level", levelToString(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) c.log_dir = j.at("log_dir").get<std::string>();
    c.console_log_level = readLevel(j, "console_log_level", c.console_log_level);
    c.file_log_level = readLevel(j, "file_log_level", c.file_log_level);
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

} // namespace cs::config
