#include "config/Resolver.hpp"
#include "config/util.hpp"
#include "error/CloudError.hpp"
#include "log/Registry.hpp"

#include <cstdlib>
#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace cs::config;
using namespace cs::error;

namespace {

struct EnvBinding {
    std::string_view var;
    std::vector<std::string_view> path;
    enum class Kind { String, Bool, Int, Duration, Size, Double } kind;
};

const std::vector<EnvBinding>& envBindings() {
    using K = EnvBinding::Kind;
    static const std::vector<EnvBinding> bindings{
        {"CLOUDSAVE_ENVIRONMENT", {"environment"}, K::String},
        {"CLOUDSAVE_DEBUG", {"debug"}, K::Bool},
        {"CLOUDSAVE_PROVIDER", {"provider", "provider"}, K::String},
        {"CLOUDSAVE_PROVIDER_ENABLED", {"provider", "enabled"}, K::Bool},

        {"CLOUDSAVE_FIREBASE_API_KEY", {"provider", "firebase", "api_key"}, K::String},
        {"CLOUDSAVE_FIREBASE_AUTH_DOMAIN", {"provider", "firebase", "auth_domain"}, K::String},
        {"CLOUDSAVE_FIREBASE_PROJECT_ID", {"provider", "firebase", "project_id"}, K::String},
        {"CLOUDSAVE_FIREBASE_STORAGE_BUCKET", {"provider", "firebase", "storage_bucket"}, K::String},
        {"CLOUDSAVE_FIREBASE_MESSAGING_SENDER_ID", {"provider", "firebase", "messaging_sender_id"}, K::String},
        {"CLOUDSAVE_FIREBASE_APP_ID", {"provider", "firebase", "app_id"}, K::String},
        {"CLOUDSAVE_FIREBASE_MEASUREMENT_ID", {"provider", "firebase", "measurement_id"}, K::String},
        {"CLOUDSAVE_FIREBASE_DATABASE_URL", {"provider", "firebase", "database_url"}, K::String},
        {"CLOUDSAVE_FIREBASE_USE_EMULATOR", {"provider", "firebase", "use_emulator"}, K::Bool},
        {"CLOUDSAVE_FIREBASE_EMULATOR_HOST", {"provider", "firebase", "emulator", "host"}, K::String},
        {"CLOUDSAVE_FIREBASE_EMULATOR_PORT", {"provider", "firebase", "emulator", "port"}, K::Int},

        {"CLOUDSAVE_SUPABASE_URL", {"provider", "supabase", "url"}, K::String},
        {"CLOUDSAVE_SUPABASE_ANON_KEY", {"provider", "supabase", "anon_key"}, K::String},
        {"CLOUDSAVE_SUPABASE_SERVICE_ROLE_KEY", {"provider", "supabase", "service_role_key"}, K::String},

        {"CLOUDSAVE_ENABLE_COMPRESSION", {"features", "compression"}, K::Bool},
        {"CLOUDSAVE_ENABLE_OFFLINE_QUEUE", {"features", "offline_queue"}, K::Bool},
        {"CLOUDSAVE_ENABLE_NETWORK_MONITORING", {"features", "network_monitoring"}, K::Bool},
        {"CLOUDSAVE_ENABLE_AUTO_RETRY", {"features", "auto_retry"}, K::Bool},
        {"CLOUDSAVE_ENABLE_ANALYTICS", {"features", "analytics"}, K::Bool},
        {"CLOUDSAVE_ENABLE_ENCRYPTION", {"features", "encryption"}, K::Bool},

        {"CLOUDSAVE_MAX_SAVES", {"settings", "max_saves"}, K::Int},
        {"CLOUDSAVE_MAX_SAVE_SIZE", {"settings", "max_save_size"}, K::Size},
        {"CLOUDSAVE_RETRY_ATTEMPTS", {"settings", "retry_attempts"}, K::Int},
        {"CLOUDSAVE_DEFAULT_TIMEOUT", {"settings", "default_timeout"}, K::Duration},

        {"CLOUDSAVE_COMPRESSION_LEVEL", {"compression", "level"}, K::String},
        {"CLOUDSAVE_MIN_COMPRESSION_RATIO", {"compression", "minimum_compression_ratio"}, K::Double},

        {"CLOUDSAVE_MAX_QUEUE_SIZE", {"offline_queue", "max_queue_size"}, K::Int},
        {"CLOUDSAVE_MAX_RETRIES", {"offline_queue", "max_retries"}, K::Int},
        {"CLOUDSAVE_RETRY_DELAY", {"offline_queue", "retry_delay"}, K::Duration},
        {"CLOUDSAVE_MAX_RETRY_DELAY", {"offline_queue", "max_retry_delay"}, K::Duration},
        {"CLOUDSAVE_PROCESSING_CONCURRENCY", {"offline_queue", "processing_concurrency"}, K::Int},
        {"CLOUDSAVE_QUEUE_PATH", {"offline_queue", "storage_path"}, K::String},
        {"CLOUDSAVE_AUTO_PROCESS_ONLINE", {"offline_queue", "auto_process_online"}, K::Bool},

        {"CLOUDSAVE_PING_URL", {"network_monitoring", "ping_url"}, K::String},
        {"CLOUDSAVE_PING_INTERVAL", {"network_monitoring", "ping_interval"}, K::Duration},
        {"CLOUDSAVE_PING_TIMEOUT", {"network_monitoring", "ping_timeout"}, K::Duration},
        {"CLOUDSAVE_PING_RETRY_ATTEMPTS", {"network_monitoring", "retry_attempts"}, K::Int},

        {"CLOUDSAVE_LOG_DIR", {"logging", "log_dir"}, K::String},
        {"CLOUDSAVE_LOG_LEVEL", {"logging", "console_log_level"}, K::String},
    };
    return bindings;
}

nlohmann::json convertEnvValue(const EnvBinding& b, const std::string& raw) {
    using K = EnvBinding::Kind;
    try {
        switch (b.kind) {
            case K::String: return raw;
            case K::Bool: return parseBool(raw);
            case K::Int: return std::stoll(raw);
            case K::Double: return std::stod(raw);
            case K::Duration: return parseDuration(raw).count();
            case K::Size: return parseMbOrGbToByte(raw);
        }
    } catch (const std::exception& e) {
        throw ConfigurationError(fmt::format("Invalid value '{}' for {}: {}", raw, b.var, e.what()));
    }
    return raw;
}

void setPath(nlohmann::json& root, const std::vector<std::string_view>& path, nlohmann::json value) {
    nlohmann::json* node = &root;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        auto& child = (*node)[std::string(path[i])];
        if (!child.is_object()) child = nlohmann::json::object();
        node = &child;
    }
    (*node)[std::string(path.back())] = std::move(value);
}

bool allPresent(const std::vector<std::pair<std::string_view, const std::string*>>& fields,
                std::vector<std::string>* missing = nullptr) {
    bool ok = true;
    for (const auto& [name, value] : fields) {
        if (!value->empty()) continue;
        ok = false;
        if (missing) missing->emplace_back(name);
    }
    return ok;
}

std::vector<std::pair<std::string_view, const std::string*>> firebaseCredentials(const FirebaseConfig& f) {
    return {
        {"api_key", &f.api_key},
        {"auth_domain", &f.auth_domain},
        {"project_id", &f.project_id},
        {"storage_bucket", &f.storage_bucket},
        {"messaging_sender_id", &f.messaging_sender_id},
        {"app_id", &f.app_id},
    };
}

std::vector<std::pair<std::string_view, const std::string*>> supabaseCredentials(const SupabaseConfig& s) {
    return {
        {"url", &s.url},
        {"anon_key", &s.anon_key},
    };
}

}

namespace cs::config {

EnvSource processEnvironment() {
    return [](const std::string_view name) -> std::optional<std::string> {
        if (const char* v = std::getenv(std::string(name).c_str())) return std::string(v);
        return std::nullopt;
    };
}

nlohmann::json environmentOverlay(const EnvSource& env) {
    auto overlay = nlohmann::json::object();
    if (!env) return overlay;

    for (const auto& b : envBindings()) {
        const auto raw = env(b.var);
        if (!raw || raw->empty()) continue;
        setPath(overlay, b.path, convertEnvValue(b, *raw));
    }

    // A Firebase API key in the environment opts into the provider unless told otherwise
    if (overlay.contains("provider") && overlay["provider"].contains("firebase") &&
        overlay["provider"]["firebase"].contains("api_key") && !overlay["provider"].contains("enabled"))
        overlay["provider"]["enabled"] = true;

    return overlay;
}

Config resolve(const ResolveOptions& opts) {
    nlohmann::json merged = Config{};

    if (opts.configFile) {
        if (!std::filesystem::exists(*opts.configFile))
            throw ConfigurationError("Config file not found: " + opts.configFile->string(), ErrorCode::ConfigMissing);
        try {
            merged.merge_patch(loadConfigOverlay(*opts.configFile));
        } catch (const ConfigurationError&) {
            throw;
        } catch (const std::exception& e) {
            throw ConfigurationError(fmt::format("Failed to parse {}: {}", opts.configFile->string(), e.what()));
        }
        log::Registry::config()->debug("[Resolver] Applied config file overlay from {}", opts.configFile->string());
    }

    const auto envOverlay = environmentOverlay(opts.env);
    if (!envOverlay.empty()) {
        merged.merge_patch(envOverlay);
        log::Registry::config()->debug("[Resolver] Applied environment overlay ({} sections)", envOverlay.size());
    }

    if (!opts.overrides.is_null() && !opts.overrides.empty()) {
        if (!opts.overrides.is_object()) throw ConfigurationError("Configuration overrides must be an object");
        merged.merge_patch(opts.overrides);
    }

    try {
        return merged.get<Config>();
    } catch (const std::exception& e) {
        throw ConfigurationError(std::string("Invalid configuration value: ") + e.what());
    }
}

ValidationResult validate(const Config& config) {
    ValidationResult r;
    const auto error = [&r](std::string msg) { r.errors.push_back(std::move(msg)); };
    const auto warn = [&r](std::string msg) { r.warnings.push_back(std::move(msg)); };

    const auto& p = config.provider;
    if (p.enabled) {
        std::vector<std::string> missing;
        if (p.provider == ProviderKind::Firebase) {
            if (!allPresent(firebaseCredentials(p.firebase), &missing))
                for (const auto& m : missing) error("Firebase " + m + " is required when cloud storage is enabled");

            if (p.firebase.use_emulator) {
                if (config.environment == Environment::Production)
                    error("Firebase emulator cannot be used in production");
                if (!p.firebase.emulator)
                    warn("Firebase emulator is enabled but no emulator host/port is configured, using localhost:9000");
            }
        } else if (p.provider == ProviderKind::Supabase) {
            if (!allPresent(supabaseCredentials(p.supabase), &missing))
                for (const auto& m : missing) error("Supabase " + m + " is required when cloud storage is enabled");
        }
    }

    const auto& s = config.settings;
    if (s.max_saves < 1) error("max_saves must be at least 1");
    if (s.max_save_size < 1024) warn("max_save_size is very small (< 1KB)");
    if (s.retry_attempts > 10) warn("retry_attempts is very high (> 10), this may cause long delays");

    const auto& c = config.compression;
    if (c.minimum_compression_ratio < 0.0 || c.minimum_compression_ratio > 1.0)
        error("minimum_compression_ratio must be between 0 and 1");
    if (c.chunk_size < 1024) warn("compression chunk_size is very small (< 1KB)");

    const auto& q = config.offline_queue;
    if (q.max_queue_size < 1) error("offline_queue.max_queue_size must be at least 1");
    if (q.processing_concurrency < 1) error("offline_queue.processing_concurrency must be at least 1");
    if (q.max_retries < 1) error("offline_queue.max_retries must be at least 1");
    if (q.retry_delay.count() <= 0) error("offline_queue.retry_delay must be positive");
    if (q.max_retry_delay < q.retry_delay) warn("offline_queue.max_retry_delay is shorter than retry_delay");
    if (q.enable_persistence && q.storage_path.empty())
        error("offline_queue.storage_path is required when persistence is enabled");

    const auto& n = config.network_monitoring;
    if (config.features.network_monitoring) {
        if (n.ping_url.empty()) error("network_monitoring.ping_url is required when monitoring is enabled");
        if (n.ping_interval.count() <= 0) error("network_monitoring.ping_interval must be positive");
        if (n.ping_timeout.count() <= 0) error("network_monitoring.ping_timeout must be positive");
        if (n.retry_attempts < 1) error("network_monitoring.retry_attempts must be at least 1");
        if (n.ping_timeout >= n.ping_interval) warn("network_monitoring.ping_timeout is not shorter than ping_interval");
    }

    if (config.features.encryption) warn("Encryption is not supported yet and will be ignored");
    if (config.environment == Environment::Production && config.debug)
        warn("Debug mode is enabled in production");

    r.isValid = r.errors.empty();
    return r;
}

bool hasRequiredCredentials(const Config& config) {
    switch (config.provider.provider) {
        case ProviderKind::Firebase: return allPresent(firebaseCredentials(config.provider.firebase));
        case ProviderKind::Supabase: return allPresent(supabaseCredentials(config.provider.supabase));
        case ProviderKind::None: return false;
    }
    return false;
}

bool isCloudStorageEnabled(const Config& config) {
    return config.provider.enabled && config.provider.provider != ProviderKind::None && hasRequiredCredentials(config);
}

std::vector<std::string> enabledFeatures(const Config& config) {
    std::vector<std::string> features;
    if (config.features.compression) features.emplace_back("compression");
    if (config.features.offline_queue) features.emplace_back("offline_queue");
    if (config.features.network_monitoring) features.emplace_back("network_monitoring");
    if (config.features.auto_retry) features.emplace_back("auto_retry");
    if (config.features.analytics) features.emplace_back("analytics");
    if (config.features.encryption) features.emplace_back("encryption");
    return features;
}

std::string summary(const Config& config) {
    const auto features = enabledFeatures(config);

    return fmt::format("{} ({}) | Features: {}",
                       providerToString(config.provider.provider),
                       isCloudStorageEnabled(config) ? "enabled" : "disabled",
                       features.empty() ? std::string("none") : fmt::format("{}", fmt::join(features, ", ")));
}

}
