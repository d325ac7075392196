#include <gtest/gtest.h>
#include "config/Resolver.hpp"
#include "error/CloudError.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace cs::config;
using namespace cs::error;
using namespace std::chrono_literals;

class ConfigTest : public ::testing::Test {
protected:
    std::map<std::string, std::string> env;
    fs::path dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / ("cloudsave_config_" + std::to_string(::getpid()) + "_" + info->name());
        fs::create_directories(dir);
    }

    void TearDown() override { fs::remove_all(dir); }

    EnvSource envSource() const {
        return [vars = env](const std::string_view name) -> std::optional<std::string> {
            const auto it = vars.find(std::string(name));
            if (it == vars.end()) return std::nullopt;
            return it->second;
        };
    }

    fs::path writeYaml(const std::string& body) const {
        const auto path = dir / "cloudsave.yaml";
        std::ofstream out(path);
        out << body;
        return path;
    }

    static bool contains(const std::vector<std::string>& v, const std::string& needle) {
        return std::ranges::find(v, needle) != v.end();
    }

    static Config firebaseEnabled() {
        Config c;
        c.provider.enabled = true;
        c.provider.provider = ProviderKind::Firebase;
        auto& f = c.provider.firebase;
        f.api_key = "key";
        f.auth_domain = "demo.firebaseapp.com";
        f.project_id = "demo";
        f.storage_bucket = "demo.appspot.com";
        f.messaging_sender_id = "1234";
        f.app_id = "1:1234:web:abcd";
        return c;
    }
};

TEST_F(ConfigTest, Resolve_DefaultsWhenNothingSupplied) {
    const auto c = resolve({.env = envSource()});

    EXPECT_FALSE(c.provider.enabled);
    EXPECT_EQ(c.provider.provider, ProviderKind::Firebase);
    EXPECT_TRUE(c.features.offline_queue);
    EXPECT_EQ(c.offline_queue.max_queue_size, 100u);
    EXPECT_EQ(c.offline_queue.max_retries, 3u);
    EXPECT_EQ(c.offline_queue.retry_delay, 1000ms);
    EXPECT_EQ(c.offline_queue.max_retry_delay, 30000ms);
    EXPECT_EQ(c.network_monitoring.ping_interval, 30000ms);
    EXPECT_EQ(c.settings.max_saves, 10u);
}

TEST_F(ConfigTest, Resolve_FileOverlayKeepsUnlistedDefaults) {
    const auto path = writeYaml(
        "offline_queue:\n"
        "  retry_delay: 2s\n"
        "  max_retries: 5\n"
        "network_monitoring:\n"
        "  ping_url: \"https://status.example.com/ping\"\n");

    const auto c = resolve({.configFile = path, .env = envSource()});

    EXPECT_EQ(c.offline_queue.retry_delay, 2000ms);
    EXPECT_EQ(c.offline_queue.max_retries, 5u);
    EXPECT_EQ(c.offline_queue.max_queue_size, 100u);
    EXPECT_EQ(c.network_monitoring.ping_url, "https://status.example.com/ping");
    EXPECT_EQ(c.network_monitoring.ping_timeout, 5000ms);
}

TEST_F(ConfigTest, Resolve_PrecedenceFileThenEnvThenOverrides) {
    const auto path = writeYaml("offline_queue:\n  max_retries: 5\n  max_queue_size: 20\n");
    env["CLOUDSAVE_MAX_RETRIES"] = "7";

    const auto fromEnv = resolve({.configFile = path, .env = envSource()});
    EXPECT_EQ(fromEnv.offline_queue.max_retries, 7u);
    EXPECT_EQ(fromEnv.offline_queue.max_queue_size, 20u);

    const auto fromOverride = resolve({
        .configFile = path,
        .overrides = {{"offline_queue", {{"max_retries", 9}}}},
        .env = envSource()
    });
    EXPECT_EQ(fromOverride.offline_queue.max_retries, 9u);
    EXPECT_EQ(fromOverride.offline_queue.max_queue_size, 20u);
}

TEST_F(ConfigTest, Env_ConvertsDurationsSizesAndBooleans) {
    env["CLOUDSAVE_RETRY_DELAY"] = "5s";
    env["CLOUDSAVE_MAX_SAVE_SIZE"] = "2MB";
    env["CLOUDSAVE_ENABLE_COMPRESSION"] = "off";
    env["CLOUDSAVE_PING_INTERVAL"] = "750";

    const auto c = resolve({.env = envSource()});

    EXPECT_EQ(c.offline_queue.retry_delay, 5000ms);
    EXPECT_EQ(c.settings.max_save_size, 2u * 1024 * 1024);
    EXPECT_FALSE(c.features.compression);
    EXPECT_EQ(c.network_monitoring.ping_interval, 750ms);
}

TEST_F(ConfigTest, Env_FirebaseApiKeyEnablesProvider) {
    env["CLOUDSAVE_FIREBASE_API_KEY"] = "abc";
    EXPECT_TRUE(resolve({.env = envSource()}).provider.enabled);

    env["CLOUDSAVE_PROVIDER_ENABLED"] = "false";
    EXPECT_FALSE(resolve({.env = envSource()}).provider.enabled);
}

TEST_F(ConfigTest, Env_EmptyValuesAreIgnored) {
    env["CLOUDSAVE_MAX_RETRIES"] = "";
    EXPECT_TRUE(environmentOverlay(envSource()).empty());
}

TEST_F(ConfigTest, Env_InvalidValueThrowsConfigurationError) {
    env["CLOUDSAVE_DEBUG"] = "maybe";
    EXPECT_THROW(resolve({.env = envSource()}), ConfigurationError);
}

TEST_F(ConfigTest, Resolve_MissingFileIsConfigMissing) {
    try {
        (void)resolve({.configFile = dir / "nope.yaml", .env = envSource()});
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ConfigMissing);
    }
}

TEST_F(ConfigTest, Validate_DefaultsAreValid) {
    const auto r = validate(Config{});
    EXPECT_TRUE(r.isValid);
    EXPECT_TRUE(r.errors.empty());
}

TEST_F(ConfigTest, Validate_EnabledFirebaseRequiresEveryCredential) {
    auto c = firebaseEnabled();
    c.provider.firebase.api_key.clear();
    c.provider.firebase.app_id.clear();

    const auto r = validate(c);
    EXPECT_FALSE(r.isValid);
    EXPECT_EQ(r.errors.size(), 2u);
    EXPECT_TRUE(contains(r.errors, "Firebase api_key is required when cloud storage is enabled"));
    EXPECT_TRUE(contains(r.errors, "Firebase app_id is required when cloud storage is enabled"));
}

TEST_F(ConfigTest, Validate_SupabaseRequiresUrlAndAnonKey) {
    Config c;
    c.provider.enabled = true;
    c.provider.provider = ProviderKind::Supabase;
    c.provider.supabase.url = "https://demo.supabase.co";

    const auto r = validate(c);
    EXPECT_FALSE(r.isValid);
    EXPECT_TRUE(contains(r.errors, "Supabase anon_key is required when cloud storage is enabled"));
}

TEST_F(ConfigTest, Validate_EmulatorRejectedInProduction) {
    auto c = firebaseEnabled();
    c.environment = Environment::Production;
    c.debug = false;
    c.provider.firebase.use_emulator = true;
    c.provider.firebase.emulator = EmulatorConfig{};

    const auto r = validate(c);
    EXPECT_FALSE(r.isValid);
    EXPECT_TRUE(contains(r.errors, "Firebase emulator cannot be used in production"));
}

TEST_F(ConfigTest, Validate_WarningsDoNotInvalidate) {
    Config c;
    c.settings.retry_attempts = 20;
    c.features.encryption = true;

    const auto r = validate(c);
    EXPECT_TRUE(r.isValid);
    EXPECT_TRUE(contains(r.warnings, "retry_attempts is very high (> 10), this may cause long delays"));
    EXPECT_TRUE(contains(r.warnings, "Encryption is not supported yet and will be ignored"));
}

TEST_F(ConfigTest, Validate_QueueBoundsAreErrors) {
    Config c;
    c.offline_queue.max_queue_size = 0;
    c.offline_queue.processing_concurrency = 0;

    const auto r = validate(c);
    EXPECT_FALSE(r.isValid);
    EXPECT_TRUE(contains(r.errors, "offline_queue.max_queue_size must be at least 1"));
    EXPECT_TRUE(contains(r.errors, "offline_queue.processing_concurrency must be at least 1"));
}

TEST_F(ConfigTest, CloudStorage_RequiresEnabledFlagAndCredentials) {
    auto c = firebaseEnabled();
    EXPECT_TRUE(hasRequiredCredentials(c));
    EXPECT_TRUE(isCloudStorageEnabled(c));

    c.provider.enabled = false;
    EXPECT_FALSE(isCloudStorageEnabled(c));

    c.provider.enabled = true;
    c.provider.firebase.project_id.clear();
    EXPECT_FALSE(isCloudStorageEnabled(c));
}

TEST_F(ConfigTest, Summary_ListsProviderAndFeatures) {
    Config c;
    c.features.network_monitoring = false;
    c.features.auto_retry = false;
    EXPECT_EQ(summary(c), "firebase (disabled) | Features: compression, offline_queue");

    auto enabled = firebaseEnabled();
    enabled.features = FeaturesConfig{.compression = false, .offline_queue = false, .network_monitoring = false,
                                      .auto_retry = false};
    EXPECT_EQ(summary(enabled), "firebase (enabled) | Features: none");
}
