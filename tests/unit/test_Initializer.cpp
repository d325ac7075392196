#include <gtest/gtest.h>
#include "runtime/Initializer.hpp"
#include "network/Monitor.hpp"
#include "queue/OperationQueue.hpp"
#include "queue/Store.hpp"
#include "sync/Executor.hpp"
#include "support/FakeProber.hpp"
#include "support/FakeProvider.hpp"
#include "support/ManualScheduler.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <thread>
#include <vector>

using namespace cs;
using namespace cs::runtime;
using namespace cs::test;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

class TestServiceFactory final : public ServiceFactory {
public:
    std::shared_ptr<ManualScheduler> scheduler = std::make_shared<ManualScheduler>();
    std::shared_ptr<FakeProber> prober = std::make_shared<FakeProber>();
    std::shared_ptr<FakeProvider> provider = std::make_shared<FakeProvider>();
    std::atomic<int> schedulersBuilt{0};
    std::atomic<int> providersBuilt{0};

    // When valid, service construction blocks until it is released
    std::shared_future<void> gate;

    std::shared_ptr<concurrency::Scheduler> createScheduler() override {
        ++schedulersBuilt;
        if (gate.valid()) gate.wait();
        return scheduler;
    }

    std::shared_ptr<network::Prober> createProber(const config::NetworkConfig&) override { return prober; }

    std::shared_ptr<storage::Provider> createProvider(const config::Config&) override {
        ++providersBuilt;
        return provider;
    }

    std::unique_ptr<queue::Store> createStore(const config::QueueConfig&) override { return nullptr; }
};

}

class InitializerTest : public ::testing::Test {
protected:
    std::shared_ptr<TestServiceFactory> factory = std::make_shared<TestServiceFactory>();
    std::unique_ptr<Initializer> init = std::make_unique<Initializer>(factory);

    void TearDown() override { init->cleanup(); }

    static json firebaseProvider() {
        return {
            {"enabled", true},
            {"provider", "firebase"},
            {"firebase", {
                {"api_key", "key"},
                {"auth_domain", "demo.firebaseapp.com"},
                {"project_id", "demo"},
                {"storage_bucket", "demo.appspot.com"},
                {"messaging_sender_id", "1234"},
                {"app_id", "1:1234:web:abcd"}
            }}
        };
    }

    static InitOptions options(json overrides = json::object()) {
        overrides["logging"]["console_log_level"] = "warn";
        InitOptions o;
        o.resolve.overrides = std::move(overrides);
        o.resolve.env = [](std::string_view) -> std::optional<std::string> { return std::nullopt; };
        return o;
    }

    static bool containsPrefix(const std::vector<std::string>& v, const std::string& prefix) {
        return std::ranges::any_of(v, [&](const std::string& s) { return s.starts_with(prefix); });
    }
};

TEST_F(InitializerTest, Initialize_BuildsEveryEnabledService) {
    const auto status = init->initialize(options({{"provider", firebaseProvider()}}));

    EXPECT_EQ(status.phase, Phase::Ready);
    EXPECT_TRUE(status.isInitialized);
    EXPECT_TRUE(status.isConfigured);
    EXPECT_TRUE(status.isConnected);
    EXPECT_EQ(status.provider, "firebase");
    EXPECT_TRUE(status.features.compression);
    EXPECT_TRUE(status.features.offlineQueue);
    EXPECT_TRUE(status.features.networkMonitoring);
    EXPECT_TRUE(status.errors.empty());
    EXPECT_TRUE(status.timestamp.has_value());
    EXPECT_TRUE(init->isReady());

    const auto services = init->getServices();
    ASSERT_NE(services, nullptr);
    EXPECT_NE(services->validator, nullptr);
    EXPECT_NE(services->compressor, nullptr);
    EXPECT_EQ(services->provider, factory->provider);
    EXPECT_NE(services->saveExecutor, nullptr);
    EXPECT_NE(services->networkMonitor, nullptr);
    EXPECT_NE(services->offlineQueue, nullptr);
    EXPECT_TRUE(services->executors->canExecute(queue::OperationType::Save, json::object()));

    EXPECT_EQ(factory->provider->connectionTests(), 1u);
    EXPECT_TRUE(init->getConfig().has_value());

    const auto summary = init->getConfigurationSummary();
    EXPECT_EQ(summary.status, "ready");
    EXPECT_EQ(summary.provider, "firebase");
    EXPECT_NE(std::ranges::find(summary.features, "compression"), summary.features.end());
}

TEST_F(InitializerTest, ConcurrentCallers_ShareOneAttempt) {
    auto first = init->initializeAsync(options());
    auto second = init->initializeAsync(options());

    EXPECT_EQ(first.get().phase, Phase::Ready);
    EXPECT_EQ(second.get().phase, Phase::Ready);
    EXPECT_EQ(factory->schedulersBuilt.load(), 1);

    // already initialized, nothing is rebuilt
    EXPECT_TRUE(init->initialize(options()).isInitialized);
    EXPECT_EQ(factory->schedulersBuilt.load(), 1);
}

TEST_F(InitializerTest, CleanupDuringAttempt_JoinsInsteadOfStartingAnother) {
    std::promise<void> release;
    factory->gate = release.get_future().share();

    auto first = init->initializeAsync(options());
    while (factory->schedulersBuilt.load() == 0) std::this_thread::yield();

    std::thread cleaner([this] { init->cleanup(); });
    std::this_thread::sleep_for(20ms);

    // cleanup is still waiting on the blocked attempt, so this joins it
    auto second = init->initializeAsync(options());
    EXPECT_EQ(factory->schedulersBuilt.load(), 1);

    release.set_value();
    cleaner.join();
    EXPECT_EQ(first.get().phase, Phase::Ready);
    EXPECT_EQ(second.get().phase, Phase::Ready);
    EXPECT_EQ(factory->schedulersBuilt.load(), 1);
}

TEST_F(InitializerTest, DisabledFeatures_LeaveServicesUnset) {
    const auto status = init->initialize(options({
        {"features", {{"compression", false}, {"offline_queue", false}, {"network_monitoring", false}}}
    }));

    EXPECT_TRUE(status.isInitialized);
    EXPECT_EQ(status.provider, "none");
    EXPECT_FALSE(status.isConnected);
    EXPECT_FALSE(status.features.compression);
    EXPECT_FALSE(status.features.offlineQueue);
    EXPECT_FALSE(status.features.networkMonitoring);

    const auto services = init->getServices();
    ASSERT_NE(services, nullptr);
    EXPECT_EQ(services->compressor, nullptr);
    EXPECT_EQ(services->provider, nullptr);
    EXPECT_EQ(services->saveExecutor, nullptr);
    EXPECT_EQ(services->networkMonitor, nullptr);
    EXPECT_EQ(services->offlineQueue, nullptr);
    EXPECT_NE(services->validator, nullptr);
    EXPECT_EQ(factory->providersBuilt.load(), 0);
}

TEST_F(InitializerTest, InvalidConfig_FailsAndStaysFailedUntilCleanup) {
    auto badProvider = firebaseProvider();
    badProvider["firebase"]["api_key"] = "";

    std::vector<std::string> reported;
    auto opts = options({{"provider", badProvider}});
    opts.onError = [&](const std::string& e) { reported.push_back(e); };

    const auto status = init->initialize(opts);
    EXPECT_EQ(status.phase, Phase::Failed);
    EXPECT_FALSE(status.isInitialized);
    EXPECT_FALSE(status.errors.empty());
    EXPECT_EQ(reported, status.errors);
    EXPECT_EQ(init->getServices(), nullptr);
    EXPECT_FALSE(init->isReady());
    EXPECT_EQ(init->getConfigurationSummary().status, "failed");
    EXPECT_EQ(factory->schedulersBuilt.load(), 0);

    // failure is sticky
    EXPECT_EQ(init->initialize(options()).phase, Phase::Failed);

    init->cleanup();
    EXPECT_EQ(init->phase(), Phase::Idle);
    EXPECT_EQ(init->initialize(options()).phase, Phase::Ready);
}

TEST_F(InitializerTest, UnreachableProvider_IsOnlyAWarning) {
    factory->provider->setReachable(false);

    std::vector<std::string> warnings;
    auto opts = options({
        {"provider", firebaseProvider()},
        {"settings", {{"retry_attempts", 2}, {"retry_delay", 100}}}
    });
    opts.onWarning = [&](const std::string& w) { warnings.push_back(w); };

    const auto status = init->initialize(opts);
    EXPECT_TRUE(status.isInitialized);
    EXPECT_FALSE(status.isConnected);
    EXPECT_TRUE(containsPrefix(status.warnings, "Storage provider connection test failed"));
    EXPECT_TRUE(containsPrefix(warnings, "Storage provider connection test failed"));
    EXPECT_EQ(factory->provider->connectionTests(), 2u);
    EXPECT_EQ(factory->scheduler->sleeps(), (std::vector<std::chrono::milliseconds>{100ms}));

    // queue-only mode is still usable
    EXPECT_NE(init->getServices()->offlineQueue, nullptr);
}

TEST_F(InitializerTest, OfflineNetwork_SkipsProviderTest) {
    factory->prober->setFallback(false);

    const auto status = init->initialize(options({
        {"provider", firebaseProvider()},
        {"settings", {{"retry_attempts", 3}}}
    }));

    EXPECT_TRUE(status.isInitialized);
    EXPECT_FALSE(status.isConnected);
    EXPECT_TRUE(containsPrefix(status.warnings, "Network connectivity test failed"));
    EXPECT_TRUE(containsPrefix(status.warnings, "Offline; skipped storage provider connection test"));
    EXPECT_EQ(factory->provider->connectionTests(), 0u);
    EXPECT_EQ(init->getConfigurationSummary().status, "offline");
}

TEST_F(InitializerTest, OfflineNetwork_RunsOneConnectivityCycle) {
    factory->prober->setFallback(false);

    // settings.retry_attempts governs the provider test, not the connectivity cycle
    const auto status = init->initialize(options({
        {"provider", firebaseProvider()},
        {"settings", {{"retry_attempts", 3}, {"retry_delay", 500}}},
        {"network_monitoring", {{"retry_attempts", 3}, {"retry_base_delay", 1000}}}
    }));

    EXPECT_FALSE(status.isConnected);
    EXPECT_EQ(factory->prober->calls(), 3u);
    EXPECT_EQ(factory->scheduler->sleeps(), (std::vector<std::chrono::milliseconds>{2000ms, 4000ms}));
}

TEST_F(InitializerTest, SkipConnectionTest_TouchesNoBackend) {
    auto opts = options({{"provider", firebaseProvider()}});
    opts.skipConnectionTest = true;

    const auto status = init->initialize(opts);
    EXPECT_TRUE(status.isInitialized);
    EXPECT_FALSE(status.isConnected);
    EXPECT_EQ(factory->provider->connectionTests(), 0u);
    EXPECT_EQ(factory->prober->calls(), 0u);
}

TEST_F(InitializerTest, Progress_ReportsEveryPhase) {
    std::vector<int> percents;
    auto opts = options();
    opts.onProgress = [&](const std::string&, const int percent) { percents.push_back(percent); };

    ASSERT_TRUE(init->initialize(opts).isInitialized);
    EXPECT_EQ(percents, (std::vector<int>{10, 20, 40, 60, 90, 100}));
}

TEST_F(InitializerTest, Reinitialize_RebuildsAndCleanupResets) {
    ASSERT_TRUE(init->initialize(options()).isInitialized);
    const auto before = init->getServices();

    const auto status = init->reinitialize(options());
    EXPECT_TRUE(status.isInitialized);
    EXPECT_NE(init->getServices(), before);
    EXPECT_EQ(factory->schedulersBuilt.load(), 2);

    init->cleanup();
    EXPECT_EQ(init->getServices(), nullptr);
    EXPECT_FALSE(init->getConfig().has_value());
    EXPECT_EQ(init->phase(), Phase::Idle);
    EXPECT_EQ(init->getConfigurationSummary().status, "not initialized");
}
