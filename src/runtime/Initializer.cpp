#include "runtime/Initializer.hpp"
#include "concurrency/Scheduler.hpp"
#include "concurrency/retry.hpp"
#include "config/util.hpp"
#include "error/CloudError.hpp"
#include "integrity/Validator.hpp"
#include "log/Registry.hpp"
#include "network/Monitor.hpp"
#include "queue/OperationQueue.hpp"
#include "storage/Compressor.hpp"
#include "storage/Provider.hpp"
#include "sync/Executor.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace cs::runtime;
using namespace cs::config;
using namespace cs::error;
using namespace cs::log;

namespace {

template <typename Fn, typename... Args>
void notifyCaller(const Fn& fn, Args&&... args) {
    if (!fn) return;
    try {
        fn(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        Registry::runtime()->warn("[Initializer] Caller callback threw: {}", e.what());
    }
}

std::shared_future<InitializationStatus> settled(InitializationStatus status) {
    std::promise<InitializationStatus> p;
    p.set_value(std::move(status));
    return p.get_future().share();
}

}

Initializer::Initializer(std::shared_ptr<ServiceFactory> factory) : factory_(std::move(factory)) {
    if (!factory_) throw std::invalid_argument("Initializer requires a service factory");
}

Initializer::~Initializer() {
    cleanup();
}

std::shared_future<InitializationStatus> Initializer::initializeAsync(InitOptions options) {
    std::scoped_lock lock(mutex_);

    if (inFlight_ && inFlight_->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        Registry::runtime()->debug("[Initializer] Initialization already in progress, joining it");
        return *inFlight_;
    }

    if (status_.isInitialized || status_.phase == Phase::Failed) return settled(status_);

    status_ = InitializationStatus{};
    inFlight_ = std::async(std::launch::async, [this, opts = std::move(options)] { return run(opts); }).share();
    return *inFlight_;
}

InitializationStatus Initializer::initialize(InitOptions options) {
    return initializeAsync(std::move(options)).get();
}

InitializationStatus Initializer::reinitialize(InitOptions options) {
    Registry::runtime()->info("[Initializer] Reinitializing");
    cleanup();
    return initialize(std::move(options));
}

void Initializer::cleanup() {
    // inFlight_ stays set while we wait so a concurrent initializeAsync joins
    // the running attempt instead of starting a second one
    std::optional<std::shared_future<InitializationStatus>> pending;
    {
        std::scoped_lock lock(mutex_);
        pending = inFlight_;
    }
    if (pending) pending->wait();

    std::shared_ptr<Services> services;
    {
        std::scoped_lock lock(mutex_);
        inFlight_.reset();
        services.swap(services_);
        config_.reset();
        status_ = InitializationStatus{};
    }

    if (services) {
        services->shutdown();
        Registry::runtime()->info("[Initializer] Services shut down");
    }
}

void Initializer::enter(const Phase phase, const InitOptions& options, const char* step, const int percent) {
    {
        std::scoped_lock lock(mutex_);
        status_.phase = phase;
    }
    Registry::runtime()->debug("[Initializer] {} ({}%)", step, percent);
    notifyCaller(options.onProgress, std::string(step), percent);
}

InitializationStatus Initializer::run(const InitOptions& options) {
    InitializationStatus status;
    std::shared_ptr<Services> services;

    try {
        enter(Phase::LoadingConfig, options, "Loading configuration", 10);
        auto cfg = resolve(options.resolve);
        Registry::reconfigure(cfg.logging);

        enter(Phase::ValidatingConfig, options, "Validating configuration", 20);
        const auto validation = validate(cfg);
        status.warnings = validation.warnings;
        if (!validation.isValid) {
            status.errors = validation.errors;
            throw ConfigurationError(fmt::format("Configuration validation failed: {}",
                                                 fmt::join(validation.errors, "; ")));
        }
        status.isConfigured = true;
        status.provider = isCloudStorageEnabled(cfg) ? providerToString(cfg.provider.provider) : "none";

        enter(Phase::InitializingServices, options, "Initializing services", 40);
        services = buildServices(cfg, options);
        status.features = {
            .compression = services->compressor != nullptr,
            .offlineQueue = services->offlineQueue != nullptr,
            .networkMonitoring = services->networkMonitor != nullptr
        };
        if (isCloudStorageEnabled(cfg) && !services->provider)
            status.warnings.emplace_back("Storage provider is enabled but no client could be created");

        if (!options.skipConnectionTest) {
            enter(Phase::TestingConnections, options, "Testing connections", 60);
            testConnections(*services, cfg, status);
        }

        enter(Phase::Finalizing, options, "Finalizing setup", 90);
        if (services->networkMonitor) services->networkMonitor->start();
        if (services->offlineQueue) services->offlineQueue->start();

        status.isInitialized = true;
        status.timestamp = std::chrono::system_clock::now();
        status.phase = Phase::Ready;

        {
            std::scoped_lock lock(mutex_);
            status_ = status;
            services_ = services;
            config_ = std::move(cfg);
        }

        for (const auto& w : status.warnings) {
            Registry::runtime()->warn("[Initializer] {}", w);
            notifyCaller(options.onWarning, w);
        }

        Registry::runtime()->info("[Initializer] Ready: provider={} connected={} warnings={}",
                                  status.provider, status.isConnected, status.warnings.size());
        notifyCaller(options.onProgress, std::string("Initialization complete"), 100);
        return status;
    } catch (const std::exception& e) {
        if (status.errors.empty()) status.errors.emplace_back(e.what());
        status.isInitialized = false;
        status.phase = Phase::Failed;

        if (services) services->shutdown();

        {
            std::scoped_lock lock(mutex_);
            status_ = status;
        }

        Registry::runtime()->error("[Initializer] Initialization failed: {}", e.what());
        for (const auto& err : status.errors) notifyCaller(options.onError, err);
        return status;
    }
}

std::shared_ptr<Services> Initializer::buildServices(const Config& cfg, const InitOptions& options) {
    auto s = std::make_shared<Services>();

    s->scheduler = factory_->createScheduler();
    if (!s->scheduler) throw std::runtime_error("Service factory returned no scheduler");

    s->validator = std::make_shared<integrity::Validator>();

    if (cfg.features.compression)
        s->compressor = std::make_shared<storage::Compressor>(cfg.compression);

    if (isCloudStorageEnabled(cfg) && hasRequiredCredentials(cfg)) {
        s->provider = factory_->createProvider(cfg);
        if (s->provider)
            Registry::runtime()->info("[Initializer] Storage provider '{}' ready", s->provider->name());
    }

    if (cfg.features.network_monitoring) {
        s->networkMonitor = std::make_shared<network::Monitor>(
            cfg.network_monitoring, *s->scheduler, factory_->createProber(cfg.network_monitoring), options.systemOnline);
    }

    s->executors = std::make_shared<queue::ExecutorRegistry>();
    if (s->provider) {
        s->saveExecutor = std::make_shared<sync::Executor>(s->provider, s->validator, s->compressor, cfg.settings);
        sync::Executor::registerAll(s->saveExecutor, *s->executors);
    }

    if (cfg.features.offline_queue) {
        auto queueCfg = cfg.offline_queue;
        if (!cfg.features.auto_retry) queueCfg.max_retries = 1;

        s->offlineQueue = std::make_shared<queue::OperationQueue>(
            queueCfg, *s->scheduler, s->executors, s->networkMonitor, factory_->createStore(queueCfg));
    }

    return s;
}

void Initializer::testConnections(const Services& services, const Config& cfg, InitializationStatus& status) const {
    const concurrency::RetryPolicy policy{
        .attempts = std::max(1u, cfg.settings.retry_attempts),
        .baseDelay = cfg.settings.retry_delay,
        .maxDelay = cfg.offline_queue.max_retry_delay
    };

    // a single probe cycle, it already retries with its own backoff
    bool reachable = true;
    if (services.networkMonitor) {
        try {
            reachable = services.networkMonitor->checkConnectivity();
            if (!reachable)
                status.warnings.emplace_back(fmt::format("Network connectivity test failed: {} unreachable",
                                                         cfg.network_monitoring.ping_url));
        } catch (const std::exception& e) {
            reachable = false;
            status.warnings.emplace_back(fmt::format("Network connectivity test failed: {}", e.what()));
        }
    }

    if (!services.provider) return;

    if (!reachable) {
        status.warnings.emplace_back("Offline; skipped storage provider connection test");
        return;
    }

    try {
        concurrency::retry(*services.scheduler, policy, [&] { services.provider->testConnection(); },
            [&](const unsigned int attempt, const std::exception& e) {
                Registry::runtime()->debug("[Initializer] {} connection attempt {} failed: {}",
                                           services.provider->name(), attempt, e.what());
            });
        status.isConnected = true;
    } catch (const std::exception& e) {
        status.warnings.emplace_back(fmt::format("Storage provider connection test failed: {}", e.what()));
    }
}

InitializationStatus Initializer::getStatus() const {
    std::scoped_lock lock(mutex_);
    return status_;
}

std::shared_ptr<Services> Initializer::getServices() const {
    std::scoped_lock lock(mutex_);
    return services_;
}

std::optional<Config> Initializer::getConfig() const {
    std::scoped_lock lock(mutex_);
    return config_;
}

Phase Initializer::phase() const {
    std::scoped_lock lock(mutex_);
    return status_.phase;
}

bool Initializer::isReady() const {
    std::scoped_lock lock(mutex_);
    return status_.isInitialized && status_.isConfigured && status_.errors.empty();
}

ConfigurationSummary Initializer::getConfigurationSummary() const {
    std::scoped_lock lock(mutex_);

    ConfigurationSummary out;
    out.provider = status_.provider;
    out.errors = status_.errors;
    out.warnings = status_.warnings;
    if (config_) out.features = enabledFeatures(*config_);

    if (status_.phase == Phase::Failed) out.status = "failed";
    else if (!status_.isInitialized) out.status = "not initialized";
    else if (services_ && services_->networkMonitor && services_->networkMonitor->isOffline()) out.status = "offline";
    else out.status = "ready";

    return out;
}
