#pragma once

#include "config/Config.hpp"
#include "config/Resolver.hpp"
#include "runtime/ServiceFactory.hpp"
#include "runtime/Services.hpp"
#include "runtime/Status.hpp"

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cs::runtime {

struct InitOptions {
    config::ResolveOptions resolve;
    bool skipConnectionTest = false;
    bool systemOnline = true; // initial passive network signal handed to the monitor

    std::function<void(const std::string& step, int percent)> onProgress;
    std::function<void(const std::string&)> onWarning;
    std::function<void(const std::string&)> onError;
};

// Phased startup: Idle -> LoadingConfig -> ValidatingConfig -> InitializingServices
//   -> TestingConnections -> Finalizing -> Ready. Failed is absorbing until
// cleanup() or reinitialize(). Connection test failures are warnings; the
// core stays usable in queue-only mode.
class Initializer {
public:
    explicit Initializer(std::shared_ptr<ServiceFactory> factory = std::make_shared<ServiceFactory>());
    ~Initializer();

    Initializer(const Initializer&) = delete;
    Initializer& operator=(const Initializer&) = delete;

    // Blocks until the attempt settles. Concurrent callers share one attempt.
    InitializationStatus initialize(InitOptions options = {});
    std::shared_future<InitializationStatus> initializeAsync(InitOptions options = {});

    InitializationStatus reinitialize(InitOptions options = {});
    void cleanup();

    [[nodiscard]] InitializationStatus getStatus() const;
    [[nodiscard]] std::shared_ptr<Services> getServices() const;
    [[nodiscard]] std::optional<config::Config> getConfig() const;
    [[nodiscard]] Phase phase() const;

    // isInitialized && isConfigured && no errors
    [[nodiscard]] bool isReady() const;

    [[nodiscard]] ConfigurationSummary getConfigurationSummary() const;

private:
    std::shared_ptr<ServiceFactory> factory_;

    mutable std::mutex mutex_;
    InitializationStatus status_;
    std::shared_ptr<Services> services_;
    std::optional<config::Config> config_;
    std::optional<std::shared_future<InitializationStatus>> inFlight_;

    InitializationStatus run(const InitOptions& options);
    void enter(Phase phase, const InitOptions& options, const char* step, int percent);

    std::shared_ptr<Services> buildServices(const config::Config& cfg, const InitOptions& options);
    void testConnections(const Services& services, const config::Config& cfg, InitializationStatus& status) const;
};

}
