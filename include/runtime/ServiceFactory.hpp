#pragma once

#include "config/Config.hpp"

#include <memory>

namespace cs::concurrency { class Scheduler; }
namespace cs::network { class Prober; }
namespace cs::queue { class Store; }
namespace cs::storage { class Provider; }

namespace cs::runtime {

// Construction seam for the Initializer. Tests override the pieces that touch
// the clock, the network or the disk.
class ServiceFactory {
public:
    virtual ~ServiceFactory() = default;

    // AsioScheduler
    virtual std::shared_ptr<concurrency::Scheduler> createScheduler();

    // CurlProber
    virtual std::shared_ptr<network::Prober> createProber(const config::NetworkConfig& cfg);

    // FirebaseProvider or SupabaseProvider; nullptr for ProviderKind::None
    virtual std::shared_ptr<storage::Provider> createProvider(const config::Config& cfg);

    // FileStore at storage_path; nullptr when persistence is off
    virtual std::unique_ptr<queue::Store> createStore(const config::QueueConfig& cfg);
};

}
