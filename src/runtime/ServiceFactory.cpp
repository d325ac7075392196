#include "runtime/ServiceFactory.hpp"
#include "concurrency/AsioScheduler.hpp"
#include "network/Prober.hpp"
#include "queue/Store.hpp"
#include "storage/FirebaseProvider.hpp"
#include "storage/SupabaseProvider.hpp"

using namespace cs::runtime;

std::shared_ptr<cs::concurrency::Scheduler> ServiceFactory::createScheduler() {
    return std::make_shared<concurrency::AsioScheduler>();
}

std::shared_ptr<cs::network::Prober> ServiceFactory::createProber(const config::NetworkConfig&) {
    return std::make_shared<network::CurlProber>();
}

std::shared_ptr<cs::storage::Provider> ServiceFactory::createProvider(const config::Config& cfg) {
    switch (cfg.provider.provider) {
        case config::ProviderKind::Firebase:
            return std::make_shared<storage::FirebaseProvider>(cfg.provider.firebase, cfg.settings.default_timeout);
        case config::ProviderKind::Supabase:
            return std::make_shared<storage::SupabaseProvider>(cfg.provider.supabase, cfg.settings.default_timeout);
        case config::ProviderKind::None:
            return nullptr;
    }
    return nullptr;
}

std::unique_ptr<cs::queue::Store> ServiceFactory::createStore(const config::QueueConfig& cfg) {
    if (!cfg.enable_persistence) return nullptr;
    return std::make_unique<queue::FileStore>(cfg.storage_path);
}
