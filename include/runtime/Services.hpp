#pragma once

#include <memory>

namespace cs::concurrency { class Scheduler; }
namespace cs::integrity { class Validator; }
namespace cs::network { class Monitor; }
namespace cs::queue { class ExecutorRegistry; class OperationQueue; }
namespace cs::storage { class Compressor; class Provider; }
namespace cs::sync { class Executor; }

namespace cs::runtime {

// Everything one successful initialize() constructed. Disabled features stay nullptr.
// Declaration order matters: the scheduler outlives the monitor and queue that hold a reference to it.
struct Services {
    std::shared_ptr<concurrency::Scheduler> scheduler;
    std::shared_ptr<integrity::Validator> validator;
    std::shared_ptr<storage::Compressor> compressor;
    std::shared_ptr<storage::Provider> provider;
    std::shared_ptr<sync::Executor> saveExecutor;
    std::shared_ptr<network::Monitor> networkMonitor;
    std::shared_ptr<queue::ExecutorRegistry> executors;
    std::shared_ptr<queue::OperationQueue> offlineQueue;

    Services() = default;
    ~Services();

    Services(const Services&) = delete;
    Services& operator=(const Services&) = delete;

    // Stops the queue then the monitor; safe to call twice
    void shutdown();
};

}
