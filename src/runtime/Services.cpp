#include "runtime/Services.hpp"
#include "concurrency/Scheduler.hpp"
#include "integrity/Validator.hpp"
#include "network/Monitor.hpp"
#include "queue/OperationQueue.hpp"
#include "storage/Compressor.hpp"
#include "storage/Provider.hpp"
#include "sync/Executor.hpp"

using namespace cs::runtime;

Services::~Services() {
    shutdown();
}

void Services::shutdown() {
    if (offlineQueue) offlineQueue->destroy();
    if (networkMonitor) networkMonitor->destroy();
}
