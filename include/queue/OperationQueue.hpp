#pragma once

#include "config/Config.hpp"
#include "concurrency/Scheduler.hpp"
#include "concurrency/ThreadPool.hpp"
#include "crypto/IdGenerator.hpp"
#include "queue/ExecutorRegistry.hpp"
#include "queue/Operation.hpp"
#include "queue/Store.hpp"
#include "util/Observable.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cs::network { class Monitor; }

namespace cs::queue {

// Durable priority queue of remote operations, drained by a fixed worker pool.
//
// Selection order is priority desc, createdAt asc, insertion order asc. At most
// processing_concurrency operations run at once; every freed slot re-runs the
// selection. Failed operations back off on the scheduler clock and are removed
// with exactly one onError once their attempts run out.
//
// Timer callbacks hold a weak reference, so own the queue through a shared_ptr.
class OperationQueue : public std::enable_shared_from_this<OperationQueue> {
public:
    using StatusListener = std::function<void(const QueueStatus&)>;

    OperationQueue(config::QueueConfig cfg,
                   concurrency::Scheduler& scheduler,
                   std::shared_ptr<ExecutorRegistry> executors,
                   std::shared_ptr<network::Monitor> monitor = nullptr,
                   std::unique_ptr<Store> store = nullptr);

    ~OperationQueue();

    OperationQueue(const OperationQueue&) = delete;
    OperationQueue& operator=(const OperationQueue&) = delete;

    // Subscribes to the monitor for auto-drain on reconnect
    void start();

    // Throws QueueCapacityError when full and nothing with priority <= 1 can be evicted
    std::string enqueue(OperationType type, nlohmann::json payload, EnqueueOptions options = {});

    // In-flight operations cannot be pre-empted; they are marked cancelled and never retried
    bool dequeue(const std::string& id);

    [[nodiscard]] std::optional<OperationRecord> getOperation(const std::string& id) const;
    [[nodiscard]] std::vector<OperationRecord> getOperationsByType(OperationType type) const;
    [[nodiscard]] std::vector<OperationRecord> getOperationsByUser(const std::string& ownerId) const;
    [[nodiscard]] QueueStatus getStatus() const;
    [[nodiscard]] size_t size() const;

    // Concurrent callers share the in-flight drain. Resolves immediately when offline.
    std::shared_future<DrainOutcome> processQueue();

    void clear();
    size_t clearFailed();
    size_t retryFailed();

    util::Unsubscribe addStatusListener(StatusListener fn);

    // Stops timers and workers. The persisted snapshot is kept for the next instance.
    void destroy();

    [[nodiscard]] const config::QueueConfig& config() const { return cfg_; }
    [[nodiscard]] ExecutorRegistry& executors() const { return *executors_; }

    // min(retry_delay * 2^(retryCount-1), max_retry_delay)
    static std::chrono::milliseconds backoffDelay(const config::QueueConfig& cfg, unsigned int retryCount);

private:
    struct Entry {
        OperationRecord record;
        OperationHandle handle;
        uint64_t sequence = 0;
        concurrency::Scheduler::TimePoint notBefore{};
        bool inFlight = false;
        bool cancelled = false;
    };

    struct Drain {
        std::promise<DrainOutcome> promise;
        std::shared_future<DrainOutcome> future;
        DrainOutcome outcome;
    };

    config::QueueConfig cfg_;
    concurrency::Scheduler& scheduler_;
    std::shared_ptr<ExecutorRegistry> executors_;
    std::shared_ptr<network::Monitor> monitor_;
    std::unique_ptr<Store> store_;
    crypto::IdGenerator ids_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::unordered_map<std::string, concurrency::Scheduler::TimerId> retryTimers_;
    std::unique_ptr<Drain> drain_;
    uint64_t nextSequence_ = 0;
    size_t inFlight_ = 0;

    std::unique_ptr<concurrency::ThreadPool> pool_;
    util::Observable<QueueStatus> statusListeners_{"queue-status"};
    util::Unsubscribe monitorSubscription_;
    std::atomic<bool> destroyed_{false};

    [[nodiscard]] bool online() const;

    void reload();
    void persistLocked();
    [[nodiscard]] QueueStatus statusLocked() const;
    [[nodiscard]] std::vector<OperationRecord> recordsLocked(const std::function<bool(const Entry&)>& pred) const;

    void fillSlotsLocked(bool isOnline);
    [[nodiscard]] Entry* selectLocked(std::optional<Executor>& fn);
    void run(const std::string& id, const OperationRecord& record, const Executor& fn,
             const std::function<void(unsigned int, unsigned int)>& onProgress);
    void complete(const std::string& id, std::optional<nlohmann::json> result, std::optional<error::OperationError> err);

    void scheduleRetryLocked(const std::string& id, std::chrono::milliseconds delay);
    void cancelRetryLocked(const std::string& id);
    void onRetryTimer(const std::string& id);
    void onNetworkChange(bool isOnline);

    static std::shared_future<DrainOutcome> settled(DrainOutcome outcome);
};

}
