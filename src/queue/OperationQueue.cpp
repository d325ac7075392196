#include "queue/OperationQueue.hpp"
#include "network/Monitor.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace cs::queue;
using namespace cs::error;
using namespace cs::concurrency;
using namespace cs::log;
using namespace std::chrono;

namespace {

template <typename Fn, typename... Args>
void invokeCallback(const char* what, const std::string& id, const Fn& fn, Args&&... args) {
    if (!fn) return;
    try {
        fn(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        Registry::queue()->error("[OperationQueue] {} callback for {} threw: {}", what, id, e.what());
    }
}

}

OperationQueue::OperationQueue(config::QueueConfig cfg,
                               Scheduler& scheduler,
                               std::shared_ptr<ExecutorRegistry> executors,
                               std::shared_ptr<network::Monitor> monitor,
                               std::unique_ptr<Store> store)
    : cfg_(std::move(cfg)),
      scheduler_(scheduler),
      executors_(std::move(executors)),
      monitor_(std::move(monitor)),
      store_(std::move(store)),
      ids_({.prefix = "op"}),
      pool_(std::make_unique<ThreadPool>(std::max(1u, cfg_.processing_concurrency))) {
    if (!executors_) throw std::invalid_argument("OperationQueue requires an executor registry");
    if (cfg_.max_queue_size == 0) throw std::invalid_argument("max_queue_size must be at least 1");
    reload();
}

OperationQueue::~OperationQueue() {
    destroy();
}

void OperationQueue::start() {
    if (!monitor_ || destroyed_.load()) return;

    monitorSubscription_ = monitor_->addListener([weak = weak_from_this()](const network::NetworkStatus& s) {
        if (const auto self = weak.lock()) self->onNetworkChange(s.isOnline);
    });
}

bool OperationQueue::online() const {
    return !monitor_ || monitor_->isOnline();
}

std::chrono::milliseconds OperationQueue::backoffDelay(const config::QueueConfig& cfg, const unsigned int retryCount) {
    auto delay = cfg.retry_delay;
    for (unsigned int i = 1; i < retryCount && delay < cfg.max_retry_delay; ++i) delay *= 2;
    return std::min(delay, cfg.max_retry_delay);
}

std::shared_future<DrainOutcome> OperationQueue::settled(DrainOutcome outcome) {
    std::promise<DrainOutcome> p;
    p.set_value(outcome);
    return p.get_future().share();
}

// ---- persistence -----------------------------------------------------------

void OperationQueue::reload() {
    if (!store_) return;

    std::vector<OperationRecord> records;
    try {
        records = store_->load();
    } catch (const std::exception& e) {
        Registry::queue()->error("[OperationQueue] Failed to load persisted queue: {}", e.what());
        return;
    }

    std::scoped_lock lock(mutex_);
    for (auto& r : records) {
        if (r.retryCount >= r.maxRetries) {
            Registry::queue()->warn("[OperationQueue] Dropping exhausted operation {} from snapshot", r.id);
            continue;
        }
        if (entries_.contains(r.id)) continue;

        const auto id = r.id;
        entries_.emplace(id, Entry{.record = std::move(r), .sequence = nextSequence_++});
    }

    if (!entries_.empty())
        Registry::queue()->info("[OperationQueue] Resumed {} persisted operations", entries_.size());
}

void OperationQueue::persistLocked() {
    if (!store_) return;

    std::vector<const Entry*> live;
    for (const auto& [_, e] : entries_)
        if (!e.cancelled) live.push_back(&e);
    std::ranges::sort(live, {}, &Entry::sequence);

    std::vector<OperationRecord> records;
    records.reserve(live.size());
    for (const auto* e : live) records.push_back(e->record);

    try {
        store_->save(records);
    } catch (const std::exception& e) {
        Registry::queue()->error("[OperationQueue] Failed to persist {} operations: {}", records.size(), e.what());
    }
}

// ---- mutation --------------------------------------------------------------

std::string OperationQueue::enqueue(const OperationType type, nlohmann::json payload, EnqueueOptions options) {
    if (destroyed_.load())
        throw OperationError(ErrorCode::OperationFailed, "Queue has been destroyed", false);

    OperationRecord record{
        .id = ids_.generate(),
        .type = type,
        .createdAt = system_clock::now(),
        .retryCount = 0,
        .maxRetries = std::max(1u, options.maxRetries.value_or(cfg_.max_retries)),
        .priority = options.priority,
        .payload = std::move(payload),
        .metadata = std::move(options.metadata)
    };
    const auto id = record.id;

    std::optional<Entry> evicted;
    QueueStatus status;
    {
        std::scoped_lock lock(mutex_);

        const auto live = static_cast<size_t>(std::ranges::count_if(entries_, [](const auto& kv) {
            return !kv.second.cancelled;
        }));

        if (live >= cfg_.max_queue_size) {
            const Entry* victim = nullptr;
            for (const auto& [_, e] : entries_) {
                if (e.inFlight || e.cancelled || e.record.priority > 1) continue;
                if (!victim || e.record.createdAt < victim->record.createdAt ||
                    (e.record.createdAt == victim->record.createdAt && e.sequence < victim->sequence))
                    victim = &e;
            }

            if (!victim) {
                Registry::queue()->warn("[OperationQueue] Queue full ({}), rejecting {} operation with priority {}",
                                        cfg_.max_queue_size, to_string(type), record.priority);
                throw QueueCapacityError("Offline queue is full (" + std::to_string(cfg_.max_queue_size) +
                                         " operations) and nothing can be evicted");
            }

            const auto victimId = victim->record.id;
            Registry::queue()->warn("[OperationQueue] Queue full, evicting oldest low-priority operation {} ({})",
                                    victimId, to_string(victim->record.type));
            cancelRetryLocked(victimId);
            evicted = std::move(entries_.at(victimId));
            entries_.erase(victimId);
        }

        entries_.emplace(id, Entry{
            .record = std::move(record),
            .handle = std::move(options.handle),
            .sequence = nextSequence_++
        });

        persistLocked();
        status = statusLocked();
    }

    Registry::queue()->debug("[OperationQueue] Enqueued {} ({}, priority {})", id, to_string(type), options.priority);

    if (evicted) {
        OperationError err(ErrorCode::OperationCancelled, "Evicted from a full offline queue", false);
        err.setOperationId(evicted->record.id);
        invokeCallback("onError", evicted->record.id, evicted->handle.onError, err);
    }

    statusListeners_.notify(status);

    if (cfg_.auto_process_online && online()) processQueue();
    return id;
}

bool OperationQueue::dequeue(const std::string& id) {
    QueueStatus status;
    {
        std::scoped_lock lock(mutex_);
        const auto it = entries_.find(id);
        if (it == entries_.end() || it->second.cancelled) return false;

        cancelRetryLocked(id);
        if (it->second.inFlight) {
            it->second.cancelled = true;
            it->second.handle = {};
            Registry::queue()->info("[OperationQueue] {} is running; it will not be retried", id);
        } else {
            entries_.erase(it);
        }

        persistLocked();
        status = statusLocked();
    }

    Registry::queue()->debug("[OperationQueue] Dequeued {}", id);
    statusListeners_.notify(status);
    return true;
}

void OperationQueue::clear() {
    QueueStatus status;
    size_t removed = 0;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [_, timer] : retryTimers_) scheduler_.cancel(timer);
        retryTimers_.clear();

        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.inFlight) {
                if (!it->second.cancelled) ++removed;
                it->second.cancelled = true;
                it->second.handle = {};
                ++it;
            } else {
                if (!it->second.cancelled) ++removed;
                it = entries_.erase(it);
            }
        }

        persistLocked();
        status = statusLocked();
    }

    Registry::queue()->info("[OperationQueue] Cleared {} operations", removed);
    statusListeners_.notify(status);
}

size_t OperationQueue::clearFailed() {
    QueueStatus status;
    size_t removed = 0;
    {
        std::scoped_lock lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            const auto& e = it->second;
            if (!e.inFlight && !e.cancelled && e.record.retryCount > 0) {
                cancelRetryLocked(e.record.id);
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }

        if (removed == 0) return 0;
        persistLocked();
        status = statusLocked();
    }

    Registry::queue()->info("[OperationQueue] Cleared {} failed operations", removed);
    statusListeners_.notify(status);
    return removed;
}

size_t OperationQueue::retryFailed() {
    QueueStatus status;
    size_t reset = 0;
    {
        std::scoped_lock lock(mutex_);
        for (auto& [id, e] : entries_) {
            if (e.inFlight || e.cancelled || e.record.retryCount == 0) continue;
            cancelRetryLocked(id);
            e.record.retryCount = 0;
            e.notBefore = {};
            ++reset;
        }

        if (reset == 0) return 0;
        persistLocked();
        status = statusLocked();
    }

    Registry::queue()->info("[OperationQueue] Reset {} failed operations for retry", reset);
    statusListeners_.notify(status);

    if (online()) processQueue();
    return reset;
}

// ---- queries ---------------------------------------------------------------

std::vector<OperationRecord> OperationQueue::recordsLocked(const std::function<bool(const Entry&)>& pred) const {
    std::vector<const Entry*> matches;
    for (const auto& [_, e] : entries_)
        if (!e.cancelled && pred(e)) matches.push_back(&e);
    std::ranges::sort(matches, {}, &Entry::sequence);

    std::vector<OperationRecord> out;
    out.reserve(matches.size());
    for (const auto* e : matches) out.push_back(e->record);
    return out;
}

std::optional<OperationRecord> OperationQueue::getOperation(const std::string& id) const {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end() || it->second.cancelled) return std::nullopt;
    return it->second.record;
}

std::vector<OperationRecord> OperationQueue::getOperationsByType(const OperationType type) const {
    std::scoped_lock lock(mutex_);
    return recordsLocked([type](const Entry& e) { return e.record.type == type; });
}

std::vector<OperationRecord> OperationQueue::getOperationsByUser(const std::string& ownerId) const {
    std::scoped_lock lock(mutex_);
    return recordsLocked([&ownerId](const Entry& e) { return e.record.metadata.ownerId == ownerId; });
}

size_t OperationQueue::size() const {
    std::scoped_lock lock(mutex_);
    return static_cast<size_t>(std::ranges::count_if(entries_, [](const auto& kv) { return !kv.second.cancelled; }));
}

QueueStatus OperationQueue::getStatus() const {
    std::scoped_lock lock(mutex_);
    return statusLocked();
}

QueueStatus OperationQueue::statusLocked() const {
    QueueStatus s;
    s.isProcessing = drain_ != nullptr;

    const auto now = scheduler_.now();
    std::optional<Scheduler::TimePoint> nextRetry;

    for (const auto& [_, e] : entries_) {
        if (e.cancelled) continue;
        ++s.total;
        if (e.inFlight) {
            ++s.processing;
            continue;
        }
        ++s.pending;
        if (e.record.retryCount > 0) ++s.failed;
        if (e.notBefore > now && (!nextRetry || e.notBefore < *nextRetry)) nextRetry = e.notBefore;
    }

    if (nextRetry)
        s.nextRetryAt = system_clock::now() + duration_cast<system_clock::duration>(*nextRetry - now);
    return s;
}

util::Unsubscribe OperationQueue::addStatusListener(StatusListener fn) {
    return statusListeners_.subscribe(std::move(fn));
}

// ---- draining --------------------------------------------------------------

std::shared_future<DrainOutcome> OperationQueue::processQueue() {
    if (destroyed_.load()) return settled({});

    const bool isOnline = online();

    std::unique_ptr<Drain> finished;
    std::shared_future<DrainOutcome> future;
    QueueStatus status;
    {
        std::scoped_lock lock(mutex_);

        if (drain_) {
            fillSlotsLocked(isOnline); // pick up anything enqueued since the drain started
            return drain_->future;
        }

        if (!isOnline) {
            Registry::queue()->debug("[OperationQueue] Offline, skipping drain of {} operations", entries_.size());
            return settled({.skippedOffline = true});
        }

        drain_ = std::make_unique<Drain>();
        drain_->future = drain_->promise.get_future().share();
        future = drain_->future;

        fillSlotsLocked(isOnline);
        if (inFlight_ == 0) finished = std::move(drain_);
        status = statusLocked();
    }

    if (finished) finished->promise.set_value(finished->outcome);
    else statusListeners_.notify(status);

    return future;
}

OperationQueue::Entry* OperationQueue::selectLocked(std::optional<Executor>& fn) {
    const auto now = scheduler_.now();
    Entry* best = nullptr;

    for (auto& [_, e] : entries_) {
        if (e.inFlight || e.cancelled) continue;
        if (e.record.retryCount >= e.record.maxRetries) continue;
        if (e.notBefore > now) continue;
        if (!executors_->canExecute(e.record.type, e.record.payload)) continue;

        if (!best) { best = &e; continue; }

        const auto& a = e.record;
        const auto& b = best->record;
        if (a.priority != b.priority) {
            if (a.priority > b.priority) best = &e;
        } else if (a.createdAt != b.createdAt) {
            if (a.createdAt < b.createdAt) best = &e;
        } else if (e.sequence < best->sequence) {
            best = &e;
        }
    }

    if (best) fn = executors_->find(best->record.type, best->record.payload);
    return best;
}

void OperationQueue::fillSlotsLocked(const bool isOnline) {
    if (destroyed_.load() || !isOnline) return;

    const size_t slots = std::max(1u, cfg_.processing_concurrency);
    while (inFlight_ < slots) {
        std::optional<Executor> fn;
        Entry* next = selectLocked(fn);
        if (!next || !fn) break;

        next->inFlight = true;
        ++inFlight_;

        const auto id = next->record.id;
        Registry::queue()->debug("[OperationQueue] Dispatching {} ({}, priority {}, attempt {}/{})", id,
                                 to_string(next->record.type), next->record.priority,
                                 next->record.retryCount + 1, next->record.maxRetries);

        pool_->submit(std::make_shared<FunctionTask>(
            [this, id, record = next->record, fn = std::move(*fn), progress = next->handle.onProgress] {
                run(id, record, fn, progress);
            },
            "operation " + id));
    }
}

void OperationQueue::run(const std::string& id, const OperationRecord& record, const Executor& fn,
                         const std::function<void(unsigned int, unsigned int)>& onProgress) {
    invokeCallback("onProgress", id, onProgress, 0u, 1u);

    std::optional<nlohmann::json> result;
    std::optional<OperationError> err;
    try {
        result = fn(record.payload, record.metadata);
    } catch (...) {
        err = normalize(std::current_exception());
    }

    if (result) invokeCallback("onProgress", id, onProgress, 1u, 1u);
    complete(id, std::move(result), std::move(err));
}

void OperationQueue::complete(const std::string& id, std::optional<nlohmann::json> result,
                              std::optional<OperationError> err) {
    const bool isOnline = online();

    OperationHandle handle;
    bool failedForGood = false;
    std::unique_ptr<Drain> finished;
    QueueStatus status;
    {
        std::scoped_lock lock(mutex_);

        const auto it = entries_.find(id);
        if (it == entries_.end()) return;
        auto& e = it->second;

        e.inFlight = false;
        if (inFlight_ > 0) --inFlight_;

        if (e.cancelled) {
            Registry::queue()->debug("[OperationQueue] Cancelled operation {} finished, discarding", id);
            entries_.erase(it);
        } else if (result) {
            handle = std::move(e.handle);
            entries_.erase(it);
            if (drain_) ++drain_->outcome.succeeded;
            Registry::queue()->debug("[OperationQueue] {} succeeded", id);
            persistLocked();
        } else {
            ++e.record.retryCount;
            err->setOperationId(id);

            if (!err->retryable() || e.record.retryCount >= e.record.maxRetries) {
                Registry::queue()->error("[OperationQueue] {} ({}) failed after {} attempt(s): [{}] {}", id,
                                         to_string(e.record.type), e.record.retryCount,
                                         codeToString(err->code()), err->what());
                handle = std::move(e.handle);
                failedForGood = true;
                entries_.erase(it);
                if (drain_) ++drain_->outcome.failed;
            } else {
                const auto delay = backoffDelay(cfg_, e.record.retryCount);
                e.notBefore = scheduler_.now() + delay;
                Registry::queue()->warn("[OperationQueue] {} failed (attempt {}/{}), retrying in {}ms: {}", id,
                                        e.record.retryCount, e.record.maxRetries, delay.count(), err->what());
                if (drain_) ++drain_->outcome.retried;
                scheduleRetryLocked(id, delay);
            }
            persistLocked();
        }

        fillSlotsLocked(isOnline);
        if (drain_ && inFlight_ == 0) finished = std::move(drain_);
        status = statusLocked();
    }

    if (result) invokeCallback("onSuccess", id, handle.onSuccess, *result);
    else if (failedForGood) invokeCallback("onError", id, handle.onError, *err);

    statusListeners_.notify(status);

    if (finished) {
        const auto& o = finished->outcome;
        Registry::queue()->info("[OperationQueue] Drain finished: {} succeeded, {} failed, {} retrying",
                                o.succeeded, o.failed, o.retried);
        finished->promise.set_value(o);
    }
}

// ---- retry timers ----------------------------------------------------------

void OperationQueue::scheduleRetryLocked(const std::string& id, const std::chrono::milliseconds delay) {
    if (destroyed_.load()) return;
    cancelRetryLocked(id);

    retryTimers_[id] = scheduler_.scheduleAfter(delay, [weak = weak_from_this(), id] {
        if (const auto self = weak.lock()) self->onRetryTimer(id);
    });
}

void OperationQueue::cancelRetryLocked(const std::string& id) {
    if (const auto it = retryTimers_.find(id); it != retryTimers_.end()) {
        scheduler_.cancel(it->second);
        retryTimers_.erase(it);
    }
}

void OperationQueue::onRetryTimer(const std::string& id) {
    {
        std::scoped_lock lock(mutex_);
        retryTimers_.erase(id);
    }
    if (!destroyed_.load()) processQueue();
}

void OperationQueue::onNetworkChange(const bool isOnline) {
    if (!isOnline || destroyed_.load()) return;
    if (!cfg_.auto_process_online) return;

    size_t pending;
    {
        std::scoped_lock lock(mutex_);
        pending = statusLocked().pending;
    }

    if (pending == 0) return;
    Registry::queue()->info("[OperationQueue] Back online, draining {} pending operations", pending);
    processQueue();
}

// ---- teardown --------------------------------------------------------------

void OperationQueue::destroy() {
    if (destroyed_.exchange(true)) return;

    if (monitorSubscription_) {
        monitorSubscription_();
        monitorSubscription_ = nullptr;
    }

    {
        std::scoped_lock lock(mutex_);
        for (const auto& [_, timer] : retryTimers_) scheduler_.cancel(timer);
        retryTimers_.clear();
    }

    // waits for running executors; dispatched-but-unstarted ones stay in the snapshot
    pool_->stop();

    std::unique_ptr<Drain> pending;
    {
        std::scoped_lock lock(mutex_);
        pending = std::move(drain_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.cancelled) {
                it = entries_.erase(it);
                continue;
            }
            it->second.inFlight = false;
            it->second.handle = {};
            ++it;
        }
        inFlight_ = 0;
    }

    if (pending) pending->promise.set_value(pending->outcome);
    statusListeners_.clear();

    Registry::queue()->debug("[OperationQueue] Destroyed");
}
