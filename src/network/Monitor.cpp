#include "network/Monitor.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace cs::network;
using namespace cs::log;
using namespace std::chrono;

Monitor::Monitor(config::NetworkConfig cfg, concurrency::Scheduler& scheduler,
                 std::shared_ptr<Prober> prober, const bool systemOnline)
    : cfg_(std::move(cfg)),
      scheduler_(scheduler),
      prober_(std::move(prober)),
      systemOnline_(systemOnline),
      sessionStart_(scheduler.now()),
      worker_(std::make_unique<concurrency::ThreadPool>(1)) {
    if (!prober_) throw std::invalid_argument("Monitor requires a prober");
    status_.isOnline = systemOnline;
}

Monitor::~Monitor() {
    destroy();
}

void Monitor::start() {
    if (destroyed_.load()) return;
    Registry::network()->info("[Monitor] Probing {} every {}ms (timeout {}ms, {} attempts)",
                              cfg_.ping_url, cfg_.ping_interval.count(), cfg_.ping_timeout.count(), cfg_.retry_attempts);
    scheduleNext();
}

void Monitor::destroy() {
    if (destroyed_.exchange(true)) return;

    std::optional<concurrency::Scheduler::TimerId> timer;
    {
        std::scoped_lock lock(mutex_);
        timer.swap(timer_);
    }
    if (timer) scheduler_.cancel(*timer);

    // discards a queued periodic cycle and joins a running one
    worker_->stop();

    listeners_.clear();

    // let an in-flight probe cycle finish before returning
    std::scoped_lock probeLock(probeMutex_);
}

NetworkStatus Monitor::getStatus() const {
    std::scoped_lock lock(mutex_);
    return status_;
}

bool Monitor::isOnline() const {
    std::scoped_lock lock(mutex_);
    return status_.isOnline;
}

bool Monitor::checkConnectivity() {
    if (destroyed_.load()) return false;

    {
        std::unique_lock lock(mutex_);
        if (!systemOnline_) {
            // Platform says offline; trust it without probing
            const bool changed = transitionLocked(false);
            const auto snapshot = status_;
            lock.unlock();
            if (changed) listeners_.notify(snapshot);
            return false;
        }
    }

    return runProbeCycle();
}

bool Monitor::runProbeCycle() {
    std::scoped_lock probeLock(probeMutex_);

    const unsigned int attempts = std::max(1u, cfg_.retry_attempts);
    for (unsigned int attempt = 1; attempt <= attempts; ++attempt) {
        if (destroyed_.load()) return false;

        ProbeResult result;
        try {
            result = prober_->probe(cfg_.ping_url, cfg_.ping_timeout);
        } catch (const std::exception& e) {
            result.reachable = false;
            result.error = e.what();
        }

        if (result.reachable) {
            applyProbeVerdict(true, result.rtt);
            return true;
        }

        Registry::network()->debug("[Monitor] Probe attempt {}/{} failed: {}", attempt, attempts, result.error);

        if (attempt < attempts) scheduler_.sleepFor(cfg_.retry_base_delay * (1LL << attempt));
    }

    Registry::network()->warn("[Monitor] {} unreachable after {} attempts", cfg_.ping_url, attempts);
    applyProbeVerdict(false, std::nullopt);
    return false;
}

void Monitor::applyProbeVerdict(const bool reachable, const std::optional<milliseconds> rtt) {
    bool changed = false;
    NetworkStatus snapshot;
    {
        std::scoped_lock lock(mutex_);
        status_.probe = reachable ? ProbeState::Reachable : ProbeState::Unreachable;
        if (rtt && !infoSupplied_) status_.rtt = static_cast<double>(rtt->count());

        // A late verdict never overrides a passive offline that arrived meanwhile
        if (reachable && !systemOnline_) return;

        changed = transitionLocked(reachable);
        snapshot = status_;
    }
    if (changed) listeners_.notify(snapshot);
}

void Monitor::scheduleNext() {
    if (destroyed_.load()) return;

    const auto id = scheduler_.scheduleAfter(cfg_.ping_interval, [weak = weak_from_this()] {
        const auto self = weak.lock();
        if (!self || self->destroyed_.load()) return;
        self->scheduleNext();
        self->dispatchPeriodicCheck();
    });

    std::scoped_lock lock(mutex_);
    timer_ = id;
}

void Monitor::dispatchPeriodicCheck() {
    // a tick that finds the previous cycle still waiting for the worker is dropped
    if (cycleQueued_.exchange(true)) return;

    try {
        worker_->submit(std::make_shared<concurrency::FunctionTask>([weak = weak_from_this()] {
            const auto self = weak.lock();
            if (!self) return;
            self->cycleQueued_.store(false);
            if (!self->destroyed_.load()) self->periodicCheck();
        }, "periodic connectivity check"));
    } catch (const std::runtime_error& e) {
        cycleQueued_.store(false);
        Registry::network()->debug("[Monitor] Periodic check dropped: {}", e.what());
    }
}

void Monitor::periodicCheck() {
    try {
        checkConnectivity();
    } catch (const std::exception& e) {
        Registry::network()->error("[Monitor] Periodic connectivity check failed: {}", e.what());
    }
}

Quality Monitor::getConnectionQuality() const {
    std::scoped_lock lock(mutex_);
    return classify(status_);
}

Quality Monitor::classify(const NetworkStatus& s) {
    if (!s.isOnline) return Quality::Poor;

    const auto& type = s.effectiveType;
    if (type == "4g" && s.rtt < 100 && s.downlink > 10) return Quality::Excellent;
    if (type == "4g" && s.rtt < 200 && s.downlink > 5) return Quality::Good;
    if (type == "3g" && s.rtt < 300) return Quality::Fair;
    if (type == "slow-2g" || type == "2g") return Quality::Poor;

    return Quality::Unknown;
}

bool Monitor::isSuitableForCloudOperations() const {
    std::scoped_lock lock(mutex_);
    if (!status_.isOnline) return false;
    if (status_.probe == ProbeState::Unreachable) return false;
    if (status_.saveData) return false;

    switch (classify(status_)) {
        case Quality::Excellent:
        case Quality::Good:
        case Quality::Fair:
            return true;
        case Quality::Unknown:
            return status_.probe == ProbeState::Reachable;
        case Quality::Poor:
            return false;
    }
    return false;
}

Statistics Monitor::getStatistics() const {
    std::scoped_lock lock(mutex_);

    Statistics st;
    st.currentSessionDuration = duration_cast<milliseconds>(scheduler_.now() - sessionStart_);
    st.totalOnlineTime = accumulatedOnline_;
    st.totalOfflineTime = accumulatedOffline_;
    if (status_.isOnline) st.totalOnlineTime += st.currentSessionDuration;
    else st.totalOfflineTime += st.currentSessionDuration;
    st.connectionSwitches = switches_;
    return st;
}

cs::util::Unsubscribe Monitor::addListener(Listener fn) {
    return listeners_.subscribe(std::move(fn));
}

void Monitor::handleSystemOnline() {
    bool changed;
    NetworkStatus snapshot;
    {
        std::scoped_lock lock(mutex_);
        systemOnline_ = true;
        if (!status_.isOnline) status_.probe = ProbeState::Unknown; // stale verdict
        changed = transitionLocked(true);
        snapshot = status_;
    }
    if (changed) {
        Registry::network()->info("[Monitor] Connection restored");
        listeners_.notify(snapshot);
    }
}

void Monitor::handleSystemOffline() {
    bool changed;
    NetworkStatus snapshot;
    {
        std::scoped_lock lock(mutex_);
        systemOnline_ = false;
        changed = transitionLocked(false);
        snapshot = status_;
    }
    if (changed) {
        Registry::network()->info("[Monitor] Connection lost");
        listeners_.notify(snapshot);
    }
}

void Monitor::updateConnectionInfo(const ConnectionInfo& info) {
    std::scoped_lock lock(mutex_);
    status_.connectionType = info.connectionType;
    status_.effectiveType = info.effectiveType;
    status_.downlink = info.downlink;
    status_.rtt = info.rtt;
    status_.saveData = info.saveData;
    infoSupplied_ = true;
}

bool Monitor::transitionLocked(const bool online) {
    if (status_.isOnline == online) return false;

    const auto now = scheduler_.now();
    const auto session = duration_cast<milliseconds>(now - sessionStart_);
    if (status_.isOnline) accumulatedOnline_ += session;
    else accumulatedOffline_ += session;
    sessionStart_ = now;

    status_.isOnline = online;
    if (online) status_.lastOnline = std::chrono::system_clock::now();
    else status_.lastOffline = std::chrono::system_clock::now();
    ++switches_;
    return true;
}
