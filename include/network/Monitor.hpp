#pragma once

#include "config/Config.hpp"
#include "concurrency/Scheduler.hpp"
#include "concurrency/ThreadPool.hpp"
#include "network/Prober.hpp"
#include "network/Status.hpp"
#include "util/Observable.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace cs::network {

// Connectivity tracker fed by passive platform signals and a periodic active probe.
//
// Precedence when the two disagree:
//  - passive offline always wins; no probe is issued while the platform reports offline
//  - a failed probe cycle flips a passively-online monitor offline
//  - a successful probe brings it back online
// isSuitableForCloudOperations() additionally refuses while the last probe verdict is unreachable.
//
// Periodic cycles run on the monitor's own worker thread, never on the scheduler's,
// so blocking probes and backoff sleeps do not hold up other timers.
class Monitor : public std::enable_shared_from_this<Monitor> {
public:
    using Listener = std::function<void(const NetworkStatus&)>;

    Monitor(config::NetworkConfig cfg,
            concurrency::Scheduler& scheduler,
            std::shared_ptr<Prober> prober,
            bool systemOnline = true);

    ~Monitor();

    Monitor(const Monitor&) = delete;
    Monitor& operator=(const Monitor&) = delete;

    // Arms the periodic probe. Requires the monitor to be owned by a shared_ptr.
    void start();

    // Stops probing and drops every listener
    void destroy();

    [[nodiscard]] NetworkStatus getStatus() const;
    [[nodiscard]] bool isOnline() const;
    [[nodiscard]] bool isOffline() const { return !isOnline(); }

    // Runs a full probe cycle now on the calling thread (with retries and backoff)
    bool checkConnectivity();

    [[nodiscard]] Quality getConnectionQuality() const;
    [[nodiscard]] bool isSuitableForCloudOperations() const;

    [[nodiscard]] Statistics getStatistics() const;

    util::Unsubscribe addListener(Listener fn);

    // passive inputs
    void handleSystemOnline();
    void handleSystemOffline();
    void updateConnectionInfo(const ConnectionInfo& info);

private:
    config::NetworkConfig cfg_;
    concurrency::Scheduler& scheduler_;
    std::shared_ptr<Prober> prober_;

    mutable std::mutex mutex_;
    NetworkStatus status_;
    bool systemOnline_;
    bool infoSupplied_ = false;
    uint64_t switches_ = 0;
    concurrency::Scheduler::TimePoint sessionStart_;
    std::chrono::milliseconds accumulatedOnline_{0};
    std::chrono::milliseconds accumulatedOffline_{0};

    std::mutex probeMutex_; // one probe cycle at a time
    std::optional<concurrency::Scheduler::TimerId> timer_;
    std::atomic<bool> destroyed_{false};
    std::atomic<bool> cycleQueued_{false};
    std::unique_ptr<concurrency::ThreadPool> worker_;

    util::Observable<NetworkStatus> listeners_{"network"};

    bool runProbeCycle();
    void applyProbeVerdict(bool reachable, std::optional<std::chrono::milliseconds> rtt);
    void scheduleNext();
    void dispatchPeriodicCheck();
    void periodicCheck();

    // Must hold mutex_. Returns true when the online flag actually changed.
    bool transitionLocked(bool online);
    static Quality classify(const NetworkStatus& s);
};

}
