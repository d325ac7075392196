#pragma once

#include "network/Prober.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace cs::test {

// Answers from a script, then falls back to a fixed verdict
class FakeProber final : public network::Prober {
public:
    explicit FakeProber(const bool fallback = true) : fallback_(fallback) {}

    network::ProbeResult probe(const std::string& url, std::chrono::milliseconds) override {
        std::scoped_lock lock(mutex_);
        ++calls_;
        lastUrl_ = url;
        cv_.notify_all();

        bool reachable = fallback_;
        if (!script_.empty()) {
            reachable = script_.front();
            script_.pop_front();
        }

        if (reachable) return {.reachable = true, .rtt = std::chrono::milliseconds(42)};
        return {.reachable = false, .error = "scripted failure"};
    }

    void script(std::initializer_list<bool> verdicts) {
        std::scoped_lock lock(mutex_);
        script_.insert(script_.end(), verdicts.begin(), verdicts.end());
    }

    void setFallback(const bool reachable) {
        std::scoped_lock lock(mutex_);
        fallback_ = reachable;
    }

    [[nodiscard]] unsigned int calls() const {
        std::scoped_lock lock(mutex_);
        return calls_;
    }

    // For probes issued from the monitor's worker thread
    bool waitForCalls(const unsigned int n, const std::chrono::milliseconds timeout = std::chrono::seconds(5)) const {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return calls_ >= n; });
    }

    [[nodiscard]] std::string lastUrl() const {
        std::scoped_lock lock(mutex_);
        return lastUrl_;
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::deque<bool> script_;
    bool fallback_;
    unsigned int calls_ = 0;
    std::string lastUrl_;
};

}
