#pragma once

#include "concurrency/Scheduler.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <vector>

namespace cs::test {

// Virtual clock. Timers only fire from advance(), on the calling thread and
// outside the scheduler lock, so callbacks may arm or cancel other timers.
// sleepFor() moves the clock without firing anything.
class ManualScheduler final : public concurrency::Scheduler {
public:
    TimePoint now() const override {
        std::scoped_lock lock(mutex_);
        return now_;
    }

    void sleepFor(const Duration d) override {
        std::scoped_lock lock(mutex_);
        sleeps_.push_back(d);
        now_ += d;
    }

    TimerId scheduleAfter(const Duration d, std::function<void()> fn) override {
        std::scoped_lock lock(mutex_);
        const auto id = nextId_++;
        timers_.emplace(id, Timer{now_ + d, std::move(fn)});
        return id;
    }

    bool cancel(const TimerId id) override {
        std::scoped_lock lock(mutex_);
        return timers_.erase(id) > 0;
    }

    // Moves the clock forward by d, firing every timer that falls due on the way in deadline order
    void advance(const Duration d) {
        TimePoint target;
        {
            std::scoped_lock lock(mutex_);
            target = now_ + d;
        }

        for (;;) {
            std::function<void()> fn;
            {
                std::scoped_lock lock(mutex_);
                auto due = timers_.end();
                for (auto it = timers_.begin(); it != timers_.end(); ++it)
                    if (it->second.at <= target && (due == timers_.end() || it->second.at < due->second.at))
                        due = it;

                if (due == timers_.end()) {
                    now_ = std::max(now_, target);
                    return;
                }

                now_ = std::max(now_, due->second.at);
                fn = std::move(due->second.fn);
                timers_.erase(due);
            }
            fn();
        }
    }

    [[nodiscard]] std::vector<Duration> sleeps() const {
        std::scoped_lock lock(mutex_);
        return sleeps_;
    }

    [[nodiscard]] size_t pendingTimers() const {
        std::scoped_lock lock(mutex_);
        return timers_.size();
    }

private:
    struct Timer {
        TimePoint at;
        std::function<void()> fn;
    };

    mutable std::mutex mutex_;
    TimePoint now_{};
    TimerId nextId_ = 1;
    std::map<TimerId, Timer> timers_;
    std::vector<Duration> sleeps_;
};

}
