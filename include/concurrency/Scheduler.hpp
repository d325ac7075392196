#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace cs::concurrency {

// Clock and timer seam. Every delay in the core (probe backoff, retry backoff,
// periodic probing) goes through here so tests can drive time by hand.
class Scheduler {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::milliseconds;
    using TimerId = uint64_t;

    virtual ~Scheduler() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;

    // Blocks the calling thread for d (virtual time in tests)
    virtual void sleepFor(Duration d) = 0;

    // Runs fn once after d, on the scheduler's own thread
    virtual TimerId scheduleAfter(Duration d, std::function<void()> fn) = 0;

    // Returns false when the timer already fired or was never armed
    virtual bool cancel(TimerId id) = 0;
};

}
