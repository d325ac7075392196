#pragma once

#include "concurrency/Scheduler.hpp"

#include <exception>
#include <functional>
#include <string>

namespace cs::concurrency {

struct RetryPolicy {
    unsigned int attempts = 3;
    Scheduler::Duration baseDelay{1000};
    Scheduler::Duration maxDelay{30000};
};

// Calls fn until it returns without throwing, sleeping baseDelay * 2^n between attempts.
// The last exception is rethrown once attempts are exhausted.
template <typename Fn>
auto retry(Scheduler& scheduler, const RetryPolicy& policy, Fn&& fn,
           const std::function<void(unsigned int attempt, const std::exception&)>& onFailure = {})
    -> decltype(fn()) {
    const unsigned int attempts = policy.attempts == 0 ? 1 : policy.attempts;

    for (unsigned int attempt = 0;; ++attempt) {
        try {
            return fn();
        } catch (const std::exception& e) {
            if (onFailure) onFailure(attempt + 1, e);
            if (attempt + 1 >= attempts) throw;
        }

        auto delay = policy.baseDelay * (1LL << attempt);
        if (delay > policy.maxDelay) delay = policy.maxDelay;
        scheduler.sleepFor(delay);
    }
}

}
