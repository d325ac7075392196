#pragma once

#include "log/Registry.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cs::util {

using Unsubscribe = std::function<void()>;

// Listener set with a single notify path. Listeners run outside the lock, so a
// listener may unsubscribe itself (or others) while being notified.
template <typename... Args>
class Observable {
public:
    using Listener = std::function<void(const Args&...)>;

    explicit Observable(std::string name = "observable") : state_(std::make_shared<State>()) {
        state_->name = std::move(name);
    }

    Observable(const Observable&) = delete;
    Observable& operator=(const Observable&) = delete;

    Unsubscribe subscribe(Listener fn) {
        std::scoped_lock lock(state_->mutex);
        const auto id = state_->nextId++;
        state_->listeners.emplace(id, std::move(fn));

        // weak so an unsubscribe outliving the observable is a no-op
        return [weak = std::weak_ptr<State>(state_), id] {
            if (const auto s = weak.lock()) {
                std::scoped_lock l(s->mutex);
                s->listeners.erase(id);
            }
        };
    }

    void notify(const Args&... args) const {
        std::vector<Listener> snapshot;
        {
            std::scoped_lock lock(state_->mutex);
            snapshot.reserve(state_->listeners.size());
            for (const auto& [_, fn] : state_->listeners) snapshot.push_back(fn);
        }

        for (const auto& fn : snapshot) {
            try {
                fn(args...);
            } catch (const std::exception& e) {
                if (log::Registry::isInitialized())
                    log::Registry::cloudsave()->error("[Observable] {} listener threw: {}", state_->name, e.what());
            }
        }
    }

    void clear() {
        std::scoped_lock lock(state_->mutex);
        state_->listeners.clear();
    }

    [[nodiscard]] size_t size() const {
        std::scoped_lock lock(state_->mutex);
        return state_->listeners.size();
    }

private:
    struct State {
        std::string name;
        mutable std::mutex mutex;
        std::map<uint64_t, Listener> listeners;
        uint64_t nextId = 0;
    };

    std::shared_ptr<State> state_;
};

}
