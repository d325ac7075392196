#include "concurrency/AsioScheduler.hpp"
#include "log/Registry.hpp"

#include <boost/asio/post.hpp>

using namespace cs::concurrency;
using namespace cs::log;

AsioScheduler::AsioScheduler()
    : workGuard_(std::make_unique<WorkGuard>(boost::asio::make_work_guard(ioContext_))),
      ioThread_([this] { ioContext_.run(); }) {}

AsioScheduler::~AsioScheduler() {
    shutdown();
}

void AsioScheduler::shutdown() {
    if (stopped_.exchange(true)) return;

    {
        std::scoped_lock lock(mutex_);
        for (auto& [_, timer] : timers_)
            boost::asio::post(ioContext_, [timer] { timer->cancel(); });
        timers_.clear();
    }

    workGuard_.reset();
    ioContext_.stop();
    if (ioThread_.joinable()) ioThread_.join();
}

Scheduler::TimePoint AsioScheduler::now() const {
    return Clock::now();
}

void AsioScheduler::sleepFor(const Duration d) {
    std::this_thread::sleep_for(d);
}

Scheduler::TimerId AsioScheduler::scheduleAfter(const Duration d, std::function<void()> fn) {
    const auto id = nextId_++;
    if (stopped_.load()) return id;

    auto timer = std::make_shared<boost::asio::steady_timer>(ioContext_);
    {
        std::scoped_lock lock(mutex_);
        timers_.emplace(id, timer);
    }

    // steady_timer is not thread-safe, arm it on the io thread
    boost::asio::post(ioContext_, [this, id, d, timer, fn = std::move(fn)]() mutable {
        timer->expires_after(d);
        timer->async_wait([this, id, fn = std::move(fn)](const boost::system::error_code& ec) {
            bool live;
            {
                std::scoped_lock lock(mutex_);
                live = timers_.erase(id) > 0;
            }
            if (ec || !live) return; // cancelled

            try {
                fn();
            } catch (const std::exception& e) {
                Registry::runtime()->error("[Scheduler] Timer {} callback threw: {}", id, e.what());
            }
        });
    });

    return id;
}

bool AsioScheduler::cancel(const TimerId id) {
    std::shared_ptr<boost::asio::steady_timer> timer;
    {
        std::scoped_lock lock(mutex_);
        const auto it = timers_.find(id);
        if (it == timers_.end()) return false;
        timer = std::move(it->second);
        timers_.erase(it);
    }

    boost::asio::post(ioContext_, [timer] { timer->cancel(); });
    return true;
}
