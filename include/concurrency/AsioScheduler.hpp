#pragma once

#include "concurrency/Scheduler.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace cs::concurrency {

class AsioScheduler final : public Scheduler {
public:
    AsioScheduler();
    ~AsioScheduler() override;

    AsioScheduler(const AsioScheduler&) = delete;
    AsioScheduler& operator=(const AsioScheduler&) = delete;

    [[nodiscard]] TimePoint now() const override;
    void sleepFor(Duration d) override;
    TimerId scheduleAfter(Duration d, std::function<void()> fn) override;
    bool cancel(TimerId id) override;

    void shutdown();

private:
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    boost::asio::io_context ioContext_;
    std::unique_ptr<WorkGuard> workGuard_;
    std::thread ioThread_;

    std::mutex mutex_;
    std::unordered_map<TimerId, std::shared_ptr<boost::asio::steady_timer>> timers_;
    std::atomic<TimerId> nextId_{1};
    std::atomic<bool> stopped_{false};
};

}
