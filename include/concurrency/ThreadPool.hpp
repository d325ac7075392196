#pragma once

#include "concurrency/Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace cs::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads = 1);

    ~ThreadPool();

    // Discards tasks not yet picked up and joins every worker. Called from one
    // of the pool's own tasks, that worker is detached and exits once the task returns.
    void stop();

    // Throws once the pool is stopped
    void submit(std::shared_ptr<Task> task);

private:
    // Shared with the workers so a detached worker never outlives it
    struct State {
        std::condition_variable cv;
        std::mutex mutex;
        std::queue<std::shared_ptr<Task>> queue;
        std::atomic<bool> stopFlag{false};
    };

    void spawnWorker();

    std::shared_ptr<State> state_ = std::make_shared<State>();
    std::vector<std::thread> threads_;
};

} // namespace cs::concurrency
