#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace cs::concurrency;
using namespace cs::log;

ThreadPool::ThreadPool(const unsigned int nThreads) {
    for (unsigned int i = 0; i < std::max(1u, nThreads); ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(state_->mutex);
        if (state_->stopFlag.load()) return;
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(state_->queue, empty);
        state_->stopFlag.store(true);
    }
    state_->cv.notify_all();

    for (auto& t : threads_) {
        if (!t.joinable()) continue;
        if (t.get_id() == std::this_thread::get_id()) t.detach(); // stopped from one of our own tasks
        else t.join();
    }

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(state_->mutex);
        if (state_->stopFlag.load()) throw std::runtime_error("ThreadPool is stopped");
        state_->queue.push(std::move(task));
    }
    state_->cv.notify_one();
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([state = state_] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(state->mutex);
                state->cv.wait(lock, [&state] {
                    return state->stopFlag.load() || !state->queue.empty();
                });

                if (state->stopFlag.load() && state->queue.empty()) break;

                task = std::move(state->queue.front());
                state->queue.pop();
            }

            if (!task) continue;
            try {
                (*task)();
            } catch (const std::exception& e) {
                Registry::runtime()->error("[ThreadPool] Task '{}' threw: {}", task->name(), e.what());
            }
        }
    });
}
