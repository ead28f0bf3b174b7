/// @file src/engine/run_queue.cpp
/// @brief RunQueue — background worker for launched forecast runs.

#include "votecast/run_queue.hpp"

#include <fmt/core.h>

#include <exception>

namespace votecast::engine {

RunQueue::RunQueue()
    : worker_(&RunQueue::worker_loop, this) {}

RunQueue::~RunQueue() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    task_cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void RunQueue::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push(std::move(task));
    }
    task_cv_.notify_one();
}

void RunQueue::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
}

std::size_t RunQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size() + active_;
}

void RunQueue::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            task_cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            // Drain everything already queued before honouring stop.
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            fmt::print(stderr, "[run-queue] task failed: {}\n", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
        }
        idle_cv_.notify_all();
    }
}

}  // namespace votecast::engine
