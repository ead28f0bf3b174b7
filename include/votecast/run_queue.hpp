#pragma once

/// @file include/votecast/run_queue.hpp
/// @brief RunQueue — single background worker executing queued forecast runs.
///
/// submit() returns as soon as the task is queued. Tasks run one at a time in
/// FIFO order. A task that throws is logged and dropped; its run has already
/// been marked failed by the orchestrator. The destructor drains the queue
/// and joins the worker.

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

namespace votecast::engine {

class RunQueue {
public:
    RunQueue();
    ~RunQueue();

    RunQueue(const RunQueue&)            = delete;
    RunQueue& operator=(const RunQueue&) = delete;
    RunQueue(RunQueue&&)                 = delete;
    RunQueue& operator=(RunQueue&&)      = delete;

    void submit(std::function<void()> task);

    /// Block until the queue is empty and no task is executing.
    void wait_idle();

    /// Queued plus executing tasks.
    [[nodiscard]] std::size_t pending() const;

private:
    void worker_loop();

    std::queue<std::function<void()>> tasks_;
    mutable std::mutex                mutex_;
    std::condition_variable           task_cv_;
    std::condition_variable           idle_cv_;
    std::size_t                       active_ = 0;
    std::atomic<bool>                 stop_{false};
    std::thread                       worker_;  ///< Started last, joined first
};

}  // namespace votecast::engine
