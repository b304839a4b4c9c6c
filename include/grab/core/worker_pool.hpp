// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <vector>

namespace grab::core {

// Independent unit of work. Tasks record their own outcome.
struct Task {
    std::size_t id{0};
    std::function<void()> exec;

    void process() const {
        if (exec) exec();
    }
};

// Fixed-size pool that runs a known set of tasks to completion.
//
// Every task runs exactly once, on one of `concurrency` worker threads, in
// no particular order. run() blocks until the queue is drained and all
// workers have exited; the pool accepts nothing after that.
class WorkerPool {
public:
    WorkerPool(std::vector<Task> tasks, std::size_t concurrency);

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Run all tasks. If tasks threw, the first exception is rethrown here
    // after every other task has still run.
    void run();

    // Worker count actually used: clamped to [1, task count]
    [[nodiscard]] std::size_t concurrency() const noexcept { return concurrency_; }
    [[nodiscard]] std::size_t size() const noexcept { return task_count_; }

private:
    void worker();

    std::deque<Task> queue_;
    std::size_t task_count_{0};
    std::size_t concurrency_{1};
    bool ran_{false};
    std::exception_ptr first_error_;
    std::mutex mutex_;
};

} // namespace grab::core
