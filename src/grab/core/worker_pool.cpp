// Copyright (c) 2026 changcheng967. All rights reserved.

#include <grab/core/worker_pool.hpp>
#include <algorithm>
#include <optional>
#include <thread>

namespace grab::core {

WorkerPool::WorkerPool(std::vector<Task> tasks, std::size_t concurrency)
    : queue_(std::make_move_iterator(tasks.begin()), std::make_move_iterator(tasks.end()))
    , task_count_(queue_.size())
    , concurrency_(std::clamp<std::size_t>(concurrency, 1, std::max<std::size_t>(task_count_, 1))) {}

void WorkerPool::run() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ran_ || queue_.empty()) {
            ran_ = true;
            return;
        }
        ran_ = true;
    }

    {
        std::vector<std::jthread> workers;
        workers.reserve(concurrency_);
        for (std::size_t i = 0; i < concurrency_; ++i) {
            workers.emplace_back([this] { worker(); });
        }
        // jthread joins on destruction
    }

    if (first_error_) {
        std::rethrow_exception(first_error_);
    }
}

void WorkerPool::worker() {
    while (true) {
        std::optional<Task> task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                return;
            }
            task.emplace(std::move(queue_.front()));
            queue_.pop_front();
        }

        try {
            task->process();
        } catch (...) {
            // Kept for run() to rethrow; remaining tasks still run
            std::lock_guard<std::mutex> lock(mutex_);
            if (!first_error_) {
                first_error_ = std::current_exception();
            }
        }
    }
}

} // namespace grab::core
