// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

namespace route_atlas {

/// Fixed-size pool of worker threads draining a FIFO task queue.
/// The destructor runs every queued task before joining.
class ThreadPool {
public:
    /// @throws std::invalid_argument if num_threads is 0
    explicit ThreadPool(std::size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <class F>
    void Enqueue(F&& f) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            tasks_.emplace(std::forward<F>(f));
        }

        condition_.notify_one();
    }

    [[nodiscard]] std::size_t GetQueueSize() const;

    [[nodiscard]] std::size_t GetThreadCount() const noexcept {
        return workers_.size();
    }

private:
    void WorkerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_;
};

} // namespace route_atlas
