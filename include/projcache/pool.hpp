/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "projcache/types.hpp"

namespace projcache {

using JobProcessor = std::function<void(TaskId taskId, int workerId)>;

// Fixed-size worker pool with a FIFO queue of task ids.
//
// stop() closes the pool, lets the workers drain what is already queued and
// waits at most `grace` for that to happen. Past the deadline the queue is
// dropped, busy workers get their interrupt flag raised and are detached.
// Worker state is shared with the threads so a detached worker never touches
// a destroyed Pool.
class Pool {
public:
    explicit Pool(int workers, std::string name = "Worker") noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobProcessor processor);
    // Returns true when the pool drained within the grace window
    bool stop(std::chrono::milliseconds grace) noexcept;
    [[nodiscard]] bool submit(TaskId taskId) noexcept;
    
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] std::size_t activeCount() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    struct Shared;

    static void workerLoop(std::shared_ptr<Shared> shared, int workerId, std::string threadName);
    [[nodiscard]] bool awaitIdle(std::chrono::milliseconds timeout) noexcept;
    void terminate() noexcept;
    
    int workers_;
    std::string name_;
    
    std::atomic<bool> running_{false};
    std::shared_ptr<Shared> shared_;
    std::vector<std::thread> workerThreads_;
};

// True inside a pool job once the pool has given up waiting for it.
[[nodiscard]] bool interruptRequested() noexcept;

}
