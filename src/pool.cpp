/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "projcache/pool.hpp"
#include "projcache/logger.hpp"
#include <condition_variable>
#include <mutex>
#include <queue>
#include <utility>

namespace {
thread_local const std::atomic<bool>* t_interrupt = nullptr;
}

namespace projcache {

struct Pool::Shared {
    JobProcessor processor;

    std::mutex mutex;
    std::condition_variable jobAvailable;
    std::condition_variable idle;
    std::queue<TaskId> jobQueue;
    std::size_t active = 0;
    bool closed = false;   // no new submissions, drain the queue
    bool aborted = false;  // exit without draining

    std::vector<bool> busy;
    std::unique_ptr<std::atomic<bool>[]> interrupt;
};

bool interruptRequested() noexcept {
    return t_interrupt != nullptr && t_interrupt->load();
}

Pool::Pool(int workers, std::string name) noexcept
    : workers_(workers > 0 ? workers : 1), name_(std::move(name)) {
    LOG_DEBUG("Pool " + name_ + " created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop(std::chrono::milliseconds(0));
}

bool Pool::start(JobProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool " + name_ + " already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid job processor provided");
        return false;
    }

    auto shared = std::make_shared<Shared>();
    shared->processor = std::move(processor);
    shared->busy.assign(static_cast<std::size_t>(workers_), false);
    shared->interrupt = std::make_unique<std::atomic<bool>[]>(static_cast<std::size_t>(workers_));
    shared_ = shared;

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, shared_, i,
                                        name_ + "-" + std::to_string(i));
        }
        
        running_.store(true);
        LOG_DEBUG("Pool " + name_ + " started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        running_.store(true);
        terminate();
        return false;
    }
}

bool Pool::stop(std::chrono::milliseconds grace) noexcept {
    if (!running_.load()) {
        return true;
    }

    LOG_DEBUG("Stopping pool " + name_ + "...");

    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->closed = true;
    }
    shared_->jobAvailable.notify_all();

    if (!awaitIdle(grace)) {
        terminate();
        return false;
    }

    // Drained: every worker sees an empty closed queue and exits
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();
    shared_.reset();
    running_.store(false);

    LOG_DEBUG("Pool " + name_ + " stopped");
    return true;
}

bool Pool::submit(TaskId taskId) noexcept {
    if (!running_.load()) {
        LOG_DEBUG("Cannot submit task " + std::to_string(taskId) + " to stopped pool " + name_);
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(shared_->mutex);
            if (shared_->closed) {
                return false;
            }
            shared_->jobQueue.push(taskId);
        }
        
        shared_->jobAvailable.notify_one();
        LOG_TRACE("Task queued: " + std::to_string(taskId));
        return true;
    } catch (...) {
        LOG_ERROR("Failed to queue task: " + std::to_string(taskId));
        return false;
    }
}

std::size_t Pool::queueSize() const noexcept {
    auto shared = shared_;
    if (!shared) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(shared->mutex);
    return shared->jobQueue.size();
}

std::size_t Pool::activeCount() const noexcept {
    auto shared = shared_;
    if (!shared) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(shared->mutex);
    return shared->active;
}

bool Pool::awaitIdle(std::chrono::milliseconds timeout) noexcept {
    try {
        std::unique_lock<std::mutex> lock(shared_->mutex);
        return shared_->idle.wait_for(lock, timeout, [this] {
            return shared_->jobQueue.empty() && shared_->active == 0;
        });
    } catch (...) {
        return false;
    }
}

void Pool::terminate() noexcept {
    std::vector<bool> busy;
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->aborted = true;
        shared_->closed = true;
        dropped = shared_->jobQueue.size();
        std::queue<TaskId>().swap(shared_->jobQueue);
        busy = shared_->busy;
        for (std::size_t i = 0; i < busy.size(); ++i) {
            if (busy[i]) {
                shared_->interrupt[i].store(true);
            }
        }
    }
    shared_->jobAvailable.notify_all();

    int abandoned = 0;
    for (std::size_t i = 0; i < workerThreads_.size(); ++i) {
        auto& thread = workerThreads_[i];
        if (!thread.joinable()) {
            continue;
        }
        if (i < busy.size() && busy[i]) {
            thread.detach();
            ++abandoned;
        } else {
            thread.join();
        }
    }
    workerThreads_.clear();
    shared_.reset();
    running_.store(false);

    if (dropped > 0 || abandoned > 0) {
        LOG_WARN("Pool " + name_ + " terminated: dropped " + std::to_string(dropped) +
                 " queued task(s), abandoned " + std::to_string(abandoned) + " busy worker(s)");
    } else {
        LOG_DEBUG("Pool " + name_ + " terminated");
    }
}

void Pool::workerLoop(std::shared_ptr<Shared> shared, int workerId, std::string threadName) {
    setThreadName(threadName);
    t_interrupt = &shared->interrupt[workerId];
    LOG_TRACE(threadName + " thread started");
    
    try {
        while (true) {
            TaskId taskId = 0;
            
            {
                std::unique_lock<std::mutex> lock(shared->mutex);
                shared->jobAvailable.wait(lock, [&shared] { 
                    return !shared->jobQueue.empty() || shared->closed || shared->aborted; 
                });
                
                if (shared->aborted || shared->jobQueue.empty()) {
                    break;
                }
                
                taskId = shared->jobQueue.front();
                shared->jobQueue.pop();
                ++shared->active;
                shared->busy[workerId] = true;
            }
            
            try {
                shared->processor(taskId, workerId);
            } catch (const std::exception& e) {
                LOG_ERROR(threadName + " task processing error: " + 
                         std::string(e.what()) + " (task: " + std::to_string(taskId) + ")");
            } catch (...) {
                LOG_ERROR(threadName + " unknown task processing error (task: " + std::to_string(taskId) + ")");
            }

            {
                std::lock_guard<std::mutex> lock(shared->mutex);
                --shared->active;
                shared->busy[workerId] = false;
                if (shared->jobQueue.empty() && shared->active == 0) {
                    shared->idle.notify_all();
                }
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR(threadName + " fatal error: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR(threadName + " unknown fatal error");
    }
    
    LOG_TRACE(threadName + " stopped");
    t_interrupt = nullptr;
}

}
