/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "projcache/scheduler.hpp"
#include "projcache/loaders.hpp"
#include "projcache/logger.hpp"
#include "projcache/pool.hpp"
#include "projcache/project.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

namespace projcache {

struct Scheduler::Entry {
    std::unique_ptr<RefreshTask> task;
    std::string name;
    TaskKind kind;
    std::chrono::milliseconds initialDelay;

    std::atomic<std::uint64_t> runs{0};
    std::atomic<std::uint64_t> failures{0};
    std::atomic<std::uint64_t> skipped{0};
    std::atomic<bool> pending{false};  // queued or running

    Entry(std::unique_ptr<RefreshTask> t, std::chrono::milliseconds delay)
        : task(std::move(t)), name(task->name()), kind(task->kind()), initialDelay(delay) {}
};

Scheduler::Scheduler(Project& project, std::vector<std::unique_ptr<RefreshTask>> tasks,
                     SchedulerConfig config)
    : project_(project), config_(config), entries_(std::make_shared<Entries>()) {
    for (auto& task : tasks) {
        if (!task) {
            LOG_WARN("Ignoring null refresh task for project \"" + project_.name() + "\"");
            continue;
        }
        entries_->push_back(std::make_unique<Entry>(std::move(task), std::chrono::milliseconds(0)));
    }
    refreshCount_ = entries_->size();

    if (config_.reportStatus) {
        std::ostream& out = config_.statusOut ? *config_.statusOut : std::cout;
        entries_->push_back(std::make_unique<Entry>(std::make_unique<StatusReporter>(project_, out),
                                                    config_.statusDelay));
    }

    LOG_DEBUG("Scheduler created for project \"" + project_.name() + "\" with " +
              std::to_string(refreshCount_) + " refresh task(s)");
}

Scheduler::~Scheduler() {
    stop();
}

bool Scheduler::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);

    if (state_.load() != SchedulerState::Created) {
        LOG_WARN("Scheduler for project \"" + project_.name() + "\" cannot be started again");
        return false;
    }

    std::string reason;
    if (!config_.validate(reason)) {
        LOG_ERROR("Scheduler for project \"" + project_.name() + "\" not started: " + reason);
        return false;
    }

    LOG_INFO("Starting project data reloading for project \"" + project_.name() +
             "\", type: " + toString(project_.type()));

    try {
        const int workers = config_.resolveWorkers(entries_->size());
        if (static_cast<std::size_t>(workers) < entries_->size()) {
            LOG_WARN("Project \"" + project_.name() + "\" schedules " + std::to_string(entries_->size()) +
                     " tasks on " + std::to_string(workers) + " workers; executions will queue");
        }

        auto pool = std::make_unique<Pool>(workers, project_.name() + "/Worker");
        auto entries = entries_;
        std::string projectName = project_.name();
        if (!pool->start([entries, projectName](TaskId taskId, int) {
                execute(*(*entries)[taskId], projectName);
            })) {
            LOG_ERROR("Failed to start worker pool for project \"" + project_.name() + "\"");
            return false;
        }
        pool_ = std::move(pool);

        {
            std::lock_guard<std::mutex> timerLock(timerMutex_);
            timerStop_ = false;
        }
        timerThread_ = std::thread(&Scheduler::timerLoop, this, Clock::now());

        state_.store(SchedulerState::Running);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start scheduler for project \"" + project_.name() + "\": " + std::string(e.what()));
        if (pool_) {
            pool_->stop(std::chrono::milliseconds(0));
            pool_.reset();
        }
        return false;
    }
}

bool Scheduler::stop() noexcept {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);

    if (state_.load() != SchedulerState::Running) {
        LOG_DEBUG("Scheduler for project \"" + project_.name() + "\" is not running");
        return false;
    }

    LOG_INFO("Stopping project data reloading for project \"" + project_.name() + "\"...");

    {
        std::lock_guard<std::mutex> timerLock(timerMutex_);
        timerStop_ = true;
    }
    timerWake_.notify_all();
    if (timerThread_.joinable()) {
        timerThread_.join();
    }

    if (!pool_->stop(config_.graceWindow)) {
        LOG_WARN("Project \"" + project_.name() + "\": refreshes still running after " +
                 std::to_string(config_.graceWindow.count()) + "ms grace window were interrupted");
    }
    pool_.reset();
    state_.store(SchedulerState::Stopped);

    LOG_INFO("Project data reloading stopped for project \"" + project_.name() + "\"");
    return true;
}

std::vector<const RefreshTask*> Scheduler::tasks() const {
    std::vector<const RefreshTask*> result;
    result.reserve(refreshCount_);
    for (std::size_t i = 0; i < refreshCount_; ++i) {
        result.push_back((*entries_)[i]->task.get());
    }
    return result;
}

std::vector<TaskStats> Scheduler::stats() const {
    std::vector<TaskStats> result;
    result.reserve(entries_->size());
    for (const auto& entry : *entries_) {
        TaskStats stats;
        stats.name = entry->name;
        stats.kind = entry->kind;
        stats.runs = entry->runs.load();
        stats.failures = entry->failures.load();
        stats.skipped = entry->skipped.load();
        result.push_back(std::move(stats));
    }
    return result;
}

int Scheduler::workerCount() const noexcept {
    return config_.resolveWorkers(entries_->size());
}

void Scheduler::timerLoop(Clock::time_point origin) {
    setThreadName("Timer-" + project_.name());
    LOG_DEBUG("Timer loop started");

    std::vector<Clock::time_point> next;
    next.reserve(entries_->size());
    for (const auto& entry : *entries_) {
        next.push_back(origin + entry->initialDelay);
    }

    std::unique_lock<std::mutex> lock(timerMutex_);
    while (!timerStop_) {
        if (next.empty()) {
            timerWake_.wait(lock, [this] { return timerStop_; });
            break;
        }

        // Fixed rate: the next firing is anchored to the schedule, not to now
        const auto now = Clock::now();
        for (TaskId id = 0; id < next.size() && !timerStop_; ++id) {
            while (next[id] <= now) {
                fire(id);
                next[id] += config_.reloadPeriod;
            }
        }

        const auto wake = *std::min_element(next.begin(), next.end());
        timerWake_.wait_until(lock, wake, [this] { return timerStop_; });
    }

    LOG_DEBUG("Timer loop stopped");
}

void Scheduler::fire(TaskId taskId) {
    Entry& entry = *(*entries_)[taskId];

    if (config_.overlap == OverlapPolicy::Skip) {
        if (entry.pending.exchange(true)) {
            entry.skipped.fetch_add(1);
            LOG_DEBUG("Skipping " + entry.name + " for project \"" + project_.name() +
                      "\": previous run not finished");
            return;
        }
    } else {
        entry.pending.store(true);
    }

    if (!pool_->submit(taskId)) {
        entry.pending.store(false);
    }
}

void Scheduler::execute(Entry& entry, const std::string& projectName) noexcept {
    try {
        entry.task->run();
    } catch (const std::exception& e) {
        entry.failures.fetch_add(1);
        LOG_ERROR("Refresh task " + entry.name + " failed for project \"" + projectName + "\": " + e.what());
    } catch (...) {
        entry.failures.fetch_add(1);
        LOG_ERROR("Refresh task " + entry.name + " failed for project \"" + projectName + "\": unknown error");
    }
    entry.runs.fetch_add(1);
    entry.pending.store(false);
}

}
