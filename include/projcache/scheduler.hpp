/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "projcache/config.hpp"
#include "projcache/task.hpp"
#include "projcache/types.hpp"

namespace projcache {

class Project;
class Pool;

enum class SchedulerState : std::uint8_t { Created, Running, Stopped };

struct TaskStats {
    std::string name;
    TaskKind kind = TaskKind::Statistics;
    std::uint64_t runs = 0;      // finished executions, failed ones included
    std::uint64_t failures = 0;
    std::uint64_t skipped = 0;   // firings dropped under OverlapPolicy::Skip
};

// Runs a project's refresh tasks at a fixed rate on its own worker pool.
//
// Every task fires at start and then every reloadPeriod, anchored to the
// start time. The status reporter (when enabled) goes through the same path
// with statusDelay as its first offset. Lifecycle is Created -> Running ->
// Stopped: start() only succeeds from Created, stop() only acts on Running
// and is a no-op returning false otherwise.
class Scheduler final {
public:
    Scheduler(Project& project, std::vector<std::unique_ptr<RefreshTask>> tasks,
              SchedulerConfig config = SchedulerConfig{});
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    [[nodiscard]] bool start();
    // Blocks for at most the grace window
    bool stop() noexcept;

    [[nodiscard]] SchedulerState state() const noexcept { return state_.load(); }
    [[nodiscard]] Project& project() const noexcept { return project_; }
    [[nodiscard]] const SchedulerConfig& config() const noexcept { return config_; }
    // Bound refresh tasks in factory order, status reporter excluded
    [[nodiscard]] std::vector<const RefreshTask*> tasks() const;
    // One entry per scheduled task, status reporter last
    [[nodiscard]] std::vector<TaskStats> stats() const;
    [[nodiscard]] int workerCount() const noexcept;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry;
    using Entries = std::vector<std::unique_ptr<Entry>>;

    void timerLoop(Clock::time_point origin);
    void fire(TaskId taskId);
    static void execute(Entry& entry, const std::string& projectName) noexcept;

    Project& project_;
    SchedulerConfig config_;
    std::size_t refreshCount_ = 0;
    std::shared_ptr<Entries> entries_;

    std::mutex lifecycleMutex_;
    std::atomic<SchedulerState> state_{SchedulerState::Created};
    std::unique_ptr<Pool> pool_;

    std::thread timerThread_;
    std::mutex timerMutex_;
    std::condition_variable timerWake_;
    bool timerStop_ = false;
};

}
