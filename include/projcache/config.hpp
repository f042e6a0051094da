/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace projcache {

// What to do when a task fires while its previous execution is unfinished.
enum class OverlapPolicy : std::uint8_t {
    Skip,   // drop the firing
    Allow   // queue it anyway; executions of one task may overlap
};

struct SchedulerConfig {
    static constexpr int kDefaultWorkers = 4;
    // Upper bounds keep start time + offsets well inside steady_clock's range
    static constexpr long kMaxSeconds = 366L * 24 * 60 * 60;
    static constexpr int kMaxWorkers = 1024;

    std::chrono::milliseconds reloadPeriod{std::chrono::seconds(15)};
    std::chrono::milliseconds statusDelay{std::chrono::seconds(1)};
    std::chrono::milliseconds graceWindow{std::chrono::seconds(60)};
    int workers = 0;  // 0 = max(kDefaultWorkers, scheduled tasks)
    OverlapPolicy overlap = OverlapPolicy::Skip;
    bool reportStatus = true;
    std::ostream* statusOut = nullptr;  // nullptr = std::cout

    // Defaults overridden by PROJCACHE_* environment variables
    [[nodiscard]] static SchedulerConfig fromEnv();

    // False with a reason when a duration or the worker count is out of range
    [[nodiscard]] bool validate(std::string& reason) const;

    [[nodiscard]] int resolveWorkers(std::size_t scheduledTasks) const noexcept;
};

}
