/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "projcache/config.hpp"
#include "projcache/scheduler.hpp"
#include "projcache/task.hpp"

namespace projcache {

class Project;
class DataSource;

enum class CreateError : uint8_t {
    None = 0,
    UnsupportedProjectType,
    MissingDataSource
};

struct CreateResult {
    bool ok = false;
    std::unique_ptr<Scheduler> scheduler;
    CreateError error = CreateError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Refresh tasks for the project's type, bound to that project:
//   STATIC -> statistics
//   LIVE   -> project details, last update time, statistics
// std::nullopt for a type outside that table.
[[nodiscard]] std::optional<std::vector<std::unique_ptr<RefreshTask>>>
buildRefreshTasks(Project& project, const std::shared_ptr<DataSource>& source);

[[nodiscard]] CreateResult createScheduler(Project& project, std::shared_ptr<DataSource> source,
                                           const SchedulerConfig& config = SchedulerConfig{});

}
