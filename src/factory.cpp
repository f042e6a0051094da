/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "projcache/factory.hpp"
#include "projcache/loaders.hpp"
#include "projcache/logger.hpp"
#include "projcache/project.hpp"
#include "projcache/source.hpp"
#include <utility>

namespace projcache {

std::optional<std::vector<std::unique_ptr<RefreshTask>>>
buildRefreshTasks(Project& project, const std::shared_ptr<DataSource>& source) {
    std::vector<std::unique_ptr<RefreshTask>> tasks;

    switch (project.type()) {
        case ProjectType::Static:
            tasks.push_back(std::make_unique<StatisticsLoader>(project, source));
            return std::move(tasks);
        case ProjectType::Live:
            tasks.push_back(std::make_unique<ProjectDetailsLoader>(project, source));
            tasks.push_back(std::make_unique<LastUpdateTimeLoader>(project, source));
            tasks.push_back(std::make_unique<StatisticsLoader>(project, source));
            return std::move(tasks);
    }
    return std::nullopt;
}

CreateResult createScheduler(Project& project, std::shared_ptr<DataSource> source,
                             const SchedulerConfig& config) {
    CreateResult result;

    if (!source) {
        result.error = CreateError::MissingDataSource;
        result.message = "No data source for project \"" + project.name() + "\"";
        LOG_ERROR(result.message);
        return result;
    }

    auto tasks = buildRefreshTasks(project, source);
    if (!tasks) {
        result.error = CreateError::UnsupportedProjectType;
        result.message = "Unsupported project type " + toString(project.type()) +
                         " for project \"" + project.name() + "\"";
        LOG_ERROR(result.message);
        return result;
    }

    result.scheduler = std::make_unique<Scheduler>(project, std::move(*tasks), config);
    result.ok = true;
    return result;
}

}
