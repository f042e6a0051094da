/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "projcache/loaders.hpp"
#include "projcache/project.hpp"
#include "projcache/source.hpp"
#include "projcache/logger.hpp"
#include <mutex>
#include <ostream>
#include <utility>

namespace {
// Several schedulers may report to the same stream
std::mutex g_status_mutex;
}

namespace projcache {

StatisticsLoader::StatisticsLoader(Project& project, std::shared_ptr<DataSource> source)
    : project_(project), source_(std::move(source)) {
}

void StatisticsLoader::run() {
    LoginStatistics stats = source_->fetchLoginStatistics(project_);
    project_.setStatistics(stats);
    LOG_DEBUG("Loaded login statistics for \"" + project_.name() + "\": " +
              std::to_string(stats.totalLogins) + " logins");
}

ProjectDetailsLoader::ProjectDetailsLoader(Project& project, std::shared_ptr<DataSource> source)
    : project_(project), source_(std::move(source)) {
}

void ProjectDetailsLoader::run() {
    project_.setDetails(source_->fetchProjectDetails(project_));
    LOG_DEBUG("Loaded project details for \"" + project_.name() + "\"");
}

LastUpdateTimeLoader::LastUpdateTimeLoader(Project& project, std::shared_ptr<DataSource> source)
    : project_(project), source_(std::move(source)) {
}

void LastUpdateTimeLoader::run() {
    project_.setLastUpdateTime(source_->fetchLastUpdateTime(project_));
    LOG_TRACE("Loaded last update time for \"" + project_.name() + "\"");
}

StatusReporter::StatusReporter(const Project& project, std::ostream& out)
    : project_(project), out_(out) {
}

void StatusReporter::run() {
    std::lock_guard<std::mutex> lock(g_status_mutex);
    project_.prettyPrint(out_);
}

}
