/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "projcache/project.hpp"
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>

namespace {

std::string formatTime(std::chrono::system_clock::time_point when) {
    if (when == std::chrono::system_clock::time_point{}) {
        return "never";
    }
    auto time = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}

namespace projcache {

Project::Project(std::string name, ProjectType type)
    : name_(std::move(name)), type_(type) {
}

void Project::setStatistics(const LoginStatistics& stats) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    statistics_ = stats;
}

LoginStatistics Project::statistics() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return statistics_;
}

void Project::setDetails(const ProjectDetails& details) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    details_ = details;
}

ProjectDetails Project::details() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return details_;
}

void Project::setLastUpdateTime(Clock::time_point when) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    lastUpdateTime_ = when;
}

Project::Clock::time_point Project::lastUpdateTime() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return lastUpdateTime_;
}

void Project::prettyPrint(std::ostream& out) const {
    LoginStatistics stats;
    ProjectDetails details;
    Clock::time_point updated;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        stats = statistics_;
        details = details_;
        updated = lastUpdateTime_;
    }

    // Build the whole block first so concurrent printers do not interleave lines
    std::ostringstream oss;
    oss << "Project \"" << name_ << "\" (" << toString(type_) << ")\n";
    oss << "  logins:       " << stats.totalLogins << " total, "
        << stats.failedLogins << " failed, " << stats.activeUsers << " active users\n";
    if (type_ == ProjectType::Live) {
        oss << "  owner:        " << (details.owner.empty() ? "-" : details.owner) << "\n";
        oss << "  members:      " << details.memberCount << "\n";
        oss << "  description:  " << (details.description.empty() ? "-" : details.description) << "\n";
        oss << "  last update:  " << formatTime(updated) << "\n";
    }
    out << oss.str() << std::flush;
}

}
