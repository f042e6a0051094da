/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>

#include "projcache/types.hpp"

namespace projcache {

struct LoginStatistics {
    std::uint64_t activeUsers = 0;
    std::uint64_t totalLogins = 0;
    std::uint64_t failedLogins = 0;
};

struct ProjectDetails {
    std::string description;
    std::string owner;
    std::uint32_t memberCount = 0;
};

// Entity whose cached data is kept fresh by a Scheduler. Name and type are
// fixed at construction; each cached slice has its own accessor pair and all
// of them are guarded by one mutex, so loaders may run concurrently.
class Project final {
public:
    using Clock = std::chrono::system_clock;

    Project(std::string name, ProjectType type);

    Project(const Project&) = delete;
    Project& operator=(const Project&) = delete;
    Project(Project&&) = delete;
    Project& operator=(Project&&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] ProjectType type() const noexcept { return type_; }

    void setStatistics(const LoginStatistics& stats);
    [[nodiscard]] LoginStatistics statistics() const;

    void setDetails(const ProjectDetails& details);
    [[nodiscard]] ProjectDetails details() const;

    void setLastUpdateTime(Clock::time_point when);
    // Epoch when never loaded
    [[nodiscard]] Clock::time_point lastUpdateTime() const;

    void prettyPrint(std::ostream& out) const;

private:
    const std::string name_;
    const ProjectType type_;

    mutable std::mutex stateMutex_;
    LoginStatistics statistics_;
    ProjectDetails details_;
    Clock::time_point lastUpdateTime_{};
};

}
