/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>

#include "projcache/project.hpp"

namespace projcache {

// External system the loaders read from (login server, persistence store).
// Calls may block and may throw; a throw fails that one refresh cycle only.
// Implementations must be callable from several worker threads at once.
class DataSource {
public:
    virtual ~DataSource() = default;

    virtual LoginStatistics fetchLoginStatistics(const Project& project) = 0;
    virtual ProjectDetails fetchProjectDetails(const Project& project) = 0;
    virtual std::chrono::system_clock::time_point fetchLastUpdateTime(const Project& project) = 0;
};

}
