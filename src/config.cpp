/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "projcache/config.hpp"
#include "projcache/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <optional>
#include <string>

namespace {

std::optional<long> readPositive(const char* var, bool allowZero, long max) {
    const char* value = std::getenv(var);
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(value, &end, 10);
    if (*end != '\0' || parsed < 0 || (parsed == 0 && !allowZero)) {
        LOG_WARN(std::string("Ignoring invalid ") + var + "=" + value);
        return std::nullopt;
    }
    if (errno == ERANGE || parsed > max) {
        LOG_WARN(std::string(var) + "=" + value + " exceeds limit, using " + std::to_string(max));
        return max;
    }
    return parsed;
}

}

namespace projcache {

SchedulerConfig SchedulerConfig::fromEnv() {
    SchedulerConfig config;

    if (auto seconds = readPositive("PROJCACHE_RELOAD_PERIOD", false, kMaxSeconds)) {
        config.reloadPeriod = std::chrono::seconds(*seconds);
    }
    if (auto seconds = readPositive("PROJCACHE_STATUS_DELAY", true, kMaxSeconds)) {
        config.statusDelay = std::chrono::seconds(*seconds);
    }
    if (auto seconds = readPositive("PROJCACHE_GRACE_WINDOW", true, kMaxSeconds)) {
        config.graceWindow = std::chrono::seconds(*seconds);
    }
    if (auto workers = readPositive("PROJCACHE_WORKERS", true, kMaxWorkers)) {
        config.workers = static_cast<int>(*workers);
    }
    if (const char* overlap = std::getenv("PROJCACHE_OVERLAP")) {
        std::string value(overlap);
        for (char& c : value) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (value == "skip") {
            config.overlap = OverlapPolicy::Skip;
        } else if (value == "allow") {
            config.overlap = OverlapPolicy::Allow;
        } else {
            LOG_WARN("Ignoring invalid PROJCACHE_OVERLAP=" + value);
        }
    }

    return config;
}

bool SchedulerConfig::validate(std::string& reason) const {
    const std::chrono::milliseconds limit = std::chrono::seconds(kMaxSeconds);

    if (reloadPeriod.count() <= 0 || reloadPeriod > limit) {
        reason = "reload period " + std::to_string(reloadPeriod.count()) + "ms out of range";
        return false;
    }
    if (statusDelay.count() < 0 || statusDelay > limit) {
        reason = "status delay " + std::to_string(statusDelay.count()) + "ms out of range";
        return false;
    }
    if (graceWindow.count() < 0 || graceWindow > limit) {
        reason = "grace window " + std::to_string(graceWindow.count()) + "ms out of range";
        return false;
    }
    if (workers < 0 || workers > kMaxWorkers) {
        reason = "worker count " + std::to_string(workers) + " out of range";
        return false;
    }
    return true;
}

int SchedulerConfig::resolveWorkers(std::size_t scheduledTasks) const noexcept {
    if (workers > 0) {
        return workers;
    }
    return std::max(kDefaultWorkers, static_cast<int>(scheduledTasks));
}

}
