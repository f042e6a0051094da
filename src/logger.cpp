/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "projcache/logger.hpp"
#include <iostream>
#include <cctype>
#include <cstdlib>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <thread>

namespace projcache {

static LogLevel g_level = LogLevel::INFO;
static std::mutex g_log_mutex;
static bool g_level_initialized = false;
static thread_local std::string t_thread_name;

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

void Logger::initFromEnv() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = parseEnvLevel();
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = parseEnvLevel();
        g_level_initialized = true;
    }
    return g_level;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&time_t, &local);

        std::ostringstream ss;
        ss << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        ss << " [" << levelToString(level) << "] [";
        if (t_thread_name.empty()) {
            ss << "T" << std::this_thread::get_id();
        } else {
            ss << t_thread_name;
        }
        ss << "] " << message;

        {
            // All logs go to stderr - stdout carries status snapshots
            std::lock_guard<std::mutex> lock(g_log_mutex);
            std::cerr << ss.str() << std::endl;
        }
    } catch (...) {
        // Never throw from logging
    }
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env_val = std::getenv("PROJCACHE_LOG_LEVEL");
    if (!env_val) return LogLevel::INFO;

    std::string level_str(env_val);
    for (char& c : level_str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (level_str == "error") return LogLevel::ERROR;
    if (level_str == "warn" || level_str == "warning") return LogLevel::WARN;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "trace") return LogLevel::TRACE;
    
    return LogLevel::INFO;
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    t_thread_name = name;
}

}
