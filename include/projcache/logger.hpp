/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace projcache {

enum class LogLevel : uint8_t { 
    ERROR = 0, 
    WARN = 1, 
    INFO = 2, 
    DEBUG = 3, 
    TRACE = 4 
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    
    static void log(LogLevel level, const std::string& message) noexcept;
    
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Name shown in the [thread] column for lines logged by the calling thread
void setThreadName(const std::string& name);

}

#define LOG_ERROR(msg) ::projcache::Logger::error(msg)
#define LOG_WARN(msg)  ::projcache::Logger::warn(msg)  
#define LOG_INFO(msg)  ::projcache::Logger::info(msg)
#define LOG_DEBUG(msg) ::projcache::Logger::debug(msg)
#define LOG_TRACE(msg) ::projcache::Logger::trace(msg)
