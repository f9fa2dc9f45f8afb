/*
 * mtget - Bounded-concurrency transfer scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace mtget {

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

// Thread naming for log context (Main, Worker-N)
void setThreadName(const std::string& name);
void clearThreadName() noexcept;
std::string workerThreadName(std::uint32_t taskId);

}

#define LOG_ERROR(msg) ::mtget::Logger::error(msg)
#define LOG_WARN(msg)  ::mtget::Logger::warn(msg)
#define LOG_INFO(msg)  ::mtget::Logger::info(msg)
#define LOG_DEBUG(msg) ::mtget::Logger::debug(msg)
#define LOG_TRACE(msg) ::mtget::Logger::trace(msg)
