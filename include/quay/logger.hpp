/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace quay {

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
    // Re-read QUAY_LOG_LEVEL, overriding any earlier setLevel().
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& text) noexcept;

private:
    static const char* levelToString(LogLevel level) noexcept;
};

// Names the calling thread in log lines ("Slot-2", "Reaper", ...).
void setThreadName(const std::string& name);
void clearThreadName();

}

#define LOG_ERROR(msg) ::quay::Logger::error(msg)
#define LOG_WARN(msg)  ::quay::Logger::warn(msg)
#define LOG_INFO(msg)  ::quay::Logger::info(msg)
#define LOG_DEBUG(msg) ::quay::Logger::debug(msg)
#define LOG_TRACE(msg) ::quay::Logger::trace(msg)
