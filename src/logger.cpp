/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace quay {

namespace {
std::mutex g_log_mutex;
LogLevel g_level = LogLevel::INFO;
bool g_level_initialized = false;
std::unordered_map<std::thread::id, std::string> g_thread_names;

LogLevel envLevel() noexcept {
    const char* env_val = std::getenv("QUAY_LOG_LEVEL");
    if (!env_val) return LogLevel::INFO;
    return Logger::parseLevel(env_val).value_or(LogLevel::INFO);
}

// Caller holds g_log_mutex.
std::string threadLabel() {
    auto tid = std::this_thread::get_id();
    auto it = g_thread_names.find(tid);
    if (it != g_thread_names.end()) {
        return it->second;
    }
    std::ostringstream oss;
    oss << "T" << tid;
    return oss.str();
}
}

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

void Logger::initFromEnv() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = envLevel();
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = envLevel();
        g_level_initialized = true;
    }
    return g_level;
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (!enabled(level)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local{};
        localtime_r(&time_t, &local);

        std::lock_guard<std::mutex> lock(g_log_mutex);
        std::ostringstream ss;
        ss << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count() << "]"
           << " [" << levelToString(level) << "]"
           << " [" << threadLabel() << "] " << message;
        // stdout belongs to the CLI tools
        std::cerr << ss.str() << std::endl;
    } catch (...) {
        // logging must never throw into the caller
    }
}

std::optional<LogLevel> Logger::parseLevel(const std::string& text) noexcept {
    std::string value(text);
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "error") return LogLevel::ERROR;
    if (value == "warn" || value == "warning") return LogLevel::WARN;
    if (value == "info") return LogLevel::INFO;
    if (value == "debug") return LogLevel::DEBUG;
    if (value == "trace") return LogLevel::TRACE;
    return std::nullopt;
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
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

void clearThreadName() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names.erase(std::this_thread::get_id());
}

}
