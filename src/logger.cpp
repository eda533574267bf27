/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "relayq/logger.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace relayq {

namespace {
std::mutex g_output_mutex;
std::ostream* g_output = nullptr;

// Unset until the first setLevel/initFromEnv or the first log call
std::once_flag g_level_once;
std::atomic<LogLevel> g_level{LogLevel::INFO};

thread_local std::string t_thread_name;

LogLevel envLevel() noexcept {
    const char* value = std::getenv("RELAYQ_LOG_LEVEL");
    if (!value) {
        return LogLevel::INFO;
    }
    return parseLogLevel(value).value_or(LogLevel::INFO);
}

void ensureLevel() noexcept {
    std::call_once(g_level_once, [] { g_level.store(envLevel()); });
}

const char* tag(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "?????";
}

std::string threadTag() {
    if (!t_thread_name.empty()) {
        return t_thread_name;
    }
    std::ostringstream oss;
    oss << "T" << std::this_thread::get_id();
    return oss.str();
}
}

std::optional<LogLevel> parseLogLevel(const std::string& name) noexcept {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "error") return LogLevel::ERROR;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "trace") return LogLevel::TRACE;
    return std::nullopt;
}

void Logger::setLevel(LogLevel level) noexcept {
    ensureLevel();
    g_level.store(level);
}

void Logger::initFromEnv() noexcept {
    ensureLevel();
    g_level.store(envLevel());
}

LogLevel Logger::level() noexcept {
    ensureLevel();
    return g_level.load();
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<std::uint8_t>(level) <= static_cast<std::uint8_t>(Logger::level());
}

void Logger::setOutput(std::ostream* out) noexcept {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    g_output = out;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    if (!enabled(level)) {
        return;
    }

    try {
        auto now = std::chrono::system_clock::now();
        auto seconds = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm local{};
        localtime_r(&seconds, &local);

        std::ostringstream line;
        line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
             << "." << std::setfill('0') << std::setw(3) << ms << "]"
             << " [" << tag(level) << "]"
             << " [" << threadTag() << "] "
             << message << "\n";

        std::lock_guard<std::mutex> lock(g_output_mutex);
        std::ostream& out = g_output ? *g_output : std::cerr;
        out << line.str() << std::flush;
    } catch (const std::exception&) {
        // A failed log line is dropped
    }
}

void setThreadName(const std::string& name) {
    t_thread_name = name;
}

}
