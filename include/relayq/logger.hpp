/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace relayq {

enum class LogLevel : std::uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// "error", "warn"/"warning", "info", "debug", "trace"; case-insensitive.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(const std::string& name) noexcept;

// Process-wide line logger shared by relayqd, the worker and rq. Lines go to
// stderr unless redirected; stdout stays free for command output.
class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    // RELAYQ_LOG_LEVEL, or INFO when unset or unrecognized.
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    // nullptr restores stderr. The stream must outlive its use.
    static void setOutput(std::ostream* out) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }
};

// Tag printed on this thread's log lines ("Http", "Sweep", "Worker").
void setThreadName(const std::string& name);

}

#define LOG_ERROR(msg) ::relayq::Logger::error(msg)
#define LOG_WARN(msg)  ::relayq::Logger::warn(msg)
#define LOG_INFO(msg)  ::relayq::Logger::info(msg)
#define LOG_DEBUG(msg) ::relayq::Logger::debug(msg)
#define LOG_TRACE(msg) ::relayq::Logger::trace(msg)
