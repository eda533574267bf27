/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "relayq/config.hpp"
#include "relayq/logger.hpp"
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace relayq {

namespace {
// Longest accepted duration; keeps clock arithmetic in nanoseconds from overflowing.
constexpr double kMaxSeconds = 100.0 * 365 * 24 * 3600;

std::string env_string(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    return val;
}

std::size_t env_size(const char* name, std::size_t defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

int env_int(const char* name, int defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

std::chrono::milliseconds env_seconds(const char* name, std::chrono::milliseconds defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    std::chrono::milliseconds parsed{};
    if (!parseSeconds(val, parsed)) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
    return parsed;
}
}

bool parseSeconds(const std::string& text, std::chrono::milliseconds& out) noexcept {
    try {
        std::size_t used = 0;
        double seconds = std::stod(text, &used);
        if (used != text.size() || !std::isfinite(seconds) || seconds < 0 || seconds > kMaxSeconds) {
            return false;
        }
        out = std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

BrokerConfig BrokerConfig::fromEnv() {
    BrokerConfig config;
    config.host = env_string("RELAYQ_HOST", config.host);
    config.port = env_int("RELAYQ_PORT", config.port);
    config.inputDir = env_string("RELAYQ_INPUT_DIR", config.inputDir.string());
    config.inputPrefix = env_string("RELAYQ_INPUT_PREFIX", config.inputPrefix);
    config.maxUploadBytes = env_size("RELAYQ_MAX_UPLOAD", config.maxUploadBytes);
    config.maxJobAge = env_seconds("RELAYQ_JOB_MAX_AGE", config.maxJobAge);
    config.sweepInterval = env_seconds("RELAYQ_SWEEP_INTERVAL", config.sweepInterval);
    return config;
}

WorkerConfig WorkerConfig::fromEnv() {
    WorkerConfig config;
    config.brokerUrl = env_string("RELAYQ_BROKER_URL", config.brokerUrl);
    config.backendUrl = env_string("RELAYQ_BACKEND_URL", config.backendUrl);
    config.outputDir = env_string("RELAYQ_OUTPUT_DIR", config.outputDir.string());
    config.outputSubfolder = env_string("RELAYQ_OUTPUT_SUBFOLDER", config.outputSubfolder);
    config.workflowPath = env_string("RELAYQ_WORKFLOW", config.workflowPath.string());
    config.nodesPath = env_string("RELAYQ_NODES", config.nodesPath.string());
    config.pollInterval = env_seconds("RELAYQ_POLL_INTERVAL", config.pollInterval);
    config.backendPollInterval = env_seconds("RELAYQ_BACKEND_POLL_INTERVAL", config.backendPollInterval);
    config.jobTimeout = env_seconds("RELAYQ_JOB_TIMEOUT", config.jobTimeout);
    config.maxConsecutiveErrors = env_int("RELAYQ_MAX_CONSECUTIVE_ERRORS", config.maxConsecutiveErrors);
    config.errorCooldown = env_seconds("RELAYQ_ERROR_COOLDOWN", config.errorCooldown);
    return config;
}

}
