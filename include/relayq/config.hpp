/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace relayq {

struct BrokerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    std::filesystem::path inputDir = "ComfyUI/input";
    std::string inputPrefix = "td_input";
    std::size_t maxUploadBytes = 50ULL * 1024 * 1024;
    std::chrono::milliseconds maxJobAge{std::chrono::hours(1)};
    std::chrono::milliseconds sweepInterval{std::chrono::minutes(1)};

    // Defaults overridden by RELAYQ_* environment variables.
    [[nodiscard]] static BrokerConfig fromEnv();
};

struct WorkerConfig {
    std::string brokerUrl = "http://127.0.0.1:8080";
    std::string backendUrl = "http://127.0.0.1:8111";
    std::filesystem::path outputDir = "ComfyUI/output";
    std::string outputSubfolder = "td_output";
    std::filesystem::path workflowPath = "workflows/ltxv_image_to_video.json";
    std::filesystem::path nodesPath;  // empty: built-in node map
    std::chrono::milliseconds pollInterval{500};
    std::chrono::milliseconds backendPollInterval{1000};
    std::chrono::milliseconds jobTimeout{std::chrono::minutes(10)};
    std::chrono::milliseconds requestTimeout{std::chrono::seconds(10)};
    int maxConsecutiveErrors = 5;
    std::chrono::milliseconds errorCooldown{std::chrono::seconds(10)};

    [[nodiscard]] static WorkerConfig fromEnv();
};

// Parses a non-negative number of seconds ("0.5", "600") into milliseconds.
// Values beyond 100 years are rejected.
[[nodiscard]] bool parseSeconds(const std::string& text, std::chrono::milliseconds& out) noexcept;

}
