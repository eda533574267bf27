/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>

#include <json/json.h>

#include "relayq/backend.hpp"
#include "relayq/broker_client.hpp"
#include "relayq/config.hpp"
#include "relayq/resolver.hpp"
#include "relayq/workflow.hpp"

namespace relayq {

enum class ProcessResult : std::uint8_t {
    Idle,        // queue empty
    Success,     // job reported done
    Failed,      // job reported as error
    Skipped,     // start rejected (job deleted or taken)
    SystemError  // broker unreachable or unexpected failure
};

// Single-threaded consumer: takes the oldest queued job from the broker,
// drives it through the backend and reports the outcome.
class Worker final {
public:
    explicit Worker(const WorkerConfig& config);

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;
    Worker(Worker&&) = delete;
    Worker& operator=(Worker&&) = delete;

    // Loads the workflow template and node map and prepares the output folder.
    // Fails when the template cannot be read or lacks a usable image input node.
    [[nodiscard]] bool init() noexcept;

    // One iteration without any sleep.
    [[nodiscard]] ProcessResult processOnce() noexcept;

    // Loops until stop(), backing off after repeated system errors.
    void run();
    void stop() noexcept;

    [[nodiscard]] bool isStopping() const noexcept { return stop_.load(); }
    [[nodiscard]] int consecutiveErrors() const noexcept { return consecutiveErrors_; }

private:
    [[nodiscard]] ProcessResult processJob(const Dispatch& job) noexcept;
    [[nodiscard]] ProcessResult reportFailure(const JobId& id, ErrorKind kind, const std::string& message) noexcept;
    [[nodiscard]] ProcessResult reportSuccess(const JobId& id, const std::filesystem::path& result) noexcept;
    // One more attempt after a poll interval when the broker was unreachable.
    BrokerReply reportWithRetry(const JobId& id, const std::function<BrokerReply()>& send);
    void sleepFor(std::chrono::milliseconds duration);

    WorkerConfig config_;
    BrokerClient broker_;
    BackendClient backend_;
    OutputResolver resolver_;
    Json::Value workflow_;
    NodeMap nodes_;
    bool initialized_ = false;

    int consecutiveErrors_ = 0;
    std::atomic<bool> stop_{false};
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
};

}
