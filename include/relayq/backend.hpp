/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <memory>
#include <string>

#include <json/json.h>

#include "relayq/types.hpp"

namespace httplib {
class Client;
}

namespace relayq {

// The backend's history entry for one finished execution.
struct ExecutionRecord {
    std::string executionId;
    Json::Value entry;

    [[nodiscard]] const Json::Value& outputs() const { return entry["outputs"]; }
};

struct SubmitReply {
    bool ok = false;
    std::string executionId;
    ErrorKind error = ErrorKind::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct ExecutionReply {
    bool ok = false;
    ExecutionRecord record;
    ErrorKind error = ErrorKind::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Talks to the generative backend: POST /prompt, then GET /history/{id}
// until the execution reaches a terminal state. There is no cancel call; a
// timed-out execution keeps running on the backend.
class BackendClient final {
public:
    explicit BackendClient(const std::string& baseUrl,
                           std::chrono::milliseconds requestTimeout = std::chrono::seconds(10));
    ~BackendClient();

    BackendClient(const BackendClient&) = delete;
    BackendClient& operator=(const BackendClient&) = delete;
    BackendClient(BackendClient&&) = delete;
    BackendClient& operator=(BackendClient&&) = delete;

    [[nodiscard]] SubmitReply submit(const Json::Value& graph) noexcept;
    [[nodiscard]] ExecutionReply pollUntilTerminal(const std::string& executionId,
                                                   std::chrono::milliseconds pollInterval,
                                                   std::chrono::milliseconds timeout) noexcept;

    [[nodiscard]] const std::string& clientId() const noexcept { return clientId_; }
    [[nodiscard]] const std::string& baseUrl() const noexcept { return baseUrl_; }

private:
    enum class Poll : std::uint8_t { Pending, Succeeded, Failed };

    Poll fetchHistory(const std::string& executionId, ExecutionRecord& record, std::string& message);
    [[nodiscard]] static std::string generateClientId();
    [[nodiscard]] static std::string describeFailure(const Json::Value& entry);

    std::string baseUrl_;
    std::string clientId_;
    std::unique_ptr<httplib::Client> http_;
};

}
