/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "relayq/backend.hpp"
#include "relayq/json.hpp"
#include "relayq/logger.hpp"
#include <httplib.h>
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <thread>

namespace relayq {

namespace {
std::string rejectionMessage(const httplib::Result& res) {
    Json::Value body;
    std::string parseError;
    if (!parseJson(res->body, body, parseError) || !body.isObject()) {
        return "HTTP " + std::to_string(res->status) + ": " + res->body;
    }

    std::string message = "HTTP " + std::to_string(res->status);
    const Json::Value& error = body["error"];
    if (error.isObject()) {
        if (error["message"].isString()) message += ": " + error["message"].asString();
        if (error["details"].isString() && !error["details"].asString().empty()) {
            message += " (" + error["details"].asString() + ")";
        }
    } else if (error.isString()) {
        message += ": " + error.asString();
    }
    if (body["node_errors"].isObject() && !body["node_errors"].empty()) {
        message += " node_errors=" + toJson(body["node_errors"]);
    }
    return message;
}
}

BackendClient::BackendClient(const std::string& baseUrl, std::chrono::milliseconds requestTimeout)
    : baseUrl_(baseUrl), clientId_(generateClientId()),
      http_(std::make_unique<httplib::Client>(baseUrl)) {
    auto timeoutUs = std::chrono::duration_cast<std::chrono::microseconds>(requestTimeout).count();
    http_->set_connection_timeout(5, 0);
    http_->set_read_timeout(static_cast<time_t>(timeoutUs / 1000000), static_cast<time_t>(timeoutUs % 1000000));
    http_->set_write_timeout(static_cast<time_t>(timeoutUs / 1000000), static_cast<time_t>(timeoutUs % 1000000));
    LOG_DEBUG("Backend client " + clientId_ + " for " + baseUrl_);
}

BackendClient::~BackendClient() = default;

SubmitReply BackendClient::submit(const Json::Value& graph) noexcept {
    try {
        Json::Value body(Json::objectValue);
        body["prompt"] = graph;
        body["client_id"] = clientId_;

        auto res = http_->Post("/prompt", toJson(body), "application/json");
        if (!res) {
            std::string reason = httplib::to_string(res.error());
            LOG_WARN("Backend submission failed: " + reason);
            return {false, "", ErrorKind::BackendUnavailable, "Cannot reach backend at " + baseUrl_ + ": " + reason};
        }
        if (res->status >= 500) {
            return {false, "", ErrorKind::BackendUnavailable, "Backend error on submit: " + rejectionMessage(res)};
        }
        if (res->status != 200) {
            return {false, "", ErrorKind::BackendExecutionFailed, "Backend rejected workflow: " + rejectionMessage(res)};
        }

        Json::Value reply;
        std::string error;
        if (!parseJson(res->body, reply, error) || !reply.isObject() || !reply["prompt_id"].isString()) {
            return {false, "", ErrorKind::BackendUnavailable, "Malformed submit reply from backend: " + res->body};
        }

        std::string executionId = reply["prompt_id"].asString();
        LOG_INFO("Queued backend execution: " + executionId);
        return {true, executionId, ErrorKind::None, ""};
    } catch (const std::exception& e) {
        return {false, "", ErrorKind::BackendUnavailable, std::string("Submission error: ") + e.what()};
    }
}

ExecutionReply BackendClient::pollUntilTerminal(const std::string& executionId,
                                                std::chrono::milliseconds pollInterval,
                                                std::chrono::milliseconds timeout) noexcept {
    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + timeout;
    int failures = 0;

    while (true) {
        ExecutionRecord record;
        std::string message;
        Poll state = Poll::Pending;
        try {
            state = fetchHistory(executionId, record, message);
        } catch (const std::exception& e) {
            message = e.what();
        }

        if (state == Poll::Succeeded) {
            LOG_INFO("Execution " + executionId + " completed successfully");
            return {true, std::move(record), ErrorKind::None, ""};
        }
        if (state == Poll::Failed) {
            LOG_WARN("Execution " + executionId + " failed: " + message);
            return {false, std::move(record), ErrorKind::BackendExecutionFailed, message};
        }
        if (!message.empty()) {
            ++failures;
            LOG_DEBUG("History poll for " + executionId + " failed (" + std::to_string(failures) + "): " + message);
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            std::ostringstream oss;
            oss << "Execution " << executionId << " did not complete within "
                << std::fixed << std::setprecision(1)
                << std::chrono::duration<double>(timeout).count() << "s";
            if (failures > 0) {
                oss << " (" << failures << " failed poll(s), last: " << message << ")";
            }
            return {false, {}, ErrorKind::BackendTimeout, oss.str()};
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(pollInterval, remaining));
    }
}

BackendClient::Poll BackendClient::fetchHistory(const std::string& executionId,
                                                ExecutionRecord& record, std::string& message) {
    auto res = http_->Get("/history/" + executionId);
    if (!res) {
        message = httplib::to_string(res.error());
        return Poll::Pending;
    }
    if (res->status != 200) {
        message = "HTTP " + std::to_string(res->status);
        return Poll::Pending;
    }

    Json::Value history;
    if (!parseJson(res->body, history, message) || !history.isObject()) {
        if (message.empty()) message = "history is not a JSON object";
        return Poll::Pending;
    }
    if (!history.isMember(executionId)) {
        return Poll::Pending;
    }

    const Json::Value& entry = history[executionId];
    if (!entry.isObject()) {
        return Poll::Pending;
    }
    const Json::Value& status = entry["status"];
    if (status.isObject() && status["status_str"].isString() && status["status_str"].asString() == "error") {
        record = {executionId, entry};
        message = describeFailure(entry);
        return Poll::Failed;
    }
    if (entry["outputs"].isObject()) {
        record = {executionId, entry};
        return Poll::Succeeded;
    }
    return Poll::Pending;
}

std::string BackendClient::describeFailure(const Json::Value& entry) {
    const Json::Value& status = entry["status"];
    const Json::Value& messages = status.isObject() ? status["messages"] : Json::Value::nullSingleton();
    if (messages.isArray()) {
        for (const auto& item : messages) {
            if (!item.isArray() || item.size() < 2 || !item[0].isString() ||
                item[0].asString() != "execution_error" || !item[1].isObject()) {
                continue;
            }
            const Json::Value& data = item[1];
            std::string text = "Workflow execution failed";
            if (data["node_type"].isString()) {
                text += " in " + data["node_type"].asString();
            }
            if (data["node_id"].isString()) {
                text += " (node " + data["node_id"].asString() + ")";
            }
            if (data["exception_message"].isString()) {
                text += ": " + data["exception_message"].asString();
            }
            return text;
        }
        if (!messages.empty()) {
            return "Workflow execution failed: " + toJson(messages);
        }
    }
    return "Workflow execution failed: Unknown error";
}

std::string BackendClient::generateClientId() {
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<std::uint64_t> dist;
    std::uint64_t hi = dist(rng);
    std::uint64_t lo = dist(rng);

    std::ostringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << (hi >> 32) << "-"
       << std::setw(4) << ((hi >> 16) & 0xffff) << "-"
       << std::setw(4) << (hi & 0xffff) << "-"
       << std::setw(4) << (lo >> 48) << "-"
       << std::setw(12) << (lo & 0xffffffffffffULL);
    return ss.str();
}

}
