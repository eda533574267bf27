/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <json/json.h>

#include "relayq/types.hpp"

namespace httplib {
class Client;
}

namespace relayq {

// A queued job as handed out by GET /queue/next.
struct Dispatch {
    JobId id;
    std::string inputPath;
    std::string prompt;
    std::optional<std::string> negativePrompt;
    std::optional<std::uint64_t> seed;
};

// status is the HTTP code, 0 when the broker could not be reached.
struct BrokerReply {
    bool ok = false;
    int status = 0;
    Json::Value body;
    ErrorKind error = ErrorKind::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct NextReply {
    bool ok = false;
    std::optional<Dispatch> job;
    ErrorKind error = ErrorKind::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

class BrokerClient final {
public:
    explicit BrokerClient(const std::string& baseUrl,
                          std::chrono::milliseconds requestTimeout = std::chrono::seconds(10));
    ~BrokerClient();

    BrokerClient(const BrokerClient&) = delete;
    BrokerClient& operator=(const BrokerClient&) = delete;
    BrokerClient(BrokerClient&&) = delete;
    BrokerClient& operator=(BrokerClient&&) = delete;

    // Worker side
    [[nodiscard]] NextReply next() noexcept;
    [[nodiscard]] BrokerReply start(const JobId& id) noexcept;
    [[nodiscard]] BrokerReply complete(const JobId& id, const std::string& resultPath) noexcept;
    [[nodiscard]] BrokerReply fail(const JobId& id, const std::string& message) noexcept;

    // Client side
    [[nodiscard]] BrokerReply submit(const std::filesystem::path& image, const std::string& prompt,
                                     const std::optional<std::string>& negativePrompt,
                                     std::optional<std::uint64_t> seed) noexcept;
    [[nodiscard]] BrokerReply job(const JobId& id) noexcept;
    [[nodiscard]] BrokerReply list(const std::optional<std::string>& status, std::size_t limit) noexcept;
    [[nodiscard]] BrokerReply remove(const JobId& id) noexcept;
    [[nodiscard]] BrokerReply health() noexcept;
    [[nodiscard]] BrokerReply download(const JobId& id, const std::filesystem::path& out) noexcept;

    [[nodiscard]] const std::string& baseUrl() const noexcept { return baseUrl_; }

private:
    std::string baseUrl_;
    std::unique_ptr<httplib::Client> http_;
};

}
