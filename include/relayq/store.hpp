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
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "relayq/types.hpp"

namespace relayq {

struct Job {
    JobId id;
    std::uint64_t sequence = 0;
    Clock::time_point createdAt;
    std::filesystem::path inputPath;
    std::string prompt;
    std::optional<std::string> negativePrompt;
    std::optional<std::uint64_t> seed;
    Status status = Status::Queued;
    std::optional<std::filesystem::path> resultPath;
    std::optional<std::string> errorMessage;
    std::optional<Clock::time_point> startedAt;
    std::optional<Clock::time_point> completedAt;
};

enum class StoreResult : std::uint8_t {
    Ok,
    NotFound,
    InvalidTransition
};

struct StatusCounts {
    std::size_t queued = 0;
    std::size_t running = 0;
    std::size_t done = 0;
    std::size_t error = 0;
    std::size_t total = 0;
};

// Authoritative in-memory job map. Every operation holds one mutex for its
// whole duration; nothing here touches the filesystem.
class JobStore final {
public:
    JobStore() = default;

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;
    JobStore(JobStore&&) = delete;
    JobStore& operator=(JobStore&&) = delete;

    Job create(const std::filesystem::path& input, const std::string& prompt,
               const std::optional<std::string>& negativePrompt = std::nullopt,
               std::optional<std::uint64_t> seed = std::nullopt);

    // Two-step creation for callers that must name files after the id before
    // the job becomes visible. create() fails if the id is already present.
    [[nodiscard]] JobId reserveId();
    std::optional<Job> create(const JobId& reserved, const std::filesystem::path& input,
                              const std::string& prompt,
                              const std::optional<std::string>& negativePrompt,
                              std::optional<std::uint64_t> seed);

    [[nodiscard]] std::optional<Job> get(const JobId& id) const;
    [[nodiscard]] std::vector<Job> list(std::optional<Status> filter, std::size_t limit) const;

    // Returns the removed record so the caller can release its files.
    std::optional<Job> remove(const JobId& id);

    StoreResult markRunning(const JobId& id);
    StoreResult markDone(const JobId& id, const std::filesystem::path& result);
    StoreResult markError(const JobId& id, const std::string& message);

    // Oldest queued job. Does not reserve it: a second caller sees the same job
    // until markRunning lands, so only one worker may consume this.
    [[nodiscard]] std::optional<Job> nextQueued() const;

    // Removes jobs created more than maxAge ago; returns them for file cleanup.
    std::vector<Job> sweep(std::chrono::milliseconds maxAge);

    [[nodiscard]] StatusCounts counts() const;
    [[nodiscard]] std::size_t size() const;

    // Test hook: the clock used for creation and transition stamps.
    void setClock(Clock::time_point (*now)()) noexcept { now_ = now; }

private:
    [[nodiscard]] JobId generateIdLocked();
    StoreResult finish(const JobId& id, Status terminal,
                       const std::filesystem::path* result, const std::string* message);

    mutable std::mutex mutex_;
    std::unordered_map<JobId, Job> jobs_;
    std::uint64_t counter_ = 0;
    std::uint64_t sequence_ = 0;
    Clock::time_point (*now_)() = &Clock::now;
};

}
