/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace relayq {

// Core job lifecycle states. Done and Error are terminal.
enum class Status : std::uint8_t { Queued, Running, Done, Error };

// Opaque job identifier, unique for the lifetime of a store.
using JobId = std::string;

using Clock = std::chrono::system_clock;

enum class ErrorKind : std::uint8_t {
    None = 0,
    NotFound,
    BackendUnavailable,
    BackendExecutionFailed,
    BackendTimeout,
    NoOutputProduced,
    InvalidTransition,
    StorageError,
    InvalidRequest,
    BrokerUnavailable,
    ConfigError,
    InternalError
};

[[nodiscard]] const char* statusName(Status status) noexcept;
[[nodiscard]] std::optional<Status> parseStatus(const std::string& name) noexcept;
[[nodiscard]] const char* errorKindName(ErrorKind kind) noexcept;

// Seconds since epoch with sub-second precision, as carried on the wire.
[[nodiscard]] double toEpochSeconds(Clock::time_point tp) noexcept;

} // namespace relayq
