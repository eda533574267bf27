/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "relayq/types.hpp"

namespace relayq {

const char* statusName(Status status) noexcept {
    switch (status) {
        case Status::Queued: return "queued";
        case Status::Running: return "running";
        case Status::Done: return "done";
        case Status::Error: return "error";
        default: return "unknown";
    }
}

std::optional<Status> parseStatus(const std::string& name) noexcept {
    if (name == "queued") return Status::Queued;
    if (name == "running") return Status::Running;
    if (name == "done") return Status::Done;
    if (name == "error") return Status::Error;
    return std::nullopt;
}

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::BackendUnavailable: return "BackendUnavailable";
        case ErrorKind::BackendExecutionFailed: return "BackendExecutionFailed";
        case ErrorKind::BackendTimeout: return "BackendTimeout";
        case ErrorKind::NoOutputProduced: return "NoOutputProduced";
        case ErrorKind::InvalidTransition: return "InvalidTransition";
        case ErrorKind::StorageError: return "StorageError";
        case ErrorKind::InvalidRequest: return "InvalidRequest";
        case ErrorKind::BrokerUnavailable: return "BrokerUnavailable";
        case ErrorKind::ConfigError: return "ConfigError";
        case ErrorKind::InternalError: return "InternalError";
        default: return "Unknown";
    }
}

double toEpochSeconds(Clock::time_point tp) noexcept {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

}
