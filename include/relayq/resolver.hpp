/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

#include "relayq/backend.hpp"
#include "relayq/types.hpp"

namespace relayq {

enum class OutputKind : std::uint8_t { Image, Video, Gif };

struct ResolveResult {
    bool ok = false;
    std::filesystem::path path;
    OutputKind kind = OutputKind::Image;
    std::string node;
    ErrorKind error = ErrorKind::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Locates produced files under the backend's output root. The first manifest
// entry that exists on disk wins.
class OutputResolver {
public:
    explicit OutputResolver(const std::filesystem::path& outputRoot) noexcept;

    [[nodiscard]] ResolveResult resolve(const ExecutionRecord& record) const noexcept;
    [[nodiscard]] const std::filesystem::path& outputRoot() const noexcept { return outputRoot_; }

private:
    std::filesystem::path outputRoot_;

    [[nodiscard]] std::filesystem::path entryPath(const Json::Value& entry) const;
};

}
