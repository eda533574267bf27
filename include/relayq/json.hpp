/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include <json/json.h>

namespace relayq {

// Parse a JSON document. On failure returns false and fills error.
[[nodiscard]] bool parseJson(const std::string& text, Json::Value& out, std::string& error) noexcept;

// Read and parse a JSON file.
[[nodiscard]] bool loadJsonFile(const std::filesystem::path& path, Json::Value& out, std::string& error) noexcept;

// Compact single-line rendering. Object keys come out sorted, so equal
// values always render to identical bytes.
[[nodiscard]] std::string toJson(const Json::Value& value);

}
