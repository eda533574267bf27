/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "relayq/resolver.hpp"
#include "relayq/logger.hpp"

namespace relayq {

namespace {
struct ManifestList {
    const char* key;
    OutputKind kind;
};

// Visiting order inside one node's manifest
const ManifestList kLists[] = {
    {"images", OutputKind::Image},
    {"videos", OutputKind::Video},
    {"gifs", OutputKind::Gif},
};
}

OutputResolver::OutputResolver(const std::filesystem::path& outputRoot) noexcept
    : outputRoot_(outputRoot) {
}

ResolveResult OutputResolver::resolve(const ExecutionRecord& record) const noexcept {
    try {
        const Json::Value& outputs = record.outputs();
        if (!outputs.isObject()) {
            return {false, {}, OutputKind::Image, "", ErrorKind::NoOutputProduced,
                    "Execution " + record.executionId + " has no output manifest"};
        }

        std::size_t missing = 0;
        for (auto node = outputs.begin(); node != outputs.end(); ++node) {
            const Json::Value& manifest = *node;
            if (!manifest.isObject()) {
                continue;
            }
            for (const auto& list : kLists) {
                const Json::Value& entries = manifest[list.key];
                if (!entries.isArray()) {
                    continue;
                }
                for (const auto& entry : entries) {
                    if (!entry.isObject() || !entry["filename"].isString()) {
                        LOG_WARN("Skipping malformed manifest entry in node " + node.name());
                        continue;
                    }
                    auto path = entryPath(entry);
                    std::error_code ec;
                    if (std::filesystem::is_regular_file(path, ec)) {
                        LOG_INFO("Found output: " + path.string());
                        return {true, path, list.kind, node.name(), ErrorKind::None, ""};
                    }
                    ++missing;
                    LOG_WARN("Output not found: " + path.string());
                }
            }
        }

        std::string message = "Workflow completed but no output file found";
        if (missing > 0) {
            message += " (" + std::to_string(missing) + " manifest entries missing on disk)";
        }
        return {false, {}, OutputKind::Image, "", ErrorKind::NoOutputProduced, message};
    } catch (const std::exception& e) {
        return {false, {}, OutputKind::Image, "", ErrorKind::NoOutputProduced,
                std::string("Cannot read output manifest: ") + e.what()};
    }
}

std::filesystem::path OutputResolver::entryPath(const Json::Value& entry) const {
    std::filesystem::path path = outputRoot_;
    const Json::Value& subfolder = entry["subfolder"];
    if (subfolder.isString() && !subfolder.asString().empty()) {
        path /= subfolder.asString();
    }
    return path / entry["filename"].asString();
}

}
