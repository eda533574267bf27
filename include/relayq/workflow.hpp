/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "relayq/types.hpp"

namespace relayq {

// One backend node and the input field written on it.
struct NodeBinding {
    std::string node;
    std::string input;
};

// The recognized injection points of a workflow graph. An unset field means
// the workflow does not use that feature.
struct NodeMap {
    std::optional<NodeBinding> imageInput{NodeBinding{"240", "image"}};
    std::optional<NodeBinding> positivePrompt{NodeBinding{"6", "text"}};
    std::optional<NodeBinding> negativePrompt{NodeBinding{"7", "text"}};
    std::optional<NodeBinding> seed{NodeBinding{"72", "noise_seed"}};
    std::optional<NodeBinding> output{NodeBinding{"241", "filename_prefix"}};

    // Reads {"image_input": "240", "seed": {"node": "3", "input": "seed"}, ...}.
    // Keys left out keep their defaults, null disables a field.
    [[nodiscard]] static bool load(const std::filesystem::path& path, NodeMap& out, std::string& error) noexcept;
    [[nodiscard]] static bool fromJson(const Json::Value& doc, NodeMap& out, std::string& error) noexcept;
};

struct JobParams {
    JobId id;
    std::string inputPath;
    std::string prompt;
    std::optional<std::string> negativePrompt;
    std::uint64_t seed = 0;
};

// Largest seed handed out when the job carries none.
constexpr std::uint64_t kMaxSeed = 1ULL << 63;

// Supplied seed, or a uniform draw from [1, kMaxSeed].
[[nodiscard]] std::uint64_t resolveSeed(std::optional<std::uint64_t> seed);

// Bound nodes that the template lacks, one message each.
[[nodiscard]] std::vector<std::string> validate(const Json::Value& workflow, const NodeMap& nodes);

// Concrete request graph for one job. The template is copied, not modified;
// bindings whose node is missing from the template are skipped.
[[nodiscard]] Json::Value build(const Json::Value& workflow, const NodeMap& nodes,
                                const JobParams& params, const std::string& outputSubfolder);

// Request body text for a built graph; identical graphs give identical bytes.
[[nodiscard]] std::string serialize(const Json::Value& graph);

// Output filename prefix; embeds the job id so results can be matched by name.
[[nodiscard]] std::string outputPrefix(const std::string& outputSubfolder, const JobId& id);

}
