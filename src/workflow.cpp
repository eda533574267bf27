/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "relayq/workflow.hpp"
#include "relayq/json.hpp"
#include "relayq/logger.hpp"
#include <random>

namespace relayq {

namespace {

struct FieldSpec {
    const char* key;
    std::optional<NodeBinding> NodeMap::*member;
    const char* defaultInput;
};

const FieldSpec kFields[] = {
    {"image_input", &NodeMap::imageInput, "image"},
    {"positive_prompt", &NodeMap::positivePrompt, "text"},
    {"negative_prompt", &NodeMap::negativePrompt, "text"},
    {"seed", &NodeMap::seed, "noise_seed"},
    {"output", &NodeMap::output, "filename_prefix"},
};

bool isNodeId(const Json::Value& v) {
    return v.isString() || v.isIntegral();
}

// Empty when the binding can be written, otherwise why it cannot.
std::string nodeProblem(const Json::Value& workflow, const NodeBinding& binding) {
    if (!workflow.isObject() || !workflow.isMember(binding.node)) {
        return "node " + binding.node + " not found in workflow";
    }
    const Json::Value& node = workflow[binding.node];
    if (!node.isObject()) {
        return "node " + binding.node + " is not a JSON object";
    }
    if (node.isMember("inputs") && !node["inputs"].isObject()) {
        return "node " + binding.node + " has non-object inputs";
    }
    return "";
}

void inject(Json::Value& workflow, const std::optional<NodeBinding>& binding,
            const char* field, const Json::Value& value) {
    if (!binding) {
        return;
    }
    std::string problem = nodeProblem(workflow, *binding);
    if (!problem.empty()) {
        LOG_WARN(std::string(field) + ": " + problem + ", skipping");
        return;
    }
    workflow[binding->node]["inputs"][binding->input] = value;
}

}

bool NodeMap::fromJson(const Json::Value& doc, NodeMap& out, std::string& error) noexcept {
    try {
        if (!doc.isObject()) {
            error = "node map must be a JSON object";
            return false;
        }

        NodeMap nodes;
        for (const auto& key : doc.getMemberNames()) {
            const FieldSpec* spec = nullptr;
            for (const auto& candidate : kFields) {
                if (key == candidate.key) {
                    spec = &candidate;
                    break;
                }
            }
            if (!spec) {
                error = "unknown node map field: " + key;
                return false;
            }

            const Json::Value& value = doc[key];
            if (value.isNull()) {
                nodes.*(spec->member) = std::nullopt;
            } else if (isNodeId(value)) {
                nodes.*(spec->member) = NodeBinding{value.asString(), spec->defaultInput};
            } else if (value.isObject() && isNodeId(value["node"])) {
                NodeBinding binding{value["node"].asString(), spec->defaultInput};
                if (value.isMember("input")) {
                    if (!value["input"].isString() || value["input"].asString().empty()) {
                        error = "field " + key + ": input must be a non-empty string";
                        return false;
                    }
                    binding.input = value["input"].asString();
                }
                nodes.*(spec->member) = binding;
            } else {
                error = "field " + key + ": expected node id, {\"node\", \"input\"} or null";
                return false;
            }
        }

        out = nodes;
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool NodeMap::load(const std::filesystem::path& path, NodeMap& out, std::string& error) noexcept {
    Json::Value doc;
    if (!loadJsonFile(path, doc, error)) {
        return false;
    }
    if (!fromJson(doc, out, error)) {
        error = path.string() + ": " + error;
        return false;
    }
    return true;
}

std::uint64_t resolveSeed(std::optional<std::uint64_t> seed) {
    if (seed) {
        return *seed;
    }
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist(1, kMaxSeed);
    return dist(rng);
}

std::vector<std::string> validate(const Json::Value& workflow, const NodeMap& nodes) {
    std::vector<std::string> problems;
    if (!workflow.isObject()) {
        problems.push_back("workflow template is not a JSON object");
        return problems;
    }
    for (const auto& spec : kFields) {
        const auto& binding = nodes.*(spec.member);
        if (!binding) {
            continue;
        }
        std::string problem = nodeProblem(workflow, *binding);
        if (!problem.empty()) {
            problems.push_back(std::string(spec.key) + ": " + problem);
        }
    }
    return problems;
}

Json::Value build(const Json::Value& workflow, const NodeMap& nodes,
                  const JobParams& params, const std::string& outputSubfolder) {
    Json::Value request = workflow;

    inject(request, nodes.imageInput, "image_input", Json::Value(params.inputPath));

    // Empty prompt keeps whatever the workflow already carries
    if (!params.prompt.empty()) {
        inject(request, nodes.positivePrompt, "positive_prompt", Json::Value(params.prompt));
    }
    if (params.negativePrompt) {
        inject(request, nodes.negativePrompt, "negative_prompt", Json::Value(*params.negativePrompt));
    }

    inject(request, nodes.seed, "seed", Json::Value(static_cast<Json::UInt64>(params.seed)));
    inject(request, nodes.output, "output", Json::Value(outputPrefix(outputSubfolder, params.id)));

    return request;
}

std::string serialize(const Json::Value& graph) {
    return toJson(graph);
}

std::string outputPrefix(const std::string& outputSubfolder, const JobId& id) {
    if (outputSubfolder.empty()) {
        return id;
    }
    return outputSubfolder + "/" + id;
}

}
