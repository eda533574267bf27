/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "relayq/broker_client.hpp"
#include "relayq/json.hpp"
#include "relayq/logger.hpp"
#include <httplib.h>
#include <fstream>
#include <sstream>

namespace relayq {

namespace {
ErrorKind kindForStatus(int status) {
    switch (status) {
        case 404: return ErrorKind::NotFound;
        case 409: return ErrorKind::InvalidTransition;
        default: break;
    }
    if (status >= 400 && status < 500) {
        return ErrorKind::InvalidRequest;
    }
    return ErrorKind::StorageError;
}

BrokerReply unreachable(const std::string& baseUrl, const httplib::Result& res) {
    BrokerReply reply;
    reply.error = ErrorKind::BrokerUnavailable;
    reply.message = "Cannot reach broker at " + baseUrl + ": " + httplib::to_string(res.error());
    return reply;
}

BrokerReply toReply(const std::string& baseUrl, const httplib::Result& res) {
    if (!res) {
        return unreachable(baseUrl, res);
    }

    BrokerReply reply;
    reply.status = res->status;
    std::string parseError;
    if (!res->body.empty() && !parseJson(res->body, reply.body, parseError)) {
        reply.body = Json::Value();
    }

    if (res->status >= 200 && res->status < 300) {
        reply.ok = true;
        return reply;
    }

    reply.error = kindForStatus(res->status);
    if (reply.body.isObject() && reply.body["error"].isString()) {
        reply.message = reply.body["error"].asString();
    } else {
        reply.message = "HTTP " + std::to_string(res->status);
    }
    return reply;
}

BrokerReply failure(ErrorKind kind, const std::string& message) {
    BrokerReply reply;
    reply.error = kind;
    reply.message = message;
    return reply;
}

// Job path for an id that may carry reserved characters.
std::string jobPath(const JobId& id, const char* action = nullptr) {
    std::string path = "/jobs/" + httplib::encode_query_param(id);
    if (action) {
        path += std::string("/") + action;
    }
    return path;
}

std::optional<std::string> optionalString(const Json::Value& v) {
    if (v.isString()) {
        return v.asString();
    }
    return std::nullopt;
}
}

BrokerClient::BrokerClient(const std::string& baseUrl, std::chrono::milliseconds requestTimeout)
    : baseUrl_(baseUrl), http_(std::make_unique<httplib::Client>(baseUrl)) {
    auto timeoutUs = std::chrono::duration_cast<std::chrono::microseconds>(requestTimeout).count();
    http_->set_connection_timeout(5, 0);
    http_->set_read_timeout(static_cast<time_t>(timeoutUs / 1000000), static_cast<time_t>(timeoutUs % 1000000));
    http_->set_write_timeout(static_cast<time_t>(timeoutUs / 1000000), static_cast<time_t>(timeoutUs % 1000000));
}

BrokerClient::~BrokerClient() = default;

NextReply BrokerClient::next() noexcept {
    try {
        auto reply = toReply(baseUrl_, http_->Get("/queue/next"));
        if (!reply) {
            return {false, std::nullopt, reply.error, reply.message};
        }

        const Json::Value& body = reply.body;
        if (!body.isObject()) {
            return {false, std::nullopt, ErrorKind::BrokerUnavailable, "Malformed queue reply from broker"};
        }
        if (body["job_id"].isNull()) {
            return {true, std::nullopt, ErrorKind::None, ""};
        }
        if (!body["job_id"].isString() || !body["input_image_path"].isString()) {
            return {false, std::nullopt, ErrorKind::BrokerUnavailable, "Malformed queue reply from broker"};
        }

        Dispatch job;
        job.id = body["job_id"].asString();
        job.inputPath = body["input_image_path"].asString();
        job.prompt = body["prompt"].isString() ? body["prompt"].asString() : "";
        job.negativePrompt = optionalString(body["negative_prompt"]);
        if (body["seed"].isUInt64()) {
            job.seed = body["seed"].asUInt64();
        }
        return {true, job, ErrorKind::None, ""};
    } catch (const std::exception& e) {
        return {false, std::nullopt, ErrorKind::BrokerUnavailable, std::string("Queue request failed: ") + e.what()};
    }
}

BrokerReply BrokerClient::start(const JobId& id) noexcept {
    try {
        return toReply(baseUrl_, http_->Post(jobPath(id, "start"), httplib::Params{}));
    } catch (const std::exception& e) {
        return failure(ErrorKind::BrokerUnavailable, e.what());
    }
}

BrokerReply BrokerClient::complete(const JobId& id, const std::string& resultPath) noexcept {
    try {
        httplib::Params params{{"result_path", resultPath}};
        return toReply(baseUrl_, http_->Post(jobPath(id, "complete"), params));
    } catch (const std::exception& e) {
        return failure(ErrorKind::BrokerUnavailable, e.what());
    }
}

BrokerReply BrokerClient::fail(const JobId& id, const std::string& message) noexcept {
    try {
        httplib::Params params{{"error_message", message}};
        return toReply(baseUrl_, http_->Post(jobPath(id, "error"), params));
    } catch (const std::exception& e) {
        return failure(ErrorKind::BrokerUnavailable, e.what());
    }
}

BrokerReply BrokerClient::submit(const std::filesystem::path& image, const std::string& prompt,
                                 const std::optional<std::string>& negativePrompt,
                                 std::optional<std::uint64_t> seed) noexcept {
    try {
        std::ifstream file(image, std::ios::binary);
        if (!file) {
            return failure(ErrorKind::InvalidRequest, "Cannot read image: " + image.string());
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        httplib::MultipartFormDataItems items = {
            {"image", buffer.str(), image.filename().string(), "application/octet-stream"},
            {"prompt", prompt, "", ""},
        };
        if (negativePrompt) {
            items.push_back({"negative_prompt", *negativePrompt, "", ""});
        }
        if (seed) {
            items.push_back({"seed", std::to_string(*seed), "", ""});
        }

        return toReply(baseUrl_, http_->Post("/jobs", items));
    } catch (const std::exception& e) {
        return failure(ErrorKind::BrokerUnavailable, e.what());
    }
}

BrokerReply BrokerClient::job(const JobId& id) noexcept {
    try {
        return toReply(baseUrl_, http_->Get(jobPath(id)));
    } catch (const std::exception& e) {
        return failure(ErrorKind::BrokerUnavailable, e.what());
    }
}

BrokerReply BrokerClient::list(const std::optional<std::string>& status, std::size_t limit) noexcept {
    try {
        std::string path = "/jobs?limit=" + std::to_string(limit);
        if (status) {
            path += "&status=" + httplib::encode_query_param(*status);
        }
        return toReply(baseUrl_, http_->Get(path));
    } catch (const std::exception& e) {
        return failure(ErrorKind::BrokerUnavailable, e.what());
    }
}

BrokerReply BrokerClient::remove(const JobId& id) noexcept {
    try {
        return toReply(baseUrl_, http_->Delete(jobPath(id)));
    } catch (const std::exception& e) {
        return failure(ErrorKind::BrokerUnavailable, e.what());
    }
}

BrokerReply BrokerClient::health() noexcept {
    try {
        return toReply(baseUrl_, http_->Get("/health"));
    } catch (const std::exception& e) {
        return failure(ErrorKind::BrokerUnavailable, e.what());
    }
}

BrokerReply BrokerClient::download(const JobId& id, const std::filesystem::path& out) noexcept {
    try {
        auto res = http_->Get(jobPath(id, "result"));
        if (!res) {
            return unreachable(baseUrl_, res);
        }
        if (res->status != 200) {
            return toReply(baseUrl_, res);
        }

        std::ofstream file(out, std::ios::binary);
        if (file) {
            file.write(res->body.data(), static_cast<std::streamsize>(res->body.size()));
        }
        if (!file) {
            return failure(ErrorKind::StorageError, "Cannot write " + out.string());
        }

        BrokerReply reply;
        reply.ok = true;
        reply.status = res->status;
        reply.body = Json::Value(static_cast<Json::UInt64>(res->body.size()));
        LOG_DEBUG("Downloaded " + std::to_string(res->body.size()) + " bytes to " + out.string());
        return reply;
    } catch (const std::exception& e) {
        return failure(ErrorKind::StorageError, e.what());
    }
}

}
