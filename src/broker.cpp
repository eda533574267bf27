/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "relayq/broker.hpp"
#include "relayq/json.hpp"
#include "relayq/logger.hpp"
#include <httplib.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace relayq {

namespace {

constexpr std::size_t kDefaultListLimit = 50;
constexpr std::size_t kMaxListLimit = 1000;

void sendJson(httplib::Response& res, const Json::Value& payload, int status = 200) {
    res.status = status;
    res.set_content(toJson(payload), "application/json");
}

void sendError(httplib::Response& res, int status, const std::string& message) {
    Json::Value body(Json::objectValue);
    body["error"] = message;
    sendJson(res, body, status);
}

// Form fields arrive urlencoded from the worker and multipart from clients.
std::optional<std::string> formValue(const httplib::Request& req, const std::string& name) {
    if (req.has_param(name)) {
        return req.get_param_value(name);
    }
    if (req.has_file(name)) {
        return req.get_file_value(name).content;
    }
    return std::nullopt;
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool parseUnsigned(const std::string& text, std::uint64_t& out) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        out = std::stoull(text);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool isAllowedImageExtension(const std::string& ext) {
    static const char* const valid[] = {".png", ".jpg", ".jpeg", ".gif", ".webp", ".bmp"};
    return std::find(std::begin(valid), std::end(valid), ext) != std::end(valid);
}

const char* mediaType(const std::string& ext) {
    if (ext == ".mp4") return "video/mp4";
    if (ext == ".webm") return "video/webm";
    if (ext == ".gif") return "image/gif";
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".webp") return "image/webp";
    return "application/octet-stream";
}

Json::Value timeOrNull(const std::optional<Clock::time_point>& tp) {
    return tp ? Json::Value(toEpochSeconds(*tp)) : Json::Value();
}

Json::Value jobToJson(const Job& job) {
    Json::Value doc(Json::objectValue);
    doc["id"] = job.id;
    doc["status"] = statusName(job.status);
    doc["created_at"] = toEpochSeconds(job.createdAt);
    doc["prompt"] = job.prompt;
    doc["negative_prompt"] = job.negativePrompt ? Json::Value(*job.negativePrompt) : Json::Value();
    doc["seed"] = job.seed ? Json::Value(static_cast<Json::UInt64>(*job.seed)) : Json::Value();
    doc["has_result"] = job.resultPath.has_value();
    doc["error_message"] = job.errorMessage ? Json::Value(*job.errorMessage) : Json::Value();
    doc["started_at"] = timeOrNull(job.startedAt);
    doc["completed_at"] = timeOrNull(job.completedAt);
    if (job.startedAt && job.completedAt) {
        doc["processing_time"] = std::chrono::duration<double>(*job.completedAt - *job.startedAt).count();
    } else {
        doc["processing_time"] = Json::Value();
    }
    return doc;
}

std::string preview(const std::string& prompt) {
    return prompt.size() > 50 ? prompt.substr(0, 50) + "..." : prompt;
}

void sendTransition(httplib::Response& res, StoreResult result, const JobId& id, const JobStore& store) {
    switch (result) {
        case StoreResult::Ok: {
            Json::Value body(Json::objectValue);
            body["status"] = "ok";
            sendJson(res, body);
            return;
        }
        case StoreResult::NotFound:
            sendError(res, 404, "Job " + id + " not found");
            return;
        case StoreResult::InvalidTransition: {
            auto job = store.get(id);
            Json::Value body(Json::objectValue);
            body["error"] = "Invalid transition for job " + id;
            body["status"] = job ? statusName(job->status) : "unknown";
            sendJson(res, body, 409);
            return;
        }
    }
}

}

Broker::Broker(const BrokerConfig& config)
    : config_(config) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(config_.inputDir, ec);
    if (!ec) {
        config_.inputDir = absolute.lexically_normal();
    }
    LOG_DEBUG("Broker created - input: " + config_.inputDir.string() +
              ", port: " + std::to_string(config_.port));
}

Broker::~Broker() {
    shutdown();
}

bool Broker::start() {
    if (running_.load()) {
        LOG_WARN("Broker already running");
        return false;
    }

    if (!createDirectories()) {
        LOG_ERROR("Failed to create input directory: " + config_.inputDir.string());
        return false;
    }

    try {
        http_ = std::make_unique<httplib::Server>();
        registerRoutes();

        if (config_.port == 0) {
            port_ = http_->bind_to_any_port(config_.host);
            if (port_ < 0) {
                LOG_ERROR("Failed to bind " + config_.host + " on any port");
                return false;
            }
        } else {
            if (!http_->bind_to_port(config_.host, config_.port)) {
                LOG_ERROR("Failed to bind " + config_.host + ":" + std::to_string(config_.port));
                return false;
            }
            port_ = config_.port;
        }

        shutdown_.store(false);
        running_.store(true);

        listenThread_ = std::thread([this] {
            setThreadName("Http");
            if (!http_->listen_after_bind() && !shutdown_.load()) {
                LOG_ERROR("HTTP listener stopped unexpectedly");
            }
        });
        http_->wait_until_ready();

        sweepThread_ = std::thread(&Broker::sweepLoop, this);

        LOG_INFO("Broker listening on " + config_.host + ":" + std::to_string(port_));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start broker: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
}

void Broker::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down broker...");
    shutdown_.store(true);
    running_.store(false);

    if (http_) {
        http_->stop();
    }
    if (listenThread_.joinable()) {
        listenThread_.join();
    }
    if (sweepThread_.joinable()) {
        sweepThread_.join();
    }

    LOG_INFO("Broker shutdown complete");
}

bool Broker::createDirectories() noexcept {
    try {
        std::filesystem::create_directories(config_.inputDir);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create directories: " + std::string(e.what()));
        return false;
    }
}

void Broker::registerRoutes() {
    http_->set_payload_max_length(config_.maxUploadBytes + 1024 * 1024);

    http_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LOG_DEBUG(req.method + " " + req.path + " -> " + std::to_string(res.status));
    });

    http_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.body.empty()) {
            sendError(res, res.status, res.status == 404 ? "not found" : "request failed");
        }
    });

    http_->Post("/jobs", [this](const httplib::Request& req, httplib::Response& res) { handleCreate(req, res); });
    http_->Get("/jobs", [this](const httplib::Request& req, httplib::Response& res) { handleList(req, res); });
    http_->Get(R"(/jobs/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) { handleGet(req, res); });
    http_->Get(R"(/jobs/([^/]+)/result)", [this](const httplib::Request& req, httplib::Response& res) { handleResult(req, res); });
    http_->Delete(R"(/jobs/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) { handleDelete(req, res); });

    http_->Get("/queue/next", [this](const httplib::Request& req, httplib::Response& res) { handleNext(req, res); });
    http_->Post(R"(/jobs/([^/]+)/start)", [this](const httplib::Request& req, httplib::Response& res) { handleStart(req, res); });
    http_->Post(R"(/jobs/([^/]+)/complete)", [this](const httplib::Request& req, httplib::Response& res) { handleComplete(req, res); });
    http_->Post(R"(/jobs/([^/]+)/error)", [this](const httplib::Request& req, httplib::Response& res) { handleError(req, res); });

    http_->Get("/health", [this](const httplib::Request& req, httplib::Response& res) { handleHealth(req, res); });
}

void Broker::handleCreate(const httplib::Request& req, httplib::Response& res) {
    try {
        if (!req.has_file("image")) {
            sendError(res, 400, "image file is required");
            return;
        }
        const auto image = req.get_file_value("image");
        if (image.content.empty()) {
            sendError(res, 400, "image file is empty");
            return;
        }
        if (image.content.size() > config_.maxUploadBytes) {
            sendError(res, 413, "image exceeds size limit (" + std::to_string(config_.maxUploadBytes) + " bytes)");
            return;
        }

        std::string ext = toLowerCopy(std::filesystem::path(image.filename).extension().string());
        if (ext.empty()) {
            ext = ".png";
        }
        if (!isAllowedImageExtension(ext)) {
            sendError(res, 400, "unsupported image extension: " + ext);
            return;
        }

        std::string prompt = formValue(req, "prompt").value_or("");
        std::optional<std::string> negativePrompt = formValue(req, "negative_prompt");
        std::optional<std::uint64_t> seed;
        if (auto seedText = formValue(req, "seed"); seedText && !seedText->empty()) {
            std::uint64_t parsed = 0;
            if (!parseUnsigned(*seedText, parsed)) {
                sendError(res, 400, "seed must be a non-negative integer");
                return;
            }
            seed = parsed;
        }

        // The id is reserved first so the upload can carry it in its name
        JobId id = store_.reserveId();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now().time_since_epoch()).count();
        auto inputPath = config_.inputDir /
            (config_.inputPrefix + "_" + id + "_" + std::to_string(millis) + ext);

        {
            std::ofstream file(inputPath, std::ios::binary);
            if (file) {
                file.write(image.content.data(), static_cast<std::streamsize>(image.content.size()));
                file.flush();
            }
            if (!file) {
                std::error_code ec;
                std::filesystem::remove(inputPath, ec);
                LOG_ERROR("StorageError: failed to save input image " + inputPath.string());
                sendError(res, 500, "Failed to save image");
                return;
            }
        }
        LOG_INFO("Saved input image: " + inputPath.string() + " (" + std::to_string(image.content.size()) + " bytes)");

        auto job = store_.create(id, inputPath, prompt, negativePrompt, seed);
        if (!job) {
            std::error_code ec;
            std::filesystem::remove(inputPath, ec);
            sendError(res, 500, "Failed to register job");
            return;
        }

        LOG_INFO("Created job " + job->id + " with prompt: '" + preview(prompt) + "'");

        Json::Value reply(Json::objectValue);
        reply["job_id"] = job->id;
        reply["status"] = statusName(job->status);
        reply["message"] = "Job queued for processing";
        sendJson(res, reply);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create job: " + std::string(e.what()));
        sendError(res, 500, "Failed to create job");
    }
}

void Broker::handleGet(const httplib::Request& req, httplib::Response& res) {
    const std::string id = req.matches[1];
    auto job = store_.get(id);
    if (!job) {
        sendError(res, 404, "Job " + id + " not found");
        return;
    }
    sendJson(res, jobToJson(*job));
}

void Broker::handleResult(const httplib::Request& req, httplib::Response& res) {
    const std::string id = req.matches[1];
    auto job = store_.get(id);
    if (!job) {
        sendError(res, 404, "Job " + id + " not found");
        return;
    }
    if (job->status != Status::Done) {
        sendError(res, 400, std::string("Job is not complete. Status: ") + statusName(job->status));
        return;
    }

    std::error_code ec;
    if (!job->resultPath || !std::filesystem::is_regular_file(*job->resultPath, ec)) {
        sendError(res, 404, "Result file not found");
        return;
    }

    std::ifstream file(*job->resultPath, std::ios::binary);
    if (!file) {
        sendError(res, 404, "Result file not found");
        return;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string ext = toLowerCopy(job->resultPath->extension().string());
    res.set_header("Content-Disposition", "attachment; filename=\"result_" + id + ext + "\"");
    res.set_content(buffer.str(), mediaType(ext));
}

void Broker::handleDelete(const httplib::Request& req, httplib::Response& res) {
    const std::string id = req.matches[1];
    auto job = store_.remove(id);
    if (!job) {
        sendError(res, 404, "Job " + id + " not found");
        return;
    }

    releaseFiles(*job);
    LOG_INFO("Deleted job " + id);

    Json::Value body(Json::objectValue);
    body["message"] = "Job " + id + " deleted";
    sendJson(res, body);
}

void Broker::handleList(const httplib::Request& req, httplib::Response& res) {
    std::optional<Status> filter;
    if (req.has_param("status") && !req.get_param_value("status").empty()) {
        filter = parseStatus(req.get_param_value("status"));
        if (!filter) {
            sendError(res, 400, "unknown status: " + req.get_param_value("status"));
            return;
        }
    }

    std::size_t limit = kDefaultListLimit;
    if (req.has_param("limit")) {
        std::uint64_t parsed = 0;
        if (!parseUnsigned(req.get_param_value("limit"), parsed)) {
            sendError(res, 400, "limit must be a positive integer");
            return;
        }
        limit = static_cast<std::size_t>(std::clamp<std::uint64_t>(parsed, 1, kMaxListLimit));
    }

    auto jobs = store_.list(filter, limit);
    Json::Value array(Json::arrayValue);
    for (const auto& job : jobs) {
        array.append(jobToJson(job));
    }

    Json::Value body(Json::objectValue);
    body["total"] = static_cast<Json::UInt64>(store_.size());
    body["returned"] = static_cast<Json::UInt64>(jobs.size());
    body["jobs"] = array;
    sendJson(res, body);
}

void Broker::handleNext(const httplib::Request&, httplib::Response& res) {
    Json::Value body(Json::objectValue);
    auto job = store_.nextQueued();
    if (!job) {
        body["job_id"] = Json::Value();
        sendJson(res, body);
        return;
    }

    body["job_id"] = job->id;
    body["input_image_path"] = job->inputPath.string();
    body["prompt"] = job->prompt;
    body["negative_prompt"] = job->negativePrompt ? Json::Value(*job->negativePrompt) : Json::Value();
    body["seed"] = job->seed ? Json::Value(static_cast<Json::UInt64>(*job->seed)) : Json::Value();
    sendJson(res, body);
}

void Broker::handleStart(const httplib::Request& req, httplib::Response& res) {
    const std::string id = req.matches[1];
    sendTransition(res, store_.markRunning(id), id, store_);
}

void Broker::handleComplete(const httplib::Request& req, httplib::Response& res) {
    const std::string id = req.matches[1];
    auto resultPath = formValue(req, "result_path");
    if (!resultPath || resultPath->empty()) {
        sendError(res, 400, "result_path is required");
        return;
    }
    sendTransition(res, store_.markDone(id, *resultPath), id, store_);
}

void Broker::handleError(const httplib::Request& req, httplib::Response& res) {
    const std::string id = req.matches[1];
    auto message = formValue(req, "error_message");
    if (!message) {
        sendError(res, 400, "error_message is required");
        return;
    }
    sendTransition(res, store_.markError(id, *message), id, store_);
}

void Broker::handleHealth(const httplib::Request&, httplib::Response& res) {
    auto counts = store_.counts();
    Json::Value body(Json::objectValue);
    body["status"] = "healthy";
    body["timestamp"] = toEpochSeconds(Clock::now());
    body["jobs_count"] = static_cast<Json::UInt64>(counts.total);
    body["queued"] = static_cast<Json::UInt64>(counts.queued);
    body["running"] = static_cast<Json::UInt64>(counts.running);
    body["done"] = static_cast<Json::UInt64>(counts.done);
    body["error"] = static_cast<Json::UInt64>(counts.error);
    sendJson(res, body);
}

std::size_t Broker::sweepNow() {
    auto removed = store_.sweep(config_.maxJobAge);
    for (const auto& job : removed) {
        releaseFiles(job);
    }
    return removed.size();
}

void Broker::releaseFiles(const Job& job) noexcept {
    auto release = [&job](const std::filesystem::path& path) {
        std::error_code ec;
        if (path.empty() || !std::filesystem::exists(path, ec)) {
            return;
        }
        if (!std::filesystem::remove(path, ec) || ec) {
            LOG_WARN("StorageError: could not remove " + path.string() + " for job " + job.id +
                     (ec ? ": " + ec.message() : ""));
        }
    };

    try {
        release(job.inputPath);
        if (job.resultPath) {
            release(*job.resultPath);
        }
    } catch (const std::exception& e) {
        LOG_WARN("Error cleaning up job " + job.id + ": " + e.what());
    }
}

void Broker::sweepLoop() {
    setThreadName("Sweep");
    if (config_.sweepInterval.count() == 0) {
        LOG_DEBUG("Periodic sweep disabled");
        return;
    }
    LOG_DEBUG("Sweep loop started");

    while (!shutdown_.load()) {
        auto sleepEnd = std::chrono::steady_clock::now() + config_.sweepInterval;
        while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (shutdown_.load()) {
            break;
        }

        try {
            sweepNow();
        } catch (const std::exception& e) {
            LOG_ERROR("Sweep error: " + std::string(e.what()));
        }
    }

    LOG_DEBUG("Sweep loop stopped");
}

}
