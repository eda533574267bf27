/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "relayq/worker.hpp"
#include "relayq/json.hpp"
#include "relayq/logger.hpp"
#include <iomanip>
#include <sstream>

namespace relayq {

namespace {
std::string seconds(std::chrono::steady_clock::duration d) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << std::chrono::duration<double>(d).count() << "s";
    return oss.str();
}

bool tolerated(const BrokerReply& reply) {
    return reply.status == 404 || reply.status == 409;
}
}

Worker::Worker(const WorkerConfig& config)
    : config_(config),
      broker_(config.brokerUrl, config.requestTimeout),
      backend_(config.backendUrl, config.requestTimeout),
      resolver_(config.outputDir) {
    LOG_DEBUG("Worker created - broker: " + config_.brokerUrl + ", backend: " + config_.backendUrl);
}

bool Worker::init() noexcept {
    try {
        std::string error;
        if (!loadJsonFile(config_.workflowPath, workflow_, error) || !workflow_.isObject()) {
            LOG_ERROR("ConfigError: cannot load workflow " + config_.workflowPath.string() +
                      (error.empty() ? ": not a JSON object" : ": " + error));
            return false;
        }

        nodes_ = NodeMap{};
        if (!config_.nodesPath.empty() && !NodeMap::load(config_.nodesPath, nodes_, error)) {
            LOG_ERROR("ConfigError: cannot load node map " + config_.nodesPath.string() + ": " + error);
            return false;
        }

        if (!nodes_.imageInput) {
            LOG_ERROR("ConfigError: node map has no image input binding");
            return false;
        }
        for (const auto& problem : validate(workflow_, nodes_)) {
            if (problem.rfind("image_input:", 0) == 0) {
                LOG_ERROR("ConfigError: " + problem);
                return false;
            }
            LOG_WARN("Workflow check: " + problem);
        }

        auto outputFolder = config_.outputDir;
        if (!config_.outputSubfolder.empty()) {
            outputFolder /= config_.outputSubfolder;
        }
        std::filesystem::create_directories(outputFolder);

        LOG_INFO("Workflow loaded: " + config_.workflowPath.string() + " (" +
                 std::to_string(workflow_.size()) + " nodes)");
        initialized_ = true;
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Worker initialization failed: " + std::string(e.what()));
        return false;
    }
}

ProcessResult Worker::processOnce() noexcept {
    if (!initialized_) {
        LOG_ERROR("Worker used before init()");
        return ProcessResult::SystemError;
    }

    auto next = broker_.next();
    if (!next) {
        LOG_WARN(std::string(errorKindName(next.error)) + ": " + next.message);
        return ProcessResult::SystemError;
    }
    if (!next.job) {
        return ProcessResult::Idle;
    }
    return processJob(*next.job);
}

ProcessResult Worker::processJob(const Dispatch& job) noexcept {
    auto started = broker_.start(job.id);
    if (!started) {
        if (tolerated(started)) {
            LOG_WARN("Skipping job " + job.id + ": " + started.message);
            return ProcessResult::Skipped;
        }
        LOG_ERROR("Cannot start job " + job.id + ": " + started.message);
        return ProcessResult::SystemError;
    }

    const auto startTime = std::chrono::steady_clock::now();
    LOG_INFO("Processing job " + job.id);
    LOG_INFO("  Input: " + job.inputPath);
    LOG_INFO("  Prompt: " + job.prompt);

    try {
        JobParams params;
        params.id = job.id;
        params.inputPath = job.inputPath;
        params.prompt = job.prompt;
        params.negativePrompt = job.negativePrompt;
        params.seed = resolveSeed(job.seed);
        LOG_DEBUG("  Seed: " + std::to_string(params.seed));

        Json::Value graph = build(workflow_, nodes_, params, config_.outputSubfolder);

        auto submitted = backend_.submit(graph);
        if (!submitted) {
            return reportFailure(job.id, submitted.error, submitted.message);
        }

        auto execution = backend_.pollUntilTerminal(submitted.executionId,
                                                    config_.backendPollInterval, config_.jobTimeout);
        if (!execution) {
            return reportFailure(job.id, execution.error, execution.message);
        }

        auto output = resolver_.resolve(execution.record);
        if (!output) {
            return reportFailure(job.id, output.error, output.message);
        }

        LOG_INFO("Job " + job.id + " produced " + output.path.string() + " in " +
                 seconds(std::chrono::steady_clock::now() - startTime));
        return reportSuccess(job.id, output.path);
    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing job " + job.id + ": " + std::string(e.what()));
        return reportFailure(job.id, ErrorKind::InternalError,
                             "Internal processing error: " + std::string(e.what()));
    }
}

BrokerReply Worker::reportWithRetry(const JobId& id, const std::function<BrokerReply()>& send) {
    auto reply = send();
    if (reply || reply.status != 0 || stop_.load()) {
        return reply;
    }
    LOG_WARN("Report for job " + id + " did not reach the broker, retrying: " + reply.message);
    sleepFor(config_.pollInterval);
    return send();
}

ProcessResult Worker::reportFailure(const JobId& id, ErrorKind kind, const std::string& message) noexcept {
    const std::string text = std::string(errorKindName(kind)) + ": " + message;
    LOG_ERROR("Job " + id + " failed: " + text);

    auto reply = reportWithRetry(id, [&] { return broker_.fail(id, text); });
    if (!reply) {
        if (tolerated(reply)) {
            LOG_WARN("Failure report for job " + id + " ignored: " + reply.message);
            return ProcessResult::Failed;
        }
        LOG_ERROR("Cannot report failure of job " + id + ": " + reply.message);
        return ProcessResult::SystemError;
    }
    return ProcessResult::Failed;
}

ProcessResult Worker::reportSuccess(const JobId& id, const std::filesystem::path& result) noexcept {
    auto reply = reportWithRetry(id, [&] { return broker_.complete(id, result.string()); });
    if (!reply) {
        if (tolerated(reply)) {
            LOG_WARN("Completion report for job " + id + " ignored: " + reply.message);
            return ProcessResult::Success;
        }
        LOG_ERROR("Cannot report completion of job " + id + ": " + reply.message);
        return ProcessResult::SystemError;
    }
    return ProcessResult::Success;
}

void Worker::run() {
    setThreadName("Worker");
    LOG_INFO("Worker started - polling " + config_.brokerUrl);

    while (!stop_.load()) {
        ProcessResult result = processOnce();

        if (result == ProcessResult::SystemError) {
            ++consecutiveErrors_;
            if (consecutiveErrors_ >= config_.maxConsecutiveErrors) {
                LOG_ERROR("Too many consecutive errors (" + std::to_string(consecutiveErrors_) +
                          "), cooling down");
                sleepFor(config_.errorCooldown);
                consecutiveErrors_ = 0;
            } else {
                sleepFor(config_.pollInterval);
            }
            continue;
        }

        consecutiveErrors_ = 0;
        if (result == ProcessResult::Idle) {
            sleepFor(config_.pollInterval);
        }
    }

    LOG_INFO("Worker stopped");
}

void Worker::stop() noexcept {
    {
        std::lock_guard<std::mutex> lock(sleepMutex_);
        stop_.store(true);
    }
    sleepCv_.notify_all();
}

void Worker::sleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(sleepMutex_);
    sleepCv_.wait_for(lock, duration, [this] { return stop_.load(); });
}

}
