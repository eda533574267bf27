/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "relayq/store.hpp"
#include "relayq/logger.hpp"
#include <algorithm>
#include <sstream>

namespace relayq {

namespace {
bool newerFirst(const Job& a, const Job& b) {
    if (a.createdAt != b.createdAt) {
        return a.createdAt > b.createdAt;
    }
    return a.sequence > b.sequence;
}
}

Job JobStore::create(const std::filesystem::path& input, const std::string& prompt,
                     const std::optional<std::string>& negativePrompt,
                     std::optional<std::uint64_t> seed) {
    // A freshly reserved id cannot be present, so this always succeeds
    return *create(reserveId(), input, prompt, negativePrompt, seed);
}

JobId JobStore::reserveId() {
    std::lock_guard<std::mutex> lock(mutex_);
    return generateIdLocked();
}

std::optional<Job> JobStore::create(const JobId& reserved, const std::filesystem::path& input,
                                    const std::string& prompt,
                                    const std::optional<std::string>& negativePrompt,
                                    std::optional<std::uint64_t> seed) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs_.count(reserved) > 0) {
        LOG_ERROR("Refusing to reuse job id: " + reserved);
        return std::nullopt;
    }

    Job job;
    job.id = reserved;
    job.sequence = ++sequence_;
    job.createdAt = now_();
    job.inputPath = input;
    job.prompt = prompt;
    job.negativePrompt = negativePrompt;
    job.seed = seed;
    job.status = Status::Queued;

    jobs_.emplace(job.id, job);
    LOG_DEBUG("Job created: " + job.id);
    return job;
}

std::optional<Job> JobStore::get(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Job> JobStore::list(std::optional<Status> filter, std::size_t limit) const {
    std::vector<Job> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs.reserve(jobs_.size());
        for (const auto& [id, job] : jobs_) {
            if (!filter || job.status == *filter) {
                jobs.push_back(job);
            }
        }
    }

    std::sort(jobs.begin(), jobs.end(), newerFirst);
    if (jobs.size() > limit) {
        jobs.resize(limit);
    }
    return jobs;
}

std::optional<Job> JobStore::remove(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    Job removed = std::move(it->second);
    jobs_.erase(it);
    LOG_DEBUG("Job removed: " + id);
    return removed;
}

StoreResult JobStore::markRunning(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return StoreResult::NotFound;
    }

    Job& job = it->second;
    if (job.status != Status::Queued) {
        LOG_WARN("Ignoring start of job " + id + " in state " + statusName(job.status));
        return StoreResult::InvalidTransition;
    }

    job.status = Status::Running;
    job.startedAt = now_();
    LOG_INFO("Job " + id + " started processing");
    return StoreResult::Ok;
}

StoreResult JobStore::markDone(const JobId& id, const std::filesystem::path& result) {
    return finish(id, Status::Done, &result, nullptr);
}

StoreResult JobStore::markError(const JobId& id, const std::string& message) {
    return finish(id, Status::Error, nullptr, &message);
}

StoreResult JobStore::finish(const JobId& id, Status terminal,
                             const std::filesystem::path* result, const std::string* message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return StoreResult::NotFound;
    }

    Job& job = it->second;
    if (job.status != Status::Running) {
        LOG_WARN(std::string("Ignoring ") + statusName(terminal) + " report for job " + id +
                 " in state " + statusName(job.status));
        return StoreResult::InvalidTransition;
    }

    auto completed = now_();
    if (job.startedAt && completed < *job.startedAt) {
        completed = *job.startedAt;
    }

    job.status = terminal;
    job.completedAt = completed;
    if (result) {
        job.resultPath = *result;
    }
    if (message) {
        job.errorMessage = *message;
    }

    double elapsed = job.startedAt
        ? std::chrono::duration<double>(completed - *job.startedAt).count()
        : 0.0;
    std::ostringstream oss;
    oss.precision(2);
    oss << std::fixed << elapsed;
    if (terminal == Status::Done) {
        LOG_INFO("Job " + id + " completed in " + oss.str() + "s");
    } else {
        LOG_ERROR("Job " + id + " failed after " + oss.str() + "s: " + job.errorMessage.value_or(""));
    }
    return StoreResult::Ok;
}

std::optional<Job> JobStore::nextQueued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Job* oldest = nullptr;
    for (const auto& [id, job] : jobs_) {
        if (job.status != Status::Queued) {
            continue;
        }
        if (!oldest || newerFirst(*oldest, job)) {
            oldest = &job;
        }
    }
    if (!oldest) {
        return std::nullopt;
    }
    return *oldest;
}

std::vector<Job> JobStore::sweep(std::chrono::milliseconds maxAge) {
    std::vector<Job> removed;
    if (maxAge.count() < 0) {
        return removed;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto cutoff = now_() - maxAge;
    for (auto it = jobs_.begin(); it != jobs_.end(); ) {
        if (it->second.createdAt < cutoff) {
            removed.push_back(std::move(it->second));
            it = jobs_.erase(it);
        } else {
            ++it;
        }
    }
    if (!removed.empty()) {
        LOG_INFO("Swept " + std::to_string(removed.size()) + " old job(s)");
    }
    return removed;
}

StatusCounts JobStore::counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StatusCounts counts;
    counts.total = jobs_.size();
    for (const auto& [id, job] : jobs_) {
        switch (job.status) {
            case Status::Queued: ++counts.queued; break;
            case Status::Running: ++counts.running; break;
            case Status::Done: ++counts.done; break;
            case Status::Error: ++counts.error; break;
        }
    }
    return counts;
}

std::size_t JobStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

JobId JobStore::generateIdLocked() {
    // Counter never repeats, so ids stay unique even after removals.
    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        now_().time_since_epoch()).count();
    ++counter_;

    std::stringstream ss;
    ss << now << "_" << counter_;
    return ss.str();
}

}
