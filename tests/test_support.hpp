/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>
#include <json/json.h>

#include "relayq/json.hpp"

namespace relayq::test {

// Scratch directory removed when the test ends.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("relayq_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary);
    file << content;
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

// Image-to-video graph shaped like the default node map expects.
inline Json::Value sampleWorkflow() {
    Json::Value wf(Json::objectValue);
    wf["240"]["class_type"] = "LoadImage";
    wf["240"]["inputs"]["image"] = "example.png";
    wf["6"]["class_type"] = "CLIPTextEncode";
    wf["6"]["inputs"]["text"] = "default positive";
    wf["7"]["class_type"] = "CLIPTextEncode";
    wf["7"]["inputs"]["text"] = "default negative";
    wf["72"]["class_type"] = "RandomNoise";
    wf["72"]["inputs"]["noise_seed"] = 1;
    wf["241"]["class_type"] = "VHS_VideoCombine";
    wf["241"]["inputs"]["filename_prefix"] = "ComfyUI";
    wf["241"]["inputs"]["format"] = "video/h264-mp4";
    return wf;
}

// In-process stand-in for the generative backend's /prompt and /history API.
// Successful executions write their output file under outputRoot the way the
// video combine node does: <subfolder>/<name>_00001.mp4.
class FakeBackend {
public:
    enum class Mode { Succeed, Fail, Stall, Reject, MissingFile };

    explicit FakeBackend(std::filesystem::path outputRoot, std::string outputNode = "241")
        : outputRoot_(std::move(outputRoot)), outputNode_(std::move(outputNode)) {
        server_.Post("/prompt", [this](const httplib::Request& req, httplib::Response& res) {
            onPrompt(req, res);
        });
        server_.Get(R"(/history/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
            onHistory(req, res);
        });
    }

    ~FakeBackend() { stop(); }

    FakeBackend(const FakeBackend&) = delete;
    FakeBackend& operator=(const FakeBackend&) = delete;

    bool start() {
        port_ = server_.bind_to_any_port("127.0.0.1");
        if (port_ < 0) {
            return false;
        }
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
        return true;
    }

    void stop() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }
    void setMode(Mode mode) { mode_.store(mode); }
    void setPendingPolls(int polls) { pendingPolls_.store(polls); }
    int historyRequests() const { return historyRequests_.load(); }

    std::vector<Json::Value> submitted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return submitted_;
    }

private:
    void onPrompt(const httplib::Request& req, httplib::Response& res) {
        Json::Value body;
        std::string error;
        if (!parseJson(req.body, body, error) || !body["prompt"].isObject()) {
            res.status = 400;
            res.set_content(R"({"error": "bad request"})", "application/json");
            return;
        }

        Mode mode = mode_.load();
        if (mode == Mode::Reject) {
            res.status = 400;
            res.set_content(
                R"({"error": {"type": "prompt_outputs_failed_validation", "message": "Prompt outputs failed validation", "details": ""},)"
                R"( "node_errors": {"240": {"errors": [{"message": "Invalid image file"}]}}})",
                "application/json");
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        submitted_.push_back(body["prompt"]);
        std::string id = "exec-" + std::to_string(submitted_.size());

        Json::Value entry(Json::objectValue);
        if (mode == Mode::Fail) {
            Json::Value data(Json::objectValue);
            data["node_id"] = "240";
            data["node_type"] = "LoadImage";
            data["exception_message"] = "Invalid image file";
            Json::Value message(Json::arrayValue);
            message.append("execution_error");
            message.append(data);
            entry["outputs"] = Json::Value(Json::objectValue);
            entry["status"]["status_str"] = "error";
            entry["status"]["completed"] = false;
            entry["status"]["messages"].append(message);
        } else if (mode == Mode::Succeed || mode == Mode::MissingFile) {
            std::string prefix = body["prompt"][outputNode_]["inputs"]["filename_prefix"].asString();
            std::filesystem::path relative(prefix);
            std::string subfolder = relative.parent_path().string();
            std::string filename = relative.filename().string() + "_00001.mp4";
            if (mode == Mode::Succeed) {
                writeFile(outputRoot_ / subfolder / filename, "fake mp4 bytes");
            }

            Json::Value item(Json::objectValue);
            item["filename"] = filename;
            item["subfolder"] = subfolder;
            item["type"] = "output";
            entry["outputs"][outputNode_]["gifs"].append(item);
            entry["status"]["status_str"] = "success";
            entry["status"]["completed"] = true;
            entry["status"]["messages"] = Json::Value(Json::arrayValue);
        }
        if (mode != Mode::Stall) {
            history_[id] = entry;
            remaining_[id] = pendingPolls_.load();
        }

        Json::Value reply(Json::objectValue);
        reply["prompt_id"] = id;
        reply["number"] = static_cast<int>(submitted_.size());
        res.set_content(toJson(reply), "application/json");
    }

    void onHistory(const httplib::Request& req, httplib::Response& res) {
        ++historyRequests_;
        std::string id = req.matches[1];
        Json::Value reply(Json::objectValue);

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = history_.find(id);
        if (it != history_.end()) {
            if (remaining_[id] > 0) {
                --remaining_[id];
            } else {
                reply[id] = it->second;
            }
        }
        res.set_content(toJson(reply), "application/json");
    }

    std::filesystem::path outputRoot_;
    std::string outputNode_;
    httplib::Server server_;
    std::thread thread_;
    int port_ = -1;

    std::atomic<Mode> mode_{Mode::Succeed};
    std::atomic<int> pendingPolls_{1};
    std::atomic<int> historyRequests_{0};

    mutable std::mutex mutex_;
    std::vector<Json::Value> submitted_;
    std::map<std::string, Json::Value> history_;
    std::map<std::string, int> remaining_;
};

// A URL nothing listens on: a fake backend that has been shut down.
inline std::string deadUrl() {
    TempDir dir;
    FakeBackend gone(dir.path());
    if (!gone.start()) {
        return "http://127.0.0.1:9";
    }
    std::string url = gone.url();
    gone.stop();
    return url;
}

}
