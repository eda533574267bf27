/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>

#include "relayq/config.hpp"
#include "relayq/store.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace relayq {

// HTTP control plane over a JobStore. Handlers only touch the store and the
// upload directory; nothing here waits on the backend.
class Broker final {
public:
    explicit Broker(const BrokerConfig& config);
    ~Broker();

    Broker(const Broker&) = delete;
    Broker& operator=(const Broker&) = delete;
    Broker(Broker&&) = delete;
    Broker& operator=(Broker&&) = delete;

    // Binds (port 0 picks a free port) and serves on background threads.
    [[nodiscard]] bool start();
    void shutdown() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] int port() const noexcept { return port_; }
    [[nodiscard]] JobStore& store() noexcept { return store_; }
    [[nodiscard]] const BrokerConfig& config() const noexcept { return config_; }

    // One age-based sweep: drops old records and deletes their files.
    std::size_t sweepNow();

private:
    [[nodiscard]] bool createDirectories() noexcept;
    void registerRoutes();
    void sweepLoop();
    void releaseFiles(const Job& job) noexcept;

    void handleCreate(const httplib::Request& req, httplib::Response& res);
    void handleGet(const httplib::Request& req, httplib::Response& res);
    void handleResult(const httplib::Request& req, httplib::Response& res);
    void handleDelete(const httplib::Request& req, httplib::Response& res);
    void handleList(const httplib::Request& req, httplib::Response& res);
    void handleNext(const httplib::Request& req, httplib::Response& res);
    void handleStart(const httplib::Request& req, httplib::Response& res);
    void handleComplete(const httplib::Request& req, httplib::Response& res);
    void handleError(const httplib::Request& req, httplib::Response& res);
    void handleHealth(const httplib::Request& req, httplib::Response& res);

    BrokerConfig config_;
    JobStore store_;
    std::unique_ptr<httplib::Server> http_;
    int port_ = 0;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::thread listenThread_;
    std::thread sweepThread_;
};

}
