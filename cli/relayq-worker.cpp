/*
 * relayq - Worker daemon (relayq-worker)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "relayq/config.hpp"
#include "relayq/logger.hpp"
#include "relayq/worker.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace relayq;

constexpr const char* VERSION = "0.1.0";

static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "relayq Worker\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --broker URL        Broker base URL (default http://127.0.0.1:8080)\n";
    std::cout << "  --backend URL       Backend base URL (default http://127.0.0.1:8111)\n";
    std::cout << "  --workflow F        Workflow template JSON\n";
    std::cout << "  --nodes F           Node map JSON (built-in map when omitted)\n";
    std::cout << "  --output-dir D      Backend output root\n";
    std::cout << "  --timeout S         Seconds to wait for one execution\n";
    std::cout << "  --debug             Verbose logging\n";
    std::cout << "  -h, --help          Show this help\n";
    std::cout << "  -v, --version       Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  RELAYQ_BROKER_URL, RELAYQ_BACKEND_URL, RELAYQ_OUTPUT_DIR,\n";
    std::cout << "  RELAYQ_OUTPUT_SUBFOLDER, RELAYQ_WORKFLOW, RELAYQ_NODES,\n";
    std::cout << "  RELAYQ_POLL_INTERVAL, RELAYQ_BACKEND_POLL_INTERVAL, RELAYQ_JOB_TIMEOUT,\n";
    std::cout << "  RELAYQ_MAX_CONSECUTIVE_ERRORS, RELAYQ_ERROR_COOLDOWN, RELAYQ_LOG_LEVEL\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " --workflow workflows/ltxv_image_to_video.json\n";
    std::cout << "  " << progName << " --backend http://gpu-box:8188 --timeout 900\n";
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();
    WorkerConfig config = WorkerConfig::fromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
        if (arg == "--debug") {
            Logger::setLevel(LogLevel::DEBUG);
            continue;
        }

        if (i + 1 >= argc) {
            std::cerr << "Error: Unknown or incomplete option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
        std::string value = argv[++i];

        if (arg == "--broker") {
            config.brokerUrl = value;
        } else if (arg == "--backend") {
            config.backendUrl = value;
        } else if (arg == "--workflow") {
            config.workflowPath = value;
        } else if (arg == "--nodes") {
            config.nodesPath = value;
        } else if (arg == "--output-dir") {
            config.outputDir = value;
        } else if (arg == "--timeout") {
            if (!parseSeconds(value, config.jobTimeout)) {
                std::cerr << "Error: Invalid timeout: " << value << "\n";
                return 1;
            }
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        Worker worker(config);
        if (!worker.init()) {
            std::cerr << "Failed to initialize worker\n";
            return 1;
        }

        LOG_INFO("Broker:   " + config.brokerUrl);
        LOG_INFO("Backend:  " + config.backendUrl);
        LOG_INFO("Output:   " + config.outputDir.string());

        // The loop runs on its own thread so the signal flag can be polled here
        std::thread loop([&worker] { worker.run(); });
        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        std::cout << "\nShutdown requested, stopping worker..." << std::endl;
        worker.stop();
        loop.join();
    } catch (const std::exception& e) {
        LOG_ERROR("Worker error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
