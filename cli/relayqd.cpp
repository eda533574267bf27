/*
 * relayq - Broker daemon (relayqd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "relayq/broker.hpp"
#include "relayq/config.hpp"
#include "relayq/logger.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace relayq;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "relayq Broker Daemon\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --host H              Bind address (default 0.0.0.0)\n";
    std::cout << "  --port P              Listen port, 0 picks a free one (default 8080)\n";
    std::cout << "  --input-dir D         Where uploaded images are stored\n";
    std::cout << "  --max-age S           Seconds a job is kept before the sweep drops it\n";
    std::cout << "  --sweep-interval S    Seconds between sweeps, 0 disables\n";
    std::cout << "  -h, --help            Show this help\n";
    std::cout << "  -v, --version         Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  RELAYQ_HOST, RELAYQ_PORT, RELAYQ_INPUT_DIR, RELAYQ_INPUT_PREFIX,\n";
    std::cout << "  RELAYQ_MAX_UPLOAD, RELAYQ_JOB_MAX_AGE, RELAYQ_SWEEP_INTERVAL\n";
    std::cout << "  RELAYQ_LOG_LEVEL      Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " --port 8080 --input-dir ./ComfyUI/input\n";
    std::cout << "  RELAYQ_LOG_LEVEL=DEBUG " << progName << "\n";
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();
    BrokerConfig config = BrokerConfig::fromEnv();

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

        if (i + 1 >= argc) {
            std::cerr << "Error: Unknown or incomplete option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
        std::string value = argv[++i];

        if (arg == "--host") {
            config.host = value;
        } else if (arg == "--port") {
            try {
                config.port = std::stoi(value);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid port: " << value << "\n";
                return 1;
            }
        } else if (arg == "--input-dir") {
            config.inputDir = value;
        } else if (arg == "--max-age") {
            if (!parseSeconds(value, config.maxJobAge)) {
                std::cerr << "Error: Invalid max age: " << value << "\n";
                return 1;
            }
        } else if (arg == "--sweep-interval") {
            if (!parseSeconds(value, config.sweepInterval)) {
                std::cerr << "Error: Invalid sweep interval: " << value << "\n";
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
        Broker broker(config);
        if (!broker.start()) {
            std::cerr << "Failed to start broker\n";
            return 1;
        }

        std::cout << "relayq " << VERSION << " listening on " << config.host << ":" << broker.port() << "\n";
        std::cout << "  Input dir  " << broker.config().inputDir.string() << "\n" << std::flush;

        while (!g_shutdown_requested && broker.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, stopping broker..." << std::endl;
        }
        broker.shutdown();
    } catch (const std::exception& e) {
        LOG_ERROR("Broker error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
