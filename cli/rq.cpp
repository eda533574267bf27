/*
 * relayq - Command line client (rq)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "relayq/broker_client.hpp"
#include "relayq/config.hpp"
#include "relayq/json.hpp"
#include "relayq/logger.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace relayq;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "relayq Command Line Client v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [--broker URL] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  submit <image> [prompt...] [--negative T] [--seed N]   Queue a job, prints its id\n";
    std::cout << "  status <id>                                          Show a job\n";
    std::cout << "  result <id> <out> [--wait]                           Download the result\n";
    std::cout << "  delete <id>                                          Remove a job and its files\n";
    std::cout << "  list [--status S] [--limit N]                        List jobs, newest first\n";
    std::cout << "  health                                               Broker health and counts\n\n";
    std::cout << "Exit codes:\n";
    std::cout << "  0 ok, 1 error, 2 job not ready\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  RELAYQ_BROKER_URL  Broker base URL (default http://127.0.0.1:8080)\n";
    std::cout << "  RELAYQ_LOG_LEVEL   Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " submit cat.png a cat walking on the beach --seed 42\n";
    std::cout << "  " << progName << " result 1731808123456789_1 out.mp4 --wait\n";
    std::cout << "  " << progName << " list --status error\n";
}

int reportError(const BrokerReply& reply) {
    std::cerr << "Error: " << reply.message << std::endl;
    return 1;
}

std::string field(const Json::Value& doc, const char* key) {
    const Json::Value& v = doc[key];
    if (v.isNull()) return "-";
    if (v.isString()) return v.asString();
    return toJson(v);
}

void printJob(const Json::Value& job) {
    std::cout << "id          " << field(job, "id") << "\n";
    std::cout << "status      " << field(job, "status") << "\n";
    std::cout << "prompt      " << field(job, "prompt") << "\n";
    std::cout << "negative    " << field(job, "negative_prompt") << "\n";
    std::cout << "seed        " << field(job, "seed") << "\n";
    std::cout << "has result  " << field(job, "has_result") << "\n";
    if (job["error_message"].isString()) {
        std::cout << "error       " << job["error_message"].asString() << "\n";
    }
    if (job["processing_time"].isNumeric()) {
        std::cout << "took        " << job["processing_time"].asDouble() << "s\n";
    }
}

int cmdSubmit(BrokerClient& client, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Error: submit requires an image path\n";
        return 1;
    }

    std::optional<std::string> negative;
    std::optional<std::uint64_t> seed;
    std::ostringstream promptStream;
    bool first = true;
    for (std::size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "--negative" && i + 1 < args.size()) {
            negative = args[++i];
        } else if (args[i] == "--seed" && i + 1 < args.size()) {
            try {
                seed = std::stoull(args[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid seed: " << args[i] << "\n";
                return 1;
            }
        } else {
            if (!first) promptStream << " ";
            promptStream << args[i];
            first = false;
        }
    }

    auto reply = client.submit(args[0], promptStream.str(), negative, seed);
    if (!reply) {
        return reportError(reply);
    }
    std::cout << reply.body["job_id"].asString() << std::endl;
    return 0;
}

int cmdStatus(BrokerClient& client, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Error: status requires a job id\n";
        return 1;
    }
    auto reply = client.job(args[0]);
    if (!reply) {
        return reportError(reply);
    }
    printJob(reply.body);
    return 0;
}

int cmdResult(BrokerClient& client, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "Error: result requires a job id and an output path\n";
        return 1;
    }
    const std::string& id = args[0];
    bool wait = args.size() > 2 && (args[2] == "--wait" || args[2] == "-w");

    while (true) {
        auto reply = client.job(id);
        if (!reply) {
            return reportError(reply);
        }
        std::string status = reply.body["status"].asString();
        if (status == "done") {
            break;
        }
        if (status == "error") {
            std::cerr << "Job failed: " << id << std::endl;
            std::cerr << "Error: " << field(reply.body, "error_message") << std::endl;
            return 1;
        }
        if (!wait) {
            std::cerr << "Job not ready: " << id << " (status: " << status << ")" << std::endl;
            return 2;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    auto reply = client.download(id, args[1]);
    if (!reply) {
        return reportError(reply);
    }
    std::cout << args[1] << std::endl;
    return 0;
}

int cmdDelete(BrokerClient& client, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Error: delete requires a job id\n";
        return 1;
    }
    auto reply = client.remove(args[0]);
    if (!reply) {
        return reportError(reply);
    }
    std::cout << field(reply.body, "message") << std::endl;
    return 0;
}

int cmdList(BrokerClient& client, const std::vector<std::string>& args) {
    std::optional<std::string> status;
    std::size_t limit = 50;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--status" && i + 1 < args.size()) {
            status = args[++i];
        } else if (args[i] == "--limit" && i + 1 < args.size()) {
            try {
                limit = static_cast<std::size_t>(std::stoul(args[++i]));
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid limit: " << args[i] << "\n";
                return 1;
            }
        }
    }

    auto reply = client.list(status, limit);
    if (!reply) {
        return reportError(reply);
    }
    for (const auto& job : reply.body["jobs"]) {
        std::cout << field(job, "id") << "  " << field(job, "status") << "  " << field(job, "prompt") << "\n";
    }
    std::cout << reply.body["returned"].asUInt64() << " of " << reply.body["total"].asUInt64() << " job(s)" << std::endl;
    return 0;
}

int cmdHealth(BrokerClient& client) {
    auto reply = client.health();
    if (!reply) {
        return reportError(reply);
    }
    std::cout << toJson(reply.body) << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; RELAYQ_LOG_LEVEL overrides
    if (!std::getenv("RELAYQ_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    std::string brokerUrl = WorkerConfig::fromEnv().brokerUrl;
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (command.empty()) {
            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            }
            if (arg == "-v" || arg == "--version") {
                std::cout << VERSION << "\n";
                return 0;
            }
            if (arg == "--broker" && i + 1 < argc) {
                brokerUrl = argv[++i];
                continue;
            }
            command = arg;
        } else {
            args.push_back(arg);
        }
    }

    if (command.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        // Long timeout so result downloads of large videos finish
        BrokerClient client(brokerUrl, std::chrono::seconds(120));

        if (command == "submit") return cmdSubmit(client, args);
        if (command == "status") return cmdStatus(client, args);
        if (command == "result") return cmdResult(client, args);
        if (command == "delete") return cmdDelete(client, args);
        if (command == "list") return cmdList(client, args);
        if (command == "health") return cmdHealth(client);

        std::cerr << "Error: Unknown command: " << command << "\n";
        printUsage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
