/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "relayq/logger.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <thread>
#include <vector>

using namespace relayq;

namespace {
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved = Logger::level();
        Logger::setOutput(&captured);
    }
    void TearDown() override {
        Logger::setOutput(nullptr);
        Logger::setLevel(saved);
    }

    std::ostringstream captured;
    LogLevel saved = LogLevel::INFO;
};
}

TEST(ParseLogLevel, KnownNamesAnyCase) {
    EXPECT_EQ(parseLogLevel("error"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("info"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::TRACE);
    EXPECT_FALSE(parseLogLevel("verbose"));
    EXPECT_FALSE(parseLogLevel(""));
}

TEST_F(LoggerTest, FiltersBelowLevel) {
    Logger::setLevel(LogLevel::WARN);
    LOG_INFO("hidden line");
    LOG_WARN("shown line");
    LOG_ERROR("also shown");

    std::string out = captured.str();
    EXPECT_EQ(out.find("hidden line"), std::string::npos);
    EXPECT_NE(out.find("[WARN ]"), std::string::npos);
    EXPECT_NE(out.find("shown line"), std::string::npos);
    EXPECT_NE(out.find("[ERROR]"), std::string::npos);
}

TEST_F(LoggerTest, LineCarriesThreadName) {
    Logger::setLevel(LogLevel::DEBUG);
    std::thread named([] {
        setThreadName("Sweep");
        LOG_DEBUG("from sweep");
    });
    named.join();
    LOG_DEBUG("from main");

    std::string out = captured.str();
    auto sweepLine = out.find("[Sweep] from sweep");
    ASSERT_NE(sweepLine, std::string::npos);
    auto mainLine = out.find("from main");
    ASSERT_NE(mainLine, std::string::npos);
    EXPECT_EQ(out.find("[Sweep]", sweepLine + 1), std::string::npos);
}

TEST_F(LoggerTest, OneLinePerMessageAcrossThreads) {
    Logger::setLevel(LogLevel::INFO);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([] {
            for (int i = 0; i < 25; ++i) {
                LOG_INFO("tick");
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::istringstream lines(captured.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        EXPECT_EQ(line.rfind("[", 0), 0u);
        EXPECT_EQ(line.substr(line.size() - 5), " tick");
        ++count;
    }
    EXPECT_EQ(count, 100);
}
