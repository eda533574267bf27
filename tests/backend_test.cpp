/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "relayq/backend.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace relayq;
using relayq::test::FakeBackend;
using relayq::test::TempDir;
using relayq::test::deadUrl;
using relayq::test::sampleWorkflow;

namespace {
constexpr std::chrono::milliseconds kFastPoll{20};

class BackendClientTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(backend.start()); }

    TempDir outputRoot;
    FakeBackend backend{outputRoot.path()};
};
}

TEST_F(BackendClientTest, SubmitAndPollToSuccess) {
    BackendClient client(backend.url());
    backend.setPendingPolls(2);

    auto submitted = client.submit(sampleWorkflow());
    ASSERT_TRUE(submitted) << submitted.message;
    EXPECT_EQ(submitted.executionId, "exec-1");

    auto execution = client.pollUntilTerminal(submitted.executionId, kFastPoll, std::chrono::seconds(5));
    ASSERT_TRUE(execution) << execution.message;
    EXPECT_EQ(execution.record.executionId, "exec-1");
    EXPECT_TRUE(execution.record.outputs().isObject());
    EXPECT_TRUE(execution.record.outputs().isMember("241"));
    EXPECT_GE(backend.historyRequests(), 3);
}

TEST_F(BackendClientTest, SubmitSendsGraphUnchanged) {
    BackendClient client(backend.url());
    auto submitted = client.submit(sampleWorkflow());
    ASSERT_TRUE(submitted);

    auto graphs = backend.submitted();
    ASSERT_EQ(graphs.size(), 1u);
    EXPECT_EQ(graphs[0], sampleWorkflow());
    EXPECT_FALSE(client.clientId().empty());
}

TEST_F(BackendClientTest, ExecutionErrorCarriesNodeDetails) {
    BackendClient client(backend.url());
    backend.setMode(FakeBackend::Mode::Fail);

    auto submitted = client.submit(sampleWorkflow());
    ASSERT_TRUE(submitted);
    auto execution = client.pollUntilTerminal(submitted.executionId, kFastPoll, std::chrono::seconds(5));

    EXPECT_FALSE(execution);
    EXPECT_EQ(execution.error, ErrorKind::BackendExecutionFailed);
    EXPECT_NE(execution.message.find("LoadImage"), std::string::npos);
    EXPECT_NE(execution.message.find("node 240"), std::string::npos);
    EXPECT_NE(execution.message.find("Invalid image file"), std::string::npos);
}

TEST_F(BackendClientTest, RejectedGraphIsExecutionFailure) {
    BackendClient client(backend.url());
    backend.setMode(FakeBackend::Mode::Reject);

    auto submitted = client.submit(sampleWorkflow());
    EXPECT_FALSE(submitted);
    EXPECT_EQ(submitted.error, ErrorKind::BackendExecutionFailed);
    EXPECT_NE(submitted.message.find("Prompt outputs failed validation"), std::string::npos);
    EXPECT_NE(submitted.message.find("node_errors"), std::string::npos);
}

TEST_F(BackendClientTest, StalledExecutionTimesOut) {
    BackendClient client(backend.url());
    backend.setMode(FakeBackend::Mode::Stall);

    auto submitted = client.submit(sampleWorkflow());
    ASSERT_TRUE(submitted);

    auto start = std::chrono::steady_clock::now();
    auto execution = client.pollUntilTerminal(submitted.executionId, kFastPoll, std::chrono::milliseconds(200));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(execution);
    EXPECT_EQ(execution.error, ErrorKind::BackendTimeout);
    EXPECT_NE(execution.message.find(submitted.executionId), std::string::npos);
    EXPECT_GE(elapsed, std::chrono::milliseconds(200));
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(BackendClient, UnreachableSubmitIsBackendUnavailable) {
    BackendClient client(deadUrl(), std::chrono::seconds(1));
    auto submitted = client.submit(sampleWorkflow());
    EXPECT_FALSE(submitted);
    EXPECT_EQ(submitted.error, ErrorKind::BackendUnavailable);
}

TEST(BackendClient, UnreachablePollRetriesUntilTimeout) {
    BackendClient client(deadUrl(), std::chrono::seconds(1));
    auto execution = client.pollUntilTerminal("exec-9", kFastPoll, std::chrono::milliseconds(150));
    EXPECT_FALSE(execution);
    EXPECT_EQ(execution.error, ErrorKind::BackendTimeout);
    EXPECT_NE(execution.message.find("failed poll"), std::string::npos);
}
