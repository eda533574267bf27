/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "relayq/store.hpp"
#include <gtest/gtest.h>
#include <set>
#include <thread>

using namespace relayq;

namespace {
Clock::time_point g_now;

Clock::time_point fakeNow() {
    return g_now;
}

class JobStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        g_now = Clock::time_point(std::chrono::seconds(1700000000));
        store.setClock(&fakeNow);
    }

    void advance(std::chrono::milliseconds d) { g_now += d; }

    JobStore store;
};
}

TEST_F(JobStoreTest, CreateStartsQueued) {
    Job job = store.create("/in/cat.png", "a cat", std::string("blurry"), 42);

    EXPECT_EQ(job.status, Status::Queued);
    EXPECT_EQ(job.prompt, "a cat");
    EXPECT_EQ(job.negativePrompt.value_or(""), "blurry");
    EXPECT_EQ(job.seed.value_or(0), 42u);
    EXPECT_FALSE(job.resultPath);
    EXPECT_FALSE(job.errorMessage);
    EXPECT_FALSE(job.startedAt);
    EXPECT_FALSE(job.completedAt);
    EXPECT_EQ(job.createdAt, g_now);

    auto fetched = store.get(job.id);
    ASSERT_TRUE(fetched);
    EXPECT_EQ(fetched->inputPath.string(), "/in/cat.png");
}

TEST_F(JobStoreTest, IdsAreDistinctAtSameInstant) {
    std::set<JobId> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(store.create("/in/x.png", "").id);
    }
    EXPECT_EQ(ids.size(), 100u);
}

TEST_F(JobStoreTest, IdsAreDistinctAcrossThreads) {
    std::vector<std::thread> threads;
    std::mutex idsMutex;
    std::set<JobId> ids;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                JobId id = store.create("/in/x.png", "p").id;
                std::lock_guard<std::mutex> lock(idsMutex);
                ids.insert(id);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(ids.size(), 400u);
    EXPECT_EQ(store.size(), 400u);
}

TEST_F(JobStoreTest, ReservedIdIsUsedOnce) {
    JobId id = store.reserveId();
    EXPECT_FALSE(store.get(id));

    auto job = store.create(id, "/in/a.png", "p", std::nullopt, std::nullopt);
    ASSERT_TRUE(job);
    EXPECT_EQ(job->id, id);
    EXPECT_FALSE(store.create(id, "/in/b.png", "q", std::nullopt, std::nullopt));
    EXPECT_EQ(store.get(id)->prompt, "p");
}

TEST_F(JobStoreTest, FullLifecycleToDone) {
    JobId id = store.create("/in/a.png", "p").id;

    advance(std::chrono::seconds(1));
    ASSERT_EQ(store.markRunning(id), StoreResult::Ok);
    auto running = store.get(id);
    EXPECT_EQ(running->status, Status::Running);
    ASSERT_TRUE(running->startedAt);

    advance(std::chrono::seconds(3));
    ASSERT_EQ(store.markDone(id, "/out/a.mp4"), StoreResult::Ok);
    auto done = store.get(id);
    EXPECT_EQ(done->status, Status::Done);
    EXPECT_EQ(done->resultPath->string(), "/out/a.mp4");
    EXPECT_FALSE(done->errorMessage);
    EXPECT_EQ(*done->completedAt - *done->startedAt, std::chrono::seconds(3));
}

TEST_F(JobStoreTest, FailureSetsMessageOnly) {
    JobId id = store.create("/in/a.png", "p").id;
    ASSERT_EQ(store.markRunning(id), StoreResult::Ok);
    ASSERT_EQ(store.markError(id, "BackendTimeout: too slow"), StoreResult::Ok);

    auto job = store.get(id);
    EXPECT_EQ(job->status, Status::Error);
    EXPECT_EQ(job->errorMessage.value(), "BackendTimeout: too slow");
    EXPECT_FALSE(job->resultPath);
    EXPECT_TRUE(job->completedAt);
}

TEST_F(JobStoreTest, IllegalTransitionsLeaveRecordUntouched) {
    JobId id = store.create("/in/a.png", "p").id;

    EXPECT_EQ(store.markDone(id, "/out/x.mp4"), StoreResult::InvalidTransition);
    EXPECT_EQ(store.markError(id, "nope"), StoreResult::InvalidTransition);
    auto queued = store.get(id);
    EXPECT_EQ(queued->status, Status::Queued);
    EXPECT_FALSE(queued->resultPath);
    EXPECT_FALSE(queued->errorMessage);

    ASSERT_EQ(store.markRunning(id), StoreResult::Ok);
    EXPECT_EQ(store.markRunning(id), StoreResult::InvalidTransition);

    ASSERT_EQ(store.markDone(id, "/out/a.mp4"), StoreResult::Ok);
    EXPECT_EQ(store.markError(id, "late"), StoreResult::InvalidTransition);
    EXPECT_EQ(store.markDone(id, "/out/b.mp4"), StoreResult::InvalidTransition);
    EXPECT_EQ(store.markRunning(id), StoreResult::InvalidTransition);

    auto done = store.get(id);
    EXPECT_EQ(done->status, Status::Done);
    EXPECT_EQ(done->resultPath->string(), "/out/a.mp4");
    EXPECT_FALSE(done->errorMessage);
}

TEST_F(JobStoreTest, UnknownIdIsNotFound) {
    EXPECT_FALSE(store.get("missing"));
    EXPECT_FALSE(store.remove("missing"));
    EXPECT_EQ(store.markRunning("missing"), StoreResult::NotFound);
    EXPECT_EQ(store.markDone("missing", "/x"), StoreResult::NotFound);
    EXPECT_EQ(store.markError("missing", "x"), StoreResult::NotFound);
}

TEST_F(JobStoreTest, CompletionIsNeverBeforeStart) {
    JobId id = store.create("/in/a.png", "p").id;
    ASSERT_EQ(store.markRunning(id), StoreResult::Ok);

    // Wall clock stepped backwards between the two reports
    advance(std::chrono::seconds(-5));
    ASSERT_EQ(store.markDone(id, "/out/a.mp4"), StoreResult::Ok);

    auto job = store.get(id);
    EXPECT_GE(*job->completedAt, *job->startedAt);
}

TEST_F(JobStoreTest, ListIsNewestFirstWithFilterAndLimit) {
    JobId first = store.create("/in/1.png", "one").id;
    advance(std::chrono::seconds(1));
    JobId second = store.create("/in/2.png", "two").id;
    JobId third = store.create("/in/3.png", "three").id;  // same instant as second
    ASSERT_EQ(store.markRunning(first), StoreResult::Ok);

    auto all = store.list(std::nullopt, 50);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, third);
    EXPECT_EQ(all[1].id, second);
    EXPECT_EQ(all[2].id, first);

    auto limited = store.list(std::nullopt, 2);
    ASSERT_EQ(limited.size(), 2u);
    EXPECT_EQ(limited[0].id, third);

    auto running = store.list(Status::Running, 50);
    ASSERT_EQ(running.size(), 1u);
    EXPECT_EQ(running[0].id, first);

    EXPECT_TRUE(store.list(Status::Error, 50).empty());
}

TEST_F(JobStoreTest, NextQueuedIsOldestAndDoesNotReserve) {
    EXPECT_FALSE(store.nextQueued());

    JobId first = store.create("/in/1.png", "one").id;
    JobId second = store.create("/in/2.png", "two").id;
    advance(std::chrono::seconds(1));
    store.create("/in/3.png", "three");

    EXPECT_EQ(store.nextQueued()->id, first);
    EXPECT_EQ(store.nextQueued()->id, first);

    ASSERT_EQ(store.markRunning(first), StoreResult::Ok);
    EXPECT_EQ(store.nextQueued()->id, second);
}

TEST_F(JobStoreTest, RemoveReturnsRecord) {
    JobId id = store.create("/in/a.png", "p").id;
    ASSERT_EQ(store.markRunning(id), StoreResult::Ok);
    ASSERT_EQ(store.markDone(id, "/out/a.mp4"), StoreResult::Ok);

    auto removed = store.remove(id);
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed->inputPath.string(), "/in/a.png");
    EXPECT_EQ(removed->resultPath->string(), "/out/a.mp4");
    EXPECT_FALSE(store.get(id));
    EXPECT_EQ(store.markError(id, "late"), StoreResult::NotFound);
}

TEST_F(JobStoreTest, SweepDropsOnlyOldJobs) {
    JobId old = store.create("/in/old.png", "old").id;
    advance(std::chrono::minutes(30));
    JobId recent = store.create("/in/new.png", "new").id;
    advance(std::chrono::minutes(31));

    auto removed = store.sweep(std::chrono::hours(1));
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].id, old);
    EXPECT_FALSE(store.get(old));
    EXPECT_TRUE(store.get(recent));
}

TEST_F(JobStoreTest, CountsByStatus) {
    JobId a = store.create("/in/a.png", "a").id;
    JobId b = store.create("/in/b.png", "b").id;
    JobId c = store.create("/in/c.png", "c").id;
    store.create("/in/d.png", "d");

    ASSERT_EQ(store.markRunning(a), StoreResult::Ok);
    ASSERT_EQ(store.markRunning(b), StoreResult::Ok);
    ASSERT_EQ(store.markDone(b, "/out/b.mp4"), StoreResult::Ok);
    ASSERT_EQ(store.markRunning(c), StoreResult::Ok);
    ASSERT_EQ(store.markError(c, "x"), StoreResult::Ok);

    auto counts = store.counts();
    EXPECT_EQ(counts.total, 4u);
    EXPECT_EQ(counts.queued, 1u);
    EXPECT_EQ(counts.running, 1u);
    EXPECT_EQ(counts.done, 1u);
    EXPECT_EQ(counts.error, 1u);
}

TEST_F(JobStoreTest, NegativeMaxAgeSweepsNothing) {
    JobId id = store.create("/in/a.png", "p").id;
    EXPECT_TRUE(store.sweep(std::chrono::milliseconds(-1)).empty());
    EXPECT_TRUE(store.sweep(std::chrono::milliseconds::min()).empty());
    EXPECT_TRUE(store.get(id));
}
