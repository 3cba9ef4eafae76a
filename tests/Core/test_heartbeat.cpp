/**
 * @file test_heartbeat.cpp
 * @brief Unit tests for Heartbeat implementation
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <gtest/gtest.h>
#include <Lectern/Core/Heartbeat.hpp>
#include "TestHarness.hpp"
#include <atomic>
#include <thread>
#include <chrono>
#include <set>
#include <mutex>

using namespace Lectern;
using namespace Lectern::Network;
using namespace Lectern::Testing;

class HeartbeatTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.interval = Milliseconds{20};  // Short interval for fast tests
        config.stopOnFailure = true;

        sendCount = 0;
        failSends = false;
        send = [this]() -> VoidResult {
            sendCount++;
            if (failSends) {
                return ErrorCode::ConnectionClosed;
            }
            return VoidResult::Success();
        };
    }

    HeartbeatConfig config;
    Heartbeat::SendFunction send;
    std::atomic<int> sendCount{0};
    std::atomic<bool> failSends{false};
};

// Test heartbeat construction
TEST_F(HeartbeatTest, Construction) {
    Heartbeat heartbeat(config, send);
    EXPECT_FALSE(heartbeat.isRunning());

    auto status = heartbeat.getStatus();
    EXPECT_FALSE(status.isRunning);
    EXPECT_EQ(status.successCount, 0u);
    EXPECT_EQ(status.failureCount, 0u);
    EXPECT_EQ(status.sequenceNumber, 0u);
    EXPECT_EQ(status.lastError, ErrorCode::Success);
}

// Test default interval
TEST_F(HeartbeatTest, DefaultInterval) {
    HeartbeatConfig defaults;
    EXPECT_EQ(defaults.interval, Milliseconds{3000});
    EXPECT_TRUE(defaults.stopOnFailure);
}

// Test heartbeat start and stop
TEST_F(HeartbeatTest, StartStop) {
    config.interval = Milliseconds{5000};
    Heartbeat heartbeat(config, send);

    auto result = heartbeat.start();
    EXPECT_TRUE(result.isSuccess());
    EXPECT_TRUE(heartbeat.isRunning());

    // Stop before the first interval elapses
    heartbeat.stop();
    EXPECT_FALSE(heartbeat.isRunning());
    EXPECT_EQ(sendCount.load(), 0);
}

// Test double start should fail
TEST_F(HeartbeatTest, DoubleStart) {
    Heartbeat heartbeat(config, send);

    auto result1 = heartbeat.start();
    EXPECT_TRUE(result1.isSuccess());

    auto result2 = heartbeat.start();
    EXPECT_FALSE(result2.isSuccess());
    EXPECT_EQ(result2.error(), ErrorCode::InvalidState);

    heartbeat.stop();
}

// Test heartbeat with no send function
TEST_F(HeartbeatTest, NullSendFunction) {
    Heartbeat heartbeat(config, nullptr);

    auto result = heartbeat.start();
    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(result.error(), ErrorCode::NullPointer);

    EXPECT_EQ(heartbeat.sendHeartbeat().error(), ErrorCode::NullPointer);
}

// Test periodic pings
TEST_F(HeartbeatTest, PingsPeriodically) {
    Heartbeat heartbeat(config, send);
    ASSERT_LECTERN_SUCCESS(heartbeat.start());

    EXPECT_TRUE(waitFor([&] { return sendCount.load() >= 3; }));
    heartbeat.stop();

    auto status = heartbeat.getStatus();
    EXPECT_GE(status.successCount, 3u);
    EXPECT_EQ(status.failureCount, 0u);
    EXPECT_EQ(status.sequenceNumber, status.successCount);
    EXPECT_NE(status.lastSuccess, TimePoint{});

    // No more pings after stop
    int after = sendCount.load();
    std::this_thread::sleep_for(Milliseconds{100});
    EXPECT_EQ(sendCount.load(), after);
}

// Test loop ends on first failure
TEST_F(HeartbeatTest, StopsOnFailure) {
    failSends = true;
    Heartbeat heartbeat(config, send);

    std::atomic<int> failures{0};
    std::atomic<ErrorCode> reported{ErrorCode::Success};
    heartbeat.setCallbacks(nullptr, [&](ErrorCode error, uint64_t) {
        reported = error;
        failures++;
    });

    ASSERT_LECTERN_SUCCESS(heartbeat.start());
    ASSERT_TRUE(waitFor([&] { return !heartbeat.isRunning(); }));

    EXPECT_EQ(sendCount.load(), 1);
    EXPECT_EQ(failures.load(), 1);
    EXPECT_EQ(reported.load(), ErrorCode::ConnectionClosed);

    auto status = heartbeat.getStatus();
    EXPECT_EQ(status.failureCount, 1u);
    EXPECT_EQ(status.lastError, ErrorCode::ConnectionClosed);
    EXPECT_FALSE(status.isRunning);

    // Restart after a failure is allowed
    failSends = false;
    ASSERT_LECTERN_SUCCESS(heartbeat.start());
    EXPECT_TRUE(waitFor([&] { return heartbeat.getStatus().successCount >= 1; }));
    heartbeat.stop();
}

// Test loop continues when failures are tolerated
TEST_F(HeartbeatTest, ContinuesOnFailureWhenConfigured) {
    config.stopOnFailure = false;
    failSends = true;
    Heartbeat heartbeat(config, send);

    ASSERT_LECTERN_SUCCESS(heartbeat.start());
    EXPECT_TRUE(waitFor([&] { return heartbeat.getStatus().failureCount >= 3; }));
    EXPECT_TRUE(heartbeat.isRunning());

    failSends = false;
    EXPECT_TRUE(waitFor([&] { return heartbeat.getStatus().successCount >= 1; }));
    heartbeat.stop();

    EXPECT_EQ(heartbeat.getStatus().lastError, ErrorCode::Success);
}

// Test manual heartbeats advance the sequence
TEST_F(HeartbeatTest, SequenceNumberIncrements) {
    Heartbeat heartbeat(config, send);

    std::set<uint64_t> sequences;
    std::mutex mutex;
    heartbeat.setCallbacks([&](uint64_t sequence) {
        std::lock_guard<std::mutex> lock(mutex);
        sequences.insert(sequence);
    }, nullptr);

    ASSERT_LECTERN_SUCCESS(heartbeat.sendHeartbeat());
    ASSERT_LECTERN_SUCCESS(heartbeat.sendHeartbeat());

    failSends = true;
    EXPECT_EQ(heartbeat.sendHeartbeat().error(), ErrorCode::ConnectionClosed);

    auto status = heartbeat.getStatus();
    EXPECT_EQ(status.sequenceNumber, 3u);
    EXPECT_EQ(status.successCount, 2u);
    EXPECT_EQ(status.failureCount, 1u);
    EXPECT_EQ(sequences, (std::set<uint64_t>{0, 1}));
}

// Callbacks may call back into the heartbeat
TEST_F(HeartbeatTest, CallbackMayQueryStatus) {
    Heartbeat heartbeat(config, send);

    std::atomic<uint64_t> seen{0};
    heartbeat.setCallbacks([&](uint64_t) {
        seen = heartbeat.getStatus().successCount;
    }, nullptr);

    ASSERT_LECTERN_SUCCESS(heartbeat.sendHeartbeat());
    EXPECT_EQ(seen.load(), 1u);
}

// Test move semantics
TEST_F(HeartbeatTest, MoveConstruction) {
    Heartbeat first(config, send);
    ASSERT_LECTERN_SUCCESS(first.start());

    Heartbeat second(std::move(first));
    EXPECT_TRUE(second.isRunning());
    EXPECT_TRUE(waitFor([&] { return sendCount.load() >= 1; }));

    second.stop();
    EXPECT_FALSE(second.isRunning());
}
