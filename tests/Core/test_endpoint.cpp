/**
 * @file test_endpoint.cpp
 * @brief Unit tests for framed connection endpoints
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <gtest/gtest.h>
#include <Lectern/Core/Endpoint.hpp>
#include "TestHarness.hpp"

#include <map>
#include <memory>
#include <thread>
#include <vector>

using namespace Lectern;
using namespace Lectern::Network;
using namespace Lectern::Protocol;
using namespace Lectern::Testing;

class EndpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto [a, b] = makeSocketPair();
        local = std::make_unique<Endpoint>(std::move(a), "local", 1);
        remote = std::make_unique<Endpoint>(std::move(b), "remote", 2);
    }

    /// Collect messages on `remote` until `count` arrived or the deadline passes
    std::vector<Message> collect(size_t count, Milliseconds timeout = Milliseconds{3000}) {
        std::vector<Message> messages;
        auto deadline = Clock::now() + timeout;
        while (messages.size() < count && Clock::now() < deadline) {
            MessageBatch batch = remote->receiveMessages(Milliseconds{100});
            for (auto& message : batch.messages) {
                messages.push_back(std::move(message));
            }
            if (batch.status == TransportStatus::ConnectionClosed) {
                break;
            }
        }
        return messages;
    }

    std::unique_ptr<Endpoint> local;
    std::unique_ptr<Endpoint> remote;
};

TEST_F(EndpointTest, SendAndReceiveMessage) {
    MessageData data;
    data["content"] = "hello";
    ASSERT_LECTERN_SUCCESS(local->sendMessage(MessageType::ChatMessage, data));

    auto messages = collect(1);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_TRUE(messages[0].is(MessageType::ChatMessage));
    EXPECT_EQ(messages[0].data["content"], "hello");

    auto sent = local->statistics();
    auto received = remote->statistics();
    EXPECT_EQ(sent.framesSent, 1u);
    EXPECT_EQ(received.framesReceived, 1u);
    EXPECT_EQ(sent.bytesSent, received.bytesReceived);
}

TEST_F(EndpointTest, ReceiveTimesOut) {
    auto start = Clock::now();
    FrameBatch batch = remote->receive(Milliseconds{50});
    auto elapsed = Clock::now() - start;

    EXPECT_EQ(batch.status, TransportStatus::Timeout);
    EXPECT_TRUE(batch.frames.empty());
    EXPECT_GE(elapsed, Milliseconds{40});
    EXPECT_TRUE(remote->isConnected());
}

TEST_F(EndpointTest, LargeFrameArrivesWhole) {
    MessageData data;
    data["blob"] = randomString(300000);

    // Uncompressed so the frame spans many reads
    std::thread sender([&] {
        EXPECT_TRUE(local->sendMessage(MessageType::FileChunk, data, false).isSuccess());
    });

    auto messages = collect(1);
    sender.join();

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].data["blob"], data["blob"]);
}

TEST_F(EndpointTest, ConcurrentSendersDoNotInterleave) {
    const int numThreads = 8;
    const int messagesPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; t++) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < messagesPerThread; i++) {
                MessageData data;
                data["thread"] = t;
                data["index"] = i;
                // Mix small and compressed frames
                data["padding"] = std::string(static_cast<size_t>((i % 3) * 1500), 'p');
                EXPECT_TRUE(local->sendMessage(MessageType::ChatMessage, data).isSuccess());
            }
        });
    }

    auto messages = collect(static_cast<size_t>(numThreads * messagesPerThread), Milliseconds{10000});
    for (auto& thread : threads) {
        thread.join();
    }

    ASSERT_EQ(messages.size(), static_cast<size_t>(numThreads * messagesPerThread));
    EXPECT_EQ(remote->statistics().decodeErrors, 0u);

    // Per-sender order is preserved
    std::map<int, int> nextIndex;
    for (const auto& message : messages) {
        int thread = message.data["thread"].get<int>();
        int index = message.data["index"].get<int>();
        EXPECT_EQ(index, nextIndex[thread]);
        nextIndex[thread] = index + 1;
    }
}

TEST_F(EndpointTest, PeerCloseIsReported) {
    local->close();
    local.reset();

    FrameBatch batch = remote->receive(Milliseconds{1000});
    EXPECT_EQ(batch.status, TransportStatus::ConnectionClosed);
    EXPECT_FALSE(remote->isConnected());

    // Further calls fail fast
    EXPECT_EQ(remote->receive(Milliseconds{1000}).status, TransportStatus::ConnectionClosed);
    EXPECT_LECTERN_ERROR(remote->sendMessage(MessageType::Ping, MessageBuilder::ping()),
                         ErrorCode::NotConnected);
}

TEST_F(EndpointTest, LocalCloseWakesBlockedReader) {
    std::thread closer([this] {
        std::this_thread::sleep_for(Milliseconds{100});
        remote->close();
    });

    auto start = Clock::now();
    FrameBatch batch = remote->receive(Milliseconds{5000});
    closer.join();

    EXPECT_EQ(batch.status, TransportStatus::ConnectionClosed);
    EXPECT_LT(Clock::now() - start, Milliseconds{4000});
}

TEST_F(EndpointTest, SendAfterCloseFails) {
    local->close();
    EXPECT_FALSE(local->isConnected());
    EXPECT_LECTERN_ERROR(local->sendMessage(MessageType::Ping, MessageBuilder::ping()),
                         ErrorCode::NotConnected);
}

TEST_F(EndpointTest, UndecodableFrameIsProtocolError) {
    // Well-formed header around a payload that is not JSON
    ByteBuffer bogus{'A', 'F', 'R', 'D', 0x00, 0x02, 0x00, 0x00, 0x00, 0x03, 0x00, 'x', 'y', 'z'};
    ASSERT_LECTERN_SUCCESS(local->send(bogus));

    MessageBatch batch;
    ASSERT_TRUE(waitFor([&] {
        batch = remote->receiveMessages(Milliseconds{100});
        return batch.status != TransportStatus::Timeout;
    }));

    EXPECT_EQ(batch.status, TransportStatus::ProtocolError);
    EXPECT_TRUE(batch.messages.empty());
    EXPECT_EQ(remote->statistics().decodeErrors, 1u);

    // The connection stays usable
    EXPECT_TRUE(remote->isConnected());
    ASSERT_LECTERN_SUCCESS(local->sendMessage(MessageType::Ping, MessageBuilder::ping()));
    auto messages = collect(1);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_TRUE(messages[0].is(MessageType::Ping));
}

TEST_F(EndpointTest, GarbageBeforeFrameIsSkipped) {
    ByteBuffer garbage{0xde, 0xad, 0xbe, 0xef, 0x00, 0x01};
    ASSERT_LECTERN_SUCCESS(local->send(garbage));
    ASSERT_LECTERN_SUCCESS(local->sendMessage(MessageType::Pong, MessageBuilder::pong()));

    auto messages = collect(1);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_TRUE(messages[0].is(MessageType::Pong));
    EXPECT_GE(remote->statistics().assembler.syncRecoveries, 1u);
}

TEST_F(EndpointTest, PeerName) {
    EXPECT_EQ(local->peerName(), "local:1");
    EXPECT_EQ(remote->peerAddress(), "remote");
    EXPECT_EQ(remote->peerPort(), 2);
    EXPECT_STREQ(toString(TransportStatus::ProtocolError), "protocol error");
}

TEST(EndpointStandaloneTest, InvalidSocketStartsDisconnected) {
    Endpoint endpoint(Socket(), "nowhere", 0);
    EXPECT_FALSE(endpoint.isConnected());
    EXPECT_EQ(endpoint.receive(Milliseconds{10}).status, TransportStatus::ConnectionClosed);
}
