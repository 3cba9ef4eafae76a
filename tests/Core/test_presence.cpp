/**
 * @file test_presence.cpp
 * @brief Unit tests for presenter announcement and discovery
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <gtest/gtest.h>
#include <Lectern/Core/Presence.hpp>
#include <Lectern/Core/Protocol.hpp>
#include "TestHarness.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace Lectern;
using namespace Lectern::Network;
using namespace Lectern::Protocol;
using namespace Lectern::Testing;

class PresenceTest : public ::testing::Test {
protected:
    void SetUp() override {
        listenerConfig.port = freeUdpPort();
        listenerConfig.receiveTimeout = Milliseconds{100};

        // Announcements go straight to the loopback listener
        announcerConfig = listenerConfig;
        announcerConfig.group = "127.0.0.1";
        announcerConfig.broadcastAddress = "127.0.0.1";
        announcerConfig.announceInterval = Milliseconds{100};

        listener = std::make_unique<PresenceListener>(listenerConfig, [this](const PresenterInfo& info) {
            std::lock_guard<std::mutex> lock(mutex);
            found.push_back(info);
        });
    }

    void TearDown() override {
        listener->stop();
    }

    void sendRaw(const ByteBuffer& datagram) {
        auto socket = Socket::createUdp();
        ASSERT_LECTERN_SUCCESS(socket);
        ASSERT_LECTERN_SUCCESS(socket.value().sendTo(datagram, "127.0.0.1", listenerConfig.port));
    }

    void sendAnnouncement(const MessageData& data) {
        auto frame = pack(MessageType::TeacherBroadcast, data, false);
        ASSERT_LECTERN_SUCCESS(frame);
        sendRaw(frame.value());
    }

    size_t foundCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return found.size();
    }

    Config::PresenceConfig listenerConfig;
    Config::PresenceConfig announcerConfig;
    std::unique_ptr<PresenceListener> listener;

    std::mutex mutex;
    std::vector<PresenterInfo> found;
};

TEST_F(PresenceTest, AnnouncementDiscovered) {
    ASSERT_LECTERN_SUCCESS(listener->start());
    EXPECT_TRUE(listener->isRunning());

    PresenceAnnouncer announcer(announcerConfig, "Ms. Smith", 3, 9999);
    ASSERT_LECTERN_SUCCESS(announcer.start());

    ASSERT_TRUE(waitFor([&] { return foundCount() >= 1; }));

    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ(found[0].name, "Ms. Smith");
        EXPECT_EQ(found[0].channel, 3);
        EXPECT_EQ(found[0].port, 9999);
        EXPECT_EQ(found[0].address, "127.0.0.1");
        EXPECT_EQ(found[0].id, "127.0.0.1:9999");
    }

    // Repeated announcements refresh the entry without new callbacks
    ASSERT_TRUE(waitFor([&] { return announcer.announcementsSent() >= 4; }));
    announcer.stop();
    EXPECT_FALSE(announcer.isRunning());

    EXPECT_EQ(foundCount(), 1u);
    auto presenters = listener->presenters();
    ASSERT_EQ(presenters.size(), 1u);
    EXPECT_GT(presenters[0].lastSeen, found[0].lastSeen);
}

TEST_F(PresenceTest, DistinctPortsAreDistinctPresenters) {
    ASSERT_LECTERN_SUCCESS(listener->start());

    sendAnnouncement(MessageBuilder::presenterAnnouncement("Room A", 1, 9000));
    sendAnnouncement(MessageBuilder::presenterAnnouncement("Room B", 2, 9001));

    ASSERT_TRUE(waitFor([&] { return foundCount() == 2; }));
    EXPECT_EQ(listener->presenters().size(), 2u);
}

TEST_F(PresenceTest, InvalidAnnouncementsIgnored) {
    ASSERT_LECTERN_SUCCESS(listener->start());

    MessageData badPort = MessageBuilder::presenterAnnouncement("Bad", 1, 9999);
    badPort["port"] = 0;
    sendAnnouncement(badPort);

    badPort["port"] = 70000;
    sendAnnouncement(badPort);

    badPort["port"] = "9999";
    sendAnnouncement(badPort);

    MessageData noPort;
    noPort["teacher_name"] = "Nameless";
    sendAnnouncement(noPort);

    // Wrong type
    auto ping = pack(MessageType::Ping, MessageBuilder::ping(), false);
    ASSERT_LECTERN_SUCCESS(ping);
    sendRaw(ping.value());

    // Not a frame
    sendRaw(ByteBuffer{'h', 'e', 'l', 'l', 'o'});

    // Name and channel are optional
    MessageData minimal;
    minimal["port"] = 4242;
    sendAnnouncement(minimal);

    ASSERT_TRUE(waitFor([&] { return foundCount() >= 1; }));
    std::this_thread::sleep_for(Milliseconds{100});

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].port, 4242);
    EXPECT_TRUE(found[0].name.empty());
    EXPECT_EQ(found[0].channel, 0);
}

TEST_F(PresenceTest, ClearForgetsPresenters) {
    ASSERT_LECTERN_SUCCESS(listener->start());

    MessageData announcement = MessageBuilder::presenterAnnouncement("Again", 1, 9100);
    sendAnnouncement(announcement);
    ASSERT_TRUE(waitFor([&] { return foundCount() == 1; }));

    listener->clear();
    EXPECT_TRUE(listener->presenters().empty());

    sendAnnouncement(announcement);
    ASSERT_TRUE(waitFor([&] { return foundCount() == 2; }));
}

TEST_F(PresenceTest, LifecycleErrors) {
    ASSERT_LECTERN_SUCCESS(listener->start());
    EXPECT_LECTERN_ERROR(listener->start(), ErrorCode::InvalidState);

    listener->stop();
    EXPECT_FALSE(listener->isRunning());
    // Idempotent
    listener->stop();

    PresenceAnnouncer announcer(announcerConfig, "Idle", 1, 9999);
    EXPECT_LECTERN_ERROR(announcer.announceOnce(), ErrorCode::NotConnected);

    ASSERT_LECTERN_SUCCESS(announcer.start());
    EXPECT_LECTERN_ERROR(announcer.start(), ErrorCode::InvalidState);
    announcer.stop();
}

TEST_F(PresenceTest, MulticastJoinStatusReported) {
    ASSERT_LECTERN_SUCCESS(listener->start());
    // Either joined, or running on broadcast only
    SUCCEED() << "multicast joined: " << listener->multicastJoined();
    EXPECT_TRUE(listener->isRunning());
}

TEST_F(PresenceTest, ThrowingHandlerKeepsListening) {
    listener.reset();

    auto calls = std::make_shared<std::atomic<int>>(0);
    listener = std::make_unique<PresenceListener>(listenerConfig, [calls](const PresenterInfo&) {
        (*calls)++;
        throw std::runtime_error("handler failure");
    });
    ASSERT_LECTERN_SUCCESS(listener->start());

    sendAnnouncement(MessageBuilder::presenterAnnouncement("Room A", 1, 9200));
    ASSERT_TRUE(waitFor([&] { return calls->load() == 1; }));

    sendAnnouncement(MessageBuilder::presenterAnnouncement("Room B", 2, 9201));
    ASSERT_TRUE(waitFor([&] { return calls->load() == 2; }));

    EXPECT_TRUE(listener->isRunning());
    EXPECT_EQ(listener->presenters().size(), 2u);
}
