/**
 * @file Presence.hpp
 * @brief Presenter discovery over UDP multicast with broadcast fallback
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * A running session server periodically announces its name, channel and
 * session port as a TEACHER_BROADCAST frame. Each announcement goes to the
 * presence multicast group and, for networks without multicast routing,
 * to the broadcast address on the same port. Participants listen on both.
 */

#pragma once

#ifndef LECTERN_CORE_PRESENCE_HPP
#define LECTERN_CORE_PRESENCE_HPP

#include <Lectern/Core/Types.hpp>
#include <Lectern/Core/ErrorCodes.hpp>
#include <Lectern/Core/NetworkConfig.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Lectern::Network {

/**
 * @brief A presenter seen on the presence channel
 */
struct PresenterInfo {
    /// "address:port", unique per discovered presenter
    std::string id;
    std::string name;
    std::string address;
    int channel = 0;
    uint16_t port = 0;

    /// Arrival time of the latest announcement
    TimePoint lastSeen{};
};

/**
 * @brief Periodic presence announcements
 */
class PresenceAnnouncer {
public:
    /**
     * @param config Presence channel settings
     * @param presenterName Name shown to participants
     * @param channel Classroom channel number
     * @param sessionPort Port of the session server being announced
     */
    PresenceAnnouncer(const Config::PresenceConfig& config,
                      std::string presenterName,
                      int channel,
                      uint16_t sessionPort);
    ~PresenceAnnouncer();

    PresenceAnnouncer(const PresenceAnnouncer&) = delete;
    PresenceAnnouncer& operator=(const PresenceAnnouncer&) = delete;

    /**
     * @brief Create the socket and start announcing
     */
    VoidResult start();

    void stop() noexcept;

    /**
     * @brief Send one announcement now
     * @return Success when the multicast or the broadcast copy went out
     */
    VoidResult announceOnce();

    [[nodiscard]] bool isRunning() const noexcept;

    /// Announcements with at least one successful copy
    [[nodiscard]] uint64_t announcementsSent() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Collects presenter announcements
 *
 * Presenters are keyed by address and port. The callback fires once per
 * newly seen presenter, on the listener thread; later announcements only
 * refresh the stored record.
 */
class PresenceListener {
public:
    using PresenterCallback = std::function<void(const PresenterInfo& presenter)>;

    PresenceListener(const Config::PresenceConfig& config, PresenterCallback onPresenterFound);
    ~PresenceListener();

    PresenceListener(const PresenceListener&) = delete;
    PresenceListener& operator=(const PresenceListener&) = delete;

    /**
     * @brief Bind the presence port and start listening
     *
     * Failing to join the multicast group is not an error; the listener
     * then relies on the broadcast copies.
     */
    VoidResult start();

    void stop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

    /**
     * @brief Whether the multicast join succeeded on the last start()
     */
    [[nodiscard]] bool multicastJoined() const noexcept;

    /**
     * @brief Snapshot of every presenter seen so far
     */
    [[nodiscard]] std::vector<PresenterInfo> presenters() const;

    /**
     * @brief Forget all discovered presenters
     */
    void clear();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Lectern::Network

#endif // LECTERN_CORE_PRESENCE_HPP
