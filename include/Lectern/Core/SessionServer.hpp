/**
 * @file SessionServer.hpp
 * @brief Presenter-side session server
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * Accepts participant connections, runs the registration handshake,
 * answers heartbeats, evicts silent participants and exposes unicast and
 * broadcast sends. While running it also announces itself on the
 * presence channel.
 *
 * Threads: one accept loop, one eviction sweep, one loop per connection.
 * Listener callbacks run on those threads and must not call stop().
 */

#pragma once

#ifndef LECTERN_CORE_SESSION_SERVER_HPP
#define LECTERN_CORE_SESSION_SERVER_HPP

#include <Lectern/Core/Types.hpp>
#include <Lectern/Core/ErrorCodes.hpp>
#include <Lectern/Core/NetworkConfig.hpp>
#include <Lectern/Core/ParticipantRegistry.hpp>
#include <Lectern/Core/Protocol.hpp>

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Lectern::Session {

/**
 * @brief Receives session events from a SessionServer
 *
 * onParticipantDisconnected fires exactly once for every participant that
 * was reported through onParticipantConnected and later left the registry
 * by disconnecting, by eviction or by server shutdown. A participant whose
 * connection is replaced by a newer one with the same identity stays
 * connected and only sees a second onParticipantConnected.
 */
class ServerListener {
public:
    virtual ~ServerListener() = default;

    virtual void onParticipantConnected(const ParticipantInfo& participant) { (void)participant; }

    virtual void onParticipantDisconnected(const std::string& participantId) { (void)participantId; }

    /**
     * @brief Any frame from a registered participant except PING,
     *        STUDENT_CONNECT and DISCONNECT
     */
    virtual void onMessage(const std::string& participantId, const Protocol::Message& message) {
        (void)participantId;
        (void)message;
    }
};

class SessionServer {
public:
    struct Statistics {
        uint64_t totalConnections = 0;
        uint64_t messagesSent = 0;
        uint64_t messagesReceived = 0;
        uint64_t rejectedRegistrations = 0;
        uint64_t evictions = 0;
        size_t activeParticipants = 0;
        Milliseconds uptime{0};
    };

    /**
     * @param config Server settings; port 0 binds an ephemeral port
     * @param listener Event sink, may be null
     */
    explicit SessionServer(const Config::ServerConfig& config,
                           std::shared_ptr<ServerListener> listener = nullptr);
    ~SessionServer();

    SessionServer(const SessionServer&) = delete;
    SessionServer& operator=(const SessionServer&) = delete;

    /**
     * @brief Bind, listen and start the worker threads
     * @return InvalidState if running, ConfigInvalid for a zero capacity,
     *         BindFailed / ListenFailed from the socket layer
     *
     * A presence announcer that fails to start is logged and ignored.
     */
    VoidResult start();

    /**
     * @brief Close every connection and join every thread
     *
     * Participants still registered are reported as disconnected.
     */
    void stop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

    /**
     * @brief Port the server listens on (the bound port when 0 was configured)
     */
    [[nodiscard]] uint16_t port() const noexcept;

    /**
     * @brief Send one message to a registered participant
     * @return ParticipantNotFound for an unknown id
     */
    VoidResult sendTo(const std::string& participantId,
                      Protocol::MessageType type,
                      const Protocol::MessageData& data = Protocol::MessageData::object());

    /**
     * @brief Send one message to every registered participant
     * @param exclude Participant ids to skip
     * @return Number of participants the frame was delivered to
     */
    size_t broadcast(Protocol::MessageType type,
                     const Protocol::MessageData& data = Protocol::MessageData::object(),
                     const std::set<std::string>& exclude = {});

    [[nodiscard]] std::vector<ParticipantInfo> getParticipants() const;
    [[nodiscard]] std::optional<ParticipantInfo> getParticipant(const std::string& participantId) const;
    [[nodiscard]] size_t participantCount() const;

    bool setParticipantStatus(const std::string& participantId, ParticipantStatus status);

    [[nodiscard]] Statistics statistics() const;

    [[nodiscard]] const Config::ServerConfig& config() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Lectern::Session

#endif // LECTERN_CORE_SESSION_SERVER_HPP
