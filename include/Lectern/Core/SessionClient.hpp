/**
 * @file SessionClient.hpp
 * @brief Participant-side session client
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * Discovers presenters on the presence channel, connects to one, performs
 * the registration handshake and then keeps the session alive with
 * periodic PINGs while delivering everything the presenter sends.
 */

#pragma once

#ifndef LECTERN_CORE_SESSION_CLIENT_HPP
#define LECTERN_CORE_SESSION_CLIENT_HPP

#include <Lectern/Core/Types.hpp>
#include <Lectern/Core/ErrorCodes.hpp>
#include <Lectern/Core/NetworkConfig.hpp>
#include <Lectern/Core/Presence.hpp>
#include <Lectern/Core/Protocol.hpp>

#include <memory>
#include <string>
#include <vector>

namespace Lectern::Session {

/**
 * @brief Receives session events from a SessionClient
 *
 * Callbacks run on the client's internal threads, except onConnected and
 * messages that arrived during the handshake, which run on the thread
 * calling connect().
 */
class ClientListener {
public:
    virtual ~ClientListener() = default;

    virtual void onConnected(const std::string& participantId) { (void)participantId; }

    /**
     * @brief Fires once per established connection
     */
    virtual void onDisconnected() {}

    /**
     * @brief Every frame from the presenter except PONG
     */
    virtual void onMessage(const Protocol::Message& message) { (void)message; }

    /**
     * @brief A presenter was seen for the first time
     */
    virtual void onPresenterFound(const Network::PresenterInfo& presenter) { (void)presenter; }
};

class SessionClient {
public:
    struct Statistics {
        uint64_t messagesSent = 0;
        uint64_t messagesReceived = 0;
        uint64_t bytesSent = 0;
        uint64_t bytesReceived = 0;

        /// Time since the current connection was accepted
        Milliseconds uptime{0};
    };

    explicit SessionClient(const Config::ClientConfig& config,
                           std::shared_ptr<ClientListener> listener = nullptr);
    ~SessionClient();

    SessionClient(const SessionClient&) = delete;
    SessionClient& operator=(const SessionClient&) = delete;

    /**
     * @brief Start listening for presenter announcements
     */
    VoidResult startDiscovery();

    void stopDiscovery() noexcept;

    /**
     * @brief Presenters discovered so far
     */
    [[nodiscard]] std::vector<Network::PresenterInfo> availablePresenters() const;

    /**
     * @brief Connect and register with a discovered presenter
     * @return The participant id assigned by the presenter
     */
    Result<std::string> connect(const Network::PresenterInfo& presenter);

    /**
     * @brief Connect and register with the session server at address:port
     *
     * Waits at most the configured accept timeout for the answer.
     *
     * @return The participant id, AlreadyConnected, RegistrationRejected,
     *         RegistrationTimeout, HandshakeFailed or a socket error
     */
    Result<std::string> connect(const std::string& address, uint16_t port);

    /**
     * @brief Close the connection; safe to call repeatedly and from callbacks
     */
    void disconnect() noexcept;

    VoidResult sendMessage(Protocol::MessageType type,
                           const Protocol::MessageData& data = Protocol::MessageData::object());

    [[nodiscard]] bool isConnected() const noexcept;

    /**
     * @brief Id assigned by the presenter; empty before the first connect
     */
    [[nodiscard]] std::string participantId() const;

    /**
     * @brief Identifier sent in the registration request
     */
    [[nodiscard]] const std::string& machineId() const noexcept;

    [[nodiscard]] Statistics statistics() const;

    /**
     * @brief Disconnect and stop discovery
     */
    void stop() noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Lectern::Session

#endif // LECTERN_CORE_SESSION_CLIENT_HPP
