/**
 * @file SessionClient.cpp
 * @brief Participant-side session client implementation
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <Lectern/Core/SessionClient.hpp>
#include <Lectern/Core/Encoding.hpp>
#include <Lectern/Core/Endpoint.hpp>
#include <Lectern/Core/Heartbeat.hpp>
#include <Lectern/Core/Logger.hpp>
#include <Lectern/Core/Socket.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

namespace Lectern::Session {

using Network::Endpoint;
using Network::MessageBatch;
using Network::PresenterInfo;
using Network::Socket;
using Network::TransportStatus;
using Protocol::Message;
using Protocol::MessageType;

// ============================================================================
// SessionClient Implementation
// ============================================================================

class SessionClient::Impl {
public:
    Impl(const Config::ClientConfig& config, std::shared_ptr<ClientListener> listener)
        : m_config(config)
        , m_listener(std::move(listener))
        , m_machineId(config.machineId.empty() ? Encoding::machineIdentifier() : config.machineId)
        , m_connected(false)
    {
    }

    ~Impl() {
        stop();
    }

    // ------------------------------------------------------------------------
    // Discovery
    // ------------------------------------------------------------------------

    VoidResult startDiscovery() {
        std::lock_guard<std::mutex> lock(m_discoveryMutex);

        if (m_discovery && m_discovery->isRunning()) {
            return ErrorCode::InvalidState;
        }

        m_discovery = std::make_unique<Network::PresenceListener>(
            m_config.presence,
            [this](const PresenterInfo& presenter) { notifyPresenterFound(presenter); });

        VoidResult started = m_discovery->start();
        if (started.isFailure()) {
            LECTERN_LOG_ERROR_F("Presenter discovery failed to start: %s",
                                getErrorMessage(started.error()).data());
            m_discovery.reset();
        }
        return started;
    }

    void stopDiscovery() noexcept {
        std::lock_guard<std::mutex> lock(m_discoveryMutex);
        if (m_discovery) {
            m_discovery->stop();
        }
    }

    std::vector<PresenterInfo> availablePresenters() const {
        std::lock_guard<std::mutex> lock(m_discoveryMutex);
        if (!m_discovery) {
            return {};
        }
        return m_discovery->presenters();
    }

    // ------------------------------------------------------------------------
    // Connection
    // ------------------------------------------------------------------------

    Result<std::string> connect(const std::string& address, uint16_t port) {
        std::lock_guard<std::mutex> connectLock(m_connectMutex);

        if (m_connected) {
            return ErrorCode::AlreadyConnected;
        }

        joinLingeringReceiver();

        Result<Socket> connected = Socket::connectTcp(address, port, m_config.connectTimeout);
        if (connected.isFailure()) {
            LECTERN_LOG_ERROR_F("Cannot connect to %s:%u: %s", address.c_str(),
                                static_cast<unsigned>(port), getErrorMessage(connected.error()).data());
            return connected.error();
        }

        Socket socket = std::move(connected).value();
        if (socket.setNoDelay(true).isFailure()) {
            LECTERN_LOG_DEBUG("TCP_NODELAY not applied");
        }

        auto endpoint = std::make_shared<Endpoint>(std::move(socket), address, port,
                                                   m_config.receiveBufferSize, m_config.maxPayloadSize);

        LECTERN_LOG_INFO_F("Connected to %s, registering as '%s'", endpoint->peerName().c_str(),
                           m_config.participantName.c_str());

        VoidResult requested = endpoint->sendMessage(
            MessageType::StudentConnect,
            Protocol::MessageBuilder::registrationRequest(m_config.participantName, m_machineId));
        if (requested.isFailure()) {
            endpoint->close();
            return requested.error();
        }
        m_messagesSent++;

        std::vector<Message> early;
        Result<std::string> answer = awaitAnswer(*endpoint, early);
        if (answer.isFailure()) {
            endpoint->close();
            return answer.error();
        }

        auto heartbeat = std::make_unique<Network::Heartbeat>(
            Network::HeartbeatConfig{m_config.heartbeatInterval, true},
            [this, weak = std::weak_ptr<Endpoint>(endpoint)]() -> VoidResult {
                std::shared_ptr<Endpoint> target = weak.lock();
                if (!target) {
                    return ErrorCode::NotConnected;
                }
                VoidResult sent = target->sendMessage(MessageType::Ping, Protocol::MessageBuilder::ping());
                if (sent.isSuccess()) {
                    m_messagesSent++;
                }
                return sent;
            });

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_endpoint = endpoint;
            m_participantId = answer.value();
            m_connectedAt = Clock::now();
            m_connected = true;
        }

        LECTERN_LOG_INFO_F("Registration accepted, participant id %s", answer.value().c_str());

        notify([&](ClientListener& listener) { listener.onConnected(answer.value()); });
        for (const Message& message : early) {
            deliver(message);
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_connected) {
            // Disconnected from a callback
            return answer;
        }

        try {
            m_receiveThread = std::thread(&Impl::receiveLoop, this, endpoint);
        } catch (const std::system_error&) {
            m_connected = false;
            endpoint->close();
            return ErrorCode::ThreadCreationFailed;
        }

        VoidResult beating = heartbeat->start();
        if (beating.isFailure()) {
            LECTERN_LOG_WARNING_F("Heartbeat not started: %s", getErrorMessage(beating.error()).data());
        }
        m_heartbeat = std::move(heartbeat);

        return answer;
    }

    void disconnect() noexcept {
        std::shared_ptr<Endpoint> endpoint;
        std::unique_ptr<Network::Heartbeat> heartbeat;
        std::thread receiver;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_connected.exchange(false)) {
                return;
            }
            endpoint = m_endpoint;
            heartbeat = std::move(m_heartbeat);
            if (m_receiveThread.joinable() && m_receiveThread.get_id() != std::this_thread::get_id()) {
                receiver = std::move(m_receiveThread);
            }
        }

        LECTERN_LOG_INFO("Disconnecting from presenter");

        if (heartbeat) {
            heartbeat->stop();
        }

        if (endpoint) {
            if (endpoint->isConnected()) {
                (void)endpoint->sendMessage(MessageType::Disconnect, Protocol::MessageData::object());
            }
            endpoint->close();
        }

        if (receiver.joinable()) {
            receiver.join();
        }

        notify([](ClientListener& listener) { listener.onDisconnected(); });
    }

    VoidResult sendMessage(MessageType type, const Protocol::MessageData& data) {
        std::shared_ptr<Endpoint> endpoint;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_connected) {
                return ErrorCode::NotConnected;
            }
            endpoint = m_endpoint;
        }

        VoidResult sent = endpoint->sendMessage(type, data);
        if (sent.isSuccess()) {
            m_messagesSent++;
        }
        return sent;
    }

    bool isConnected() const noexcept {
        return m_connected.load();
    }

    std::string participantId() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_participantId;
    }

    const std::string& machineId() const noexcept {
        return m_machineId;
    }

    Statistics statistics() const {
        Statistics stats;
        stats.messagesSent = m_messagesSent.load();
        stats.messagesReceived = m_messagesReceived.load();

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_endpoint) {
            Endpoint::Statistics transport = m_endpoint->statistics();
            stats.bytesSent = transport.bytesSent;
            stats.bytesReceived = transport.bytesReceived;
        }
        if (m_connected) {
            stats.uptime = std::chrono::duration_cast<Milliseconds>(Clock::now() - m_connectedAt);
        }
        return stats;
    }

    void stop() noexcept {
        disconnect();
        stopDiscovery();

        std::lock_guard<std::mutex> connectLock(m_connectMutex);
        joinLingeringReceiver();
    }

private:
    /**
     * @brief Wait for CONNECTION_ACCEPTED or CONNECTION_REJECTED
     *
     * Anything else arriving first is kept in early for delivery once the
     * connection is established.
     */
    Result<std::string> awaitAnswer(Endpoint& endpoint, std::vector<Message>& early) {
        const TimePoint deadline = Clock::now() + m_config.acceptTimeout;

        while (true) {
            auto remaining = std::chrono::duration_cast<Milliseconds>(deadline - Clock::now());
            if (remaining <= Milliseconds::zero()) {
                LECTERN_LOG_ERROR("No registration answer from presenter");
                return ErrorCode::RegistrationTimeout;
            }

            MessageBatch batch = endpoint.receiveMessages(std::min(remaining, m_config.receiveTimeout));

            std::optional<Result<std::string>> answer;

            for (Message& message : batch.messages) {
                m_messagesReceived++;

                // Frames read together with the answer still belong to the session
                if (answer) {
                    early.push_back(std::move(message));
                    continue;
                }

                if (message.is(MessageType::ConnectionAccepted)) {
                    auto idIt = message.data.find("student_id");
                    if (idIt == message.data.end() || !idIt->is_string()) {
                        LECTERN_LOG_ERROR("Acceptance without a participant id");
                        return ErrorCode::HandshakeFailed;
                    }
                    answer = Result<std::string>(idIt->get<std::string>());
                    continue;
                }

                if (message.is(MessageType::ConnectionRejected)) {
                    std::string reason = "Unknown";
                    auto reasonIt = message.data.find("reason");
                    if (reasonIt != message.data.end() && reasonIt->is_string()) {
                        reason = reasonIt->get<std::string>();
                    }
                    LECTERN_LOG_WARNING_F("Registration rejected: %s", reason.c_str());
                    return ErrorCode::RegistrationRejected;
                }

                early.push_back(std::move(message));
            }

            if (answer) {
                return std::move(*answer);
            }

            if (batch.status == TransportStatus::ConnectionClosed) {
                LECTERN_LOG_ERROR("Presenter closed the connection during registration");
                return ErrorCode::HandshakeFailed;
            }
        }
    }

    void receiveLoop(std::shared_ptr<Endpoint> endpoint) {
        while (m_connected) {
            MessageBatch batch = endpoint->receiveMessages(m_config.receiveTimeout);

            for (const Message& message : batch.messages) {
                m_messagesReceived++;
                deliver(message);
            }

            if (batch.status == TransportStatus::ConnectionClosed) {
                if (m_connected) {
                    LECTERN_LOG_WARNING("Connection closed by presenter");
                    Endpoint::Statistics stats = endpoint->statistics();
                    LECTERN_LOG_INFO_F("Assembler: %llu frames, %llu bytes, %llu resyncs",
                                       static_cast<unsigned long long>(stats.assembler.framesAssembled),
                                       static_cast<unsigned long long>(stats.assembler.bytesProcessed),
                                       static_cast<unsigned long long>(stats.assembler.syncRecoveries));
                    disconnect();
                }
                break;
            }
        }
    }

    void deliver(const Message& message) {
        if (message.is(MessageType::Pong)) {
            return;
        }
        notify([&](ClientListener& listener) { listener.onMessage(message); });
    }

    void notifyPresenterFound(const PresenterInfo& presenter) {
        notify([&](ClientListener& listener) { listener.onPresenterFound(presenter); });
    }

    template<typename F>
    void notify(F&& call) noexcept {
        if (!m_listener) {
            return;
        }
        try {
            call(*m_listener);
        } catch (const std::exception& e) {
            LECTERN_LOG_ERROR_F("Client listener failed: %s", e.what());
        }
    }

    void joinLingeringReceiver() {
        std::thread lingering;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_connected || !m_receiveThread.joinable() ||
                m_receiveThread.get_id() == std::this_thread::get_id()) {
                return;
            }
            lingering = std::move(m_receiveThread);
        }
        lingering.join();
    }

    Config::ClientConfig m_config;
    std::shared_ptr<ClientListener> m_listener;
    std::string m_machineId;

    mutable std::mutex m_discoveryMutex;
    std::unique_ptr<Network::PresenceListener> m_discovery;

    std::mutex m_connectMutex;
    mutable std::mutex m_mutex;
    std::atomic<bool> m_connected;
    std::shared_ptr<Endpoint> m_endpoint;
    std::unique_ptr<Network::Heartbeat> m_heartbeat;
    std::thread m_receiveThread;
    std::string m_participantId;
    TimePoint m_connectedAt{};

    std::atomic<uint64_t> m_messagesSent{0};
    std::atomic<uint64_t> m_messagesReceived{0};
};

// ============================================================================
// SessionClient Public API
// ============================================================================

SessionClient::SessionClient(const Config::ClientConfig& config, std::shared_ptr<ClientListener> listener)
    : m_impl(std::make_unique<Impl>(config, std::move(listener)))
{
}

SessionClient::~SessionClient() = default;

VoidResult SessionClient::startDiscovery() {
    return m_impl->startDiscovery();
}

void SessionClient::stopDiscovery() noexcept {
    m_impl->stopDiscovery();
}

std::vector<Network::PresenterInfo> SessionClient::availablePresenters() const {
    return m_impl->availablePresenters();
}

Result<std::string> SessionClient::connect(const Network::PresenterInfo& presenter) {
    return m_impl->connect(presenter.address, presenter.port);
}

Result<std::string> SessionClient::connect(const std::string& address, uint16_t port) {
    return m_impl->connect(address, port);
}

void SessionClient::disconnect() noexcept {
    m_impl->disconnect();
}

VoidResult SessionClient::sendMessage(Protocol::MessageType type, const Protocol::MessageData& data) {
    return m_impl->sendMessage(type, data);
}

bool SessionClient::isConnected() const noexcept {
    return m_impl->isConnected();
}

std::string SessionClient::participantId() const {
    return m_impl->participantId();
}

const std::string& SessionClient::machineId() const noexcept {
    return m_impl->machineId();
}

SessionClient::Statistics SessionClient::statistics() const {
    return m_impl->statistics();
}

void SessionClient::stop() noexcept {
    m_impl->stop();
}

} // namespace Lectern::Session
