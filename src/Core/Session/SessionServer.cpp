/**
 * @file SessionServer.cpp
 * @brief Presenter-side session server implementation
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <Lectern/Core/SessionServer.hpp>
#include <Lectern/Core/Endpoint.hpp>
#include <Lectern/Core/Logger.hpp>
#include <Lectern/Core/Presence.hpp>
#include <Lectern/Core/Socket.hpp>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <iterator>
#include <list>
#include <mutex>
#include <system_error>
#include <thread>

namespace Lectern::Session {

using Network::Endpoint;
using Network::MessageBatch;
using Network::Socket;
using Network::TransportStatus;
using Protocol::Message;
using Protocol::MessageType;

namespace {

constexpr const char* REJECT_FULL = "Session is full";
constexpr const char* REJECT_MALFORMED = "Malformed registration";
constexpr const char* REJECT_UNREGISTERED = "Registration required";

} // anonymous namespace

// ============================================================================
// SessionServer Implementation
// ============================================================================

class SessionServer::Impl {
public:
    Impl(const Config::ServerConfig& config, std::shared_ptr<ServerListener> listener)
        : m_config(config)
        , m_listener(std::move(listener))
        , m_registry(config.maxParticipants)
        , m_running(false)
        , m_port(0)
    {
    }

    ~Impl() {
        stop();
    }

    VoidResult start() {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);

        if (m_running) {
            return ErrorCode::InvalidState;
        }

        if (m_config.maxParticipants == 0) {
            return ErrorCode::ConfigInvalid;
        }

        Result<Socket> listening = Socket::listenTcp(m_config.bindAddress, m_config.port, m_config.backlog);
        if (listening.isFailure()) {
            LECTERN_LOG_ERROR_F("Cannot listen on %s:%u: %s", m_config.bindAddress.c_str(),
                                static_cast<unsigned>(m_config.port),
                                getErrorMessage(listening.error()).data());
            return listening.error();
        }

        m_listenSocket = std::move(listening).value();
        m_port = m_listenSocket.localPort();
        m_startTime = Clock::now();
        m_running = true;

        try {
            m_acceptThread = std::thread(&Impl::acceptLoop, this);
            m_sweepThread = std::thread(&Impl::sweepLoop, this);
        } catch (const std::system_error&) {
            m_running = false;
            m_sweepCv.notify_all();
            if (m_acceptThread.joinable()) {
                m_acceptThread.join();
            }
            m_listenSocket.close();
            return ErrorCode::ThreadCreationFailed;
        }

        if (m_config.announcePresence) {
            m_announcer = std::make_unique<Network::PresenceAnnouncer>(
                m_config.presence, m_config.presenterName, m_config.channel, m_port);
            VoidResult announcing = m_announcer->start();
            if (announcing.isFailure()) {
                LECTERN_LOG_WARNING_F("Presence announcements disabled: %s",
                                      getErrorMessage(announcing.error()).data());
                m_announcer.reset();
            }
        }

        LECTERN_LOG_INFO_F("Session server '%s' listening on %s:%u (channel %d)",
                           m_config.presenterName.c_str(), m_config.bindAddress.c_str(),
                           static_cast<unsigned>(m_port), m_config.channel);
        return VoidResult::Success();
    }

    void stop() noexcept {
        {
            std::lock_guard<std::mutex> lock(m_lifecycleMutex);
            if (!m_running) {
                return;
            }
            {
                std::lock_guard<std::mutex> sweepLock(m_sweepMutex);
                m_running = false;
            }
        }

        LECTERN_LOG_INFO("Stopping session server");

        m_sweepCv.notify_all();

        if (m_acceptThread.joinable()) {
            m_acceptThread.join();
        }
        if (m_sweepThread.joinable()) {
            m_sweepThread.join();
        }

        m_listenSocket.close();

        if (m_announcer) {
            m_announcer->stop();
            m_announcer.reset();
        }

        for (ParticipantRegistry::Entry& entry : m_registry.clear()) {
            if (entry.endpoint) {
                entry.endpoint->close();
            }
            notifyDisconnected(entry.info.id);
        }

        std::list<Connection> connections;
        {
            std::lock_guard<std::mutex> lock(m_connectionsMutex);
            connections.swap(m_connections);
        }
        for (Connection& connection : connections) {
            connection.endpoint->close();
        }
        for (Connection& connection : connections) {
            if (connection.thread.joinable()) {
                connection.thread.join();
            }
        }

        LECTERN_LOG_INFO("Session server stopped");
    }

    bool isRunning() const noexcept {
        return m_running.load();
    }

    uint16_t port() const noexcept {
        return m_port.load();
    }

    VoidResult sendTo(const std::string& participantId, MessageType type, const Protocol::MessageData& data) {
        ParticipantRegistry::EndpointPtr endpoint = m_registry.endpoint(participantId);
        if (!endpoint) {
            return ErrorCode::ParticipantNotFound;
        }

        VoidResult sent = endpoint->sendMessage(type, data);
        if (sent.isSuccess()) {
            m_messagesSent++;
        }
        return sent;
    }

    size_t broadcast(MessageType type, const Protocol::MessageData& data, const std::set<std::string>& exclude) {
        Result<ByteBuffer> frame = Protocol::pack(type, data);
        if (frame.isFailure()) {
            LECTERN_LOG_ERROR_F("Cannot encode %s broadcast: %s", Protocol::toString(type),
                                getErrorMessage(frame.error()).data());
            return 0;
        }

        size_t delivered = 0;
        for (const ParticipantRegistry::Entry& entry : m_registry.entries()) {
            if (!entry.endpoint || exclude.count(entry.info.id) > 0) {
                continue;
            }
            if (entry.endpoint->send(frame.value()).isSuccess()) {
                delivered++;
            }
        }

        m_messagesSent += delivered;
        return delivered;
    }

    std::vector<ParticipantInfo> getParticipants() const {
        return m_registry.participants();
    }

    std::optional<ParticipantInfo> getParticipant(const std::string& participantId) const {
        return m_registry.find(participantId);
    }

    size_t participantCount() const {
        return m_registry.size();
    }

    bool setParticipantStatus(const std::string& participantId, ParticipantStatus status) {
        return m_registry.setStatus(participantId, status);
    }

    Statistics statistics() const {
        Statistics stats;
        stats.totalConnections = m_totalConnections.load();
        stats.messagesSent = m_messagesSent.load();
        stats.messagesReceived = m_messagesReceived.load();
        stats.rejectedRegistrations = m_rejected.load();
        stats.evictions = m_evictions.load();
        stats.activeParticipants = m_registry.size();
        if (m_running) {
            stats.uptime = std::chrono::duration_cast<Milliseconds>(Clock::now() - m_startTime);
        }
        return stats;
    }

    const Config::ServerConfig& config() const noexcept {
        return m_config;
    }

private:
    struct Connection {
        std::shared_ptr<Endpoint> endpoint;
        std::shared_ptr<std::atomic<bool>> finished;
        std::thread thread;
    };

    // ------------------------------------------------------------------------
    // Accept
    // ------------------------------------------------------------------------

    void acceptLoop() {
        while (m_running) {
            reapFinishedConnections();

            Result<Network::AcceptedConnection> accepted = m_listenSocket.accept(m_config.receiveTimeout);
            if (accepted.isFailure()) {
                if (accepted.error() != ErrorCode::Timeout && m_running) {
                    LECTERN_LOG_WARNING_F("Accept failed: %s", getErrorMessage(accepted.error()).data());
                }
                continue;
            }

            Network::AcceptedConnection connection = std::move(accepted).value();
            if (connection.socket.setNoDelay(true).isFailure()) {
                LECTERN_LOG_DEBUG("TCP_NODELAY not applied");
            }

            m_totalConnections++;
            LECTERN_LOG_INFO_F("New connection from %s:%u", connection.address.c_str(),
                               static_cast<unsigned>(connection.port));

            auto endpoint = std::make_shared<Endpoint>(std::move(connection.socket),
                                                       connection.address,
                                                       connection.port,
                                                       m_config.receiveBufferSize,
                                                       m_config.maxPayloadSize);
            spawnConnection(std::move(endpoint));
        }
    }

    void spawnConnection(std::shared_ptr<Endpoint> endpoint) {
        std::lock_guard<std::mutex> lock(m_connectionsMutex);

        Connection connection;
        connection.endpoint = std::move(endpoint);
        connection.finished = std::make_shared<std::atomic<bool>>(false);

        try {
            connection.thread = std::thread(&Impl::connectionLoop, this,
                                            connection.endpoint, connection.finished);
        } catch (const std::system_error&) {
            LECTERN_LOG_ERROR_F("No thread for connection %s, closing it",
                                connection.endpoint->peerName().c_str());
            connection.endpoint->close();
            return;
        }

        m_connections.push_back(std::move(connection));
    }

    void reapFinishedConnections() {
        std::list<Connection> finished;
        {
            std::lock_guard<std::mutex> lock(m_connectionsMutex);
            for (auto it = m_connections.begin(); it != m_connections.end(); ) {
                if (it->finished->load()) {
                    auto next = std::next(it);
                    finished.splice(finished.end(), m_connections, it);
                    it = next;
                } else {
                    ++it;
                }
            }
        }

        for (Connection& connection : finished) {
            if (connection.thread.joinable()) {
                connection.thread.join();
            }
        }
    }

    // ------------------------------------------------------------------------
    // Per-connection loop
    // ------------------------------------------------------------------------

    void connectionLoop(std::shared_ptr<Endpoint> endpoint, std::shared_ptr<std::atomic<bool>> finished) {
        std::string participantId;
        const TimePoint registrationDeadline = Clock::now() + m_config.registrationTimeout;
        bool open = true;

        while (open && m_running && endpoint->isConnected()) {
            if (participantId.empty() && Clock::now() >= registrationDeadline) {
                LECTERN_LOG_WARNING_F("No registration from %s, closing", endpoint->peerName().c_str());
                break;
            }

            MessageBatch batch = endpoint->receiveMessages(m_config.receiveTimeout);

            for (const Message& message : batch.messages) {
                m_messagesReceived++;

                if (participantId.empty()) {
                    if (!message.is(MessageType::StudentConnect)) {
                        reject(*endpoint, REJECT_UNREGISTERED);
                        open = false;
                        break;
                    }

                    Result<std::string> registered = registerParticipant(endpoint, message);
                    if (registered.isFailure()) {
                        open = false;
                        break;
                    }
                    participantId = std::move(registered).value();
                    continue;
                }

                if (!m_registry.touch(participantId, endpoint)) {
                    // Replaced by a newer connection or evicted
                    open = false;
                    break;
                }

                if (!handleMessage(participantId, *endpoint, message)) {
                    open = false;
                    break;
                }
            }

            if (batch.status == TransportStatus::ConnectionClosed) {
                break;
            }
        }

        if (!participantId.empty()) {
            std::optional<ParticipantInfo> removed = m_registry.remove(participantId, endpoint);
            if (removed) {
                LECTERN_LOG_INFO_F("Participant disconnected: %s (%s)",
                                   removed->name.c_str(), participantId.c_str());
                notifyDisconnected(participantId);
            }
        }

        endpoint->close();
        finished->store(true);
    }

    /**
     * @return false when the connection should be closed
     */
    bool handleMessage(const std::string& participantId, Endpoint& endpoint, const Message& message) {
        std::optional<MessageType> kind = message.kind();

        if (kind == MessageType::Ping) {
            if (endpoint.sendMessage(MessageType::Pong, Protocol::MessageBuilder::pong()).isSuccess()) {
                m_messagesSent++;
            }
            return true;
        }

        if (kind == MessageType::Disconnect) {
            LECTERN_LOG_DEBUG_F("%s announced disconnect", participantId.c_str());
            return false;
        }

        if (kind == MessageType::StudentConnect) {
            LECTERN_LOG_DEBUG_F("Ignoring repeated registration from %s", participantId.c_str());
            return true;
        }

        if (m_listener) {
            try {
                m_listener->onMessage(participantId, message);
            } catch (const std::exception& e) {
                LECTERN_LOG_ERROR_F("Message handler failed: %s", e.what());
            }
        }
        return true;
    }

    // ------------------------------------------------------------------------
    // Registration
    // ------------------------------------------------------------------------

    Result<std::string> registerParticipant(const std::shared_ptr<Endpoint>& endpoint, const Message& message) {
        const Protocol::MessageData& data = message.data;

        auto machineIt = data.find("machine_id");
        if (machineIt == data.end() || !machineIt->is_string() || machineIt->get<std::string>().empty()) {
            LECTERN_LOG_WARNING_F("Malformed registration from %s", endpoint->peerName().c_str());
            reject(*endpoint, REJECT_MALFORMED);
            return ErrorCode::RegistrationRejected;
        }

        ParticipantInfo info;
        info.name = "Unknown";
        auto nameIt = data.find("student_name");
        if (nameIt != data.end() && nameIt->is_string()) {
            info.name = nameIt->get<std::string>();
        }

        info.address = endpoint->peerAddress();
        info.port = endpoint->peerPort();
        info.id = makeParticipantId(machineIt->get<std::string>(), info.address);
        info.status = ParticipantStatus::Online;
        info.connectedAt = Clock::now();
        info.lastSeen = info.connectedAt;

        Result<ParticipantRegistry::EndpointPtr> admitted = m_registry.admit(info, endpoint);
        if (admitted.isFailure()) {
            LECTERN_LOG_WARNING_F("Rejecting %s: session is full (%zu)", info.id.c_str(), m_registry.capacity());
            reject(*endpoint, REJECT_FULL);
            return admitted.error();
        }

        VoidResult accepted = endpoint->sendMessage(MessageType::ConnectionAccepted,
                                                    Protocol::MessageBuilder::connectionAccepted(info.id));
        if (accepted.isFailure()) {
            LECTERN_LOG_ERROR_F("Could not confirm registration of %s", info.id.c_str());
            (void)m_registry.remove(info.id, endpoint);
            return accepted.error();
        }
        m_messagesSent++;

        LECTERN_LOG_INFO_F("Participant registered: %s (%s)", info.name.c_str(), info.id.c_str());

        if (m_listener) {
            try {
                m_listener->onParticipantConnected(info);
            } catch (const std::exception& e) {
                LECTERN_LOG_ERROR_F("Connect handler failed: %s", e.what());
            }
        }

        return info.id;
    }

    void reject(Endpoint& endpoint, const char* reason) {
        m_rejected++;
        if (endpoint.sendMessage(MessageType::ConnectionRejected,
                                 Protocol::MessageBuilder::connectionRejected(reason)).isSuccess()) {
            m_messagesSent++;
        }
        endpoint.close();
    }

    // ------------------------------------------------------------------------
    // Eviction
    // ------------------------------------------------------------------------

    void sweepLoop() {
        while (true) {
            {
                std::unique_lock<std::mutex> lock(m_sweepMutex);
                if (m_sweepCv.wait_for(lock, m_config.sweepInterval, [this] { return !m_running; })) {
                    break;
                }
            }

            evictStale();
        }
    }

    void evictStale() {
        for (ParticipantRegistry::Entry& entry : m_registry.removeStale(m_config.heartbeatTimeout)) {
            LECTERN_LOG_WARNING_F("Evicting %s (%s): no heartbeat for %lld ms",
                                  entry.info.name.c_str(), entry.info.id.c_str(),
                                  static_cast<long long>(m_config.heartbeatTimeout.count()));
            if (entry.endpoint) {
                entry.endpoint->close();
            }
            m_evictions++;
            notifyDisconnected(entry.info.id);
        }
    }

    void notifyDisconnected(const std::string& participantId) noexcept {
        if (!m_listener) {
            return;
        }
        try {
            m_listener->onParticipantDisconnected(participantId);
        } catch (const std::exception& e) {
            LECTERN_LOG_ERROR_F("Disconnect handler failed: %s", e.what());
        }
    }

    Config::ServerConfig m_config;
    std::shared_ptr<ServerListener> m_listener;
    ParticipantRegistry m_registry;

    std::mutex m_lifecycleMutex;
    std::atomic<bool> m_running;
    std::atomic<uint16_t> m_port;
    TimePoint m_startTime{};

    Socket m_listenSocket;
    std::thread m_acceptThread;

    std::mutex m_sweepMutex;
    std::condition_variable m_sweepCv;
    std::thread m_sweepThread;

    std::unique_ptr<Network::PresenceAnnouncer> m_announcer;

    std::mutex m_connectionsMutex;
    std::list<Connection> m_connections;

    std::atomic<uint64_t> m_totalConnections{0};
    std::atomic<uint64_t> m_messagesSent{0};
    std::atomic<uint64_t> m_messagesReceived{0};
    std::atomic<uint64_t> m_rejected{0};
    std::atomic<uint64_t> m_evictions{0};
};

// ============================================================================
// SessionServer Public API
// ============================================================================

SessionServer::SessionServer(const Config::ServerConfig& config, std::shared_ptr<ServerListener> listener)
    : m_impl(std::make_unique<Impl>(config, std::move(listener)))
{
}

SessionServer::~SessionServer() = default;

VoidResult SessionServer::start() {
    return m_impl->start();
}

void SessionServer::stop() noexcept {
    m_impl->stop();
}

bool SessionServer::isRunning() const noexcept {
    return m_impl->isRunning();
}

uint16_t SessionServer::port() const noexcept {
    return m_impl->port();
}

VoidResult SessionServer::sendTo(const std::string& participantId,
                                 Protocol::MessageType type,
                                 const Protocol::MessageData& data) {
    return m_impl->sendTo(participantId, type, data);
}

size_t SessionServer::broadcast(Protocol::MessageType type,
                                const Protocol::MessageData& data,
                                const std::set<std::string>& exclude) {
    return m_impl->broadcast(type, data, exclude);
}

std::vector<ParticipantInfo> SessionServer::getParticipants() const {
    return m_impl->getParticipants();
}

std::optional<ParticipantInfo> SessionServer::getParticipant(const std::string& participantId) const {
    return m_impl->getParticipant(participantId);
}

size_t SessionServer::participantCount() const {
    return m_impl->participantCount();
}

bool SessionServer::setParticipantStatus(const std::string& participantId, ParticipantStatus status) {
    return m_impl->setParticipantStatus(participantId, status);
}

SessionServer::Statistics SessionServer::statistics() const {
    return m_impl->statistics();
}

const Config::ServerConfig& SessionServer::config() const noexcept {
    return m_impl->config();
}

} // namespace Lectern::Session
