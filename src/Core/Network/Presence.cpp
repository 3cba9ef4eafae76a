/**
 * @file Presence.cpp
 * @brief Presence announcer and listener
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <Lectern/Core/Presence.hpp>
#include <Lectern/Core/Logger.hpp>
#include <Lectern/Core/Protocol.hpp>
#include <Lectern/Core/Socket.hpp>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <map>
#include <mutex>
#include <system_error>
#include <thread>

namespace Lectern::Network {

// ============================================================================
// PresenceAnnouncer
// ============================================================================

class PresenceAnnouncer::Impl {
public:
    Impl(const Config::PresenceConfig& config, std::string presenterName, int channel, uint16_t sessionPort)
        : m_config(config)
        , m_presenterName(std::move(presenterName))
        , m_channel(channel)
        , m_sessionPort(sessionPort)
        , m_running(false)
        , m_sent(0)
    {
    }

    ~Impl() {
        stop();
    }

    VoidResult start() {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_running) {
            return ErrorCode::InvalidState;
        }

        Result<Socket> created = Socket::createUdp();
        if (created.isFailure()) {
            return created.error();
        }

        Socket socket = std::move(created).value();
        LECTERN_TRY(socket.setMulticastTtl(m_config.ttl));
        LECTERN_TRY(socket.setMulticastLoopback(true));
        LECTERN_TRY(socket.setBroadcast(true));

        m_socket = std::move(socket);
        m_running = true;

        try {
            m_thread = std::thread(&Impl::announceLoop, this);
        } catch (const std::system_error&) {
            m_running = false;
            m_socket.close();
            return ErrorCode::ThreadCreationFailed;
        }

        LECTERN_LOG_INFO_F("Announcing '%s' (channel %d, port %u) on %s:%u",
                           m_presenterName.c_str(), m_channel, static_cast<unsigned>(m_sessionPort),
                           m_config.group.c_str(), static_cast<unsigned>(m_config.port));
        return VoidResult::Success();
    }

    void stop() noexcept {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running) {
                return;
            }
            m_running = false;
        }

        m_cv.notify_one();

        if (m_thread.joinable()) {
            m_thread.join();
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_socket.close();
    }

    bool isRunning() const noexcept {
        return m_running.load();
    }

    uint64_t announcementsSent() const noexcept {
        return m_sent.load();
    }

    VoidResult announceOnce() {
        Result<ByteBuffer> frame = Protocol::pack(
            Protocol::MessageType::TeacherBroadcast,
            Protocol::MessageBuilder::presenterAnnouncement(m_presenterName, m_channel, m_sessionPort),
            false);
        if (frame.isFailure()) {
            return frame.error();
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_socket.isValid()) {
            return ErrorCode::NotConnected;
        }

        VoidResult multicast = m_socket.sendTo(frame.value(), m_config.group, m_config.port);
        if (multicast.isFailure()) {
            LECTERN_LOG_DEBUG("Multicast announcement failed");
        }

        VoidResult broadcast = m_socket.sendTo(frame.value(), m_config.broadcastAddress, m_config.port);
        if (broadcast.isFailure()) {
            LECTERN_LOG_DEBUG("Broadcast announcement failed");
        }

        if (multicast.isFailure() && broadcast.isFailure()) {
            return multicast.error();
        }

        m_sent++;
        return VoidResult::Success();
    }

private:
    void announceLoop() {
        while (m_running) {
            (void)announceOnce();

            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_cv.wait_for(lock, m_config.announceInterval, [this] { return !m_running; })) {
                break;
            }
        }
    }

    Config::PresenceConfig m_config;
    std::string m_presenterName;
    int m_channel;
    uint16_t m_sessionPort;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_thread;
    std::atomic<bool> m_running;
    Socket m_socket;

    std::atomic<uint64_t> m_sent;
};

PresenceAnnouncer::PresenceAnnouncer(const Config::PresenceConfig& config,
                                     std::string presenterName,
                                     int channel,
                                     uint16_t sessionPort)
    : m_impl(std::make_unique<Impl>(config, std::move(presenterName), channel, sessionPort))
{
}

PresenceAnnouncer::~PresenceAnnouncer() = default;

VoidResult PresenceAnnouncer::start() {
    return m_impl->start();
}

void PresenceAnnouncer::stop() noexcept {
    m_impl->stop();
}

VoidResult PresenceAnnouncer::announceOnce() {
    return m_impl->announceOnce();
}

bool PresenceAnnouncer::isRunning() const noexcept {
    return m_impl->isRunning();
}

uint64_t PresenceAnnouncer::announcementsSent() const noexcept {
    return m_impl->announcementsSent();
}

// ============================================================================
// PresenceListener
// ============================================================================

class PresenceListener::Impl {
public:
    Impl(const Config::PresenceConfig& config, PresenterCallback onPresenterFound)
        : m_config(config)
        , m_onPresenterFound(std::move(onPresenterFound))
        , m_running(false)
        , m_multicastJoined(false)
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

        Result<Socket> bound = Socket::bindUdp("0.0.0.0", m_config.port, true);
        if (bound.isFailure()) {
            return bound.error();
        }

        Socket socket = std::move(bound).value();
        LECTERN_TRY(socket.setBroadcast(true));

        m_multicastJoined = socket.joinMulticastGroup(m_config.group).isSuccess();
        if (!m_multicastJoined) {
            LECTERN_LOG_WARNING("Multicast unavailable, listening for broadcast announcements only");
        }

        m_socket = std::move(socket);
        m_running = true;

        try {
            m_thread = std::thread(&Impl::listenLoop, this);
        } catch (const std::system_error&) {
            m_running = false;
            m_socket.close();
            return ErrorCode::ThreadCreationFailed;
        }

        LECTERN_LOG_INFO_F("Listening for presenters on port %u", static_cast<unsigned>(m_config.port));
        return VoidResult::Success();
    }

    void stop() noexcept {
        {
            std::lock_guard<std::mutex> lock(m_lifecycleMutex);
            if (!m_running) {
                return;
            }
            m_running = false;
        }

        if (m_thread.joinable()) {
            m_thread.join();
        }

        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        if (m_multicastJoined) {
            (void)m_socket.leaveMulticastGroup(m_config.group);
        }
        m_socket.close();
    }

    bool isRunning() const noexcept {
        return m_running.load();
    }

    bool multicastJoined() const noexcept {
        return m_multicastJoined.load();
    }

    std::vector<PresenterInfo> presenters() const {
        std::lock_guard<std::mutex> lock(m_presentersMutex);

        std::vector<PresenterInfo> result;
        result.reserve(m_presenters.size());
        for (const auto& [id, presenter] : m_presenters) {
            result.push_back(presenter);
        }
        return result;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_presentersMutex);
        m_presenters.clear();
    }

private:
    void listenLoop() {
        ByteBuffer buffer(m_config.bufferSize);

        while (m_running) {
            Result<Datagram> datagram = m_socket.receiveFrom(buffer, m_config.receiveTimeout);
            if (datagram.isFailure()) {
                if (datagram.error() != ErrorCode::Timeout && m_running) {
                    LECTERN_LOG_DEBUG("Presence receive failed");
                }
                continue;
            }

            handleDatagram(ByteSpan(buffer.data(), datagram.value().size), datagram.value().address);
        }
    }

    void handleDatagram(ByteSpan bytes, const std::string& senderAddress) {
        Result<Protocol::Message> message = Protocol::unpack(bytes);
        if (message.isFailure() || !message.value().is(Protocol::MessageType::TeacherBroadcast)) {
            return;
        }

        const Protocol::MessageData& data = message.value().data;

        auto portIt = data.find("port");
        if (portIt == data.end() || !portIt->is_number_integer()) {
            return;
        }
        int64_t port = portIt->get<int64_t>();
        if (port <= 0 || port > 65535) {
            return;
        }

        PresenterInfo presenter;
        presenter.address = senderAddress;
        presenter.port = static_cast<uint16_t>(port);
        presenter.id = senderAddress + ":" + std::to_string(port);
        presenter.lastSeen = Clock::now();

        auto nameIt = data.find("teacher_name");
        if (nameIt != data.end() && nameIt->is_string()) {
            presenter.name = nameIt->get<std::string>();
        }

        auto channelIt = data.find("channel");
        if (channelIt != data.end() && channelIt->is_number_integer()) {
            presenter.channel = channelIt->get<int>();
        }

        bool isNew = false;
        {
            std::lock_guard<std::mutex> lock(m_presentersMutex);
            isNew = m_presenters.find(presenter.id) == m_presenters.end();
            m_presenters[presenter.id] = presenter;
        }

        if (isNew) {
            LECTERN_LOG_INFO_F("Found presenter '%s' at %s", presenter.name.c_str(), presenter.id.c_str());
            if (m_onPresenterFound) {
                try {
                    m_onPresenterFound(presenter);
                } catch (const std::exception& e) {
                    LECTERN_LOG_ERROR_F("Presenter handler failed: %s", e.what());
                }
            }
        }
    }

    Config::PresenceConfig m_config;
    PresenterCallback m_onPresenterFound;

    std::mutex m_lifecycleMutex;
    std::thread m_thread;
    std::atomic<bool> m_running;
    std::atomic<bool> m_multicastJoined;
    Socket m_socket;

    mutable std::mutex m_presentersMutex;
    std::map<std::string, PresenterInfo> m_presenters;
};

PresenceListener::PresenceListener(const Config::PresenceConfig& config, PresenterCallback onPresenterFound)
    : m_impl(std::make_unique<Impl>(config, std::move(onPresenterFound)))
{
}

PresenceListener::~PresenceListener() = default;

VoidResult PresenceListener::start() {
    return m_impl->start();
}

void PresenceListener::stop() noexcept {
    m_impl->stop();
}

bool PresenceListener::isRunning() const noexcept {
    return m_impl->isRunning();
}

bool PresenceListener::multicastJoined() const noexcept {
    return m_impl->multicastJoined();
}

std::vector<PresenterInfo> PresenceListener::presenters() const {
    return m_impl->presenters();
}

void PresenceListener::clear() {
    m_impl->clear();
}

} // namespace Lectern::Network
