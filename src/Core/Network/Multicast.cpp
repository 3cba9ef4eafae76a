/**
 * @file Multicast.cpp
 * @brief Fan-out sender, receiver and sequencing
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <Lectern/Core/Multicast.hpp>
#include <Lectern/Core/Compression.hpp>
#include <Lectern/Core/Logger.hpp>
#include <Lectern/Core/Protocol.hpp>

#include <condition_variable>
#include <exception>
#include <system_error>
#include <thread>

namespace Lectern::Network {

// ============================================================================
// MulticastSender
// ============================================================================

MulticastSender::MulticastSender(const Config::FanoutConfig& config)
    : m_config(config) {
}

MulticastSender::~MulticastSender() {
    close();
}

VoidResult MulticastSender::open() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_socket.isValid()) {
        return ErrorCode::InvalidState;
    }

    Result<Socket> socket = Socket::createUdp();
    if (socket.isFailure()) {
        return socket.error();
    }

    Socket udp = std::move(socket).value();
    LECTERN_TRY(udp.setMulticastTtl(m_config.ttl));
    LECTERN_TRY(udp.setMulticastLoopback(true));

    // A smaller kernel buffer only costs throughput
    if (udp.setSendBufferSize(m_config.socketBufferSize).isFailure()) {
        LECTERN_LOG_WARNING("Could not enlarge fan-out send buffer");
    }

    m_socket = std::move(udp);
    LECTERN_LOG_INFO_F("Fan-out sender ready on %s:%u (ttl %d)", m_config.group.c_str(),
                       static_cast<unsigned>(m_config.port), m_config.ttl);
    return VoidResult::Success();
}

VoidResult MulticastSender::send(ByteSpan payload, bool compress) {
    ByteBuffer deflated;
    ByteSpan datagram = payload;

    if (compress) {
        Result<ByteBuffer> result = Compression::compress(payload, m_config.compressionLevel);
        if (result.isFailure()) {
            m_errors++;
            return result.error();
        }
        deflated = std::move(result).value();
        datagram = deflated;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_socket.isValid()) {
        return ErrorCode::NotConnected;
    }

    VoidResult sent = m_socket.sendTo(datagram, m_config.group, m_config.port);
    if (sent.isFailure()) {
        m_errors++;
        LECTERN_LOG_DEBUG_F("Fan-out send of %zu bytes failed", datagram.size());
        return sent;
    }

    m_packetsSent++;
    m_bytesSent += datagram.size();
    return VoidResult::Success();
}

void MulticastSender::close() noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_socket.isValid()) {
        m_socket.close();
        LECTERN_LOG_INFO("Fan-out sender closed");
    }
}

bool MulticastSender::isOpen() const noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_socket.isValid();
}

MulticastSender::Statistics MulticastSender::statistics() const noexcept {
    Statistics stats;
    stats.packetsSent = m_packetsSent.load();
    stats.bytesSent = m_bytesSent.load();
    stats.errors = m_errors.load();
    return stats;
}

// ============================================================================
// MulticastReceiver
// ============================================================================

class MulticastReceiver::Impl {
public:
    Impl(const Config::FanoutConfig& config, DataCallback onData)
        : m_config(config)
        , m_onData(std::move(onData))
        , m_running(false)
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
        if (!m_onData) {
            return ErrorCode::NullPointer;
        }

        Result<Socket> bound = Socket::bindUdp("0.0.0.0", m_config.port, true);
        if (bound.isFailure()) {
            return bound.error();
        }

        Socket socket = std::move(bound).value();
        LECTERN_TRY(socket.joinMulticastGroup(m_config.group));

        if (socket.setReceiveBufferSize(m_config.socketBufferSize).isFailure()) {
            LECTERN_LOG_WARNING("Could not enlarge fan-out receive buffer");
        }

        m_socket = std::move(socket);
        m_running = true;

        try {
            m_thread = std::thread(&Impl::receiveLoop, this);
        } catch (const std::system_error&) {
            m_running = false;
            m_socket.close();
            return ErrorCode::ThreadCreationFailed;
        }

        LECTERN_LOG_INFO_F("Fan-out receiver joined %s:%u", m_config.group.c_str(),
                           static_cast<unsigned>(m_config.port));
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

        if (m_thread.joinable()) {
            m_thread.join();
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        (void)m_socket.leaveMulticastGroup(m_config.group);
        m_socket.close();
        LECTERN_LOG_INFO("Fan-out receiver stopped");
    }

    bool isRunning() const noexcept {
        return m_running.load();
    }

    Statistics statistics() const noexcept {
        Statistics stats;
        stats.packetsReceived = m_packetsReceived.load();
        stats.bytesReceived = m_bytesReceived.load();
        stats.errors = m_errors.load();
        return stats;
    }

private:
    void receiveLoop() {
        ByteBuffer buffer(m_config.bufferSize);

        while (m_running) {
            Result<Datagram> datagram = m_socket.receiveFrom(buffer, m_config.receiveTimeout);
            if (datagram.isFailure()) {
                if (datagram.error() != ErrorCode::Timeout && m_running) {
                    m_errors++;
                    LECTERN_LOG_DEBUG("Fan-out receive failed");
                }
                continue;
            }

            size_t size = datagram.value().size;
            if (size == 0) {
                continue;
            }

            ByteSpan raw(buffer.data(), size);
            Result<ByteBuffer> inflated = Compression::decompress(raw, Protocol::MAX_PAYLOAD_SIZE);
            ByteSpan payload = inflated.isSuccess() ? ByteSpan(inflated.value()) : raw;

            m_packetsReceived++;
            m_bytesReceived += payload.size();

            try {
                m_onData(payload);
            } catch (const std::exception& e) {
                m_errors++;
                LECTERN_LOG_ERROR_F("Fan-out data handler failed: %s", e.what());
            }
        }
    }

    Config::FanoutConfig m_config;
    DataCallback m_onData;

    mutable std::mutex m_mutex;
    std::thread m_thread;
    std::atomic<bool> m_running;
    Socket m_socket;

    std::atomic<uint64_t> m_packetsReceived{0};
    std::atomic<uint64_t> m_bytesReceived{0};
    std::atomic<uint64_t> m_errors{0};
};

MulticastReceiver::MulticastReceiver(const Config::FanoutConfig& config, DataCallback onData)
    : m_impl(std::make_unique<Impl>(config, std::move(onData)))
{
}

MulticastReceiver::~MulticastReceiver() = default;

VoidResult MulticastReceiver::start() {
    return m_impl->start();
}

void MulticastReceiver::stop() noexcept {
    m_impl->stop();
}

bool MulticastReceiver::isRunning() const noexcept {
    return m_impl->isRunning();
}

MulticastReceiver::Statistics MulticastReceiver::statistics() const noexcept {
    return m_impl->statistics();
}

// ============================================================================
// Sequencing
// ============================================================================

ByteBuffer prependSequence(uint32_t sequence, ByteSpan payload) {
    ByteBuffer out;
    out.reserve(SEQUENCE_PREFIX_SIZE + payload.size());
    out.push_back(static_cast<Byte>(sequence >> 24));
    out.push_back(static_cast<Byte>(sequence >> 16));
    out.push_back(static_cast<Byte>(sequence >> 8));
    out.push_back(static_cast<Byte>(sequence));
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

SequencedFrameSender::SequencedFrameSender(MulticastSender& sender, uint32_t firstSequence)
    : m_sender(sender)
    , m_next(firstSequence) {
}

VoidResult SequencedFrameSender::send(ByteSpan payload, bool compress) {
    uint32_t sequence = m_next.fetch_add(1);
    ByteBuffer tagged = prependSequence(sequence, payload);
    return m_sender.send(tagged, compress);
}

std::optional<SequencedFrame> SequencedFrameFilter::accept(ByteSpan datagram) {
    if (datagram.size() < SEQUENCE_PREFIX_SIZE) {
        m_dropped++;
        return std::nullopt;
    }

    uint32_t sequence = (static_cast<uint32_t>(datagram[0]) << 24) |
                        (static_cast<uint32_t>(datagram[1]) << 16) |
                        (static_cast<uint32_t>(datagram[2]) << 8) |
                        static_cast<uint32_t>(datagram[3]);

    if (m_last && sequence <= *m_last) {
        m_dropped++;
        return std::nullopt;
    }

    m_last = sequence;
    m_accepted++;

    SequencedFrame frame;
    frame.sequence = sequence;
    frame.payload.assign(datagram.begin() + SEQUENCE_PREFIX_SIZE, datagram.end());
    return frame;
}

} // namespace Lectern::Network
