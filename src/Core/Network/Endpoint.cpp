/**
 * @file Endpoint.cpp
 * @brief Reliable frame channel implementation
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <Lectern/Core/Endpoint.hpp>
#include <Lectern/Core/Logger.hpp>

namespace Lectern::Network {

const char* toString(TransportStatus status) noexcept {
    switch (status) {
        case TransportStatus::Ok: return "ok";
        case TransportStatus::Timeout: return "timeout";
        case TransportStatus::ConnectionClosed: return "connection closed";
        case TransportStatus::ProtocolError: return "protocol error";
        default: return "unknown";
    }
}

Endpoint::Endpoint(Socket socket,
                   std::string peerAddress,
                   uint16_t peerPort,
                   size_t receiveBufferSize,
                   size_t maxPayloadSize)
    : m_socket(std::move(socket))
    , m_peerAddress(std::move(peerAddress))
    , m_peerPort(peerPort)
    , m_assembler(maxPayloadSize)
    , m_readBuffer(receiveBufferSize) {
    if (!m_socket.isValid()) {
        m_connected = false;
    }
}

Endpoint::~Endpoint() {
    close();
}

std::string Endpoint::peerName() const {
    return m_peerAddress + ":" + std::to_string(m_peerPort);
}

VoidResult Endpoint::send(ByteSpan frame) {
    std::lock_guard<std::mutex> lock(m_sendMutex);

    if (!m_connected.load()) {
        return ErrorCode::NotConnected;
    }

    size_t total = 0;
    while (total < frame.size()) {
        IoResult result = m_socket.send(frame.subspan(total));

        switch (result.status) {
            case IoStatus::Ok:
                if (result.bytes == 0) {
                    m_connected = false;
                    return ErrorCode::ConnectionClosed;
                }
                total += result.bytes;
                break;

            case IoStatus::Timeout:
                // Interrupted; retry the remainder
                break;

            case IoStatus::Closed:
                LECTERN_LOG_DEBUG_F("Send to %s failed: connection closed", peerName().c_str());
                m_connected = false;
                return ErrorCode::ConnectionClosed;

            case IoStatus::Error:
            default:
                LECTERN_LOG_WARNING_F("Send to %s failed", peerName().c_str());
                m_connected = false;
                return ErrorCode::SendFailed;
        }
    }

    m_bytesSent += frame.size();
    m_framesSent++;
    return VoidResult::Success();
}

VoidResult Endpoint::sendMessage(Protocol::MessageType type,
                                 const Protocol::MessageData& data,
                                 bool compress) {
    Result<ByteBuffer> frame = Protocol::pack(type, data, compress);
    if (frame.isFailure()) {
        return frame.error();
    }
    return send(frame.value());
}

FrameBatch Endpoint::receive(Milliseconds timeout) {
    std::lock_guard<std::mutex> lock(m_receiveMutex);

    FrameBatch batch;
    if (!m_connected.load()) {
        m_assembler.clear();
        batch.status = TransportStatus::ConnectionClosed;
        return batch;
    }

    IoResult result = m_socket.receive(m_readBuffer, timeout);

    switch (result.status) {
        case IoStatus::Ok:
            m_bytesReceived += result.bytes;
            batch.frames = m_assembler.feed(ByteSpan(m_readBuffer.data(), result.bytes));
            m_framesReceived += batch.frames.size();
            {
                std::lock_guard<std::mutex> statsLock(m_statsMutex);
                m_assemblerStats = m_assembler.statistics();
            }
            break;

        case IoStatus::Timeout:
            batch.status = TransportStatus::Timeout;
            break;

        case IoStatus::Closed:
        case IoStatus::Error:
        default:
            if (m_connected.exchange(false)) {
                LECTERN_LOG_DEBUG_F("Connection to %s closed by peer", peerName().c_str());
            }
            m_assembler.clear();
            batch.status = TransportStatus::ConnectionClosed;
            break;
    }

    return batch;
}

MessageBatch Endpoint::receiveMessages(Milliseconds timeout) {
    FrameBatch frames = receive(timeout);

    MessageBatch batch;
    batch.status = frames.status;

    for (const ByteBuffer& frame : frames.frames) {
        Result<Protocol::Message> message = Protocol::unpack(frame);
        if (message.isFailure()) {
            m_decodeErrors++;
            batch.status = TransportStatus::ProtocolError;
            LECTERN_LOG_WARNING_F("Dropping undecodable frame from %s: %s",
                                  peerName().c_str(), getErrorMessage(message.error()).data());
            continue;
        }
        batch.messages.push_back(std::move(message).value());
    }

    return batch;
}

void Endpoint::close() noexcept {
    m_connected = false;
    // Wakes a reader blocked in poll(); the descriptor is released on destruction
    m_socket.shutdown();
}

Endpoint::Statistics Endpoint::statistics() const {
    Statistics stats;
    stats.bytesSent = m_bytesSent.load();
    stats.bytesReceived = m_bytesReceived.load();
    stats.framesSent = m_framesSent.load();
    stats.framesReceived = m_framesReceived.load();
    stats.decodeErrors = m_decodeErrors.load();
    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        stats.assembler = m_assemblerStats;
    }
    return stats;
}

} // namespace Lectern::Network
