/**
 * @file Endpoint.hpp
 * @brief One reliable connection with its own frame assembler and write lock
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#pragma once

#ifndef LECTERN_CORE_ENDPOINT_HPP
#define LECTERN_CORE_ENDPOINT_HPP

#include <Lectern/Core/Types.hpp>
#include <Lectern/Core/ErrorCodes.hpp>
#include <Lectern/Core/Protocol.hpp>
#include <Lectern/Core/Socket.hpp>
#include <Lectern/Core/StreamAssembler.hpp>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace Lectern::Network {

/**
 * @brief Outcome of a receive on an endpoint
 */
enum class TransportStatus : uint8_t {
    Ok,                 ///< Read completed (zero or more frames)
    Timeout,            ///< No bytes before the deadline
    ConnectionClosed,   ///< Peer closed, reset, or close() was called
    ProtocolError       ///< Bytes arrived but at least one frame failed to decode
};

/**
 * @brief Human-readable status name
 */
[[nodiscard]] const char* toString(TransportStatus status) noexcept;

/**
 * @brief Raw frames from one read
 */
struct FrameBatch {
    TransportStatus status = TransportStatus::Ok;
    std::vector<ByteBuffer> frames;
};

/**
 * @brief Decoded messages from one read
 *
 * Frames that fail to decode are dropped and reported through
 * TransportStatus::ProtocolError; the connection stays usable.
 */
struct MessageBatch {
    TransportStatus status = TransportStatus::Ok;
    std::vector<Protocol::Message> messages;
};

/**
 * @brief Reliable bidirectional frame channel
 *
 * send() may be called from any number of threads; frames are written
 * whole under a per-endpoint lock. receive() must be driven by a single
 * reader thread. close() is idempotent and may be called from any thread;
 * it wakes a blocked reader.
 */
class Endpoint {
public:
    struct Statistics {
        uint64_t bytesSent = 0;
        uint64_t bytesReceived = 0;
        uint64_t framesSent = 0;
        uint64_t framesReceived = 0;
        uint64_t decodeErrors = 0;
        Protocol::StreamAssembler::Statistics assembler;
    };

    /**
     * @param socket Connected stream socket (ownership transferred)
     * @param peerAddress Remote IPv4 address
     * @param peerPort Remote port
     * @param receiveBufferSize Largest single read
     * @param maxPayloadSize Largest frame payload accepted from the peer
     */
    Endpoint(Socket socket,
             std::string peerAddress,
             uint16_t peerPort,
             size_t receiveBufferSize = 65536,
             size_t maxPayloadSize = Protocol::MAX_PAYLOAD_SIZE);
    ~Endpoint();

    Endpoint(const Endpoint&) = delete;
    Endpoint& operator=(const Endpoint&) = delete;

    /**
     * @brief Write a complete frame
     * @return Success, NotConnected, ConnectionClosed or SendFailed. Any
     *         failure leaves the endpoint disconnected.
     */
    VoidResult send(ByteSpan frame);

    /**
     * @brief Pack and send one message
     */
    VoidResult sendMessage(Protocol::MessageType type,
                           const Protocol::MessageData& data,
                           bool compress = true);

    /**
     * @brief One timed read fed through the assembler
     */
    [[nodiscard]] FrameBatch receive(Milliseconds timeout);

    /**
     * @brief receive() followed by decoding of every frame
     */
    [[nodiscard]] MessageBatch receiveMessages(Milliseconds timeout);

    /**
     * @brief Shut the connection down; safe to call repeatedly
     */
    void close() noexcept;

    [[nodiscard]] bool isConnected() const noexcept { return m_connected.load(); }
    [[nodiscard]] const std::string& peerAddress() const noexcept { return m_peerAddress; }
    [[nodiscard]] uint16_t peerPort() const noexcept { return m_peerPort; }

    /**
     * @brief "address:port" of the peer
     */
    [[nodiscard]] std::string peerName() const;

    [[nodiscard]] Statistics statistics() const;

private:
    Socket m_socket;
    std::string m_peerAddress;
    uint16_t m_peerPort;

    std::atomic<bool> m_connected{true};

    std::mutex m_sendMutex;

    // Reader-side state
    std::mutex m_receiveMutex;
    Protocol::StreamAssembler m_assembler;
    ByteBuffer m_readBuffer;

    // Copy of the assembler counters, readable while a receive blocks
    mutable std::mutex m_statsMutex;
    Protocol::StreamAssembler::Statistics m_assemblerStats;

    std::atomic<uint64_t> m_bytesSent{0};
    std::atomic<uint64_t> m_bytesReceived{0};
    std::atomic<uint64_t> m_framesSent{0};
    std::atomic<uint64_t> m_framesReceived{0};
    std::atomic<uint64_t> m_decodeErrors{0};
};

} // namespace Lectern::Network

#endif // LECTERN_CORE_ENDPOINT_HPP
