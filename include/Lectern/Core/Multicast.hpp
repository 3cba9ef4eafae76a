/**
 * @file Multicast.hpp
 * @brief Fan-out streaming over UDP multicast
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * One datagram sent to the group reaches every joined participant, so the
 * presenter's cost of streaming screen frames does not grow with the class
 * size. Delivery is best effort: there is no acknowledgment and no retry.
 *
 * Payloads may be tagged with a 4-byte big-endian sequence number
 * (SequencedFrameSender); receivers discard anything not newer than the
 * last frame they accepted (SequencedFrameFilter).
 */

#pragma once

#ifndef LECTERN_CORE_MULTICAST_HPP
#define LECTERN_CORE_MULTICAST_HPP

#include <Lectern/Core/Types.hpp>
#include <Lectern/Core/ErrorCodes.hpp>
#include <Lectern/Core/NetworkConfig.hpp>
#include <Lectern/Core/Socket.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace Lectern::Network {

/// Size of the sequence prefix on fan-out payloads
constexpr size_t SEQUENCE_PREFIX_SIZE = 4;

// ============================================================================
// Sender
// ============================================================================

/**
 * @brief Writes datagrams to the fan-out group
 *
 * send() is thread-safe.
 */
class MulticastSender {
public:
    struct Statistics {
        uint64_t packetsSent = 0;
        uint64_t bytesSent = 0;
        uint64_t errors = 0;
    };

    explicit MulticastSender(const Config::FanoutConfig& config = {});
    ~MulticastSender();

    MulticastSender(const MulticastSender&) = delete;
    MulticastSender& operator=(const MulticastSender&) = delete;

    /**
     * @brief Create the socket and apply TTL, loopback and buffer options
     */
    VoidResult open();

    /**
     * @brief Send one datagram
     * @param payload Bytes to deliver
     * @param compress DEFLATE the payload at the configured level first
     */
    VoidResult send(ByteSpan payload, bool compress = true);

    void close() noexcept;

    [[nodiscard]] bool isOpen() const noexcept;
    [[nodiscard]] Statistics statistics() const noexcept;
    [[nodiscard]] const Config::FanoutConfig& config() const noexcept { return m_config; }

private:
    Config::FanoutConfig m_config;

    mutable std::mutex m_mutex;
    Socket m_socket;

    std::atomic<uint64_t> m_packetsSent{0};
    std::atomic<uint64_t> m_bytesSent{0};
    std::atomic<uint64_t> m_errors{0};
};

// ============================================================================
// Receiver
// ============================================================================

/**
 * @brief Joins the fan-out group and delivers every datagram
 *
 * Datagrams are inflated when they hold a valid zlib stream and delivered
 * unchanged otherwise. The callback runs on the receiver thread.
 */
class MulticastReceiver {
public:
    using DataCallback = std::function<void(ByteSpan payload)>;

    struct Statistics {
        uint64_t packetsReceived = 0;
        uint64_t bytesReceived = 0;
        uint64_t errors = 0;
    };

    MulticastReceiver(const Config::FanoutConfig& config, DataCallback onData);
    ~MulticastReceiver();

    MulticastReceiver(const MulticastReceiver&) = delete;
    MulticastReceiver& operator=(const MulticastReceiver&) = delete;

    /**
     * @brief Bind, join the group and start the receive thread
     * @return InvalidState if already running, BindFailed or
     *         MulticastJoinFailed when the socket cannot be set up
     */
    VoidResult start();

    /**
     * @brief Stop the thread and leave the group; safe to call repeatedly
     */
    void stop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] Statistics statistics() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Sequencing
// ============================================================================

/**
 * @brief Prefixes each payload with an increasing sequence number
 */
class SequencedFrameSender {
public:
    /**
     * @param sender Open sender; must outlive this object
     * @param firstSequence Number given to the first frame
     */
    explicit SequencedFrameSender(MulticastSender& sender, uint32_t firstSequence = 0);

    /**
     * @brief Send payload tagged with the next sequence number
     *
     * The number advances even when the send fails so that receivers never
     * see a reused value.
     */
    VoidResult send(ByteSpan payload, bool compress = true);

    /**
     * @brief Number the next frame will carry
     */
    [[nodiscard]] uint32_t nextSequence() const noexcept { return m_next.load(); }

private:
    MulticastSender& m_sender;
    std::atomic<uint32_t> m_next;
};

/**
 * @brief A fan-out payload with its sequence number removed
 */
struct SequencedFrame {
    uint32_t sequence = 0;
    ByteBuffer payload;
};

/**
 * @brief Drops duplicate and out-of-order frames
 *
 * Not thread-safe; feed it from the receiver callback.
 */
class SequencedFrameFilter {
public:
    /**
     * @brief Split and check one payload
     * @return The frame when its sequence is newer than the last accepted
     *         one (any sequence is accepted first), std::nullopt otherwise
     */
    [[nodiscard]] std::optional<SequencedFrame> accept(ByteSpan datagram);

    /**
     * @brief Forget the last accepted sequence
     */
    void reset() noexcept { m_last.reset(); }

    [[nodiscard]] std::optional<uint32_t> lastSequence() const noexcept { return m_last; }
    [[nodiscard]] uint64_t acceptedCount() const noexcept { return m_accepted; }
    [[nodiscard]] uint64_t droppedCount() const noexcept { return m_dropped; }

private:
    std::optional<uint32_t> m_last;
    uint64_t m_accepted = 0;
    uint64_t m_dropped = 0;
};

/**
 * @brief Prefix a payload with a big-endian sequence number
 */
[[nodiscard]] ByteBuffer prependSequence(uint32_t sequence, ByteSpan payload);

} // namespace Lectern::Network

#endif // LECTERN_CORE_MULTICAST_HPP
