/**
 * @file Heartbeat.hpp
 * @brief Periodic liveness pings from a participant
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * The session server evicts participants it has not heard from within its
 * heartbeat timeout. A connected client therefore sends a PING at a fixed
 * interval; the server answers with PONG, which the client discards.
 */

#pragma once

#ifndef LECTERN_CORE_HEARTBEAT_HPP
#define LECTERN_CORE_HEARTBEAT_HPP

#include <Lectern/Core/Types.hpp>
#include <Lectern/Core/ErrorCodes.hpp>
#include <functional>
#include <memory>

namespace Lectern::Network {

/**
 * @brief Heartbeat configuration
 */
struct HeartbeatConfig {
    /// Interval between pings (default: 3 seconds)
    Milliseconds interval{3000};

    /// Stop the loop after the first failed send
    bool stopOnFailure = true;
};

/**
 * @brief Heartbeat status information
 */
struct HeartbeatStatus {
    /// Whether heartbeat thread is running
    bool isRunning = false;

    /// Number of pings sent
    uint64_t successCount = 0;

    /// Number of failed send attempts
    uint64_t failureCount = 0;

    /// Sequence of the next ping; advances on every attempt
    uint64_t sequenceNumber = 0;

    TimePoint lastSuccess{};
    TimePoint lastFailure{};
    ErrorCode lastError = ErrorCode::Success;
};

/**
 * @brief Background ping sender
 *
 * The transport is injected as a send function so the same scheduler
 * drives any connection type.
 *
 * @example
 * ```cpp
 * Heartbeat heartbeat(config, [&endpoint] {
 *     return endpoint.sendMessage(Protocol::MessageType::Ping,
 *                                 Protocol::MessageBuilder::ping());
 * });
 * heartbeat.start();
 * ```
 */
class Heartbeat {
public:
    using SendFunction = std::function<VoidResult()>;

    /**
     * @param config Heartbeat configuration
     * @param send Sends one ping; called from the heartbeat thread
     */
    Heartbeat(const HeartbeatConfig& config, SendFunction send);

    /**
     * @brief Destructor - stops heartbeat thread if running
     */
    ~Heartbeat();

    // Non-copyable
    Heartbeat(const Heartbeat&) = delete;
    Heartbeat& operator=(const Heartbeat&) = delete;

    Heartbeat(Heartbeat&&) noexcept;
    Heartbeat& operator=(Heartbeat&&) noexcept;

    /**
     * @brief Start the heartbeat thread
     * @return InvalidState if already running, NullPointer without a send
     *         function
     *
     * The first ping is sent one interval after start.
     */
    VoidResult start();

    /**
     * @brief Stop the heartbeat thread and wait for it
     *
     * Safe to call multiple times.
     */
    void stop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

    [[nodiscard]] HeartbeatStatus getStatus() const noexcept;

    /**
     * @brief Send a single ping immediately
     */
    VoidResult sendHeartbeat();

    /**
     * @brief Set callbacks for heartbeat events
     *
     * Callbacks are invoked from the heartbeat thread.
     */
    void setCallbacks(
        std::function<void(uint64_t sequence)> onSuccess,
        std::function<void(ErrorCode error, uint64_t sequence)> onFailure
    );

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Lectern::Network

#endif // LECTERN_CORE_HEARTBEAT_HPP
