/**
 * @file NetworkConfig.hpp
 * @brief Typed configuration for presenter and participant transports
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * Every port, group address, interval and timeout used by the transport
 * lives in one of these structs. Defaults match the classroom wire
 * conventions (TCP 9999, presence 239.255.255.250:10000, media
 * 239.255.1.1:5005).
 */

#pragma once

#ifndef LECTERN_CORE_NETWORK_CONFIG_HPP
#define LECTERN_CORE_NETWORK_CONFIG_HPP

#include <Lectern/Core/Types.hpp>
#include <Lectern/Core/ErrorCodes.hpp>
#include <Lectern/Core/Config.hpp>
#include <string>

namespace Lectern::Config {

/// Default reliable session port
constexpr uint16_t DEFAULT_SESSION_PORT = 9999;

/// Default presence (discovery) port
constexpr uint16_t DEFAULT_PRESENCE_PORT = 10000;

/// Default media fan-out port
constexpr uint16_t DEFAULT_FANOUT_PORT = 5005;

/// Default participant capacity of one session
constexpr size_t DEFAULT_MAX_PARTICIPANTS = 50;

/// Default socket read size
constexpr size_t DEFAULT_RECEIVE_BUFFER = 65536;

/**
 * @brief Presence / discovery channel settings
 */
struct PresenceConfig {
    std::string group = "239.255.255.250";
    std::string broadcastAddress = "255.255.255.255";
    uint16_t port = DEFAULT_PRESENCE_PORT;
    int ttl = 2;

    /// Interval between presenter announcements
    Milliseconds announceInterval{5000};

    /// Read timeout so listeners observe shutdown promptly
    Milliseconds receiveTimeout{1000};

    size_t bufferSize = DEFAULT_RECEIVE_BUFFER;
};

/**
 * @brief Media fan-out (multicast streaming) settings
 */
struct FanoutConfig {
    std::string group = "239.255.1.1";
    uint16_t port = DEFAULT_FANOUT_PORT;
    int ttl = 32;

    /// Largest datagram the receiver reads
    size_t bufferSize = DEFAULT_RECEIVE_BUFFER;

    /// SO_SNDBUF / SO_RCVBUF
    int socketBufferSize = 1024 * 1024;

    Milliseconds receiveTimeout{1000};

    /// zlib level for datagram compression (fast)
    int compressionLevel = 1;
};

/**
 * @brief Presenter-side session server settings
 */
struct ServerConfig {
    std::string presenterName = "Presenter";
    int channel = 1;
    std::string bindAddress = "0.0.0.0";
    uint16_t port = DEFAULT_SESSION_PORT;
    int backlog = 50;
    size_t maxParticipants = DEFAULT_MAX_PARTICIPANTS;

    /// Participants silent for longer than this are evicted
    Milliseconds heartbeatTimeout{15000};

    /// Interval of the eviction sweep
    Milliseconds sweepInterval{3000};

    /// First frame on a new connection must be a registration within this
    Milliseconds registrationTimeout{10000};

    /// Per-read timeout of connection loops
    Milliseconds receiveTimeout{1000};

    size_t receiveBufferSize = DEFAULT_RECEIVE_BUFFER;

    /// Largest accepted frame payload
    size_t maxPayloadSize = 10 * 1024 * 1024;

    /// Announce presence on the discovery channel
    bool announcePresence = true;

    PresenceConfig presence;
};

/**
 * @brief Participant-side session client settings
 */
struct ClientConfig {
    std::string participantName = "Participant";

    /// Derived from the host when empty
    std::string machineId;

    Milliseconds connectTimeout{5000};

    /// Bounded wait for CONNECTION_ACCEPTED / CONNECTION_REJECTED
    Milliseconds acceptTimeout{5000};

    Milliseconds heartbeatInterval{3000};

    Milliseconds receiveTimeout{1000};

    size_t receiveBufferSize = DEFAULT_RECEIVE_BUFFER;

    size_t maxPayloadSize = 10 * 1024 * 1024;

    PresenceConfig presence;
};

/**
 * @brief Overlay `server.*` and `presence.*` keys on the defaults
 *
 * Recognised keys: server.name, server.channel, server.bind_address,
 * server.port, server.backlog, server.max_participants,
 * server.heartbeat_timeout_ms, server.sweep_interval_ms,
 * server.registration_timeout_ms, server.announce_presence and the
 * presence keys listed for makePresenceConfig().
 */
[[nodiscard]] Result<ServerConfig> makeServerConfig(const ConfigMap& map);

/**
 * @brief Overlay `client.*` and `presence.*` keys on the defaults
 *
 * Recognised keys: client.name, client.machine_id,
 * client.connect_timeout_ms, client.accept_timeout_ms,
 * client.heartbeat_interval_ms and the presence keys.
 */
[[nodiscard]] Result<ClientConfig> makeClientConfig(const ConfigMap& map);

/**
 * @brief Overlay `presence.*` keys: group, broadcast, port, ttl, interval_ms
 */
[[nodiscard]] Result<PresenceConfig> makePresenceConfig(const ConfigMap& map);

/**
 * @brief Overlay `fanout.*` keys: group, port, ttl, buffer_size,
 *        socket_buffer_size, compression_level
 */
[[nodiscard]] Result<FanoutConfig> makeFanoutConfig(const ConfigMap& map);

} // namespace Lectern::Config

#endif // LECTERN_CORE_NETWORK_CONFIG_HPP
