/**
 * @file NetworkConfig.cpp
 * @brief Mapping of loaded configuration keys onto transport settings
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <Lectern/Core/NetworkConfig.hpp>
#include <Lectern/Core/Logger.hpp>

#include <arpa/inet.h>

namespace Lectern::Config {

namespace {

bool isIPv4(const std::string& address) {
    in_addr parsed{};
    return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

VoidResult readPort(const ConfigMap& map, const std::string& key, uint16_t& out) {
    if (auto value = getInt(map, key)) {
        if (*value <= 0 || *value > 65535) {
            LECTERN_LOG_ERROR_F("%s out of range: %lld", key.c_str(), static_cast<long long>(*value));
            return ErrorCode::ConfigInvalid;
        }
        out = static_cast<uint16_t>(*value);
    } else if (map.count(key)) {
        return ErrorCode::ConfigInvalid;
    }
    return VoidResult::Success();
}

VoidResult readPositiveMs(const ConfigMap& map, const std::string& key, Milliseconds& out) {
    if (auto value = getInt(map, key)) {
        if (*value <= 0) {
            LECTERN_LOG_ERROR_F("%s must be positive", key.c_str());
            return ErrorCode::ConfigInvalid;
        }
        out = Milliseconds(*value);
    } else if (map.count(key)) {
        return ErrorCode::ConfigInvalid;
    }
    return VoidResult::Success();
}

VoidResult readRange(const ConfigMap& map, const std::string& key,
                     int64_t low, int64_t high, int64_t& out) {
    if (auto value = getInt(map, key)) {
        if (*value < low || *value > high) {
            LECTERN_LOG_ERROR_F("%s must be within [%lld, %lld]", key.c_str(),
                                static_cast<long long>(low), static_cast<long long>(high));
            return ErrorCode::ConfigInvalid;
        }
        out = *value;
    } else if (map.count(key)) {
        return ErrorCode::ConfigInvalid;
    }
    return VoidResult::Success();
}

VoidResult readAddress(const ConfigMap& map, const std::string& key, std::string& out) {
    if (auto value = getString(map, key)) {
        if (!isIPv4(*value)) {
            LECTERN_LOG_ERROR_F("%s is not an IPv4 address: %s", key.c_str(), value->c_str());
            return ErrorCode::ConfigInvalid;
        }
        out = *value;
    } else if (map.count(key)) {
        return ErrorCode::ConfigInvalid;
    }
    return VoidResult::Success();
}

} // namespace

Result<PresenceConfig> makePresenceConfig(const ConfigMap& map) {
    PresenceConfig config;

    LECTERN_TRY(readAddress(map, "presence.group", config.group));
    LECTERN_TRY(readAddress(map, "presence.broadcast", config.broadcastAddress));
    LECTERN_TRY(readPort(map, "presence.port", config.port));
    LECTERN_TRY(readPositiveMs(map, "presence.interval_ms", config.announceInterval));

    int64_t ttl = config.ttl;
    LECTERN_TRY(readRange(map, "presence.ttl", 1, 255, ttl));
    config.ttl = static_cast<int>(ttl);

    return config;
}

Result<FanoutConfig> makeFanoutConfig(const ConfigMap& map) {
    FanoutConfig config;

    LECTERN_TRY(readAddress(map, "fanout.group", config.group));
    LECTERN_TRY(readPort(map, "fanout.port", config.port));

    int64_t ttl = config.ttl;
    LECTERN_TRY(readRange(map, "fanout.ttl", 1, 255, ttl));
    config.ttl = static_cast<int>(ttl);

    int64_t bufferSize = static_cast<int64_t>(config.bufferSize);
    LECTERN_TRY(readRange(map, "fanout.buffer_size", 512, 65536, bufferSize));
    config.bufferSize = static_cast<size_t>(bufferSize);

    int64_t socketBuffer = config.socketBufferSize;
    LECTERN_TRY(readRange(map, "fanout.socket_buffer_size", 4096, 64 * 1024 * 1024, socketBuffer));
    config.socketBufferSize = static_cast<int>(socketBuffer);

    int64_t level = config.compressionLevel;
    LECTERN_TRY(readRange(map, "fanout.compression_level", 0, 9, level));
    config.compressionLevel = static_cast<int>(level);

    return config;
}

Result<ServerConfig> makeServerConfig(const ConfigMap& map) {
    ServerConfig config;

    if (auto name = getString(map, "server.name")) {
        if (name->empty()) {
            return ErrorCode::ConfigInvalid;
        }
        config.presenterName = *name;
    }

    int64_t channel = config.channel;
    LECTERN_TRY(readRange(map, "server.channel", 1, 9999, channel));
    config.channel = static_cast<int>(channel);

    LECTERN_TRY(readAddress(map, "server.bind_address", config.bindAddress));
    LECTERN_TRY(readPort(map, "server.port", config.port));

    int64_t backlog = config.backlog;
    LECTERN_TRY(readRange(map, "server.backlog", 1, 4096, backlog));
    config.backlog = static_cast<int>(backlog);

    int64_t maxParticipants = static_cast<int64_t>(config.maxParticipants);
    LECTERN_TRY(readRange(map, "server.max_participants", 1, 10000, maxParticipants));
    config.maxParticipants = static_cast<size_t>(maxParticipants);

    LECTERN_TRY(readPositiveMs(map, "server.heartbeat_timeout_ms", config.heartbeatTimeout));
    LECTERN_TRY(readPositiveMs(map, "server.sweep_interval_ms", config.sweepInterval));
    LECTERN_TRY(readPositiveMs(map, "server.registration_timeout_ms", config.registrationTimeout));

    if (auto announce = getBool(map, "server.announce_presence")) {
        config.announcePresence = *announce;
    }

    Result<PresenceConfig> presence = makePresenceConfig(map);
    if (presence.isFailure()) {
        return presence.error();
    }
    config.presence = presence.value();

    return config;
}

Result<ClientConfig> makeClientConfig(const ConfigMap& map) {
    ClientConfig config;

    if (auto name = getString(map, "client.name")) {
        if (name->empty()) {
            return ErrorCode::ConfigInvalid;
        }
        config.participantName = *name;
    }

    if (auto machineId = getString(map, "client.machine_id")) {
        config.machineId = *machineId;
    }

    LECTERN_TRY(readPositiveMs(map, "client.connect_timeout_ms", config.connectTimeout));
    LECTERN_TRY(readPositiveMs(map, "client.accept_timeout_ms", config.acceptTimeout));
    LECTERN_TRY(readPositiveMs(map, "client.heartbeat_interval_ms", config.heartbeatInterval));

    Result<PresenceConfig> presence = makePresenceConfig(map);
    if (presence.isFailure()) {
        return presence.error();
    }
    config.presence = presence.value();

    return config;
}

} // namespace Lectern::Config
