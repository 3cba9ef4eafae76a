/**
 * @file ParticipantRegistry.hpp
 * @brief Live participants of one session
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * Maps participant identity to its record and its single live endpoint.
 * Every access goes through one mutex that is held only for map
 * operations. Removal is conditional on the endpoint, so a connection
 * loop that outlived a replacement or an eviction cannot remove the
 * record that now belongs to someone else.
 */

#pragma once

#ifndef LECTERN_CORE_PARTICIPANT_REGISTRY_HPP
#define LECTERN_CORE_PARTICIPANT_REGISTRY_HPP

#include <Lectern/Core/Types.hpp>
#include <Lectern/Core/ErrorCodes.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Lectern::Network {
class Endpoint;
}

namespace Lectern::Session {

/**
 * @brief Presenter-visible state of a participant
 */
enum class ParticipantStatus : uint8_t {
    Offline,
    Online,
    Busy,
    WatchingVideo,
    TakingExam,
    InGroup,
    ScreenLocked,
    HandRaised
};

/**
 * @brief Wire name of a status ("online", "screen_locked", ...)
 */
[[nodiscard]] const char* toString(ParticipantStatus status) noexcept;

[[nodiscard]] std::optional<ParticipantStatus> parseParticipantStatus(std::string_view name) noexcept;

/**
 * @brief Registered participant
 */
struct ParticipantInfo {
    /// machine_id + "_" + address
    std::string id;
    std::string name;
    std::string address;
    uint16_t port = 0;
    ParticipantStatus status = ParticipantStatus::Online;
    TimePoint connectedAt{};

    /// Last frame received from the participant
    TimePoint lastSeen{};
};

/**
 * @brief Identity of a participant as the server derives it
 */
[[nodiscard]] std::string makeParticipantId(const std::string& machineId, const std::string& address);

class ParticipantRegistry {
public:
    using EndpointPtr = std::shared_ptr<Network::Endpoint>;

    struct Entry {
        ParticipantInfo info;
        EndpointPtr endpoint;
    };

    /**
     * @param capacity Maximum number of distinct identities
     */
    explicit ParticipantRegistry(size_t capacity);

    ParticipantRegistry(const ParticipantRegistry&) = delete;
    ParticipantRegistry& operator=(const ParticipantRegistry&) = delete;

    /**
     * @brief Admit a participant, replacing any record with the same id
     *
     * The previous endpoint, if any, is closed before the new record is
     * stored, under the same lock acquisition.
     *
     * @return The replaced endpoint (nullptr when the id was new), or
     *         SessionFull when a new id would exceed the capacity
     */
    Result<EndpointPtr> admit(ParticipantInfo info, EndpointPtr endpoint);

    /**
     * @brief Refresh lastSeen of the record owned by endpoint
     * @return false when the record was removed or replaced
     */
    bool touch(const std::string& id, const EndpointPtr& endpoint);

    /**
     * @brief Remove the record if endpoint still owns it
     * @return The removed record, std::nullopt when ownership moved on
     */
    std::optional<ParticipantInfo> remove(const std::string& id, const EndpointPtr& endpoint);

    /**
     * @brief Remove every record silent for longer than timeout
     *
     * The removed entries still hold their endpoints; the caller closes
     * them outside the registry lock.
     */
    std::vector<Entry> removeStale(Milliseconds timeout, TimePoint now = Clock::now());

    /**
     * @brief Remove everything
     */
    std::vector<Entry> clear();

    bool setStatus(const std::string& id, ParticipantStatus status);

    [[nodiscard]] EndpointPtr endpoint(const std::string& id) const;
    [[nodiscard]] std::optional<ParticipantInfo> find(const std::string& id) const;

    /**
     * @brief Copy of every entry, safe to use without the lock
     */
    [[nodiscard]] std::vector<Entry> entries() const;
    [[nodiscard]] std::vector<ParticipantInfo> participants() const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const noexcept { return m_capacity; }
    [[nodiscard]] bool contains(const std::string& id) const;

private:
    size_t m_capacity;
    mutable std::mutex m_mutex;
    std::map<std::string, Entry> m_entries;
};

} // namespace Lectern::Session

#endif // LECTERN_CORE_PARTICIPANT_REGISTRY_HPP
