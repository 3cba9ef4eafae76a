/**
 * @file ParticipantRegistry.cpp
 * @brief Live participant registry implementation
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <Lectern/Core/ParticipantRegistry.hpp>
#include <Lectern/Core/Endpoint.hpp>
#include <Lectern/Core/Logger.hpp>

#include <array>
#include <utility>

namespace Lectern::Session {

namespace {

struct StatusName {
    ParticipantStatus status;
    const char* name;
};

constexpr std::array<StatusName, 8> STATUS_NAMES{{
    {ParticipantStatus::Offline, "offline"},
    {ParticipantStatus::Online, "online"},
    {ParticipantStatus::Busy, "busy"},
    {ParticipantStatus::WatchingVideo, "watching_video"},
    {ParticipantStatus::TakingExam, "taking_exam"},
    {ParticipantStatus::InGroup, "in_group"},
    {ParticipantStatus::ScreenLocked, "screen_locked"},
    {ParticipantStatus::HandRaised, "hand_raised"},
}};

} // anonymous namespace

const char* toString(ParticipantStatus status) noexcept {
    for (const auto& entry : STATUS_NAMES) {
        if (entry.status == status) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<ParticipantStatus> parseParticipantStatus(std::string_view name) noexcept {
    for (const auto& entry : STATUS_NAMES) {
        if (name == entry.name) {
            return entry.status;
        }
    }
    return std::nullopt;
}

std::string makeParticipantId(const std::string& machineId, const std::string& address) {
    return machineId + "_" + address;
}

ParticipantRegistry::ParticipantRegistry(size_t capacity)
    : m_capacity(capacity) {
}

Result<ParticipantRegistry::EndpointPtr> ParticipantRegistry::admit(ParticipantInfo info, EndpointPtr endpoint) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(info.id);
    if (it == m_entries.end()) {
        if (m_entries.size() >= m_capacity) {
            return ErrorCode::SessionFull;
        }

        std::string id = info.id;
        m_entries.emplace(std::move(id), Entry{std::move(info), std::move(endpoint)});
        return EndpointPtr{};
    }

    // Last connection wins; the old endpoint is closed before the new one
    // becomes visible
    EndpointPtr replaced = std::move(it->second.endpoint);
    if (replaced) {
        replaced->close();
    }

    LECTERN_LOG_INFO_F("Participant %s reconnected, previous connection closed", info.id.c_str());

    it->second = Entry{std::move(info), std::move(endpoint)};
    return replaced;
}

bool ParticipantRegistry::touch(const std::string& id, const EndpointPtr& endpoint) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(id);
    if (it == m_entries.end() || it->second.endpoint != endpoint) {
        return false;
    }

    it->second.info.lastSeen = Clock::now();
    return true;
}

std::optional<ParticipantInfo> ParticipantRegistry::remove(const std::string& id, const EndpointPtr& endpoint) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(id);
    if (it == m_entries.end() || it->second.endpoint != endpoint) {
        return std::nullopt;
    }

    ParticipantInfo info = std::move(it->second.info);
    m_entries.erase(it);
    return info;
}

std::vector<ParticipantRegistry::Entry> ParticipantRegistry::removeStale(Milliseconds timeout, TimePoint now) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<Entry> stale;
    for (auto it = m_entries.begin(); it != m_entries.end(); ) {
        if (now - it->second.info.lastSeen > timeout) {
            stale.push_back(std::move(it->second));
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }
    return stale;
}

std::vector<ParticipantRegistry::Entry> ParticipantRegistry::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<Entry> removed;
    removed.reserve(m_entries.size());
    for (auto& [id, entry] : m_entries) {
        removed.push_back(std::move(entry));
    }
    m_entries.clear();
    return removed;
}

bool ParticipantRegistry::setStatus(const std::string& id, ParticipantStatus status) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return false;
    }
    it->second.info.status = status;
    return true;
}

ParticipantRegistry::EndpointPtr ParticipantRegistry::endpoint(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(id);
    return it == m_entries.end() ? EndpointPtr{} : it->second.endpoint;
}

std::optional<ParticipantInfo> ParticipantRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

std::vector<ParticipantRegistry::Entry> ParticipantRegistry::entries() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<Entry> result;
    result.reserve(m_entries.size());
    for (const auto& [id, entry] : m_entries) {
        result.push_back(entry);
    }
    return result;
}

std::vector<ParticipantInfo> ParticipantRegistry::participants() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<ParticipantInfo> result;
    result.reserve(m_entries.size());
    for (const auto& [id, entry] : m_entries) {
        result.push_back(entry.info);
    }
    return result;
}

size_t ParticipantRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

bool ParticipantRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.find(id) != m_entries.end();
}

} // namespace Lectern::Session
