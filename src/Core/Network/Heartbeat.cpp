/**
 * @file Heartbeat.cpp
 * @brief Participant heartbeat implementation
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <Lectern/Core/Heartbeat.hpp>
#include <Lectern/Core/Logger.hpp>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <system_error>
#include <thread>

namespace Lectern::Network {

// ============================================================================
// Heartbeat Implementation
// ============================================================================

class Heartbeat::Impl {
public:
    Impl(const HeartbeatConfig& config, SendFunction send)
        : m_config(config)
        , m_send(std::move(send))
        , m_running(false)
        , m_sequenceNumber(0)
        , m_successCount(0)
        , m_failureCount(0)
        , m_lastError(ErrorCode::Success)
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

        if (!m_send) {
            return ErrorCode::NullPointer;
        }

        // A joined-out loop may have left a finished thread behind
        if (m_thread.joinable()) {
            m_thread.join();
        }

        m_running = true;
        m_sequenceNumber = 0;

        try {
            m_thread = std::thread(&Impl::heartbeatLoop, this);
        } catch (const std::system_error&) {
            m_running = false;
            return ErrorCode::ThreadCreationFailed;
        }

        return VoidResult::Success();
    }

    void stop() noexcept {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_running = false;
        }

        m_cv.notify_one();

        if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
            m_thread.join();
        }
    }

    bool isRunning() const noexcept {
        return m_running.load();
    }

    HeartbeatStatus getStatus() const noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);

        HeartbeatStatus status;
        status.isRunning = m_running;
        status.successCount = m_successCount.load();
        status.failureCount = m_failureCount.load();
        status.sequenceNumber = m_sequenceNumber.load();
        status.lastSuccess = m_lastSuccess;
        status.lastFailure = m_lastFailure;
        status.lastError = m_lastError;

        return status;
    }

    VoidResult sendHeartbeat() {
        return sendHeartbeatInternal();
    }

    void setCallbacks(
        std::function<void(uint64_t sequence)> onSuccess,
        std::function<void(ErrorCode error, uint64_t sequence)> onFailure
    ) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_onSuccess = std::move(onSuccess);
        m_onFailure = std::move(onFailure);
    }

private:
    void heartbeatLoop() {
        while (true) {
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                if (m_cv.wait_for(lock, m_config.interval, [this] { return !m_running; })) {
                    break;
                }
            }

            VoidResult result = sendHeartbeatInternal();
            if (result.isFailure() && m_config.stopOnFailure) {
                LECTERN_LOG_DEBUG_F("Heartbeat stopped: %s", getErrorMessage(result.error()).data());
                m_running = false;
                break;
            }
        }
    }

    VoidResult sendHeartbeatInternal() {
        if (!m_send) {
            return ErrorCode::NullPointer;
        }

        uint64_t sequence = m_sequenceNumber.fetch_add(1);

        VoidResult result = m_send();

        std::function<void(uint64_t)> onSuccess;
        std::function<void(ErrorCode, uint64_t)> onFailure;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (result.isSuccess()) {
                m_successCount.fetch_add(1);
                m_lastSuccess = Clock::now();
                m_lastError = ErrorCode::Success;
                onSuccess = m_onSuccess;
            } else {
                m_failureCount.fetch_add(1);
                m_lastFailure = Clock::now();
                m_lastError = result.error();
                onFailure = m_onFailure;
            }
        }

        if (onSuccess) {
            onSuccess(sequence);
        }
        if (onFailure) {
            onFailure(result.error(), sequence);
        }

        return result;
    }

    HeartbeatConfig m_config;
    SendFunction m_send;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_thread;
    std::atomic<bool> m_running;

    std::atomic<uint64_t> m_sequenceNumber;
    std::atomic<uint64_t> m_successCount;
    std::atomic<uint64_t> m_failureCount;

    TimePoint m_lastSuccess;
    TimePoint m_lastFailure;
    ErrorCode m_lastError;

    std::function<void(uint64_t sequence)> m_onSuccess;
    std::function<void(ErrorCode error, uint64_t sequence)> m_onFailure;
};

// ============================================================================
// Heartbeat Public API
// ============================================================================

Heartbeat::Heartbeat(const HeartbeatConfig& config, SendFunction send)
    : m_impl(std::make_unique<Impl>(config, std::move(send)))
{
}

Heartbeat::~Heartbeat() = default;

Heartbeat::Heartbeat(Heartbeat&&) noexcept = default;
Heartbeat& Heartbeat::operator=(Heartbeat&&) noexcept = default;

VoidResult Heartbeat::start() {
    return m_impl->start();
}

void Heartbeat::stop() noexcept {
    m_impl->stop();
}

bool Heartbeat::isRunning() const noexcept {
    return m_impl->isRunning();
}

HeartbeatStatus Heartbeat::getStatus() const noexcept {
    return m_impl->getStatus();
}

VoidResult Heartbeat::sendHeartbeat() {
    return m_impl->sendHeartbeat();
}

void Heartbeat::setCallbacks(
    std::function<void(uint64_t sequence)> onSuccess,
    std::function<void(ErrorCode error, uint64_t sequence)> onFailure
) {
    m_impl->setCallbacks(std::move(onSuccess), std::move(onFailure));
}

} // namespace Lectern::Network
