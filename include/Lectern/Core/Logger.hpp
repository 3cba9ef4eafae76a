/**
 * @file Logger.hpp
 * @brief Logging infrastructure for Lectern diagnostics
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * Thread-safe logging system with multiple severity levels, file rotation
 * and an optional user callback, backed by spdlog.
 */

#pragma once

#ifndef LECTERN_CORE_LOGGER_HPP
#define LECTERN_CORE_LOGGER_HPP

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <mutex>
#include <memory>
#include <chrono>
#include <functional>

namespace spdlog {
class logger;
}

namespace Lectern {
namespace Core {

/**
 * @brief Log severity levels
 */
enum class LogLevel : uint8_t {
    Trace = 0,      ///< Verbose tracing (per-frame events)
    Debug = 1,      ///< Debug information for development
    Info = 2,       ///< Connection lifecycle and session events
    Warning = 3,    ///< Recoverable anomalies (resync, version mismatch)
    Error = 4,      ///< Failed operations
    Critical = 5,   ///< Startup failures
    Off = 255       ///< Disable all logging
};

/**
 * @brief Log output targets
 */
enum class LogOutput : uint8_t {
    None = 0,
    Console = 1 << 0,   ///< Output to console/stdout
    File = 1 << 1,      ///< Output to rotating file
    Callback = 1 << 2,  ///< Call user-provided callback
    All = Console | File | Callback
};

inline LogOutput operator|(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline LogOutput operator&(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline bool hasFlag(LogOutput value, LogOutput flag) {
    return (static_cast<uint8_t>(value) & static_cast<uint8_t>(flag)) != 0;
}

/**
 * @brief Log callback function type
 * @param level Severity level of the message
 * @param message Formatted log message
 * @param timestamp Message timestamp
 */
using LogCallback = std::function<void(LogLevel level, std::string_view message,
                                       std::chrono::system_clock::time_point timestamp)>;

/**
 * @brief Thread-safe logging system for Lectern
 *
 * A process-wide singleton. Until Initialize() is called every message is
 * counted as dropped, so library code may log unconditionally.
 */
class Logger {
public:
    /**
     * @brief Get the global logger instance
     */
    static Logger& Instance();

    /**
     * @brief Initialize the logger
     * @param minLevel Minimum log level to record
     * @param outputs Output targets (console, file, callback)
     * @param logFilePath Path to log file (required if File output enabled)
     * @param maxFileSizeMB Maximum log file size in MB before rotation
     * @return true on success, false if already initialized or sinks fail
     */
    bool Initialize(LogLevel minLevel = LogLevel::Info,
                    LogOutput outputs = LogOutput::Console,
                    const std::string& logFilePath = "",
                    size_t maxFileSizeMB = 10);

    /**
     * @brief Shutdown the logger and flush all buffers
     */
    void Shutdown();

    void SetMinLevel(LogLevel level);

    LogLevel GetMinLevel() const;

    /**
     * @brief Set user callback for log messages
     *
     * Only delivered when the logger was initialized with LogOutput::Callback.
     */
    void SetCallback(LogCallback callback);

    /**
     * @brief Check if a log level is enabled
     */
    bool IsLevelEnabled(LogLevel level) const;

    /**
     * @brief Log a message at the specified level
     * @param level Severity level
     * @param message Message text
     * @param file Source file name (optional)
     * @param line Source line number (optional)
     */
    void Log(LogLevel level, std::string_view message,
             const char* file = nullptr, int line = 0);

    /**
     * @brief Log a printf-style formatted message
     */
    template<typename... Args>
    void LogFormat(LogLevel level, const char* format, Args&&... args) {
        if (!IsLevelEnabled(level)) {
            Log(level, std::string_view{});
            return;
        }

        char buffer[1024];
        int result = std::snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);

        if (result > 0 && static_cast<size_t>(result) < sizeof(buffer)) {
            Log(level, std::string_view(buffer, result));
        } else if (result > 0) {
            std::string largeBuffer(static_cast<size_t>(result) + 1, '\0');
            std::snprintf(largeBuffer.data(), largeBuffer.size(), format, std::forward<Args>(args)...);
            largeBuffer.resize(static_cast<size_t>(result));
            Log(level, largeBuffer);
        }
    }

    /**
     * @brief Flush all sinks
     */
    void Flush();

    /**
     * @brief Number of messages logged at each level
     */
    struct Statistics {
        size_t trace;
        size_t debug;
        size_t info;
        size_t warning;
        size_t error;
        size_t critical;
        size_t dropped;  ///< Messages dropped due to level filtering
    };

    Statistics GetStatistics() const;

    void ResetStatistics();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void DispatchCallback(LogLevel level, std::string_view message);

    // Configuration
    LogLevel minLevel_ = LogLevel::Info;
    LogOutput outputs_ = LogOutput::Console;
    std::string logFilePath_;
    size_t maxFileSizeBytes_ = 10 * 1024 * 1024;

    // State
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> spdlogger_;
    bool initialized_ = false;

    // Callback is guarded separately so the sink can call back without
    // re-entering mutex_.
    mutable std::mutex callbackMutex_;
    LogCallback callback_;

    // Statistics
    mutable std::mutex statsMutex_;
    Statistics stats_{};
};

} // namespace Core
} // namespace Lectern

// ============================================================================
// Convenience Macros
// ============================================================================

#ifndef LECTERN_DISABLE_LOGGING

#define LECTERN_LOG_TRACE(msg) \
    ::Lectern::Core::Logger::Instance().Log(::Lectern::Core::LogLevel::Trace, msg, __FILE__, __LINE__)

#define LECTERN_LOG_DEBUG(msg) \
    ::Lectern::Core::Logger::Instance().Log(::Lectern::Core::LogLevel::Debug, msg, __FILE__, __LINE__)

#define LECTERN_LOG_INFO(msg) \
    ::Lectern::Core::Logger::Instance().Log(::Lectern::Core::LogLevel::Info, msg, __FILE__, __LINE__)

#define LECTERN_LOG_WARNING(msg) \
    ::Lectern::Core::Logger::Instance().Log(::Lectern::Core::LogLevel::Warning, msg, __FILE__, __LINE__)

#define LECTERN_LOG_ERROR(msg) \
    ::Lectern::Core::Logger::Instance().Log(::Lectern::Core::LogLevel::Error, msg, __FILE__, __LINE__)

#define LECTERN_LOG_CRITICAL(msg) \
    ::Lectern::Core::Logger::Instance().Log(::Lectern::Core::LogLevel::Critical, msg, __FILE__, __LINE__)

#define LECTERN_LOG_TRACE_F(fmt, ...) \
    ::Lectern::Core::Logger::Instance().LogFormat(::Lectern::Core::LogLevel::Trace, fmt, __VA_ARGS__)

#define LECTERN_LOG_DEBUG_F(fmt, ...) \
    ::Lectern::Core::Logger::Instance().LogFormat(::Lectern::Core::LogLevel::Debug, fmt, __VA_ARGS__)

#define LECTERN_LOG_INFO_F(fmt, ...) \
    ::Lectern::Core::Logger::Instance().LogFormat(::Lectern::Core::LogLevel::Info, fmt, __VA_ARGS__)

#define LECTERN_LOG_WARNING_F(fmt, ...) \
    ::Lectern::Core::Logger::Instance().LogFormat(::Lectern::Core::LogLevel::Warning, fmt, __VA_ARGS__)

#define LECTERN_LOG_ERROR_F(fmt, ...) \
    ::Lectern::Core::Logger::Instance().LogFormat(::Lectern::Core::LogLevel::Error, fmt, __VA_ARGS__)

#define LECTERN_LOG_CRITICAL_F(fmt, ...) \
    ::Lectern::Core::Logger::Instance().LogFormat(::Lectern::Core::LogLevel::Critical, fmt, __VA_ARGS__)

#else
#define LECTERN_LOG_TRACE(msg) ((void)0)
#define LECTERN_LOG_DEBUG(msg) ((void)0)
#define LECTERN_LOG_INFO(msg) ((void)0)
#define LECTERN_LOG_WARNING(msg) ((void)0)
#define LECTERN_LOG_ERROR(msg) ((void)0)
#define LECTERN_LOG_CRITICAL(msg) ((void)0)
#define LECTERN_LOG_TRACE_F(fmt, ...) ((void)0)
#define LECTERN_LOG_DEBUG_F(fmt, ...) ((void)0)
#define LECTERN_LOG_INFO_F(fmt, ...) ((void)0)
#define LECTERN_LOG_WARNING_F(fmt, ...) ((void)0)
#define LECTERN_LOG_ERROR_F(fmt, ...) ((void)0)
#define LECTERN_LOG_CRITICAL_F(fmt, ...) ((void)0)
#endif // LECTERN_DISABLE_LOGGING

#endif // LECTERN_CORE_LOGGER_HPP
