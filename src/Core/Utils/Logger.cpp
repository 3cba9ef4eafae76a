/**
 * @file Logger.cpp
 * @brief Implementation of the logging infrastructure
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * Uses spdlog for console output, size-based file rotation and a callback
 * sink that forwards formatted records to the user callback.
 */

#include "Lectern/Core/Logger.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <filesystem>
#include <vector>

namespace Lectern {
namespace Core {

namespace {

spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warning:  return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
        default:                 return spdlog::level::info;
    }
}

LogLevel FromSpdlogLevel(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warning;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Critical;
        case spdlog::level::off:      return LogLevel::Off;
        default:                      return LogLevel::Info;
    }
}

/**
 * @brief spdlog sink forwarding each record to a std::function
 */
template<typename Mutex>
class ForwardingSink : public spdlog::sinks::base_sink<Mutex> {
public:
    using Handler = std::function<void(const spdlog::details::log_msg&)>;

    explicit ForwardingSink(Handler handler) : handler_(std::move(handler)) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        if (handler_) {
            handler_(msg);
        }
    }

    void flush_() override {}

private:
    Handler handler_;
};

using ForwardingSinkMt = ForwardingSink<std::mutex>;

constexpr size_t ROTATED_FILES = 3;

/**
 * @brief Sinks for the requested outputs; console when none applies
 */
std::vector<spdlog::sink_ptr> MakeSinks(LogOutput outputs,
                                        const std::string& filePath,
                                        size_t maxFileBytes,
                                        ForwardingSinkMt::Handler forward) {
    std::vector<spdlog::sink_ptr> sinks;

    if (hasFlag(outputs, LogOutput::File) && !filePath.empty()) {
        std::filesystem::path path(filePath);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            filePath, maxFileBytes, ROTATED_FILES));
    }

    if (hasFlag(outputs, LogOutput::Callback)) {
        sinks.push_back(std::make_shared<ForwardingSinkMt>(std::move(forward)));
    }

    if (hasFlag(outputs, LogOutput::Console) || sinks.empty()) {
        sinks.insert(sinks.begin(), std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    return sinks;
}

} // namespace

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

bool Logger::Initialize(LogLevel minLevel, LogOutput outputs,
                        const std::string& logFilePath, size_t maxFileSizeMB) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return false;
    }

    minLevel_ = minLevel;
    outputs_ = outputs;
    logFilePath_ = logFilePath;
    maxFileSizeBytes_ = maxFileSizeMB * 1024 * 1024;

    try {
        std::vector<spdlog::sink_ptr> sinks = MakeSinks(
            outputs_, logFilePath_, maxFileSizeBytes_,
            [this](const spdlog::details::log_msg& msg) {
                DispatchCallback(FromSpdlogLevel(msg.level),
                                 std::string_view(msg.payload.data(), msg.payload.size()));
            });
        for (auto& sink : sinks) {
            sink->set_level(ToSpdlogLevel(minLevel_));
        }

        spdlogger_ = std::make_shared<spdlog::logger>(
            "lectern",
            sinks.begin(),
            sinks.end()
        );

        // [timestamp] [level] [thread] message
        spdlogger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        spdlogger_->set_level(ToSpdlogLevel(minLevel_));
        spdlogger_->flush_on(spdlog::level::warn);

        initialized_ = true;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        spdlogger_.reset();
        return false;
    }
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return;
    }

    if (spdlogger_) {
        spdlogger_->flush();
        spdlogger_.reset();
    }

    initialized_ = false;
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;
    if (spdlogger_) {
        spdlogger_->set_level(ToSpdlogLevel(level));
        for (auto& sink : spdlogger_->sinks()) {
            sink->set_level(ToSpdlogLevel(level));
        }
    }
}

LogLevel Logger::GetMinLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return minLevel_;
}

void Logger::SetCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callback_ = std::move(callback);
}

bool Logger::IsLevelEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_ && level >= minLevel_ && level != LogLevel::Off;
}

void Logger::Log(LogLevel level, std::string_view message,
                 const char* file, int line) {
    if (!IsLevelEnabled(level)) {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.dropped++;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        switch (level) {
            case LogLevel::Trace:    stats_.trace++; break;
            case LogLevel::Debug:    stats_.debug++; break;
            case LogLevel::Info:     stats_.info++; break;
            case LogLevel::Warning:  stats_.warning++; break;
            case LogLevel::Error:    stats_.error++; break;
            case LogLevel::Critical: stats_.critical++; break;
            default: break;
        }
    }

    std::shared_ptr<spdlog::logger> target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = spdlogger_;
    }
    if (!target) {
        return;
    }

    std::string formattedMsg;
    if (file && line > 0) {
        // Strip the directory part of __FILE__
        const char* filename = file;
        for (const char* p = file; *p; ++p) {
            if (*p == '/' || *p == '\\') {
                filename = p + 1;
            }
        }
        formattedMsg = std::string("(") + filename + ":" + std::to_string(line) + ") " + std::string(message);
    } else {
        formattedMsg = std::string(message);
    }

    target->log(ToSpdlogLevel(level), formattedMsg);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (spdlogger_) {
        spdlogger_->flush();
    }
}

Logger::Statistics Logger::GetStatistics() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

void Logger::ResetStatistics() {
    std::lock_guard<std::mutex> lock(statsMutex_);
    stats_ = Statistics{};
}

void Logger::DispatchCallback(LogLevel level, std::string_view message) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    if (callback_) {
        callback_(level, message, std::chrono::system_clock::now());
    }
}

} // namespace Core
} // namespace Lectern
