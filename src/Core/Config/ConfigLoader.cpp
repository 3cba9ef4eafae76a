/**
 * @file ConfigLoader.cpp
 * @brief Implementation of key/value configuration loading
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <Lectern/Core/Config.hpp>
#include <Lectern/Core/Logger.hpp>

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <stdlib.h>
#include <cerrno>
#include <cstdlib>

#include <sstream>

namespace Lectern::Config {

namespace {

std::string trim(const std::string& text, const char* whitespace = " \t\r\n") {
    const size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return {};
    }
    const size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

ConfigValue inferValue(const std::string& raw) {
    if (raw == "true" || raw == "TRUE" || raw == "True") {
        return true;
    }
    if (raw == "false" || raw == "FALSE" || raw == "False") {
        return false;
    }

    if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
        return raw.substr(1, raw.size() - 2);
    }

    if (!raw.empty()) {
        errno = 0;
        char* end = nullptr;
        long long integer = std::strtoll(raw.c_str(), &end, 10);
        if (errno == 0 && end && *end == '\0') {
            return static_cast<int64_t>(integer);
        }

        errno = 0;
        end = nullptr;
        double real = std::strtod(raw.c_str(), &end);
        if (errno == 0 && end && *end == '\0' && raw.find('.') != std::string::npos) {
            return real;
        }
    }

    return raw;
}

} // namespace

class ConfigLoader::Impl {
public:
    Options options;

    explicit Impl(const Options& opts) : options(opts) {}

    Result<std::string> canonicalizePath(const std::string& path) {
        char* resolved = realpath(path.c_str(), nullptr);
        if (!resolved) {
            return errno == ENOENT ? ErrorCode::ConfigFileNotFound : ErrorCode::InvalidPath;
        }
        std::string result(resolved);
        free(resolved);
        return result;
    }

    Result<bool> isPathAllowed(const std::string& canonicalPath) {
        if (options.allowed_directory.empty()) {
            return true;
        }

        auto allowedResult = canonicalizePath(options.allowed_directory);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }

        std::string allowed = allowedResult.value();
        if (!allowed.empty() && allowed.back() != '/') {
            allowed.push_back('/');
        }

        if (canonicalPath.length() < allowed.length()) {
            return false;
        }

        return canonicalPath.compare(0, allowed.length(), allowed) == 0;
    }

    Result<std::string> readFile(const std::string& path) {
        auto canonResult = canonicalizePath(path);
        if (canonResult.isFailure()) {
            return canonResult.error();
        }
        const std::string& canonPath = canonResult.value();

        auto allowedResult = isPathAllowed(canonPath);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }
        if (!allowedResult.value()) {
            return ErrorCode::AccessDenied;
        }

        int fd = open(canonPath.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
        if (fd < 0) {
            return ErrorCode::ConfigFileNotFound;
        }

        // Size is checked on the open descriptor, not the path
        struct stat st;
        if (fstat(fd, &st) < 0) {
            close(fd);
            return ErrorCode::IOError;
        }

        if (!S_ISREG(st.st_mode)) {
            close(fd);
            return ErrorCode::InvalidPath;
        }

        if (static_cast<size_t>(st.st_size) > options.max_file_size) {
            close(fd);
            return ErrorCode::FileTooLarge;
        }

        std::string data(static_cast<size_t>(st.st_size), '\0');
        size_t total = 0;
        while (total < data.size()) {
            ssize_t bytesRead = read(fd, data.data() + total, data.size() - total);
            if (bytesRead < 0 && errno == EINTR) {
                continue;
            }
            if (bytesRead <= 0) {
                break;
            }
            total += static_cast<size_t>(bytesRead);
        }
        close(fd);

        if (total != data.size()) {
            return ErrorCode::FileReadError;
        }

        return data;
    }

    Result<ConfigMap> parseConfig(std::string_view text) {
        ConfigMap config;

        std::istringstream stream{std::string(text)};
        std::string line;
        size_t lineNumber = 0;

        while (std::getline(stream, line)) {
            ++lineNumber;
            std::string trimmed = trim(line);

            if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
                continue;
            }

            size_t pos = trimmed.find('=');
            if (pos == std::string::npos) {
                if (options.strict) {
                    LECTERN_LOG_ERROR_F("Config line %zu has no '=' separator", lineNumber);
                    return ErrorCode::ConfigParseFailed;
                }
                continue;
            }

            std::string key = trim(trimmed.substr(0, pos));
            std::string value = trim(trimmed.substr(pos + 1));

            if (key.empty()) {
                if (options.strict) {
                    return ErrorCode::ConfigParseFailed;
                }
                continue;
            }

            config[key] = inferValue(value);
        }

        return config;
    }
};

ConfigLoader::ConfigLoader()
    : ConfigLoader(Options{}) {}

ConfigLoader::ConfigLoader(const Options& options)
    : m_impl(std::make_unique<Impl>(options)) {}

ConfigLoader::~ConfigLoader() = default;

Result<ConfigMap> ConfigLoader::load(const std::string& path) {
    auto dataResult = m_impl->readFile(path);
    if (dataResult.isFailure()) {
        LECTERN_LOG_ERROR_F("Failed to read config %s: %s", path.c_str(),
                            getErrorMessage(dataResult.error()).data());
        return dataResult.error();
    }

    return loadFromMemory(dataResult.value());
}

Result<ConfigMap> ConfigLoader::loadFromMemory(std::string_view text) {
    if (text.size() > m_impl->options.max_file_size) {
        return ErrorCode::FileTooLarge;
    }
    return m_impl->parseConfig(text);
}

// ============================================================================
// Typed lookups
// ============================================================================

std::optional<std::string> getString(const ConfigMap& map, const std::string& key) {
    auto it = map.find(key);
    if (it == map.end()) {
        return std::nullopt;
    }
    if (const auto* text = std::get_if<std::string>(&it->second)) {
        return *text;
    }
    return std::nullopt;
}

std::optional<int64_t> getInt(const ConfigMap& map, const std::string& key) {
    auto it = map.find(key);
    if (it == map.end()) {
        return std::nullopt;
    }
    if (const auto* number = std::get_if<int64_t>(&it->second)) {
        return *number;
    }
    return std::nullopt;
}

std::optional<bool> getBool(const ConfigMap& map, const std::string& key) {
    auto it = map.find(key);
    if (it == map.end()) {
        return std::nullopt;
    }
    if (const auto* flag = std::get_if<bool>(&it->second)) {
        return *flag;
    }
    return std::nullopt;
}

} // namespace Lectern::Config
