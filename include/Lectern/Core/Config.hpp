/**
 * @file Config.hpp
 * @brief Configuration file loading for Lectern
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * Reads simple `key = value` files into a typed map. Files are opened
 * once, size-checked on the open descriptor and optionally confined to
 * an allowed directory.
 */

#pragma once

#ifndef LECTERN_CORE_CONFIG_HPP
#define LECTERN_CORE_CONFIG_HPP

#include <Lectern/Core/Types.hpp>
#include <Lectern/Core/ErrorCodes.hpp>
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <variant>

namespace Lectern::Config {

using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string
>;

using ConfigMap = std::map<std::string, ConfigValue>;

/**
 * @brief Key/value configuration loader
 *
 * Syntax: one `key = value` per line, `#` or `;` starts a comment line,
 * surrounding whitespace is trimmed. Values are typed by inference:
 * `true`/`false` become bool, integers int64, decimals double, and
 * anything else (optionally double-quoted) a string.
 */
class ConfigLoader {
public:
    struct Options {
        size_t max_file_size = 1024 * 1024;  // 1MB default
        std::string allowed_directory;       // Restrict to directory
        bool strict = false;                 // Reject lines without '='
    };

    ConfigLoader();
    explicit ConfigLoader(const Options& options);
    ~ConfigLoader();

    ConfigLoader(const ConfigLoader&) = delete;
    ConfigLoader& operator=(const ConfigLoader&) = delete;

    /**
     * @brief Load configuration from file
     * @param path Path to configuration file
     * @return Parsed configuration or error
     */
    Result<ConfigMap> load(const std::string& path);

    /**
     * @brief Parse configuration text already in memory
     */
    Result<ConfigMap> loadFromMemory(std::string_view text);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Typed lookups
// ============================================================================

/// String value or nullopt if missing / not a string
[[nodiscard]] std::optional<std::string> getString(const ConfigMap& map, const std::string& key);

/// Integer value or nullopt if missing / not an integer
[[nodiscard]] std::optional<int64_t> getInt(const ConfigMap& map, const std::string& key);

/// Boolean value or nullopt if missing / not a bool
[[nodiscard]] std::optional<bool> getBool(const ConfigMap& map, const std::string& key);

} // namespace Lectern::Config

#endif // LECTERN_CORE_CONFIG_HPP
