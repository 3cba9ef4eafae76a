/**
 * @file Types.hpp
 * @brief Core type definitions for the Lectern classroom transport
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * This file contains fundamental type definitions, constants, and aliases
 * used throughout the Lectern codebase. All components should include
 * this header for consistent type usage.
 */

#pragma once

#ifndef LECTERN_CORE_TYPES_HPP
#define LECTERN_CORE_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <chrono>

namespace Lectern {

// ============================================================================
// Version Information
// ============================================================================

/// Major version number
constexpr uint32_t VERSION_MAJOR = 1;

/// Minor version number
constexpr uint32_t VERSION_MINOR = 0;

/// Patch version number
constexpr uint32_t VERSION_PATCH = 0;

/// Full version string
constexpr const char* VERSION_STRING = "1.0.0";

// ============================================================================
// Fundamental Type Aliases
// ============================================================================

/// Byte type for raw buffer operations
using Byte = uint8_t;

/// Span of bytes (non-owning view)
using ByteSpan = std::span<const Byte>;

/// Mutable span of bytes
using MutableByteSpan = std::span<Byte>;

/// Owning byte buffer
using ByteBuffer = std::vector<Byte>;

/// Native socket descriptor
using SocketHandle = int;

/// Value of a descriptor that owns nothing
constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

// ============================================================================
// Time Types
// ============================================================================

/// Monotonic clock for timeouts and liveness tracking
using Clock = std::chrono::steady_clock;

/// Time point type
using TimePoint = Clock::time_point;

/// Duration in milliseconds
using Milliseconds = std::chrono::milliseconds;

/// Duration in seconds
using Seconds = std::chrono::seconds;

// ============================================================================
// Helpers
// ============================================================================

/**
 * @brief View a string's bytes without copying
 */
inline ByteSpan asBytes(std::string_view text) noexcept {
    return ByteSpan(reinterpret_cast<const Byte*>(text.data()), text.size());
}

/**
 * @brief Copy a string into an owning byte buffer
 */
inline ByteBuffer toBuffer(std::string_view text) {
    return ByteBuffer(text.begin(), text.end());
}

} // namespace Lectern

#endif // LECTERN_CORE_TYPES_HPP
