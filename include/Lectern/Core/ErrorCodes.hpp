/**
 * @file ErrorCodes.hpp
 * @brief Error codes and result types for the Lectern transport
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * Every transport, protocol and session failure is reported as an
 * ErrorCode, usually wrapped in a Result. Nothing in the public API
 * throws across a module boundary.
 */

#pragma once

#ifndef LECTERN_CORE_ERROR_CODES_HPP
#define LECTERN_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Lectern {

// ============================================================================
// Error Category Enumeration
// ============================================================================

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory : uint8_t {
    None        = 0x00,  ///< No error
    System      = 0x01,  ///< Operating system errors
    Crypto      = 0x03,  ///< Hashing / encoding helpers
    Network     = 0x04,  ///< Socket and connection errors
    Protocol    = 0x05,  ///< Wire framing errors
    Session     = 0x06,  ///< Registration and registry errors
    Config      = 0x08,  ///< Configuration errors
    IO          = 0x09,  ///< File I/O errors
    Parse       = 0x0A,  ///< Parsing errors
    Internal    = 0xFF   ///< Internal/unknown errors
};

// ============================================================================
// Error Code Enumeration
// ============================================================================

/**
 * @brief Error codes for all Lectern operations
 *
 * Error codes are structured as:
 * - 0x0000: Success
 * - 0x0100-0x01FF: System errors
 * - 0x0300-0x03FF: Crypto errors
 * - 0x0400-0x04FF: Network errors
 * - 0x0500-0x05FF: Protocol errors
 * - 0x0600-0x06FF: Session errors
 * - 0x0800-0x08FF: Config errors
 * - 0x0900-0x09FF: I/O errors
 * - 0x0A00-0x0AFF: Parse errors
 * - 0xFF00-0xFFFF: Internal errors
 */
enum class ErrorCode : uint16_t {
    // ========================================================================
    // Success (0x0000)
    // ========================================================================

    /// Operation completed successfully
    Success = 0x0000,

    // ========================================================================
    // System Errors (0x0100-0x01FF)
    // ========================================================================

    /// Generic system error
    SystemError = 0x0100,

    /// Failed to allocate memory
    AllocationFailed = 0x0102,

    /// Thread creation failed
    ThreadCreationFailed = 0x0103,

    /// Operation timed out
    Timeout = 0x0105,



    /// Invalid handle
    InvalidHandle = 0x0108,

    // ========================================================================
    // Cryptographic Errors (0x0300-0x03FF)
    // ========================================================================

    /// Generic cryptographic error
    CryptoError = 0x0300,

    /// Hash computation failed
    HashFailed = 0x0303,

    /// Random number generation failed
    RandomGenerationFailed = 0x0307,

    // ========================================================================
    // Network Errors (0x0400-0x04FF)
    // ========================================================================

    /// Generic network error
    NetworkError = 0x0400,

    /// Failed to connect to the remote endpoint
    ConnectionFailed = 0x0401,


    /// Peer closed the connection in an orderly way
    ConnectionClosed = 0x0403,

    /// Operation requires a live connection
    NotConnected = 0x0404,

    /// Could not bind the requested address/port
    BindFailed = 0x0405,

    /// Could not start listening
    ListenFailed = 0x0406,

    /// Socket option could not be applied
    SocketOptionFailed = 0x0407,

    /// Socket creation failed
    SocketCreateFailed = 0x0408,

    /// Write to the socket failed
    SendFailed = 0x0409,

    /// Read from the socket failed
    ReceiveFailed = 0x040A,

    /// Network unreachable
    NetworkUnreachable = 0x040B,

    /// Address string could not be parsed
    AddressInvalid = 0x040C,

    /// Joining a multicast group failed
    MulticastJoinFailed = 0x040D,

    /// Accept on the listening socket failed
    AcceptFailed = 0x040E,

    // ========================================================================
    // Protocol Errors (0x0500-0x05FF)
    // ========================================================================

    /// Generic protocol error
    ProtocolError = 0x0500,

    /// Input shorter than a frame header
    FrameTooShort = 0x0501,

    /// Magic constant mismatch
    InvalidMagic = 0x0502,

    /// Declared payload longer than the bytes available
    FrameTruncated = 0x0503,

    /// Declared or produced payload above the protocol ceiling
    FrameTooLarge = 0x0504,

    /// DEFLATE compression failed
    CompressionFailed = 0x0505,

    /// DEFLATE decompression failed
    DecompressionFailed = 0x0506,

    /// Message could not be serialized
    EncodeFailed = 0x0507,

    /// Message envelope is missing its type
    InvalidMessage = 0x0508,

    // ========================================================================
    // Session Errors (0x0600-0x06FF)
    // ========================================================================

    /// Generic session error
    SessionError = 0x0600,

    /// Registration handshake failed
    HandshakeFailed = 0x0601,

    /// Presenter refused the registration
    RegistrationRejected = 0x0602,

    /// No registration arrived in time
    RegistrationTimeout = 0x0603,

    /// No participant with that identity
    ParticipantNotFound = 0x0604,

    /// Participant limit reached
    SessionFull = 0x0605,

    /// Already connected to a presenter
    AlreadyConnected = 0x0606,

    // ========================================================================
    // Configuration Errors (0x0800-0x08FF)
    // ========================================================================

    /// Generic configuration error
    ConfigError = 0x0800,


    /// Invalid configuration value
    ConfigInvalid = 0x0802,

    /// Configuration file not found
    ConfigFileNotFound = 0x0803,

    /// Configuration parse error
    ConfigParseFailed = 0x0804,

    // ========================================================================
    // I/O Errors (0x0900-0x09FF)
    // ========================================================================

    /// Generic I/O error
    IOError = 0x0900,


    /// File read error
    FileReadError = 0x0906,

    /// File too large
    FileTooLarge = 0x0909,

    /// Invalid file path
    InvalidPath = 0x090A,

    /// Access denied
    AccessDenied = 0x090B,

    // ========================================================================
    // Parse Errors (0x0A00-0x0AFF)
    // ========================================================================

    /// Generic parse error
    ParseError = 0x0A00,

    /// JSON parse error
    JsonParseFailed = 0x0A01,


    /// Missing required field
    MissingField = 0x0A03,

    /// Invalid field type
    InvalidFieldType = 0x0A04,


    /// Invalid base64 string
    InvalidBase64 = 0x0A06,

    // ========================================================================
    // Internal Errors (0xFF00-0xFFFF)
    // ========================================================================

    /// Unknown internal error
    InternalError = 0xFF00,


    /// Invalid state
    InvalidState = 0xFF03,

    /// Null pointer
    NullPointer = 0xFF04,

    /// Invalid argument
    InvalidArgument = 0xFF05
};

// ============================================================================
// Error Code Utilities
// ============================================================================

/**
 * @brief Get the category of an error code
 * @param code The error code
 * @return The error category
 */
[[nodiscard]] constexpr ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    uint16_t value = static_cast<uint16_t>(code);
    if (value == 0) return ErrorCategory::None;
    uint8_t category = static_cast<uint8_t>((value >> 8) & 0xFF);
    return static_cast<ErrorCategory>(category);
}

/**
 * @brief Check if an error code represents success
 */
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::Success;
}

/**
 * @brief Check if an error code represents failure
 */
[[nodiscard]] constexpr bool isFailure(ErrorCode code) noexcept {
    return code != ErrorCode::Success;
}

/**
 * @brief Get human-readable error message
 * @param code The error code
 * @return Error message string
 */
[[nodiscard]] std::string_view getErrorMessage(ErrorCode code) noexcept;

/**
 * @brief Get error category name
 * @param category The error category
 * @return Category name string
 */
[[nodiscard]] std::string_view getCategoryName(ErrorCategory category) noexcept;

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an ErrorCode.
 *
 * @tparam T The success value type
 *
 * @example
 * ```cpp
 * auto frame = Protocol::pack("PING", {});
 * if (frame.isFailure()) {
 *     LECTERN_LOG_ERROR_F("pack failed: %s",
 *                         getErrorMessage(frame.error()).data());
 * }
 * ```
 */
template<typename T>
class Result {
public:
    /// Default constructor creates a failed result
    Result() : m_data(ErrorCode::InternalError) {}

    /// Construct from success value
    Result(const T& value) : m_data(value) {}

    /// Construct from success value (move)
    Result(T&& value) : m_data(std::move(value)) {}

    /// Construct from error code
    Result(ErrorCode error) : m_data(error) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    [[nodiscard]] static Result Success(T value) {
        return Result(std::move(value));
    }

    [[nodiscard]] static Result Error(ErrorCode code) {
        return Result(code);
    }

    /// Check if result is success
    [[nodiscard]] bool isSuccess() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    /// Check if result is failure
    [[nodiscard]] bool isFailure() const noexcept {
        return std::holds_alternative<ErrorCode>(m_data);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    /// Get the success value (throws if failure)
    [[nodiscard]] T& value() & {
        if (isFailure()) {
            throw std::logic_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (const, throws if failure)
    [[nodiscard]] const T& value() const & {
        if (isFailure()) {
            throw std::logic_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (rvalue, throws if failure)
    [[nodiscard]] T&& value() && {
        if (isFailure()) {
            throw std::logic_error("Attempted to access value of failed Result");
        }
        return std::get<T>(std::move(m_data));
    }

    /// Get the error code (throws if success)
    [[nodiscard]] ErrorCode error() const {
        if (isSuccess()) {
            throw std::logic_error("Attempted to access error of successful Result");
        }
        return std::get<ErrorCode>(m_data);
    }

    /// Get value or default if failure
    [[nodiscard]] T valueOr(const T& defaultValue) const & {
        return isSuccess() ? std::get<T>(m_data) : defaultValue;
    }

    /// Get value or default if failure (move)
    [[nodiscard]] T valueOr(T&& defaultValue) && {
        return isSuccess() ? std::get<T>(std::move(m_data)) : std::move(defaultValue);
    }

    /// Get error or Success if no error
    [[nodiscard]] ErrorCode errorOr(ErrorCode defaultError = ErrorCode::Success) const noexcept {
        return isFailure() ? std::get<ErrorCode>(m_data) : defaultError;
    }

    /// Transform success value using a function
    template<typename F>
    [[nodiscard]] auto map(F&& func) const -> Result<decltype(func(std::declval<T>()))> {
        using U = decltype(func(std::declval<T>()));
        if (isSuccess()) {
            return Result<U>(func(std::get<T>(m_data)));
        }
        return Result<U>(std::get<ErrorCode>(m_data));
    }

private:
    std::variant<T, ErrorCode> m_data;
};

/**
 * @brief Specialization of Result for void (no return value)
 */
template<>
class Result<void> {
public:
    /// Construct success result
    Result() : m_error(ErrorCode::Success) {}

    /// Construct from error code
    Result(ErrorCode error) : m_error(error) {}

    [[nodiscard]] static Result Success() {
        return Result();
    }

    [[nodiscard]] static Result Error(ErrorCode code) {
        return Result(code);
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return m_error == ErrorCode::Success;
    }

    [[nodiscard]] bool isFailure() const noexcept {
        return m_error != ErrorCode::Success;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    [[nodiscard]] ErrorCode error() const noexcept {
        return m_error;
    }

private:
    ErrorCode m_error;
};

/// Alias for Result<void>
using VoidResult = Result<void>;

// ============================================================================
// Convenience Macros
// ============================================================================

/**
 * @brief Return early if result is failure
 *
 * Usage:
 * ```cpp
 * LECTERN_TRY(socket.setNoDelay(true));
 * ```
 */
#define LECTERN_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.isFailure()) return _result.error(); \
    } while (0)

/**
 * @brief Assign value or return early on failure
 *
 * Usage:
 * ```cpp
 * LECTERN_TRY_ASSIGN(frame, Protocol::pack(type, data));
 * ```
 */
#define LECTERN_TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (_result_##var.isFailure()) return _result_##var.error(); \
    var = std::move(_result_##var).value()

} // namespace Lectern

#endif // LECTERN_CORE_ERROR_CODES_HPP
