/**
 * @file Encoding.hpp
 * @brief Binary-to-text encodings and host identity helpers
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * Binary fields (screen frames, file chunks) travel inside JSON message
 * payloads as base64 text. The participant machine identifier is a
 * SHA-256 digest of host properties, stable across restarts.
 */

#pragma once

#ifndef LECTERN_CORE_ENCODING_HPP
#define LECTERN_CORE_ENCODING_HPP

#include <Lectern/Core/Types.hpp>
#include <Lectern/Core/ErrorCodes.hpp>
#include <string>

namespace Lectern::Encoding {

/**
 * @brief Convert bytes to base64 string (no line breaks)
 */
std::string toBase64(ByteSpan data);

/**
 * @brief Convert base64 string to bytes
 * @return Decoded bytes or ErrorCode::InvalidBase64
 */
Result<ByteBuffer> fromBase64(const std::string& base64);

/**
 * @brief Convert bytes to lower-case hex string
 */
std::string toHex(ByteSpan data);

/**
 * @brief SHA-256 digest of data
 */
Result<ByteBuffer> sha256(ByteSpan data);

/**
 * @brief Fill a buffer with cryptographically secure random bytes
 */
Result<ByteBuffer> randomBytes(size_t size);

/**
 * @brief Stable identifier for this host
 *
 * Hashes /etc/machine-id (or /var/lib/dbus/machine-id) together with the
 * host name and returns the first 16 bytes of the digest as hex. When
 * neither file is readable the host name alone is used; when that fails
 * too a random identifier is returned.
 */
std::string machineIdentifier();

} // namespace Lectern::Encoding

#endif // LECTERN_CORE_ENCODING_HPP
