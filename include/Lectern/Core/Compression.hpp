/**
 * @file Compression.hpp
 * @brief zlib (DEFLATE) helpers for frame payloads and media datagrams
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#pragma once

#ifndef LECTERN_CORE_COMPRESSION_HPP
#define LECTERN_CORE_COMPRESSION_HPP

#include <Lectern/Core/Types.hpp>
#include <Lectern/Core/ErrorCodes.hpp>

namespace Lectern::Compression {

/// Level used for reliable-channel frame payloads
constexpr int FRAME_COMPRESSION_LEVEL = 6;

/// Level used for fan-out datagrams (speed over ratio)
constexpr int DATAGRAM_COMPRESSION_LEVEL = 1;

/**
 * @brief Compress data into a zlib stream
 * @param data Input bytes
 * @param level zlib level 0-9
 */
Result<ByteBuffer> compress(ByteSpan data, int level = FRAME_COMPRESSION_LEVEL);

/**
 * @brief Inflate a zlib stream
 * @param data Compressed bytes
 * @param maxOutput Output ceiling; larger results fail with FrameTooLarge
 * @return Inflated bytes, DecompressionFailed for corrupt or incomplete
 *         streams
 */
Result<ByteBuffer> decompress(ByteSpan data, size_t maxOutput);

} // namespace Lectern::Compression

#endif // LECTERN_CORE_COMPRESSION_HPP
