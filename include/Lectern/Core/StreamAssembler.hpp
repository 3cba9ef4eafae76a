/**
 * @file StreamAssembler.hpp
 * @brief Recovers complete frames from an arbitrarily chunked byte stream
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * A reliable stream has no message boundaries: one read may hold half a
 * frame, several frames, or garbage from a misbehaving peer. The assembler
 * buffers input and resynchronizes on the frame magic whenever the buffer
 * does not start with a valid header.
 */

#pragma once

#ifndef LECTERN_CORE_STREAM_ASSEMBLER_HPP
#define LECTERN_CORE_STREAM_ASSEMBLER_HPP

#include <Lectern/Core/Types.hpp>
#include <Lectern/Core/Protocol.hpp>

#include <vector>

namespace Lectern::Protocol {

/**
 * @brief Frame reassembly state for one connection
 *
 * Not thread-safe; each endpoint owns exactly one instance and feeds it
 * from its receive path only.
 */
class StreamAssembler {
public:
    /**
     * @brief Assembler counters
     */
    struct Statistics {
        uint64_t framesAssembled = 0;
        uint64_t bytesProcessed = 0;
        uint64_t syncRecoveries = 0;
        uint64_t oversizedRejected = 0;
    };

    /**
     * @param maxPayloadSize Largest payload a header may announce
     */
    explicit StreamAssembler(size_t maxPayloadSize = MAX_PAYLOAD_SIZE);

    /**
     * @brief Append bytes and extract every complete frame
     * @return Frames in stream order, each byte-identical to what was sent
     */
    [[nodiscard]] std::vector<ByteBuffer> feed(ByteSpan chunk);

    /**
     * @brief Discard buffered bytes (statistics are kept)
     */
    void clear() noexcept;

    /**
     * @brief Bytes waiting for the rest of a frame
     */
    [[nodiscard]] size_t bufferedBytes() const noexcept { return m_buffer.size(); }

    [[nodiscard]] const Statistics& statistics() const noexcept { return m_stats; }

    [[nodiscard]] size_t maxPayloadSize() const noexcept { return m_maxPayloadSize; }

private:
    ByteBuffer m_buffer;
    size_t m_maxPayloadSize;
    Statistics m_stats;
};

} // namespace Lectern::Protocol

#endif // LECTERN_CORE_STREAM_ASSEMBLER_HPP
