/**
 * @file StreamAssembler.cpp
 * @brief Frame reassembly with magic resynchronization
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <Lectern/Core/StreamAssembler.hpp>
#include <Lectern/Core/Logger.hpp>

#include <algorithm>

namespace Lectern::Protocol {

StreamAssembler::StreamAssembler(size_t maxPayloadSize)
    : m_maxPayloadSize(maxPayloadSize) {
}

std::vector<ByteBuffer> StreamAssembler::feed(ByteSpan chunk) {
    std::vector<ByteBuffer> frames;
    if (chunk.empty()) {
        return frames;
    }

    m_buffer.insert(m_buffer.end(), chunk.begin(), chunk.end());
    m_stats.bytesProcessed += chunk.size();

    // Consumed bytes are erased once at the end
    size_t pos = 0;

    while (m_buffer.size() - pos >= HEADER_SIZE) {
        auto begin = m_buffer.begin() + static_cast<std::ptrdiff_t>(pos);

        if (!std::equal(MAGIC.begin(), MAGIC.end(), begin)) {
            auto found = std::search(begin + 1, m_buffer.end(), MAGIC.begin(), MAGIC.end());
            if (found == m_buffer.end()) {
                // A magic may straddle the next chunk boundary
                pos = m_buffer.size() - (MAGIC.size() - 1);
                break;
            }

            size_t skipped = static_cast<size_t>(found - begin);
            LECTERN_LOG_WARNING_F("Stream out of sync, skipping %zu bytes", skipped);
            pos += skipped;
            m_stats.syncRecoveries++;
            continue;
        }

        auto frameLength = getFrameLength(ByteSpan(m_buffer).subspan(pos, HEADER_SIZE));
        if (!frameLength) {
            pos += 1;
            continue;
        }

        if (*frameLength > m_maxPayloadSize + HEADER_SIZE) {
            LECTERN_LOG_ERROR_F("Frame header announces %zu bytes, skipping", *frameLength);
            m_stats.oversizedRejected++;
            pos += 1;
            continue;
        }

        if (m_buffer.size() - pos < *frameLength) {
            break;
        }

        auto frameBegin = m_buffer.begin() + static_cast<std::ptrdiff_t>(pos);
        frames.emplace_back(frameBegin, frameBegin + static_cast<std::ptrdiff_t>(*frameLength));
        pos += *frameLength;
        m_stats.framesAssembled++;
    }

    m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(pos));
    return frames;
}

void StreamAssembler::clear() noexcept {
    m_buffer.clear();
}

} // namespace Lectern::Protocol
