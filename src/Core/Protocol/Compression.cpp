/**
 * @file Compression.cpp
 * @brief zlib stream compression implementation
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <Lectern/Core/Compression.hpp>
#include <zlib.h>
#include <algorithm>
#include <limits>

namespace Lectern::Compression {

Result<ByteBuffer> compress(ByteSpan data, int level) {
    if (level < Z_NO_COMPRESSION || level > Z_BEST_COMPRESSION) {
        return ErrorCode::InvalidArgument;
    }
    if (data.size() > std::numeric_limits<uLong>::max()) {
        return ErrorCode::FrameTooLarge;
    }

    uLongf bound = compressBound(static_cast<uLong>(data.size()));
    ByteBuffer output(bound);

    int status = compress2(output.data(), &bound,
                           data.data(), static_cast<uLong>(data.size()), level);
    if (status != Z_OK) {
        return ErrorCode::CompressionFailed;
    }

    output.resize(bound);
    return output;
}

Result<ByteBuffer> decompress(ByteSpan data, size_t maxOutput) {
    if (data.empty()) {
        return ErrorCode::DecompressionFailed;
    }

    z_stream stream{};
    if (inflateInit(&stream) != Z_OK) {
        return ErrorCode::DecompressionFailed;
    }

    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());

    ByteBuffer output;
    output.resize(std::min<size_t>(std::max<size_t>(data.size() * 4, 4096), maxOutput + 1));

    int status = Z_OK;
    while (status != Z_STREAM_END) {
        if (stream.total_out >= output.size()) {
            if (output.size() > maxOutput) {
                inflateEnd(&stream);
                return ErrorCode::FrameTooLarge;
            }
            output.resize(std::min<size_t>(output.size() * 2, maxOutput + 1));
        }

        stream.next_out = output.data() + stream.total_out;
        stream.avail_out = static_cast<uInt>(output.size() - stream.total_out);

        status = inflate(&stream, Z_NO_FLUSH);
        if (status == Z_STREAM_END) {
            break;
        }
        if (status != Z_OK && status != Z_BUF_ERROR) {
            inflateEnd(&stream);
            return ErrorCode::DecompressionFailed;
        }
        if (stream.avail_out == 0) {
            continue;
        }
        // Room left but no end-of-stream marker: input was truncated
        inflateEnd(&stream);
        return ErrorCode::DecompressionFailed;
    }

    size_t produced = stream.total_out;
    inflateEnd(&stream);

    if (produced > maxOutput) {
        return ErrorCode::FrameTooLarge;
    }

    output.resize(produced);
    return output;
}

} // namespace Lectern::Compression
