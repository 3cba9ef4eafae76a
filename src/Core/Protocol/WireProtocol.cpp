/**
 * @file WireProtocol.cpp
 * @brief Frame encoding and decoding
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <Lectern/Core/Protocol.hpp>
#include <Lectern/Core/Compression.hpp>
#include <Lectern/Core/Logger.hpp>

#include <algorithm>
#include <ctime>
#include <new>

namespace Lectern::Protocol {

namespace {

struct TypeName {
    MessageType type;
    const char* name;
};

constexpr TypeName TYPE_NAMES[] = {
    {MessageType::Ping, "PING"},
    {MessageType::Pong, "PONG"},
    {MessageType::Disconnect, "DISCONNECT"},
    {MessageType::TeacherBroadcast, "TEACHER_BROADCAST"},
    {MessageType::StudentConnect, "STUDENT_CONNECT"},
    {MessageType::StudentInfo, "STUDENT_INFO"},
    {MessageType::ConnectionAccepted, "CONNECTION_ACCEPTED"},
    {MessageType::ConnectionRejected, "CONNECTION_REJECTED"},
    {MessageType::ScreenStreamStart, "SCREEN_STREAM_START"},
    {MessageType::ScreenStreamStop, "SCREEN_STREAM_STOP"},
    {MessageType::ScreenFrame, "SCREEN_FRAME"},
    {MessageType::VideoStreamStart, "VIDEO_STREAM_START"},
    {MessageType::VideoStreamStop, "VIDEO_STREAM_STOP"},
    {MessageType::VideoFrame, "VIDEO_FRAME"},
    {MessageType::VideoControl, "VIDEO_CONTROL"},
    {MessageType::AudioStreamStart, "AUDIO_STREAM_START"},
    {MessageType::AudioStreamStop, "AUDIO_STREAM_STOP"},
    {MessageType::AudioFrame, "AUDIO_FRAME"},
    {MessageType::VoiceStart, "VOICE_START"},
    {MessageType::VoiceStop, "VOICE_STOP"},
    {MessageType::VoiceData, "VOICE_DATA"},
    {MessageType::WebcamStart, "WEBCAM_START"},
    {MessageType::WebcamStop, "WEBCAM_STOP"},
    {MessageType::WebcamFrame, "WEBCAM_FRAME"},
    {MessageType::WhiteboardStart, "WHITEBOARD_START"},
    {MessageType::WhiteboardStop, "WHITEBOARD_STOP"},
    {MessageType::WhiteboardCommand, "WHITEBOARD_COMMAND"},
    {MessageType::WhiteboardSync, "WHITEBOARD_SYNC"},
    {MessageType::ChatMessage, "CHAT_MESSAGE"},
    {MessageType::ChatGroup, "CHAT_GROUP"},
    {MessageType::FileSend, "FILE_SEND"},
    {MessageType::FileRequest, "FILE_REQUEST"},
    {MessageType::FileChunk, "FILE_CHUNK"},
    {MessageType::FileComplete, "FILE_COMPLETE"},
    {MessageType::LockScreen, "LOCK_SCREEN"},
    {MessageType::UnlockScreen, "UNLOCK_SCREEN"},
    {MessageType::LockInput, "LOCK_INPUT"},
    {MessageType::UnlockInput, "UNLOCK_INPUT"},
    {MessageType::BlockApp, "BLOCK_APP"},
    {MessageType::UnblockApp, "UNBLOCK_APP"},
    {MessageType::RemoteCommand, "REMOTE_COMMAND"},
    {MessageType::WebControlSet, "WEB_CONTROL_SET"},
    {MessageType::WebControlStatus, "WEB_CONTROL_STATUS"},
    {MessageType::FileTransferStart, "FILE_TRANSFER_START"},
    {MessageType::FileTransferData, "FILE_TRANSFER_DATA"},
    {MessageType::FileTransferEnd, "FILE_TRANSFER_END"},
    {MessageType::FileTransferAck, "FILE_TRANSFER_ACK"},
    {MessageType::FileCollectRequest, "FILE_COLLECT_REQUEST"},
    {MessageType::FileCollectResponse, "FILE_COLLECT_RESPONSE"},
    {MessageType::ActivityReport, "ACTIVITY_REPORT"},
    {MessageType::ActivityRequest, "ACTIVITY_REQUEST"},
    {MessageType::ScreenshotRequest, "SCREENSHOT_REQUEST"},
    {MessageType::ScreenshotResponse, "SCREENSHOT_RESPONSE"},
    {MessageType::ExamStart, "EXAM_START"},
    {MessageType::ExamAnswer, "EXAM_ANSWER"},
    {MessageType::ExamResult, "EXAM_RESULT"},
    {MessageType::ExamEnd, "EXAM_END"},
    {MessageType::PollStart, "POLL_START"},
    {MessageType::PollAnswer, "POLL_ANSWER"},
    {MessageType::PollResult, "POLL_RESULT"},
    {MessageType::GroupCreate, "GROUP_CREATE"},
    {MessageType::GroupAssign, "GROUP_ASSIGN"},
    {MessageType::GroupMessage, "GROUP_MESSAGE"},
    {MessageType::DemoStart, "DEMO_START"},
    {MessageType::DemoStop, "DEMO_STOP"},
    {MessageType::DemoFrame, "DEMO_FRAME"},
    {MessageType::BoardStart, "BOARD_START"},
    {MessageType::BoardDraw, "BOARD_DRAW"},
    {MessageType::BoardClear, "BOARD_CLEAR"},
    {MessageType::BoardStop, "BOARD_STOP"},
};

void writeU16(ByteBuffer& out, uint16_t value) {
    out.push_back(static_cast<Byte>(value >> 8));
    out.push_back(static_cast<Byte>(value));
}

void writeU32(ByteBuffer& out, uint32_t value) {
    out.push_back(static_cast<Byte>(value >> 24));
    out.push_back(static_cast<Byte>(value >> 16));
    out.push_back(static_cast<Byte>(value >> 8));
    out.push_back(static_cast<Byte>(value));
}

uint16_t readU16(const Byte* p) noexcept {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t readU32(const Byte* p) noexcept {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

} // namespace

// ============================================================================
// Message types
// ============================================================================

const char* toString(MessageType type) noexcept {
    for (const auto& entry : TYPE_NAMES) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "UNKNOWN";
}

std::optional<MessageType> parseMessageType(std::string_view text) noexcept {
    for (const auto& entry : TYPE_NAMES) {
        if (text == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

std::string currentTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    char buffer[32];
    size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buffer, written);
}

// ============================================================================
// Framing
// ============================================================================

Result<ByteBuffer> pack(std::string_view type, const MessageData& data, bool compress) {
    if (type.empty()) {
        return ErrorCode::InvalidArgument;
    }
    if (!data.is_null() && !data.is_object()) {
        return ErrorCode::InvalidArgument;
    }

    ByteBuffer payload;
    try {
        MessageData envelope;
        envelope["type"] = std::string(type);
        envelope["timestamp"] = currentTimestamp();
        envelope["data"] = data.is_null() ? MessageData::object() : data;

        // Strings must be valid UTF-8; non-ASCII is written verbatim
        std::string text = envelope.dump();
        payload.assign(text.begin(), text.end());
    } catch (const nlohmann::json::exception& e) {
        LECTERN_LOG_ERROR_F("Failed to encode %.*s message: %s",
                            static_cast<int>(type.size()), type.data(), e.what());
        return ErrorCode::EncodeFailed;
    } catch (const std::bad_alloc&) {
        return ErrorCode::AllocationFailed;
    }

    bool compressed = false;
    if (compress && payload.size() > COMPRESSION_THRESHOLD) {
        Result<ByteBuffer> deflated = Compression::compress(payload, Compression::FRAME_COMPRESSION_LEVEL);
        if (deflated.isFailure()) {
            LECTERN_LOG_ERROR("Payload compression failed");
            return deflated.error();
        }
        payload = std::move(deflated).value();
        compressed = true;
    }

    if (payload.size() > MAX_PAYLOAD_SIZE) {
        LECTERN_LOG_ERROR_F("Payload of %zu bytes exceeds protocol limit", payload.size());
        return ErrorCode::FrameTooLarge;
    }

    ByteBuffer frame;
    frame.reserve(HEADER_SIZE + payload.size());
    frame.insert(frame.end(), MAGIC.begin(), MAGIC.end());
    writeU16(frame, PROTOCOL_VERSION);
    writeU32(frame, static_cast<uint32_t>(payload.size()));
    frame.push_back(compressed ? 1 : 0);
    frame.insert(frame.end(), payload.begin(), payload.end());

    return frame;
}

Result<ByteBuffer> pack(MessageType type, const MessageData& data, bool compress) {
    return pack(std::string_view(toString(type)), data, compress);
}

std::optional<FrameHeader> parseHeader(ByteSpan bytes) noexcept {
    if (bytes.size() < HEADER_SIZE) {
        return std::nullopt;
    }
    if (!std::equal(MAGIC.begin(), MAGIC.end(), bytes.begin())) {
        return std::nullopt;
    }

    FrameHeader header;
    header.version = readU16(bytes.data() + 4);
    header.payloadLength = readU32(bytes.data() + 6);
    header.compressed = bytes[10] != 0;
    return header;
}

std::optional<size_t> getFrameLength(ByteSpan header) noexcept {
    auto parsed = parseHeader(header);
    if (!parsed) {
        return std::nullopt;
    }
    return HEADER_SIZE + static_cast<size_t>(parsed->payloadLength);
}

Result<Message> unpack(ByteSpan frame) {
    if (frame.size() < HEADER_SIZE) {
        return ErrorCode::FrameTooShort;
    }

    auto header = parseHeader(frame);
    if (!header) {
        LECTERN_LOG_DEBUG("Rejecting frame with invalid magic");
        return ErrorCode::InvalidMagic;
    }

    if (header->version < MIN_SUPPORTED_VERSION || header->version > PROTOCOL_VERSION) {
        // Decoded anyway; the envelope has not changed between versions
        LECTERN_LOG_WARNING_F("Unsupported protocol version %u", static_cast<unsigned>(header->version));
    }

    if (header->payloadLength > MAX_PAYLOAD_SIZE) {
        return ErrorCode::FrameTooLarge;
    }
    if (frame.size() - HEADER_SIZE < header->payloadLength) {
        LECTERN_LOG_DEBUG_F("Truncated frame: expected %u payload bytes, have %zu",
                            header->payloadLength, frame.size() - HEADER_SIZE);
        return ErrorCode::FrameTruncated;
    }

    ByteSpan payload = frame.subspan(HEADER_SIZE, header->payloadLength);

    ByteBuffer inflated;
    if (header->compressed) {
        Result<ByteBuffer> result = Compression::decompress(payload, MAX_PAYLOAD_SIZE);
        if (result.isFailure()) {
            LECTERN_LOG_ERROR_F("Frame decompression failed: %s", getErrorMessage(result.error()).data());
            return result.error();
        }
        inflated = std::move(result).value();
        payload = ByteSpan(inflated);
    }

    try {
        MessageData envelope = MessageData::parse(payload.begin(), payload.end());
        if (!envelope.is_object()) {
            return ErrorCode::InvalidMessage;
        }

        auto typeIt = envelope.find("type");
        if (typeIt == envelope.end() || !typeIt->is_string()) {
            return ErrorCode::InvalidMessage;
        }

        Message message;
        message.version = header->version;
        message.type = typeIt->get<std::string>();

        auto timestampIt = envelope.find("timestamp");
        if (timestampIt != envelope.end() && timestampIt->is_string()) {
            message.timestamp = timestampIt->get<std::string>();
        }

        auto dataIt = envelope.find("data");
        if (dataIt != envelope.end() && !dataIt->is_null()) {
            if (!dataIt->is_object()) {
                return ErrorCode::InvalidMessage;
            }
            message.data = std::move(*dataIt);
        }

        return message;
    } catch (const nlohmann::json::exception& e) {
        LECTERN_LOG_ERROR_F("Frame payload is not a valid envelope: %s", e.what());
        return ErrorCode::JsonParseFailed;
    } catch (const std::bad_alloc&) {
        return ErrorCode::AllocationFailed;
    }
}

// ============================================================================
// Media chunks
// ============================================================================

Result<ByteBuffer> packMediaChunk(uint32_t frameId, ByteSpan data) {
    if (data.size() > UINT32_MAX) {
        return ErrorCode::FrameTooLarge;
    }

    ByteBuffer chunk;
    chunk.reserve(MEDIA_CHUNK_HEADER_SIZE + data.size());
    writeU32(chunk, frameId);
    writeU32(chunk, static_cast<uint32_t>(data.size()));
    chunk.insert(chunk.end(), data.begin(), data.end());
    return chunk;
}

Result<MediaChunk> unpackMediaChunk(ByteSpan bytes) {
    if (bytes.size() < MEDIA_CHUNK_HEADER_SIZE) {
        return ErrorCode::FrameTooShort;
    }

    MediaChunk chunk;
    chunk.frameId = readU32(bytes.data());
    uint32_t length = readU32(bytes.data() + 4);

    if (bytes.size() - MEDIA_CHUNK_HEADER_SIZE < length) {
        LECTERN_LOG_DEBUG("Incomplete media chunk");
        return ErrorCode::FrameTruncated;
    }

    ByteSpan body = bytes.subspan(MEDIA_CHUNK_HEADER_SIZE, length);
    chunk.data.assign(body.begin(), body.end());
    return chunk;
}

} // namespace Lectern::Protocol
