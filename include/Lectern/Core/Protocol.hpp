/**
 * @file Protocol.hpp
 * @brief Binary wire protocol for the classroom session channel
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * Frame layout (all integers big-endian):
 *
 *   offset  size  field
 *   0       4     magic "AFRD"
 *   4       2     protocol version
 *   6       4     payload length
 *   10      1     compressed flag (0/1)
 *   11      n     payload (UTF-8 JSON envelope, DEFLATE when flagged)
 *
 * The envelope is `{"type": ..., "timestamp": ..., "data": {...}}`. Payloads
 * above COMPRESSION_THRESHOLD bytes are compressed when the caller allows it.
 */

#pragma once

#ifndef LECTERN_CORE_PROTOCOL_HPP
#define LECTERN_CORE_PROTOCOL_HPP

#include <Lectern/Core/Types.hpp>
#include <Lectern/Core/ErrorCodes.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace Lectern::Protocol {

// ============================================================================
// Constants
// ============================================================================

/// Frame magic
constexpr std::array<Byte, 4> MAGIC = {'A', 'F', 'R', 'D'};

/// Version written by pack()
constexpr uint16_t PROTOCOL_VERSION = 2;

/// Oldest version unpack() accepts without a warning
constexpr uint16_t MIN_SUPPORTED_VERSION = 1;

/// magic + version + length + flag
constexpr size_t HEADER_SIZE = 11;

/// Protocol ceiling on a single payload
constexpr size_t MAX_PAYLOAD_SIZE = 10 * 1024 * 1024;

/// Payloads strictly larger than this are compressed
constexpr size_t COMPRESSION_THRESHOLD = 1024;

/// frame id + length
constexpr size_t MEDIA_CHUNK_HEADER_SIZE = 8;

// ============================================================================
// Message types
// ============================================================================

/**
 * @brief Message vocabulary shared by presenter and participant
 *
 * The wire carries the string form. Types a peer does not know are still
 * delivered as a Message whose kind() is empty.
 */
enum class MessageType : uint16_t {
    // Session plumbing
    Ping,
    Pong,
    Disconnect,
    TeacherBroadcast,
    StudentConnect,
    StudentInfo,
    ConnectionAccepted,
    ConnectionRejected,

    // Media streams
    ScreenStreamStart,
    ScreenStreamStop,
    ScreenFrame,
    VideoStreamStart,
    VideoStreamStop,
    VideoFrame,
    VideoControl,
    AudioStreamStart,
    AudioStreamStop,
    AudioFrame,
    VoiceStart,
    VoiceStop,
    VoiceData,
    WebcamStart,
    WebcamStop,
    WebcamFrame,

    // Whiteboard
    WhiteboardStart,
    WhiteboardStop,
    WhiteboardCommand,
    WhiteboardSync,

    // Chat
    ChatMessage,
    ChatGroup,

    // Files
    FileSend,
    FileRequest,
    FileChunk,
    FileComplete,

    // Classroom control
    LockScreen,
    UnlockScreen,
    LockInput,
    UnlockInput,
    BlockApp,
    UnblockApp,
    RemoteCommand,
    WebControlSet,
    WebControlStatus,

    // File transfer and collection
    FileTransferStart,
    FileTransferData,
    FileTransferEnd,
    FileTransferAck,
    FileCollectRequest,
    FileCollectResponse,

    // Activity monitoring
    ActivityReport,
    ActivityRequest,
    ScreenshotRequest,
    ScreenshotResponse,

    // Exams and polls
    ExamStart,
    ExamAnswer,
    ExamResult,
    ExamEnd,
    PollStart,
    PollAnswer,
    PollResult,

    // Groups
    GroupCreate,
    GroupAssign,
    GroupMessage,

    // Demonstration
    DemoStart,
    DemoStop,
    DemoFrame,

    // Board
    BoardStart,
    BoardDraw,
    BoardClear,
    BoardStop
};

/**
 * @brief Wire string of a message type ("PING", "SCREEN_FRAME", ...)
 */
[[nodiscard]] const char* toString(MessageType type) noexcept;

/**
 * @brief Parse a wire string
 * @return The type, or std::nullopt for strings outside the vocabulary
 */
[[nodiscard]] std::optional<MessageType> parseMessageType(std::string_view text) noexcept;

// ============================================================================
// Messages
// ============================================================================

/// Message body; key order is preserved across pack/unpack
using MessageData = nlohmann::ordered_json;

/**
 * @brief Logical content of one frame
 */
struct Message {
    /// Wire tag as received
    std::string type;

    /// Sender-local "YYYY-MM-DD HH:MM:SS"
    std::string timestamp;

    /// Body object (may be empty)
    MessageData data = MessageData::object();

    /// Protocol version from the frame header
    uint16_t version = PROTOCOL_VERSION;

    /// Typed view of the tag; empty for unknown types
    [[nodiscard]] std::optional<MessageType> kind() const noexcept {
        return parseMessageType(type);
    }

    [[nodiscard]] bool is(MessageType expected) const noexcept {
        return type == toString(expected);
    }
};

/**
 * @brief Decoded frame header
 */
struct FrameHeader {
    uint16_t version = 0;
    uint32_t payloadLength = 0;
    bool compressed = false;
};

// ============================================================================
// Framing
// ============================================================================

/**
 * @brief Encode a message into one frame
 *
 * @param type Wire tag
 * @param data Body object
 * @param compress Allow DEFLATE when the payload exceeds COMPRESSION_THRESHOLD
 * @return Complete frame (header + payload), or EncodeFailed /
 *         CompressionFailed / FrameTooLarge
 */
[[nodiscard]] Result<ByteBuffer> pack(std::string_view type,
                                      const MessageData& data,
                                      bool compress = true);

/**
 * @brief Encode a typed message into one frame
 */
[[nodiscard]] Result<ByteBuffer> pack(MessageType type,
                                      const MessageData& data,
                                      bool compress = true);

/**
 * @brief Decode one complete frame
 *
 * Fails with FrameTooShort, InvalidMagic, FrameTruncated, FrameTooLarge,
 * DecompressionFailed, JsonParseFailed or InvalidMessage. Never throws.
 */
[[nodiscard]] Result<Message> unpack(ByteSpan frame);

/**
 * @brief Parse the fixed header
 * @return Header fields, or std::nullopt when short or the magic differs
 */
[[nodiscard]] std::optional<FrameHeader> parseHeader(ByteSpan bytes) noexcept;

/**
 * @brief Total frame length (header + payload) announced by a header
 * @param header At least the first HEADER_SIZE bytes of a frame
 * @return Length, or std::nullopt when short or the magic differs
 */
[[nodiscard]] std::optional<size_t> getFrameLength(ByteSpan header) noexcept;

/**
 * @brief Current local time in envelope format
 */
[[nodiscard]] std::string currentTimestamp();

// ============================================================================
// Media chunks
// ============================================================================

/**
 * @brief Raw media payload tagged with a frame id
 */
struct MediaChunk {
    uint32_t frameId = 0;
    ByteBuffer data;
};

/**
 * @brief Prefix bytes with frame id and length (uint32 each, big-endian)
 */
[[nodiscard]] Result<ByteBuffer> packMediaChunk(uint32_t frameId, ByteSpan data);

/**
 * @brief Split a media chunk; trailing bytes past the declared length are ignored
 */
[[nodiscard]] Result<MediaChunk> unpackMediaChunk(ByteSpan bytes);

// ============================================================================
// Message builders
// ============================================================================

/**
 * @brief Constructors for the messages the session layer exchanges
 *
 * Control messages are small and are packed uncompressed by their callers.
 */
namespace MessageBuilder {

[[nodiscard]] MessageData ping();
[[nodiscard]] MessageData pong();

/// TEACHER_BROADCAST body
[[nodiscard]] MessageData presenterAnnouncement(const std::string& name,
                                                int channel,
                                                uint16_t port);

/// STUDENT_CONNECT body
[[nodiscard]] MessageData registrationRequest(const std::string& participantName,
                                              const std::string& machineId);

/// CONNECTION_ACCEPTED body
[[nodiscard]] MessageData connectionAccepted(const std::string& participantId);

/// CONNECTION_REJECTED body
[[nodiscard]] MessageData connectionRejected(const std::string& reason);

/**
 * @brief CHAT_MESSAGE body
 * @param recipient Participant id for a private message, empty for everyone
 * @param group Group id for a group message, empty otherwise
 */
[[nodiscard]] MessageData chatMessage(const std::string& senderId,
                                      const std::string& senderName,
                                      const std::string& content,
                                      const std::string& recipient = {},
                                      const std::string& group = {});

[[nodiscard]] MessageData lockScreen(const std::string& message);
[[nodiscard]] MessageData unlockScreen();

/**
 * @brief SCREEN_FRAME body carrying a JPEG image as base64
 */
[[nodiscard]] MessageData screenFrame(ByteSpan jpeg,
                                      uint32_t frameId,
                                      const std::string& quality = "medium");

/**
 * @brief Extract the image bytes of a SCREEN_FRAME body
 */
[[nodiscard]] Result<ByteBuffer> screenFrameImage(const MessageData& data);

} // namespace MessageBuilder

} // namespace Lectern::Protocol

#endif // LECTERN_CORE_PROTOCOL_HPP
