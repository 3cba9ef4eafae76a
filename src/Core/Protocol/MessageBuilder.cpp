/**
 * @file MessageBuilder.cpp
 * @brief Bodies of the session-level messages
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <Lectern/Core/Protocol.hpp>
#include <Lectern/Core/Encoding.hpp>

namespace Lectern::Protocol::MessageBuilder {

MessageData ping() {
    return MessageData::object();
}

MessageData pong() {
    return MessageData::object();
}

MessageData presenterAnnouncement(const std::string& name, int channel, uint16_t port) {
    MessageData data;
    data["teacher_name"] = name;
    data["channel"] = channel;
    data["port"] = port;
    return data;
}

MessageData registrationRequest(const std::string& participantName, const std::string& machineId) {
    MessageData data;
    data["student_name"] = participantName;
    data["machine_id"] = machineId;
    return data;
}

MessageData connectionAccepted(const std::string& participantId) {
    MessageData data;
    data["student_id"] = participantId;
    return data;
}

MessageData connectionRejected(const std::string& reason) {
    MessageData data;
    data["reason"] = reason;
    return data;
}

MessageData chatMessage(const std::string& senderId,
                        const std::string& senderName,
                        const std::string& content,
                        const std::string& recipient,
                        const std::string& group) {
    MessageData data;
    data["sender_id"] = senderId;
    data["sender_name"] = senderName;
    data["content"] = content;
    data["recipient_id"] = recipient.empty() ? MessageData() : MessageData(recipient);
    data["group_id"] = group.empty() ? MessageData() : MessageData(group);
    return data;
}

MessageData lockScreen(const std::string& message) {
    MessageData data;
    data["message"] = message;
    return data;
}

MessageData unlockScreen() {
    return MessageData::object();
}

MessageData screenFrame(ByteSpan jpeg, uint32_t frameId, const std::string& quality) {
    MessageData data;
    data["frame_id"] = frameId;
    data["frame"] = Encoding::toBase64(jpeg);
    data["quality"] = quality;
    return data;
}

Result<ByteBuffer> screenFrameImage(const MessageData& data) {
    auto it = data.find("frame");
    if (it == data.end()) {
        return ErrorCode::MissingField;
    }
    if (!it->is_string()) {
        return ErrorCode::InvalidFieldType;
    }
    return Encoding::fromBase64(it->get_ref<const std::string&>());
}

} // namespace Lectern::Protocol::MessageBuilder
