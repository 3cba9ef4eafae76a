/**
 * @file ErrorCodes.cpp
 * @brief Human-readable descriptions for Lectern error codes
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <Lectern/Core/ErrorCodes.hpp>

namespace Lectern {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:                return "Success";

        case ErrorCode::SystemError:            return "System error";
        case ErrorCode::AllocationFailed:       return "Memory allocation failed";
        case ErrorCode::ThreadCreationFailed:   return "Thread creation failed";
        case ErrorCode::Timeout:                return "Operation timed out";
        case ErrorCode::InvalidHandle:          return "Invalid handle";

        case ErrorCode::CryptoError:            return "Cryptographic error";
        case ErrorCode::HashFailed:             return "Hash computation failed";
        case ErrorCode::RandomGenerationFailed: return "Random generation failed";

        case ErrorCode::NetworkError:           return "Network error";
        case ErrorCode::ConnectionFailed:       return "Connection failed";
        case ErrorCode::ConnectionClosed:       return "Connection closed";
        case ErrorCode::NotConnected:           return "Not connected";
        case ErrorCode::BindFailed:             return "Failed to bind address";
        case ErrorCode::ListenFailed:           return "Failed to listen";
        case ErrorCode::SocketOptionFailed:     return "Failed to set socket option";
        case ErrorCode::SocketCreateFailed:     return "Failed to create socket";
        case ErrorCode::SendFailed:             return "Send failed";
        case ErrorCode::ReceiveFailed:          return "Receive failed";
        case ErrorCode::NetworkUnreachable:     return "Network unreachable";
        case ErrorCode::AddressInvalid:         return "Invalid network address";
        case ErrorCode::MulticastJoinFailed:    return "Failed to join multicast group";
        case ErrorCode::AcceptFailed:           return "Accept failed";

        case ErrorCode::ProtocolError:          return "Protocol error";
        case ErrorCode::FrameTooShort:          return "Frame shorter than header";
        case ErrorCode::InvalidMagic:           return "Invalid frame magic";
        case ErrorCode::FrameTruncated:         return "Frame payload truncated";
        case ErrorCode::FrameTooLarge:          return "Frame exceeds maximum payload size";
        case ErrorCode::CompressionFailed:      return "Compression failed";
        case ErrorCode::DecompressionFailed:    return "Decompression failed";
        case ErrorCode::EncodeFailed:           return "Message encoding failed";
        case ErrorCode::InvalidMessage:         return "Invalid message envelope";

        case ErrorCode::SessionError:           return "Session error";
        case ErrorCode::HandshakeFailed:        return "Registration handshake failed";
        case ErrorCode::RegistrationRejected:   return "Registration rejected";
        case ErrorCode::RegistrationTimeout:    return "Registration timed out";
        case ErrorCode::ParticipantNotFound:    return "Participant not found";
        case ErrorCode::SessionFull:            return "Session is full";
        case ErrorCode::AlreadyConnected:       return "Already connected";

        case ErrorCode::ConfigError:            return "Configuration error";
        case ErrorCode::ConfigInvalid:          return "Invalid configuration value";
        case ErrorCode::ConfigFileNotFound:     return "Configuration file not found";
        case ErrorCode::ConfigParseFailed:      return "Configuration parse error";

        case ErrorCode::IOError:                return "I/O error";
        case ErrorCode::FileReadError:          return "File read error";
        case ErrorCode::FileTooLarge:           return "File too large";
        case ErrorCode::InvalidPath:            return "Invalid path";
        case ErrorCode::AccessDenied:           return "Access denied";

        case ErrorCode::ParseError:             return "Parse error";
        case ErrorCode::JsonParseFailed:        return "JSON parse error";
        case ErrorCode::MissingField:           return "Missing required field";
        case ErrorCode::InvalidFieldType:       return "Invalid field type";
        case ErrorCode::InvalidBase64:          return "Invalid base64 string";

        case ErrorCode::InternalError:          return "Internal error";
        case ErrorCode::InvalidState:           return "Invalid state";
        case ErrorCode::NullPointer:            return "Null pointer";
        case ErrorCode::InvalidArgument:        return "Invalid argument";
    }
    return "Unknown error";
}

std::string_view getCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:     return "None";
        case ErrorCategory::System:   return "System";
        case ErrorCategory::Crypto:   return "Crypto";
        case ErrorCategory::Network:  return "Network";
        case ErrorCategory::Protocol: return "Protocol";
        case ErrorCategory::Session:  return "Session";
        case ErrorCategory::Config:   return "Config";
        case ErrorCategory::IO:       return "IO";
        case ErrorCategory::Parse:    return "Parse";
        case ErrorCategory::Internal: return "Internal";
    }
    return "Unknown";
}

} // namespace Lectern
