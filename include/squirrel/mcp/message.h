#pragma once

#include <squirrel/core/json_utils.h>
#include <squirrel/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace squirrel::mcp {

enum class MessageType { Command, Response, Event, Request, Error, Unknown };

enum class SecurityLevel { None, Low, Normal, High, Critical };

enum class CompressionFormat { None, Gzip, Zstd, Lz4 };

enum class EncryptionFormat { None, Aes256Gcm, ChaCha20Poly1305 };

enum class ResponseStatus { Success, Error, Pending, Timeout };

const char* toString(MessageType type) noexcept;
const char* toString(SecurityLevel level) noexcept;
const char* toString(CompressionFormat format) noexcept;
const char* toString(EncryptionFormat format) noexcept;
const char* toString(ResponseStatus status) noexcept;

// Unrecognised names decode to MessageType::Unknown.
MessageType parseMessageType(std::string_view name) noexcept;
Result<SecurityLevel> parseSecurityLevel(std::string_view name);
Result<CompressionFormat> parseCompressionFormat(std::string_view name);
Result<EncryptionFormat> parseEncryptionFormat(std::string_view name);
Result<ResponseStatus> parseResponseStatus(std::string_view name);

struct MessageMetadata {
    std::optional<int64_t> timestamp; // unix seconds
    std::optional<std::string> source;
    std::optional<std::string> destination;
    SecurityLevel security_level = SecurityLevel::Normal;
    CompressionFormat compression = CompressionFormat::None;
    EncryptionFormat encryption = EncryptionFormat::None;
    std::optional<std::string> correlation_id;

    bool operator==(const MessageMetadata&) const = default;

    json toJson() const;
    static Result<MessageMetadata> fromJson(const json& j);
};

struct Message {
    std::string id;
    MessageType message_type = MessageType::Unknown;
    json payload;
    std::optional<MessageMetadata> metadata;
    std::optional<std::string> error;

    // Fresh UUID id and metadata stamped with the current time.
    static Message create(MessageType type, json payload);

    // "command_type" for Command, "event_type" for Event, when the payload names one.
    std::optional<std::string> subtype() const;

    bool operator==(const Message&) const = default;

    json toJson() const;
    // Accepts the legacy "type" discriminant when "message_type" is absent.
    static Result<Message> fromJson(const json& j);
};

struct Response {
    std::string message_id;
    std::string protocol_version;
    ResponseStatus status = ResponseStatus::Success;
    json payload;
    std::optional<std::string> error_message;
    std::optional<MessageMetadata> metadata;

    bool operator==(const Response&) const = default;

    json toJson() const;
    static Result<Response> fromJson(const json& j);
};

} // namespace squirrel::mcp
