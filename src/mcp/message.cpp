#include <squirrel/core/uuid.h>
#include <squirrel/core/time_utils.h>
#include <squirrel/mcp/message.h>

namespace squirrel::mcp {

namespace {

template <typename E, std::size_t N>
Result<E> lookup(std::string_view name, const std::pair<std::string_view, E> (&table)[N],
                 std::string_view what) {
    for (const auto& [key, value] : table) {
        if (key == name) {
            return value;
        }
    }
    return Error{ErrorCode::InvalidFormat,
                 "Unknown " + std::string(what) + " '" + std::string(name) + "'"};
}

constexpr std::pair<std::string_view, SecurityLevel> kSecurityLevels[] = {
    {"None", SecurityLevel::None},
    {"Low", SecurityLevel::Low},
    {"Normal", SecurityLevel::Normal},
    {"High", SecurityLevel::High},
    {"Critical", SecurityLevel::Critical},
};

constexpr std::pair<std::string_view, CompressionFormat> kCompressionFormats[] = {
    {"None", CompressionFormat::None},
    {"Gzip", CompressionFormat::Gzip},
    {"Zstd", CompressionFormat::Zstd},
    {"Lz4", CompressionFormat::Lz4},
};

constexpr std::pair<std::string_view, EncryptionFormat> kEncryptionFormats[] = {
    {"None", EncryptionFormat::None},
    {"Aes256Gcm", EncryptionFormat::Aes256Gcm},
    {"ChaCha20Poly1305", EncryptionFormat::ChaCha20Poly1305},
};

constexpr std::pair<std::string_view, ResponseStatus> kResponseStatuses[] = {
    {"Success", ResponseStatus::Success},
    {"Error", ResponseStatus::Error},
    {"Pending", ResponseStatus::Pending},
    {"Timeout", ResponseStatus::Timeout},
};

template <typename T>
Result<std::optional<T>> optionalField(const json& obj, const char* name) {
    if (!obj.contains(name) || obj[name].is_null()) {
        return std::optional<T>{};
    }
    auto value = json_utils::get_field<T>(obj, name);
    if (!value) {
        return Error{ErrorCode::InvalidFormat, value.error().message};
    }
    return std::optional<T>{std::move(value).value()};
}

template <typename E>
Result<E> enumField(const json& obj, const char* name, E fallback,
                    Result<E> (*parse)(std::string_view)) {
    if (!obj.contains(name) || obj[name].is_null()) {
        return fallback;
    }
    if (!obj[name].is_string()) {
        return Error{ErrorCode::InvalidFormat, std::string("Field '") + name + "' must be a string"};
    }
    return parse(obj[name].get_ref<const std::string&>());
}

} // namespace

const char* toString(MessageType type) noexcept {
    switch (type) {
        case MessageType::Command: return "Command";
        case MessageType::Response: return "Response";
        case MessageType::Event: return "Event";
        case MessageType::Request: return "Request";
        case MessageType::Error: return "Error";
        case MessageType::Unknown: return "Unknown";
    }
    return "Unknown";
}

const char* toString(SecurityLevel level) noexcept {
    for (const auto& [name, value] : kSecurityLevels) {
        if (value == level)
            return name.data();
    }
    return "Normal";
}

const char* toString(CompressionFormat format) noexcept {
    for (const auto& [name, value] : kCompressionFormats) {
        if (value == format)
            return name.data();
    }
    return "None";
}

const char* toString(EncryptionFormat format) noexcept {
    for (const auto& [name, value] : kEncryptionFormats) {
        if (value == format)
            return name.data();
    }
    return "None";
}

const char* toString(ResponseStatus status) noexcept {
    for (const auto& [name, value] : kResponseStatuses) {
        if (value == status)
            return name.data();
    }
    return "Error";
}

MessageType parseMessageType(std::string_view name) noexcept {
    if (name == "Command")
        return MessageType::Command;
    if (name == "Response")
        return MessageType::Response;
    if (name == "Event")
        return MessageType::Event;
    if (name == "Request")
        return MessageType::Request;
    if (name == "Error")
        return MessageType::Error;
    return MessageType::Unknown;
}

Result<SecurityLevel> parseSecurityLevel(std::string_view name) {
    return lookup(name, kSecurityLevels, "security level");
}

Result<CompressionFormat> parseCompressionFormat(std::string_view name) {
    return lookup(name, kCompressionFormats, "compression format");
}

Result<EncryptionFormat> parseEncryptionFormat(std::string_view name) {
    return lookup(name, kEncryptionFormats, "encryption format");
}

Result<ResponseStatus> parseResponseStatus(std::string_view name) {
    return lookup(name, kResponseStatuses, "response status");
}

json MessageMetadata::toJson() const {
    json j = json::object();
    if (timestamp)
        j["timestamp"] = *timestamp;
    if (source)
        j["source"] = *source;
    if (destination)
        j["destination"] = *destination;
    j["security_level"] = toString(security_level);
    j["compression"] = toString(compression);
    j["encryption"] = toString(encryption);
    if (correlation_id)
        j["correlation_id"] = *correlation_id;
    return j;
}

Result<MessageMetadata> MessageMetadata::fromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidFormat, "Message metadata must be an object"};
    }

    MessageMetadata meta;

    auto timestamp = optionalField<int64_t>(j, "timestamp");
    if (!timestamp)
        return timestamp.error();
    meta.timestamp = timestamp.value();

    auto source = optionalField<std::string>(j, "source");
    if (!source)
        return source.error();
    meta.source = source.value();

    auto destination = optionalField<std::string>(j, "destination");
    if (!destination)
        return destination.error();
    meta.destination = destination.value();

    auto correlation = optionalField<std::string>(j, "correlation_id");
    if (!correlation)
        return correlation.error();
    meta.correlation_id = correlation.value();

    auto security = enumField(j, "security_level", SecurityLevel::Normal, &parseSecurityLevel);
    if (!security)
        return security.error();
    meta.security_level = security.value();

    auto compression = enumField(j, "compression", CompressionFormat::None, &parseCompressionFormat);
    if (!compression)
        return compression.error();
    meta.compression = compression.value();

    auto encryption = enumField(j, "encryption", EncryptionFormat::None, &parseEncryptionFormat);
    if (!encryption)
        return encryption.error();
    meta.encryption = encryption.value();

    return meta;
}

Message Message::create(MessageType type, json payload) {
    Message msg;
    msg.id = core::generateUUID();
    msg.message_type = type;
    msg.payload = std::move(payload);
    MessageMetadata meta;
    meta.timestamp = core::nowUnixSeconds();
    msg.metadata = std::move(meta);
    return msg;
}

std::optional<std::string> Message::subtype() const {
    const char* key = nullptr;
    if (message_type == MessageType::Command)
        key = "command_type";
    else if (message_type == MessageType::Event)
        key = "event_type";

    if (!key || !payload.is_object())
        return std::nullopt;
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

json Message::toJson() const {
    json j = {{"id", id}, {"message_type", toString(message_type)}, {"payload", payload}};
    if (metadata)
        j["metadata"] = metadata->toJson();
    if (error)
        j["error"] = *error;
    return j;
}

Result<Message> Message::fromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidFormat, "Message must be a JSON object"};
    }

    auto id = json_utils::get_field<std::string>(j, "id");
    if (!id) {
        return Error{ErrorCode::InvalidFormat, id.error().message};
    }

    const char* discriminant = j.contains("message_type") ? "message_type" : "type";
    auto typeName = json_utils::get_field<std::string>(j, discriminant);
    if (!typeName) {
        return Error{ErrorCode::InvalidFormat, "Missing or invalid message type discriminant"};
    }

    Message msg;
    msg.id = std::move(id).value();
    msg.message_type = parseMessageType(typeName.value());
    msg.payload = j.contains("payload") ? j["payload"] : json(nullptr);

    if (j.contains("metadata") && !j["metadata"].is_null()) {
        auto meta = MessageMetadata::fromJson(j["metadata"]);
        if (!meta)
            return meta.error();
        msg.metadata = std::move(meta).value();
    }

    auto error = optionalField<std::string>(j, "error");
    if (!error)
        return error.error();
    msg.error = error.value();

    return msg;
}

json Response::toJson() const {
    json j = {{"message_id", message_id},
              {"protocol_version", protocol_version},
              {"status", toString(status)},
              {"payload", payload}};
    if (error_message)
        j["error_message"] = *error_message;
    if (metadata)
        j["metadata"] = metadata->toJson();
    return j;
}

Result<Response> Response::fromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidFormat, "Response must be a JSON object"};
    }

    auto messageId = json_utils::get_field<std::string>(j, "message_id");
    if (!messageId)
        return Error{ErrorCode::InvalidFormat, messageId.error().message};
    auto version = json_utils::get_field<std::string>(j, "protocol_version");
    if (!version)
        return Error{ErrorCode::InvalidFormat, version.error().message};

    auto status = enumField(j, "status", ResponseStatus::Success, &parseResponseStatus);
    if (!status)
        return status.error();

    Response resp;
    resp.message_id = std::move(messageId).value();
    resp.protocol_version = std::move(version).value();
    resp.status = status.value();
    resp.payload = j.contains("payload") ? j["payload"] : json(nullptr);

    auto errorMessage = optionalField<std::string>(j, "error_message");
    if (!errorMessage)
        return errorMessage.error();
    resp.error_message = errorMessage.value();

    if (j.contains("metadata") && !j["metadata"].is_null()) {
        auto meta = MessageMetadata::fromJson(j["metadata"]);
        if (!meta)
            return meta.error();
        resp.metadata = std::move(meta).value();
    }
    return resp;
}

} // namespace squirrel::mcp
