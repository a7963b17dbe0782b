#include <spdlog/spdlog.h>
#include <squirrel/core/time_utils.h>
#include <squirrel/mcp/message_validator.h>

namespace squirrel::mcp {

namespace {

Result<void> checkProtocolVersion(const Message& message, const ProtocolConfig& config) {
    if (!message.payload.is_object()) {
        return {};
    }
    auto it = message.payload.find("protocol_version");
    if (it == message.payload.end() || !it->is_string()) {
        return {};
    }

    const auto& requested = it->get_ref<const std::string&>();
    if (requested == config.version) {
        return {};
    }

    auto ours = ProtocolVersion::parse(config.version);
    auto theirs = ProtocolVersion::parse(requested);
    if (ours && theirs && ours.value().isCompatible(theirs.value())) {
        return {};
    }
    return Error{ErrorCode::InvalidVersion, "Protocol version '" + requested +
                                                "' is not compatible with '" + config.version +
                                                "'"};
}

} // namespace

Result<std::size_t> MessageValidator::serializedSize(const Message& message) {
    auto text = json_utils::dump_json(message.toJson(), -1, ErrorCode::InvalidFormat);
    if (!text) {
        return text.error();
    }
    return text.value().size();
}

Result<void> MessageValidator::validate(const Message& message, const ProtocolConfig& config) {
    return validate(message, config, core::nowUnixSeconds());
}

Result<void> MessageValidator::validate(const Message& message, const ProtocolConfig& config,
                                        int64_t now) {
    if (message.message_type == MessageType::Unknown) {
        return Error{ErrorCode::InvalidFormat, "Unknown message type"};
    }
    if (message.id.empty()) {
        return Error{ErrorCode::InvalidFormat, "Message ID is missing"};
    }

    auto size = serializedSize(message);
    if (!size) {
        return size.error();
    }
    if (size.value() > config.max_message_size) {
        return Error{ErrorCode::MessageTooLarge,
                     fmt::format("Message size ({} bytes) exceeds maximum allowed size ({} bytes)",
                                 size.value(), config.max_message_size)};
    }

    if (message.metadata && message.metadata->timestamp) {
        const int64_t ts = *message.metadata->timestamp;
        if (ts > now) {
            return Error{ErrorCode::InvalidTimestamp,
                         fmt::format("Message timestamp {} is in the future (now {})", ts, now)};
        }
        // ts <= now, so the unsigned difference is exact over the whole int64 range. Compared in
        // whole seconds: age * 1000 > timeout_ms  <=>  age > timeout_ms / 1000.
        const uint64_t ageSeconds = static_cast<uint64_t>(now) - static_cast<uint64_t>(ts);
        if (ageSeconds > config.timeout_ms / 1000) {
            return Error{ErrorCode::MessageTimeout,
                         fmt::format("Message is too old: age {} s exceeds timeout {} ms",
                                     ageSeconds, config.timeout_ms)};
        }
    }

    if (message.message_type == MessageType::Command ||
        message.message_type == MessageType::Request) {
        if (!message.payload.is_object()) {
            return Error{ErrorCode::InvalidPayload,
                         fmt::format("Payload for {} message must be an object, got {}",
                                     toString(message.message_type),
                                     json_utils::kind_name(message.payload))};
        }
    }

    return checkProtocolVersion(message, config);
}

} // namespace squirrel::mcp
