#include <squirrel/mcp/protocol_config.h>

#include <charconv>
#include <vector>

namespace squirrel::mcp {

namespace {

Error badVersion(std::string_view text) {
    return Error{ErrorCode::InvalidArgument, "Invalid protocol version '" + std::string(text) +
                                                 "': expected major.minor[.patch]"};
}

} // namespace

Result<ProtocolVersion> ProtocolVersion::parse(std::string_view text) {
    std::vector<uint32_t> parts;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        const std::size_t dot = text.find('.', pos);
        const std::size_t end = dot == std::string_view::npos ? text.size() : dot;
        const std::string_view part = text.substr(pos, end - pos);
        if (part.empty()) {
            return badVersion(text);
        }
        uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        if (ec != std::errc{} || ptr != part.data() + part.size()) {
            return badVersion(text);
        }
        parts.push_back(value);
        if (dot == std::string_view::npos) {
            break;
        }
        pos = dot + 1;
    }

    if (parts.size() < 2 || parts.size() > 3) {
        return badVersion(text);
    }
    ProtocolVersion v;
    v.major = parts[0];
    v.minor = parts[1];
    v.patch = parts.size() == 3 ? parts[2] : 0;
    return v;
}

std::string ProtocolVersion::toString() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

json ProtocolConfig::toJson() const {
    return json{{"version", version},
                {"max_message_size", max_message_size},
                {"timeout_ms", timeout_ms},
                {"retry_count", retry_count}};
}

Result<ProtocolConfig> ProtocolConfig::fromJson(const json& j) {
    auto version = json_utils::get_field<std::string>(j, "version");
    if (!version)
        return version.error();
    auto maxSize = json_utils::get_field<std::size_t>(j, "max_message_size");
    if (!maxSize)
        return maxSize.error();
    auto timeout = json_utils::get_field<uint64_t>(j, "timeout_ms");
    if (!timeout)
        return timeout.error();
    auto retries = json_utils::get_field<uint32_t>(j, "retry_count");
    if (!retries)
        return retries.error();

    ProtocolConfig config;
    config.version = std::move(version).value();
    config.max_message_size = maxSize.value();
    config.timeout_ms = timeout.value();
    config.retry_count = retries.value();
    return config;
}

} // namespace squirrel::mcp
