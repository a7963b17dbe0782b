#pragma once

#include <squirrel/core/json_utils.h>
#include <squirrel/core/types.h>

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace squirrel::mcp {

struct ProtocolVersion {
    uint32_t major = 1;
    uint32_t minor = 0;
    uint32_t patch = 0;

    // "major.minor" or "major.minor.patch"
    static Result<ProtocolVersion> parse(std::string_view text);
    std::string toString() const;

    // Same major, and at least the other's minor.
    bool isCompatible(const ProtocolVersion& other) const noexcept {
        return major == other.major && minor >= other.minor;
    }

    auto operator<=>(const ProtocolVersion&) const = default;
};

struct ProtocolConfig {
    static constexpr std::size_t kDefaultMaxMessageSize = 1024 * 1024;
    static constexpr uint64_t kDefaultTimeoutMs = 5000;
    static constexpr uint32_t kDefaultRetryCount = 3;

    // Kept as text so a label that fails serialisation can still be represented.
    std::string version = "1.0.0";
    std::size_t max_message_size = kDefaultMaxMessageSize;
    uint64_t timeout_ms = kDefaultTimeoutMs;
    uint32_t retry_count = kDefaultRetryCount;

    bool operator==(const ProtocolConfig&) const = default;

    json toJson() const;
    static Result<ProtocolConfig> fromJson(const json& j);
};

} // namespace squirrel::mcp
