#pragma once

#include <squirrel/mcp/message.h>
#include <squirrel/mcp/protocol_config.h>

#include <cstdint>

namespace squirrel::mcp {

/**
 * Stateless admission checks applied before any handler sees a message.
 *
 * Checks run in order and the first failure wins: known type and non-empty id,
 * serialised size, timestamp freshness, Command/Request payload shape, then the
 * optional payload protocol_version pin.
 */
class MessageValidator {
public:
    static Result<void> validate(const Message& message, const ProtocolConfig& config);

    // `now` is unix seconds.
    static Result<void> validate(const Message& message, const ProtocolConfig& config,
                                 int64_t now);

    // Compact serialised size in bytes.
    static Result<std::size_t> serializedSize(const Message& message);
};

} // namespace squirrel::mcp
