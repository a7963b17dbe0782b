#pragma once

#include <squirrel/core/types.h>
#include <squirrel/mcp/protocol_config.h>
#include <squirrel/session/state_manager.h>

#include <filesystem>
#include <string>

namespace squirrel::config {

struct SquirrelConfig {
    mcp::ProtocolConfig protocol;
    session::SessionConfig session;
    std::string log_level = "info";
};

SquirrelConfig defaultSquirrelConfig();

// Reads [mcp], [session] and [logging] from `path` (missing file means defaults), then applies
// SQUIRREL_* environment overrides. Malformed numbers or versions are InvalidArgument.
Result<SquirrelConfig> loadSquirrelConfig(const std::filesystem::path& path);

// Uses $SQUIRREL_CONFIG when set, else the XDG location.
Result<SquirrelConfig> loadSquirrelConfig();

} // namespace squirrel::config
