#include <spdlog/spdlog.h>
#include <squirrel/config/config_helpers.h>
#include <squirrel/config/squirrel_config.h>

#include <charconv>
#include <cstdlib>
#include <optional>

namespace squirrel::config {

namespace {

template <typename T> Result<T> parseUnsigned(const std::string& key, const std::string& text) {
    T value{};
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc{} || ptr != end) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid value for '" + key + "': '" + text + "' is not a non-negative integer"};
    }
    return value;
}

std::optional<std::string> envValue(const char* name) {
    if (const char* value = std::getenv(name); value && *value) {
        return std::string(value);
    }
    return std::nullopt;
}

// File value first, then the environment override. Empty when neither is set.
std::optional<std::string> lookup(const std::filesystem::path& path, const std::string& section,
                                  const std::string& key, const char* envName) {
    std::optional<std::string> result;
    if (!path.empty()) {
        if (auto value = parse_config_value(path, section, key); !value.empty()) {
            result = std::move(value);
        }
    }
    if (envName) {
        if (auto value = envValue(envName)) {
            result = std::move(value);
        }
    }
    return result;
}

template <typename T>
Result<void> applyUnsigned(const std::filesystem::path& path, const std::string& section,
                           const std::string& key, const char* envName, T& target) {
    auto text = lookup(path, section, key, envName);
    if (!text) {
        return {};
    }
    auto parsed = parseUnsigned<T>(section + "." + key, *text);
    if (!parsed) {
        return parsed.error();
    }
    target = parsed.value();
    return {};
}

} // namespace

SquirrelConfig defaultSquirrelConfig() {
    SquirrelConfig config;
    config.session.storage_path = get_data_dir() / "states";
    return config;
}

Result<SquirrelConfig> loadSquirrelConfig(const std::filesystem::path& path) {
    SquirrelConfig config = defaultSquirrelConfig();

    std::filesystem::path source;
    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        source = path;
        spdlog::debug("Loading configuration from {}", path.string());
    } else if (!path.empty()) {
        spdlog::debug("No configuration at {}, using defaults", path.string());
    }

    if (auto version = lookup(source, "mcp", "version", nullptr)) {
        if (auto parsed = mcp::ProtocolVersion::parse(*version); !parsed) {
            return Error{ErrorCode::InvalidArgument,
                         "Invalid value for 'mcp.version': " + parsed.error().message};
        }
        config.protocol.version = *version;
    }

    if (auto r = applyUnsigned(source, "mcp", "max_message_size", "SQUIRREL_MCP_MAX_MESSAGE_SIZE",
                               config.protocol.max_message_size);
        !r) {
        return r.error();
    }
    if (auto r = applyUnsigned(source, "mcp", "timeout_ms", "SQUIRREL_MCP_TIMEOUT_MS",
                               config.protocol.timeout_ms);
        !r) {
        return r.error();
    }
    if (auto r = applyUnsigned(source, "mcp", "retry_count", "SQUIRREL_MCP_RETRY_COUNT",
                               config.protocol.retry_count);
        !r) {
        return r.error();
    }

    if (auto storage = lookup(source, "session", "storage_path", "SQUIRREL_STATE_DIR")) {
        config.session.storage_path = expand_tilde(*storage);
    }
    if (auto r = applyUnsigned(source, "session", "max_recovery_points", nullptr,
                               config.session.max_recovery_points);
        !r) {
        return r.error();
    }
    if (auto r = applyUnsigned(source, "session", "max_context_history", nullptr,
                               config.session.max_context_history);
        !r) {
        return r.error();
    }

    if (auto level = lookup(source, "logging", "level", "SQUIRREL_LOG_LEVEL")) {
        config.log_level = *level;
    }

    return config;
}

Result<SquirrelConfig> loadSquirrelConfig() {
    if (auto env = envValue("SQUIRREL_CONFIG")) {
        return loadSquirrelConfig(std::filesystem::path(*env));
    }
    return loadSquirrelConfig(get_config_path());
}

} // namespace squirrel::config
