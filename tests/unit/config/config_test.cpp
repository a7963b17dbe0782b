#include <catch2/catch_test_macros.hpp>
#include <squirrel/config/config_helpers.h>
#include <squirrel/config/squirrel_config.h>

#include "../../common/test_helpers.h"

#include <spdlog/spdlog.h>

using namespace squirrel;
using namespace squirrel::config;
using squirrel::test::ScopedEnvVar;
using squirrel::test::TempDirGuard;
using squirrel::test::write_file;

namespace {

// Clears every override so the host environment cannot leak into a test.
struct CleanEnv {
    ScopedEnvVar maxSize{"SQUIRREL_MCP_MAX_MESSAGE_SIZE", std::nullopt};
    ScopedEnvVar timeout{"SQUIRREL_MCP_TIMEOUT_MS", std::nullopt};
    ScopedEnvVar retries{"SQUIRREL_MCP_RETRY_COUNT", std::nullopt};
    ScopedEnvVar stateDir{"SQUIRREL_STATE_DIR", std::nullopt};
    ScopedEnvVar logLevel{"SQUIRREL_LOG_LEVEL", std::nullopt};
};

} // namespace

TEST_CASE("parse_config_value - TOML subset", "[config]") {
    TempDirGuard dir;
    auto path = write_file(dir.path() / "config.toml", R"(# top comment
[mcp]
version = "1.2.0"
timeout_ms = 2500   # inline comment
label = "has # inside"

[session]
storage_path = '~/states'
max_recovery_points=4
)");

    CHECK(parse_config_value(path, "mcp", "version") == "1.2.0");
    CHECK(parse_config_value(path, "mcp", "timeout_ms") == "2500");
    CHECK(parse_config_value(path, "mcp", "label") == "has # inside");
    CHECK(parse_config_value(path, "session", "storage_path") == "~/states");
    CHECK(parse_config_value(path, "session", "max_recovery_points") == "4");
    CHECK(parse_config_value(path, "session", "timeout_ms").empty());
    CHECK(parse_config_value(dir.path() / "missing.toml", "mcp", "version").empty());
}

TEST_CASE("parseLogLevel - syslog names map onto spdlog levels", "[config][logging]") {
    CHECK(parseLogLevel("trace") == spdlog::level::trace);
    CHECK(parseLogLevel("debug") == spdlog::level::debug);
    CHECK(parseLogLevel("notice") == spdlog::level::info);
    CHECK(parseLogLevel("warning") == spdlog::level::warn);
    CHECK(parseLogLevel("warn") == spdlog::level::warn);
    CHECK(parseLogLevel("error") == spdlog::level::err);
    CHECK(parseLogLevel("emergency") == spdlog::level::critical);
    CHECK(parseLogLevel("bogus") == spdlog::level::info);

    applyLogLevel("error");
    CHECK(spdlog::get_level() == spdlog::level::err);
    applyLogLevel("info");
}

TEST_CASE("expand_tilde - home relative paths", "[config]") {
    ScopedEnvVar home{"HOME", std::string("/home/tester")};
    CHECK(expand_tilde("~/data").string() == "/home/tester/data");
    CHECK(expand_tilde("~").string() == "/home/tester");
    CHECK(expand_tilde("/abs/path").string() == "/abs/path");
}

TEST_CASE("loadSquirrelConfig - defaults and file values", "[config]") {
    CleanEnv env;
    ScopedEnvVar xdg{"XDG_DATA_HOME", std::string("/tmp/squirrel-xdg")};
    TempDirGuard dir;

    SECTION("Missing file yields defaults") {
        auto cfg = loadSquirrelConfig(dir.path() / "absent.toml");
        REQUIRE(cfg);
        const auto& c = cfg.value();
        CHECK(c.protocol.version == "1.0.0");
        CHECK(c.protocol.max_message_size == 1024u * 1024u);
        CHECK(c.protocol.timeout_ms == 5000u);
        CHECK(c.protocol.retry_count == 3u);
        CHECK(c.session.max_recovery_points == 10u);
        CHECK(c.session.max_context_history == 100u);
        CHECK(c.session.storage_path.string() == "/tmp/squirrel-xdg/squirrel/states");
        CHECK(c.log_level == "info");
    }

    SECTION("File values override defaults") {
        auto path = write_file(dir.path() / "config.toml", R"([mcp]
version = "2.1"
max_message_size = 4096
timeout_ms = 750
retry_count = 0

[session]
storage_path = "/var/lib/squirrel/states"
max_recovery_points = 3
max_context_history = 20

[logging]
level = "debug"
)");
        auto cfg = loadSquirrelConfig(path);
        REQUIRE(cfg);
        const auto& c = cfg.value();
        CHECK(c.protocol.version == "2.1");
        CHECK(c.protocol.max_message_size == 4096u);
        CHECK(c.protocol.timeout_ms == 750u);
        CHECK(c.protocol.retry_count == 0u);
        CHECK(c.session.storage_path.string() == "/var/lib/squirrel/states");
        CHECK(c.session.max_recovery_points == 3u);
        CHECK(c.session.max_context_history == 20u);
        CHECK(c.log_level == "debug");
    }

    SECTION("Environment overrides win over the file") {
        auto path = write_file(dir.path() / "config.toml", "[mcp]\ntimeout_ms = 750\n");
        ScopedEnvVar timeout{"SQUIRREL_MCP_TIMEOUT_MS", std::string("9000")};
        ScopedEnvVar stateDir{"SQUIRREL_STATE_DIR", std::string("/srv/states")};
        ScopedEnvVar level{"SQUIRREL_LOG_LEVEL", std::string("warn")};

        auto cfg = loadSquirrelConfig(path);
        REQUIRE(cfg);
        CHECK(cfg.value().protocol.timeout_ms == 9000u);
        CHECK(cfg.value().session.storage_path.string() == "/srv/states");
        CHECK(cfg.value().log_level == "warn");
    }
}

TEST_CASE("loadSquirrelConfig - malformed values are rejected", "[config]") {
    CleanEnv env;
    TempDirGuard dir;

    SECTION("Non-numeric size names the key and text") {
        auto path = write_file(dir.path() / "config.toml", "[mcp]\nmax_message_size = big\n");
        auto cfg = loadSquirrelConfig(path);
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().code == ErrorCode::InvalidArgument);
        CHECK(cfg.error().message.find("mcp.max_message_size") != std::string::npos);
        CHECK(cfg.error().message.find("big") != std::string::npos);
    }

    SECTION("Negative number") {
        auto path = write_file(dir.path() / "config.toml", "[mcp]\ntimeout_ms = -5\n");
        auto cfg = loadSquirrelConfig(path);
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Bad protocol version") {
        auto path = write_file(dir.path() / "config.toml", "[mcp]\nversion = \"one.two\"\n");
        auto cfg = loadSquirrelConfig(path);
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Bad environment override") {
        ScopedEnvVar retries{"SQUIRREL_MCP_RETRY_COUNT", std::string("3x")};
        auto cfg = loadSquirrelConfig(dir.path() / "absent.toml");
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().code == ErrorCode::InvalidArgument);
    }
}
