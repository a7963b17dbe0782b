#include <catch2/catch_test_macros.hpp>
#include <squirrel/core/types.h>

#include <stdexcept>
#include <string>

using namespace squirrel;

TEST_CASE("Result - value and error access", "[core][result]") {
    SECTION("Holds a value") {
        Result<int> r = 42;
        REQUIRE(r);
        CHECK(r.has_value());
        CHECK(r.value() == 42);
        CHECK_THROWS_AS(r.error(), std::runtime_error);
    }

    SECTION("Holds an error with its message") {
        Result<std::string> r = Error{ErrorCode::NotFound, "state 'draft' not found"};
        REQUIRE_FALSE(r);
        CHECK(r.error() == ErrorCode::NotFound);
        CHECK(r.error().message == "state 'draft' not found");
        CHECK_THROWS_AS(r.value(), std::runtime_error);
    }

    SECTION("Bare error code uses the stable name as message") {
        Result<int> r = ErrorCode::HandlerNotFound;
        REQUIRE_FALSE(r);
        CHECK(r.error().message == "Handler not found");
    }

    SECTION("Void result") {
        Result<void> ok;
        CHECK(ok);
        Result<void> bad = Error{ErrorCode::IoError, "disk full"};
        REQUIRE_FALSE(bad);
        CHECK(bad.error().code == ErrorCode::IoError);
        CHECK(bad.error().describe() == "I/O error: disk full");
    }

    SECTION("Moving the value out") {
        Result<std::string> r = std::string("payload");
        auto moved = std::move(r).value();
        CHECK(moved == "payload");
    }
}

TEST_CASE("errorToString - stable names", "[core][error]") {
    CHECK(std::string(errorToString(ErrorCode::Success)) == "Success");
    CHECK(std::string(errorToString(ErrorCode::MessageTooLarge)) == "Message too large");
    CHECK(std::string(errorToString(ErrorCode::ProtocolNotReady)) == "Protocol not ready");
    CHECK(std::string(errorToString(ErrorCode::InvalidTransition)) == "Invalid state transition");
    CHECK(fmt::format("{}", ErrorCode::InvalidData) == "Invalid data");
}
