#include <catch2/catch_test_macros.hpp>
#include <squirrel/mcp/protocol_lifecycle.h>

using namespace squirrel;
using namespace squirrel::mcp;

TEST_CASE("ProtocolLifecycle - starts uninitialized", "[mcp][lifecycle]") {
    ProtocolLifecycle fsm;
    auto snap = fsm.snapshot();
    CHECK(snap.state == ProtocolState::Uninitialized);
    CHECK(snap.lastError.empty());
}

TEST_CASE("ProtocolLifecycle - normal startup path", "[mcp][lifecycle]") {
    ProtocolLifecycle fsm;
    REQUIRE(fsm.transitionTo(ProtocolState::Initializing));
    REQUIRE(fsm.transitionTo(ProtocolState::Initialized));
    REQUIRE(fsm.transitionTo(ProtocolState::Ready));
    CHECK(fsm.state() == ProtocolState::Ready);

    // Ready can step back to Initialized and forward again
    REQUIRE(fsm.transitionTo(ProtocolState::Initialized));
    REQUIRE(fsm.transitionTo(ProtocolState::Ready));

    REQUIRE(fsm.transitionTo(ProtocolState::ShuttingDown));
    CHECK(fsm.state() == ProtocolState::ShuttingDown);
}

TEST_CASE("ProtocolLifecycle - illegal transitions are rejected", "[mcp][lifecycle]") {
    ProtocolLifecycle fsm;

    auto r = fsm.transitionTo(ProtocolState::Ready);
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::InvalidState);
    CHECK(r.error().message == "Invalid protocol state transition: Uninitialized -> Ready");
    CHECK(fsm.state() == ProtocolState::Uninitialized);

    REQUIRE(fsm.transitionTo(ProtocolState::Initializing));
    CHECK_FALSE(fsm.transitionTo(ProtocolState::Ready));
    CHECK_FALSE(fsm.transitionTo(ProtocolState::Uninitialized));
    CHECK(fsm.state() == ProtocolState::Initializing);
}

TEST_CASE("ProtocolLifecycle - Error and ShuttingDown are absorbing", "[mcp][lifecycle]") {
    using S = ProtocolState;
    for (auto terminal : {S::Error, S::ShuttingDown}) {
        for (auto next : {S::Uninitialized, S::Initializing, S::Initialized, S::Ready}) {
            CHECK_FALSE(ProtocolLifecycle::isAllowed(terminal, next));
        }
    }
    CHECK_FALSE(ProtocolLifecycle::isAllowed(S::Error, S::ShuttingDown));
    CHECK_FALSE(ProtocolLifecycle::isAllowed(S::ShuttingDown, S::Error));

    ProtocolLifecycle fsm;
    REQUIRE(fsm.transitionTo(S::Error, std::string{"disk on fire"}));
    auto snap = fsm.snapshot();
    CHECK(snap.state == S::Error);
    CHECK(snap.lastError == "disk on fire");
    CHECK_FALSE(fsm.transitionTo(S::Initializing));
}

TEST_CASE("ProtocolLifecycle - same state is a no-op", "[mcp][lifecycle]") {
    ProtocolLifecycle fsm;
    REQUIRE(fsm.transitionTo(ProtocolState::Error, std::string{"boom"}));
    auto before = fsm.snapshot();
    CHECK(fsm.transitionTo(ProtocolState::Error));
    auto after = fsm.snapshot();
    CHECK(after.state == ProtocolState::Error);
    CHECK(after.lastError == "boom");
    CHECK(after.lastTransition == before.lastTransition);
}

TEST_CASE("ProtocolLifecycle - restoreIf and reset", "[mcp][lifecycle]") {
    ProtocolLifecycle fsm;
    REQUIRE(fsm.transitionTo(ProtocolState::Initializing));

    CHECK_FALSE(fsm.restoreIf(ProtocolState::Ready, ProtocolState::Uninitialized));
    CHECK(fsm.state() == ProtocolState::Initializing);

    CHECK(fsm.restoreIf(ProtocolState::Initializing, ProtocolState::Uninitialized));
    CHECK(fsm.state() == ProtocolState::Uninitialized);

    REQUIRE(fsm.transitionTo(ProtocolState::Error, std::string{"x"}));
    fsm.reset();
    auto snap = fsm.snapshot();
    CHECK(snap.state == ProtocolState::Uninitialized);
    CHECK(snap.lastError.empty());
    CHECK(fsm.transitionTo(ProtocolState::Initializing));
}

TEST_CASE("ProtocolLifecycle - state names", "[mcp][lifecycle]") {
    CHECK(std::string(toString(ProtocolState::Uninitialized)) == "Uninitialized");
    CHECK(std::string(toString(ProtocolState::Initializing)) == "Initializing");
    CHECK(std::string(toString(ProtocolState::Initialized)) == "Initialized");
    CHECK(std::string(toString(ProtocolState::Ready)) == "Ready");
    CHECK(std::string(toString(ProtocolState::ShuttingDown)) == "ShuttingDown");
    CHECK(std::string(toString(ProtocolState::Error)) == "Error");
}
