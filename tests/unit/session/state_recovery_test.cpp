#include <catch2/catch_test_macros.hpp>
#include <squirrel/session/state_recovery.h>

#include <atomic>
#include <chrono>

using namespace squirrel;
using namespace squirrel::session;

namespace {

std::shared_ptr<StatePersistence> memoryPersistence() {
    return std::make_shared<StatePersistence>(createMemoryStateStorage());
}

class FailingWriteStorage : public MemoryStateStorage {
public:
    Result<void> write(std::string_view key, std::string_view contents) override {
        if (failWrites) {
            return Error{ErrorCode::IoError, "disk full"};
        }
        return MemoryStateStorage::write(key, contents);
    }

    std::atomic<bool> failWrites{false};
};

} // namespace

TEST_CASE("StateRecovery - points are capped and listed newest first", "[session][recovery]") {
    auto persistence = memoryPersistence();
    StateRecovery recovery(persistence, 3);
    CHECK(recovery.maxPointsPerState() == 3);

    auto state = makeState("doc", json{{"step", 0}});
    std::vector<std::string> ids;
    for (int i = 1; i <= 5; ++i) {
        state.update(json{{"step", i}});
        auto point = recovery.createRecoveryPoint(state, "step " + std::to_string(i), false);
        REQUIRE(point);
        CHECK(point.value().metadata.version == state.version);
        ids.push_back(point.value().id);
    }

    auto points = recovery.listRecoveryPoints("doc");
    REQUIRE(points.size() == 3);
    CHECK(points[0].id == ids[4]);
    CHECK(points[1].id == ids[3]);
    CHECK(points[2].id == ids[2]);
    CHECK(points[0].metadata.reason == "step 5");
    CHECK_FALSE(points[0].metadata.is_automatic);

    // The latest capture is also the persisted current state
    auto current = persistence->loadState("doc");
    REQUIRE(current);
    CHECK(current.value().data["step"] == 5);

    CHECK(recovery.listRecoveryPoints("other").empty());
}

TEST_CASE("StateRecovery - recoverState", "[session][recovery]") {
    auto persistence = memoryPersistence();
    StateRecovery recovery(persistence);

    auto missing = recovery.recoverState("doc");
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::NotFound);

    auto state = makeState("doc", json{{"v", "first"}});
    auto first = recovery.createRecoveryPoint(state, "first", true);
    REQUIRE(first);
    state.update(json{{"v", "second"}});
    REQUIRE(recovery.createRecoveryPoint(state, "second", true));

    SECTION("Latest by default") {
        auto r = recovery.recoverState("doc");
        REQUIRE(r);
        CHECK(r.value().data["v"] == "second");
        CHECK(r.value().persisted);
    }

    SECTION("Specific point re-persists its capture") {
        auto r = recovery.recoverState("doc", first.value().id);
        REQUIRE(r);
        CHECK(r.value().data["v"] == "first");
        CHECK(r.value().version == 1);

        auto stored = persistence->loadState("doc");
        REQUIRE(stored);
        CHECK(stored.value().data["v"] == "first");
    }

    SECTION("Unknown point id") {
        auto r = recovery.recoverState("doc", std::string{"nope"});
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::NotFound);
    }
}

TEST_CASE("StateRecovery - cleanupOldPoints", "[session][recovery]") {
    StateRecovery recovery(memoryPersistence());
    auto a = makeState("a", json::object());
    auto b = makeState("b", json::object());
    REQUIRE(recovery.createRecoveryPoint(a, "a", true));
    REQUIRE(recovery.createRecoveryPoint(b, "b", true));

    CHECK(recovery.cleanupOldPoints(std::chrono::hours(1)) == 0);
    CHECK(recovery.listRecoveryPoints("a").size() == 1);

    // A negative age puts the cutoff in the future
    CHECK(recovery.cleanupOldPoints(std::chrono::seconds(-60)) == 2);
    CHECK(recovery.listRecoveryPoints("a").empty());
    CHECK(recovery.verifyRecoveryChain("a").error().code == ErrorCode::NotFound);
}

TEST_CASE("StateRecovery - verifyRecoveryChain", "[session][recovery]") {
    StateRecovery recovery(memoryPersistence());

    CHECK(recovery.verifyRecoveryChain("doc").error().code == ErrorCode::NotFound);

    auto state = makeState("doc", json::object());
    REQUIRE(recovery.createRecoveryPoint(state, "one", true));
    state.touch();
    REQUIRE(recovery.createRecoveryPoint(state, "two", true));

    auto ok = recovery.verifyRecoveryChain("doc");
    REQUIRE(ok);
    CHECK(ok.value());

    SECTION("Non-increasing version breaks the chain") {
        REQUIRE(recovery.createRecoveryPoint(state, "same version", true));
        auto r = recovery.verifyRecoveryChain("doc");
        REQUIRE(r);
        CHECK_FALSE(r.value());
    }

    SECTION("Dependencies must have points") {
        auto child = makeState("child", json::object());
        REQUIRE(recovery.createRecoveryPoint(child, "depends on doc", true, {"doc"}));
        CHECK(recovery.verifyRecoveryChain("child").value());

        auto orphan = makeState("orphan", json::object());
        REQUIRE(recovery.createRecoveryPoint(orphan, "depends on ghost", true, {"ghost"}));
        CHECK_FALSE(recovery.verifyRecoveryChain("orphan").value());
    }
}

TEST_CASE("StateRecovery - rejects invalid names", "[session][recovery]") {
    StateRecovery recovery(memoryPersistence());
    auto r = recovery.createRecoveryPoint(makeState("", json::object()), "x", true);
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("StateRecovery - failed save records no point", "[session][recovery]") {
    auto storage = std::make_shared<FailingWriteStorage>();
    auto persistence = std::make_shared<StatePersistence>(storage);
    StateRecovery recovery(persistence, 5);

    auto state = makeState("doc", json{{"n", 1}});
    REQUIRE(recovery.createRecoveryPoint(state, "first", true));

    storage->failWrites = true;
    state.update(json{{"n", 2}});
    auto failed = recovery.createRecoveryPoint(state, "second", true);
    REQUIRE_FALSE(failed);
    CHECK(failed.error().code == ErrorCode::IoError);

    auto points = recovery.listRecoveryPoints("doc");
    REQUIRE(points.size() == 1);
    CHECK(points[0].metadata.reason == "first");
    CHECK(persistence->cachedVersion("doc") == std::optional<uint64_t>{1});

    // A name whose only save failed has no points at all
    auto fresh = recovery.createRecoveryPoint(makeState("other", json::object()), "x", true);
    REQUIRE_FALSE(fresh);
    CHECK(recovery.listRecoveryPoints("other").empty());
    CHECK(recovery.verifyRecoveryChain("other").error().code == ErrorCode::NotFound);
}
