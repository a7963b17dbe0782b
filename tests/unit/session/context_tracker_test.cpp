#include <catch2/catch_test_macros.hpp>
#include <squirrel/session/context_tracker.h>

#include <vector>

using namespace squirrel;
using namespace squirrel::session;

namespace {

class RecordingSubscriber : public IContextSubscriber {
public:
    void onStateChange(const ContextState& oldState, const ContextState& newState) override {
        changes.emplace_back(oldState.version, newState.version);
    }
    void onError(const Error& error) override { errors.push_back(error); }

    std::vector<std::pair<uint64_t, uint64_t>> changes;
    std::vector<Error> errors;
};

} // namespace

TEST_CASE("ContextTracker - initial state", "[session][context]") {
    ContextTracker tracker;
    CHECK(tracker.maxHistory() == ContextTracker::kDefaultMaxHistory);
    auto state = tracker.getState();
    CHECK(state.version == 0);
    CHECK(state.data.is_null());
    CHECK(tracker.getHistory().empty());
}

TEST_CASE("ContextTracker - updates are versioned and recorded", "[session][context]") {
    ContextTracker tracker;
    auto first = tracker.updateState(json{{"topic", "a"}}, json{{"source", "test"}});
    auto second = tracker.updateState(json{{"topic", "b"}});
    CHECK(first.version == 1);
    CHECK(second.version == 2);
    CHECK(tracker.getState() == second);

    auto history = tracker.getHistory();
    REQUIRE(history.size() == 2);
    CHECK(history[0].id == "snapshot_1");
    CHECK(history[0].state == first);
    REQUIRE(history[0].metadata);
    CHECK((*history[0].metadata)["source"] == "test");
    CHECK(history[1].id == "snapshot_2");
    CHECK_FALSE(history[1].metadata);
}

TEST_CASE("ContextTracker - history is bounded", "[session][context]") {
    ContextTracker tracker(3);
    for (int i = 1; i <= 5; ++i) {
        tracker.updateState(json{{"i", i}});
    }
    auto history = tracker.getHistory();
    REQUIRE(history.size() == 3);
    CHECK(history.front().state.version == 3);
    CHECK(history.back().state.version == 5);

    auto evicted = tracker.rollbackTo(1);
    REQUIRE_FALSE(evicted);
    CHECK(evicted.error().code == ErrorCode::InvalidState);
    CHECK(evicted.error().message == "Version 1 not found");

    CHECK(ContextTracker(0).maxHistory() == 1);
}

TEST_CASE("ContextTracker - rollback keeps later history", "[session][context]") {
    ContextTracker tracker;
    auto v1 = tracker.updateState(json{{"step", 1}});
    tracker.updateState(json{{"step", 2}});
    tracker.updateState(json{{"step", 3}});

    auto rolled = tracker.rollbackTo(1);
    REQUIRE(rolled);
    CHECK(rolled.value() == v1);
    CHECK(tracker.getState() == v1);
    CHECK(tracker.getHistory().size() == 3);

    // New versions continue after the highest issued one
    auto next = tracker.updateState(json{{"step", 4}});
    CHECK(next.version == 4);

    REQUIRE(tracker.rollbackTo(3));
    CHECK(tracker.getState().data["step"] == 3);
}

TEST_CASE("ContextTracker - subscribers", "[session][context]") {
    ContextTracker tracker;
    auto sub = std::make_shared<RecordingSubscriber>();
    tracker.subscribe(sub);
    tracker.subscribe(nullptr);

    tracker.updateState(json{{"x", 1}});
    tracker.updateState(json{{"x", 2}});
    REQUIRE(tracker.rollbackTo(1));
    CHECK_FALSE(tracker.rollbackTo(42));

    REQUIRE(sub->changes.size() == 3);
    CHECK(sub->changes[0] == std::pair<uint64_t, uint64_t>{0, 1});
    CHECK(sub->changes[1] == std::pair<uint64_t, uint64_t>{1, 2});
    CHECK(sub->changes[2] == std::pair<uint64_t, uint64_t>{2, 1});
    REQUIRE(sub->errors.size() == 1);
    CHECK(sub->errors[0].code == ErrorCode::InvalidState);

    tracker.unsubscribe(sub);
    tracker.updateState(json{{"x", 3}});
    CHECK(sub->changes.size() == 3);
}

TEST_CASE("ContextTracker - subscribers may read the tracker", "[session][context]") {
    class ReadingSubscriber : public IContextSubscriber {
    public:
        explicit ReadingSubscriber(ContextTracker& t) : tracker(t) {}
        void onStateChange(const ContextState&, const ContextState& newState) override {
            seen = tracker.getState().version == newState.version;
        }
        ContextTracker& tracker;
        bool seen = false;
    };

    ContextTracker tracker;
    auto sub = std::make_shared<ReadingSubscriber>(tracker);
    tracker.subscribe(sub);
    tracker.updateState(json::object());
    CHECK(sub->seen);
}
