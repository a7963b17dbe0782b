#include <catch2/catch_test_macros.hpp>
#include <squirrel/mcp/message_dispatcher.h>

#include <atomic>
#include <chrono>
#include <future>
#include <vector>

using namespace squirrel;
using namespace squirrel::mcp;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<MCPProtocol> readyProtocol(std::atomic<int>& calls) {
    auto protocol = std::make_shared<MCPProtocol>();
    REQUIRE(protocol->initialize());
    REQUIRE(protocol->markReady());
    auto* raw = protocol.get();
    REQUIRE(protocol->registerHandler(
        MessageType::Command, makeHandler([raw, &calls](const Message& msg) -> Result<Response> {
            ++calls;
            return raw->createResponse(msg, ResponseStatus::Success, json{{"ok", true}});
        })));
    return protocol;
}

} // namespace

TEST_CASE("MessageDispatcher - handles messages on the pool", "[mcp][dispatcher]") {
    std::atomic<int> calls{0};
    auto protocol = readyProtocol(calls);
    MessageDispatcher dispatcher(protocol, 4);
    CHECK(dispatcher.threadCount() == 4);

    std::vector<std::future<Result<Response>>> futures;
    std::vector<std::string> ids;
    for (int i = 0; i < 16; ++i) {
        auto msg = Message::create(MessageType::Command, json::object());
        ids.push_back(msg.id);
        futures.push_back(dispatcher.submit(std::move(msg)));
    }

    for (std::size_t i = 0; i < futures.size(); ++i) {
        REQUIRE(futures[i].wait_for(10s) == std::future_status::ready);
        auto r = futures[i].get();
        REQUIRE(r);
        CHECK(r.value().message_id == ids[i]);
    }
    CHECK(calls.load() == 16);
}

TEST_CASE("MessageDispatcher - errors come back through the future", "[mcp][dispatcher]") {
    std::atomic<int> calls{0};
    auto protocol = readyProtocol(calls);
    MessageDispatcher dispatcher(protocol);

    auto fut = dispatcher.submit(Message::create(MessageType::Request, json::object()));
    REQUIRE(fut.wait_for(10s) == std::future_status::ready);
    auto r = fut.get();
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::HandlerNotFound);
    CHECK(calls.load() == 0);
}

TEST_CASE("MessageDispatcher - stop", "[mcp][dispatcher]") {
    std::atomic<int> calls{0};
    auto protocol = readyProtocol(calls);
    MessageDispatcher dispatcher(protocol, 0);
    CHECK(dispatcher.threadCount() == 1);

    auto queued = dispatcher.submit(Message::create(MessageType::Command, json::object()));
    dispatcher.stop();
    CHECK(dispatcher.stopped());

    // Work queued before stop() completes
    REQUIRE(queued.wait_for(0s) == std::future_status::ready);
    CHECK(queued.get());

    auto late = dispatcher.submit(Message::create(MessageType::Command, json::object()));
    REQUIRE(late.wait_for(0s) == std::future_status::ready);
    auto r = late.get();
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::InvalidState);

    dispatcher.stop();
    CHECK(calls.load() == 1);
}
