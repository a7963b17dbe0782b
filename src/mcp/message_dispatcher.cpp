#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <squirrel/mcp/message_dispatcher.h>

namespace squirrel::mcp {

MessageDispatcher::MessageDispatcher(std::shared_ptr<MCPProtocol> protocol, std::size_t threads)
    : protocol_(std::move(protocol)), threads_(threads < 1 ? 1 : threads),
      pool_(std::make_unique<boost::asio::thread_pool>(threads_)) {
    spdlog::debug("MessageDispatcher started with {} threads", threads_);
}

MessageDispatcher::~MessageDispatcher() {
    stop();
}

std::future<Result<Response>> MessageDispatcher::submit(Message message) {
    auto promise = std::make_shared<std::promise<Result<Response>>>();
    auto future = promise->get_future();

    std::lock_guard lock(stopMutex_);
    if (stopped_.load(std::memory_order_acquire) || !protocol_) {
        promise->set_value(Error{ErrorCode::InvalidState,
                                 fmt::format("Dispatcher is stopped; message {} not submitted",
                                             message.id)});
        return future;
    }

    boost::asio::post(*pool_, [protocol = protocol_, promise, msg = std::move(message)]() {
        try {
            promise->set_value(protocol->handleMessage(msg));
        } catch (const std::exception& e) {
            promise->set_value(Error{ErrorCode::InternalError,
                                     fmt::format("Dispatch of message {} failed: {}", msg.id,
                                                 e.what())});
        }
    });
    return future;
}

void MessageDispatcher::stop() {
    std::lock_guard lock(stopMutex_);
    if (stopped_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    pool_->join();
    spdlog::debug("MessageDispatcher stopped");
}

} // namespace squirrel::mcp
