#pragma once

#include <boost/asio/thread_pool.hpp>
#include <squirrel/mcp/protocol.h>

#include <atomic>
#include <future>
#include <memory>
#include <mutex>

namespace squirrel::mcp {

// Runs MCPProtocol::handleMessage on a Boost.Asio thread pool.
class MessageDispatcher {
public:
    static constexpr std::size_t kDefaultThreads = 2;

    explicit MessageDispatcher(std::shared_ptr<MCPProtocol> protocol,
                               std::size_t threads = kDefaultThreads);
    ~MessageDispatcher();

    MessageDispatcher(const MessageDispatcher&) = delete;
    MessageDispatcher& operator=(const MessageDispatcher&) = delete;

    // After stop() the future is ready and holds InvalidState.
    std::future<Result<Response>> submit(Message message);

    // Waits for queued work, then joins the pool. Idempotent.
    void stop();

    bool stopped() const noexcept { return stopped_.load(std::memory_order_acquire); }
    std::size_t threadCount() const noexcept { return threads_; }

private:
    std::shared_ptr<MCPProtocol> protocol_;
    std::size_t threads_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
    std::atomic<bool> stopped_{false};
    std::mutex stopMutex_;
};

} // namespace squirrel::mcp
