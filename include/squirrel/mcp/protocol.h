#pragma once

#include <squirrel/mcp/message.h>
#include <squirrel/mcp/message_validator.h>
#include <squirrel/mcp/protocol_config.h>
#include <squirrel/mcp/protocol_lifecycle.h>

#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace squirrel::mcp {

class IMessageHandler {
public:
    virtual ~IMessageHandler() = default;
    virtual Result<Response> handle(const Message& message) = 0;
};

using MessageHandlerPtr = std::shared_ptr<IMessageHandler>;
using HandlerFunction = std::function<Result<Response>(const Message&)>;

// Adapts a callable into a handler. Returns nullptr for an empty function.
MessageHandlerPtr makeHandler(HandlerFunction fn);

// Record serialised on initialisation; deserialised by MCPProtocol::internalState().
struct InternalState {
    bool initialized = false;
    ProtocolConfig config;

    json toJson() const;
    static Result<InternalState> fromJson(const json& j);
};

// "Command" or "Command:<subtype>"
std::string routeKey(MessageType type, const std::optional<std::string>& subtype = std::nullopt);

/**
 * Protocol instance: lifecycle gating, validation and per-type handler dispatch.
 *
 * The handler table, the lifecycle and the initialisation record each sit behind their own
 * lock. Handlers run outside every lock, so they may call back into the protocol.
 */
class MCPProtocol {
public:
    MCPProtocol();
    explicit MCPProtocol(ProtocolConfig config);
    ~MCPProtocol() = default;

    MCPProtocol(const MCPProtocol&) = delete;
    MCPProtocol& operator=(const MCPProtocol&) = delete;

    // Lifecycle
    Result<void> initialize();
    Result<void> initializeWithConfig(ProtocolConfig config);
    // Only way out of ShuttingDown/Error.
    Result<void> reinitialize(ProtocolConfig config);

    // ProtocolNotInitialized for Initializing/Initialized/Ready before initialize().
    Result<void> setState(ProtocolState state);
    Result<void> markReady();
    Result<void> shutdown();
    Result<void> fail(const std::string& reason);

    // Messaging
    Result<Response> handleMessage(const Message& message);
    // Returns the handler key the message would be routed to. Empty for an unhandled Error.
    Result<std::string> routeMessage(const Message& message) const;
    Result<void> validateMessage(const Message& message) const;

    Response createResponse(const Message& message, ResponseStatus status,
                            json payload = json::object(),
                            std::optional<std::string> errorMessage = std::nullopt) const;

    // Handler table
    Result<void> registerHandler(MessageType type, MessageHandlerPtr handler);
    Result<void> registerHandler(MessageType type, const std::string& subtype,
                                 MessageHandlerPtr handler);
    Result<void> unregisterHandler(MessageType type);
    Result<void> unregisterHandler(MessageType type, const std::string& subtype);
    bool hasHandler(const std::string& key) const;
    std::size_t handlerCount() const;

    // Accessors
    ProtocolState state() const { return lifecycle_.state(); }
    ProtocolLifecycleSnapshot lifecycleSnapshot() const { return lifecycle_.snapshot(); }
    bool isInitialized() const;
    ProtocolConfig config() const;
    std::string version() const;
    Result<InternalState> internalState() const;

private:
    Result<void> initializeLocked(ProtocolConfig config);
    Result<void> insertHandler(const std::string& key, MessageHandlerPtr handler);
    Result<void> eraseHandler(const std::string& key);
    // Specialised key first, then the type key. Empty when neither is registered.
    std::optional<std::pair<std::string, MessageHandlerPtr>> resolve(const Message& message) const;

    ProtocolLifecycle lifecycle_;

    mutable std::shared_mutex stateMutex_;
    bool initialized_ = false;
    ProtocolConfig config_;
    std::string serializedState_;

    mutable std::shared_mutex handlersMutex_;
    std::unordered_map<std::string, MessageHandlerPtr> handlers_;
};

} // namespace squirrel::mcp
