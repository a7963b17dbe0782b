#include <spdlog/spdlog.h>
#include <squirrel/core/time_utils.h>
#include <squirrel/mcp/protocol.h>

#include <mutex>

namespace squirrel::mcp {

namespace {

class FunctionHandler final : public IMessageHandler {
public:
    explicit FunctionHandler(HandlerFunction fn) : fn_(std::move(fn)) {}

    Result<Response> handle(const Message& message) override { return fn_(message); }

private:
    HandlerFunction fn_;
};

} // namespace

MessageHandlerPtr makeHandler(HandlerFunction fn) {
    if (!fn) {
        return nullptr;
    }
    return std::make_shared<FunctionHandler>(std::move(fn));
}

json InternalState::toJson() const {
    return json{{"initialized", initialized}, {"config", config.toJson()}};
}

Result<InternalState> InternalState::fromJson(const json& j) {
    auto initialized = json_utils::get_field<bool>(j, "initialized");
    if (!initialized)
        return initialized.error();
    if (!j.contains("config"))
        return Error{ErrorCode::InvalidData, "Missing required field: config"};
    auto config = ProtocolConfig::fromJson(j["config"]);
    if (!config)
        return config.error();

    InternalState state;
    state.initialized = initialized.value();
    state.config = std::move(config).value();
    return state;
}

std::string routeKey(MessageType type, const std::optional<std::string>& subtype) {
    std::string key = toString(type);
    if (subtype) {
        key += ":";
        key += *subtype;
    }
    return key;
}

MCPProtocol::MCPProtocol() = default;

MCPProtocol::MCPProtocol(ProtocolConfig config) : config_(std::move(config)) {}

Result<void> MCPProtocol::initialize() {
    std::unique_lock lock(stateMutex_);
    return initializeLocked(config_);
}

Result<void> MCPProtocol::initializeWithConfig(ProtocolConfig config) {
    std::unique_lock lock(stateMutex_);
    return initializeLocked(std::move(config));
}

Result<void> MCPProtocol::reinitialize(ProtocolConfig config) {
    std::unique_lock lock(stateMutex_);
    spdlog::info("Re-initializing protocol with version {}", config.version);
    lifecycle_.reset();
    initialized_ = false;
    serializedState_.clear();
    return initializeLocked(std::move(config));
}

Result<void> MCPProtocol::initializeLocked(ProtocolConfig config) {
    if (initialized_) {
        return Error{ErrorCode::ProtocolAlreadyInitialized,
                     fmt::format("Protocol already initialized with version {}", config_.version)};
    }

    const auto prev = lifecycle_.state();
    if (prev == ProtocolState::ShuttingDown || prev == ProtocolState::Error) {
        return Error{ErrorCode::InvalidState,
                     fmt::format("Cannot initialize protocol from state {}", toString(prev))};
    }

    if (auto r = lifecycle_.transitionTo(ProtocolState::Initializing); !r) {
        return r;
    }

    InternalState record{true, config};
    auto text = json_utils::dump_json(record.toJson(), -1, ErrorCode::StateSerialization);
    if (!text) {
        lifecycle_.restoreIf(ProtocolState::Initializing, prev);
        spdlog::error("Protocol initialization aborted: {}", text.error().message);
        return text.error();
    }

    if (auto r = lifecycle_.transitionTo(ProtocolState::Initialized); !r) {
        return r;
    }

    initialized_ = true;
    config_ = std::move(config);
    serializedState_ = std::move(text).value();
    spdlog::info("Protocol initialized (version={}, max_message_size={}, timeout_ms={})",
                 config_.version, config_.max_message_size, config_.timeout_ms);
    return {};
}

Result<void> MCPProtocol::setState(ProtocolState state) {
    // Initializing, Initialized and Ready are only reachable through initialize().
    if ((state == ProtocolState::Initializing || state == ProtocolState::Initialized ||
         state == ProtocolState::Ready) &&
        !isInitialized()) {
        return Error{ErrorCode::ProtocolNotInitialized,
                     fmt::format("Cannot enter state {} before initialize()", toString(state))};
    }
    return lifecycle_.transitionTo(state);
}

Result<void> MCPProtocol::markReady() {
    if (!isInitialized()) {
        return Error{ErrorCode::ProtocolNotInitialized, "Cannot mark protocol ready before initialize()"};
    }
    return lifecycle_.transitionTo(ProtocolState::Ready);
}

Result<void> MCPProtocol::shutdown() {
    return lifecycle_.transitionTo(ProtocolState::ShuttingDown);
}

Result<void> MCPProtocol::fail(const std::string& reason) {
    return lifecycle_.transitionTo(ProtocolState::Error, reason);
}

bool MCPProtocol::isInitialized() const {
    std::shared_lock lock(stateMutex_);
    return initialized_;
}

ProtocolConfig MCPProtocol::config() const {
    std::shared_lock lock(stateMutex_);
    return config_;
}

std::string MCPProtocol::version() const {
    std::shared_lock lock(stateMutex_);
    return config_.version;
}

Result<InternalState> MCPProtocol::internalState() const {
    std::string text;
    {
        std::shared_lock lock(stateMutex_);
        if (!initialized_) {
            return Error{ErrorCode::InvalidState, "Protocol has no internal state before initialize()"};
        }
        text = serializedState_;
    }

    auto parsed = json_utils::parse_json(text);
    if (!parsed) {
        return Error{ErrorCode::InvalidState, parsed.error().message};
    }
    auto state = InternalState::fromJson(parsed.value());
    if (!state) {
        return Error{ErrorCode::InvalidState, state.error().message};
    }
    return state;
}

Result<void> MCPProtocol::validateMessage(const Message& message) const {
    return MessageValidator::validate(message, config());
}

Result<Response> MCPProtocol::handleMessage(const Message& message) {
    ProtocolConfig cfg;
    {
        std::shared_lock lock(stateMutex_);
        if (!initialized_) {
            return Error{ErrorCode::ProtocolNotInitialized,
                         fmt::format("Cannot handle message {}: protocol not initialized", message.id)};
        }
        cfg = config_;
    }

    const auto current = lifecycle_.state();
    if (current != ProtocolState::Ready) {
        return Error{ErrorCode::ProtocolNotReady,
                     fmt::format("Cannot handle message {}: protocol state is {}", message.id,
                                 toString(current))};
    }

    if (auto valid = MessageValidator::validate(message, cfg); !valid) {
        spdlog::warn("Rejected message {}: {}", message.id, valid.error().message);
        return valid.error();
    }

    auto resolved = resolve(message);
    if (!resolved) {
        return Error{ErrorCode::HandlerNotFound,
                     fmt::format("No handler registered for {} message {}",
                                 toString(message.message_type), message.id)};
    }

    spdlog::debug("Dispatching message {} to handler '{}'", message.id, resolved->first);
    try {
        return resolved->second->handle(message);
    } catch (const std::exception& e) {
        spdlog::error("Handler '{}' threw while handling message {}: {}", resolved->first,
                      message.id, e.what());
        return Error{ErrorCode::InternalError,
                     fmt::format("Handler '{}' failed: {}", resolved->first, e.what())};
    } catch (...) {
        spdlog::error("Handler '{}' threw a non-standard exception for message {}",
                      resolved->first, message.id);
        return Error{ErrorCode::InternalError,
                     fmt::format("Handler '{}' failed with a non-standard exception",
                                 resolved->first)};
    }
}

Result<std::string> MCPProtocol::routeMessage(const Message& message) const {
    ProtocolConfig cfg;
    {
        std::shared_lock lock(stateMutex_);
        if (!initialized_) {
            return Error{ErrorCode::ProtocolNotInitialized,
                         fmt::format("Cannot route message {}: protocol not initialized", message.id)};
        }
        cfg = config_;
    }

    if (auto valid = MessageValidator::validate(message, cfg); !valid) {
        spdlog::warn("Rejected message {} during routing: {}", message.id, valid.error().message);
        return valid.error();
    }

    switch (message.message_type) {
        case MessageType::Command:
        case MessageType::Request:
        case MessageType::Event: {
            auto resolved = resolve(message);
            if (!resolved) {
                return Error{ErrorCode::HandlerNotFound,
                             fmt::format("No route for {} message {}",
                                         toString(message.message_type), message.id)};
            }
            spdlog::debug("Routed message {} to '{}'", message.id, resolved->first);
            return resolved->first;
        }
        case MessageType::Response: {
            const auto& payload = message.payload;
            if (!payload.is_object() || !payload.contains("message_id") ||
                !payload["message_id"].is_string()) {
                return Error{ErrorCode::InvalidFormat,
                             fmt::format("Response {} does not reference a message_id", message.id)};
            }
            spdlog::debug("Routed response {} for request {}", message.id,
                          payload["message_id"].get<std::string>());
            return routeKey(MessageType::Response);
        }
        case MessageType::Error: {
            const auto key = routeKey(MessageType::Error);
            if (hasHandler(key)) {
                return key;
            }
            spdlog::warn("Unhandled error message {}: {}", message.id,
                         message.error.value_or("<no error text>"));
            return std::string{};
        }
        case MessageType::Unknown:
            break;
    }
    return Error{ErrorCode::InvalidFormat, "Unknown message type"};
}

Response MCPProtocol::createResponse(const Message& message, ResponseStatus status, json payload,
                                     std::optional<std::string> errorMessage) const {
    Response response;
    response.message_id = message.id;
    response.protocol_version = version();
    response.status = status;
    response.payload = std::move(payload);
    response.error_message = std::move(errorMessage);

    MessageMetadata meta;
    meta.timestamp = core::nowUnixSeconds();
    meta.correlation_id = message.id;
    response.metadata = std::move(meta);
    return response;
}

Result<void> MCPProtocol::registerHandler(MessageType type, MessageHandlerPtr handler) {
    if (type == MessageType::Unknown) {
        return Error{ErrorCode::InvalidArgument, "Cannot register a handler for Unknown messages"};
    }
    return insertHandler(routeKey(type), std::move(handler));
}

Result<void> MCPProtocol::registerHandler(MessageType type, const std::string& subtype,
                                          MessageHandlerPtr handler) {
    if (type != MessageType::Command && type != MessageType::Event) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Subtype handlers are only supported for Command and Event, got {}",
                                 toString(type))};
    }
    if (subtype.empty()) {
        return Error{ErrorCode::InvalidArgument, "Handler subtype must not be empty"};
    }
    return insertHandler(routeKey(type, subtype), std::move(handler));
}

Result<void> MCPProtocol::unregisterHandler(MessageType type) {
    return eraseHandler(routeKey(type));
}

Result<void> MCPProtocol::unregisterHandler(MessageType type, const std::string& subtype) {
    return eraseHandler(routeKey(type, subtype));
}

Result<void> MCPProtocol::insertHandler(const std::string& key, MessageHandlerPtr handler) {
    if (!handler) {
        return Error{ErrorCode::InvalidArgument, fmt::format("Null handler for '{}'", key)};
    }
    std::unique_lock lock(handlersMutex_);
    auto [it, inserted] = handlers_.try_emplace(key, std::move(handler));
    if (!inserted) {
        return Error{ErrorCode::HandlerAlreadyExists,
                     fmt::format("Handler already registered for '{}'", key)};
    }
    spdlog::debug("Registered handler '{}'", key);
    return {};
}

Result<void> MCPProtocol::eraseHandler(const std::string& key) {
    std::unique_lock lock(handlersMutex_);
    if (handlers_.erase(key) == 0) {
        return Error{ErrorCode::HandlerNotFound, fmt::format("No handler registered for '{}'", key)};
    }
    spdlog::debug("Unregistered handler '{}'", key);
    return {};
}

bool MCPProtocol::hasHandler(const std::string& key) const {
    std::shared_lock lock(handlersMutex_);
    return handlers_.contains(key);
}

std::size_t MCPProtocol::handlerCount() const {
    std::shared_lock lock(handlersMutex_);
    return handlers_.size();
}

std::optional<std::pair<std::string, MessageHandlerPtr>>
MCPProtocol::resolve(const Message& message) const {
    std::shared_lock lock(handlersMutex_);
    if (auto sub = message.subtype()) {
        auto key = routeKey(message.message_type, sub);
        if (auto it = handlers_.find(key); it != handlers_.end()) {
            return std::make_pair(it->first, it->second);
        }
    }
    auto key = routeKey(message.message_type);
    if (auto it = handlers_.find(key); it != handlers_.end()) {
        return std::make_pair(it->first, it->second);
    }
    return std::nullopt;
}

} // namespace squirrel::mcp
