#include <spdlog/spdlog.h>
#include <squirrel/core/uuid.h>
#include <squirrel/session/state_manager.h>

#include <algorithm>
#include <mutex>

namespace squirrel::session {

namespace {

std::shared_ptr<IStateStorage> storageFor(const SessionConfig& config) {
    if (config.storage_path.empty()) {
        return createMemoryStateStorage();
    }
    return createFileStateStorage(config.storage_path);
}

} // namespace

StateManager::StateManager(const SessionConfig& config)
    : StateManager(storageFor(config), config.max_recovery_points) {}

StateManager::StateManager(std::shared_ptr<IStateStorage> storage, std::size_t maxRecoveryPoints)
    : persistence_(std::make_shared<StatePersistence>(std::move(storage))),
      recovery_(std::make_unique<StateRecovery>(persistence_, maxRecoveryPoints)) {
    spdlog::debug("StateManager using {} storage, {} recovery points per state",
                  persistence_->storage().type(), recovery_->maxPointsPerState());
}

std::shared_ptr<std::mutex> StateManager::recordLock(const std::string& name) {
    std::lock_guard lock(recordLocksMutex_);
    auto& slot = recordLocks_[name];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

Result<void> StateManager::registerState(const std::string& name, State state) {
    if (auto valid = validateStateName(name); !valid) {
        return valid;
    }
    state.name = name;

    auto record = recordLock(name);
    std::lock_guard recordGuard(*record);

    auto point = recovery_->createRecoveryPoint(state, "Initial state registration", true);
    if (!point) {
        return point.error();
    }
    state.persisted = true;

    {
        std::unique_lock lock(statesMutex_);
        states_.insert_or_assign(name, std::move(state));
    }
    spdlog::debug("Registered state '{}'", name);
    return {};
}

void StateManager::registerTransition(StateTransition transition) {
    std::unique_lock lock(transitionsMutex_);
    spdlog::debug("Registered transition '{}' -> '{}'", transition.from_state,
                  transition.to_state);
    auto from = transition.from_state;
    transitions_[from].push_back(std::move(transition));
}

Result<void> StateManager::transitionState(const std::string& from, const std::string& to,
                                           std::optional<json> metadata) {
    bool hasEdges = false;
    bool allowed = false;
    {
        std::shared_lock lock(transitionsMutex_);
        if (auto it = transitions_.find(from); it != transitions_.end()) {
            hasEdges = !it->second.empty();
            allowed = std::any_of(it->second.begin(), it->second.end(),
                                  [&](const StateTransition& t) { return t.to_state == to; });
        }
    }
    if (!allowed) {
        bool knownState = false;
        {
            std::shared_lock lock(statesMutex_);
            knownState = states_.contains(from);
        }
        // A registered state without outgoing edges is still a known endpoint.
        if (!hasEdges && !knownState) {
            return Error{ErrorCode::NotFound, "State '" + from + "' not found"};
        }
        return Error{ErrorCode::InvalidTransition,
                     "Invalid transition from '" + from + "' to '" + to + "'"};
    }

    auto record = recordLock(to);
    std::lock_guard recordGuard(*record);

    State target;
    {
        std::shared_lock lock(statesMutex_);
        auto it = states_.find(to);
        if (it == states_.end()) {
            return Error{ErrorCode::NotFound, "State '" + to + "' not found"};
        }
        target = it->second;
    }
    target.touch();

    auto point =
        recovery_->createRecoveryPoint(target, "Transition from " + from + " to " + to, true, {from});
    if (!point) {
        spdlog::error("Transition '{}' -> '{}' not applied: {}", from, to, point.error().message);
        return point.error();
    }
    target.persisted = true;

    StateHistoryEntry entry;
    entry.id = core::generateUUID();
    entry.from_state = from;
    entry.to_state = to;
    entry.version = target.version;
    entry.timestamp = target.updated_at;
    entry.metadata = std::move(metadata);

    {
        std::unique_lock statesLock(statesMutex_);
        states_.insert_or_assign(to, target);
        std::unique_lock historyLock(historyMutex_);
        history_.push_back(std::move(entry));
    }
    spdlog::info("State transition '{}' -> '{}' (version {})", from, to, target.version);
    return {};
}

Result<State> StateManager::updateState(const std::string& name, json data) {
    auto record = recordLock(name);
    std::lock_guard recordGuard(*record);
    std::unique_lock lock(statesMutex_);
    auto it = states_.find(name);
    if (it == states_.end()) {
        return Error{ErrorCode::NotFound, "State '" + name + "' not found"};
    }
    it->second.update(std::move(data));
    return it->second;
}

Result<State> StateManager::setStateValue(const std::string& name, const std::string& key,
                                          json value) {
    auto record = recordLock(name);
    std::lock_guard recordGuard(*record);
    std::unique_lock lock(statesMutex_);
    auto it = states_.find(name);
    if (it == states_.end()) {
        return Error{ErrorCode::NotFound, "State '" + name + "' not found"};
    }
    if (auto set = it->second.set(key, std::move(value)); !set) {
        return set.error();
    }
    return it->second;
}

Result<void> StateManager::persistState(const std::string& name) {
    auto record = recordLock(name);
    std::lock_guard recordGuard(*record);

    State snapshot;
    {
        std::shared_lock lock(statesMutex_);
        auto it = states_.find(name);
        if (it == states_.end()) {
            return Error{ErrorCode::NotFound, "State '" + name + "' not found"};
        }
        snapshot = it->second;
    }

    if (auto saved = persistence_->saveState(snapshot); !saved) {
        return saved;
    }

    std::unique_lock lock(statesMutex_);
    if (auto it = states_.find(name); it != states_.end()) {
        it->second.persisted = true;
    }
    return {};
}

Result<State> StateManager::getState(const std::string& name) {
    {
        std::shared_lock lock(statesMutex_);
        if (auto it = states_.find(name); it != states_.end()) {
            return it->second;
        }
    }

    auto loaded = persistence_->loadState(name);
    if (!loaded) {
        return loaded.error();
    }

    std::unique_lock lock(statesMutex_);
    auto [it, inserted] = states_.try_emplace(name, std::move(loaded).value());
    if (inserted) {
        spdlog::debug("Cached persisted state '{}' (version {})", name, it->second.version);
    }
    return it->second;
}

std::vector<std::string> StateManager::getValidTransitions(const std::string& from) const {
    std::shared_lock lock(transitionsMutex_);
    std::vector<std::string> targets;
    auto it = transitions_.find(from);
    if (it == transitions_.end()) {
        return targets;
    }
    targets.reserve(it->second.size());
    for (const auto& t : it->second) {
        targets.push_back(t.to_state);
    }
    return targets;
}

std::vector<StateHistoryEntry> StateManager::getHistory() const {
    std::shared_lock lock(historyMutex_);
    return history_;
}

std::vector<std::string> StateManager::stateNames() const {
    std::shared_lock lock(statesMutex_);
    std::vector<std::string> names;
    names.reserve(states_.size());
    for (const auto& [name, _] : states_) {
        names.push_back(name);
    }
    return names;
}

Result<bool> StateManager::applyRemoteState(State state) {
    if (auto valid = validateStateName(state.name); !valid) {
        return valid.error();
    }

    auto record = recordLock(state.name);
    std::lock_guard recordGuard(*record);
    std::unique_lock lock(statesMutex_);
    auto it = states_.find(state.name);
    if (it != states_.end() && state.version <= it->second.version) {
        spdlog::debug("Ignoring remote state '{}' version {} (local version {})", state.name,
                      state.version, it->second.version);
        return false;
    }
    spdlog::debug("Applying remote state '{}' version {}", state.name, state.version);
    state.persisted = false;
    const auto name = state.name;
    states_.insert_or_assign(name, std::move(state));
    return true;
}

Result<std::size_t> StateManager::loadPersistedStates() {
    auto names = persistence_->listStates();
    if (!names) {
        return names.error();
    }

    std::size_t loaded = 0;
    for (const auto& name : names.value()) {
        auto record = recordLock(name);
        std::lock_guard recordGuard(*record);
        auto state = persistence_->loadState(name);
        if (!state) {
            spdlog::warn("Skipping persisted state '{}': {}", name, state.error().message);
            continue;
        }
        std::unique_lock lock(statesMutex_);
        auto it = states_.find(name);
        if (it == states_.end() || it->second.version < state.value().version) {
            states_.insert_or_assign(name, std::move(state).value());
            ++loaded;
        }
    }
    spdlog::info("Loaded {} persisted states", loaded);
    return loaded;
}

Result<void> StateManager::deleteState(const std::string& name) {
    if (auto valid = validateStateName(name); !valid) {
        return valid;
    }
    auto record = recordLock(name);
    std::lock_guard recordGuard(*record);
    {
        std::unique_lock lock(statesMutex_);
        states_.erase(name);
    }
    return persistence_->deleteState(name);
}

Result<State> StateManager::recoverState(const std::string& name,
                                         const std::optional<std::string>& pointId) {
    auto record = recordLock(name);
    std::lock_guard recordGuard(*record);
    auto recovered = recovery_->recoverState(name, pointId);
    if (!recovered) {
        return recovered.error();
    }
    std::unique_lock lock(statesMutex_);
    states_.insert_or_assign(name, recovered.value());
    return recovered;
}

std::vector<RecoveryPoint> StateManager::listRecoveryPoints(const std::string& name) const {
    return recovery_->listRecoveryPoints(name);
}

Result<bool> StateManager::verifyStateIntegrity(const std::string& name) const {
    auto chain = recovery_->verifyRecoveryChain(name);
    if (!chain || !chain.value()) {
        return chain;
    }

    auto stored = persistence_->loadState(name);
    if (!stored) {
        if (stored.error().code == ErrorCode::InvalidData) {
            spdlog::warn("State '{}' failed integrity check: {}", name, stored.error().message);
            return false;
        }
        if (stored.error().code != ErrorCode::NotFound) {
            return stored.error();
        }
    }
    return true;
}

std::size_t StateManager::cleanupRecoveryPoints(std::chrono::seconds maxAge) {
    return recovery_->cleanupOldPoints(maxAge);
}

} // namespace squirrel::session
