#pragma once

#include <squirrel/session/state.h>
#include <squirrel/session/state_persistence.h>
#include <squirrel/session/state_recovery.h>
#include <squirrel/session/state_storage.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace squirrel::session {

struct SessionConfig {
    std::filesystem::path storage_path;
    std::size_t max_recovery_points = StateRecovery::kDefaultMaxPointsPerState;
    std::size_t max_context_history = 100;
};

/**
 * Named states, a transition table between them and an append-only transition history.
 *
 * Operations that change or persist a named state hold that name's record lock for their whole
 * duration, so history, recovery points and storage see one name's versions in the same order.
 * Lock order is record, then states, then history. Every accessor returns a copy.
 */
class StateManager {
public:
    // File-backed under config.storage_path, or in memory when the path is empty.
    explicit StateManager(const SessionConfig& config);
    StateManager(std::shared_ptr<IStateStorage> storage, std::size_t maxRecoveryPoints);

    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    // Insert or overwrite; the key is authoritative for state.name.
    Result<void> registerState(const std::string& name, State state);
    void registerTransition(StateTransition transition);

    // The target is bumped, persisted with a recovery point, then published with its history
    // entry. A failed persist leaves memory and history untouched.
    Result<void> transitionState(const std::string& from, const std::string& to,
                                 std::optional<json> metadata = std::nullopt);

    Result<State> updateState(const std::string& name, json data);
    Result<State> setStateValue(const std::string& name, const std::string& key, json value);
    Result<void> persistState(const std::string& name);

    // Memory first, then persistence; a loaded state is cached.
    Result<State> getState(const std::string& name);
    std::vector<std::string> getValidTransitions(const std::string& from) const;
    std::vector<StateHistoryEntry> getHistory() const;
    std::vector<std::string> stateNames() const;

    // Applies only a strictly newer version. Returns whether it was applied.
    Result<bool> applyRemoteState(State state);

    // Returns how many states were loaded.
    Result<std::size_t> loadPersistedStates();
    Result<void> deleteState(const std::string& name);

    Result<State> recoverState(const std::string& name,
                               const std::optional<std::string>& pointId = std::nullopt);
    std::vector<RecoveryPoint> listRecoveryPoints(const std::string& name) const;
    Result<bool> verifyStateIntegrity(const std::string& name) const;
    std::size_t cleanupRecoveryPoints(std::chrono::seconds maxAge);

    StatePersistence& persistence() noexcept { return *persistence_; }
    StateRecovery& recovery() noexcept { return *recovery_; }

private:
    std::shared_ptr<std::mutex> recordLock(const std::string& name);

    std::shared_ptr<StatePersistence> persistence_;
    std::unique_ptr<StateRecovery> recovery_;

    std::mutex recordLocksMutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> recordLocks_;

    mutable std::shared_mutex statesMutex_;
    std::map<std::string, State> states_;

    mutable std::shared_mutex transitionsMutex_;
    std::map<std::string, std::vector<StateTransition>> transitions_;

    mutable std::shared_mutex historyMutex_;
    std::vector<StateHistoryEntry> history_;
};

} // namespace squirrel::session
