#pragma once

#include <squirrel/session/state.h>
#include <squirrel/session/state_persistence.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace squirrel::session {

struct RecoveryMetadata {
    uint64_t version = 0;
    std::string reason;
    bool is_automatic = false;
    std::vector<std::string> dependencies;
};

// Immutable capture of a State at one version.
struct RecoveryPoint {
    std::string id;
    std::string state_name;
    TimePoint timestamp{};
    State state;
    RecoveryMetadata metadata;

    json toJson() const;
};

class StateRecovery {
public:
    static constexpr std::size_t kDefaultMaxPointsPerState = 10;

    explicit StateRecovery(std::shared_ptr<StatePersistence> persistence,
                           std::size_t maxPointsPerState = kDefaultMaxPointsPerState);

    StateRecovery(const StateRecovery&) = delete;
    StateRecovery& operator=(const StateRecovery&) = delete;

    // Persists `state` as current, then appends a point (oldest evicted past the cap). A failed
    // save returns the error and records no point.
    Result<RecoveryPoint> createRecoveryPoint(const State& state, const std::string& reason,
                                              bool isAutomatic,
                                              std::vector<std::string> dependencies = {});

    // Re-persists the captured state of the given (or latest) point and returns it.
    Result<State> recoverState(const std::string& name,
                               const std::optional<std::string>& pointId = std::nullopt);

    // Newest first. Empty when none.
    std::vector<RecoveryPoint> listRecoveryPoints(const std::string& name) const;

    // Drops points older than maxAge. Returns how many were removed.
    std::size_t cleanupOldPoints(std::chrono::seconds maxAge);

    // NotFound for an unknown name; false on the first broken version order or missing dependency.
    Result<bool> verifyRecoveryChain(const std::string& name) const;

    std::size_t maxPointsPerState() const noexcept { return maxPointsPerState_; }

private:
    std::shared_ptr<StatePersistence> persistence_;
    std::size_t maxPointsPerState_;
    mutable std::mutex mutex_;
    // Oldest first per name.
    std::unordered_map<std::string, std::vector<RecoveryPoint>> points_;
};

} // namespace squirrel::session
