#include <spdlog/spdlog.h>
#include <squirrel/core/time_utils.h>
#include <squirrel/core/uuid.h>
#include <squirrel/session/state_recovery.h>

#include <algorithm>

namespace squirrel::session {

json RecoveryPoint::toJson() const {
    json j = {{"id", id},
              {"state_name", state_name},
              {"timestamp", core::formatRfc3339(timestamp)},
              {"state", state.toJson()}};
    j["metadata"] = {{"version", metadata.version},
                     {"reason", metadata.reason},
                     {"is_automatic", metadata.is_automatic},
                     {"dependencies", metadata.dependencies}};
    return j;
}

StateRecovery::StateRecovery(std::shared_ptr<StatePersistence> persistence,
                             std::size_t maxPointsPerState)
    : persistence_(std::move(persistence)),
      maxPointsPerState_(maxPointsPerState < 1 ? 1 : maxPointsPerState) {}

Result<RecoveryPoint> StateRecovery::createRecoveryPoint(const State& state,
                                                         const std::string& reason,
                                                         bool isAutomatic,
                                                         std::vector<std::string> dependencies) {
    if (auto valid = validateStateName(state.name); !valid) {
        return valid.error();
    }

    RecoveryPoint point;
    point.id = core::generateUUID();
    point.state_name = state.name;
    point.timestamp = std::chrono::system_clock::now();
    point.state = state;
    point.metadata.version = state.version;
    point.metadata.reason = reason;
    point.metadata.is_automatic = isAutomatic;
    point.metadata.dependencies = std::move(dependencies);

    // Persist then append under one lock: a failed save leaves no point behind, and the point
    // order always matches the order states reached storage.
    std::lock_guard lock(mutex_);
    if (persistence_) {
        if (auto saved = persistence_->saveState(state); !saved) {
            spdlog::error("Recovery point for '{}' not created: persisting failed: {}", state.name,
                          saved.error().message);
            return saved.error();
        }
    }

    auto& list = points_[state.name];
    list.push_back(point);
    while (list.size() > maxPointsPerState_) {
        spdlog::debug("Evicting recovery point {} for '{}'", list.front().id, state.name);
        list.erase(list.begin());
    }

    spdlog::debug("Created {} recovery point {} for '{}' at version {} ({})",
                  isAutomatic ? "automatic" : "manual", point.id, state.name, state.version, reason);
    return point;
}

Result<State> StateRecovery::recoverState(const std::string& name,
                                          const std::optional<std::string>& pointId) {
    State captured;
    {
        std::lock_guard lock(mutex_);
        auto it = points_.find(name);
        if (it == points_.end() || it->second.empty()) {
            return Error{ErrorCode::NotFound, "No recovery points for state '" + name + "'"};
        }
        const auto& list = it->second;
        if (pointId) {
            auto found = std::find_if(list.begin(), list.end(),
                                      [&](const RecoveryPoint& p) { return p.id == *pointId; });
            if (found == list.end()) {
                return Error{ErrorCode::NotFound,
                             "Recovery point '" + *pointId + "' not found for state '" + name + "'"};
            }
            captured = found->state;
        } else {
            captured = list.back().state;
        }
    }

    if (persistence_) {
        if (auto saved = persistence_->saveState(captured); !saved) {
            return saved.error();
        }
        captured.persisted = true;
    }
    spdlog::info("Recovered state '{}' to version {}", name, captured.version);
    return captured;
}

std::vector<RecoveryPoint> StateRecovery::listRecoveryPoints(const std::string& name) const {
    std::lock_guard lock(mutex_);
    auto it = points_.find(name);
    if (it == points_.end()) {
        return {};
    }
    return std::vector<RecoveryPoint>(it->second.rbegin(), it->second.rend());
}

std::size_t StateRecovery::cleanupOldPoints(std::chrono::seconds maxAge) {
    const auto cutoff = std::chrono::system_clock::now() - maxAge;
    std::size_t removed = 0;

    std::lock_guard lock(mutex_);
    for (auto it = points_.begin(); it != points_.end();) {
        auto& list = it->second;
        const auto before = list.size();
        std::erase_if(list, [&](const RecoveryPoint& p) { return p.timestamp < cutoff; });
        removed += before - list.size();
        if (list.empty()) {
            it = points_.erase(it);
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        spdlog::info("Removed {} recovery points older than {}s", removed, maxAge.count());
    }
    return removed;
}

Result<bool> StateRecovery::verifyRecoveryChain(const std::string& name) const {
    std::lock_guard lock(mutex_);
    auto it = points_.find(name);
    if (it == points_.end()) {
        return Error{ErrorCode::NotFound, "No recovery points for state '" + name + "'"};
    }

    const auto& list = it->second;
    for (std::size_t i = 1; i < list.size(); ++i) {
        if (list[i].metadata.version <= list[i - 1].metadata.version) {
            spdlog::warn("Recovery chain for '{}' broken: version {} follows {}", name,
                         list[i].metadata.version, list[i - 1].metadata.version);
            return false;
        }
    }

    for (const auto& point : list) {
        for (const auto& dep : point.metadata.dependencies) {
            auto depIt = points_.find(dep);
            if (depIt == points_.end() || depIt->second.empty()) {
                spdlog::warn("Recovery chain for '{}' broken: dependency '{}' has no recovery points",
                             name, dep);
                return false;
            }
        }
    }
    return true;
}

} // namespace squirrel::session
