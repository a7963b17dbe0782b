#pragma once

#include <squirrel/core/json_utils.h>
#include <squirrel/core/types.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace squirrel::session {

struct ContextState {
    uint64_t version = 0;
    json data;
    TimePoint last_modified{};

    bool operator==(const ContextState&) const = default;
};

struct ContextSnapshot {
    std::string id; // "snapshot_<version>"
    TimePoint timestamp{};
    ContextState state;
    std::optional<json> metadata;
};

class IContextSubscriber {
public:
    virtual ~IContextSubscriber() = default;
    virtual void onStateChange(const ContextState& oldState, const ContextState& newState) = 0;
    virtual void onError(const Error& error) { (void)error; }
};

/**
 * Single versioned context with a bounded snapshot history.
 *
 * History is an append-only audit log: rollback restores a snapshot's state but keeps later
 * entries, and versions are never reissued, so each version names exactly one snapshot.
 * Subscribers are called synchronously after the tracker lock is released.
 */
class ContextTracker {
public:
    static constexpr std::size_t kDefaultMaxHistory = 100;

    explicit ContextTracker(std::size_t maxHistory = kDefaultMaxHistory);

    ContextTracker(const ContextTracker&) = delete;
    ContextTracker& operator=(const ContextTracker&) = delete;

    void subscribe(std::shared_ptr<IContextSubscriber> subscriber);
    void unsubscribe(const std::shared_ptr<IContextSubscriber>& subscriber);

    // Returns the new state.
    ContextState updateState(json data, std::optional<json> metadata = std::nullopt);

    Result<ContextState> rollbackTo(uint64_t version);

    ContextState getState() const;
    std::vector<ContextSnapshot> getHistory() const;
    std::size_t maxHistory() const noexcept { return maxHistory_; }

private:
    void pushSnapshotLocked(const ContextState& state, std::optional<json> metadata);
    std::vector<std::shared_ptr<IContextSubscriber>> subscribersCopy() const;

    const std::size_t maxHistory_;
    mutable std::mutex mutex_;
    ContextState state_;
    uint64_t highestVersion_ = 0;
    std::deque<ContextSnapshot> history_;

    mutable std::mutex subscribersMutex_;
    std::vector<std::shared_ptr<IContextSubscriber>> subscribers_;
};

} // namespace squirrel::session
