#include <spdlog/spdlog.h>
#include <squirrel/session/context_tracker.h>

#include <algorithm>
#include <chrono>

namespace squirrel::session {

ContextTracker::ContextTracker(std::size_t maxHistory)
    : maxHistory_(maxHistory < 1 ? 1 : maxHistory) {
    state_.last_modified = std::chrono::system_clock::now();
}

void ContextTracker::subscribe(std::shared_ptr<IContextSubscriber> subscriber) {
    if (!subscriber) {
        return;
    }
    std::lock_guard lock(subscribersMutex_);
    subscribers_.push_back(std::move(subscriber));
}

void ContextTracker::unsubscribe(const std::shared_ptr<IContextSubscriber>& subscriber) {
    std::lock_guard lock(subscribersMutex_);
    std::erase(subscribers_, subscriber);
}

std::vector<std::shared_ptr<IContextSubscriber>> ContextTracker::subscribersCopy() const {
    std::lock_guard lock(subscribersMutex_);
    return subscribers_;
}

void ContextTracker::pushSnapshotLocked(const ContextState& state, std::optional<json> metadata) {
    ContextSnapshot snapshot;
    snapshot.id = "snapshot_" + std::to_string(state.version);
    snapshot.timestamp = state.last_modified;
    snapshot.state = state;
    snapshot.metadata = std::move(metadata);
    history_.push_back(std::move(snapshot));
    while (history_.size() > maxHistory_) {
        history_.pop_front();
    }
}

ContextState ContextTracker::updateState(json data, std::optional<json> metadata) {
    ContextState oldState;
    ContextState newState;
    {
        std::lock_guard lock(mutex_);
        oldState = state_;
        state_.version = ++highestVersion_;
        state_.data = std::move(data);
        state_.last_modified = std::chrono::system_clock::now();
        pushSnapshotLocked(state_, std::move(metadata));
        newState = state_;
    }

    spdlog::debug("Context updated to version {}", newState.version);
    for (const auto& subscriber : subscribersCopy()) {
        subscriber->onStateChange(oldState, newState);
    }
    return newState;
}

Result<ContextState> ContextTracker::rollbackTo(uint64_t version) {
    ContextState oldState;
    ContextState newState;
    bool found = false;
    {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(history_.rbegin(), history_.rend(),
                               [&](const ContextSnapshot& s) { return s.state.version == version; });
        if (it != history_.rend()) {
            found = true;
            oldState = state_;
            state_ = it->state;
            newState = state_;
        }
    }

    if (!found) {
        Error error{ErrorCode::InvalidState, "Version " + std::to_string(version) + " not found"};
        spdlog::warn("Context rollback failed: {}", error.message);
        for (const auto& subscriber : subscribersCopy()) {
            subscriber->onError(error);
        }
        return error;
    }

    spdlog::info("Context rolled back from version {} to {}", oldState.version, newState.version);
    for (const auto& subscriber : subscribersCopy()) {
        subscriber->onStateChange(oldState, newState);
    }
    return newState;
}

ContextState ContextTracker::getState() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::vector<ContextSnapshot> ContextTracker::getHistory() const {
    std::lock_guard lock(mutex_);
    return {history_.begin(), history_.end()};
}

} // namespace squirrel::session
