#pragma once

#include <squirrel/core/types.h>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace squirrel::mcp {

enum class ProtocolState {
    Uninitialized = 0,
    Initializing,
    Initialized,
    Ready,
    ShuttingDown,
    Error,
};

const char* toString(ProtocolState state) noexcept;

struct ProtocolLifecycleSnapshot {
    ProtocolState state{ProtocolState::Uninitialized};
    std::string lastError; // empty when no error
    std::chrono::steady_clock::time_point lastTransition{};
};

// Protocol lifecycle FSM. Error and ShuttingDown are absorbing until reset().
class ProtocolLifecycle {
public:
    ProtocolLifecycle() = default;
    ~ProtocolLifecycle() = default;

    ProtocolLifecycleSnapshot snapshot() const {
        MutexLock lock(mutex_);
        return snapshot_;
    }

    ProtocolState state() const {
        MutexLock lock(mutex_);
        return snapshot_.state;
    }

    static bool isAllowed(ProtocolState from, ProtocolState to) noexcept;

    // Same-state requests are a no-op. Illegal edges return InvalidState naming both states.
    Result<void> transitionTo(ProtocolState next, std::optional<std::string> err = std::nullopt);

    // Moves to `expected` only if the current state is `from`; used to roll back a failed step.
    bool restoreIf(ProtocolState from, ProtocolState expected);

    void reset();

private:
#if defined(__cpp_lib_scoped_lock) && __cpp_lib_scoped_lock >= 201703L
    using MutexLock = std::scoped_lock<std::mutex>;
#else
    using MutexLock = std::lock_guard<std::mutex>;
#endif

    ProtocolLifecycleSnapshot snapshot_{};
    mutable std::mutex mutex_;
};

} // namespace squirrel::mcp
