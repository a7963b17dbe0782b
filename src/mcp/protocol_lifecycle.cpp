#include <spdlog/spdlog.h>
#include <squirrel/mcp/protocol_lifecycle.h>

namespace squirrel::mcp {

const char* toString(ProtocolState state) noexcept {
    switch (state) {
        case ProtocolState::Uninitialized: return "Uninitialized";
        case ProtocolState::Initializing: return "Initializing";
        case ProtocolState::Initialized: return "Initialized";
        case ProtocolState::Ready: return "Ready";
        case ProtocolState::ShuttingDown: return "ShuttingDown";
        case ProtocolState::Error: return "Error";
    }
    return "Unknown";
}

bool ProtocolLifecycle::isAllowed(ProtocolState from, ProtocolState to) noexcept {
    using S = ProtocolState;
    if (from == to) {
        return true;
    }
    switch (from) {
        case S::Uninitialized:
            return to == S::Initializing || to == S::Initialized || to == S::ShuttingDown ||
                   to == S::Error;
        case S::Initializing:
            return to == S::Initialized || to == S::ShuttingDown || to == S::Error;
        case S::Initialized:
            return to == S::Ready || to == S::ShuttingDown || to == S::Error;
        case S::Ready:
            return to == S::Initialized || to == S::ShuttingDown || to == S::Error;
        case S::ShuttingDown:
        case S::Error:
            return false;
    }
    return false;
}

Result<void> ProtocolLifecycle::transitionTo(ProtocolState next, std::optional<std::string> err) {
    MutexLock lock(mutex_);
    auto prev = snapshot_.state;
    if (prev == next) {
        spdlog::debug("Protocol transition no-op: already in state {}", toString(next));
        return {};
    }
    if (!isAllowed(prev, next)) {
        spdlog::warn("Rejected protocol transition {} -> {}", toString(prev), toString(next));
        return Error{ErrorCode::InvalidState, fmt::format("Invalid protocol state transition: {} -> {}",
                                                          toString(prev), toString(next))};
    }
    snapshot_.state = next;
    snapshot_.lastError = err.value_or("");
    snapshot_.lastTransition = std::chrono::steady_clock::now();
    spdlog::info("Protocol transition: {} -> {}{}", toString(prev), toString(next),
                 snapshot_.lastError.empty() ? "" : (std::string{" error="} + snapshot_.lastError));
    return {};
}

bool ProtocolLifecycle::restoreIf(ProtocolState from, ProtocolState expected) {
    MutexLock lock(mutex_);
    if (snapshot_.state != from) {
        return false;
    }
    spdlog::info("Protocol transition rolled back: {} -> {}", toString(from), toString(expected));
    snapshot_.state = expected;
    snapshot_.lastTransition = std::chrono::steady_clock::now();
    return true;
}

void ProtocolLifecycle::reset() {
    MutexLock lock(mutex_);
    snapshot_ = ProtocolLifecycleSnapshot{};
    snapshot_.lastTransition = std::chrono::steady_clock::now();
    spdlog::debug("Protocol lifecycle reset to Uninitialized");
}

} // namespace squirrel::mcp
