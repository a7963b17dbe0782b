#pragma once

#include <squirrel/session/state.h>
#include <squirrel/session/state_storage.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace squirrel::session {

struct PersistenceMetadata {
    uint64_t version = 1;
    TimePoint created_at{};
    TimePoint updated_at{};
    std::string checksum;
};

/**
 * Checksummed state documents:
 *
 *   { "state":    {id, name, data, created_at, updated_at, metadata},
 *     "metadata": {version, created_at, updated_at, checksum} }
 *
 * The checksum is the SHA-256 hex digest of the compact state record followed by its
 * version and the metadata timestamps, so an edit to any of them is detected on load.
 */
class StatePersistence {
public:
    explicit StatePersistence(std::shared_ptr<IStateStorage> storage);
    explicit StatePersistence(const std::filesystem::path& storagePath);

    StatePersistence(const StatePersistence&) = delete;
    StatePersistence& operator=(const StatePersistence&) = delete;

    Result<void> saveState(const State& state);
    Result<State> loadState(const std::string& name);
    Result<void> deleteState(const std::string& name);
    Result<std::vector<std::string>> listStates() const;

    std::optional<uint64_t> cachedVersion(const std::string& name) const;
    std::optional<PersistenceMetadata> cachedMetadata(const std::string& name) const;

    // Covers the state record, its version and the metadata timestamps.
    static Result<std::string> computeChecksum(const State& state, const PersistenceMetadata& meta);

    IStateStorage& storage() noexcept { return *storage_; }

private:
    std::shared_ptr<IStateStorage> storage_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PersistenceMetadata> cache_;
};

} // namespace squirrel::session
