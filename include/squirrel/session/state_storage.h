#pragma once

#include <squirrel/core/types.h>

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace squirrel::session {

// Empty names and names containing '/', '\\' or ".." are rejected with InvalidArgument.
Result<void> validateStateName(std::string_view name);

/**
 * Abstract key/document store behind StatePersistence.
 * Keys are state names; values are serialised JSON documents.
 */
class IStateStorage {
public:
    virtual ~IStateStorage() = default;

    /**
     * Store the document under key, replacing any previous value
     */
    virtual Result<void> write(std::string_view key, std::string_view contents) = 0;

    /**
     * Retrieve the document for key. NotFound when absent.
     */
    virtual Result<std::string> read(std::string_view key) const = 0;

    virtual Result<bool> exists(std::string_view key) const = 0;

    /**
     * Remove the document for key. Succeeds when already absent.
     */
    virtual Result<void> remove(std::string_view key) = 0;

    /**
     * All stored keys, sorted
     */
    virtual Result<std::vector<std::string>> list() const = 0;

    virtual std::string type() const = 0;
};

// One "<root>/<key>.json" file per key, written through "<key>.json.tmp" then renamed.
class FileStateStorage : public IStateStorage {
public:
    explicit FileStateStorage(std::filesystem::path root);

    Result<void> write(std::string_view key, std::string_view contents) override;
    Result<std::string> read(std::string_view key) const override;
    Result<bool> exists(std::string_view key) const override;
    Result<void> remove(std::string_view key) override;
    Result<std::vector<std::string>> list() const override;
    std::string type() const override { return "file"; }

    const std::filesystem::path& root() const noexcept { return root_; }
    std::filesystem::path pathFor(std::string_view key) const;

private:
    Result<void> ensureRoot() const;

    std::filesystem::path root_;
};

// In-process map, for tests and ephemeral sessions.
class MemoryStateStorage : public IStateStorage {
public:
    Result<void> write(std::string_view key, std::string_view contents) override;
    Result<std::string> read(std::string_view key) const override;
    Result<bool> exists(std::string_view key) const override;
    Result<void> remove(std::string_view key) override;
    Result<std::vector<std::string>> list() const override;
    std::string type() const override { return "memory"; }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string, std::less<>> documents_;
};

std::unique_ptr<IStateStorage> createFileStateStorage(std::filesystem::path root);
std::unique_ptr<IStateStorage> createMemoryStateStorage();

} // namespace squirrel::session
