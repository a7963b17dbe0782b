#include <spdlog/spdlog.h>
#include <squirrel/core/time_utils.h>
#include <squirrel/crypto/hasher.h>
#include <squirrel/session/state_persistence.h>

#include <chrono>

namespace squirrel::session {

namespace {

Error invalidData(const std::string& name, const std::string& detail) {
    return Error{ErrorCode::InvalidData,
                 fmt::format("Persisted state '{}' is invalid: {}", name, detail)};
}

} // namespace

StatePersistence::StatePersistence(std::shared_ptr<IStateStorage> storage)
    : storage_(std::move(storage)) {
    if (!storage_) {
        storage_ = std::make_shared<MemoryStateStorage>();
    }
}

StatePersistence::StatePersistence(const std::filesystem::path& storagePath)
    : StatePersistence(std::make_shared<FileStateStorage>(storagePath)) {}

Result<std::string> StatePersistence::computeChecksum(const State& state,
                                                     const PersistenceMetadata& meta) {
    auto text = json_utils::dump_json(state.toJson());
    if (!text) {
        return text.error();
    }
    crypto::SHA256Hasher hasher;
    hasher.update(std::string_view(text.value()));
    hasher.update(std::string_view(fmt::format(":{}:{}:{}", state.version,
                                               core::formatRfc3339(meta.created_at),
                                               core::formatRfc3339(meta.updated_at))));
    return hasher.finalize();
}

Result<void> StatePersistence::saveState(const State& state) {
    if (auto valid = validateStateName(state.name); !valid) {
        return valid;
    }

    PersistenceMetadata meta;
    meta.version = state.version;
    meta.created_at = state.created_at;
    meta.updated_at = std::chrono::system_clock::now();

    auto checksum = computeChecksum(state, meta);
    if (!checksum) {
        return Error{ErrorCode::SerializationError,
                     fmt::format("Cannot checksum state '{}': {}", state.name,
                                 checksum.error().message)};
    }
    meta.checksum = std::move(checksum).value();

    json document = {{"state", state.toJson()},
                     {"metadata",
                      {{"version", meta.version},
                       {"created_at", core::formatRfc3339(meta.created_at)},
                       {"updated_at", core::formatRfc3339(meta.updated_at)},
                       {"checksum", meta.checksum}}}};

    auto text = json_utils::dump_json(document, 2);
    if (!text) {
        return text.error();
    }

    std::lock_guard lock(mutex_);
    if (auto written = storage_->write(state.name, text.value()); !written) {
        return written;
    }
    cache_[state.name] = meta;
    spdlog::debug("Saved state '{}' version {}", state.name, meta.version);
    return {};
}

Result<State> StatePersistence::loadState(const std::string& name) {
    if (auto valid = validateStateName(name); !valid) {
        return valid.error();
    }

    std::lock_guard lock(mutex_);
    auto text = storage_->read(name);
    if (!text) {
        return text.error();
    }

    auto document = json_utils::parse_json(text.value());
    if (!document) {
        return invalidData(name, document.error().message);
    }
    const auto& doc = document.value();
    if (!doc.is_object() || !doc.contains("state") || !doc.contains("metadata") ||
        !doc["metadata"].is_object()) {
        return invalidData(name, "expected {state, metadata} document");
    }

    auto state = State::fromJson(doc["state"]);
    if (!state) {
        return invalidData(name, state.error().message);
    }
    const auto& metaJson = doc["metadata"];
    auto version = json_utils::get_field<uint64_t>(metaJson, "version");
    if (!version) {
        return invalidData(name, version.error().message);
    }
    auto stored = json_utils::get_field<std::string>(metaJson, "checksum");
    if (!stored) {
        return invalidData(name, stored.error().message);
    }

    auto createdAt = json_utils::get_field<std::string>(metaJson, "created_at");
    if (!createdAt) {
        return invalidData(name, createdAt.error().message);
    }
    auto updatedAt = json_utils::get_field<std::string>(metaJson, "updated_at");
    if (!updatedAt) {
        return invalidData(name, updatedAt.error().message);
    }

    State loaded = std::move(state).value();
    loaded.version = version.value();

    PersistenceMetadata meta;
    meta.version = loaded.version;
    meta.checksum = stored.value();
    auto created = core::parseRfc3339(createdAt.value());
    if (!created) {
        return invalidData(name, created.error().message);
    }
    meta.created_at = created.value();
    auto updated = core::parseRfc3339(updatedAt.value());
    if (!updated) {
        return invalidData(name, updated.error().message);
    }
    meta.updated_at = updated.value();

    auto actual = computeChecksum(loaded, meta);
    if (!actual) {
        return invalidData(name, actual.error().message);
    }
    if (actual.value() != stored.value()) {
        spdlog::warn("Checksum mismatch for persisted state '{}'", name);
        return Error{ErrorCode::InvalidData,
                     fmt::format("Checksum mismatch for state '{}': expected {}, computed {}", name,
                                 stored.value(), actual.value())};
    }

    cache_[name] = meta;

    loaded.persisted = true;
    return loaded;
}

Result<void> StatePersistence::deleteState(const std::string& name) {
    if (auto valid = validateStateName(name); !valid) {
        return valid;
    }
    std::lock_guard lock(mutex_);
    cache_.erase(name);
    if (auto removed = storage_->remove(name); !removed) {
        return removed;
    }
    spdlog::debug("Deleted persisted state '{}'", name);
    return {};
}

Result<std::vector<std::string>> StatePersistence::listStates() const {
    std::lock_guard lock(mutex_);
    return storage_->list();
}

std::optional<uint64_t> StatePersistence::cachedVersion(const std::string& name) const {
    std::lock_guard lock(mutex_);
    auto it = cache_.find(name);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second.version;
}

std::optional<PersistenceMetadata> StatePersistence::cachedMetadata(const std::string& name) const {
    std::lock_guard lock(mutex_);
    auto it = cache_.find(name);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace squirrel::session
