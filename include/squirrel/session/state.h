#pragma once

#include <squirrel/core/json_utils.h>
#include <squirrel/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace squirrel::session {

// Named, versioned session record.
struct State {
    std::string id;
    std::string name;
    json data;
    TimePoint created_at{};
    TimePoint updated_at{};
    std::optional<json> metadata;
    uint64_t version = 1;
    // Runtime flag; never serialised and ignored by operator==.
    bool persisted = false;

    // Replaces data. Bumps version, refreshes updated_at, clears persisted.
    void update(json newData);
    // Sets one key of object (or null) data. ValidationError for any other shape.
    Result<void> set(const std::string& key, json value);
    // Bumps version and updated_at without touching data.
    void touch();

    friend bool operator==(const State& a, const State& b) {
        return a.id == b.id && a.name == b.name && a.data == b.data &&
               a.created_at == b.created_at && a.updated_at == b.updated_at &&
               a.metadata.has_value() == b.metadata.has_value() &&
               (!a.metadata || *a.metadata == *b.metadata) && a.version == b.version;
    }
    friend bool operator!=(const State& a, const State& b) { return !(a == b); }

    // {id, name, data, created_at, updated_at, metadata}; version travels separately.
    json toJson() const;
    static Result<State> fromJson(const json& j);
};

State makeState(std::string name, json data, std::optional<json> metadata = std::nullopt);

// Registered edge between named states. Conditions and rules are carried, not interpreted.
struct StateTransition {
    std::string from_state;
    std::string to_state;
    std::vector<std::string> conditions;
    std::vector<std::string> validation_rules;

    bool operator==(const StateTransition&) const = default;
};

struct StateHistoryEntry {
    std::string id;
    std::string from_state;
    std::string to_state;
    // Version of to_state the transition produced.
    uint64_t version = 0;
    TimePoint timestamp{};
    std::optional<json> metadata;

    json toJson() const;
};

} // namespace squirrel::session
