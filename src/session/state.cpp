#include <squirrel/core/time_utils.h>
#include <squirrel/core/uuid.h>
#include <squirrel/session/state.h>

#include <chrono>

namespace squirrel::session {

namespace {

Result<TimePoint> timeField(const json& j, const char* name) {
    auto text = json_utils::get_field<std::string>(j, name);
    if (!text) {
        return text.error();
    }
    return core::parseRfc3339(text.value());
}

} // namespace

void State::touch() {
    ++version;
    updated_at = std::chrono::system_clock::now();
    persisted = false;
}

void State::update(json newData) {
    data = std::move(newData);
    touch();
}

Result<void> State::set(const std::string& key, json value) {
    if (data.is_null()) {
        data = json::object();
    } else if (!data.is_object()) {
        return Error{ErrorCode::ValidationError,
                     "Cannot set key '" + key + "' on state '" + name + "': data is " +
                         json_utils::kind_name(data) + ", not an object"};
    }
    data[key] = std::move(value);
    touch();
    return {};
}

json State::toJson() const {
    return json{{"id", id},
                {"name", name},
                {"data", data},
                {"created_at", core::formatRfc3339(created_at)},
                {"updated_at", core::formatRfc3339(updated_at)},
                {"metadata", metadata ? *metadata : json(nullptr)}};
}

Result<State> State::fromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "State record must be a JSON object"};
    }
    auto id = json_utils::get_field<std::string>(j, "id");
    if (!id)
        return id.error();
    auto name = json_utils::get_field<std::string>(j, "name");
    if (!name)
        return name.error();
    if (!j.contains("data"))
        return Error{ErrorCode::InvalidData, "Missing required field: data"};
    auto created = timeField(j, "created_at");
    if (!created)
        return created.error();
    auto updated = timeField(j, "updated_at");
    if (!updated)
        return updated.error();

    State state;
    state.id = std::move(id).value();
    state.name = std::move(name).value();
    state.data = j["data"];
    state.created_at = created.value();
    state.updated_at = updated.value();
    if (j.contains("metadata") && !j["metadata"].is_null()) {
        state.metadata = j["metadata"];
    }
    return state;
}

State makeState(std::string name, json data, std::optional<json> metadata) {
    State state;
    state.id = core::generateUUID();
    state.name = std::move(name);
    state.data = std::move(data);
    state.created_at = std::chrono::system_clock::now();
    state.updated_at = state.created_at;
    if (metadata && !metadata->is_null()) {
        state.metadata = std::move(metadata);
    }
    return state;
}

json StateHistoryEntry::toJson() const {
    return json{{"id", id},
                {"from_state", from_state},
                {"to_state", to_state},
                {"version", version},
                {"timestamp", core::formatRfc3339(timestamp)},
                {"metadata", metadata ? *metadata : json(nullptr)}};
}

} // namespace squirrel::session
