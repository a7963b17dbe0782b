#pragma once

#include <nlohmann/json.hpp>
#include <squirrel/core/types.h>

#include <string>
#include <string_view>

namespace squirrel {

using json = nlohmann::json;

namespace json_utils {

// Safe JSON parsing without exceptions
inline Result<json> parse_json(std::string_view input) noexcept {
    if (input.empty()) {
        return Error{ErrorCode::InvalidData, "Empty input string for JSON parsing"};
    }

    try {
        return json::parse(input);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, std::string("JSON parse error: ") + e.what() +
                                                 " at position " + std::to_string(e.byte)};
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("JSON parsing failed: ") + e.what()};
    }
}

// Serialise without throwing. Invalid UTF-8 and similar failures surface as the given code.
inline Result<std::string> dump_json(const json& value, int indent = -1,
                                     ErrorCode failure = ErrorCode::SerializationError) noexcept {
    try {
        return value.dump(indent);
    } catch (const json::type_error& e) {
        return Error{failure, std::string("JSON serialization error: ") + e.what()};
    } catch (const std::exception& e) {
        return Error{failure, std::string("JSON serialization failed: ") + e.what()};
    }
}

// Safe JSON field access
template <typename T>
Result<T> get_field(const json& obj, std::string_view field_name) noexcept {
    try {
        if (!obj.is_object() || !obj.contains(field_name)) {
            return Error{ErrorCode::InvalidData,
                         std::string("Missing required field: ") + std::string(field_name)};
        }
        return obj[field_name].get<T>();
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData,
                     std::string("Invalid field '") + std::string(field_name) + "': " + e.what()};
    }
}

// Name of a JSON value's kind, for error text.
inline const char* kind_name(const json& value) noexcept {
    switch (value.type()) {
        case json::value_t::null: return "null";
        case json::value_t::object: return "object";
        case json::value_t::array: return "array";
        case json::value_t::string: return "string";
        case json::value_t::boolean: return "boolean";
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float: return "number";
        case json::value_t::binary: return "binary";
        case json::value_t::discarded: return "discarded";
    }
    return "unknown";
}

} // namespace json_utils

} // namespace squirrel
