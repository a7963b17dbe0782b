#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace squirrel {

// Type aliases
using ByteVector = std::vector<std::byte>;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    // Message / protocol layer
    InvalidFormat,
    MessageTooLarge,
    InvalidTimestamp,
    MessageTimeout,
    InvalidPayload,
    InvalidVersion,
    ProtocolNotInitialized,
    ProtocolAlreadyInitialized,
    ProtocolNotReady,
    InvalidState,
    StateSerialization,
    HandlerAlreadyExists,
    HandlerNotFound,
    // Session layer
    InvalidTransition,
    ValidationError,
    NotFound,
    IoError,
    SerializationError,
    InvalidData,
    // Generic
    InvalidArgument,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidFormat: return "Invalid message format";
        case ErrorCode::MessageTooLarge: return "Message too large";
        case ErrorCode::InvalidTimestamp: return "Invalid timestamp";
        case ErrorCode::MessageTimeout: return "Message timeout";
        case ErrorCode::InvalidPayload: return "Invalid payload";
        case ErrorCode::InvalidVersion: return "Invalid protocol version";
        case ErrorCode::ProtocolNotInitialized: return "Protocol not initialized";
        case ErrorCode::ProtocolAlreadyInitialized: return "Protocol already initialized";
        case ErrorCode::ProtocolNotReady: return "Protocol not ready";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::StateSerialization: return "State serialization failed";
        case ErrorCode::HandlerAlreadyExists: return "Handler already exists";
        case ErrorCode::HandlerNotFound: return "Handler not found";
        case ErrorCode::InvalidTransition: return "Invalid state transition";
        case ErrorCode::ValidationError: return "Validation error";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::SerializationError: return "Serialization error";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }

    // "<code name>: <message>"
    std::string describe() const {
        return std::string(errorToString(code)) + ": " + message;
    }
};

// Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace squirrel

// fmt library support for ErrorCode (for spdlog)
#include <spdlog/fmt/fmt.h>
template <> struct fmt::formatter<squirrel::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(squirrel::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", squirrel::errorToString(error));
    }
};
