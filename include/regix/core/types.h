#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace regix {

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidQuery,
    UpstreamError,
    UnknownMethod,
    InvalidArgument,
    InvalidData,
    NotFound,
    NotSupported,
    NotInitialized,
    OperationCancelled,
    Timeout,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidQuery: return "Invalid query";
        case ErrorCode::UpstreamError: return "Upstream error";
        case ErrorCode::UnknownMethod: return "Unknown search method";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Stable identifier used in JSON envelopes
constexpr const char* errorCodeName(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "success";
        case ErrorCode::InvalidQuery: return "invalid_query";
        case ErrorCode::UpstreamError: return "upstream_error";
        case ErrorCode::UnknownMethod: return "unknown_method";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::InvalidData: return "invalid_data";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::NotSupported: return "not_supported";
        case ErrorCode::NotInitialized: return "not_initialized";
        case ErrorCode::OperationCancelled: return "cancelled";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::InternalError: return "internal_error";
        case ErrorCode::Unknown: return "unknown";
    }
    return "unknown";
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
};

// Simple Result type for operations that can fail
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
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
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
            throw std::runtime_error("Result contains error");
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

} // namespace regix

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<regix::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(regix::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", regix::errorToString(error));
    }
};
