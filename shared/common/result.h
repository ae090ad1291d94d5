// ============================================================================
// File: shared/common/result.h
// Description: Unified Result / Error handling structure for the command core
// ============================================================================

#pragma once
#include <string>
#include <utility>
#include <optional>
#include <cstdint>
#include <type_traits>


// NOTE: int-based, extendable by appending new codes.
enum class ResultCode : int32_t {
    OK                  = 0,
    Fail                = 1,
    Cancelled           = 2,

    // input & state error
    InvalidArgument     = 100,
    AlreadyExists       = 101,
    DuplicateIgnored    = 102,
    NotFound            = 103,

    // system & resource error
    PermissionDenied    = 200,
    InvalidState        = 204,

    // internal error
    InternalError       = 300,
    NotSupported        = 301,

    // message parsing (per message)
    UnterminatedQuote       = 500,
    UnknownArgument         = 501,
    MissingArgumentValue    = 502,
    MissingRequiredArgument = 503,
    InvalidArgumentValue    = 504,

    // command registration (startup)
    DuplicateArgumentAlias      = 600,
    AliasOrderViolation         = 601,
    PermissionConstructionError = 602,

    // command execution
    HandlerFailed       = 700,

    Unknown
};

inline constexpr bool isSuccess(ResultCode code) noexcept {
    switch (code) {
        case ResultCode::OK:
        case ResultCode::DuplicateIgnored:
            return true;
        default:
            return false;
    }
}

inline constexpr bool isFailure(ResultCode code) noexcept {
    return !isSuccess(code);
}

// ----------------------------------------------------------------------------
// 1. Error carrier, used to forward a failure between Result types
//    that share the same error payload
// ----------------------------------------------------------------------------

template <typename E>
struct Failure {
    ResultCode code;
    E error;
};

template <typename R>
inline auto failureOf(const R& r) -> Failure<std::decay_t<decltype(r.error())>> {
    return { r.code(), r.error() };
}

// ----------------------------------------------------------------------------
// 2. Result<T, E> template
// ----------------------------------------------------------------------------

template <typename T, typename E = std::optional<std::string>>
class Result {
public:
    // Default constructor: success by default
    Result() : code_(ResultCode::OK), error_() {}

    Result(Failure<E> failure)
        : code_(failure.code), error_(std::move(failure.error)) {}

    // Factory methods
    static Result OK(T value) { return Result(std::move(value)); }
    static Result Fail() { return Error(ResultCode::Fail); }
    static Result Error(ResultCode code, E error = E{}) { return Result(code, std::move(error)); }

    // Query
    [[nodiscard]] bool hasError() const noexcept { return isFailure(code_); }
    [[nodiscard]] explicit operator bool() const noexcept { return isSuccess(code_); }

    [[nodiscard]] ResultCode code() const noexcept { return code_; }
    [[nodiscard]] const T& value() const noexcept { return value_; }
    [[nodiscard]] T& value() noexcept  { return value_; }
    [[nodiscard]] const E& error() const noexcept  { return error_; }

private:
    ResultCode code_;
    T value_{};
    E error_;

    // Success constructor
    explicit Result(T val)
        : code_(ResultCode::OK), value_(std::move(val)), error_() {}

    // Error constructor
    Result(ResultCode code, E err)
        : code_(code), error_(std::move(err)) {}
};

// ----------------------------------------------------------------------------
// Partial specialization for void
// ----------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    Result() : code_(ResultCode::OK), error_() {}

    Result(Failure<E> failure)
        : code_(failure.code), error_(std::move(failure.error)) {}

    static Result OK() { return Result(ResultCode::OK, E{}); }
    static Result Fail() { return Error(ResultCode::Fail); }
    static Result Error(ResultCode code, E error = E{}) { return Result(code, std::move(error)); }

    [[nodiscard]] bool hasError() const noexcept { return isFailure(code_); }
    [[nodiscard]] explicit operator bool() const noexcept { return isSuccess(code_); }

    [[nodiscard]] const E& error() const noexcept  { return error_; }
    [[nodiscard]] ResultCode code() const noexcept  { return code_; }

private:
    ResultCode code_;
    E error_;

    Result(ResultCode code, E e)
        : code_(code), error_(std::move(e)) {}
};

// ----------------------------------------------------------------------------
// 3. String conversion (for logging / user feedback)
// ----------------------------------------------------------------------------

constexpr const char* to_string(ResultCode code) {
    switch (code) {
        case ResultCode::OK:                          return "OK";
        case ResultCode::Fail:                        return "Fail";
        case ResultCode::Cancelled:                   return "Cancelled";
        case ResultCode::InvalidArgument:             return "InvalidArgument";
        case ResultCode::AlreadyExists:               return "AlreadyExists";
        case ResultCode::DuplicateIgnored:            return "DuplicateIgnored";
        case ResultCode::NotFound:                    return "NotFound";
        case ResultCode::PermissionDenied:            return "PermissionDenied";
        case ResultCode::InvalidState:                return "InvalidState";
        case ResultCode::InternalError:               return "InternalError";
        case ResultCode::NotSupported:                return "NotSupported";
        case ResultCode::UnterminatedQuote:           return "UnterminatedQuote";
        case ResultCode::UnknownArgument:             return "UnknownArgument";
        case ResultCode::MissingArgumentValue:        return "MissingArgumentValue";
        case ResultCode::MissingRequiredArgument:     return "MissingRequiredArgument";
        case ResultCode::InvalidArgumentValue:        return "InvalidArgumentValue";
        case ResultCode::DuplicateArgumentAlias:      return "DuplicateArgumentAlias";
        case ResultCode::AliasOrderViolation:         return "AliasOrderViolation";
        case ResultCode::PermissionConstructionError: return "PermissionConstructionError";
        case ResultCode::HandlerFailed:               return "HandlerFailed";
        default:                                      return "Unknown";
    }
}

// LOGI("registration result: {}", to_string(result));
inline std::string to_string(const Result<void>& r) {
    return std::string(to_string(r.code())) +
           (r.error().has_value() ? (": " + *r.error()) : "");
}


inline Result<void> OK() noexcept { return Result<void>::OK(); }
inline Result<void> Fail() noexcept { return Result<void>::Fail(); }
inline Result<void> Error(ResultCode code, std::optional<std::string> msg = std::nullopt) noexcept  {
    return Result<void>::Error(code, std::move(msg));
}
