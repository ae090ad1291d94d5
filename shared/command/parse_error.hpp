#pragma once

#include <string>

#include "result.h"

namespace command {

// Payload of a per-message parsing failure. The ResultCode says what went wrong,
// this says where.
struct ParseError {
    std::string argument;   // canonical argument name, or the key as typed when unknown
    std::string raw;        // offending input text, empty when nothing was given
    std::string message;    // user facing description
};

template <typename T>
using ParseResult = Result<T, ParseError>;

template <typename T>
inline ParseResult<T> parseFailure(ResultCode code, std::string argument, std::string raw, std::string message) {
    return ParseResult<T>::Error(code, ParseError{ std::move(argument), std::move(raw), std::move(message) });
}

inline const std::string& to_string(const ParseError& error) {
    return error.message;
}

} // namespace command
