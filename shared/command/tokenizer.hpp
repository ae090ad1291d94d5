#pragma once

#include <string>
#include <vector>

#include "parse_error.hpp"

namespace command {

inline constexpr char QUOTE_CHARS[] = { '"', '\'' };
inline constexpr char ESCAPE_CHAR = '\\';

struct Token {
    std::string text;       // quote characters kept verbatim
    bool quoted = false;    // text starts and ends with the same quote character

    bool operator==(const Token& other) const {
        return text == other.text && quoted == other.quoted;
    }
};

bool isQuoteChar(char c);
bool isWhitespace(char c);

// True if text starts and ends with the same quote character (length >= 2).
bool isQuoted(const std::string& text);
// Removes one pair of enclosing quotes if present.
std::string stripQuotes(const std::string& text);

/**
 * Splits argument text into tokens, shell style but without a shell:
 *  - space and tab separate tokens, runs of them collapse;
 *  - '"' or '\'' opens a region closed only by the same character,
 *    the other quote character is literal inside it;
 *  - inside a region, backslash + the open quote yields the quote itself,
 *    any other backslash is kept as is.
 * Fails with UnterminatedQuote when the input ends inside a region.
 */
ParseResult<std::vector<Token>> tokenize(const std::string& text);

} // namespace command
