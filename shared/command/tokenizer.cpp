#include "tokenizer.hpp"

#include <fmt/format.h>

namespace command {

bool isQuoteChar(char c) {
    for (char q : QUOTE_CHARS) {
        if (c == q) return true;
    }
    return false;
}

bool isWhitespace(char c) {
    return c == ' ' || c == '\t';
}

bool isQuoted(const std::string& text) {
    return text.size() >= 2
        && isQuoteChar(text.front())
        && text.back() == text.front();
}

std::string stripQuotes(const std::string& text) {
    if (!isQuoted(text)) return text;
    return text.substr(1, text.size() - 2);
}

ParseResult<std::vector<Token>> tokenize(const std::string& text) {
    std::vector<Token> tokens;
    std::string current;
    char open_quote = 0;
    size_t quote_pos = 0;

    auto flush = [&]() {
        if (current.empty()) return;
        Token token;
        token.quoted = isQuoted(current);
        token.text = std::move(current);
        tokens.push_back(std::move(token));
        current.clear();
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];

        if (open_quote != 0) {
            if (c == ESCAPE_CHAR && i + 1 < text.size() && text[i + 1] == open_quote) {
                current += open_quote;
                ++i;
                continue;
            }
            current += c;
            if (c == open_quote) open_quote = 0;
            continue;
        }

        if (isWhitespace(c)) {
            flush();
            continue;
        }

        current += c;
        if (isQuoteChar(c)) {
            open_quote = c;
            quote_pos = i;
        }
    }

    if (open_quote != 0) {
        return parseFailure<std::vector<Token>>(ResultCode::UnterminatedQuote,
            "", text.substr(quote_pos),
            fmt::format("No closing quotation for {} opened at position {}", open_quote, quote_pos));
    }

    flush();
    return ParseResult<std::vector<Token>>::OK(std::move(tokens));
}

} // namespace command
