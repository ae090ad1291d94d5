#include "argument_parser.hpp"

#include <optional>

#include <fmt/format.h>

#include "result_helper.hpp"

namespace command {

namespace {

constexpr int NOT_FOUND = -1;

// Index of the still unsatisfied argument that owns alias.
int findAvailable(const std::vector<Argument>& arguments,
                  const std::vector<bool>& satisfied,
                  const std::string& alias) {
    for (size_t i = 0; i < arguments.size(); ++i) {
        if (!satisfied[i] && arguments[i].hasName(alias)) return static_cast<int>(i);
    }
    return NOT_FOUND;
}

bool isDeclared(const std::vector<Argument>& arguments, const std::string& alias) {
    for (const auto& arg : arguments) {
        if (arg.hasName(alias)) return true;
    }
    return false;
}

// "-fF": every character a distinct single-character alias of an available flag.
std::optional<std::vector<size_t>> findFlagBundle(const std::vector<Argument>& arguments,
                                                  const std::vector<bool>& satisfied,
                                                  const std::string& key) {
    if (key.size() < 2) return std::nullopt;

    std::vector<size_t> bundle;
    for (char c : key) {
        int index = findAvailable(arguments, satisfied, std::string(1, c));
        if (index == NOT_FOUND || !arguments[index].isFlag()) return std::nullopt;
        for (size_t taken : bundle) {
            if (taken == static_cast<size_t>(index)) return std::nullopt;
        }
        bundle.push_back(static_cast<size_t>(index));
    }
    return bundle;
}

} // namespace

bool startsWithNamingPrefix(const std::string& text) {
    for (const char* prefix : ARG_NAMING_PREFIXES) {
        if (text.rfind(prefix, 0) == 0) return true;
    }
    return false;
}

std::string removeNamingPrefix(const std::string& text) {
    for (const char* prefix : ARG_NAMING_PREFIXES) {
        const std::string p(prefix);
        if (text.rfind(p, 0) == 0) return text.substr(p.size());
    }
    return text;
}

bool isArgumentKey(const Token& token) {
    return !token.quoted && startsWithNamingPrefix(token.text);
}

ParseResult<ArgumentValues> resolveArguments(const std::vector<Token>& tokens,
                                             const std::vector<Argument>& arguments) {
    ArgumentValues values;
    std::vector<bool> satisfied(arguments.size(), false);
    std::vector<const Token*> positional;

    // named
    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& token = tokens[i];
        if (!isArgumentKey(token)) {
            positional.push_back(&token);
            continue;
        }

        std::string key = removeNamingPrefix(token.text);
        std::optional<std::string> inline_value;
        const auto separator = key.find(ARG_VALUE_SEPARATOR_CHAR);
        if (separator != std::string::npos) {
            inline_value = key.substr(separator + 1);
            key.resize(separator);
        }

        const int index = findAvailable(arguments, satisfied, key);
        if (index == NOT_FOUND) {
            // a declared alias that was already used is not split into flags
            if (!inline_value && !isDeclared(arguments, key)) {
                if (auto bundle = findFlagBundle(arguments, satisfied, key)) {
                    for (size_t flag_index : *bundle) {
                        values[arguments[flag_index].name()] = true;
                        satisfied[flag_index] = true;
                    }
                    continue;
                }
            }
            return parseFailure<ArgumentValues>(ResultCode::UnknownArgument, key, token.text,
                fmt::format("Unknown argument '{}'", key));
        }

        const Argument& arg = arguments[index];
        if (arg.isFlag()) {
            if (inline_value) {
                return parseFailure<ArgumentValues>(ResultCode::InvalidArgumentValue, arg.name(), *inline_value,
                    fmt::format("Unexpected flag value: {}", token.text));
            }
            values[arg.name()] = true;
            satisfied[index] = true;
            continue;
        }

        std::string raw;
        if (inline_value) {
            raw = stripQuotes(*inline_value);
        } else if (i + 1 >= tokens.size()) {
            return parseFailure<ArgumentValues>(ResultCode::MissingArgumentValue, arg.name(), token.text,
                fmt::format("Expected argument value for '{}' but found EOL", key));
        } else if (isArgumentKey(tokens[i + 1])) {
            return parseFailure<ArgumentValues>(ResultCode::MissingArgumentValue, arg.name(), token.text,
                fmt::format("Expected argument value for '{}' but found named argument '{}'",
                            key, tokens[i + 1].text));
        } else {
            raw = stripQuotes(tokens[++i].text);
        }

        auto parsed = arg.parse(raw);
        RETURN_IF_ERR(parsed);
        values[arg.name()] = std::move(parsed.value());
        satisfied[index] = true;
    }

    // positional
    size_t next = 0;
    for (const Token* token : positional) {
        while (next < arguments.size() && (satisfied[next] || arguments[next].isFlag())) ++next;
        if (next >= arguments.size()) break;

        const Argument& arg = arguments[next];
        auto parsed = arg.parse(stripQuotes(token->text));
        RETURN_IF_ERR(parsed);
        values[arg.name()] = std::move(parsed.value());
        satisfied[next] = true;
    }

    // defaults
    for (size_t i = 0; i < arguments.size(); ++i) {
        if (satisfied[i]) continue;
        auto parsed = arguments[i].parse(std::nullopt);
        RETURN_IF_ERR(parsed);
        values[arguments[i].name()] = std::move(parsed.value());
    }

    return ParseResult<ArgumentValues>::OK(std::move(values));
}

ParseResult<ArgumentValues> parseCommandArgs(const std::string& text,
                                             const std::vector<Argument>& arguments) {
    auto tokens = tokenize(text);
    RETURN_IF_ERR(tokens);
    return resolveArguments(tokens.value(), arguments);
}

} // namespace command
