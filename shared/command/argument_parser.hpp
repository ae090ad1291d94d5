#pragma once

#include <any>
#include <string>
#include <unordered_map>
#include <vector>

#include "argument.hpp"
#include "parse_error.hpp"
#include "tokenizer.hpp"

namespace command {

using ArgumentValues = std::unordered_map<std::string, std::any>;

inline constexpr char ARG_VALUE_SEPARATOR_CHAR = '=';
// longest first: "--" must be tried before "-"
inline constexpr const char* ARG_NAMING_PREFIXES[] = { "--", "-" };

bool startsWithNamingPrefix(const std::string& text);
std::string removeNamingPrefix(const std::string& text);

// An unquoted token starting with a naming prefix.
bool isArgumentKey(const Token& token);

/**
 * Maps tokens onto an argument list in three passes:
 *  1. named:      "--name value", "--name=value", "-n value", flags, bundled "-fF"
 *  2. positional: leftover tokens fill leftover non-flag arguments in declaration order
 *  3. defaults:   anything still unsatisfied gets its default or fails
 * The first failure in that order wins. Leftover tokens after pass 2 are ignored.
 *
 * The result holds exactly one entry per argument, keyed by its canonical name.
 */
ParseResult<ArgumentValues> resolveArguments(const std::vector<Token>& tokens,
                                             const std::vector<Argument>& arguments);

// tokenize() + resolveArguments()
ParseResult<ArgumentValues> parseCommandArgs(const std::string& text,
                                             const std::vector<Argument>& arguments);

} // namespace command
