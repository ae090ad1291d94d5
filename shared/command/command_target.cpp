#include "command_target.hpp"

#include <fmt/format.h>

#include "tokenizer.hpp"

namespace command {

std::pair<std::string, std::string> splitCommandFromArgs(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size() && isWhitespace(text[begin])) ++begin;

    size_t end = begin;
    while (end < text.size() && !isWhitespace(text[end])) ++end;

    size_t rest = end;
    while (rest < text.size() && isWhitespace(text[rest])) ++rest;

    return { text.substr(begin, end - begin), text.substr(rest) };
}

Result<ResolvedCommand> resolveTarget(const std::string& bot_name, const std::string& command_with_target) {
    if (command_with_target.empty() || command_with_target.front() != COMMAND_PREFIX) {
        return Result<ResolvedCommand>::Error(ResultCode::InvalidArgument,
            fmt::format("'{}' is not a command", command_with_target));
    }

    ResolvedCommand resolved;
    const auto separator = command_with_target.find(TARGET_SEPARATOR);
    if (separator == std::string::npos) {
        resolved.command = command_with_target.substr(1);
        resolved.target = bot_name;
    } else {
        resolved.command = command_with_target.substr(1, separator - 1);
        resolved.target = command_with_target.substr(separator + 1);
        resolved.explicit_target = true;
    }
    return Result<ResolvedCommand>::OK(std::move(resolved));
}

bool filterCommandTarget(const std::optional<std::string>& target,
                         const std::string& bot_name,
                         CommandTarget allowed) {
    CommandTarget actual = CommandTarget::Unspecified;
    if (target) {
        actual = (*target == bot_name) ? CommandTarget::Self : CommandTarget::Other;
    }
    return hasTarget(allowed, actual);
}

} // namespace command
