#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "result.h"

namespace command {

inline constexpr char COMMAND_PREFIX = '/';
inline constexpr char TARGET_SEPARATOR = '@';

// Which "/cmd@bot" forms a command answers to.
enum class CommandTarget : uint8_t {
    Unspecified = 1 << 0,   // "/cmd"
    Self        = 1 << 1,   // "/cmd@thisbot"
    Other       = 1 << 2,   // "/cmd@otherbot"
    Any         = Unspecified | Self | Other
};

constexpr CommandTarget operator|(CommandTarget lhs, CommandTarget rhs) {
    return static_cast<CommandTarget>(static_cast<uint8_t>(lhs) | static_cast<uint8_t>(rhs));
}

constexpr CommandTarget operator&(CommandTarget lhs, CommandTarget rhs) {
    return static_cast<CommandTarget>(static_cast<uint8_t>(lhs) & static_cast<uint8_t>(rhs));
}

constexpr bool hasTarget(CommandTarget mask, CommandTarget bit) {
    return (mask & bit) == bit;
}

inline constexpr CommandTarget DEFAULT_COMMAND_TARGET = CommandTarget::Unspecified | CommandTarget::Self;

struct ResolvedCommand {
    std::string command;                // without the leading '/'
    std::string target;                 // bot name, own name when not given
    bool explicit_target = false;       // "@bot" was present
};

// "/cmd@bot a b" -> {"/cmd@bot", "a b"}. Leading whitespace is skipped,
// the split happens at the first whitespace run.
std::pair<std::string, std::string> splitCommandFromArgs(const std::string& text);

// Fails with InvalidArgument when the text does not start with '/'.
Result<ResolvedCommand> resolveTarget(const std::string& bot_name, const std::string& command_with_target);

// nullopt target means no "@bot" was given.
bool filterCommandTarget(const std::optional<std::string>& target,
                         const std::string& bot_name,
                         CommandTarget allowed);

} // namespace command
