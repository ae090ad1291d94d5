#pragma once

#include <string>
#include <vector>

#include "argument.hpp"
#include "caller_context.hpp"
#include "command_def.hpp"

namespace command {

class CommandRegistry;

// Escapes '*' and '_' so text shows literally in Markdown.
std::string escapeForMarkdown(const std::string& text);

// One usage line: "  name (`type`): description (default: value)"
std::string generateArgumentMessage(const Argument& argument);

/**
 * /name (/alias, ...)
 * description
 * Arguments:
 *   <one usage line per argument>
 * Example:
 *   `/name <examples>`
 *
 * The last two blocks are left out for a command without arguments.
 * Without any name only the description is returned.
 */
std::string generateHelpMessage(const std::vector<std::string>& names,
                                const std::string& description,
                                const std::vector<Argument>& arguments);
std::string generateHelpMessage(const CommandInfo& info);

// Help of every command visible to and allowed for context,
// under a "Commands:" heading, separated by blank lines.
std::string generateCommandList(const CommandRegistry& registry, const chat::CallerContext& context);

// Neither hidden for context nor denied by its permission.
bool isListedFor(const CommandInfo& info, const chat::CallerContext& context);

} // namespace command
