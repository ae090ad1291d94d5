#include "command_help.hpp"

#include <fmt/format.h>

#include "command_helper.hpp"
#include "command_registry.hpp"

namespace command {

std::string escapeForMarkdown(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '*' || c == '_') escaped += '\\';
        escaped += c;
    }
    return escaped;
}

std::string generateArgumentMessage(const Argument& argument) {
    std::string message = fmt::format("  {} (`{}`): {}",
                                      escapeForMarkdown(argument.name()),
                                      argument.typeName(),
                                      escapeForMarkdown(argument.description()));
    if (!argument.isFlag() && argument.defaultValue().has_value()) {
        message += fmt::format(" (default: {})",
                               escapeForMarkdown(CommandHelper::toString(argument.defaultValue())));
    }
    if (!argument.allowedValues().empty()) {
        std::vector<std::string> escaped;
        for (const auto& value : argument.allowedValues()) escaped.push_back(escapeForMarkdown(value));
        message += fmt::format(" (one of: {})", fmt::join(escaped, ", "));
    }
    return message;
}

std::string generateHelpMessage(const std::vector<std::string>& names,
                                const std::string& description,
                                const std::vector<Argument>& arguments) {
    if (names.empty()) return description;

    std::vector<std::string> lines;

    std::string names_line = "/" + escapeForMarkdown(names.front());
    if (names.size() > 1) {
        std::vector<std::string> aliases;
        for (size_t i = 1; i < names.size(); ++i) aliases.push_back("/" + escapeForMarkdown(names[i]));
        names_line += fmt::format(" ({})", fmt::join(aliases, ", "));
    }
    lines.push_back(std::move(names_line));
    lines.push_back(description);

    if (!arguments.empty()) {
        std::vector<std::string> examples;
        lines.push_back("Arguments:");
        for (const auto& arg : arguments) {
            lines.push_back(generateArgumentMessage(arg));
            if (!arg.example().empty()) examples.push_back(arg.example());
        }
        lines.push_back("Example:");
        lines.push_back(fmt::format("  `/{} {}`", names.front(), fmt::join(examples, " ")));
    }
    return fmt::format("{}", fmt::join(lines, "\n"));
}

std::string generateHelpMessage(const CommandInfo& info) {
    return generateHelpMessage(info.names, info.description, info.arguments);
}

bool isListedFor(const CommandInfo& info, const chat::CallerContext& context) {
    if (info.hidden && info.hidden(context)) return false;
    if (info.permissions && !permission::evaluate(*info.permissions, context)) return false;
    return true;
}

std::string generateCommandList(const CommandRegistry& registry, const chat::CallerContext& context) {
    std::vector<std::string> blocks{ "Commands:" };
    for (const CommandInfo* info : registry.commands()) {
        if (isListedFor(*info, context)) blocks.push_back(generateHelpMessage(*info));
    }
    return fmt::format("{}", fmt::join(blocks, "\n\n"));
}

} // namespace command
