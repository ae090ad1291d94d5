#include "command_registry.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

#include "logging.hpp"
#include "result_helper.hpp"

namespace command {

namespace {

bool isValidCommandName(const std::string& name) {
    if (name.empty() || name.front() == COMMAND_PREFIX) return false;
    return std::none_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isspace(c) || c == TARGET_SEPARATOR;
    });
}

} // namespace

Result<void> CommandRegistry::validate(const CommandInfo& info) const {
    if (info.names.empty()) {
        return Error(ResultCode::InvalidArgument, "a command needs at least one name");
    }
    for (size_t i = 0; i < info.names.size(); ++i) {
        const auto& name = info.names[i];
        if (!isValidCommandName(name)) {
            return Error(ResultCode::InvalidArgument, fmt::format("invalid command name '{}'", name));
        }
        if (std::find(info.names.begin(), info.names.begin() + i, name) != info.names.begin() + i) {
            return Error(ResultCode::InvalidArgument,
                fmt::format("command '{}' declares name '{}' twice", info.name(), name));
        }
        auto it = by_name_.find(name);
        if (it != by_name_.end()) {
            return Error(ResultCode::AlreadyExists,
                fmt::format("name '{}' is already taken by command '{}'", name, it->second->name()));
        }
    }

    auto args = validateArguments(info.arguments);
    RETURN_IF_ERR_MSG(args, fmt::format("command '{}'", info.name()));

    if (info.permissions && info.permissions->empty()) {
        return Error(ResultCode::PermissionConstructionError,
            fmt::format("command '{}' has an empty permission", info.name()));
    }
    if (static_cast<uint8_t>(info.allowed_targets) == 0) {
        return Error(ResultCode::InvalidArgument,
            fmt::format("command '{}' accepts no target", info.name()));
    }
    return OK();
}

Result<void> CommandRegistry::registerCommand(CommandInfo info) {
    auto r = validate(info);
    if (!r) {
        if (r.code() == ResultCode::AlreadyExists)
            LOGW("{}", to_string(r));
        else
            LOGE("rejected command: {}", to_string(r));
        return r;
    }

    auto entry = std::make_unique<CommandInfo>(std::move(info));
    for (const auto& name : entry->names) {
        by_name_.emplace(name, entry.get());
    }
    LOGI("registered /{} ({} arguments{})", entry->name(), entry->arguments.size(),
         entry->permissions ? ", " + entry->permissions->describe() : std::string());
    commands_.push_back(std::move(entry));
    return OK();
}

Result<void> CommandRegistry::registerCommands(std::vector<CommandInfo> list) {
    for (auto& info : list) {
        auto r = registerCommand(std::move(info));
        RETURN_IF_ERR(r);
    }
    return OK();
}

Result<void> CommandRegistry::bindHandler(const std::string& name, Handler handler) {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        LOGW("no command '{}' to bind a handler to", name);
        return Error(ResultCode::NotFound, fmt::format("unknown command '{}'", name));
    }
    it->second->handler = std::move(handler);
    LOGD("bound handler to /{}", it->second->name());
    return OK();
}

const CommandInfo* CommandRegistry::find(const std::string& name) const {
    auto it = by_name_.find(name);
    return (it == by_name_.end()) ? nullptr : it->second;
}

std::vector<const CommandInfo*> CommandRegistry::commands() const {
    std::vector<const CommandInfo*> list;
    list.reserve(commands_.size());
    for (const auto& entry : commands_) {
        list.push_back(entry.get());
    }
    return list;
}

} // namespace command
