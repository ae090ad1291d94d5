#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "result.h"
#include "command_def.hpp"

namespace command {

/**
 * Commands known to one bot, looked up by any of their names.
 *
 * Owned by the embedding application, filled during startup and only read
 * afterwards. Entries never move, so pointers returned by find() stay valid
 * for the registry's lifetime.
 */
class CommandRegistry {
public:
    static constexpr const char* LOG_TAG = "CommandRegistry";

    // Rejects invalid names, invalid argument lists, empty permissions,
    // an empty target mask and names already taken (AlreadyExists).
    Result<void> registerCommand(CommandInfo info);
    // Stops at the first failure.
    Result<void> registerCommands(std::vector<CommandInfo> list);

    Result<void> bindHandler(const std::string& name, Handler handler);

    const CommandInfo* find(const std::string& name) const;
    // registration order
    std::vector<const CommandInfo*> commands() const;
    size_t size() const { return commands_.size(); }

private:
    Result<void> validate(const CommandInfo& info) const;

    std::vector<std::unique_ptr<CommandInfo>> commands_;
    std::unordered_map<std::string, CommandInfo*> by_name_;
};

} // namespace command
