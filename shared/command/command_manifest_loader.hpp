#pragma once

#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "result.h"
#include "message.hpp"
#include "permission.hpp"
#include "command_def.hpp"   // CommandInfo

namespace command {

/**
 * Reads command declarations from YAML.
 *
 *   commands:
 *     - names: [age, a]
 *       description: Set age
 *       target: [unspecified, self]        # or: any
 *       hidden: false
 *       arguments:
 *         - names: [age, a]
 *           description: The new age
 *           example: "25"
 *           type: int                      # string | int | float | bool
 *           optional: false
 *           default: ...
 *           allowed_values: [...]          # makes it a selection
 *         - names: [flag, f]
 *           description: Some flag
 *           flag: true
 *       permissions:
 *         all:
 *           - not: group_admin
 *           - any: [{ user_name: [alice] }, { user_id: [123456] }]
 *
 * Handlers are not part of the manifest; bind them by canonical name.
 */
class CommandManifestLoader {
public:
    static Result<std::vector<CommandInfo>> loadFromFile(const std::string& path);
    static Result<std::vector<CommandInfo>> loadFromString(const std::string& yaml);
    static Result<std::vector<CommandInfo>> load(const YAML::Node& root);

    // scalar built-in name, or a single-key map: user_id, user_name, all, any, not.
    // Malformed values are PermissionConstructionError.
    static Result<permission::Permission> parsePermission(const YAML::Node& node);

private:
    static Result<CommandInfo> parseCommand(const YAML::Node& node);
    static Result<Argument> parseArgument(const YAML::Node& node);
    static Result<CommandTarget> parseTargets(const YAML::Node& node);
    static Result<message::ArgType> parseArgType(const std::string& s);
    static Result<permission::Permission> parsePermissionNode(const YAML::Node& node);
};

} // namespace command
