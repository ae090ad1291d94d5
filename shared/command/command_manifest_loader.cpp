#include "command_manifest_loader.hpp"

#include <cstdint>
#include <unordered_map>

#include <fmt/format.h>

#include "builtin_permissions.hpp"
#include "logging.hpp"
#include "result_helper.hpp"

namespace command {

namespace {

constexpr const char* TAG = "CommandManifest";

using BuiltinFactory = const permission::Permission& (*)();

const std::unordered_map<std::string, BuiltinFactory>& builtinPermissions() {
    static const std::unordered_map<std::string, BuiltinFactory> table = {
        { "anybody",         &permission::anybody },
        { "nobody",          &permission::nobody },
        { "private_chat",    &permission::privateChat },
        { "group_chat",      &permission::groupChat },
        { "supergroup_chat", &permission::superGroupChat },
        { "group_admin",     &permission::groupAdmin },
        { "group_creator",   &permission::groupCreator },
    };
    return table;
}

// accepts a single scalar where a list is expected
template <typename T>
std::vector<T> asList(const YAML::Node& node) {
    if (node.IsScalar()) return { node.as<T>() };
    return node.as<std::vector<T>>();
}

Result<permission::Permission> permissionError(std::string message) {
    return Result<permission::Permission>::Error(ResultCode::PermissionConstructionError, std::move(message));
}

} // namespace

Result<std::vector<CommandInfo>> CommandManifestLoader::loadFromFile(const std::string& path) {
    using R = Result<std::vector<CommandInfo>>;
    try {
        auto r = load(YAML::LoadFile(path));
        if (r) LOG_INFO(TAG, "loaded {} commands from {}", r.value().size(), path);
        return r;
    } catch (const YAML::BadFile&) {
        return R::Error(ResultCode::NotFound, fmt::format("cannot open command manifest '{}'", path));
    } catch (const YAML::Exception& e) {
        return R::Error(ResultCode::InvalidArgument, fmt::format("{}: {}", path, e.what()));
    }
}

Result<std::vector<CommandInfo>> CommandManifestLoader::loadFromString(const std::string& yaml) {
    try {
        return load(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        return Result<std::vector<CommandInfo>>::Error(ResultCode::InvalidArgument, std::string(e.what()));
    }
}

Result<std::vector<CommandInfo>> CommandManifestLoader::load(const YAML::Node& root) {
    using R = Result<std::vector<CommandInfo>>;
    std::vector<CommandInfo> list;

    const auto commands = root["commands"];
    if (!commands) return R::OK(std::move(list));
    if (!commands.IsSequence()) {
        return R::Error(ResultCode::InvalidArgument, "'commands' must be a list");
    }

    try {
        for (const auto& node : commands) {
            auto info = parseCommand(node);
            RETURN_IF_ERR(info);
            list.push_back(std::move(info.value()));
        }
    } catch (const YAML::Exception& e) {
        return R::Error(ResultCode::InvalidArgument, std::string(e.what()));
    }
    return R::OK(std::move(list));
}

Result<CommandInfo> CommandManifestLoader::parseCommand(const YAML::Node& node) {
    using R = Result<CommandInfo>;
    CommandInfo info;

    if (!node["names"]) return R::Error(ResultCode::InvalidArgument, "command without 'names'");
    info.names = asList<std::string>(node["names"]);
    info.description = node["description"].as<std::string>("");

    if (node["target"]) {
        auto targets = parseTargets(node["target"]);
        RETURN_IF_ERR(targets);
        info.allowed_targets = targets.value();
    }

    if (node["hidden"].as<bool>(false)) {
        info.hidden = [](const chat::CallerContext&) { return true; };
    }

    if (node["arguments"]) {
        for (const auto& arg_node : node["arguments"]) {
            auto arg = parseArgument(arg_node);
            if (!arg) {
                return R::Error(arg.code(), fmt::format("command '{}': {}",
                    info.names.empty() ? "?" : info.names.front(), arg.error().value_or("invalid argument")));
            }
            info.arguments.push_back(std::move(arg.value()));
        }
    }

    if (node["permissions"]) {
        auto permissions = parsePermission(node["permissions"]);
        if (!permissions) {
            return R::Error(permissions.code(), fmt::format("command '{}': {}",
                info.names.empty() ? "?" : info.names.front(), permissions.error().value_or("invalid permission")));
        }
        info.permissions = permissions.value();
    }

    return R::OK(std::move(info));
}

Result<Argument> CommandManifestLoader::parseArgument(const YAML::Node& node) {
    using R = Result<Argument>;

    if (!node["names"]) return R::Error(ResultCode::InvalidArgument, "argument without 'names'");
    auto names = asList<std::string>(node["names"]);
    auto description = node["description"].as<std::string>("");

    if (node["flag"].as<bool>(false)) {
        return Argument::flag(std::move(names), std::move(description));
    }

    ArgumentDescriptor desc;
    desc.names = std::move(names);
    desc.description = std::move(description);
    desc.example = node["example"].as<std::string>("");
    desc.optional = node["optional"].as<bool>(false);

    auto type = parseArgType(node["type"].as<std::string>("string"));
    RETURN_IF_ERR(type);
    desc.type = type.value();

    if (node["default"]) {
        const auto raw = node["default"].as<std::string>();
        auto converted = (*builtinConverter(desc.type))(raw);
        if (!converted) {
            return R::Error(ResultCode::InvalidArgument, fmt::format("default '{}' of argument '{}': {}",
                raw, desc.names.empty() ? "?" : desc.names.front(), converted.error().value_or("invalid")));
        }
        desc.default_value = converted.value();
    }

    if (node["allowed_values"]) {
        return Argument::selection(std::move(desc), asList<std::string>(node["allowed_values"]));
    }
    return Argument::create(std::move(desc));
}

Result<CommandTarget> CommandManifestLoader::parseTargets(const YAML::Node& node) {
    using R = Result<CommandTarget>;
    static const std::unordered_map<std::string, CommandTarget> names = {
        { "unspecified", CommandTarget::Unspecified },
        { "self",        CommandTarget::Self },
        { "other",       CommandTarget::Other },
        { "any",         CommandTarget::Any },
    };

    uint8_t mask = 0;
    for (const auto& name : asList<std::string>(node)) {
        auto it = names.find(name);
        if (it == names.end()) {
            return R::Error(ResultCode::InvalidArgument, fmt::format("unknown command target '{}'", name));
        }
        mask |= static_cast<uint8_t>(it->second);
    }
    if (mask == 0) return R::Error(ResultCode::InvalidArgument, "empty command target list");
    return R::OK(static_cast<CommandTarget>(mask));
}

Result<message::ArgType> CommandManifestLoader::parseArgType(const std::string& s) {
    using R = Result<message::ArgType>;
    if (s == "string" || s == "str")   return R::OK(message::ArgType::String);
    if (s == "int" || s == "integer")  return R::OK(message::ArgType::Int);
    if (s == "float")                  return R::OK(message::ArgType::Float);
    if (s == "bool" || s == "boolean") return R::OK(message::ArgType::Bool);
    return R::Error(ResultCode::InvalidArgument, fmt::format("unknown argument type '{}'", s));
}

Result<permission::Permission> CommandManifestLoader::parsePermission(const YAML::Node& node) {
    try {
        return parsePermissionNode(node);
    } catch (const YAML::Exception& e) {
        return permissionError(fmt::format("invalid permission expression: {}", e.what()));
    }
}

Result<permission::Permission> CommandManifestLoader::parsePermissionNode(const YAML::Node& node) {
    using permission::Combinator;

    if (node.IsScalar()) {
        const auto name = node.as<std::string>();
        const auto& table = builtinPermissions();
        auto it = table.find(name);
        if (it == table.end()) return permissionError(fmt::format("unknown permission '{}'", name));
        return Result<permission::Permission>::OK(it->second());
    }

    if (!node.IsMap() || node.size() != 1) {
        return permissionError("a permission is a built-in name or a map with exactly one key");
    }

    const auto entry = *node.begin();
    const auto key = entry.first.as<std::string>();
    const YAML::Node& value = entry.second;

    if (key == "user_id") {
        return Result<permission::Permission>::OK(permission::userId(asList<int64_t>(value)));
    }
    if (key == "user_name") {
        return Result<permission::Permission>::OK(permission::userName(asList<std::string>(value)));
    }
    if (key == "not") {
        auto inner = parsePermissionNode(value);
        RETURN_IF_ERR(inner);
        return Result<permission::Permission>::OK(permission::negate(inner.value()));
    }
    if (key == "all" || key == "any") {
        if (!value.IsSequence() || value.size() == 0) {
            return permissionError(fmt::format("'{}' needs a non-empty list", key));
        }
        std::vector<permission::Permission> operands;
        for (const auto& child : value) {
            auto parsed = parsePermissionNode(child);
            RETURN_IF_ERR(parsed);
            operands.push_back(parsed.value());
        }
        return permission::combine(operands, key == "all" ? Combinator::And : Combinator::Or);
    }
    return permissionError(fmt::format("unknown permission key '{}'", key));
}

} // namespace command
