#pragma once
#include <filesystem>
#include <map>
#include <string>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "result.h"
#include "bot_manifest.hpp"

namespace manifest {

class BotManifestLoader {
public:
    // Relative paths inside the manifest are resolved against its directory.
    static Result<BotManifest> load(const std::string& path) {
        using R = Result<BotManifest>;
        YAML::Node root;
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::BadFile&) {
            return R::Error(ResultCode::NotFound, fmt::format("cannot open bot manifest '{}'", path));
        } catch (const YAML::Exception& e) {
            return R::Error(ResultCode::InvalidArgument, fmt::format("{}: {}", path, e.what()));
        }

        try {
            auto m = parse(root);
            if (!m) return m;
            const auto base = std::filesystem::path(path).parent_path();
            m.value().logging = resolve(base, m.value().logging);
            m.value().commands = resolve(base, m.value().commands);
            return m;
        } catch (const YAML::Exception& e) {
            return R::Error(ResultCode::InvalidArgument, fmt::format("{}: {}", path, e.what()));
        }
    }

    static Result<BotManifest> parse(const YAML::Node& root) {
        using R = Result<BotManifest>;
        BotManifest m;

        // ---------------------------
        // bot
        // ---------------------------
        if (!root["bot"] || !root["bot"]["name"]) {
            return R::Error(ResultCode::InvalidArgument, "bot.name is required");
        }
        auto bot = root["bot"];
        m.bot.name = bot["name"].as<std::string>();
        m.bot.description = bot["description"].as<std::string>("");

        m.logging = root["logging"].as<std::string>("");
        m.commands = root["commands"].as<std::string>("");

        // ---------------------------
        // error handling
        // ---------------------------
        if (root["error_handling"]) {
            auto eh = root["error_handling"];
            m.error_handling.silent_denial = eh["silent_denial"].as<bool>(true);
            m.error_handling.print_error = eh["print_error"].as<bool>(false);
        }

        // ---------------------------
        // console caller
        // ---------------------------
        if (root["console"]) {
            auto c = root["console"];
            m.console.username = c["username"].as<std::string>(m.console.username);
            m.console.chat_id = c["chat_id"].as<int64_t>(m.console.chat_id);
            if (c["users"]) m.console.users = c["users"].as<std::map<std::string, int64_t>>();
            if (c["admins"]) m.console.admins = c["admins"].as<std::vector<std::string>>();
            m.console.creator = c["creator"].as<std::string>("");

            const auto type = c["chat_type"].as<std::string>("private");
            if (type == "private")         m.console.chat_type = chat::ChatType::Private;
            else if (type == "group")      m.console.chat_type = chat::ChatType::Group;
            else if (type == "supergroup") m.console.chat_type = chat::ChatType::SuperGroup;
            else if (type == "channel")    m.console.chat_type = chat::ChatType::Channel;
            else return R::Error(ResultCode::InvalidArgument, fmt::format("unknown chat type '{}'", type));
        }

        return R::OK(std::move(m));
    }

private:
    static std::string resolve(const std::filesystem::path& base, const std::string& path) {
        if (path.empty() || std::filesystem::path(path).is_absolute()) return path;
        return (base / path).string();
    }
};

} // namespace manifest
