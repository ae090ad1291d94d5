#include "builtin_permissions.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include <fmt/format.h>

namespace permission {

namespace {

std::string normalizeUsername(const std::string& raw) {
    auto begin = std::find_if_not(raw.begin(), raw.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(raw.rbegin(), raw.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) return {};

    std::string name(begin, end);
    if (name.front() == '@') name.erase(0, 1);
    return name;
}

Permission chatTypeIs(const char* label, chat::ChatType type) {
    return Permission::leaf(label, [type](const chat::CallerContext& context) {
        return context.chat_type == type;
    });
}

} // namespace

const Permission& anybody() {
    static const Permission instance = Permission::leaf("Anybody",
        [](const chat::CallerContext&) { return true; });
    return instance;
}

const Permission& nobody() {
    static const Permission instance = Permission::leaf("Nobody",
        [](const chat::CallerContext&) { return false; });
    return instance;
}

const Permission& privateChat() {
    static const Permission instance = chatTypeIs("PrivateChat", chat::ChatType::Private);
    return instance;
}

const Permission& groupChat() {
    static const Permission instance = chatTypeIs("GroupChat", chat::ChatType::Group);
    return instance;
}

const Permission& superGroupChat() {
    static const Permission instance = chatTypeIs("SuperGroupChat", chat::ChatType::SuperGroup);
    return instance;
}

const Permission& groupAdmin() {
    static const Permission instance = Permission::leaf("GroupAdmin",
        [](const chat::CallerContext& context) {
            if (context.chat_type == chat::ChatType::Private) return true;
            auto status = chat::lookupMemberStatus(context);
            return status == chat::MemberStatus::Administrator
                || status == chat::MemberStatus::Creator;
        });
    return instance;
}

const Permission& groupCreator() {
    static const Permission instance = Permission::leaf("GroupCreator",
        [](const chat::CallerContext& context) {
            return chat::lookupMemberStatus(context) == chat::MemberStatus::Creator;
        });
    return instance;
}

Permission userId(const std::vector<int64_t>& ids) {
    std::set<int64_t> allowed(ids.begin(), ids.end());
    auto label = fmt::format("UserId({})", fmt::join(allowed, " | "));
    return Permission::leaf(std::move(label), [allowed](const chat::CallerContext& context) {
        return allowed.count(context.user_id) > 0;
    });
}

Permission userName(const std::vector<std::string>& usernames) {
    std::set<std::string> allowed;
    for (const auto& raw : usernames) {
        auto name = normalizeUsername(raw);
        if (!name.empty()) allowed.insert(std::move(name));
    }
    auto label = fmt::format("UserName({})", fmt::join(allowed, " | "));
    return Permission::leaf(std::move(label), [allowed](const chat::CallerContext& context) {
        return !context.username.empty() && allowed.count(normalizeUsername(context.username)) > 0;
    });
}

} // namespace permission
