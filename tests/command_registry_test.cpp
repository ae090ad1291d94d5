#include <gtest/gtest.h>

#include "command_registry.hpp"
#include "builtin_permissions.hpp"

using namespace command;

namespace {

CommandInfo makeCommand(std::vector<std::string> names) {
    CommandInfo info;
    info.names = std::move(names);
    info.description = "test";
    return info;
}

Argument arg(std::vector<std::string> names, bool optional = false) {
    ArgumentDescriptor desc;
    desc.names = std::move(names);
    desc.optional = optional;
    return Argument::create(std::move(desc)).value();
}

} // namespace

TEST(CommandRegistryTest, RegisterAndFindByAnyName) {
    CommandRegistry registry;
    ASSERT_TRUE(registry.registerCommand(makeCommand({ "name", "n" })));
    ASSERT_TRUE(registry.registerCommand(makeCommand({ "age" })));

    const CommandInfo* by_alias = registry.find("n");
    ASSERT_NE(by_alias, nullptr);
    EXPECT_EQ(by_alias->name(), "name");
    EXPECT_EQ(registry.find("name"), by_alias);
    EXPECT_EQ(registry.find("missing"), nullptr);

    auto all = registry.commands();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0]->name(), "name");
    EXPECT_EQ(all[1]->name(), "age");
}

TEST(CommandRegistryTest, DuplicateNameRejected) {
    CommandRegistry registry;
    ASSERT_TRUE(registry.registerCommand(makeCommand({ "name", "n" })));
    auto r = registry.registerCommand(makeCommand({ "number", "n" }));
    EXPECT_EQ(r.code(), ResultCode::AlreadyExists);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.find("number"), nullptr);
}

TEST(CommandRegistryTest, InvalidNames) {
    CommandRegistry registry;
    EXPECT_EQ(registry.registerCommand(makeCommand({})).code(), ResultCode::InvalidArgument);
    EXPECT_EQ(registry.registerCommand(makeCommand({ "/start" })).code(), ResultCode::InvalidArgument);
    EXPECT_EQ(registry.registerCommand(makeCommand({ "a b" })).code(), ResultCode::InvalidArgument);
    EXPECT_EQ(registry.registerCommand(makeCommand({ "cmd@bot" })).code(), ResultCode::InvalidArgument);
    EXPECT_EQ(registry.registerCommand(makeCommand({ "x", "x" })).code(), ResultCode::InvalidArgument);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(CommandRegistryTest, ArgumentListIsValidated) {
    CommandRegistry registry;

    auto clash = makeCommand({ "clash" });
    clash.arguments = { arg({ "name", "n" }), arg({ "number", "n" }) };
    EXPECT_EQ(registry.registerCommand(clash).code(), ResultCode::DuplicateArgumentAlias);

    auto order = makeCommand({ "order" });
    order.arguments = { arg({ "a" }, true), arg({ "b" }) };
    EXPECT_EQ(registry.registerCommand(order).code(), ResultCode::AliasOrderViolation);
}

TEST(CommandRegistryTest, EmptyPermissionRejected) {
    CommandRegistry registry;
    auto info = makeCommand({ "secret" });
    info.permissions = permission::Permission();
    EXPECT_EQ(registry.registerCommand(info).code(), ResultCode::PermissionConstructionError);

    info.permissions = permission::nobody();
    EXPECT_TRUE(registry.registerCommand(info));
}

TEST(CommandRegistryTest, BindHandler) {
    CommandRegistry registry;
    ASSERT_TRUE(registry.registerCommand(makeCommand({ "start" })));
    EXPECT_FALSE(registry.find("start")->handler);

    auto r = registry.bindHandler("start", [](const chat::CallerContext&, const message::Message&) {
        return OK();
    });
    EXPECT_TRUE(r);
    EXPECT_TRUE(registry.find("start")->handler);

    EXPECT_EQ(registry.bindHandler("stop", nullptr).code(), ResultCode::NotFound);
}

TEST(CommandRegistryTest, RegisterCommandsStopsAtFirstFailure) {
    CommandRegistry registry;
    std::vector<CommandInfo> list = { makeCommand({ "a" }), makeCommand({ "a" }), makeCommand({ "b" }) };
    EXPECT_EQ(registry.registerCommands(std::move(list)).code(), ResultCode::AlreadyExists);
    EXPECT_NE(registry.find("a"), nullptr);
    EXPECT_EQ(registry.find("b"), nullptr);
}
