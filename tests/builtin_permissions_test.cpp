#include <gtest/gtest.h>

#include "builtin_permissions.hpp"

using namespace permission;

namespace {

chat::CallerContext context(chat::ChatType type, chat::MemberStatus status = chat::MemberStatus::Member) {
    chat::CallerContext ctx;
    ctx.user_id = 7;
    ctx.username = "alice";
    ctx.chat_id = -100;
    ctx.chat_type = type;
    ctx.member_status = [status](int64_t, int64_t) { return status; };
    return ctx;
}

} // namespace

TEST(BuiltinPermissionsTest, Constants) {
    auto ctx = context(chat::ChatType::Private);
    EXPECT_TRUE(evaluate(anybody(), ctx));
    EXPECT_FALSE(evaluate(nobody(), ctx));
}

TEST(BuiltinPermissionsTest, SharedInstancesDeduplicate) {
    EXPECT_EQ(anybody(), anybody());
    EXPECT_EQ(anyOf(groupAdmin(), groupAdmin()).children().size(), 1u);
}

TEST(BuiltinPermissionsTest, ChatTypes) {
    EXPECT_TRUE(evaluate(privateChat(), context(chat::ChatType::Private)));
    EXPECT_FALSE(evaluate(privateChat(), context(chat::ChatType::Group)));
    EXPECT_TRUE(evaluate(groupChat(), context(chat::ChatType::Group)));
    EXPECT_FALSE(evaluate(groupChat(), context(chat::ChatType::SuperGroup)));
    EXPECT_TRUE(evaluate(superGroupChat(), context(chat::ChatType::SuperGroup)));
}

TEST(BuiltinPermissionsTest, GroupAdmin) {
    EXPECT_TRUE(evaluate(groupAdmin(), context(chat::ChatType::Private)));
    EXPECT_TRUE(evaluate(groupAdmin(), context(chat::ChatType::Group, chat::MemberStatus::Administrator)));
    EXPECT_TRUE(evaluate(groupAdmin(), context(chat::ChatType::Group, chat::MemberStatus::Creator)));
    EXPECT_FALSE(evaluate(groupAdmin(), context(chat::ChatType::Group, chat::MemberStatus::Member)));

    chat::CallerContext no_lookup;
    no_lookup.chat_type = chat::ChatType::Group;
    EXPECT_FALSE(evaluate(groupAdmin(), no_lookup));
}

TEST(BuiltinPermissionsTest, GroupCreator) {
    EXPECT_TRUE(evaluate(groupCreator(), context(chat::ChatType::Group, chat::MemberStatus::Creator)));
    EXPECT_FALSE(evaluate(groupCreator(), context(chat::ChatType::Group, chat::MemberStatus::Administrator)));
}

TEST(BuiltinPermissionsTest, UserId) {
    auto ctx = context(chat::ChatType::Private);
    EXPECT_TRUE(evaluate(userId({ 1, 7 }), ctx));
    EXPECT_FALSE(evaluate(userId({ 1, 2 }), ctx));
    EXPECT_EQ(userId({ 2, 1 }).describe(), "UserId(1 | 2)");
}

TEST(BuiltinPermissionsTest, UserNameNormalisation) {
    auto ctx = context(chat::ChatType::Private);
    EXPECT_TRUE(evaluate(userName({ "@alice" }), ctx));
    EXPECT_TRUE(evaluate(userName({ " alice ", "", "  " }), ctx));
    EXPECT_FALSE(evaluate(userName({ "bob" }), ctx));
    EXPECT_EQ(userName({ "@bob", " " }).describe(), "UserName(bob)");

    chat::CallerContext anonymous;
    EXPECT_FALSE(evaluate(userName({ "" }), anonymous));
}

TEST(BuiltinPermissionsTest, Composition) {
    auto rule = allOf(negate(groupAdmin()), anyOf(userName({ "alice" }), userId({ 123456 })));
    EXPECT_TRUE(evaluate(rule, context(chat::ChatType::Group)));
    EXPECT_FALSE(evaluate(rule, context(chat::ChatType::Group, chat::MemberStatus::Administrator)));
    EXPECT_FALSE(evaluate(rule, context(chat::ChatType::Private)));
}
