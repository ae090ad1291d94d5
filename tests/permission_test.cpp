#include <gtest/gtest.h>

#include "permission.hpp"

using namespace permission;

namespace {

Permission constant(const char* name, bool value) {
    return Permission::leaf(name, [value](const chat::CallerContext&) { return value; });
}

} // namespace

TEST(PermissionTest, LeafEvaluate) {
    chat::CallerContext ctx;
    EXPECT_TRUE(evaluate(constant("yes", true), ctx));
    EXPECT_FALSE(evaluate(constant("no", false), ctx));
    EXPECT_FALSE(evaluate(Permission(), ctx));
}

TEST(PermissionTest, DoubleNegation) {
    chat::CallerContext ctx;
    for (bool value : { true, false }) {
        auto p = constant("p", value);
        EXPECT_EQ(evaluate(negate(negate(p)), ctx), evaluate(p, ctx));
    }
}

TEST(PermissionTest, MergeFlattensSameKind) {
    auto a = constant("a", true);
    auto b = constant("b", true);
    auto c = constant("c", false);

    auto ab = merge(a, b, Combinator::And);
    ASSERT_TRUE(ab);
    auto abc = merge(ab.value(), c, Combinator::And);
    ASSERT_TRUE(abc);

    EXPECT_EQ(abc.value().kind(), NodeKind::And);
    EXPECT_EQ(abc.value().children(), (std::vector<Permission>{ a, b, c }));
    EXPECT_EQ(abc.value().describe(), "(a & b & c)");
    // operands are left untouched
    EXPECT_EQ(ab.value().children().size(), 2u);
}

TEST(PermissionTest, MergeBothSidesSameKind) {
    auto a = constant("a", true);
    auto b = constant("b", true);
    auto c = constant("c", true);
    auto left = merge(a, b, Combinator::Or).value();
    auto right = merge(b, c, Combinator::Or).value();
    auto both = merge(left, right, Combinator::Or);
    ASSERT_TRUE(both);
    EXPECT_EQ(both.value().children(), (std::vector<Permission>{ a, b, c }));
}

TEST(PermissionTest, AndOrDoNotFlattenIntoEachOther) {
    auto a = constant("a", true);
    auto b = constant("b", false);
    auto c = constant("c", true);

    auto or_ab = merge(a, b, Combinator::Or).value();
    auto mixed = merge(or_ab, c, Combinator::And);
    ASSERT_TRUE(mixed);
    EXPECT_EQ(mixed.value().kind(), NodeKind::And);
    ASSERT_EQ(mixed.value().children().size(), 2u);
    EXPECT_EQ(mixed.value().children()[0], or_ab);
    EXPECT_EQ(mixed.value().describe(), "((a | b) & c)");

    chat::CallerContext ctx;
    EXPECT_TRUE(evaluate(mixed.value(), ctx));
}

TEST(PermissionTest, DeduplicatesByIdentity) {
    auto a = constant("a", true);
    auto twin = constant("a", true);

    auto same = allOf(a, a);
    EXPECT_EQ(same.children().size(), 1u);

    auto distinct = allOf(a, twin);
    EXPECT_EQ(distinct.children().size(), 2u);
}

TEST(PermissionTest, MergeRejectsEmptyOperand) {
    auto a = constant("a", true);
    auto r = merge(a, Permission(), Combinator::And);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.code(), ResultCode::PermissionConstructionError);
}

TEST(PermissionTest, MergeRejectsUnknownCombinator) {
    auto a = constant("a", true);
    auto r = merge(a, a, static_cast<Combinator>(42));
    EXPECT_EQ(r.code(), ResultCode::PermissionConstructionError);
}

TEST(PermissionTest, CombineEmptyListFails) {
    EXPECT_EQ(combine({}, Combinator::Or).code(), ResultCode::PermissionConstructionError);

    auto a = constant("a", true);
    auto single = combine({ a }, Combinator::Or);
    ASSERT_TRUE(single);
    EXPECT_EQ(single.value(), a);
}

TEST(PermissionTest, ShortCircuit) {
    int calls = 0;
    auto counted = Permission::leaf("counted", [&calls](const chat::CallerContext&) {
        ++calls;
        return true;
    });
    chat::CallerContext ctx;

    EXPECT_FALSE(evaluate(allOf(constant("no", false), counted), ctx));
    EXPECT_TRUE(evaluate(anyOf(constant("yes", true), counted), ctx));
    EXPECT_EQ(calls, 0);
}

TEST(PermissionTest, AllOfWithEmptyIsIdentity) {
    auto a = constant("a", true);
    EXPECT_EQ(allOf(Permission(), a), a);
    EXPECT_EQ(anyOf(a, Permission()), a);
}

TEST(PermissionTest, DescribeNot) {
    EXPECT_EQ(negate(constant("admin", true)).describe(), "~admin");
}
