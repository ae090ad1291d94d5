#include <gtest/gtest.h>

#include "argument.hpp"

using namespace command;

namespace {

Argument make(std::vector<std::string> names, message::ArgType type, bool optional = false,
              std::any default_value = {}) {
    ArgumentDescriptor desc;
    desc.names = std::move(names);
    desc.description = "test";
    desc.example = "x";
    desc.type = type;
    desc.optional = optional;
    desc.default_value = std::move(default_value);
    auto r = Argument::create(std::move(desc));
    EXPECT_TRUE(r);
    return r.value();
}

} // namespace

TEST(ArgumentTest, BoolConverter) {
    const Converter* convert = builtinConverter(message::ArgType::Bool);
    ASSERT_NE(convert, nullptr);
    for (const char* t : { "y", "YES", "True", "t", "1" }) {
        auto r = (*convert)(t);
        ASSERT_TRUE(r) << t;
        EXPECT_TRUE(std::any_cast<bool>(r.value())) << t;
    }
    for (const char* f : { "n", "No", "FALSE", "f", "0" }) {
        auto r = (*convert)(f);
        ASSERT_TRUE(r) << f;
        EXPECT_FALSE(std::any_cast<bool>(r.value())) << f;
    }
    EXPECT_FALSE((*convert)("maybe"));
}

TEST(ArgumentTest, IntConverter) {
    const Converter* convert = builtinConverter(message::ArgType::Int);
    ASSERT_NE(convert, nullptr);
    EXPECT_EQ(std::any_cast<int64_t>((*convert)("42").value()), 42);
    EXPECT_EQ(std::any_cast<int64_t>((*convert)("-7").value()), -7);
    EXPECT_FALSE((*convert)("4.2"));
    EXPECT_FALSE((*convert)("12abc"));
    EXPECT_FALSE((*convert)(""));
}

TEST(ArgumentTest, FloatConverterPercent) {
    const Converter* convert = builtinConverter(message::ArgType::Float);
    ASSERT_NE(convert, nullptr);
    EXPECT_DOUBLE_EQ(std::any_cast<double>((*convert)("1.57").value()), 1.57);
    EXPECT_DOUBLE_EQ(std::any_cast<double>((*convert)("50%").value()), 0.5);
    EXPECT_FALSE((*convert)("%"));
    EXPECT_FALSE((*convert)("abc"));
}

TEST(ArgumentTest, FloatConverterIsDecimalOnly) {
    const Converter* convert = builtinConverter(message::ArgType::Float);
    ASSERT_NE(convert, nullptr);
    EXPECT_EQ((*convert)("0x10").code(), ResultCode::InvalidArgumentValue);
    EXPECT_FALSE((*convert)("-0X1p3"));
    EXPECT_FALSE((*convert)("0x10%"));
    EXPECT_DOUBLE_EQ(std::any_cast<double>((*convert)("-2.5e1").value()), -25.0);
}

TEST(ArgumentTest, CustomTypeNeedsConverter) {
    EXPECT_EQ(builtinConverter(message::ArgType::Custom), nullptr);

    ArgumentDescriptor desc;
    desc.names = { "point" };
    desc.type = message::ArgType::Custom;
    auto r = Argument::create(desc);
    EXPECT_EQ(r.code(), ResultCode::InvalidArgument);

    desc.converter = [](const std::string& raw) { return Result<std::any>::OK(std::any(raw.size())); };
    desc.type_name = "point";
    auto ok = Argument::create(desc);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value().typeName(), "point");
    EXPECT_EQ(std::any_cast<size_t>(ok.value().parse(std::string("abc")).value()), 3u);
}

TEST(ArgumentTest, RejectsBadNames) {
    ArgumentDescriptor desc;
    EXPECT_EQ(Argument::create(desc).code(), ResultCode::InvalidArgument);

    desc.names = { "two words" };
    EXPECT_EQ(Argument::create(desc).code(), ResultCode::InvalidArgument);

    desc.names = { "a=b" };
    EXPECT_EQ(Argument::create(desc).code(), ResultCode::InvalidArgument);

    desc.names = { "n", "name", "n" };
    EXPECT_EQ(Argument::create(desc).code(), ResultCode::DuplicateArgumentAlias);
}

TEST(ArgumentTest, FlagForcesOptionalBool) {
    ArgumentDescriptor desc;
    desc.names = { "flag", "f" };
    desc.type = message::ArgType::Int;
    desc.flag = true;
    auto r = Argument::create(desc);
    ASSERT_TRUE(r);
    const Argument& flag = r.value();
    EXPECT_TRUE(flag.isFlag());
    EXPECT_TRUE(flag.isOptional());
    EXPECT_EQ(flag.type(), message::ArgType::Bool);
    EXPECT_FALSE(std::any_cast<bool>(flag.defaultValue()));
    EXPECT_EQ(flag.example(), "--flag");
}

TEST(ArgumentTest, ParseMissingValue) {
    auto required = make({ "x" }, message::ArgType::Int);
    auto r = required.parse(std::nullopt);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.code(), ResultCode::MissingRequiredArgument);
    EXPECT_EQ(r.error().argument, "x");

    auto with_default = make({ "y" }, message::ArgType::Int, true, int64_t(5));
    EXPECT_EQ(std::any_cast<int64_t>(with_default.parse(std::nullopt).value()), 5);

    auto without_default = make({ "z" }, message::ArgType::String, true);
    auto empty = without_default.parse(std::nullopt);
    ASSERT_TRUE(empty);
    EXPECT_FALSE(empty.value().has_value());
}

TEST(ArgumentTest, ConversionAndValidationErrors) {
    ArgumentDescriptor desc;
    desc.names = { "age" };
    desc.type = message::ArgType::Int;
    desc.validator = validateAs<int64_t>([](int64_t v) { return v > 0; });
    auto age = Argument::create(desc).value();

    auto bad = age.parse(std::string("old"));
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.code(), ResultCode::InvalidArgumentValue);
    EXPECT_EQ(bad.error().raw, "old");
    EXPECT_NE(bad.error().message.find("Invalid value 'old' for argument 'age'"), std::string::npos);

    auto invalid = age.parse(std::string("-3"));
    ASSERT_FALSE(invalid);
    EXPECT_EQ(invalid.code(), ResultCode::InvalidArgumentValue);
    EXPECT_EQ(invalid.error().message, "Invalid argument value: -3");

    EXPECT_EQ(std::any_cast<int64_t>(age.parse(std::string("30")).value()), 30);
}

TEST(ArgumentTest, Selection) {
    ArgumentDescriptor desc;
    desc.names = { "color" };
    desc.description = "Pick one";
    auto r = Argument::selection(desc, { "red", "green" });
    ASSERT_TRUE(r);
    const Argument& color = r.value();
    EXPECT_EQ(color.example(), "red");
    EXPECT_TRUE(color.parse(std::string("green")));
    EXPECT_EQ(color.parse(std::string("blue")).code(), ResultCode::InvalidArgumentValue);

    EXPECT_EQ(Argument::selection(desc, {}).code(), ResultCode::InvalidArgument);

    desc.type = message::ArgType::Int;
    EXPECT_EQ(Argument::selection(desc, { "1", "two" }).code(), ResultCode::InvalidArgument);
    auto numbers = Argument::selection(desc, { "1", "2" });
    ASSERT_TRUE(numbers);
    EXPECT_TRUE(numbers.value().parse(std::string("2")));
    EXPECT_FALSE(numbers.value().parse(std::string("3")));
}

TEST(ArgumentTest, ValidateArgumentsAliasClash) {
    std::vector<Argument> args = {
        make({ "name", "n" }, message::ArgType::String),
        make({ "number", "n" }, message::ArgType::Int),
    };
    auto r = validateArguments(args);
    EXPECT_EQ(r.code(), ResultCode::DuplicateArgumentAlias);
}

TEST(ArgumentTest, ValidateArgumentsOrder) {
    std::vector<Argument> bad = {
        make({ "a" }, message::ArgType::String, true),
        make({ "b" }, message::ArgType::String),
    };
    EXPECT_EQ(validateArguments(bad).code(), ResultCode::AliasOrderViolation);

    std::vector<Argument> flag_first = {
        Argument::flag({ "flag", "f" }, "a flag").value(),
        make({ "n" }, message::ArgType::Int),
    };
    EXPECT_TRUE(validateArguments(flag_first));
}
