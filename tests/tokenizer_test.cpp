#include <gtest/gtest.h>

#include "tokenizer.hpp"

using namespace command;

namespace {

std::vector<std::string> texts(const std::vector<Token>& tokens) {
    std::vector<std::string> out;
    for (const auto& t : tokens) out.push_back(t.text);
    return out;
}

std::vector<std::string> tokenizeOk(const std::string& text) {
    auto r = tokenize(text);
    EXPECT_TRUE(r) << text;
    return texts(r.value());
}

} // namespace

TEST(TokenizerTest, EmptyInput) {
    EXPECT_TRUE(tokenizeOk("").empty());
    EXPECT_TRUE(tokenizeOk("   \t ").empty());
}

TEST(TokenizerTest, SplitsOnWhitespaceRuns) {
    EXPECT_EQ(tokenizeOk("a  b\t\tc "), (std::vector<std::string>{ "a", "b", "c" }));
}

TEST(TokenizerTest, KeepsQuotesVerbatim) {
    auto r = tokenize("\"a b\" c");
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 2u);
    EXPECT_EQ(r.value()[0].text, "\"a b\"");
    EXPECT_TRUE(r.value()[0].quoted);
    EXPECT_EQ(r.value()[1].text, "c");
    EXPECT_FALSE(r.value()[1].quoted);
}

TEST(TokenizerTest, OtherQuoteIsLiteralInsideRegion) {
    EXPECT_EQ(tokenizeOk("'it \"is\" here' x"), (std::vector<std::string>{ "'it \"is\" here'", "x" }));
    EXPECT_EQ(tokenizeOk("\"don't\""), (std::vector<std::string>{ "\"don't\"" }));
}

TEST(TokenizerTest, EscapedOpenQuote) {
    EXPECT_EQ(tokenizeOk(R"("say \"hi\"")"), (std::vector<std::string>{ R"("say "hi"")" }));
}

TEST(TokenizerTest, OtherBackslashesPassThrough) {
    EXPECT_EQ(tokenizeOk(R"("a\nb" c\d)"), (std::vector<std::string>{ R"("a\nb")", R"(c\d)" }));
    EXPECT_EQ(tokenizeOk(R"('x\"y')"), (std::vector<std::string>{ R"('x\"y')" }));
}

TEST(TokenizerTest, QuoteInsideWordJoinsToken) {
    EXPECT_EQ(tokenizeOk("--name=\"two words\" next"),
              (std::vector<std::string>{ "--name=\"two words\"", "next" }));
}

TEST(TokenizerTest, UnterminatedQuote) {
    auto r = tokenize("a \"b");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.code(), ResultCode::UnterminatedQuote);
    EXPECT_EQ(r.error().raw, "\"b");
    EXPECT_EQ(r.error().message, "No closing quotation for \" opened at position 2");
}

TEST(TokenizerTest, EscapedQuoteDoesNotClose) {
    auto r = tokenize(R"('abc\')");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.code(), ResultCode::UnterminatedQuote);
}

TEST(TokenizerTest, RetokenizingJoinedTokensIsStable) {
    const std::vector<std::string> inputs = {
        "a b c",
        "\"a b\" 'c d' e",
        "--name 'x y' -f",
        "'mixed \"quotes\"' plain",
    };
    for (const auto& input : inputs) {
        auto first = tokenizeOk(input);
        std::string joined;
        for (size_t i = 0; i < first.size(); ++i) {
            if (i > 0) joined += ' ';
            joined += first[i];
        }
        EXPECT_EQ(tokenizeOk(joined), first) << input;
    }
}

TEST(TokenizerTest, StripQuotes) {
    EXPECT_EQ(stripQuotes("\"a b\""), "a b");
    EXPECT_EQ(stripQuotes("'x'"), "x");
    EXPECT_EQ(stripQuotes("\"x'"), "\"x'");
    EXPECT_EQ(stripQuotes("\""), "\"");
    EXPECT_EQ(stripQuotes("plain"), "plain");
}
