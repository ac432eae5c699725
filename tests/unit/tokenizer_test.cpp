#include "Tokenizer.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using credhash::ui::cli::tokenizeLine;

TEST(TokenizerTest, TokenizesSimpleWords)
{
    auto result = tokenizeLine("hash argon2id");
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(*result, ::testing::ElementsAre("hash", "argon2id"));
}

TEST(TokenizerTest, HandlesExcessiveWhitespace)
{
    auto result = tokenizeLine("   verify \t  x   ");
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(*result, ::testing::ElementsAre("verify", "x"));
}

TEST(TokenizerTest, HandlesEmptyInput)
{
    EXPECT_TRUE(tokenizeLine("")->empty());
    EXPECT_TRUE(tokenizeLine("   ")->empty());
}

TEST(TokenizerTest, EncodedHashNeedsNoQuoting)
{
    auto result = tokenizeLine("verify $argon2id$v=19,m=64,t=1,p=1$c2FsdA$a+b/c");
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(*result, ::testing::ElementsAre("verify", "$argon2id$v=19,m=64,t=1,p=1$c2FsdA$a+b/c"));
}

TEST(TokenizerTest, SingleQuotesAreLiteral)
{
    auto result = tokenizeLine(R"('hello world' 'back\slash')");
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(*result, ::testing::ElementsAre("hello world", R"(back\slash)"));
}

TEST(TokenizerTest, DoubleQuotesHonourTwoEscapes)
{
    auto result = tokenizeLine(R"("say \"hi\"" "a\\b" "c\d")");
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(*result, ::testing::ElementsAre(R"(say "hi")", R"(a\b)", R"(c\d)"));
}

TEST(TokenizerTest, BackslashOutsideQuotesEscapesNextCharacter)
{
    auto result = tokenizeLine(R"(one\ token two)");
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(*result, ::testing::ElementsAre("one token", "two"));
}

TEST(TokenizerTest, AdjacentQuotedPartsJoin)
{
    auto result = tokenizeLine(R"(ab'c d'"e")");
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(*result, ::testing::ElementsAre("abc de"));
}

TEST(TokenizerTest, EmptyQuotesYieldEmptyToken)
{
    auto result = tokenizeLine(R"(a '' b)");
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(*result, ::testing::ElementsAre("a", "", "b"));
}

TEST(TokenizerTest, UnterminatedQuoteIsRejected)
{
    EXPECT_FALSE(tokenizeLine("verify 'abc").has_value());
    EXPECT_FALSE(tokenizeLine("verify \"abc").has_value());
}
