#include "Tokenizer.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using symmorph::ui::cli::Tokenizer;
using ::testing::ElementsAre;

TEST(TokenizerTest, SplitsOnWhitespace)
{
    EXPECT_THAT(Tokenizer::tokenize("encrypt hello"), ElementsAre("encrypt", "hello"));
    EXPECT_THAT(Tokenizer::tokenize("  genkey \t 32  "), ElementsAre("genkey", "32"));
}

TEST(TokenizerTest, EmptyAndBlankLinesGiveNoWords)
{
    EXPECT_TRUE(Tokenizer::tokenize("").empty());
    EXPECT_TRUE(Tokenizer::tokenize(" \t ").empty());
}

TEST(TokenizerTest, QuotedTextStaysTogether)
{
    EXPECT_THAT(Tokenizer::tokenize("encrypt 'Hello, SymmetricMorph!'"),
                ElementsAre("encrypt", "Hello, SymmetricMorph!"));
    EXPECT_THAT(Tokenizer::tokenize("encrypt \"two words\""), ElementsAre("encrypt", "two words"));
}

TEST(TokenizerTest, EmptyQuotesMakeEmptyWord)
{
    EXPECT_THAT(Tokenizer::tokenize("encrypt ''"), ElementsAre("encrypt", ""));
}

TEST(TokenizerTest, AdjacentPartsConcatenate)
{
    EXPECT_THAT(Tokenizer::tokenize("abc\"def\"'ghi'"), ElementsAre("abcdefghi"));
}

TEST(TokenizerTest, SingleQuotesAreLiteral)
{
    EXPECT_THAT(Tokenizer::tokenize("'a\\\"b'"), ElementsAre("a\\\"b"));
}

TEST(TokenizerTest, DoubleQuotesHonourTwoEscapes)
{
    EXPECT_THAT(Tokenizer::tokenize("\"say \\\"hi\\\"\""), ElementsAre("say \"hi\""));
    EXPECT_THAT(Tokenizer::tokenize("\"back\\\\slash\""), ElementsAre("back\\slash"));
    EXPECT_THAT(Tokenizer::tokenize("\"path\\to\""), ElementsAre("path\\to"));
}

TEST(TokenizerTest, BareBackslashEscapesNextCharacter)
{
    EXPECT_THAT(Tokenizer::tokenize("a\\ b c"), ElementsAre("a b", "c"));
    EXPECT_THAT(Tokenizer::tokenize("\\'x"), ElementsAre("'x"));
    EXPECT_THAT(Tokenizer::tokenize("abc\\"), ElementsAre("abc\\"));
}

TEST(TokenizerTest, UnterminatedQuoteRunsToEnd)
{
    EXPECT_THAT(Tokenizer::tokenize("encrypt \"open text"), ElementsAre("encrypt", "open text"));
    EXPECT_THAT(Tokenizer::tokenize("'abc"), ElementsAre("abc"));
}
