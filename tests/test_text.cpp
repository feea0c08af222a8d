#include "text/TextUtil.hpp"

#include <gtest/gtest.h>

using namespace semsearch;

TEST(TextUtil, WordsAreLowercasedWordCharacterRuns) {
    const auto w = textutil::words("Hello, World! snake_case x2 -- C++");
    const std::vector<std::string> expected = {"hello", "world", "snake_case", "x2", "c"};
    EXPECT_EQ(w, expected);
}

TEST(TextUtil, ContractionsSplitAtApostrophe) {
    const auto w = textutil::words("don't");
    const std::vector<std::string> expected = {"don", "t"};
    EXPECT_EQ(w, expected);
}

TEST(TextUtil, ContentWordsDropStopwords) {
    const auto w = textutil::content_words("The cat and the dog are in a car");
    const std::vector<std::string> expected = {"cat", "dog", "car"};
    EXPECT_EQ(w, expected);
}

TEST(TextUtil, ChunkSplitsOnBlankLines) {
    const auto c = textutil::chunk_text("first para\nstill first\n\nsecond\n \t\n\n  third  \n");
    ASSERT_EQ(c.size(), 3u);
    EXPECT_EQ(c[0], "first para\nstill first");
    EXPECT_EQ(c[1], "second");
    EXPECT_EQ(c[2], "third");
}

TEST(TextUtil, ChunkDropsEmptySegments) {
    EXPECT_TRUE(textutil::chunk_text("").empty());
    EXPECT_TRUE(textutil::chunk_text("\n\n   \n\n").empty());

    const auto c = textutil::chunk_text("\n\nonly\n\n\n");
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(c[0], "only");
}

TEST(TextUtil, SingleNewlineDoesNotSplit) {
    const auto c = textutil::chunk_text("a\nb\r\nc");
    ASSERT_EQ(c.size(), 1u);
}

TEST(TextUtil, WindowsBlankLineSplits) {
    const auto c = textutil::chunk_text("a\r\n\r\nb");
    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ(c[0], "a");
    EXPECT_EQ(c[1], "b");
}
