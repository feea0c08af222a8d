#include "prune/Splitter.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace semsearch;
using namespace semsearch::testutil;

TEST(Splitter, SplitsIntoNumberedParts) {
    TempDir dir;
    write_file(dir.file("glove.txt"), "a 1\nb 2\nc 3\nd 4\ne 5\n");

    const auto parts = split_file(dir.file("glove.txt"), 2, true);
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], dir.file("glove_part_1.txt"));
    EXPECT_EQ(parts[2], dir.file("glove_part_3.txt"));

    EXPECT_EQ(read_lines(parts[0]), (std::vector<std::string>{"a 1", "b 2"}));
    EXPECT_EQ(read_lines(parts[2]), (std::vector<std::string>{"e 5"}));
}

TEST(Splitter, EmptyInputWritesNothing) {
    TempDir dir;
    write_file(dir.file("empty.txt"), "");
    EXPECT_TRUE(split_file(dir.file("empty.txt"), 10, true).empty());
}

TEST(Splitter, Errors) {
    TempDir dir;
    write_file(dir.file("x.txt"), "a\n");
    EXPECT_THROW(split_file(dir.file("x.txt"), 0, true), std::runtime_error);
    EXPECT_THROW(split_file(dir.file("missing.txt"), 5, true), std::runtime_error);
}
