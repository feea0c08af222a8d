#include "search/Searcher.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace semsearch;
using namespace semsearch::testutil;

TEST(Searcher, SingleChunkAverageScore) {
    const VectorTable t = animals_table();
    const SearchIndex idx = build_index({{"pets.md", "cat dog"}}, t, Strategy::Average);

    SearchOptions opts;
    opts.top_k = 1;
    const auto res = search("dog", idx, t, opts);

    ASSERT_EQ(res.size(), 1u);
    EXPECT_EQ(res[0].file, "pets.md");
    EXPECT_EQ(res[0].text, "cat dog");
    EXPECT_NEAR(res[0].score, 0.998f, 1e-3f);
    ASSERT_TRUE(res[0].highlight_word.has_value());
    EXPECT_EQ(*res[0].highlight_word, "dog");
}

TEST(Searcher, UnresolvableQueryGivesNothing) {
    const VectorTable t = animals_table();
    const SearchIndex idx = build_index({{"pets.md", "cat dog"}}, t, Strategy::Average);

    EXPECT_TRUE(search("zebra unicorn", idx, t).empty());
    EXPECT_TRUE(search("the and of", idx, t).empty());
    EXPECT_TRUE(search("   ", idx, t).empty());
}

TEST(Searcher, EmptyIndexOrZeroTopK) {
    const VectorTable t = animals_table();
    EXPECT_TRUE(search("cat", SearchIndex{}, t).empty());

    const SearchIndex idx = build_index({{"pets.md", "cat dog"}}, t, Strategy::Average);
    SearchOptions opts;
    opts.top_k = 0;
    EXPECT_TRUE(search("cat", idx, t, opts).empty());
}

TEST(Searcher, RankedAndBoundedByTopK) {
    const VectorTable t = animals_table();
    const SearchIndex idx = build_index(
        {{"a.md", "car"}, {"b.md", "cat"}, {"c.md", "dog car"}, {"d.md", "dog"}}, t, Strategy::Average);
    ASSERT_EQ(idx.size(), 4u);

    SearchOptions opts;
    opts.top_k = 3;
    const auto res = search("cat", idx, t, opts);
    ASSERT_EQ(res.size(), 3u);
    EXPECT_EQ(res[0].file, "b.md");
    EXPECT_EQ(res[1].file, "d.md");
    for (size_t i = 1; i < res.size(); ++i) EXPECT_GE(res[i - 1].score, res[i].score);
    for (const auto& r : res) {
        EXPECT_GE(r.score, -1.0f);
        EXPECT_LE(r.score, 1.0f);
    }

    opts.top_k = 50;
    EXPECT_EQ(search("cat", idx, t, opts).size(), 4u);
}

TEST(Searcher, TiesKeepIndexOrder) {
    const VectorTable t = animals_table();
    const SearchIndex idx = build_index(
        {{"first.md", "cat"}, {"second.md", "cat cat"}, {"third.md", "car"}}, t, Strategy::Average);

    const auto res = search("cat", idx, t);
    ASSERT_EQ(res.size(), 3u);
    EXPECT_EQ(res[0].file, "first.md");
    EXPECT_EQ(res[1].file, "second.md");
    EXPECT_EQ(res[2].file, "third.md");
}

TEST(Searcher, DimensionMismatchThrows) {
    const VectorTable t = animals_table();
    SearchIndex idx;
    idx.items.push_back({"x.md", "cat", {1.0f, 0.0f, 0.0f}});
    EXPECT_THROW(search("cat", idx, t), std::invalid_argument);
}

TEST(Searcher, SifQueryUsesStoredComponent) {
    const VectorTable t = animals_table();
    const SearchIndex idx = build_index(
        {{"a.md", "cat"}, {"b.md", "car"}, {"c.md", "dog dog car"}}, t, Strategy::Sif);
    ASSERT_TRUE(idx.principal_component.has_value());

    const auto qv = embed_query("cat", idx, t);
    ASSERT_TRUE(qv.has_value());
    EXPECT_NEAR(dot(*qv, *idx.principal_component), 0.0f, 1e-5f);
}

TEST(Searcher, HighlightRespectsThreshold) {
    const VectorTable t = animals_table();
    // car . cat = 0
    EXPECT_FALSE(best_matching_word("the car", {"cat"}, t, 0.5f).has_value());
    const auto hw = best_matching_word("the car", {"cat"}, t, -0.5f);
    ASSERT_TRUE(hw.has_value());
    EXPECT_EQ(*hw, "car");

    EXPECT_FALSE(best_matching_word("cat", {"zebra"}, t, 0.5f).has_value());
    EXPECT_EQ(*best_matching_word("A Dog and a car", {"cat"}, t, 0.5f), "dog");
}

TEST(Searcher, HighlightThresholdIsConfigurable) {
    const VectorTable t = animals_table();
    const SearchIndex idx = build_index({{"pets.md", "cat dog"}}, t, Strategy::Average);

    SearchOptions opts;
    opts.highlight_threshold = 1.5f;
    const auto res = search("dog", idx, t, opts);
    ASSERT_EQ(res.size(), 1u);
    EXPECT_FALSE(res[0].highlight_word.has_value());
}

TEST(Searcher, SnippetShortText) {
    EXPECT_EQ(context_snippet("cat dog", std::string("dog")), "cat dog");
    EXPECT_EQ(context_snippet("cat dog", std::nullopt), "cat dog");
}

TEST(Searcher, SnippetCentersOnHighlight) {
    const std::string text = std::string(100, 'a') + " Target " + std::string(100, 'b');
    const std::string s = context_snippet(text, std::string("target"));
    EXPECT_EQ(s.substr(0, 3), "...");
    EXPECT_EQ(s.substr(s.size() - 3), "...");
    EXPECT_NE(s.find("Target"), std::string::npos);
    EXPECT_LE(s.size(), 150u + 6u);
}

TEST(Searcher, SnippetWithoutHighlightIsTruncated) {
    const std::string text(400, 'x');
    const std::string s = context_snippet(text, std::nullopt);
    EXPECT_EQ(s.size(), 150u);
    EXPECT_EQ(s.substr(147), "...");
}
