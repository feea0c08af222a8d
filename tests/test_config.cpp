#include "config/Config.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace semsearch;
using namespace semsearch::testutil;
using json = nlohmann::json;

TEST(Config, MissingFileGivesDefaults) {
    TempDir dir;
    const Config c = load_config(dir.file("semsearch.json"));
    EXPECT_EQ(c.strategy, Strategy::Average);
    EXPECT_EQ(c.top_k, 10);
    EXPECT_DOUBLE_EQ(c.highlight_threshold, 0.5);
    EXPECT_EQ(c.max_vocab_size, 100000);
    EXPECT_EQ(c.neighbors, 5);
    EXPECT_EQ(c.checkpoint_interval, 1000);
    EXPECT_NO_THROW(validate_config(c));
}

TEST(Config, PartialJsonOverridesOnlyPresentFields) {
    const Config c = config_from_json(json{{"strategy", "SIF"}, {"top_k", 3}, {"excluded_folders", {"Private", "Archive"}}});
    EXPECT_EQ(c.strategy, Strategy::Sif);
    EXPECT_EQ(c.top_k, 3);
    ASSERT_EQ(c.excluded_folders.size(), 2u);
    EXPECT_EQ(c.excluded_folders[1], "Archive");
    EXPECT_EQ(c.neighbors, 5);
}

TEST(Config, WrongTypesThrow) {
    EXPECT_THROW(config_from_json(json{{"top_k", "ten"}}), std::runtime_error);
    EXPECT_THROW(config_from_json(json{{"top_k", 2.5}}), std::runtime_error);
    EXPECT_THROW(config_from_json(json{{"strategy", "BM25"}}), std::runtime_error);
    EXPECT_THROW(config_from_json(json::array()), std::runtime_error);
}

TEST(Config, JsonRoundTrip) {
    Config c;
    c.vault = "/notes";
    c.strategy = Strategy::TfIdf;
    c.embedding_paths = {"a.txt", "b.txt"};
    c.similarity_threshold = 0.25;

    const Config back = config_from_json(config_to_json(c));
    EXPECT_EQ(back.vault, "/notes");
    EXPECT_EQ(back.strategy, Strategy::TfIdf);
    EXPECT_EQ(back.embedding_paths, c.embedding_paths);
    EXPECT_DOUBLE_EQ(back.similarity_threshold, 0.25);
}

TEST(Config, VectorPathsAndModelIdentifier) {
    Config c;
    c.embedding_path_format = "glove_{}.txt";
    c.embedding_file_count = 2;
    EXPECT_EQ(c.vector_paths(), (std::vector<std::string>{"glove_1.txt", "glove_2.txt"}));
    EXPECT_EQ(c.model_identifier(), "glove_{}.txt");

    c.embedding_paths = {"x.txt", "y.txt"};
    EXPECT_EQ(c.vector_paths(), c.embedding_paths);
    EXPECT_EQ(c.model_identifier(), "x.txt;y.txt");
}

TEST(Config, ValidationRejectsBadValues) {
    Config c;
    c.top_k = 0;
    EXPECT_THROW(validate_config(c), std::runtime_error);

    c = Config{};
    c.checkpoint_interval = 0;
    EXPECT_THROW(validate_config(c), std::runtime_error);

    c = Config{};
    c.threads = -1;
    EXPECT_THROW(validate_config(c), std::runtime_error);

    c = Config{};
    c.embedding_path_format.clear();
    EXPECT_THROW(validate_config(c), std::runtime_error);
}

TEST(Config, LoadsFromFile) {
    TempDir dir;
    write_file(dir.file("semsearch.json"), R"({"vault":"notes","neighbors":7})");
    const Config c = load_config(dir.file("semsearch.json"));
    EXPECT_EQ(c.vault, "notes");
    EXPECT_EQ(c.neighbors, 7);
}

TEST(Config, UsePrunedSwitchesSearchTable) {
    Config c;
    c.embedding_paths = {"full_1.txt", "full_2.txt"};
    c.pruned_path = "pruned.txt";
    c.use_pruned = true;

    EXPECT_EQ(c.vector_paths(), (std::vector<std::string>{"pruned.txt"}));
    EXPECT_EQ(c.model_identifier(), "pruned.txt");
    // pruning still reads the full tables
    EXPECT_EQ(c.source_vector_paths(), c.embedding_paths);

    const Config back = config_from_json(config_to_json(c));
    EXPECT_TRUE(back.use_pruned);
    EXPECT_THROW(config_from_json(json{{"use_pruned", "yes"}}), std::runtime_error);

    c.pruned_path.clear();
    EXPECT_THROW(validate_config(c), std::runtime_error);
}
