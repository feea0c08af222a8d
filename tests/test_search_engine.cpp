#include "search/SearchEngine.hpp"
#include "search/IndexStore.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

using namespace semsearch;
using namespace semsearch::testutil;

class SearchEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_file(m_dir.file("vectors.txt"), "cat 1 0\ndog 0.9 0.1\ncar 0 1\n");
        write_file(m_dir.file("vault/pets/cats.md"), "cat dog\n\nthe car");
        write_file(m_dir.file("vault/garage.txt"), "car");
        write_file(m_dir.file("vault/Private/secret.md"), "cat");
        write_file(m_dir.file("vault/image.png"), "cat");

        m_cfg.vault = m_dir.file("vault");
        m_cfg.embedding_paths = {m_dir.file("vectors.txt")};
        m_cfg.custom_vectors_path = m_dir.file("state/custom.json");
        m_cfg.index_path = m_dir.file("state/index.json");
        m_cfg.excluded_folders = {"Private"};
    }

    TempDir m_dir;
    Config m_cfg;
};

TEST_F(SearchEngineTest, CorpusLoadsTextFilesSorted) {
    const Corpus c = Corpus::load_from_dir(m_cfg.vault);
    ASSERT_EQ(c.size(), 3u);
    EXPECT_EQ(c.documents()[0].id, "Private/secret.md");
    EXPECT_EQ(c.documents()[1].id, "garage.txt");
    EXPECT_EQ(c.documents()[2].id, "pets/cats.md");
}

TEST_F(SearchEngineTest, RebuildThenSearch) {
    SearchEngine engine(m_cfg);
    ASSERT_TRUE(engine.rebuild(Corpus::load_from_dir(m_cfg.vault)));

    EXPECT_EQ(engine.vectors().size(), 3u);
    EXPECT_EQ(engine.index().size(), 3u);
    EXPECT_TRUE(fs::exists(m_cfg.index_path));
    EXPECT_TRUE(fs::exists(stats_path_for(m_cfg.index_path)));

    const auto res = engine.search("dog", 1);
    ASSERT_EQ(res.size(), 1u);
    EXPECT_EQ(res[0].file, "pets/cats.md");
    EXPECT_EQ(res[0].text, "cat dog");
    for (const auto& r : engine.search("cat")) EXPECT_NE(r.file, "Private/secret.md");
}

TEST_F(SearchEngineTest, PersistedIndexServesQueries) {
    {
        SearchEngine engine(m_cfg);
        ASSERT_TRUE(engine.rebuild(Corpus::load_from_dir(m_cfg.vault)));
    }

    SearchEngine engine(m_cfg);
    engine.load_vectors();
    engine.load_index();
    EXPECT_EQ(engine.index().size(), 3u);
    EXPECT_EQ(engine.search("car", 1).at(0).file, "garage.txt");
}

TEST_F(SearchEngineTest, RebuildWithoutPersistLeavesDiskAlone) {
    SearchEngine engine(m_cfg);
    ASSERT_TRUE(engine.rebuild(Corpus::load_from_dir(m_cfg.vault), false));
    EXPECT_FALSE(engine.index().empty());
    EXPECT_FALSE(fs::exists(m_cfg.index_path));
}

TEST_F(SearchEngineTest, BusyLatchRejectsRebuild) {
    SearchEngine engine(m_cfg);
    BuildLatch::Guard held(engine.build_latch());
    ASSERT_TRUE(held.owned());

    EXPECT_FALSE(engine.rebuild(Corpus::load_from_dir(m_cfg.vault)));
    EXPECT_TRUE(engine.index().empty());
    EXPECT_FALSE(fs::exists(m_cfg.index_path));
}

TEST_F(SearchEngineTest, LatchIsReleasedAfterRebuild) {
    SearchEngine engine(m_cfg);
    const Corpus c = Corpus::load_from_dir(m_cfg.vault);
    EXPECT_TRUE(engine.rebuild(c, false));
    EXPECT_FALSE(engine.build_latch().busy());
    EXPECT_TRUE(engine.rebuild(c, false));
}

TEST_F(SearchEngineTest, StrategyChangeRebuildsWithNewStrategy) {
    SearchEngine engine(m_cfg);
    const Corpus c = Corpus::load_from_dir(m_cfg.vault);
    ASSERT_TRUE(engine.rebuild(c));

    Config sif = m_cfg;
    sif.strategy = Strategy::Sif;
    ASSERT_TRUE(engine.rebuild(sif, c));
    EXPECT_EQ(engine.index().strategy, Strategy::Sif);
    EXPECT_TRUE(engine.index().principal_component.has_value());
    EXPECT_TRUE(fs::exists(pca_path_for(m_cfg.index_path)));
}

TEST_F(SearchEngineTest, MissingVectorFileThrows) {
    m_cfg.embedding_paths = {m_dir.file("nope.txt")};
    SearchEngine engine(m_cfg);
    EXPECT_THROW(engine.load_vectors(), std::runtime_error);
}

TEST_F(SearchEngineTest, LearnedWordSurvivesReload) {
    {
        SearchEngine engine(m_cfg);
        engine.load_vectors();
        const CustomVector cv = engine.learn_word("Kitten", "a small cat");
        EXPECT_EQ(cv.word, "kitten");
        EXPECT_TRUE(engine.vectors().contains("kitten"));
        EXPECT_THROW(engine.learn_word("blorp", "zebra unicorn"), std::runtime_error);
    }

    SearchEngine engine(m_cfg);
    engine.load_vectors();
    EXPECT_TRUE(engine.vectors().contains("kitten"));
    EXPECT_EQ(engine.vectors().get("kitten"), engine.vectors().get("cat"));
}

TEST_F(SearchEngineTest, CustomVectorsFromAnotherModelAreIgnored) {
    {
        SearchEngine engine(m_cfg);
        engine.load_vectors();
        engine.learn_word("kitten", "cat");
    }

    write_file(m_dir.file("other.txt"), "cat 1 0\ncar 0 1\n");
    m_cfg.embedding_paths = {m_dir.file("other.txt")};
    SearchEngine engine(m_cfg);
    engine.load_vectors();
    EXPECT_FALSE(engine.vectors().contains("kitten"));
}

TEST_F(SearchEngineTest, ExportVocabulary) {
    const std::string out = m_dir.file("vocab.txt");
    const size_t n = export_vocabulary(Corpus::load_from_dir(m_cfg.vault), out);
    EXPECT_EQ(n, 4u);

    std::ifstream in(out);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "car\ncat\ndog\nthe");
}

TEST_F(SearchEngineTest, SaveIndexWritesCurrentIndex) {
    SearchEngine engine(m_cfg);
    ASSERT_TRUE(engine.rebuild(Corpus::load_from_dir(m_cfg.vault), false));
    ASSERT_FALSE(fs::exists(m_cfg.index_path));

    engine.save_index();
    EXPECT_TRUE(fs::exists(m_cfg.index_path));
    EXPECT_EQ(load_index(m_cfg.index_path).size(), engine.index().size());
}

TEST_F(SearchEngineTest, FailedReloadKeepsPreviousSources) {
    SearchEngine engine(m_cfg);
    const Corpus c = Corpus::load_from_dir(m_cfg.vault);
    ASSERT_TRUE(engine.rebuild(c));

    Config moved = m_cfg;
    moved.embedding_paths = {m_dir.file("new.txt")};

    EXPECT_THROW(engine.rebuild(moved, c), std::runtime_error);
    EXPECT_EQ(engine.config().embedding_paths, m_cfg.embedding_paths);
    EXPECT_FALSE(engine.build_latch().busy());

    // still missing: must fail again rather than build from the old table
    EXPECT_THROW(engine.rebuild(moved, c), std::runtime_error);

    write_file(m_dir.file("new.txt"), "cat 0 1\ndog 0 1\ncar 1 0\n");
    ASSERT_TRUE(engine.rebuild(moved, c));
    EXPECT_EQ(engine.vectors().model_id(), moved.model_identifier());
    EXPECT_EQ(engine.vectors().get("car"), (Vector{1.0f, 0.0f}));
}

TEST_F(SearchEngineTest, UsePrunedLoadsOnlyThePrunedTable) {
    write_file(m_dir.file("pruned.txt"), "cat 1 0\ncar 0 1\n");
    m_cfg.pruned_path = m_dir.file("pruned.txt");
    m_cfg.use_pruned = true;

    SearchEngine engine(m_cfg);
    engine.load_vectors();
    EXPECT_EQ(engine.vectors().size(), 2u);
    EXPECT_FALSE(engine.vectors().contains("dog"));
    EXPECT_EQ(engine.vectors().model_id(), m_dir.file("pruned.txt"));
}

TEST_F(SearchEngineTest, HasVectorIgnoresCase) {
    SearchEngine engine(m_cfg);
    engine.load_vectors();
    EXPECT_TRUE(engine.has_vector("Cat"));
    EXPECT_TRUE(engine.has_vector(" DOG "));
    EXPECT_FALSE(engine.has_vector("Kitten"));

    engine.learn_word("Kitten", "cat");
    EXPECT_TRUE(engine.has_vector("KITTEN"));
}
