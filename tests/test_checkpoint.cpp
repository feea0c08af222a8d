#include "prune/Checkpoint.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

using namespace semsearch;
using namespace semsearch::testutil;

TEST(Checkpoint, AbsentFile) {
    TempDir dir;
    EXPECT_FALSE(load_checkpoint(dir.file("cp.json")).has_value());
}

TEST(Checkpoint, SaveLoad) {
    TempDir dir;
    PruningCheckpoint cp;
    cp.processed_words = {"cat", "car"};
    cp.candidate_vocab = {"cat", "car", "dog", "truck"};
    save_checkpoint(dir.file("cp.json"), cp);

    const auto back = load_checkpoint(dir.file("cp.json"));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->processed_words, cp.processed_words);
    EXPECT_EQ(back->candidate_vocab, cp.candidate_vocab);
}

TEST(Checkpoint, UnversionedFileIsAccepted) {
    TempDir dir;
    write_file(dir.file("cp.json"), R"({"processedVaultWords":["cat"],"finalVocab":["cat","dog"]})");
    const auto cp = load_checkpoint(dir.file("cp.json"));
    ASSERT_TRUE(cp.has_value());
    EXPECT_EQ(cp->candidate_vocab.size(), 2u);
}

TEST(Checkpoint, CorruptFileStartsFresh) {
    TempDir dir;
    write_file(dir.file("cp.json"), "{\"processedVaultWords\": [\"cat\"");
    EXPECT_FALSE(load_checkpoint(dir.file("cp.json")).has_value());

    write_file(dir.file("cp2.json"), R"({"processedVaultWords":"cat","finalVocab":[]})");
    EXPECT_FALSE(load_checkpoint(dir.file("cp2.json")).has_value());
}

TEST(Checkpoint, NewerVersionStartsFresh) {
    TempDir dir;
    write_file(dir.file("cp.json"), R"({"version":2,"processedVaultWords":[],"finalVocab":[]})");
    EXPECT_FALSE(load_checkpoint(dir.file("cp.json")).has_value());
}
