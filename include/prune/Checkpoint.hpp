#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>

namespace semsearch {

// Progress of a resumable pruning job. Every target word whose neighbors are
// already in candidate_vocab is listed in processed_words.
struct PruningCheckpoint {
    std::unordered_set<std::string> processed_words;
    std::unordered_set<std::string> candidate_vocab;
};

constexpr int kCheckpointVersion = 1;

// std::nullopt when the file is absent. An unreadable, malformed or
// newer-version checkpoint is reported on std::cerr and also yields
// std::nullopt, so the job starts fresh instead of misreading it.
std::optional<PruningCheckpoint> load_checkpoint(const std::filesystem::path& path);

// {version, processedVaultWords:[...], finalVocab:[...]}, arrays sorted.
// Throws std::runtime_error; the previous checkpoint survives a failed write.
void save_checkpoint(const std::filesystem::path& path, const PruningCheckpoint& cp);

}  // namespace semsearch
