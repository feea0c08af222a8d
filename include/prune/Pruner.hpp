#pragma once
#include "text/Corpus.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace semsearch {

enum class PrunePhase {
    Scanning,
    Loading,
    Searching,
    Capping,
    Writing,
    Done
};

const char* phase_name(PrunePhase p);

// Fatal pruning failure, tagged with the phase it happened in.
class PruneError : public std::runtime_error {
public:
    PruneError(PrunePhase phase, const std::string& msg);
    PrunePhase phase() const { return m_phase; }

private:
    PrunePhase m_phase;
};

struct PruneOptions {
    std::vector<std::string> input_paths;  // full embedding table
    std::string output_path;               // reduced table
    size_t neighbors = 5;
    double threshold = 0.0;                // neighbors need score > threshold
    size_t max_vocab = 100000;
    size_t checkpoint_interval = 1000;     // words per worker batch
    std::string checkpoint_path;           // empty: not resumable
    size_t threads = 0;                    // 0: hardware concurrency
    bool quiet = false;

    std::optional<uint64_t> seed;          // eviction shuffle; random when unset
    const std::atomic<bool>* cancel = nullptr;            // checked between batches
    std::function<void(size_t done, size_t total)> on_progress;  // after each batch
};

struct PruneReport {
    PrunePhase phase = PrunePhase::Scanning;  // Done, or Searching when cancelled
    bool completed = false;
    size_t target_words = 0;
    size_t processed_this_run = 0;
    size_t candidate_vocab = 0;
    size_t final_vocab = 0;
    size_t lines_written = 0;
};

// Scanning -> Loading -> Searching -> Capping -> Writing -> Done.
// With a checkpoint path, progress is saved after every batch and a later call
// resumes with the unprocessed words; Done removes the checkpoint.
// Throws PruneError for configuration, read and final write failures.
// Checkpoint write failures are only reported.
PruneReport run_pruning(const std::unordered_set<std::string>& targets, const PruneOptions& opts);

// Lines, trimmed and lowercased. Throws PruneError(Scanning) if unreadable.
std::unordered_set<std::string> load_vocabulary_file(const std::string& path);

// Every word token of every document.
std::unordered_set<std::string> scan_vocabulary(const Corpus& corpus);

// If vocab is larger than max_vocab, evicts random non-target words until it
// fits. Target words are never evicted, so the result may stay above the cap.
std::unordered_set<std::string> cap_vocabulary(const std::unordered_set<std::string>& vocab,
                                               const std::unordered_set<std::string>& targets,
                                               size_t max_vocab,
                                               std::mt19937_64& rng);

// "<output>.partial", holding vectors appended while a resumable job runs
std::string partial_path_for(const std::string& output_path);

}  // namespace semsearch
