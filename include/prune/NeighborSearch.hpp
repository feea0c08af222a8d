#pragma once
#include "emb/VectorTable.hpp"

#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace semsearch {

struct Similarity {
    std::string word;
    float score = 0.0f;
};

// Brute-force nearest neighbors over a read-only table. Row norms are computed
// once; the table may be shared by any number of workers.
class NeighborSearch {
public:
    explicit NeighborSearch(const VectorTable& table);

    using Scratch = std::vector<std::pair<float, size_t>>;  // (score, row)

    // Top `n` words by cosine similarity with score > threshold, self excluded,
    // best first (ties by table order). Empty if `word` is not in the table.
    std::vector<Similarity> nearest(const std::string& word, size_t n, double threshold, Scratch& scratch) const;

    // Runs nearest() for every word on `threads` workers pulling from a shared
    // cursor. Each worker keeps its own scratch buffer; neighbor words are
    // merged into `candidates` under one mutex. Rethrows the first worker error.
    void run_batch(const std::vector<std::string>& words,
                   size_t n,
                   double threshold,
                   size_t threads,
                   std::unordered_set<std::string>& candidates) const;

    const VectorTable& table() const { return m_table; }

private:
    const VectorTable& m_table;
    std::vector<double> m_norms;
};

}  // namespace semsearch
