#pragma once
#include "emb/VectorTable.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace semsearch {

enum class Strategy {
    Average,
    TfIdf,
    Sif
};

const char* strategy_name(Strategy s);            // "Average" | "TF-IDF" | "SIF"
Strategy parse_strategy(const std::string& name);  // throws std::runtime_error

constexpr double kSifSmoothing = 1e-3;

// Corpus statistics gathered before any chunk is embedded.
struct CorpusStats {
    std::unordered_map<std::string, double> idf;         // TF-IDF: ln(N / df)
    std::unordered_map<std::string, double> word_probs;  // SIF: count / total
};

// doc_tokens[i] = content words of document i
CorpusStats compute_corpus_stats(const std::vector<std::vector<std::string>>& doc_tokens, Strategy strategy);

// All aggregations drop tokens missing from the table and return
// std::nullopt when nothing resolves or the total weight is 0.
std::optional<Vector> average_vector(const std::vector<std::string>& tokens, const VectorTable& table);

std::optional<Vector> tfidf_vector(const std::vector<std::string>& tokens,
                                   const VectorTable& table,
                                   const std::unordered_map<std::string, double>& idf);

std::optional<Vector> sif_vector(const std::vector<std::string>& tokens,
                                 const VectorTable& table,
                                 const std::unordered_map<std::string, double>& word_probs,
                                 double smoothing = kSifSmoothing);

std::optional<Vector> aggregate(const std::vector<std::string>& tokens,
                                const VectorTable& table,
                                Strategy strategy,
                                const CorpusStats& stats);

}  // namespace semsearch
