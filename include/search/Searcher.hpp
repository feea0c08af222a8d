#pragma once
#include "emb/VectorTable.hpp"
#include "search/IndexBuilder.hpp"

#include <optional>
#include <string>
#include <vector>

namespace semsearch {

struct SearchResult {
    std::string file;
    std::string text;
    Vector embedding;
    float score = 0.0f;                       // cosine similarity, [-1, 1]
    std::optional<std::string> highlight_word;
};

struct SearchOptions {
    size_t top_k = 10;
    float highlight_threshold = 0.5f;  // highlight accepted only above this similarity
};

// Query vector built exactly like a chunk of `index`: same strategy and
// statistics, then the stored principal component removed.
std::optional<Vector> embed_query(const std::string& query, const SearchIndex& index, const VectorTable& table);

// Ranked by cosine similarity, stable on ties, at most top_k results.
// Empty index, empty query or an unresolvable query -> empty list.
// Throws std::invalid_argument when query and index dimensions differ.
std::vector<SearchResult> search(const std::string& query,
                                 const SearchIndex& index,
                                 const VectorTable& table,
                                 const SearchOptions& opts = {});

// The chunk word closest to any query word, if that similarity exceeds `threshold`.
std::optional<std::string> best_matching_word(const std::string& chunk_text,
                                              const std::vector<std::string>& query_words,
                                              const VectorTable& table,
                                              float threshold);

// <=150 chars, centered on the highlight word when it occurs in the text
std::string context_snippet(const std::string& text, const std::optional<std::string>& highlight_word);

}  // namespace semsearch
