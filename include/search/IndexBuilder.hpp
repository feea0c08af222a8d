#pragma once
#include "emb/VectorTable.hpp"
#include "search/Aggregator.hpp"
#include "text/Corpus.hpp"

#include <optional>
#include <string>
#include <vector>

namespace semsearch {

struct IndexedItem {
    std::string file;   // source document id
    std::string text;   // chunk text
    Vector embedding;
};

// One build's output. Items and principal component always come from the same build.
struct SearchIndex {
    Strategy strategy = Strategy::Average;
    CorpusStats stats;
    std::vector<IndexedItem> items;
    std::optional<Vector> principal_component;  // SIF only

    size_t size() const { return items.size(); }
    bool empty() const { return items.empty(); }
};

// true if `id` starts with any non-blank prefix (prefixes are trimmed)
bool is_excluded(const std::string& id, const std::vector<std::string>& excluded_prefixes);

// Full rebuild: filter -> chunk -> corpus stats -> aggregate -> (SIF) PCA correction.
// Chunks that yield no vector are dropped.
SearchIndex build_index(const std::vector<Document>& docs,
                        const VectorTable& table,
                        Strategy strategy,
                        const std::vector<std::string>& excluded_prefixes = {});

}  // namespace semsearch
