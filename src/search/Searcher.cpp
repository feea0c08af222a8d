#include "search/Searcher.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace semsearch {

std::optional<Vector> embed_query(const std::string& query, const SearchIndex& index, const VectorTable& table) {
    const auto tokens = textutil::content_words(query);
    auto v = aggregate(tokens, table, index.strategy, index.stats);
    if (!v) return std::nullopt;

    if (index.principal_component) remove_projection(*v, *index.principal_component);
    return v;
}

std::vector<SearchResult> search(const std::string& query,
                                 const SearchIndex& index,
                                 const VectorTable& table,
                                 const SearchOptions& opts) {
    if (index.empty() || textutil::trim(query).empty() || opts.top_k == 0) return {};

    const auto qv = embed_query(query, index, table);
    if (!qv) return {};

    std::vector<float> scores(index.items.size());
    for (size_t i = 0; i < index.items.size(); ++i) {
        const Vector& e = index.items[i].embedding;
        if (e.size() != qv->size()) {
            std::ostringstream oss;
            oss << "search: query dimension " << qv->size() << " != index dimension " << e.size()
                << " (item " << i << ", " << index.items[i].file << ")";
            throw std::invalid_argument(oss.str());
        }
        scores[i] = cosine(qv->data(), e.data(), e.size());
    }

    std::vector<size_t> order(index.items.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b){ return scores[a] > scores[b]; });

    if (order.size() > opts.top_k) order.resize(opts.top_k);

    const auto query_words = textutil::words(query);

    std::vector<SearchResult> results;
    results.reserve(order.size());
    for (size_t i : order) {
        const IndexedItem& it = index.items[i];
        SearchResult r;
        r.file = it.file;
        r.text = it.text;
        r.embedding = it.embedding;
        r.score = scores[i];
        r.highlight_word = best_matching_word(it.text, query_words, table, opts.highlight_threshold);
        results.push_back(std::move(r));
    }
    return results;
}

std::optional<std::string> best_matching_word(const std::string& chunk_text,
                                              const std::vector<std::string>& query_words,
                                              const VectorTable& table,
                                              float threshold) {
    std::vector<const float*> qvecs;
    for (const auto& w : query_words) {
        const float* v = table.find(w);
        if (v) qvecs.push_back(v);
    }
    if (qvecs.empty()) return std::nullopt;

    std::string best;
    float max_sim = -1.0f;

    for (const auto& cw : textutil::words(chunk_text)) {
        const float* cv = table.find(cw);
        if (!cv) continue;

        for (const float* qv : qvecs) {
            const float s = cosine(cv, qv, table.dim());
            if (s > max_sim) {
                max_sim = s;
                best = cw;
            }
        }
    }

    if (max_sim > threshold) return best;
    return std::nullopt;
}

std::string context_snippet(const std::string& text, const std::optional<std::string>& highlight_word) {
    auto shortened = [&]() {
        return text.size() > 150 ? text.substr(0, 147) + "..." : text;
    };

    if (!highlight_word || highlight_word->empty()) return shortened();

    const size_t pos = textutil::to_lower(text).find(*highlight_word);
    if (pos == std::string::npos) return shortened();

    const size_t start = pos > 50 ? pos - 50 : 0;
    const size_t end = std::min(text.size(), pos + highlight_word->size() + 50);

    std::string snippet = text.substr(start, end - start);
    if (start > 0) snippet = "..." + snippet;
    if (end < text.size()) snippet += "...";
    return snippet;
}

}  // namespace semsearch
