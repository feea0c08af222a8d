#include "search/IndexBuilder.hpp"
#include "search/Pca.hpp"
#include "text/TextUtil.hpp"

namespace semsearch {

bool is_excluded(const std::string& id, const std::vector<std::string>& excluded_prefixes) {
    for (const auto& raw : excluded_prefixes) {
        const std::string prefix = textutil::trim(raw);
        if (prefix.empty()) continue;
        if (id.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

SearchIndex build_index(const std::vector<Document>& docs,
                        const VectorTable& table,
                        Strategy strategy,
                        const std::vector<std::string>& excluded_prefixes) {
    SearchIndex out;
    out.strategy = strategy;

    struct Chunk {
        const Document* doc;
        std::string text;
        std::vector<std::string> tokens;
    };

    // Pass 1: chunk + token lists, document-level tokens for statistics
    std::vector<Chunk> chunks;
    std::vector<std::vector<std::string>> doc_tokens;

    for (const auto& d : docs) {
        if (is_excluded(d.id, excluded_prefixes)) continue;

        if (strategy != Strategy::Average) doc_tokens.push_back(textutil::content_words(d.text));

        for (auto& c : textutil::chunk_text(d.text)) {
            Chunk ch;
            ch.doc = &d;
            ch.tokens = textutil::content_words(c);
            ch.text = std::move(c);
            chunks.push_back(std::move(ch));
        }
    }

    out.stats = compute_corpus_stats(doc_tokens, strategy);

    // Pass 2: embed every chunk
    std::vector<Vector> embeddings;
    std::vector<const Chunk*> kept;
    embeddings.reserve(chunks.size());
    kept.reserve(chunks.size());

    for (const auto& ch : chunks) {
        auto v = aggregate(ch.tokens, table, strategy, out.stats);
        if (!v) continue;
        embeddings.push_back(std::move(*v));
        kept.push_back(&ch);
    }

    if (strategy == Strategy::Sif) {
        out.principal_component = principal_component(embeddings);
        if (out.principal_component) remove_common_component(embeddings, *out.principal_component);
    }

    out.items.reserve(kept.size());
    for (size_t i = 0; i < kept.size(); ++i) {
        out.items.push_back({kept[i]->doc->id, kept[i]->text, std::move(embeddings[i])});
    }
    return out;
}

}  // namespace semsearch
