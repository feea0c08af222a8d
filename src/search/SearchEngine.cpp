#include "search/SearchEngine.hpp"
#include "io/FileUtil.hpp"
#include "prune/Pruner.hpp"
#include "search/IndexStore.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace semsearch {

SearchEngine::SearchEngine(Config cfg) : m_cfg(std::move(cfg)) {}

// Everything the config names: vector files, then matching custom vectors.
static VectorTable load_table(const Config& cfg) {
    const auto paths = cfg.vector_paths();
    if (paths.empty()) throw std::runtime_error("no embedding paths configured");

    VectorTable table;
    for (const auto& p : paths) {
        const TableLoadStats st = table.load_file(p);
        std::cout << "[vectors] " << p << ": " << st.loaded << " vectors\n";
    }
    if (table.empty()) throw std::runtime_error("no word vectors loaded, check embedding paths");

    table.set_model_id(cfg.model_identifier());

    if (!cfg.custom_vectors_path.empty()) {
        try {
            const auto customs = load_custom_vectors(cfg.custom_vectors_path);
            const size_t merged = merge_custom_vectors(table, customs);
            if (merged > 0) std::cout << "[vectors] merged " << merged << " custom vector(s)\n";
        } catch (const std::runtime_error& e) {
            std::cerr << "warning: failed to load custom vectors: " << e.what() << "\n";
        }
    }
    return table;
}

size_t SearchEngine::load_vectors() {
    m_vectors = load_table(m_cfg);
    return m_vectors.size();
}

void SearchEngine::set_vectors(VectorTable table) {
    m_vectors = std::move(table);
}

bool SearchEngine::rebuild(const Config& cfg, const Corpus& corpus, bool persist) {
    BuildLatch::Guard guard(m_latch);
    if (!guard.owned()) {
        std::cerr << "warning: index build already in progress, request ignored\n";
        return false;
    }

    const bool sources_changed = cfg.vector_paths() != m_cfg.vector_paths() ||
                                 cfg.custom_vectors_path != m_cfg.custom_vectors_path ||
                                 cfg.model_identifier() != m_cfg.model_identifier();
    // config and table change together; a failed load keeps both as they were
    if (sources_changed || m_vectors.empty()) m_vectors = load_table(cfg);
    m_cfg = cfg;

    std::cout << "[index] building with " << strategy_name(m_cfg.strategy) << " strategy over "
              << corpus.size() << " document(s)...\n";

    SearchIndex fresh = build_index(corpus.documents(), m_vectors, m_cfg.strategy, m_cfg.excluded_folders);
    if (persist) save_index_to(fresh);

    m_index = std::move(fresh);
    std::cout << "[index] built with " << m_index.size() << " items\n";
    return true;
}

void SearchEngine::save_index_to(const SearchIndex& index) const {
    semsearch::save_index(index, m_cfg.index_path);
}

void SearchEngine::load_index() {
    m_index = semsearch::load_index(m_cfg.index_path);
}

void SearchEngine::save_index() const {
    save_index_to(m_index);
}

std::vector<SearchResult> SearchEngine::search(const std::string& query) const {
    return search(query, (size_t)std::max(0, m_cfg.top_k));
}

std::vector<SearchResult> SearchEngine::search(const std::string& query, size_t top_k) const {
    SearchOptions opts;
    opts.top_k = top_k;
    opts.highlight_threshold = (float)m_cfg.highlight_threshold;
    return semsearch::search(query, m_index, m_vectors, opts);
}

bool SearchEngine::has_vector(const std::string& word) const {
    return m_vectors.contains(textutil::to_lower(textutil::trim(word)));
}

CustomVector SearchEngine::learn_word(const std::string& word, const std::string& context) {
    auto cv = derive_custom_vector(word, context, m_vectors);
    if (!cv) throw std::runtime_error("no known words in the context of \"" + word + "\"");

    if (!m_cfg.custom_vectors_path.empty()) upsert_custom_vector(m_cfg.custom_vectors_path, *cv);
    m_vectors.set(cv->word, cv->vector);
    return *cv;
}

size_t export_vocabulary(const Corpus& corpus, const std::string& path) {
    const auto vocab = scan_vocabulary(corpus);
    std::vector<std::string> sorted(vocab.begin(), vocab.end());
    std::sort(sorted.begin(), sorted.end());

    write_atomic(path, [&](std::ostream& out) {
        for (size_t i = 0; i < sorted.size(); ++i) {
            if (i) out << '\n';
            out << sorted[i];
        }
    });
    return sorted.size();
}

}  // namespace semsearch
