#pragma once
#include "config/Config.hpp"
#include "emb/CustomVectors.hpp"
#include "emb/VectorTable.hpp"
#include "search/IndexBuilder.hpp"
#include "search/Searcher.hpp"
#include "text/Corpus.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace semsearch {

// "Build in progress" flag. try_acquire() fails while another holder exists.
class BuildLatch {
public:
    class Guard {
    public:
        explicit Guard(BuildLatch& latch) : m_latch(&latch), m_owned(latch.try_acquire()) {}
        ~Guard() { if (m_owned) m_latch->release(); }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        bool owned() const { return m_owned; }

    private:
        BuildLatch* m_latch;
        bool m_owned;
    };

    bool try_acquire() {
        bool expected = false;
        return m_busy.compare_exchange_strong(expected, true);
    }
    void release() { m_busy.store(false); }
    bool busy() const { return m_busy.load(); }

private:
    std::atomic<bool> m_busy{false};
};

class SearchEngine {
public:
    explicit SearchEngine(Config cfg);

    // Loads every configured vector file, then merges matching custom vectors.
    // Throws std::runtime_error when no path is configured, a file is missing,
    // or nothing was loaded.
    size_t load_vectors();

    // Replaces the table, e.g. with one built in memory.
    void set_vectors(VectorTable table);

    // Full rebuild under the build latch. Returns false (doing nothing) if a
    // build is already running. Vectors are reloaded when the configured
    // sources changed or none are loaded. The new index is persisted before it
    // replaces the current one when `persist` is set.
    bool rebuild(const Config& cfg, const Corpus& corpus, bool persist = true);
    bool rebuild(const Corpus& corpus, bool persist = true) { return rebuild(m_cfg, corpus, persist); }

    void load_index();
    void save_index() const;

    std::vector<SearchResult> search(const std::string& query) const;
    std::vector<SearchResult> search(const std::string& query, size_t top_k) const;

    // Derives, persists and installs a vector for a word missing from the table.
    // Throws std::runtime_error if the context resolves to no vector.
    CustomVector learn_word(const std::string& word, const std::string& context);

    // case-insensitive, surrounding whitespace ignored
    bool has_vector(const std::string& word) const;

    const Config& config() const { return m_cfg; }
    const VectorTable& vectors() const { return m_vectors; }
    const SearchIndex& index() const { return m_index; }
    BuildLatch& build_latch() { return m_latch; }

private:
    void save_index_to(const SearchIndex& index) const;

    Config m_cfg;
    VectorTable m_vectors;
    SearchIndex m_index;
    BuildLatch m_latch;
};

// sorted unique word tokens of the corpus, one per line
size_t export_vocabulary(const Corpus& corpus, const std::string& path);

}  // namespace semsearch
