#include "prune/NeighborSearch.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <mutex>
#include <thread>

namespace semsearch {

NeighborSearch::NeighborSearch(const VectorTable& table) : m_table(table) {
    const size_t dim = table.dim();
    m_norms.resize(table.size());
    for (size_t i = 0; i < table.size(); ++i) {
        const float* r = table.row(i);
        double ss = 0.0;
        for (size_t j = 0; j < dim; ++j) ss += (double)r[j] * (double)r[j];
        m_norms[i] = std::sqrt(ss);
    }
}

std::vector<Similarity> NeighborSearch::nearest(const std::string& word, size_t n, double threshold, Scratch& scratch) const {
    const auto self = m_table.row_index(word);
    if (!self || n == 0) return {};

    const size_t dim = m_table.dim();
    const float* a = m_table.row(*self);
    const double na = m_norms[*self];

    scratch.clear();
    for (size_t i = 0; i < m_table.size(); ++i) {
        if (i == *self) continue;

        double score = 0.0;
        if (na != 0.0 && m_norms[i] != 0.0) {
            const float* b = m_table.row(i);
            double d = 0.0;
            for (size_t j = 0; j < dim; ++j) d += (double)a[j] * (double)b[j];
            score = d / (na * m_norms[i]);
        }
        if (score > threshold) scratch.emplace_back((float)score, i);
    }

    const size_t k = std::min(n, scratch.size());
    std::partial_sort(scratch.begin(), scratch.begin() + (std::ptrdiff_t)k, scratch.end(),
                      [](const auto& x, const auto& y) {
                          if (x.first != y.first) return x.first > y.first;
                          return x.second < y.second;
                      });

    std::vector<Similarity> out;
    out.reserve(k);
    for (size_t i = 0; i < k; ++i) out.push_back({m_table.word_at(scratch[i].second), scratch[i].first});
    return out;
}

void NeighborSearch::run_batch(const std::vector<std::string>& words,
                               size_t n,
                               double threshold,
                               size_t threads,
                               std::unordered_set<std::string>& candidates) const {
    if (words.empty()) return;
    if (threads == 0) threads = 1;
    threads = std::min(threads, words.size());

    std::atomic<size_t> cursor{0};
    std::mutex merge_mutex;
    std::exception_ptr first_error;

    auto worker = [&]() {
        Scratch scratch;
        try {
            while (true) {
                const size_t i = cursor.fetch_add(1);
                if (i >= words.size()) break;

                auto found = nearest(words[i], n, threshold, scratch);
                if (found.empty()) continue;

                std::lock_guard<std::mutex> lock(merge_mutex);
                for (auto& s : found) candidates.insert(std::move(s.word));
            }
        } catch (...) {
            std::lock_guard<std::mutex> lock(merge_mutex);
            if (!first_error) first_error = std::current_exception();
            cursor.store(words.size());
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (size_t t = 0; t < threads; ++t) pool.emplace_back(worker);
    for (auto& th : pool) th.join();

    if (first_error) std::rethrow_exception(first_error);
}

}  // namespace semsearch
