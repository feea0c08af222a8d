#include "search/Aggregator.hpp"

#include <cmath>
#include <stdexcept>
#include <unordered_set>

namespace semsearch {

const char* strategy_name(Strategy s) {
    switch (s) {
        case Strategy::Average: return "Average";
        case Strategy::TfIdf: return "TF-IDF";
        case Strategy::Sif: return "SIF";
    }
    return "Average";
}

Strategy parse_strategy(const std::string& name) {
    if (name == "Average" || name == "average") return Strategy::Average;
    if (name == "TF-IDF" || name == "tfidf" || name == "tf-idf") return Strategy::TfIdf;
    if (name == "SIF" || name == "sif") return Strategy::Sif;
    throw std::runtime_error("unknown indexing strategy: " + name);
}

CorpusStats compute_corpus_stats(const std::vector<std::vector<std::string>>& doc_tokens, Strategy strategy) {
    CorpusStats st;

    if (strategy == Strategy::TfIdf) {
        std::unordered_map<std::string, size_t> df;
        for (const auto& toks : doc_tokens) {
            std::unordered_set<std::string> seen(toks.begin(), toks.end());
            for (const auto& w : seen) df[w] += 1;
        }

        const double n = (double)doc_tokens.size();
        st.idf.reserve(df.size());
        for (const auto& kv : df) {
            st.idf.emplace(kv.first, std::log(n / (double)kv.second));
        }
    } else if (strategy == Strategy::Sif) {
        std::unordered_map<std::string, size_t> counts;
        size_t total = 0;
        for (const auto& toks : doc_tokens) {
            for (const auto& w : toks) {
                counts[w] += 1;
                ++total;
            }
        }

        st.word_probs.reserve(counts.size());
        for (const auto& kv : counts) {
            st.word_probs.emplace(kv.first, (double)kv.second / (double)total);
        }
    }

    return st;
}

// Σ(w·v) / Σw over the tokens that resolve in the table
template <typename WeightFn>
static std::optional<Vector> weighted_mean(const std::vector<std::string>& tokens,
                                           const VectorTable& table,
                                           WeightFn weight_of) {
    const size_t dim = table.dim();
    std::vector<double> sum(dim, 0.0);
    double total = 0.0;
    size_t found = 0;

    for (const auto& t : tokens) {
        const float* v = table.find(t);
        if (!v) continue;
        ++found;

        const double w = weight_of(t);
        for (size_t i = 0; i < dim; ++i) sum[i] += w * (double)v[i];
        total += w;
    }

    if (found == 0 || total == 0.0) return std::nullopt;

    Vector out(dim);
    for (size_t i = 0; i < dim; ++i) out[i] = (float)(sum[i] / total);
    return out;
}

std::optional<Vector> average_vector(const std::vector<std::string>& tokens, const VectorTable& table) {
    return weighted_mean(tokens, table, [](const std::string&) { return 1.0; });
}

std::optional<Vector> tfidf_vector(const std::vector<std::string>& tokens,
                                   const VectorTable& table,
                                   const std::unordered_map<std::string, double>& idf) {
    if (tokens.empty()) return std::nullopt;

    std::unordered_map<std::string, size_t> tf;
    for (const auto& t : tokens) tf[t] += 1;

    const double len = (double)tokens.size();
    return weighted_mean(tokens, table, [&](const std::string& t) {
        auto it = idf.find(t);
        if (it == idf.end()) return 0.0;
        return ((double)tf[t] / len) * it->second;
    });
}

std::optional<Vector> sif_vector(const std::vector<std::string>& tokens,
                                 const VectorTable& table,
                                 const std::unordered_map<std::string, double>& word_probs,
                                 double smoothing) {
    return weighted_mean(tokens, table, [&](const std::string& t) {
        auto it = word_probs.find(t);
        const double p = (it == word_probs.end()) ? 0.0 : it->second;
        return smoothing / (smoothing + p);
    });
}

std::optional<Vector> aggregate(const std::vector<std::string>& tokens,
                                const VectorTable& table,
                                Strategy strategy,
                                const CorpusStats& stats) {
    switch (strategy) {
        case Strategy::Average: return average_vector(tokens, table);
        case Strategy::TfIdf: return tfidf_vector(tokens, table, stats.idf);
        case Strategy::Sif: return sif_vector(tokens, table, stats.word_probs);
    }
    return std::nullopt;
}

}  // namespace semsearch
