#include "search/IndexStore.hpp"
#include "io/JsonIO.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace semsearch {

using json = nlohmann::json;

static fs::path sibling_with_suffix(const fs::path& p, const std::string& suffix) {
    fs::path out = p.parent_path() / p.stem();
    out += suffix;
    return out;
}

fs::path pca_path_for(const fs::path& index_path) {
    return sibling_with_suffix(index_path, "-pca.json");
}

fs::path stats_path_for(const fs::path& index_path) {
    return sibling_with_suffix(index_path, "-stats.json");
}

static json items_to_json(const std::vector<IndexedItem>& items) {
    json arr = json::array();
    for (const auto& it : items) {
        arr.push_back({{"file", it.file}, {"text", it.text}, {"embedding", it.embedding}});
    }
    return arr;
}

static json stats_to_json(const SearchIndex& index) {
    json j;
    j["version"] = kStatsVersion;
    j["strategy"] = strategy_name(index.strategy);
    j["idf"] = json::object();
    for (const auto& kv : index.stats.idf) j["idf"][kv.first] = kv.second;
    j["word_probs"] = json::object();
    for (const auto& kv : index.stats.word_probs) j["word_probs"][kv.first] = kv.second;
    return j;
}

void save_index(const SearchIndex& index, const fs::path& index_path) {
    // sidecars first, the index last: a failure part way never leaves an
    // index newer than its stats or principal component
    std::vector<std::pair<fs::path, std::string>> files;
    files.emplace_back(stats_path_for(index_path), stats_to_json(index).dump());
    if (index.principal_component) {
        files.emplace_back(pca_path_for(index_path), json(*index.principal_component).dump());
    }
    files.emplace_back(index_path, items_to_json(index.items).dump());

    if (index_path.has_parent_path()) fs::create_directories(index_path.parent_path());

    std::vector<fs::path> staged;
    auto discard = [&]() {
        std::error_code ec;
        for (const auto& t : staged) fs::remove(t, ec);
    };

    for (const auto& f : files) {
        fs::path tmp = f.first;
        tmp += ".tmp";
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (out) {
            staged.push_back(tmp);
            out << f.second << "\n";
            out.flush();
        }
        if (!out) {
            discard();
            throw std::runtime_error("failed to write index file: " + tmp.string());
        }
    }

    for (size_t i = 0; i < files.size(); ++i) {
        if (i + 1 == files.size() && !index.principal_component) {
            std::error_code ec;
            fs::remove(pca_path_for(index_path), ec);
        }

        std::error_code ec;
        fs::rename(staged[i], files[i].first, ec);
        if (ec) {
            discard();
            throw std::runtime_error("failed to replace " + files[i].first.string() + ": " + ec.message());
        }
    }
}

static void load_stats(const json& j, SearchIndex& index, const std::string& where) {
    jsonio::require_object(j, where);

    const int version = (int)jsonio::require_number(j, "version", where);
    if (version != kStatsVersion) {
        std::ostringstream oss;
        oss << where << ": unsupported version " << version << " (expected " << kStatsVersion << ")";
        throw std::runtime_error(oss.str());
    }

    index.strategy = parse_strategy(jsonio::require_string(j, "strategy", where));

    auto read_map = [&](const char* key, std::unordered_map<std::string, double>& out) {
        if (!j.contains(key)) return;
        const json& m = j.at(key);
        jsonio::require_object(m, where + "." + key);
        out.reserve(m.size());
        for (auto it = m.begin(); it != m.end(); ++it) {
            if (!it.value().is_number()) {
                throw std::runtime_error(where + "." + key + "." + it.key() + " must be a number");
            }
            out.emplace(it.key(), it.value().get<double>());
        }
    };
    read_map("idf", index.stats.idf);
    read_map("word_probs", index.stats.word_probs);
}

SearchIndex load_index(const fs::path& index_path) {
    SearchIndex index;
    if (!fs::exists(index_path)) return index;

    const json arr = jsonio::read_json_file(index_path);
    jsonio::require_array(arr, index_path.string());

    size_t dim = 0;
    size_t skipped = 0;
    index.items.reserve(arr.size());

    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream where;
        where << "index[" << i << "]";
        try {
            const json& j = arr.at(i);
            jsonio::require_object(j, where.str());

            IndexedItem it;
            it.file = jsonio::require_string(j, "file", where.str());
            it.text = jsonio::require_string(j, "text", where.str());
            it.embedding = jsonio::require_float_array(j, "embedding", where.str());

            if (it.embedding.empty()) throw std::runtime_error(where.str() + ".embedding is empty");
            if (dim == 0) dim = it.embedding.size();
            if (it.embedding.size() != dim) throw std::runtime_error(where.str() + ".embedding has wrong dimension");

            index.items.push_back(std::move(it));
        } catch (const std::runtime_error& e) {
            if (skipped == 0) std::cerr << "warning: " << e.what() << "\n";
            ++skipped;
        }
    }
    if (skipped > 0) {
        std::cerr << "warning: " << index_path.string() << ": skipped " << skipped << " malformed item(s)\n";
    }

    const fs::path stats_path = stats_path_for(index_path);
    if (fs::exists(stats_path)) {
        load_stats(jsonio::read_json_file(stats_path), index, stats_path.string());
    } else {
        std::cerr << "warning: no index stats at " << stats_path.string()
                  << ", queries use Average aggregation\n";
        index.strategy = Strategy::Average;
    }

    const fs::path pca_path = pca_path_for(index_path);
    if (index.strategy == Strategy::Sif && fs::exists(pca_path)) {
        Vector pc = jsonio::to_float_array(jsonio::read_json_file(pca_path), pca_path.string());
        if (dim != 0 && pc.size() != dim) {
            throw std::runtime_error(pca_path.string() + ": principal component dimension does not match the index, rebuild required");
        }
        index.principal_component = std::move(pc);
    }

    return index;
}

}  // namespace semsearch
