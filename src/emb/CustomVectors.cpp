#include "emb/CustomVectors.hpp"
#include "io/JsonIO.hpp"
#include "search/Aggregator.hpp"
#include "text/TextUtil.hpp"

#include <ctime>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace semsearch {

using json = nlohmann::json;

static CustomVector parse_custom_vector(const json& j, const std::string& where) {
    jsonio::require_object(j, where);

    if (j.contains("version")) {
        if (!j.at("version").is_number_integer() || j.at("version").get<int>() != kCustomVectorVersion) {
            throw std::runtime_error(where + ": unsupported version");
        }
    }

    CustomVector cv;
    cv.word = textutil::to_lower(jsonio::require_string(j, "word", where));
    cv.vector = jsonio::require_float_array(j, "vector", where);
    cv.created_at = jsonio::require_string(j, "createdAt", where);
    cv.base_model = jsonio::require_string(j, "baseModel", where);
    cv.dimension = (int)jsonio::require_number(j, "dimension", where);

    if (cv.word.empty()) throw std::runtime_error(where + ".word is empty");
    if ((int)cv.vector.size() != cv.dimension) {
        throw std::runtime_error(where + ".vector length does not match dimension");
    }
    return cv;
}

std::vector<CustomVector> load_custom_vectors(const fs::path& path) {
    std::vector<CustomVector> out;
    if (!fs::exists(path)) return out;

    const json arr = jsonio::read_json_file(path);
    jsonio::require_array(arr, path.string());

    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream where;
        where << path.string() << "[" << i << "]";
        try {
            out.push_back(parse_custom_vector(arr.at(i), where.str()));
        } catch (const std::runtime_error& e) {
            std::cerr << "warning: skipping custom vector: " << e.what() << "\n";
        }
    }
    return out;
}

void save_custom_vectors(const fs::path& path, const std::vector<CustomVector>& vecs) {
    json arr = json::array();
    for (const auto& cv : vecs) {
        arr.push_back({
            {"version", kCustomVectorVersion},
            {"word", cv.word},
            {"vector", cv.vector},
            {"createdAt", cv.created_at},
            {"baseModel", cv.base_model},
            {"dimension", cv.dimension}
        });
    }
    jsonio::write_json_file(path, arr, 2);
}

size_t merge_custom_vectors(VectorTable& table, const std::vector<CustomVector>& vecs) {
    size_t merged = 0;
    for (const auto& cv : vecs) {
        if (cv.base_model != table.model_id() || (size_t)cv.dimension != table.dim()) {
            std::cerr << "warning: skipping custom vector for \"" << cv.word
                      << "\" due to model/dimension mismatch (model " << cv.base_model
                      << " vs " << table.model_id() << ", dim " << cv.dimension
                      << " vs " << table.dim() << ")\n";
            continue;
        }
        table.set(cv.word, cv.vector);
        ++merged;
    }
    return merged;
}

std::optional<CustomVector> derive_custom_vector(const std::string& word,
                                                 const std::string& context,
                                                 const VectorTable& table) {
    const std::string key = textutil::to_lower(textutil::trim(word));
    if (key.empty()) return std::nullopt;

    std::vector<std::string> tokens;
    for (auto& t : textutil::content_words(context)) {
        if (t != key) tokens.push_back(std::move(t));
    }

    auto v = average_vector(tokens, table);
    if (!v) return std::nullopt;

    CustomVector cv;
    cv.word = key;
    cv.dimension = (int)v->size();
    cv.vector = std::move(*v);
    cv.created_at = utc_timestamp_now();
    cv.base_model = table.model_id();
    return cv;
}

void upsert_custom_vector(const fs::path& path, const CustomVector& cv) {
    std::vector<CustomVector> all;
    try {
        all = load_custom_vectors(path);
    } catch (const std::runtime_error& e) {
        std::cerr << "warning: failed to read custom vectors file, starting a new one: " << e.what() << "\n";
    }

    bool replaced = false;
    for (auto& existing : all) {
        if (existing.word == cv.word) {
            existing = cv;
            replaced = true;
            break;
        }
    }
    if (!replaced) all.push_back(cv);

    save_custom_vectors(path, all);
}

std::string utc_timestamp_now() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

}  // namespace semsearch
