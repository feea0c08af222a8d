#include "config/Config.hpp"
#include "emb/VectorTable.hpp"
#include "io/JsonIO.hpp"

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace semsearch {

using json = nlohmann::json;

std::vector<std::string> Config::source_vector_paths() const {
    if (!embedding_paths.empty()) return embedding_paths;
    return expand_path_format(embedding_path_format, embedding_file_count);
}

std::vector<std::string> Config::vector_paths() const {
    if (use_pruned) return {pruned_path};
    return source_vector_paths();
}

std::string Config::model_identifier() const {
    if (use_pruned) return pruned_path;
    if (embedding_paths.empty()) return embedding_path_format;

    std::string id;
    for (const auto& p : embedding_paths) {
        if (!id.empty()) id += ';';
        id += p;
    }
    return id;
}

static void read_string(const json& j, const char* key, const std::string& where, std::string& out) {
    if (j.contains(key)) out = jsonio::require_string(j, key, where);
}

static void read_int(const json& j, const char* key, const std::string& where, int& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }
    out = j.at(key).get<int>();
}

static void read_bool(const json& j, const char* key, const std::string& where, bool& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_boolean()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be true or false");
    }
    out = j.at(key).get<bool>();
}

static void read_double(const json& j, const char* key, const std::string& where, double& out) {
    if (j.contains(key)) out = jsonio::require_number(j, key, where);
}

static void read_strings(const json& j, const char* key, const std::string& where, std::vector<std::string>& out) {
    if (j.contains(key)) out = jsonio::require_string_array(j, key, where);
}

Config config_from_json(const json& j, const std::string& where) {
    jsonio::require_object(j, where);

    Config c;
    read_string(j, "vault", where, c.vault);
    read_strings(j, "excluded_folders", where, c.excluded_folders);

    read_string(j, "embedding_path_format", where, c.embedding_path_format);
    read_int(j, "embedding_file_count", where, c.embedding_file_count);
    read_strings(j, "embedding_paths", where, c.embedding_paths);
    read_string(j, "pruned_path", where, c.pruned_path);
    read_bool(j, "use_pruned", where, c.use_pruned);
    read_string(j, "custom_vectors_path", where, c.custom_vectors_path);

    read_string(j, "index_path", where, c.index_path);
    if (j.contains("strategy")) c.strategy = parse_strategy(jsonio::require_string(j, "strategy", where));
    read_int(j, "top_k", where, c.top_k);
    read_double(j, "highlight_threshold", where, c.highlight_threshold);

    read_double(j, "similarity_threshold", where, c.similarity_threshold);
    read_int(j, "max_vocab_size", where, c.max_vocab_size);
    read_int(j, "neighbors", where, c.neighbors);
    read_int(j, "checkpoint_interval", where, c.checkpoint_interval);
    read_string(j, "checkpoint_path", where, c.checkpoint_path);
    read_int(j, "threads", where, c.threads);

    return c;
}

Config load_config(const std::string& path) {
    if (!fs::exists(path)) return Config{};
    return config_from_json(jsonio::read_json_file(path), path);
}

json config_to_json(const Config& c) {
    return {
        {"vault", c.vault},
        {"excluded_folders", c.excluded_folders},
        {"embedding_path_format", c.embedding_path_format},
        {"embedding_file_count", c.embedding_file_count},
        {"embedding_paths", c.embedding_paths},
        {"pruned_path", c.pruned_path},
        {"use_pruned", c.use_pruned},
        {"custom_vectors_path", c.custom_vectors_path},
        {"index_path", c.index_path},
        {"strategy", strategy_name(c.strategy)},
        {"top_k", c.top_k},
        {"highlight_threshold", c.highlight_threshold},
        {"similarity_threshold", c.similarity_threshold},
        {"max_vocab_size", c.max_vocab_size},
        {"neighbors", c.neighbors},
        {"checkpoint_interval", c.checkpoint_interval},
        {"checkpoint_path", c.checkpoint_path},
        {"threads", c.threads}
    };
}

void validate_config(const Config& c) {
    if (c.vector_paths().empty()) throw std::runtime_error("config: no embedding paths configured");
    if (c.use_pruned && c.pruned_path.empty()) throw std::runtime_error("config: use_pruned is set but pruned_path is empty");
    if (c.index_path.empty()) throw std::runtime_error("config: index_path is empty");
    if (c.top_k <= 0) throw std::runtime_error("config: top_k must be > 0");
    if (c.neighbors < 0) throw std::runtime_error("config: neighbors must be >= 0");
    if (c.max_vocab_size <= 0) throw std::runtime_error("config: max_vocab_size must be > 0");
    if (c.checkpoint_interval <= 0) throw std::runtime_error("config: checkpoint_interval must be > 0");
    if (c.threads < 0) throw std::runtime_error("config: threads must be >= 0");
}

}  // namespace semsearch
