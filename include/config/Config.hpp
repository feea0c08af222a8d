#pragma once
#include "search/Aggregator.hpp"

#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace semsearch {

struct Config {
    // corpus
    std::string vault = ".";
    std::vector<std::string> excluded_folders;

    // embedding tables
    std::string embedding_path_format = "embeddings/glove.6B.100d_part_{}.txt";
    int embedding_file_count = 4;
    std::vector<std::string> embedding_paths;  // wins over the path format when set
    std::string pruned_path = "embeddings/enhanced_pruned_vectors.txt";
    bool use_pruned = false;                   // search with the pruned table alone
    std::string custom_vectors_path = ".semsearch/custom-vectors.json";

    // index + search
    std::string index_path = ".semsearch/semantic-index.json";
    Strategy strategy = Strategy::Average;
    int top_k = 10;
    double highlight_threshold = 0.5;

    // pruning
    double similarity_threshold = 0.0;
    int max_vocab_size = 100000;
    int neighbors = 5;
    int checkpoint_interval = 1000;
    std::string checkpoint_path = ".semsearch/pruning_checkpoint.json";
    int threads = 0;  // 0 = hardware concurrency

    // the full tables, before pruning
    std::vector<std::string> source_vector_paths() const;

    // files the search table is loaded from: the pruned table when use_pruned
    std::vector<std::string> vector_paths() const;

    // custom vectors are matched against this
    std::string model_identifier() const;
};

// Absent fields keep their defaults; present fields of the wrong type throw std::runtime_error.
Config config_from_json(const nlohmann::json& j, const std::string& where = "config");

// Missing file -> defaults.
Config load_config(const std::string& path);

nlohmann::json config_to_json(const Config& c);

// Throws std::runtime_error naming the first invalid value.
void validate_config(const Config& c);

}  // namespace semsearch
