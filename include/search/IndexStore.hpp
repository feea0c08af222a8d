#pragma once
#include "search/IndexBuilder.hpp"

#include <filesystem>

namespace semsearch {

// Sidecar paths next to the index file: "<stem>-pca.json", "<stem>-stats.json"
std::filesystem::path pca_path_for(const std::filesystem::path& index_path);
std::filesystem::path stats_path_for(const std::filesystem::path& index_path);

// Writes index, stats and (SIF) principal component. All files are staged
// before any is replaced; a stale PCA sidecar is removed for non-SIF builds.
void save_index(const SearchIndex& index, const std::filesystem::path& index_path);

// Missing index file -> empty index. Malformed items are skipped with a warning.
// Throws std::runtime_error on unreadable JSON, an unsupported stats version,
// or a principal component whose dimension disagrees with the items.
SearchIndex load_index(const std::filesystem::path& index_path);

constexpr int kStatsVersion = 1;

}  // namespace semsearch
