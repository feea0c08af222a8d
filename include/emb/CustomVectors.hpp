#pragma once
#include "emb/VectorTable.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace semsearch {

struct CustomVector {
    std::string word;
    Vector vector;
    std::string created_at;  // ISO 8601, UTC
    std::string base_model;  // model_id() of the table it was derived from
    int dimension = 0;
};

constexpr int kCustomVectorVersion = 1;

// Missing file -> empty list. Records failing the schema check (or carrying an
// unknown "version") are skipped with a warning. Throws std::runtime_error if
// the file is not a JSON array.
std::vector<CustomVector> load_custom_vectors(const std::filesystem::path& path);

void save_custom_vectors(const std::filesystem::path& path, const std::vector<CustomVector>& vecs);

// Adds entries whose base_model and dimension match the table; the rest are
// skipped with a warning. Returns the number merged.
size_t merge_custom_vectors(VectorTable& table, const std::vector<CustomVector>& vecs);

// Average of the context words (the word itself excluded), stamped with the
// table's model_id() and the current time. std::nullopt if nothing resolves.
std::optional<CustomVector> derive_custom_vector(const std::string& word,
                                                 const std::string& context,
                                                 const VectorTable& table);

// Replaces the entry for the same word or appends; then writes the file.
void upsert_custom_vector(const std::filesystem::path& path, const CustomVector& cv);

std::string utc_timestamp_now();

}  // namespace semsearch
