#pragma once
#include "emb/VectorMath.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace semsearch {

struct TableLoadStats {
    size_t loaded = 0;       // vectors parsed and stored
    size_t malformed = 0;    // too few tokens / non-numeric values
    size_t wrong_dim = 0;    // dimension differs from the table's
};

// Parses one "<word> <f1> ... <fD>" line. Returns false for malformed lines
// (fewer than two values, or a token that is not a float).
bool parse_vector_line(const std::string& line, std::string& word, Vector& values);

// word -> fixed-dimension vector, rows packed contiguously.
// Keys are lowercased on insert; a later entry for the same word replaces the earlier one.
class VectorTable {
public:
    // Throws std::runtime_error if the file cannot be opened.
    // Malformed lines are skipped and reported once per file on std::cerr.
    TableLoadStats load_file(const std::string& path);
    TableLoadStats load_stream(std::istream& in, const std::string& source_name);

    // Throws std::invalid_argument if the dimension differs from dim().
    void set(const std::string& word, const Vector& v);

    // lookups expect an already lowercased word
    const float* find(const std::string& word) const;
    Vector get(const std::string& word) const;  // empty if absent
    std::optional<size_t> row_index(const std::string& word) const;
    bool contains(const std::string& word) const { return find(word) != nullptr; }

    size_t dim() const { return m_dim; }
    size_t size() const { return m_words.size(); }
    bool empty() const { return m_words.empty(); }

    // row access in insertion order
    const std::string& word_at(size_t row) const { return m_words[row]; }
    const float* row(size_t i) const { return &m_vecs[i * m_dim]; }

    // identifier of the source the table was built from (custom vectors match on it)
    const std::string& model_id() const { return m_model_id; }
    void set_model_id(std::string id) { m_model_id = std::move(id); }

    // text format, one "<word> <f1> ... <fD>" line per entry
    void save(const std::string& path) const;

    void clear();

private:
    size_t m_dim = 0;
    std::vector<std::string> m_words;
    std::vector<float> m_vecs;  // packed: size = size()*dim()
    std::unordered_map<std::string, size_t> m_rows;
    std::string m_model_id;
};

// "glove_part_{}.txt" x 3 -> glove_part_1.txt .. glove_part_3.txt
std::vector<std::string> expand_path_format(const std::string& format, int count);

}  // namespace semsearch
