#include "emb/VectorTable.hpp"
#include "io/FileUtil.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace semsearch {

static bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool parse_vector_line(const std::string& line, std::string& word, Vector& values) {
    word.clear();
    values.clear();

    const char* p = line.c_str();
    while (*p && is_ws(*p)) ++p;

    const char* w = p;
    while (*p && !is_ws(*p)) ++p;
    if (p == w) return false;
    word.assign(w, p);

    while (true) {
        while (*p && is_ws(*p)) ++p;
        if (!*p) break;

        char* end = nullptr;
        float f = std::strtof(p, &end);
        if (end == p || (*end && !is_ws(*end))) return false;
        values.push_back(f);
        p = end;
    }

    return values.size() >= 2;
}

TableLoadStats VectorTable::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open vector file: " + path);
    return load_stream(in, path);
}

TableLoadStats VectorTable::load_stream(std::istream& in, const std::string& source_name) {
    TableLoadStats st;
    std::string line;
    std::string word;
    Vector values;

    while (std::getline(in, line)) {
        if (textutil::trim(line).empty()) continue;

        if (!parse_vector_line(line, word, values)) {
            st.malformed++;
            continue;
        }
        if (m_dim != 0 && values.size() != m_dim) {
            st.wrong_dim++;
            continue;
        }
        set(word, values);
        st.loaded++;
    }

    if (in.bad()) throw std::runtime_error("read error in vector file: " + source_name);

    if (st.malformed > 0 || st.wrong_dim > 0) {
        std::cerr << "warning: " << source_name << ": skipped " << st.malformed
                  << " malformed line(s) and " << st.wrong_dim
                  << " line(s) with dimension != " << m_dim << "\n";
    }
    return st;
}

void VectorTable::set(const std::string& word, const Vector& v) {
    if (v.empty()) throw std::invalid_argument("VectorTable: empty vector for '" + word + "'");
    if (m_dim == 0) m_dim = v.size();
    if (v.size() != m_dim) {
        std::ostringstream oss;
        oss << "VectorTable: dimension " << v.size() << " for '" << word << "', table has " << m_dim;
        throw std::invalid_argument(oss.str());
    }

    const std::string key = textutil::to_lower(word);
    auto it = m_rows.find(key);
    if (it != m_rows.end()) {
        std::copy(v.begin(), v.end(), m_vecs.begin() + (std::ptrdiff_t)(it->second * m_dim));
        return;
    }

    m_rows.emplace(key, m_words.size());
    m_words.push_back(key);
    m_vecs.insert(m_vecs.end(), v.begin(), v.end());
}

const float* VectorTable::find(const std::string& word) const {
    auto it = m_rows.find(word);
    if (it == m_rows.end()) return nullptr;
    return row(it->second);
}

std::optional<size_t> VectorTable::row_index(const std::string& word) const {
    auto it = m_rows.find(word);
    if (it == m_rows.end()) return std::nullopt;
    return it->second;
}

Vector VectorTable::get(const std::string& word) const {
    const float* r = find(word);
    if (!r) return {};
    return Vector(r, r + m_dim);
}

void VectorTable::save(const std::string& path) const {
    write_atomic(path, [this](std::ostream& out) {
        out.precision(std::numeric_limits<float>::max_digits10);
        for (size_t i = 0; i < m_words.size(); ++i) {
            out << m_words[i];
            const float* r = row(i);
            for (size_t j = 0; j < m_dim; ++j) out << ' ' << r[j];
            out << '\n';
        }
    });
}

void VectorTable::clear() {
    m_dim = 0;
    m_words.clear();
    m_vecs.clear();
    m_rows.clear();
    m_model_id.clear();
}

std::vector<std::string> expand_path_format(const std::string& format, int count) {
    std::vector<std::string> out;
    const size_t pos = format.find("{}");
    if (pos == std::string::npos) {
        if (!format.empty()) out.push_back(format);
        return out;
    }
    for (int i = 1; i <= count; ++i) {
        std::string p = format;
        p.replace(pos, 2, std::to_string(i));
        out.push_back(std::move(p));
    }
    return out;
}

}  // namespace semsearch
