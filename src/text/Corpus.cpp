#include "text/Corpus.hpp"
#include "io/FileUtil.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace semsearch {

Corpus Corpus::load_from_dir(const std::string& dir) {
    Corpus c;

    fs::path root(dir);
    if (!fs::is_directory(root)) throw std::runtime_error("vault dir not found: " + dir);

    for (auto& entry : fs::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        const auto& p = entry.path();
        if (p.extension() != ".md" && p.extension() != ".txt") continue;

        Document d;
        d.id = fs::relative(p, root).generic_string();
        d.text = read_all(p);
        c.m_docs.push_back(std::move(d));
    }

    std::sort(c.m_docs.begin(), c.m_docs.end(),
              [](const Document& a, const Document& b){ return a.id < b.id; });
    return c;
}

}  // namespace semsearch
