#pragma once
#include <string>
#include <vector>

namespace semsearch {

struct Document {
    std::string id;    // path relative to the vault root, '/' separated
    std::string text;
};

class Corpus {
public:
    // loads *.md and *.txt recursively, sorted by id
    static Corpus load_from_dir(const std::string& dir);

    void add(Document doc) { m_docs.push_back(std::move(doc)); }
    const std::vector<Document>& documents() const { return m_docs; }
    size_t size() const { return m_docs.size(); }

private:
    std::vector<Document> m_docs;
};

}  // namespace semsearch
