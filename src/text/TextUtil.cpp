#include "text/TextUtil.hpp"
#include <cctype>
#include <unordered_set>

namespace semsearch {
namespace textutil {

static bool is_word_char(unsigned char c) {
    return std::isalnum(c) || c == '_';
}

static bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::vector<std::string> words(const std::string& text) {
    std::vector<std::string> out;
    std::string cur;

    for (unsigned char ch : text) {
        if (ch < 0x80 && is_word_char(ch)) {
            cur.push_back(static_cast<char>(std::tolower(ch)));
        } else if (!cur.empty()) {
            out.push_back(std::move(cur));
            cur.clear();
        }
    }
    if (!cur.empty()) out.push_back(std::move(cur));
    return out;
}

bool is_stopword(const std::string& word) {
    // contractions are left out: the tokenizer never yields an apostrophe
    static const std::unordered_set<std::string> stop = {
        "a", "about", "above", "after", "again", "against", "all", "am", "an", "and",
        "any", "are", "as", "at", "be", "because", "been", "before", "being",
        "below", "between", "both", "but", "by", "cannot", "could",
        "did", "do", "does", "doing", "down", "during",
        "each", "few", "for", "from", "further", "had", "has",
        "have", "having", "he", "her", "here",
        "hers", "herself", "him", "himself", "his", "how", "i",
        "if", "in", "into", "is", "it",
        "its", "itself", "me", "more", "most", "my", "myself",
        "no", "nor", "not", "of", "off", "on", "once", "only", "or", "other", "ought",
        "our", "ours", "ourselves", "out", "over", "own", "same", "she",
        "should", "so", "some", "such",
        "than", "that", "the", "their", "theirs", "them", "themselves",
        "then", "there", "these", "they",
        "this", "those", "through", "to", "too", "under", "until", "up",
        "very", "was", "we", "were",
        "what", "when", "where", "which",
        "while", "who", "whom", "why", "with", "would",
        "you", "your", "yours", "yourself", "yourselves"
    };
    return stop.find(word) != stop.end();
}

std::vector<std::string> content_words(const std::string& text) {
    std::vector<std::string> all = words(text);
    std::vector<std::string> out;
    out.reserve(all.size());
    for (auto& w : all) {
        if (!is_stopword(w)) out.push_back(std::move(w));
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && is_space(static_cast<unsigned char>(s[a]))) ++a;

    size_t b = s.size();
    while (b > a && is_space(static_cast<unsigned char>(s[b - 1]))) --b;

    return s.substr(a, b - a);
}

std::string to_lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::vector<std::string> chunk_text(const std::string& text) {
    std::vector<std::string> chunks;

    auto emit = [&](size_t from, size_t to) {
        std::string c = trim(text.substr(from, to - from));
        if (!c.empty()) chunks.push_back(std::move(c));
    };

    size_t start = 0;
    size_t i = 0;
    while (i < text.size()) {
        if (!is_space(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }

        size_t j = i;
        int newlines = 0;
        while (j < text.size() && is_space(static_cast<unsigned char>(text[j]))) {
            if (text[j] == '\n') ++newlines;
            ++j;
        }

        if (newlines >= 2) {
            emit(start, i);
            start = j;
        }
        i = j;
    }
    emit(start, text.size());
    return chunks;
}

}  // namespace textutil
}  // namespace semsearch
