#pragma once
#include <string>
#include <vector>

namespace semsearch {
namespace textutil {

// lowercase word tokens: maximal runs of [a-z0-9_]
std::vector<std::string> words(const std::string& text);

// words() minus English stopwords
std::vector<std::string> content_words(const std::string& text);

bool is_stopword(const std::string& word);

// split on blank lines (a whitespace run holding two or more newlines),
// trimmed, empty segments dropped, source order kept
std::vector<std::string> chunk_text(const std::string& text);

std::string trim(const std::string& s);
std::string to_lower(std::string s);

}  // namespace textutil
}  // namespace semsearch
