#pragma once
#include <filesystem>
#include <functional>
#include <ostream>
#include <string>

namespace semsearch {

std::string read_all(const std::filesystem::path& p);

// Writes through a sibling ".tmp" file and renames it over `p` only after
// `fill` returned and the stream flushed cleanly. On any failure the
// previous content of `p` is untouched and std::runtime_error is thrown.
void write_atomic(const std::filesystem::path& p, const std::function<void(std::ostream&)>& fill);

void write_atomic(const std::filesystem::path& p, const std::string& content);

}  // namespace semsearch
