#pragma once
#include <string>
#include <vector>

namespace semsearch {

// Splits `input` into "<base>_part_<n>.txt" files of `lines_per_chunk` lines
// each (n from 1, base = input without extension). Returns the paths written.
// Throws std::runtime_error on I/O failure or a zero chunk size.
std::vector<std::string> split_file(const std::string& input, size_t lines_per_chunk, bool quiet = false);

}  // namespace semsearch
