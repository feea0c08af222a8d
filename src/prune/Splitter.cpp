#include "prune/Splitter.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace semsearch {

std::vector<std::string> split_file(const std::string& input, size_t lines_per_chunk, bool quiet) {
    if (lines_per_chunk == 0) throw std::runtime_error("split: lines per chunk must be > 0");

    std::ifstream in(input);
    if (!in) throw std::runtime_error("failed to open input file: " + input);

    fs::path base = fs::path(input);
    base.replace_extension();

    std::vector<std::string> outputs;
    std::ofstream out;
    std::string line;
    size_t count = 0;

    while (std::getline(in, line)) {
        if (count % lines_per_chunk == 0) {
            if (out.is_open()) {
                out.close();
                if (!out) throw std::runtime_error("failed to write " + outputs.back());
            }
            const std::string name = base.string() + "_part_" + std::to_string(outputs.size() + 1) + ".txt";
            out.open(name, std::ios::trunc);
            if (!out) throw std::runtime_error("failed to create output file: " + name);
            outputs.push_back(name);
            if (!quiet) std::cout << "Creating " << name << "...\n";
        }
        out << line << '\n';
        ++count;
    }
    if (in.bad()) throw std::runtime_error("read error in " + input);

    if (out.is_open()) {
        out.close();
        if (!out) throw std::runtime_error("failed to write " + outputs.back());
    }
    return outputs;
}

}  // namespace semsearch
