#include "io/FileUtil.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace semsearch {

std::string read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open: " + p.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void write_atomic(const fs::path& p, const std::function<void(std::ostream&)>& fill) {
    if (p.has_parent_path()) fs::create_directories(p.parent_path());

    fs::path tmp = p;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("failed to open output file: " + tmp.string());

        try {
            fill(out);
        } catch (...) {
            out.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            throw;
        }

        out.flush();
        if (!out) {
            out.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            throw std::runtime_error("failed to write: " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, p, ec);
    if (ec) {
        std::error_code ignore;
        fs::remove(tmp, ignore);
        throw std::runtime_error("failed to replace " + p.string() + ": " + ec.message());
    }
}

void write_atomic(const fs::path& p, const std::string& content) {
    write_atomic(p, [&](std::ostream& out){ out << content; });
}

}  // namespace semsearch
