#include "commands/Args.hpp"

#include <stdexcept>

namespace semsearch {

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(s, &used);
    } catch (const std::logic_error&) {
        throw std::runtime_error(key + " expects an integer, got '" + s + "'");
    }
    if (used != s.size()) throw std::runtime_error(key + " expects an integer, got '" + s + "'");
    return v;
}

double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &used);
    } catch (const std::logic_error&) {
        throw std::runtime_error(key + " expects a number, got '" + s + "'");
    }
    if (used != s.size()) throw std::runtime_error(key + " expects a number, got '" + s + "'");
    return v;
}

std::string positional(int argc, char** argv, int index) {
    if (index >= argc) return "";
    const std::string s = argv[index];
    if (s.rfind("--", 0) == 0) return "";
    return s;
}

Config config_from_args(int argc, char** argv) {
    Config cfg = load_config(get_arg(argc, argv, "--config", "semsearch.json"));

    cfg.vault = get_arg(argc, argv, "--vault", cfg.vault);
    cfg.index_path = get_arg(argc, argv, "--index", cfg.index_path);
    const std::string strategy = get_arg(argc, argv, "--strategy", "");
    if (!strategy.empty()) cfg.strategy = parse_strategy(strategy);
    cfg.top_k = get_arg_int(argc, argv, "--topk", cfg.top_k);

    validate_config(cfg);
    return cfg;
}

}  // namespace semsearch
