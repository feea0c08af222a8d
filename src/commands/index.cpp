#include "commands/index.hpp"
#include "commands/Args.hpp"
#include "search/SearchEngine.hpp"
#include "text/Corpus.hpp"

#include <iostream>
#include <string>

using namespace semsearch;

int cmd_index(int argc, char** argv) {
    try {
        const Config cfg = config_from_args(argc, argv);

        Corpus corpus = Corpus::load_from_dir(cfg.vault);

        SearchEngine engine(cfg);
        if (!engine.rebuild(corpus)) return 1;

        std::cout << "VAULT: " << cfg.vault << "\n";
        std::cout << "STRATEGY: " << strategy_name(cfg.strategy) << "\n";
        std::cout << "DOCUMENTS: " << corpus.size() << "\n";
        std::cout << "ITEMS: " << engine.index().size() << "\n";
        std::cout << "PCA: " << (engine.index().principal_component ? "yes" : "no") << "\n";
        std::cout << "OUT_INDEX: " << cfg.index_path << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "index failed: " << e.what() << "\n";
        return 1;
    }
}
