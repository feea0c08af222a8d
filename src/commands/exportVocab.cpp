#include "commands/exportVocab.hpp"
#include "commands/Args.hpp"
#include "search/SearchEngine.hpp"
#include "text/Corpus.hpp"

#include <iostream>
#include <string>

using namespace semsearch;

int cmd_export_vocab(int argc, char** argv) {
    try {
        Config cfg = load_config(get_arg(argc, argv, "--config", "semsearch.json"));
        cfg.vault = get_arg(argc, argv, "--vault", cfg.vault);
        const std::string out = get_arg(argc, argv, "--out", "embeddings/vault_vocab.txt");

        Corpus corpus = Corpus::load_from_dir(cfg.vault);
        const size_t n = export_vocabulary(corpus, out);

        std::cout << "WORDS: " << n << "\n";
        std::cout << "OUT: " << out << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "export-vocab failed: " << e.what() << "\n";
        return 1;
    }
}
