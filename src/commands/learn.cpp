#include "commands/learn.hpp"
#include "commands/Args.hpp"
#include "search/SearchEngine.hpp"

#include <iostream>
#include <string>

using namespace semsearch;

int cmd_learn(int argc, char** argv) {
    try {
        const std::string word = positional(argc, argv, 1);
        const std::string context = positional(argc, argv, 2);
        if (word.empty() || context.empty()) {
            std::cerr << "usage: semsearch learn <word> \"<context>\" [--config <path>]\n";
            return 1;
        }

        const Config cfg = config_from_args(argc, argv);

        SearchEngine engine(cfg);
        engine.load_vectors();

        if (engine.has_vector(word)) {
            std::cout << "note: \"" << word << "\" already has a vector, replacing it with a custom one\n";
        }

        const CustomVector cv = engine.learn_word(word, context);

        std::cout << "WORD: " << cv.word << "\n";
        std::cout << "DIM: " << cv.dimension << "\n";
        std::cout << "BASE_MODEL: " << cv.base_model << "\n";
        std::cout << "OUT: " << cfg.custom_vectors_path << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "learn failed: " << e.what() << "\n";
        return 1;
    }
}
