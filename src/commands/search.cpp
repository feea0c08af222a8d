#include "commands/search.hpp"
#include "commands/Args.hpp"
#include "search/SearchEngine.hpp"

#include <iomanip>
#include <iostream>
#include <string>

#include "nlohmann/json.hpp"

using namespace semsearch;

int cmd_search(int argc, char** argv) {
    try {
        const std::string query = positional(argc, argv, 1);
        if (query.empty()) {
            std::cerr << "error: missing query\n";
            return 1;
        }

        const Config cfg = config_from_args(argc, argv);
        const bool as_json = has_flag(argc, argv, "--json");

        SearchEngine engine(cfg);
        engine.load_vectors();
        engine.load_index();

        if (engine.index().empty()) {
            std::cerr << "error: index is empty or missing, run `semsearch index` first\n";
            return 1;
        }

        const auto results = engine.search(query);

        if (as_json) {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& r : results) {
                nlohmann::json j;
                j["file"] = r.file;
                j["score"] = r.score;
                j["context"] = context_snippet(r.text, r.highlight_word);
                if (r.highlight_word) j["highlightWord"] = *r.highlight_word;
                arr.push_back(j);
            }
            std::cout << arr.dump(2) << "\n";
            return 0;
        }

        if (results.empty()) {
            std::cout << "no results\n";
            return 0;
        }

        for (size_t i = 0; i < results.size(); ++i) {
            const auto& r = results[i];
            std::cout << (i + 1) << ". " << r.file << "  (" << std::fixed << std::setprecision(4) << r.score << ")";
            if (r.highlight_word) std::cout << "  [" << *r.highlight_word << "]";
            std::cout << "\n   " << context_snippet(r.text, r.highlight_word) << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "search failed: " << e.what() << "\n";
        return 1;
    }
}
