#include "prune/Checkpoint.hpp"
#include "io/JsonIO.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace semsearch {

using json = nlohmann::json;

static std::vector<std::string> sorted(const std::unordered_set<std::string>& s) {
    std::vector<std::string> v(s.begin(), s.end());
    std::sort(v.begin(), v.end());
    return v;
}

std::optional<PruningCheckpoint> load_checkpoint(const fs::path& path) {
    if (!fs::exists(path)) return std::nullopt;

    try {
        const json j = jsonio::read_json_file(path);
        const std::string where = path.string();
        jsonio::require_object(j, where);

        // files written before versioning carry no "version" field
        if (j.contains("version")) {
            const int version = (int)jsonio::require_number(j, "version", where);
            if (version != kCheckpointVersion) {
                throw std::runtime_error(where + ": unsupported checkpoint version " + std::to_string(version));
            }
        }

        PruningCheckpoint cp;
        for (auto& w : jsonio::require_string_array(j, "processedVaultWords", where)) {
            cp.processed_words.insert(std::move(w));
        }
        for (auto& w : jsonio::require_string_array(j, "finalVocab", where)) {
            cp.candidate_vocab.insert(std::move(w));
        }
        return cp;
    } catch (const std::runtime_error& e) {
        std::cerr << "warning: could not read checkpoint file, starting fresh: " << e.what() << "\n";
        return std::nullopt;
    }
}

void save_checkpoint(const fs::path& path, const PruningCheckpoint& cp) {
    json j;
    j["version"] = kCheckpointVersion;
    j["processedVaultWords"] = sorted(cp.processed_words);
    j["finalVocab"] = sorted(cp.candidate_vocab);
    jsonio::write_json_file(path, j);
}

}  // namespace semsearch
