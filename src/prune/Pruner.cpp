#include "prune/Pruner.hpp"
#include "emb/VectorTable.hpp"
#include "io/FileUtil.hpp"
#include "prune/Checkpoint.hpp"
#include "prune/NeighborSearch.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace semsearch {

const char* phase_name(PrunePhase p) {
    switch (p) {
        case PrunePhase::Scanning: return "scanning";
        case PrunePhase::Loading: return "loading";
        case PrunePhase::Searching: return "searching";
        case PrunePhase::Capping: return "capping";
        case PrunePhase::Writing: return "writing";
        case PrunePhase::Done: return "done";
    }
    return "unknown";
}

PruneError::PruneError(PrunePhase phase, const std::string& msg)
    : std::runtime_error(std::string(phase_name(phase)) + ": " + msg), m_phase(phase) {}

std::string partial_path_for(const std::string& output_path) {
    return output_path + ".partial";
}

std::unordered_set<std::string> load_vocabulary_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw PruneError(PrunePhase::Scanning, "failed to open vocabulary file: " + path);

    std::unordered_set<std::string> vocab;
    std::string line;
    while (std::getline(in, line)) {
        std::string w = textutil::to_lower(textutil::trim(line));
        if (!w.empty()) vocab.insert(std::move(w));
    }
    if (in.bad()) throw PruneError(PrunePhase::Scanning, "read error in vocabulary file: " + path);
    return vocab;
}

std::unordered_set<std::string> scan_vocabulary(const Corpus& corpus) {
    std::unordered_set<std::string> vocab;
    for (const auto& d : corpus.documents()) {
        for (auto& w : textutil::words(d.text)) vocab.insert(std::move(w));
    }
    return vocab;
}

std::unordered_set<std::string> cap_vocabulary(const std::unordered_set<std::string>& vocab,
                                               const std::unordered_set<std::string>& targets,
                                               size_t max_vocab,
                                               std::mt19937_64& rng) {
    if (vocab.size() <= max_vocab) return vocab;

    std::vector<std::string> neighbors_only;
    for (const auto& w : vocab) {
        if (targets.find(w) == targets.end()) neighbors_only.push_back(w);
    }
    // fixed order first, so a given seed always evicts the same words
    std::sort(neighbors_only.begin(), neighbors_only.end());
    std::shuffle(neighbors_only.begin(), neighbors_only.end(), rng);

    const size_t to_remove = std::min(vocab.size() - max_vocab, neighbors_only.size());

    std::unordered_set<std::string> out;
    for (const auto& w : vocab) {
        if (targets.find(w) != targets.end()) out.insert(w);
    }
    for (size_t i = to_remove; i < neighbors_only.size(); ++i) out.insert(neighbors_only[i]);
    return out;
}

namespace {

class PruneJob {
public:
    PruneJob(const std::unordered_set<std::string>& targets, const PruneOptions& opts)
        : m_targets(targets), m_opts(opts) {}

    PruneReport run();

private:
    void log(const std::string& msg) const {
        if (!m_opts.quiet) std::cout << "[prune] " << msg << "\n";
    }

    bool resumable() const { return !m_opts.checkpoint_path.empty(); }

    void scan();
    void load();
    bool search();
    void cap();
    void write();
    void finish();

    void save_progress();
    void append_new_vectors();
    void read_written_words();

    const std::unordered_set<std::string>& m_targets;
    const PruneOptions& m_opts;

    PruneReport m_report;
    PruningCheckpoint m_cp;
    std::vector<std::string> m_to_process;
    std::unordered_set<std::string> m_written;  // words already in the partial file
    std::unordered_set<std::string> m_final;
    VectorTable m_table;
};

void PruneJob::scan() {
    m_report.phase = PrunePhase::Scanning;
    log("Step 1/5: collecting target vocabulary...");

    if (m_targets.empty()) throw PruneError(PrunePhase::Scanning, "target vocabulary is empty");
    if (m_opts.input_paths.empty()) throw PruneError(PrunePhase::Scanning, "no input embedding files");
    if (m_opts.output_path.empty()) throw PruneError(PrunePhase::Scanning, "no output path");
    if (m_opts.checkpoint_interval == 0) throw PruneError(PrunePhase::Scanning, "checkpoint interval must be > 0");

    if (resumable()) {
        if (auto cp = load_checkpoint(m_opts.checkpoint_path)) {
            m_cp = std::move(*cp);
            read_written_words();
            log("resuming from checkpoint, " + std::to_string(m_cp.processed_words.size()) + " words processed");
        } else {
            // no valid checkpoint: drop any stale partial output
            std::error_code ec;
            fs::remove(partial_path_for(m_opts.output_path), ec);
        }
    }

    for (const auto& w : m_targets) {
        if (m_cp.processed_words.find(w) == m_cp.processed_words.end()) m_to_process.push_back(w);
    }
    std::sort(m_to_process.begin(), m_to_process.end());

    m_report.target_words = m_targets.size();
    log("-> " + std::to_string(m_targets.size()) + " target words, " +
        std::to_string(m_to_process.size()) + " to process");
}

void PruneJob::read_written_words() {
    std::ifstream in(partial_path_for(m_opts.output_path));
    if (!in) return;

    std::string line;
    while (std::getline(in, line)) {
        const size_t end = line.find_first_of(" \t\r");
        std::string w = textutil::to_lower(line.substr(0, end));
        if (!w.empty()) m_written.insert(std::move(w));
    }
}

void PruneJob::load() {
    m_report.phase = PrunePhase::Loading;
    log("Step 2/5: loading full embedding table...");

    try {
        for (const auto& p : m_opts.input_paths) m_table.load_file(p);
    } catch (const std::exception& e) {
        throw PruneError(PrunePhase::Loading, e.what());
    }
    if (m_table.empty()) throw PruneError(PrunePhase::Loading, "no vectors loaded from input files");

    log("-> loaded " + std::to_string(m_table.size()) + " vectors (dim " + std::to_string(m_table.dim()) + ")");
}

bool PruneJob::search() {
    m_report.phase = PrunePhase::Searching;
    log("Step 3/5: finding neighbors for " + std::to_string(m_to_process.size()) + " words...");

    size_t threads = m_opts.threads;
    if (threads == 0) threads = std::max(1u, std::thread::hardware_concurrency());

    NeighborSearch ns(m_table);
    const size_t total = m_to_process.size();
    const size_t step = m_opts.checkpoint_interval;

    for (size_t begin = 0; begin < total; begin += step) {
        const size_t end = std::min(total, begin + step);
        const std::vector<std::string> batch(m_to_process.begin() + (std::ptrdiff_t)begin,
                                             m_to_process.begin() + (std::ptrdiff_t)end);

        ns.run_batch(batch, m_opts.neighbors, m_opts.threshold, threads, m_cp.candidate_vocab);

        for (const auto& w : batch) {
            m_cp.candidate_vocab.insert(w);
            m_cp.processed_words.insert(w);
        }
        m_report.processed_this_run = end;

        log("progress " + std::to_string(end) + "/" + std::to_string(total));
        if (resumable()) save_progress();
        if (m_opts.on_progress) m_opts.on_progress(end, total);

        if (m_opts.cancel && m_opts.cancel->load() && end < total) {
            log("cancelled, progress kept in checkpoint");
            return false;
        }
    }

    if (total == 0 && resumable()) save_progress();

    // targets processed by an earlier run are part of the vocabulary too
    for (const auto& w : m_targets) m_cp.candidate_vocab.insert(w);

    m_report.candidate_vocab = m_cp.candidate_vocab.size();
    log("-> " + std::to_string(m_cp.candidate_vocab.size()) + " candidate words");
    return true;
}

void PruneJob::save_progress() {
    try {
        append_new_vectors();
        save_checkpoint(m_opts.checkpoint_path, m_cp);
    } catch (const std::exception& e) {
        std::cerr << "warning: checkpoint not saved, will retry at the next one: " << e.what() << "\n";
    }
}

void PruneJob::append_new_vectors() {
    std::vector<std::string> fresh;
    for (const auto& w : m_cp.candidate_vocab) {
        if (m_written.find(w) == m_written.end() && m_table.contains(w)) fresh.push_back(w);
    }
    if (fresh.empty()) return;
    std::sort(fresh.begin(), fresh.end());

    const std::string path = partial_path_for(m_opts.output_path);
    const fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);

    std::ofstream out(path, std::ios::app);
    if (!out) throw std::runtime_error("failed to open " + path);

    out.precision(std::numeric_limits<float>::max_digits10);
    const size_t dim = m_table.dim();
    for (const auto& w : fresh) {
        const float* v = m_table.find(w);
        out << w;
        for (size_t i = 0; i < dim; ++i) out << ' ' << v[i];
        out << '\n';
    }
    out.flush();
    if (!out) throw std::runtime_error("failed to append to " + path);

    for (auto& w : fresh) m_written.insert(std::move(w));
}

void PruneJob::cap() {
    m_report.phase = PrunePhase::Capping;
    log("Step 4/5: enforcing max vocabulary size of " + std::to_string(m_opts.max_vocab) + "...");

    // vault words of earlier runs stay protected even if they left the vault since
    std::unordered_set<std::string> keep = m_targets;
    keep.insert(m_cp.processed_words.begin(), m_cp.processed_words.end());

    std::mt19937_64 rng(m_opts.seed ? *m_opts.seed : std::random_device{}());
    m_final = cap_vocabulary(m_cp.candidate_vocab, keep, m_opts.max_vocab, rng);
    m_report.final_vocab = m_final.size();

    if (m_final.size() > m_opts.max_vocab) {
        std::cerr << "warning: " << keep.size() << " target words alone exceed the cap of "
                  << m_opts.max_vocab << "\n";
    }
    log("-> " + std::to_string(m_final.size()) + " words kept");
}

void PruneJob::write() {
    m_report.phase = PrunePhase::Writing;
    log("Step 5/5: writing " + std::to_string(m_final.size()) + " vectors to " + m_opts.output_path + "...");

    size_t written = 0;
    try {
        write_atomic(m_opts.output_path, [&](std::ostream& out) {
            std::unordered_set<std::string> emitted;
            std::string line;
            std::string word;
            Vector values;

            for (const auto& p : m_opts.input_paths) {
                std::ifstream in(p);
                if (!in) throw std::runtime_error("failed to reopen " + p);

                while (std::getline(in, line)) {
                    if (!parse_vector_line(line, word, values)) continue;
                    if (values.size() != m_table.dim()) continue;

                    word = textutil::to_lower(word);
                    if (m_final.find(word) == m_final.end()) continue;
                    if (!emitted.insert(word).second) continue;

                    if (!line.empty() && line.back() == '\r') line.pop_back();
                    out << line << '\n';
                    ++written;
                }
                if (in.bad()) throw std::runtime_error("read error in " + p);
            }
        });
    } catch (const std::exception& e) {
        throw PruneError(PrunePhase::Writing, e.what());
    }

    m_report.lines_written = written;
}

void PruneJob::finish() {
    std::error_code ec;
    if (resumable()) {
        fs::remove(m_opts.checkpoint_path, ec);
        if (ec) std::cerr << "warning: failed to remove checkpoint: " << ec.message() << "\n";
        fs::remove(partial_path_for(m_opts.output_path), ec);
    }
    m_report.phase = PrunePhase::Done;
    m_report.completed = true;
    log("done: " + std::to_string(m_report.lines_written) + " vectors written");
}

PruneReport PruneJob::run() {
    scan();
    load();
    if (!search()) return m_report;
    cap();
    write();
    finish();
    return m_report;
}

}  // namespace

PruneReport run_pruning(const std::unordered_set<std::string>& targets, const PruneOptions& opts) {
    PruneJob job(targets, opts);
    return job.run();
}

}  // namespace semsearch
