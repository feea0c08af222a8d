#include "commands/prune.hpp"
#include "commands/Args.hpp"
#include "prune/Pruner.hpp"
#include "prune/Splitter.hpp"
#include "text/Corpus.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

using namespace semsearch;

static std::atomic<bool> g_interrupted{false};

static void on_sigint(int) {
    g_interrupted.store(true);
}

static void print_report(const PruneReport& r, const std::string& out) {
    std::cout << "TARGET_WORDS: " << r.target_words << "\n";
    std::cout << "PROCESSED: " << r.processed_this_run << "\n";
    std::cout << "CANDIDATES: " << r.candidate_vocab << "\n";
    std::cout << "FINAL_VOCAB: " << r.final_vocab << "\n";
    std::cout << "LINES_WRITTEN: " << r.lines_written << "\n";
    std::cout << "OUT: " << out << "\n";
}

int cmd_prune(int argc, char** argv) {
    try {
        Config cfg = load_config(get_arg(argc, argv, "--config", "semsearch.json"));
        cfg.vault = get_arg(argc, argv, "--vault", cfg.vault);
        validate_config(cfg);

        PruneOptions opts;
        opts.input_paths = cfg.source_vector_paths();
        opts.output_path = cfg.pruned_path;
        opts.neighbors = (size_t)cfg.neighbors;
        opts.threshold = cfg.similarity_threshold;
        opts.max_vocab = (size_t)cfg.max_vocab_size;
        opts.checkpoint_interval = (size_t)cfg.checkpoint_interval;
        opts.checkpoint_path = cfg.checkpoint_path;
        opts.threads = (size_t)cfg.threads;
        opts.cancel = &g_interrupted;

        Corpus corpus = Corpus::load_from_dir(cfg.vault);
        const auto targets = scan_vocabulary(corpus);

        std::signal(SIGINT, on_sigint);
        const PruneReport r = run_pruning(targets, opts);
        std::signal(SIGINT, SIG_DFL);

        if (!r.completed) {
            std::cout << "interrupted: run `semsearch prune` again to resume from " << cfg.checkpoint_path << "\n";
            return 130;
        }
        print_report(r, opts.output_path);
        return 0;
    } catch (const std::exception& e) {
        std::signal(SIGINT, SIG_DFL);
        std::cerr << "prune failed: " << e.what() << "\n";
        return 1;
    }
}

int cmd_tool_split(int argc, char** argv) {
    try {
        const std::string input = get_arg(argc, argv, "-input", "");
        const int lines = get_arg_int(argc, argv, "-lines", 100000);
        if (input.empty()) {
            std::cerr << "error: -input flag is required for split command\n";
            return 1;
        }
        if (lines <= 0) {
            std::cerr << "error: -lines must be > 0\n";
            return 1;
        }

        std::cout << "Splitting file " << input << " into chunks of " << lines << " lines...\n";
        const auto parts = split_file(input, (size_t)lines);
        std::cout << "Done splitting: " << parts.size() << " file(s).\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "split failed: " << e.what() << "\n";
        return 1;
    }
}

int cmd_tool_prune(int argc, char** argv) {
    try {
        const std::string input = get_arg(argc, argv, "-input", "");
        const std::string vocab = get_arg(argc, argv, "-vocab", "");
        if (input.empty() || vocab.empty()) {
            std::cerr << "error: -input and -vocab flags are required for prune command\n";
            return 1;
        }

        const int cap = get_arg_int(argc, argv, "-cap", 100000);
        const int neighbors = get_arg_int(argc, argv, "-neighbors", 5);
        if (cap <= 0 || neighbors < 0) {
            std::cerr << "error: -cap must be > 0 and -neighbors >= 0\n";
            return 1;
        }

        PruneOptions opts;
        opts.input_paths = {input};
        opts.output_path = get_arg(argc, argv, "-output", "pruned_vectors.txt");
        opts.threshold = get_arg_double(argc, argv, "-threshold", 0.0);
        opts.max_vocab = (size_t)cap;
        opts.neighbors = (size_t)neighbors;
        const int threads = get_arg_int(argc, argv, "-threads", 0);
        if (threads < 0) {
            std::cerr << "error: -threads must be >= 0\n";
            return 1;
        }
        opts.threads = (size_t)threads;

        const auto targets = load_vocabulary_file(vocab);
        const PruneReport r = run_pruning(targets, opts);
        print_report(r, opts.output_path);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "prune failed: " << e.what() << "\n";
        return 1;
    }
}
