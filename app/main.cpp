#include "commands/exportVocab.hpp"
#include "commands/index.hpp"
#include "commands/learn.hpp"
#include "commands/prune.hpp"
#include "commands/search.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  semsearch index [args]\n"
        << "  semsearch search \"<query>\" [args]\n"
        << "  semsearch learn <word> \"<context>\" [args]\n"
        << "  semsearch export-vocab [args]\n"
        << "  semsearch prune [args]\n"
        << "  semsearch help\n";
    return 1;
}

static int print_index_help() {
    std::cerr
        << "usage:\n"
        << "  semsearch index [options]\n"
        << "\n"
        << "options:\n"
        << "  --config <path>              default: semsearch.json\n"
        << "  --vault <dir>                default: config vault\n"
        << "  --strategy <s>               Average | TF-IDF | SIF (default: config strategy)\n"
        << "  --index <path>               default: config index_path\n";
    return 0;
}

static int print_search_help() {
    std::cerr
        << "usage:\n"
        << "  semsearch search \"<query>\" [options]\n"
        << "\n"
        << "options:\n"
        << "  --config <path>              default: semsearch.json\n"
        << "  --index <path>               default: config index_path\n"
        << "  --topk <n>                   default: 10\n"
        << "  --json                       print results as JSON\n";
    return 0;
}

static int print_learn_help() {
    std::cerr
        << "usage:\n"
        << "  semsearch learn <word> \"<context>\" [--config <path>]\n"
        << "\n"
        << "Derives a vector for <word> from the known words of <context> and\n"
        << "stores it in the custom vectors file.\n";
    return 0;
}

static int print_export_help() {
    std::cerr
        << "usage:\n"
        << "  semsearch export-vocab [options]\n"
        << "\n"
        << "options:\n"
        << "  --config <path>              default: semsearch.json\n"
        << "  --vault <dir>                default: config vault\n"
        << "  --out <path>                 default: embeddings/vault_vocab.txt\n";
    return 0;
}

static int print_prune_help() {
    std::cerr
        << "usage:\n"
        << "  semsearch prune [options]\n"
        << "\n"
        << "Builds the pruned vector file from the vault vocabulary. Resumable:\n"
        << "progress is checkpointed and Ctrl-C stops after the current batch.\n"
        << "\n"
        << "options:\n"
        << "  --config <path>              default: semsearch.json\n"
        << "  --vault <dir>                default: config vault\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    const bool help = (argc >= 3 && std::string(argv[2]) == "--help");
    if (help) {
        if (cmd == "index")        return print_index_help();
        if (cmd == "search")       return print_search_help();
        if (cmd == "learn")        return print_learn_help();
        if (cmd == "export-vocab") return print_export_help();
        if (cmd == "prune")        return print_prune_help();
    }

    if (cmd == "index")        return cmd_index(argc - 1, argv + 1);
    if (cmd == "search")       return cmd_search(argc - 1, argv + 1);
    if (cmd == "learn")        return cmd_learn(argc - 1, argv + 1);
    if (cmd == "export-vocab") return cmd_export_vocab(argc - 1, argv + 1);
    if (cmd == "prune")        return cmd_prune(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
