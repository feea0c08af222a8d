#include "commands/prune.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  vocab-prune split -input <path> [-lines <n>]\n"
        << "  vocab-prune prune -input <path> -vocab <path> [options]\n"
        << "\n"
        << "prune options:\n"
        << "  -output <path>               default: pruned_vectors.txt\n"
        << "  -threshold <f>               default: 0.0\n"
        << "  -cap <n>                     default: 100000\n"
        << "  -neighbors <n>               default: 5\n"
        << "  -threads <n>                 default: 0 (all cores)\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];
    if (cmd == "split") return cmd_tool_split(argc - 1, argv + 1);
    if (cmd == "prune") return cmd_tool_prune(argc - 1, argv + 1);

    std::cerr << "expected 'split' or 'prune' subcommands\n";
    return print_usage();
}
