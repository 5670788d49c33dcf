// yamldiff.cc - Structural diff of two YAML files
// Reports every divergence between the parsed trees with line:column on both sides

#include <iostream>

#include "cli.h"

using namespace yamldiff;

int main(int argc, char* argv[]) {
    DiffConfig config;
    bool help = false;
    if (!parse_args(argc, argv, config, help, std::cerr)) {
        print_usage(argv[0], std::cerr);
        return help ? EXIT_OK : EXIT_USAGE;
    }

    DiffResult result;
    if (!run_diff(config, result)) return EXIT_DIFF_ERROR;
    return EXIT_OK;
}
