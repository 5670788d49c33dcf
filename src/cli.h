// cli.h - Command-line configuration and driver
// Part of yamldiff - structural YAML diff

#ifndef YAMLDIFF_CLI_H
#define YAMLDIFF_CLI_H

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include "diff.h"

namespace yamldiff {

//=============================================================================
// Diff Configuration
//=============================================================================

struct DiffConfig {
    std::string left_path;
    std::string right_path;

    bool skip_header = false;
    size_t context_lines = 0;
    size_t col_width = 0;       // 0 = derive from terminal

    enum class Color { AUTO, ALWAYS, NEVER } color = Color::AUTO;

    bool quiet = false;
    bool verbose = false;
};

//=============================================================================
// Diff Result
//=============================================================================

struct DiffResult {
    std::vector<Diff> diffs;
    size_t left_documents = 0;
    size_t right_documents = 0;
    double elapsed_ms = 0;
};

// Exit status of the command-line tool
enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_DIFF_ERROR = 2,
};

// Parse argv into `config`. Returns false on bad arguments (details go to
// `err`); `help` is set when -h was given.
bool parse_args(int argc, char* argv[], DiffConfig& config, bool& help, std::ostream& err);

void print_usage(const char* argv0, std::ostream& err);

// Load, diff and print. Errors are reported to `err` and yield false.
bool run_diff(const DiffConfig& config, DiffResult& result,
              std::ostream& out = std::cout, std::ostream& err = std::cerr);

} // namespace yamldiff

#endif // YAMLDIFF_CLI_H
