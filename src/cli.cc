// cli.cc - Command-line configuration and driver
// Option parsing with getopt_long, load + diff + print

#include "cli.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <getopt.h>
#include <unistd.h>

#include "output.h"

namespace yamldiff {

void print_usage(const char* argv0, std::ostream& err) {
    err << "Usage:\n"
        << "  " << argv0 << " [options] <left> <right>\n"
        << "\nCompares two YAML files structurally (\"-\" reads stdin).\n"
        << "\nOptions:\n"
        << "  -C, --context <n>       Lines of context to print with each difference (default: 0)\n"
        << "  -x, --skip-header-doc   Skip the first document (header) of each YAML stream\n"
        << "  -w, --width <n>         Column width per side (default: from terminal)\n"
        << "      --color             Always color the output\n"
        << "      --no-color          Disable colored output\n"
        << "  -q, --quiet             Print only the summary line\n"
        << "  -v, --verbose           Print document counts and timing to stderr\n"
        << "  -h, --help              Show this help message\n";
}

static bool parse_size(const char* s, size_t& out) {
    if (s == nullptr || *s == '\0') return false;
    char* end = nullptr;
    long v = std::strtol(s, &end, 10);
    if (*end != '\0' || v < 0) return false;
    out = static_cast<size_t>(v);
    return true;
}

bool parse_args(int argc, char* argv[], DiffConfig& config, bool& help, std::ostream& err) {
    static struct option long_options[] = {
        {"context",         required_argument, nullptr, 'C'},
        {"skip-header-doc", no_argument,       nullptr, 'x'},
        {"width",           required_argument, nullptr, 'w'},
        {"color",           no_argument,       nullptr, 'A'},
        {"no-color",        no_argument,       nullptr, 'N'},
        {"quiet",           no_argument,       nullptr, 'q'},
        {"verbose",         no_argument,       nullptr, 'v'},
        {"help",            no_argument,       nullptr, 'h'},
        {nullptr,           0,                 nullptr, 0}
    };

    help = false;
    optind = 0;  // Full getopt reset, parse_args may run more than once

    int opt;
    while ((opt = getopt_long(argc, argv, "C:xw:qvh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'C':
                if (!parse_size(optarg, config.context_lines)) {
                    err << "Error: invalid context line count: " << optarg << "\n";
                    return false;
                }
                break;
            case 'x': config.skip_header = true; break;
            case 'w':
                if (!parse_size(optarg, config.col_width) || config.col_width < MIN_COL_WIDTH) {
                    err << "Error: width must be at least " << MIN_COL_WIDTH << "\n";
                    return false;
                }
                break;
            case 'A': config.color = DiffConfig::Color::ALWAYS; break;
            case 'N': config.color = DiffConfig::Color::NEVER; break;
            case 'q': config.quiet = true; break;
            case 'v': config.verbose = true; break;
            case 'h': help = true; return false;
            default:  return false;
        }
    }

    // Remaining arguments after options
    if (argc - optind != 2) return false;
    config.left_path = argv[optind];
    config.right_path = argv[optind + 1];
    return true;
}

bool run_diff(const DiffConfig& config, DiffResult& result,
              std::ostream& out, std::ostream& err) {
    auto start = std::chrono::steady_clock::now();

    std::string left_text, right_text;
    try {
        left_text = read_yaml_source(config.left_path, Side::LEFT);
        right_text = read_yaml_source(config.right_path, Side::RIGHT);

        auto left_docs = load_stream(left_text, Side::LEFT, config.left_path);
        auto right_docs = load_stream(right_text, Side::RIGHT, config.right_path);
        result.left_documents = left_docs.size();
        result.right_documents = right_docs.size();

        result.diffs = diff_streams(left_docs, right_docs, config.skip_header);
    } catch (const DiffError& e) {
        err << e.what() << "\n";
        return false;
    }

    auto end = std::chrono::steady_clock::now();
    result.elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

    if (config.verbose) {
        err << "Left:  " << config.left_path << " (" << result.left_documents << " document(s))\n"
            << "Right: " << config.right_path << " (" << result.right_documents << " document(s))\n"
            << "Time:  " << result.elapsed_ms << " ms\n";
    }

    PrintOptions options;
    options.context = config.context_lines;
    options.col_width = config.col_width > 0
        ? config.col_width
        : column_width(terminal_columns(), options.separator);
    options.color = config.color == DiffConfig::Color::ALWAYS ||
                    (config.color == DiffConfig::Color::AUTO && isatty(STDOUT_FILENO));

    if (!config.quiet && !result.diffs.empty()) {
        print_header(out, config.left_path, config.right_path, options);
        print_diffs(out, result.diffs, options, &left_text, &right_text);
    }
    print_summary(out, result.diffs.size(), options);
    return true;
}

} // namespace yamldiff
