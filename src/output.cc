// output.cc - Side-by-side rendering of diff records

#include "output.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>

namespace yamldiff {

std::string shorten_and_pad(const std::string& s, size_t width, const std::string& placeholder) {
    if (s.size() > width) {
        if (width <= placeholder.size()) return s.substr(0, width);
        return s.substr(0, width - placeholder.size()) + placeholder;
    }
    return s + std::string(width - s.size(), ' ');
}

std::string fit_path(const std::string& s, size_t width) {
    if (s.size() <= width) return s + std::string(width - s.size(), ' ');
    if (width <= 3) return s.substr(s.size() - width);
    return "..." + s.substr(s.size() - (width - 3));
}

std::string side_to_str(char prefix, const std::string& side,
                        const std::optional<Position>& pos, size_t col_width) {
    std::ostringstream ss;
    ss << prefix;
    if (pos) {
        ss << std::setw(4) << std::right << pos->line << ':'
           << std::setw(3) << std::left << pos->column;
    } else {
        ss << std::string(8, ' ');
    }
    size_t text_width = col_width > 10 ? col_width - 10 : 0;
    ss << ' ' << shorten_and_pad(side, text_width, "...");
    return ss.str();
}

std::string format_diff(const Diff& d, const PrintOptions& options) {
    return side_to_str('L', d.left, d.left_pos, options.col_width) + options.separator +
           side_to_str('R', d.right, d.right_pos, options.col_width);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

static std::string context_line(const std::vector<std::string>& lines,
                                const std::optional<Position>& pos, long offset,
                                size_t width) {
    if (pos) {
        long idx = static_cast<long>(pos->line) - 1 + offset;
        if (idx >= 0 && idx < static_cast<long>(lines.size())) {
            return shorten_and_pad(lines[idx], width);
        }
    }
    return std::string(width, ' ');
}

void print_diffs(std::ostream& out, const std::vector<Diff>& diffs,
                 const PrintOptions& options,
                 const std::string* left_text, const std::string* right_text) {
    size_t context = options.context;
    if (left_text == nullptr || right_text == nullptr) context = 0;

    std::vector<std::string> lines_l, lines_r;
    if (context > 0) {
        lines_l = split_lines(*left_text);
        lines_r = split_lines(*right_text);
    }
    const std::string gap(options.separator.size(), ' ');
    const long ctx = static_cast<long>(context);

    for (const auto& d : diffs) {
        if (options.color) out << (context ? YAMLDIFF_BLUE : YAMLDIFF_RESET);
        out << format_diff(d, options) << "\n";
        if (context == 0) continue;

        for (long offset = -ctx; offset <= ctx; ++offset) {
            if (options.color) out << (offset == 0 ? YAMLDIFF_RED : YAMLDIFF_RESET);
            out << context_line(lines_l, d.left_pos, offset, options.col_width)
                << gap
                << context_line(lines_r, d.right_pos, offset, options.col_width)
                << "\n";
        }
        out << "\n";
    }
    if (options.color && !diffs.empty()) out << YAMLDIFF_RESET;
}

void print_header(std::ostream& out, const std::string& left_name,
                  const std::string& right_name, const PrintOptions& options) {
    size_t width = options.col_width > 2 ? options.col_width - 2 : 0;
    if (options.color) out << YAMLDIFF_BRIGHT;
    out << "L:" << fit_path(left_name, width)
        << std::string(options.separator.size(), ' ')
        << "R:" << fit_path(right_name, width);
    if (options.color) out << YAMLDIFF_RESET;
    out << "\n";
}

void print_summary(std::ostream& out, size_t diff_count, const PrintOptions& options) {
    if (diff_count == 0) {
        out << "The given files are identical.\n";
        return;
    }
    if (options.color) out << YAMLDIFF_BRIGHT;
    out << diff_count << " difference(s) found.";
    if (options.color) out << YAMLDIFF_RESET;
    out << "\n";
}

unsigned terminal_columns() {
    if (!isatty(STDOUT_FILENO)) return 0;
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) < 0) return 0;
    return ws.ws_col;
}

size_t column_width(unsigned columns, const std::string& separator) {
    if (columns == 0) return DEFAULT_COL_WIDTH;
    long w = static_cast<long>(columns) / 2 - static_cast<long>(separator.size()) / 2 - 1;
    return std::max(static_cast<long>(MIN_COL_WIDTH), w);
}

} // namespace yamldiff
