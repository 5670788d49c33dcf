// output.h - Side-by-side rendering of diff records
// Part of yamldiff - structural YAML diff

#ifndef YAMLDIFF_OUTPUT_H
#define YAMLDIFF_OUTPUT_H

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "diff.h"

//=============================================================================
// ANSI Color Codes
//=============================================================================

#define YAMLDIFF_BLUE   "\033[34m"
#define YAMLDIFF_RED    "\033[31m"
#define YAMLDIFF_BRIGHT "\033[1m"
#define YAMLDIFF_RESET  "\033[0m"

namespace yamldiff {

inline constexpr size_t DEFAULT_COL_WIDTH = 40;
inline constexpr size_t MIN_COL_WIDTH = 20;

struct PrintOptions {
    size_t col_width = DEFAULT_COL_WIDTH;
    std::string separator = "<->";
    size_t context = 0;     // Source lines shown above and below each diff
    bool color = false;
};

// Truncate to `width` (ending in `placeholder`) or pad with spaces
std::string shorten_and_pad(const std::string& s, size_t width,
                            const std::string& placeholder = "");

// Pad short paths; long paths keep their tail behind "..."
std::string fit_path(const std::string& s, size_t width);

// "L" + "line:col " + text, exactly col_width wide
std::string side_to_str(char prefix, const std::string& side,
                        const std::optional<Position>& pos, size_t col_width);

std::string format_diff(const Diff& d, const PrintOptions& options);

std::vector<std::string> split_lines(const std::string& text);

// Source texts may be null, which disables context lines
void print_diffs(std::ostream& out, const std::vector<Diff>& diffs,
                 const PrintOptions& options,
                 const std::string* left_text = nullptr,
                 const std::string* right_text = nullptr);

void print_header(std::ostream& out, const std::string& left_name,
                  const std::string& right_name, const PrintOptions& options);

void print_summary(std::ostream& out, size_t diff_count, const PrintOptions& options);

//=============================================================================
// Terminal
//=============================================================================

// Width of the terminal on stdout, 0 if stdout is not a terminal
unsigned terminal_columns();

// Per-side column width for a terminal `columns` wide (0 = default)
size_t column_width(unsigned columns, const std::string& separator);

} // namespace yamldiff

#endif // YAMLDIFF_OUTPUT_H
