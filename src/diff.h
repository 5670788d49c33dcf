// diff.h - Structural diff of parsed YAML documents and streams
// Part of yamldiff - structural YAML diff

#ifndef YAMLDIFF_DIFF_H
#define YAMLDIFF_DIFF_H

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "position.h"

namespace yamldiff {

//=============================================================================
// Diff Record
//=============================================================================

inline constexpr const char* MISSING_KEY = "<missing key>";
inline constexpr const char* MISSING_ITEM = "<missing item>";
inline constexpr const char* NO_DOCUMENT = "<no document>";

struct Diff {
    std::string left;
    std::string right;
    std::optional<Position> left_pos;
    std::optional<Position> right_pos;

    Diff(std::string l, std::string r,
         std::optional<Position> lp = std::nullopt,
         std::optional<Position> rp = std::nullopt)
        : left(std::move(l)), right(std::move(r)), left_pos(lp), right_pos(rp) {}
};

//=============================================================================
// Errors
//=============================================================================

enum class Side : uint8_t { NONE, LEFT, RIGHT, BOTH };

inline const char* side_name(Side s) {
    switch (s) {
        case Side::NONE: return "";
        case Side::LEFT: return "left";
        case Side::RIGHT: return "right";
        case Side::BOTH: return "left and right";
    }
    return "?";
}

class DiffError : public std::runtime_error {
public:
    enum class Kind : uint8_t {
        PARSE,      // Malformed YAML on one side
        HEADER,     // Header skip requested, fewer than 2 documents
        IO,         // Input could not be read
        INTERNAL,   // Classifier invariant violated
    };

    DiffError(Kind kind, Side side, const std::string& msg, int line = 0, int column = 0)
        : std::runtime_error(msg), kind_(kind), side_(side), line_(line), column_(column) {}

    Kind kind() const { return kind_; }
    Side side() const { return side_; }

    // 1-based, 0 when unknown (only set for PARSE)
    int line() const { return line_; }
    int column() const { return column_; }

private:
    Kind kind_;
    Side side_;
    int line_;
    int column_;
};

//=============================================================================
// Tree Differ
//=============================================================================

std::vector<Diff> diff_documents(const YAML::Node& left, const YAML::Node& right);
std::vector<Diff> diff_mappings(const YAML::Node& left, const YAML::Node& right);
std::vector<Diff> diff_sequences(const YAML::Node& left, const YAML::Node& right);

//=============================================================================
// Stream Differ
//=============================================================================

// Parse every document of a YAML stream. `name` is used in error messages
// and defaults to the side name.
std::vector<YAML::Node> load_stream(const std::string& text, Side side,
                                    const std::string& name = "");

// Throws DiffError(HEADER) naming every side with fewer than 2 documents
void check_header_docs(const std::vector<YAML::Node>& left_docs,
                       const std::vector<YAML::Node>& right_docs);

std::vector<Diff> diff_streams(const std::vector<YAML::Node>& left_docs,
                               const std::vector<YAML::Node>& right_docs,
                               bool skip_header = false);

// Whole contents of `path` ("-" is stdin); throws DiffError(IO)
std::string read_yaml_source(const std::string& path, Side side);

// Single entry point: empty result iff both sources are semantically identical
std::vector<Diff> diff_yaml_streams(const std::string& left, const std::string& right,
                                    bool skip_header = false,
                                    const std::string& left_name = "",
                                    const std::string& right_name = "");

std::vector<Diff> diff_yaml_files(const std::string& left_path,
                                  const std::string& right_path,
                                  bool skip_header = false);

} // namespace yamldiff

#endif // YAMLDIFF_DIFF_H
