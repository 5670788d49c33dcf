// position.h - Source positions of nodes, keys and items
// Part of yamldiff - structural YAML diff

#ifndef YAMLDIFF_POSITION_H
#define YAMLDIFF_POSITION_H

#include <cstddef>
#include <optional>

#include <yaml-cpp/yaml.h>

#include "node.h"

namespace yamldiff {

//=============================================================================
// Position - 1-based line/column in the original source
//=============================================================================

struct Position {
    int line = 1;
    int column = 1;

    Position() = default;
    Position(int l, int c) : line(l), column(c) {}

    // yaml-cpp marks are 0-based; a null mark has no position
    static std::optional<Position> from_mark(const YAML::Mark& mark) {
        if (mark.is_null() || mark.line < 0 || mark.column < 0) return std::nullopt;
        return Position(mark.line + 1, mark.column + 1);
    }

    bool operator==(const Position& o) const {
        return line == o.line && column == o.column;
    }
    bool operator!=(const Position& o) const { return !(*this == o); }
};

//=============================================================================
// Position lookup
// Every mapping/sequence node can resolve its own position, the position of
// a named key, of a keyed value, and of an indexed item.
//=============================================================================

inline std::optional<Position> node_position(const YAML::Node& node) {
    if (!node.IsDefined()) return std::nullopt;
    return Position::from_mark(node.Mark());
}

inline std::optional<Position> key_position(const std::vector<MapEntry>& entries,
                                            const YAML::Node& key) {
    long idx = find_key(entries, key);
    if (idx < 0) return std::nullopt;
    return node_position(entries[idx].first);
}

inline std::optional<Position> value_position(const std::vector<MapEntry>& entries,
                                              const YAML::Node& key) {
    long idx = find_key(entries, key);
    if (idx < 0) return std::nullopt;
    return node_position(entries[idx].second);
}

inline std::optional<Position> item_position(const std::vector<YAML::Node>& items,
                                             size_t index) {
    if (index >= items.size()) return std::nullopt;
    return node_position(items[index]);
}

} // namespace yamldiff

#endif // YAMLDIFF_POSITION_H
