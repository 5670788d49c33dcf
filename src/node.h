// node.h - Node classification and keyed lookup over parsed YAML trees
// Part of yamldiff - structural YAML diff

#ifndef YAMLDIFF_NODE_H
#define YAMLDIFF_NODE_H

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "scalar.h"

namespace yamldiff {

//=============================================================================
// Node Type Classification
//=============================================================================

enum class NodeType : uint8_t {
    ABSENT,     // YAML null, or no value at all
    MAPPING,    // Unique keys, each with a position and value
    SEQUENCE,   // Ordered, integer-indexed
    SCALAR,     // Any other leaf (strings included)
};

// Rules in order: null/undefined -> ABSENT, map -> MAPPING,
// sequence -> SEQUENCE, everything else -> SCALAR
NodeType node_type(const YAML::Node& node);

inline const char* node_type_name(NodeType t) {
    switch (t) {
        case NodeType::ABSENT: return "null";
        case NodeType::MAPPING: return "mapping";
        case NodeType::SEQUENCE: return "sequence";
        case NodeType::SCALAR: return "scalar";
    }
    return "?";
}

//=============================================================================
// Scalar access
//=============================================================================

ScalarValue scalar_value(const YAML::Node& node);

// Structural equality: scalars by resolved value, containers element-wise
// (mappings ignore key order). Used for key matching.
bool nodes_equal(const YAML::Node& a, const YAML::Node& b);

// Human-readable rendering: scalar source text, "null", or flow-style YAML
// for containers.
std::string describe_node(const YAML::Node& node);

//=============================================================================
// Mapping / sequence views
//=============================================================================

// Entries of a mapping in source order
using MapEntry = std::pair<YAML::Node, YAML::Node>;

std::vector<MapEntry> map_entries(const YAML::Node& map);
std::vector<YAML::Node> sequence_items(const YAML::Node& seq);

// Index of the entry whose key equals `key`, or -1
long find_key(const std::vector<MapEntry>& entries, const YAML::Node& key);

//=============================================================================
// Key index
//=============================================================================

// Canonical text of a node: nodes_equal(a, b) iff canonical_key(a) ==
// canonical_key(b). Scalars use canonical_scalar, containers are encoded
// with length-prefixed children (mapping entries sorted).
std::string canonical_key(const YAML::Node& node);

// Hash index over the keys of one mapping
struct KeyIndex {
    std::vector<std::string> keys;                      // Canonical key per entry
    std::unordered_map<std::string, size_t> slots;      // First entry per key
    long duplicate = -1;                                // First repeated entry, or -1

    explicit KeyIndex(const std::vector<MapEntry>& entries);

    // Entry holding `canonical`, or -1
    long find(const std::string& canonical) const;
};

} // namespace yamldiff

#endif // YAMLDIFF_NODE_H
