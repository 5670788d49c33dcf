// node.cc - Node classification and keyed lookup
// Part of yamldiff - structural YAML diff

#include "node.h"

#include <algorithm>

namespace yamldiff {

NodeType node_type(const YAML::Node& node) {
    if (!node.IsDefined()) return NodeType::ABSENT;
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null: return NodeType::ABSENT;
        case YAML::NodeType::Map: return NodeType::MAPPING;
        case YAML::NodeType::Sequence: return NodeType::SEQUENCE;
        case YAML::NodeType::Scalar: return NodeType::SCALAR;
    }
    return NodeType::SCALAR;
}

ScalarValue scalar_value(const YAML::Node& node) {
    return resolve_scalar(node.Scalar(), node.Tag());
}

std::vector<MapEntry> map_entries(const YAML::Node& map) {
    std::vector<MapEntry> entries;
    entries.reserve(map.size());
    for (YAML::const_iterator it = map.begin(); it != map.end(); ++it) {
        entries.emplace_back(it->first, it->second);
    }
    return entries;
}

std::vector<YAML::Node> sequence_items(const YAML::Node& seq) {
    std::vector<YAML::Node> items;
    items.reserve(seq.size());
    for (YAML::const_iterator it = seq.begin(); it != seq.end(); ++it) {
        items.push_back(*it);
    }
    return items;
}

long find_key(const std::vector<MapEntry>& entries, const YAML::Node& key) {
    for (size_t i = 0; i < entries.size(); ++i) {
        if (nodes_equal(entries[i].first, key)) return static_cast<long>(i);
    }
    return -1;
}

static void append_sized(std::string& out, const std::string& part) {
    out += std::to_string(part.size());
    out += ':';
    out += part;
}

std::string canonical_key(const YAML::Node& node) {
    switch (node_type(node)) {
        case NodeType::ABSENT:
            return "~";
        case NodeType::SCALAR:
            return canonical_scalar(scalar_value(node));
        case NodeType::SEQUENCE: {
            std::string out = "[";
            for (const auto& item : sequence_items(node)) {
                append_sized(out, canonical_key(item));
            }
            out += ']';
            return out;
        }
        case NodeType::MAPPING: {
            // Entries sorted so that key order does not matter
            std::vector<std::string> parts;
            for (const auto& [key, value] : map_entries(node)) {
                std::string part;
                append_sized(part, canonical_key(key));
                append_sized(part, canonical_key(value));
                parts.push_back(std::move(part));
            }
            std::sort(parts.begin(), parts.end());
            std::string out = "{";
            for (const auto& part : parts) append_sized(out, part);
            out += '}';
            return out;
        }
    }
    return "?";
}

//=============================================================================
// KeyIndex
//=============================================================================

KeyIndex::KeyIndex(const std::vector<MapEntry>& entries) {
    keys.reserve(entries.size());
    slots.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        keys.push_back(canonical_key(entries[i].first));
        if (!slots.emplace(keys.back(), i).second && duplicate < 0) {
            duplicate = static_cast<long>(i);
        }
    }
}

long KeyIndex::find(const std::string& canonical) const {
    auto it = slots.find(canonical);
    return it == slots.end() ? -1 : static_cast<long>(it->second);
}

bool nodes_equal(const YAML::Node& a, const YAML::Node& b) {
    NodeType ta = node_type(a);
    if (ta != node_type(b)) return false;

    switch (ta) {
        case NodeType::ABSENT:
            return true;
        case NodeType::SCALAR:
            return scalars_equal(scalar_value(a), scalar_value(b));
        case NodeType::SEQUENCE: {
            if (a.size() != b.size()) return false;
            auto ia = sequence_items(a);
            auto ib = sequence_items(b);
            for (size_t i = 0; i < ia.size(); ++i) {
                if (!nodes_equal(ia[i], ib[i])) return false;
            }
            return true;
        }
        case NodeType::MAPPING: {
            if (a.size() != b.size()) return false;
            auto ea = map_entries(a);
            auto eb = map_entries(b);
            const KeyIndex index(eb);
            for (const auto& [key, value] : ea) {
                long idx = index.find(canonical_key(key));
                if (idx < 0 || !nodes_equal(value, eb[idx].second)) return false;
            }
            return true;
        }
    }
    return false;
}

std::string describe_node(const YAML::Node& node) {
    switch (node_type(node)) {
        case NodeType::ABSENT:
            return "null";
        case NodeType::SCALAR:
            return node.Scalar();
        case NodeType::MAPPING:
        case NodeType::SEQUENCE: {
            YAML::Emitter out;
            out << YAML::Flow << node;
            return out.c_str();
        }
    }
    return "?";
}

} // namespace yamldiff
