// diff.cc - Structural diff of parsed YAML documents and streams
// Recursive lock-step walk over two trees, positional list alignment

#include "diff.h"

#include <algorithm>
#include <iterator>
#include <sstream>

#include "mmap.h"

namespace yamldiff {

//=============================================================================
// Helpers
//=============================================================================

static void append(std::vector<Diff>& to, std::vector<Diff>&& from) {
    to.insert(to.end(), std::make_move_iterator(from.begin()),
              std::make_move_iterator(from.end()));
}

static std::string type_label(const char* prefix, NodeType t, const std::string& suffix) {
    std::string s = "<";
    s += prefix;
    s += node_type_name(t);
    s += '>';
    if (!suffix.empty()) {
        s += ' ';
        s += suffix;
    }
    return s;
}

// Compare two child nodes that both exist: a mapping value or a sequence
// item. `label` annotates type mismatches (the key for mapping values).
static std::vector<Diff> diff_children(const YAML::Node& left, const YAML::Node& right,
                                       const std::optional<Position>& left_pos,
                                       const std::optional<Position>& right_pos,
                                       const std::string& label) {
    NodeType tl = node_type(left);
    NodeType tr = node_type(right);

    if (tl != tr) {
        return {Diff(type_label("node of type ", tl, label),
                     type_label("node of type ", tr, label),
                     left_pos, right_pos)};
    }

    switch (tl) {
        case NodeType::ABSENT:
            return {};
        case NodeType::MAPPING:
            return diff_mappings(left, right);
        case NodeType::SEQUENCE:
            return diff_sequences(left, right);
        case NodeType::SCALAR:
            if (scalars_equal(scalar_value(left), scalar_value(right))) return {};
            return {Diff(left.Scalar(), right.Scalar(), left_pos, right_pos)};
    }
    return {};
}

//=============================================================================
// Tree Differ
//=============================================================================

std::vector<Diff> diff_documents(const YAML::Node& left, const YAML::Node& right) {
    NodeType tl = node_type(left);
    NodeType tr = node_type(right);

    if (tl != tr) {
        return {Diff(type_label("top-level node of type ", tl, ""),
                     type_label("top-level node of type ", tr, ""),
                     tl != NodeType::ABSENT ? node_position(left) : std::nullopt,
                     tr != NodeType::ABSENT ? node_position(right) : std::nullopt)};
    }

    switch (tl) {
        case NodeType::ABSENT:
            return {};
        case NodeType::MAPPING:
            return diff_mappings(left, right);
        case NodeType::SEQUENCE:
            return diff_sequences(left, right);
        case NodeType::SCALAR:
            if (scalars_equal(scalar_value(left), scalar_value(right))) return {};
            return {Diff(left.Scalar(), right.Scalar(),
                         node_position(left), node_position(right))};
    }

    throw DiffError(DiffError::Kind::INTERNAL, Side::NONE, "Unknown YAML root node type");
}

std::vector<Diff> diff_mappings(const YAML::Node& left, const YAML::Node& right) {
    std::vector<Diff> diffs;
    const auto left_entries = map_entries(left);
    const auto right_entries = map_entries(right);
    const KeyIndex left_index(left_entries);
    const KeyIndex right_index(right_entries);

    // Pass 1: left keys in left order
    for (size_t i = 0; i < left_entries.size(); ++i) {
        const auto& [key, value] = left_entries[i];
        long idx = right_index.find(left_index.keys[i]);
        if (idx < 0) {
            diffs.emplace_back(describe_node(key), MISSING_KEY,
                               node_position(key), node_position(right));
            continue;
        }
        const YAML::Node& other = right_entries[idx].second;
        append(diffs, diff_children(value, other, node_position(value),
                                    node_position(other), describe_node(key)));
    }

    // Pass 2: keys only present on the right, in right order
    for (size_t i = 0; i < right_entries.size(); ++i) {
        if (left_index.find(right_index.keys[i]) >= 0) continue;
        const YAML::Node& key = right_entries[i].first;
        diffs.emplace_back(MISSING_KEY, describe_node(key),
                           node_position(left), node_position(key));
    }

    return diffs;
}

std::vector<Diff> diff_sequences(const YAML::Node& left, const YAML::Node& right) {
    std::vector<Diff> diffs;
    const auto left_items = sequence_items(left);
    const auto right_items = sequence_items(right);
    const size_t max_len = std::max(left_items.size(), right_items.size());

    for (size_t i = 0; i < max_len; ++i) {
        if (i >= left_items.size()) {
            diffs.emplace_back(MISSING_ITEM, describe_node(right_items[i]),
                               node_position(left), item_position(right_items, i));
        } else if (i >= right_items.size()) {
            diffs.emplace_back(describe_node(left_items[i]), MISSING_ITEM,
                               item_position(left_items, i), node_position(right));
        } else {
            append(diffs, diff_children(left_items[i], right_items[i],
                                        item_position(left_items, i),
                                        item_position(right_items, i), ""));
        }
    }

    return diffs;
}

//=============================================================================
// Stream Differ
//=============================================================================

static DiffError parse_error(Side side, const std::string& name, int line, int column,
                             const std::string& problem) {
    std::ostringstream ss;
    ss << "Error parsing YAML stream \"" << (name.empty() ? side_name(side) : name)
       << "\":\n" << line << ":" << column << " " << problem;
    return DiffError(DiffError::Kind::PARSE, side, ss.str(), line, column);
}

// Mappings must have unique keys; yaml-cpp keeps every repeated entry
static void check_unique_keys(const YAML::Node& node, Side side, const std::string& name) {
    switch (node_type(node)) {
        case NodeType::ABSENT:
        case NodeType::SCALAR:
            return;
        case NodeType::SEQUENCE:
            for (const auto& item : sequence_items(node)) check_unique_keys(item, side, name);
            return;
        case NodeType::MAPPING: {
            const auto entries = map_entries(node);
            const KeyIndex index(entries);
            if (index.duplicate >= 0) {
                const YAML::Node& key = entries[index.duplicate].first;
                auto pos = node_position(key);
                throw parse_error(side, name, pos ? pos->line : 0, pos ? pos->column : 0,
                                  "found duplicate key \"" + describe_node(key) + "\"");
            }
            for (const auto& [key, value] : entries) {
                check_unique_keys(key, side, name);
                check_unique_keys(value, side, name);
            }
            return;
        }
    }
}

std::vector<YAML::Node> load_stream(const std::string& text, Side side,
                                    const std::string& name) {
    std::vector<YAML::Node> docs;
    try {
        docs = YAML::LoadAll(text);
    } catch (const YAML::Exception& e) {
        int line = e.mark.is_null() ? 0 : e.mark.line + 1;
        int column = e.mark.is_null() ? 0 : e.mark.column + 1;
        throw parse_error(side, name, line, column, e.msg);
    }
    for (const auto& doc : docs) check_unique_keys(doc, side, name);
    return docs;
}

void check_header_docs(const std::vector<YAML::Node>& left_docs,
                       const std::vector<YAML::Node>& right_docs) {
    bool left_short = left_docs.size() < 2;
    bool right_short = right_docs.size() < 2;
    if (!left_short && !right_short) return;

    Side side = (left_short && right_short) ? Side::BOTH
              : left_short ? Side::LEFT : Side::RIGHT;
    throw DiffError(DiffError::Kind::HEADER, side,
                    std::string("Cannot skip header: no header YAML document found in ") +
                    side_name(side) + " stream");
}

std::vector<Diff> diff_streams(const std::vector<YAML::Node>& left_docs,
                               const std::vector<YAML::Node>& right_docs,
                               bool skip_header) {
    // yaml-cpp node assignment rebinds the referenced node, so the header
    // document is skipped by offset rather than erased
    size_t first = 0;
    if (skip_header) {
        check_header_docs(left_docs, right_docs);
        first = 1;
    }

    std::vector<Diff> diffs;
    const size_t left_len = left_docs.size() - first;
    const size_t right_len = right_docs.size() - first;
    const size_t max_len = std::max(left_len, right_len);
    for (size_t i = 0; i < max_len; ++i) {
        std::string label = "<YAML document #" + std::to_string(i + 1) + ">";
        if (i >= left_len) {
            diffs.emplace_back(NO_DOCUMENT, label, std::nullopt,
                               node_position(right_docs[first + i]));
        } else if (i >= right_len) {
            diffs.emplace_back(label, NO_DOCUMENT, node_position(left_docs[first + i]),
                               std::nullopt);
        } else {
            append(diffs, diff_documents(left_docs[first + i], right_docs[first + i]));
        }
    }
    return diffs;
}

std::vector<Diff> diff_yaml_streams(const std::string& left, const std::string& right,
                                    bool skip_header,
                                    const std::string& left_name,
                                    const std::string& right_name) {
    // Both sides are parsed before any comparison
    auto left_docs = load_stream(left, Side::LEFT, left_name);
    auto right_docs = load_stream(right, Side::RIGHT, right_name);
    return diff_streams(left_docs, right_docs, skip_header);
}

std::string read_yaml_source(const std::string& path, Side side) {
    std::string text;
    if (!read_input(path, text)) {
        throw DiffError(DiffError::Kind::IO, side, "Failed to open: " + path);
    }
    return text;
}

std::vector<Diff> diff_yaml_files(const std::string& left_path,
                                  const std::string& right_path,
                                  bool skip_header) {
    std::string left = read_yaml_source(left_path, Side::LEFT);
    std::string right = read_yaml_source(right_path, Side::RIGHT);
    return diff_yaml_streams(left, right, skip_header, left_path, right_path);
}

} // namespace yamldiff
