// diff_test.cc - Unit tests for the tree differ
// Tests documents, mappings, sequences, type mismatches and record positions

#include "test_helper.h"
#include "../src/diff.h"

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

using namespace yamldiff;

//=============================================================================
// Helper functions
//=============================================================================

static std::vector<Diff> diff_text(const char* left, const char* right) {
    return diff_documents(YAML::Load(left), YAML::Load(right));
}

static void assert_pos(const std::optional<Position>& pos, int line, int column) {
    ASSERT_TRUE(pos.has_value());
    ASSERT_EQ(pos->line, line);
    ASSERT_EQ(pos->column, column);
}

// Every record of `ab` appears in `ba` with sides swapped
static bool mirrored(const std::vector<Diff>& ab, const std::vector<Diff>& ba) {
    if (ab.size() != ba.size()) return false;
    for (const auto& d : ab) {
        auto it = std::find_if(ba.begin(), ba.end(), [&](const Diff& e) {
            return e.left == d.right && e.right == d.left &&
                   e.left_pos == d.right_pos && e.right_pos == d.left_pos;
        });
        if (it == ba.end()) return false;
    }
    return true;
}

static const char* SAMPLES[] = {
    "a: 1\nb: [1, 2, {c: d}]\n",
    "a: 1.0\nb: [1, 2]\ne: x\n",
    "- 1\n- two\n- {three: 3}\n",
    "[1, 2]\n",
    "plain scalar\n",
    "~\n",
    "a:\n  b:\n    c: [true, false]\n",
};

//=============================================================================
// Identity
//=============================================================================

TEST(identical_documents_have_no_diffs) {
    for (const char* s : SAMPLES) {
        ASSERT_TRUE(diff_text(s, s).empty());
    }
}

TEST(identity_with_nan_and_overflow) {
    ASSERT_TRUE(diff_text("a: .nan\nb: 123456789012345678901234\n",
                          "a: .nan\nb: 123456789012345678901234\n").empty());
}

TEST(key_order_is_irrelevant) {
    ASSERT_TRUE(diff_text("a: 1\nb: 2\nc: 3\n", "c: 3\na: 1\nb: 2\n").empty());
    ASSERT_TRUE(diff_text("{x: {p: 1, q: 2}}", "{x: {q: 2, p: 1}}").empty());
}

//=============================================================================
// Scalars
//=============================================================================

TEST(changed_value_in_flow_mapping) {
    auto diffs = diff_text("{a: 1}", "{a: 2}");
    ASSERT_EQ(diffs.size(), 1u);
    ASSERT_EQ(diffs[0].left, "1");
    ASSERT_EQ(diffs[0].right, "2");
    assert_pos(diffs[0].left_pos, 1, 5);
    assert_pos(diffs[0].right_pos, 1, 5);
}

TEST(numeric_values_compare_by_value) {
    ASSERT_TRUE(diff_text("a: 1", "a: 1.0").empty());
    ASSERT_TRUE(diff_text("a: 0x1F", "a: 31").empty());
    ASSERT_TRUE(diff_text("a: true", "a: True").empty());
}

TEST(quoted_number_differs_from_plain) {
    auto diffs = diff_text("a: 1", "a: '1'");
    ASSERT_EQ(diffs.size(), 1u);
    ASSERT_EQ(diffs[0].left, "1");
    ASSERT_EQ(diffs[0].right, "1");
}

TEST(yes_is_a_string) {
    ASSERT_EQ(diff_text("a: yes", "a: true").size(), 1u);
}

TEST(top_level_scalars) {
    ASSERT_TRUE(diff_text("hello", "hello").empty());
    auto diffs = diff_text("hello", "world");
    ASSERT_EQ(diffs.size(), 1u);
    ASSERT_EQ(diffs[0].left, "hello");
    ASSERT_EQ(diffs[0].right, "world");
    assert_pos(diffs[0].left_pos, 1, 1);
    assert_pos(diffs[0].right_pos, 1, 1);
}

TEST(nested_scalar_position) {
    auto diffs = diff_text("a:\n  b:\n    c: 1\n", "a:\n  b:\n    c: 2\n");
    ASSERT_EQ(diffs.size(), 1u);
    assert_pos(diffs[0].left_pos, 3, 8);
    assert_pos(diffs[0].right_pos, 3, 8);
}

//=============================================================================
// Mappings
//=============================================================================

TEST(key_missing_on_right) {
    auto diffs = diff_text("a: 1\nb: 2\n", "a: 1\n");
    ASSERT_EQ(diffs.size(), 1u);
    ASSERT_EQ(diffs[0].left, "b");
    ASSERT_EQ(diffs[0].right, MISSING_KEY);
    assert_pos(diffs[0].left_pos, 2, 1);
    assert_pos(diffs[0].right_pos, 1, 1);
}

TEST(key_missing_on_left) {
    auto diffs = diff_text("a: 1\n", "a: 1\nb: 2\n");
    ASSERT_EQ(diffs.size(), 1u);
    ASSERT_EQ(diffs[0].left, MISSING_KEY);
    ASSERT_EQ(diffs[0].right, "b");
    assert_pos(diffs[0].left_pos, 1, 1);
    assert_pos(diffs[0].right_pos, 2, 1);
}

TEST(mapping_records_follow_two_passes) {
    auto diffs = diff_text("a: 1\nb: 2\nc: 3\n", "d: 4\nb: 20\na: 1\n");
    ASSERT_EQ(diffs.size(), 3u);
    ASSERT_EQ(diffs[0].left, "2");
    ASSERT_EQ(diffs[0].right, "20");
    ASSERT_EQ(diffs[1].left, "c");
    ASSERT_EQ(diffs[1].right, MISSING_KEY);
    ASSERT_EQ(diffs[2].left, MISSING_KEY);
    ASSERT_EQ(diffs[2].right, "d");
}

TEST(every_differing_key_reported_once) {
    auto diffs = diff_text("{a: 1, b: 2, c: 3}", "{b: 2, c: 4, d: 5, e: 6}");
    ASSERT_EQ(diffs.size(), 4u);
    size_t missing_right = 0, missing_left = 0, changed = 0;
    for (const auto& d : diffs) {
        if (d.right == MISSING_KEY) ++missing_right;
        else if (d.left == MISSING_KEY) ++missing_left;
        else ++changed;
    }
    ASSERT_EQ(missing_right, 1u);
    ASSERT_EQ(missing_left, 2u);
    ASSERT_EQ(changed, 1u);
}

TEST(numeric_keys_match_by_value) {
    ASSERT_TRUE(diff_text("{1: a}", "{1.0: a}").empty());
    ASSERT_EQ(diff_text("{1: a}", "{'1': a}").size(), 2u);
}

TEST(complex_key_description) {
    auto diffs = diff_text("? [k]\n: 1\n", "{}");
    ASSERT_EQ(diffs.size(), 1u);
    ASSERT_EQ(diffs[0].left, "[k]");
    ASSERT_EQ(diffs[0].right, MISSING_KEY);
}

TEST(null_values) {
    ASSERT_TRUE(diff_text("a: ~", "a: null").empty());
    ASSERT_TRUE(diff_text("a:", "a: ~").empty());
    auto diffs = diff_text("a: ~", "a: 1");
    ASSERT_EQ(diffs.size(), 1u);
    ASSERT_EQ(diffs[0].left, "<node of type null> a");
    ASSERT_EQ(diffs[0].right, "<node of type scalar> a");
}

//=============================================================================
// Sequences
//=============================================================================

TEST(sequence_item_missing_on_right) {
    auto diffs = diff_text("[1, 2, 3]", "[1, 2]");
    ASSERT_EQ(diffs.size(), 1u);
    ASSERT_EQ(diffs[0].left, "3");
    ASSERT_EQ(diffs[0].right, MISSING_ITEM);
    assert_pos(diffs[0].left_pos, 1, 8);
    assert_pos(diffs[0].right_pos, 1, 1);
}

TEST(sequence_item_missing_on_left) {
    auto diffs = diff_text("[1, 2]", "[1, 2, 3]");
    ASSERT_EQ(diffs.size(), 1u);
    ASSERT_EQ(diffs[0].left, MISSING_ITEM);
    ASSERT_EQ(diffs[0].right, "3");
    assert_pos(diffs[0].left_pos, 1, 1);
    assert_pos(diffs[0].right_pos, 1, 8);
}

TEST(sequences_align_by_index) {
    auto diffs = diff_text("[1, 2]", "[2, 1]");
    ASSERT_EQ(diffs.size(), 2u);
    ASSERT_EQ(diffs[0].left, "1");
    ASSERT_EQ(diffs[0].right, "2");
    ASSERT_EQ(diffs[1].left, "2");
    ASSERT_EQ(diffs[1].right, "1");
}

TEST(missing_container_item_is_described_in_flow_style) {
    auto diffs = diff_text("[1, {a: b}]", "[1]");
    ASSERT_EQ(diffs.size(), 1u);
    ASSERT_EQ(diffs[0].left, "{a: b}");
    ASSERT_EQ(diffs[0].right, MISSING_ITEM);
}

TEST(mapping_inside_sequence) {
    auto diffs = diff_text("- name: x\n  v: 1\n- name: y\n",
                           "- name: x\n  v: 2\n- name: y\n");
    ASSERT_EQ(diffs.size(), 1u);
    ASSERT_EQ(diffs[0].left, "1");
    ASSERT_EQ(diffs[0].right, "2");
    assert_pos(diffs[0].left_pos, 2, 6);
}

//=============================================================================
// Type mismatches
//=============================================================================

TEST(top_level_type_mismatch_short_circuits) {
    auto diffs = diff_text("[1, 2, 3]", "{a: 1, b: 2}");
    ASSERT_EQ(diffs.size(), 1u);
    ASSERT_EQ(diffs[0].left, "<top-level node of type sequence>");
    ASSERT_EQ(diffs[0].right, "<top-level node of type mapping>");
    assert_pos(diffs[0].left_pos, 1, 1);
    assert_pos(diffs[0].right_pos, 1, 1);
}

TEST(top_level_null_has_no_position) {
    auto diffs = diff_text("~", "a: 1");
    ASSERT_EQ(diffs.size(), 1u);
    ASSERT_EQ(diffs[0].left, "<top-level node of type null>");
    ASSERT_FALSE(diffs[0].left_pos.has_value());
    assert_pos(diffs[0].right_pos, 1, 1);
}

TEST(child_type_mismatch_names_the_key) {
    auto diffs = diff_text("a: [1]\n", "a: {b: 1}\n");
    ASSERT_EQ(diffs.size(), 1u);
    ASSERT_EQ(diffs[0].left, "<node of type sequence> a");
    ASSERT_EQ(diffs[0].right, "<node of type mapping> a");
    assert_pos(diffs[0].left_pos, 1, 4);
    assert_pos(diffs[0].right_pos, 1, 4);
}

TEST(item_type_mismatch_has_no_key) {
    auto diffs = diff_text("[1, [2]]", "[1, 2]");
    ASSERT_EQ(diffs.size(), 1u);
    ASSERT_EQ(diffs[0].left, "<node of type sequence>");
    ASSERT_EQ(diffs[0].right, "<node of type scalar>");
}

//=============================================================================
// Large mappings
//=============================================================================

static std::string numbered_mapping(size_t n, bool reversed, size_t changed) {
    std::string out;
    for (size_t k = 0; k < n; ++k) {
        size_t i = reversed ? n - 1 - k : k;
        out += "key" + std::to_string(i) + ": " + std::to_string(i == changed ? i + 1 : i) + "\n";
    }
    return out;
}

TEST(large_reversed_mapping_is_fast) {
    const size_t n = 5000;
    YAML::Node left = YAML::Load(numbered_mapping(n, false, n));
    YAML::Node right = YAML::Load(numbered_mapping(n, true, 1234));

    auto start = std::chrono::steady_clock::now();
    auto diffs = diff_documents(left, right);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_EQ(diffs.size(), 1u);
    ASSERT_EQ(diffs[0].left, "1234");
    ASSERT_EQ(diffs[0].right, "1235");
    ASSERT_TRUE(elapsed < std::chrono::seconds(1));
}

TEST(large_mapping_missing_keys) {
    YAML::Node left = YAML::Load(numbered_mapping(3000, false, 3000));
    YAML::Node right = YAML::Load(numbered_mapping(2000, true, 3000));
    auto diffs = diff_documents(left, right);
    ASSERT_EQ(diffs.size(), 1000u);
    ASSERT_EQ(diffs[0].left, "key2000");
    ASSERT_EQ(diffs[0].right, MISSING_KEY);
}

//=============================================================================
// Symmetry
//=============================================================================

TEST(swapping_sides_swaps_records) {
    for (const char* a : SAMPLES) {
        for (const char* b : SAMPLES) {
            auto ab = diff_text(a, b);
            auto ba = diff_text(b, a);
            if (!mirrored(ab, ba)) {
                throw std::runtime_error(std::string("asymmetric diff: ") + a + " vs " + b);
            }
        }
    }
}

//=============================================================================
// Main
//=============================================================================

int main() {
    std::cout << "=== Diff Unit Tests ===\n";
    // Tests are auto-run by static initializers
    return test::print_summary();
}
