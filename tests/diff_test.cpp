#include <jd-cpp/diff.hpp>
#include <jd-cpp/json.hpp>
#include <jd-cpp/patch.hpp>

#include <gtest/gtest.h>

#include <string_view>

using namespace jd_cpp;

namespace {

auto doc(std::string_view text) -> Node {
    return read_json(text);
}

auto nodes(std::string_view text) -> std::vector<Node> {
    return read_json(text).as_array();
}

}  // anonymous namespace

// -- Equal documents ----------------------------------------------------------

TEST(Diff, equal_documents_produce_empty_diff) {
    EXPECT_TRUE(diff(doc("1"), doc("1")).empty());
    EXPECT_TRUE(diff(doc(R"({"a":[1,{"b":null}]})"), doc(R"({"a":[1,{"b":null}]})")).empty());
    EXPECT_TRUE(diff(Node{}, Node{}).empty());
}

TEST(Diff, precision_suppresses_small_changes) {
    const auto opts = DiffOptions{}.with_precision(0.01);
    EXPECT_TRUE(diff(doc("[1.0, 2.0]"), doc("[1.001, 2.0]"), opts).empty());
    EXPECT_EQ(diff(doc("[1.0, 2.0]"), doc("[1.1, 2.0]"), opts).size(), 1u);
}

// -- Primitives ---------------------------------------------------------------

TEST(Diff, root_replacement) {
    const auto d = diff(doc("1"), doc(R"("x")"));
    ASSERT_EQ(d.size(), 1u);
    EXPECT_TRUE(d[0].path.empty());
    EXPECT_FALSE(d[0].metadata.has_value());
    EXPECT_EQ(d[0].remove, nodes("[1]"));
    EXPECT_EQ(d[0].add, nodes(R"(["x"])"));
    EXPECT_TRUE(d[0].before.empty());
    EXPECT_TRUE(d[0].after.empty());
}

TEST(Diff, void_to_value_has_no_removal) {
    const auto d = diff(Node{}, doc("1"));
    ASSERT_EQ(d.size(), 1u);
    EXPECT_TRUE(d[0].remove.empty());
    EXPECT_EQ(d[0].add, nodes("[1]"));
}

TEST(Diff, value_to_void_has_no_addition) {
    const auto d = diff(doc("1"), Node{});
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d[0].remove, nodes("[1]"));
    EXPECT_TRUE(d[0].add.empty());
}

TEST(Diff, null_is_a_value) {
    const auto d = diff(doc("null"), doc("false"));
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d[0].remove, (std::vector<Node>{Node{Null{}}}));
    EXPECT_EQ(d[0].add, (std::vector<Node>{Node{false}}));
}

// -- Objects ------------------------------------------------------------------

TEST(Diff, object_key_change) {
    const auto d = diff(doc(R"({"name":"old"})"), doc(R"({"name":"new"})"));
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d[0].path, (Path{key("name")}));
    EXPECT_EQ(d[0].remove, nodes(R"(["old"])"));
    EXPECT_EQ(d[0].add, nodes(R"(["new"])"));
}

TEST(Diff, object_keys_in_lexical_order) {
    const auto d = diff(doc(R"({"c":1,"a":1,"b":1})"), doc(R"({"b":2,"d":1,"a":2})"));
    ASSERT_EQ(d.size(), 4u);
    EXPECT_EQ(d[0].path, (Path{key("a")}));
    EXPECT_EQ(d[1].path, (Path{key("b")}));
    EXPECT_EQ(d[2].path, (Path{key("c")}));
    EXPECT_EQ(d[2].remove, nodes("[1]"));
    EXPECT_TRUE(d[2].add.empty());
    EXPECT_EQ(d[3].path, (Path{key("d")}));
    EXPECT_TRUE(d[3].remove.empty());
    EXPECT_EQ(d[3].add, nodes("[1]"));
}

TEST(Diff, nested_objects_recurse) {
    const auto d = diff(doc(R"({"a":{"b":{"c":1}}})"), doc(R"({"a":{"b":{"c":2}}})"));
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d[0].path, (Path{key("a"), key("b"), key("c")}));
}

TEST(Diff, object_to_array_is_replacement) {
    const auto d = diff(doc(R"({"a":{}})"), doc(R"({"a":[]})"));
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d[0].path, (Path{key("a")}));
    EXPECT_EQ(d[0].remove, nodes("[{}]"));
    EXPECT_EQ(d[0].add, nodes("[[]]"));
}

// -- Lists --------------------------------------------------------------------

TEST(Diff, list_substitution_carries_context) {
    const auto d = diff(doc("[1,2,3]"), doc("[1,4,3]"));
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d[0].path, (Path{index(1)}));
    EXPECT_EQ(d[0].before, nodes("[1]"));
    EXPECT_EQ(d[0].remove, nodes("[2]"));
    EXPECT_EQ(d[0].add, nodes("[4]"));
    EXPECT_EQ(d[0].after, nodes("[3]"));
}

TEST(Diff, list_append_has_void_after_context) {
    const auto d = diff(doc("[1,2]"), doc("[1,2,3]"));
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d[0].path, (Path{index(2)}));
    EXPECT_EQ(d[0].before, nodes("[2]"));
    EXPECT_TRUE(d[0].remove.empty());
    EXPECT_EQ(d[0].add, nodes("[3]"));
    ASSERT_EQ(d[0].after.size(), 1u);
    EXPECT_TRUE(d[0].after[0].is_void());
}

TEST(Diff, list_prepend_has_void_before_context) {
    const auto d = diff(doc("[2]"), doc("[1,2]"));
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d[0].path, (Path{index(0)}));
    ASSERT_EQ(d[0].before.size(), 1u);
    EXPECT_TRUE(d[0].before[0].is_void());
    EXPECT_EQ(d[0].add, nodes("[1]"));
    EXPECT_EQ(d[0].after, nodes("[2]"));
}

TEST(Diff, list_removals_split_into_hunks) {
    const auto d = diff(doc("[1,2,3,4]"), doc("[2,4]"));
    ASSERT_EQ(d.size(), 2u);

    EXPECT_EQ(d[0].path, (Path{index(0)}));
    ASSERT_EQ(d[0].before.size(), 1u);
    EXPECT_TRUE(d[0].before[0].is_void());
    EXPECT_EQ(d[0].remove, nodes("[1]"));
    EXPECT_EQ(d[0].after, nodes("[2]"));

    EXPECT_EQ(d[1].path, (Path{index(1)}));
    EXPECT_EQ(d[1].before, nodes("[2]"));
    EXPECT_EQ(d[1].remove, nodes("[3]"));
    EXPECT_EQ(d[1].after, nodes("[4]"));
}

TEST(Diff, list_reorder) {
    const auto d = diff(doc("[1,2,1]"), doc("[1,1,2]"));
    ASSERT_EQ(d.size(), 2u);

    EXPECT_EQ(d[0].path, (Path{index(1)}));
    EXPECT_EQ(d[0].before, nodes("[1]"));
    EXPECT_TRUE(d[0].remove.empty());
    EXPECT_EQ(d[0].add, nodes("[1]"));
    EXPECT_EQ(d[0].after, nodes("[2]"));

    EXPECT_EQ(d[1].path, (Path{index(3)}));
    EXPECT_EQ(d[1].before, nodes("[2]"));
    EXPECT_EQ(d[1].remove, nodes("[1]"));
    ASSERT_EQ(d[1].after.size(), 1u);
    EXPECT_TRUE(d[1].after[0].is_void());
}

TEST(Diff, empty_list_to_values) {
    const auto d = diff(doc("[]"), doc("[1,2]"));
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d[0].path, (Path{index(0)}));
    EXPECT_EQ(d[0].add, nodes("[1,2]"));
    ASSERT_EQ(d[0].before.size(), 1u);
    EXPECT_TRUE(d[0].before[0].is_void());
    ASSERT_EQ(d[0].after.size(), 1u);
    EXPECT_TRUE(d[0].after[0].is_void());
}

TEST(Diff, nested_container_in_list_recurses) {
    const auto d = diff(doc(R"([{"a":1}])"), doc(R"([{"a":2}])"));
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d[0].path, (Path{index(0), key("a")}));
    EXPECT_EQ(d[0].remove, nodes("[1]"));
    EXPECT_EQ(d[0].add, nodes("[2]"));
    EXPECT_TRUE(d[0].before.empty());
    EXPECT_TRUE(d[0].after.empty());
}

TEST(Diff, nested_lists_recurse) {
    const auto d = diff(doc("[[1,2]]"), doc("[[1,3]]"));
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d[0].path, (Path{index(0), index(1)}));
    EXPECT_EQ(d[0].before, nodes("[1]"));
    EXPECT_EQ(d[0].after.size(), 1u);
}

TEST(Diff, list_in_object) {
    const auto d = diff(doc(R"({"items":[1,2,3]})"), doc(R"({"items":[1,4,3]})"));
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d[0].path, (Path{key("items"), index(1)}));
}

// -- Merge mode ---------------------------------------------------------------

TEST(DiffMerge, every_hunk_is_flagged) {
    const auto d = diff(doc(R"({"a":1,"b":[1,2]})"), doc(R"({"b":[1,3],"c":null})"),
                        DiffOptions{}.with_merge());
    ASSERT_EQ(d.size(), 3u);
    for (const auto& element : d) {
        ASSERT_TRUE(element.metadata.has_value());
        EXPECT_TRUE(element.metadata->merge);
        EXPECT_TRUE(element.remove.empty());
        ASSERT_EQ(element.add.size(), 1u);
    }
}

TEST(DiffMerge, removed_key_adds_void) {
    const auto d = diff(doc(R"({"a":1})"), doc("{}"), DiffOptions{}.with_merge());
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d[0].path, (Path{key("a")}));
    EXPECT_TRUE(d[0].add[0].is_void());
}

TEST(DiffMerge, arrays_are_replaced_wholesale) {
    const auto d = diff(doc(R"({"b":[1,2]})"), doc(R"({"b":[1,3]})"), DiffOptions{}.with_merge());
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d[0].path, (Path{key("b")}));
    EXPECT_EQ(d[0].add, nodes("[[1,3]]"));
}

TEST(DiffMerge, nested_objects_recurse) {
    const auto d = diff(doc(R"({"a":{"b":1}})"), doc(R"({"a":{"b":2}})"), DiffOptions{}.with_merge());
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d[0].path, (Path{key("a"), key("b")}));
}

TEST(EffectiveMerge, inherits_from_preceding_hunk) {
    auto d = Diff(4);
    d[0].metadata = DiffMetadata{true};
    d[2].metadata = DiffMetadata{false};
    EXPECT_EQ(effective_merge(d), (std::vector<bool>{true, true, false, false}));
}

TEST(EffectiveMerge, defaults_to_strict) {
    EXPECT_EQ(effective_merge(Diff(2)), (std::vector<bool>{false, false}));
}

// -- Properties ---------------------------------------------------------------

TEST(DiffProperty, applying_diff_yields_target) {
    const char* cases[][2] = {
        {"[1,2,3]", "[1,4,3]"},
        {"[1,2,3,4]", "[2,4]"},
        {"[1,2,1]", "[1,1,2]"},
        {"[]", "[1,2,3]"},
        {"[1,2,3]", "[]"},
        {"[1,2,3]", "[3,2,1]"},
        {R"({"a":[1,{"b":2}],"c":"x"})", R"({"a":[{"b":3},1],"d":true})"},
        {R"([{"a":1},{"b":2},{"c":3}])", R"([{"a":1},{"c":4}])"},
        {"[[1,2],[3]]", "[[1],[3,4],5]"},
        {R"({"x":null})", R"({"x":{"y":[1]}})"},
        {"1", "[1]"},
        {"", R"({"a":1})"},
        {R"({"a":1})", ""},
    };
    for (const auto& [lhs, rhs] : cases) {
        const auto a = doc(lhs);
        const auto b = doc(rhs);
        EXPECT_EQ(apply_patch(a, diff(a, b)), b) << lhs << " -> " << rhs;
    }
}

TEST(DiffProperty, diff_is_deterministic) {
    const auto a = doc(R"({"a":[1,2,3,{"b":[4,5]}],"c":{"d":1}})");
    const auto b = doc(R"({"a":[3,2,{"b":[5]}],"c":{"e":1}})");
    EXPECT_EQ(diff(a, b), diff(a, b));
}
