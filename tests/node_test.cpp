#include <jd-cpp/node.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <unordered_set>

using namespace jd_cpp;

// -- NodeKind -----------------------------------------------------------------

TEST(NodeKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(NodeKind::void_),   "void");
    EXPECT_EQ(to_string_view(NodeKind::null),    "null");
    EXPECT_EQ(to_string_view(NodeKind::boolean), "boolean");
    EXPECT_EQ(to_string_view(NodeKind::number),  "number");
    EXPECT_EQ(to_string_view(NodeKind::string),  "string");
    EXPECT_EQ(to_string_view(NodeKind::array),   "JSON array");
    EXPECT_EQ(to_string_view(NodeKind::object),  "JSON object");
}

// -- Construction -------------------------------------------------------------

TEST(Node, default_is_void) {
    const auto n = Node{};
    EXPECT_TRUE(n.is_void());
    EXPECT_EQ(n, Node{Void{}});
}

TEST(Node, void_is_not_null) {
    EXPECT_NE(Node{}, Node{Null{}});
}

TEST(Node, primitive_constructors) {
    EXPECT_EQ(Node{true}.kind(), NodeKind::boolean);
    EXPECT_EQ(Node{1}.kind(), NodeKind::number);
    EXPECT_EQ(Node{std::int64_t{7}}.as_number(), 7.0);
    EXPECT_EQ(Node{0.5}.as_number(), 0.5);
    EXPECT_EQ(Node{"text"}.kind(), NodeKind::string);
    EXPECT_EQ(Node{std::string{"text"}}.as_string(), "text");
}

TEST(Node, string_literal_is_not_bool) {
    const auto n = Node{"x"};
    EXPECT_TRUE(n.is_string());
}

TEST(Node, containers) {
    const auto n = Node{Object{{"name", "jd"}, {"tags", Array{1, 2, 3}}}};
    ASSERT_TRUE(n.is_object());
    EXPECT_EQ(n.as_object().at("name").as_string(), "jd");
    EXPECT_EQ(n.as_object().at("tags").as_array().size(), 3u);
}

TEST(Node, object_keys_are_sorted) {
    const auto n = Node{Object{{"b", 1}, {"a", 2}, {"c", 3}}};
    auto keys = std::string{};
    for (const auto& [k, v] : n.as_object()) keys += k;
    EXPECT_EQ(keys, "abc");
}

TEST(Node, rejects_non_finite_numbers) {
    try {
        auto n = Node{std::numeric_limits<double>::quiet_NaN()};
        (void)n;
        FAIL() << "NaN accepted";
    } catch (const Exception& e) {
        EXPECT_EQ(e.error().kind, ErrorKind::invalid_document);
    }
    EXPECT_THROW(Node{std::numeric_limits<double>::infinity()}, Exception);
}

TEST(Node, wrong_accessor_throws) {
    EXPECT_THROW((void)Node{1}.as_string(), std::bad_variant_access);
}

TEST(Node, copies_share_contents) {
    const auto a = Node{Array{1, 2, 3}};
    const auto b = a;
    EXPECT_EQ(&a.as_array(), &b.as_array());
}

// -- Equality -----------------------------------------------------------------

TEST(Equality, exact_structural) {
    EXPECT_EQ((Node{Array{1, "a", Null{}}}), (Node{Array{1, "a", Null{}}}));
    EXPECT_NE((Node{Array{1, 2}}), (Node{Array{2, 1}}));
    EXPECT_NE((Node{Object{{"a", 1}}}), (Node{Object{{"a", 1}, {"b", 2}}}));
    EXPECT_NE(Node{1}, Node{"1"});
}

TEST(Equality, precision_tolerance) {
    const auto opts = DiffOptions{}.with_precision(0.1);
    EXPECT_TRUE(equals(Node{1.0}, Node{1.05}, opts));
    EXPECT_FALSE(equals(Node{1.0}, Node{1.2}, opts));
    EXPECT_FALSE(equals(Node{1.0}, Node{1.05}));
}

TEST(Equality, tolerance_applies_inside_containers) {
    const auto opts = DiffOptions{}.with_precision(0.01);
    const auto a = Node{Object{{"x", Array{1.0, 2.0}}}};
    const auto b = Node{Object{{"x", Array{1.001, 2.0}}}};
    EXPECT_TRUE(equals(a, b, opts));
    EXPECT_NE(a, b);
}

TEST(DiffOptions, rejects_bad_precision) {
    EXPECT_THROW((void)DiffOptions{}.with_precision(-1.0), Exception);
    EXPECT_THROW((void)DiffOptions{}.with_precision(std::nan("")), Exception);
    EXPECT_NO_THROW((void)DiffOptions{}.with_precision(0.0));
}

// -- Hashing ------------------------------------------------------------------

TEST(HashCode, fixed_constants) {
    EXPECT_EQ(hash_code(Node{}), 0x968D2691216B97F3ULL);
    EXPECT_EQ(hash_code(Node{Null{}}), 0x88E032E6CCAB73FEULL);
    EXPECT_EQ(hash_code(Node{true}), 0x1CDC59AFE4E36B24ULL);
    EXPECT_EQ(hash_code(Node{false}), 0xBF1F7E0AD17738C6ULL);
}

TEST(HashCode, strings_and_numbers_use_fnv1a) {
    EXPECT_EQ(hash_code(Node{"jd"}), 0x08c16007b564e43bULL);
    EXPECT_EQ(hash_code(Node{""}), 0xcbf29ce484222325ULL);
    EXPECT_EQ(hash_code(Node{1}), 0xaab1693229ba1db8ULL);
}

TEST(HashCode, arrays_are_seeded) {
    EXPECT_EQ(hash_code(Node{Array{}}), 0x54cf01f6116fb283ULL);
    EXPECT_EQ(hash_code(Node{Array{1}}), 0x9ad94b698013d5a3ULL);
}

TEST(HashCode, order_sensitive_for_arrays) {
    EXPECT_NE(hash_code(Node{Array{1, 2}}), hash_code(Node{Array{2, 1}}));
}

TEST(HashCode, equal_nodes_hash_equally) {
    const auto a = Node{Object{{"a", Array{1, 2}}, {"b", Null{}}}};
    const auto b = Node{Object{{"b", Null{}}, {"a", Array{1, 2}}}};
    EXPECT_EQ(hash_code(a), hash_code(b));
}

TEST(HashCode, signed_zeros_hash_equally) {
    EXPECT_EQ(Node{-0.0}, Node{0.0});
    EXPECT_EQ(hash_code(Node{-0.0}), hash_code(Node{0.0}));
}

TEST(HashCode, empty_array_and_object_differ) {
    EXPECT_NE(hash_code(Node{Array{}}), hash_code(Node{Object{}}));
}

TEST(HashCode, usable_in_unordered_containers) {
    auto set = std::unordered_set<Node>{};
    set.insert(Node{1});
    set.insert(Node{1});
    set.insert(Node{"1"});
    EXPECT_EQ(set.size(), 2u);
}

// -- Visitor ------------------------------------------------------------------

TEST(Overload, visits_node_value) {
    const auto n = Node{Array{1, 2}};
    auto size = std::visit(overload{
        [](const Array& a) { return a.size(); },
        [](const auto&) { return std::size_t{0}; },
    }, n.value());
    EXPECT_EQ(size, 2u);
}
