/// @file node.hpp
/// @brief The document model: Node, its alternatives, equality and hashing.

#pragma once

#include <jd-cpp/options.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jd_cpp {

/// The absence of a value. Distinct from Null.
///
/// Parsing empty input yields Void, deleting through a patch yields Void,
/// and list hunks use Void as context at either end of a sequence.
struct Void {
    auto operator<=>(const Void&) const = default;
    auto operator==(const Void&) const -> bool = default;
};

/// The JSON null literal.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

class Node;

/// An ordered sequence of nodes.
using Array = std::vector<Node>;

/// String-keyed nodes in lexical key order.
using Object = std::map<std::string, Node>;

/// The closed set of alternatives a Node can hold.
using NodeValue = std::variant<Void, Null, bool, double, std::string, Array, Object>;

/// Discriminator for the alternatives of NodeValue, in the same order.
enum class NodeKind : std::uint8_t {
    void_,
    null,
    boolean,
    number,
    string,
    array,
    object,
};

/// Convert a NodeKind to its string representation.
constexpr auto to_string_view(NodeKind kind) noexcept -> std::string_view {
    switch (kind) {
        case NodeKind::void_:   return "void";
        case NodeKind::null:    return "null";
        case NodeKind::boolean: return "boolean";
        case NodeKind::number:  return "number";
        case NodeKind::string:  return "string";
        case NodeKind::array:   return "JSON array";
        case NodeKind::object:  return "JSON object";
    }
    return "unknown";
}

/// An immutable document value.
///
/// Nodes share their contents: copying a Node copies a pointer, never the
/// tree beneath it. A default-constructed Node is Void.
///
/// @code
/// auto doc = Node{Object{{"name", "jd"}, {"tags", Array{1, 2, 3}}}};
/// doc.as_object().at("name").as_string();  // "jd"
/// @endcode
class Node {
public:
    /// Construct Void.
    Node();

    Node(Void);
    Node(Null);
    Node(bool b);

    /// @throws Exception (invalid_document) if d is NaN or infinite.
    Node(double d);
    Node(int i);
    Node(std::int64_t i);

    Node(const char* s);
    Node(std::string s);
    Node(Array items);
    Node(Object fields);

    auto kind() const noexcept -> NodeKind;

    auto is_void() const noexcept -> bool { return kind() == NodeKind::void_; }
    auto is_null() const noexcept -> bool { return kind() == NodeKind::null; }
    auto is_bool() const noexcept -> bool { return kind() == NodeKind::boolean; }
    auto is_number() const noexcept -> bool { return kind() == NodeKind::number; }
    auto is_string() const noexcept -> bool { return kind() == NodeKind::string; }
    auto is_array() const noexcept -> bool { return kind() == NodeKind::array; }
    auto is_object() const noexcept -> bool { return kind() == NodeKind::object; }

    /// Typed access. Throws std::bad_variant_access on a kind mismatch.
    auto as_bool() const -> bool;
    auto as_number() const -> double;
    auto as_string() const -> const std::string&;
    auto as_array() const -> const Array&;
    auto as_object() const -> const Object&;

    /// The underlying variant, for use with std::visit.
    auto value() const noexcept -> const NodeValue&;

    /// Exact structural equality. Numbers compare with ==.
    auto operator==(const Node& other) const -> bool;

private:
    std::shared_ptr<const NodeValue> value_;
};

/// Structural equality where numbers within options.precision are equal.
auto equals(const Node& lhs, const Node& rhs, const DiffOptions& options = {}) -> bool;

/// 64-bit FNV-1a structural hash.
///
/// Equal documents hash equally across runs and platforms. Numbers hash
/// their IEEE-754 bit pattern, with -0.0 folded into 0.0.
auto hash_code(const Node& node) -> std::uint64_t;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Array& a) { ... },
///     [](const auto&) { ... },
/// }, node.value());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace jd_cpp

// -- std::hash specialization -------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<jd_cpp::Node> {
    auto operator()(const jd_cpp::Node& node) const -> std::size_t {
        return static_cast<std::size_t>(jd_cpp::hash_code(node));
    }
};

/// @endcond
