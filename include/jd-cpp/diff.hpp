/// @file diff.hpp
/// @brief Diff, DiffElement and the structural diff algorithm.

#pragma once

#include <jd-cpp/node.hpp>
#include <jd-cpp/options.hpp>
#include <jd-cpp/path.hpp>

#include <optional>
#include <vector>

namespace jd_cpp {

/// Per-hunk flags.
///
/// Metadata is inherited along a Diff: a hunk without metadata uses the
/// metadata of the closest preceding hunk that has one.
struct DiffMetadata {
    bool merge{false};  ///< Hunk carries RFC 7386 merge semantics.

    auto operator==(const DiffMetadata&) const -> bool = default;
};

/// One unit of change (a hunk).
///
/// `before` and `after` are only populated for list hunks. They hold the
/// neighbouring elements that must surround the insertion point, with Void
/// standing for either end of the list.
struct DiffElement {
    std::optional<DiffMetadata> metadata;
    Path path;
    std::vector<Node> before;
    std::vector<Node> remove;
    std::vector<Node> add;
    std::vector<Node> after;

    auto operator==(const DiffElement&) const -> bool = default;
};

/// An ordered sequence of hunks. Order follows document traversal order.
using Diff = std::vector<DiffElement>;

/// Compute the structural difference between two documents.
///
/// Total: never throws for well-formed nodes. Equal documents (under
/// `options.precision`) produce an empty Diff.
///
/// @code
/// auto d = diff(read_json(R"({"name":"old"})"), read_json(R"({"name":"new"})"));
/// // d[0].path == Path{key("name")}, d[0].remove == {"old"}, d[0].add == {"new"}
/// @endcode
auto diff(const Node& lhs, const Node& rhs, const DiffOptions& options = {}) -> Diff;

/// The merge flag in force for each hunk of `d`, after inheritance.
auto effective_merge(const Diff& d) -> std::vector<bool>;

}  // namespace jd_cpp
