/// @file patch.hpp
/// @brief Applying and reversing diffs.

#pragma once

#include <jd-cpp/diff.hpp>
#include <jd-cpp/node.hpp>

namespace jd_cpp {

/// Apply a diff to a document and return the patched document.
///
/// Hunks apply in order, each against the result of the previous one. A
/// hunk whose effective metadata is merge uses RFC 7386 rules (objects are
/// created along the path, nothing is validated); every other hunk is
/// strict and must find exactly the values and list context it expects.
///
/// The base is never modified. On failure nothing is returned.
///
/// @throws Exception with kind context_mismatch, strategy_error or
///   invalid_diff. The message names the expected and actual values.
///
/// @code
/// auto a = read_json("[1,2,3]");
/// auto b = read_json("[1,4,3]");
/// assert(apply_patch(a, diff(a, b)) == b);
/// @endcode
auto apply_patch(const Node& base, const Diff& d) -> Node;

/// Invert a strict diff, so that apply_patch(b, reverse(diff(a, b))) == a.
///
/// Each hunk swaps remove and add. Hunks are emitted in reverse order
/// because list positions depend on the hunks applied before them.
///
/// @throws Exception (reverse_error) if any hunk is effectively merge:
///   merge hunks do not record the values they replace.
auto reverse(const Diff& d) -> Diff;

}  // namespace jd_cpp
