/// @file render.hpp
/// @brief Renderers: native text, JSON Patch, JSON Merge Patch and raw dump.

#pragma once

#include <jd-cpp/diff.hpp>

#include <string>

namespace jd_cpp {

/// Options for the native text renderer.
struct RenderOptions {
    /// Wrap removals in red and additions in green (ANSI escapes). A hunk
    /// replacing one string with another highlights only the characters
    /// that changed.
    bool color{false};

    auto operator==(const RenderOptions&) const -> bool = default;
};

/// Native hunk format.
///
/// @code
/// ^ {"Merge":true}     metadata, only when the effective metadata changes
/// @ ["items",1]        hunk path
/// [                    before context (Void: start of list)
///   1                  before context
/// - 2                  removed value
/// + 4                  added value
///   3                  after context
/// ]                    after context (Void: end of list)
/// @endcode
auto render_native(const Diff& d, const RenderOptions& options = {}) -> std::string;

/// RFC 6902 JSON Patch, as a compact JSON array.
///
/// Every removed value is guarded by a `test` op, and list context becomes
/// `test` ops on the neighbouring indices.
/// @throws Exception (render_error) for merge hunks, hunks with more than
///   one line of context, hunks with nothing to remove or add, Void values
///   and object keys that look like numbers.
auto render_patch(const Diff& d) -> std::string;

/// RFC 7386 JSON Merge Patch.
/// @throws Exception (render_error) unless every hunk is effectively merge,
///   or if a hunk carries old values or a list index in its path.
/// @throws Exception (invalid_diff) for a hunk with more than one new value.
auto render_merge(const Diff& d) -> std::string;

/// Raw JSON dump of the hunk structure, for debugging. Never fails.
auto render_raw(const Diff& d) -> std::string;

}  // namespace jd_cpp
