/// @file path.hpp
/// @brief Path: the location of a hunk inside a document.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jd_cpp {

/// A single step into a document: an object key or a list index.
///
/// Index -1 addresses the position after the last element of a list
/// (the "-" token in JSON Pointer).
using PathSegment = std::variant<std::string, std::int64_t>;

/// A sequence of segments from the document root. Empty means the root.
using Path = std::vector<PathSegment>;

/// Convenience constructor for a key segment.
inline auto key(std::string k) -> PathSegment { return PathSegment{std::move(k)}; }

/// Convenience constructor for an index segment.
inline auto index(std::int64_t i) -> PathSegment { return PathSegment{i}; }

/// Return a copy of `path` with `segment` appended.
auto append(const Path& path, PathSegment segment) -> Path;

/// Human-readable form used in error messages: `[a 1]`.
auto to_string(const Path& path) -> std::string;

/// Render as an RFC 6901 JSON Pointer.
///
/// Keys escape `~` as `~0` and `/` as `~1`. Index -1 renders as `-`.
/// @throws Exception (render_error) for keys that look like integers, such
///   as `0`, `-1` or `01`, since they cannot be told apart from indices when
///   read back.
auto to_json_pointer(const Path& path) -> std::string;

/// Parse an RFC 6901 JSON Pointer.
///
/// Tokens made of digits without leading zeros become indices, `-` becomes
/// index -1 and everything else is a key.
/// @throws Exception (parse_error) if the pointer is non-empty and does not
///   start with '/', or for integer-looking tokens that are not indices
///   (`-1`, `01`), which to_json_pointer never produces.
auto parse_json_pointer(std::string_view pointer) -> Path;

}  // namespace jd_cpp
