/// @file json.hpp
/// @brief nlohmann/json interoperability for jd-cpp.
///
/// Provides ADL serialization (to_json/from_json) for Node, a text reader
/// that maps empty input to Void, and the canonical compact serializer used
/// by error messages and renderers.

#pragma once

#include <jd-cpp/node.hpp>
#include <jd-cpp/path.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace jd_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

/// @throws Exception (invalid_document) if the node is or contains Void.
void to_json(nlohmann::json& j, const Node& node);

/// JSON numbers become doubles; an unparsed (discarded) value is rejected.
void from_json(const nlohmann::json& j, Node& node);

// =============================================================================
// Text
// =============================================================================

/// Parse a JSON document.
///
/// Empty or whitespace-only text yields Void.
/// @throws Exception (invalid_document) on malformed JSON or non-finite numbers.
auto read_json(std::string_view text) -> Node;

/// Compact canonical JSON for a node.
///
/// Void renders as the empty string. Integral numbers within the int64
/// range render without a fractional part, so 1.0 renders as `1`.
/// @throws Exception (invalid_document) if Void is nested inside a container.
auto to_json_string(const Node& node) -> std::string;

// =============================================================================
// Paths
// =============================================================================

/// A path as a JSON array: keys become strings, indices integers.
auto path_to_json(const Path& path) -> nlohmann::json;

/// Inverse of path_to_json.
/// @throws Exception (parse_error) if j is not an array of strings and integers.
auto path_from_json(const nlohmann::json& j) -> Path;

}  // namespace jd_cpp
