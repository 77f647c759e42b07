/// @file raw_codec.hpp
/// @brief Tagged JSON encoding of nodes and hunks for the raw format.
///
/// Internal header, not installed.

#pragma once

#include <jd-cpp/diff.hpp>
#include <jd-cpp/node.hpp>

#include <nlohmann/json.hpp>

namespace jd_cpp::detail {

/// `{"type":"Number","value":1}`, `{"type":"Void"}` and so on. Unlike the
/// canonical encoding this can represent Void anywhere in a tree.
auto node_to_raw(const Node& node) -> nlohmann::ordered_json;

/// @throws Exception (parse_error) on an unknown tag or a malformed value.
auto node_from_raw(const nlohmann::ordered_json& j) -> Node;

/// Fields in order: metadata (when present), path, before, remove, add,
/// after. Empty node lists are omitted.
auto element_to_raw(const DiffElement& element) -> nlohmann::ordered_json;

/// @throws Exception (parse_error) on unknown fields or malformed values.
auto element_from_raw(const nlohmann::ordered_json& j) -> DiffElement;

}  // namespace jd_cpp::detail
