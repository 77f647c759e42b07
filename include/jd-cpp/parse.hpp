/// @file parse.hpp
/// @brief Readers: the inverses of the renderers in render.hpp.

#pragma once

#include <jd-cpp/diff.hpp>

#include <string_view>

namespace jd_cpp {

/// Read the native hunk format produced by render_native (without color).
///
/// Hunks get merge metadata while a `^ {"Merge":true}` line is in force and
/// no metadata otherwise.
/// @throws Exception (parse_error) naming the offending line.
auto read_diff(std::string_view text) -> Diff;

/// Read an RFC 6902 JSON Patch shaped the way render_patch writes it.
///
/// Each hunk is a run of context `test` ops, then `test`/`remove` pairs on
/// one path, then `add` ops at consecutive positions. Only `test`, `remove`
/// and `add` are accepted.
/// @throws Exception (parse_error) for anything render_patch would not
///   produce: a `remove` without its guarding `test`, a `test` that guards
///   nothing, unsupported ops, missing fields.
auto read_patch(std::string_view text) -> Diff;

/// Read an RFC 7386 JSON Merge Patch. Every hunk carries merge metadata;
/// `null` members become deletions (an add of Void).
/// @throws Exception (parse_error) on malformed JSON.
auto read_merge(std::string_view text) -> Diff;

/// Read the raw dump produced by render_raw.
/// @throws Exception (parse_error) on malformed input.
auto read_raw(std::string_view text) -> Diff;

}  // namespace jd_cpp
