#include <jd-cpp/render.hpp>

#include <jd-cpp/error.hpp>
#include <jd-cpp/json.hpp>
#include <jd-cpp/patch.hpp>

#include "lcs.hpp"
#include "raw_codec.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jd_cpp {

namespace {

constexpr auto color_red = std::string_view{"\x1b[31m"};
constexpr auto color_green = std::string_view{"\x1b[32m"};
constexpr auto color_reset = std::string_view{"\x1b[0m"};

template <typename Json>
auto compact(const Json& j) -> std::string {
    return j.dump(-1, ' ', false, Json::error_handler_t::replace);
}

// =============================================================================
// Native format
// =============================================================================

/// Split UTF-8 text into code points. Malformed sequences split per byte.
auto split_code_points(std::string_view s) -> std::vector<std::string_view> {
    auto result = std::vector<std::string_view>{};
    result.reserve(s.size());
    auto i = std::size_t{0};
    while (i < s.size()) {
        auto lead = static_cast<unsigned char>(s[i]);
        auto len = std::size_t{1};
        if ((lead & 0xE0) == 0xC0) {
            len = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4;
        }
        if (i + len > s.size()) len = 1;
        result.push_back(s.substr(i, len));
        i += len;
    }
    return result;
}

/// JSON string escaping without the surrounding quotes.
auto escape_fragment(std::string_view text) -> std::string {
    auto quoted = compact(nlohmann::json(std::string{text}));
    return quoted.substr(1, quoted.size() - 2);
}

/// Emits the code points of one side, wrapping runs not in the common
/// subsequence in `color`.
void append_runs(std::string& out, const std::vector<std::string_view>& chars,
                 const std::vector<bool>& common, std::string_view color) {
    auto i = std::size_t{0};
    while (i < chars.size()) {
        auto run = std::string{};
        const auto in_common = common[i];
        for (; i < chars.size() && common[i] == in_common; ++i) run += chars[i];
        if (in_common) {
            out += escape_fragment(run);
        } else {
            out += color;
            out += escape_fragment(run);
            out += color_reset;
        }
    }
}

void render_string_change(std::string& out, const std::string& before, const std::string& after) {
    const auto old_chars = split_code_points(before);
    const auto new_chars = split_code_points(after);
    const auto pairs = detail::longest_common_subsequence(old_chars, new_chars, std::equal_to<>{});

    auto old_common = std::vector<bool>(old_chars.size(), false);
    auto new_common = std::vector<bool>(new_chars.size(), false);
    for (const auto& [i, j] : pairs) {
        old_common[i] = true;
        new_common[j] = true;
    }

    out += "- \"";
    append_runs(out, old_chars, old_common, color_red);
    out += "\"\n+ \"";
    append_runs(out, new_chars, new_common, color_green);
    out += "\"\n";
}

void render_value_line(std::string& out, char marker, const Node& value,
                       bool color, std::string_view code) {
    if (color) out += code;
    out += marker;
    if (!value.is_void()) {
        out += ' ';
        out += to_json_string(value);
    }
    if (color) out += color_reset;
    out += '\n';
}

void render_context_line(std::string& out, const Node& value, char void_marker) {
    if (value.is_void()) {
        out += void_marker;
    } else {
        out += "  ";
        out += to_json_string(value);
    }
    out += '\n';
}

// =============================================================================
// JSON Patch
// =============================================================================

auto patch_op(std::string_view op, std::string path, const Node& value) -> nlohmann::json {
    if (value.is_void()) {
        throw Exception{ErrorKind::render_error,
                        "cannot render void value as JSON Patch at " + path};
    }
    return nlohmann::json{{"op", std::string{op}}, {"path", std::move(path)}, {"value", nlohmann::json(value)}};
}

auto parent_of(const Path& path) -> Path {
    return Path(path.begin(), path.end() - 1);
}

}  // anonymous namespace

auto render_native(const Diff& d, const RenderOptions& options) -> std::string {
    const auto merge_flags = effective_merge(d);
    auto out = std::string{};
    auto merge = false;
    for (std::size_t i = 0; i < d.size(); ++i) {
        const auto& element = d[i];
        if (merge_flags[i] != merge) {
            merge = merge_flags[i];
            out += merge ? "^ {\"Merge\":true}\n" : "^ {\"Merge\":false}\n";
        }
        out += "@ ";
        out += compact(path_to_json(element.path));
        out += '\n';

        for (const auto& context : element.before) render_context_line(out, context, '[');

        const auto string_change = options.color && element.remove.size() == 1 &&
                                   element.add.size() == 1 && element.remove.front().is_string() &&
                                   element.add.front().is_string();
        if (string_change) {
            render_string_change(out, element.remove.front().as_string(), element.add.front().as_string());
        } else {
            for (const auto& value : element.remove) {
                render_value_line(out, '-', value, options.color, color_red);
            }
            for (const auto& value : element.add) {
                render_value_line(out, '+', value, options.color, color_green);
            }
        }

        for (const auto& context : element.after) render_context_line(out, context, ']');
    }
    return out;
}

auto render_patch(const Diff& d) -> std::string {
    const auto merge_flags = effective_merge(d);
    auto ops = nlohmann::json::array();
    for (std::size_t i = 0; i < d.size(); ++i) {
        const auto& element = d[i];
        if (merge_flags[i]) {
            throw Exception{ErrorKind::render_error,
                            "cannot render merge diff element at " + to_string(element.path) +
                                " as JSON Patch"};
        }
        if (element.before.size() > 1) {
            throw Exception{ErrorKind::render_error,
                            "only one line of before context supported. got " +
                                std::to_string(element.before.size())};
        }
        if (element.after.size() > 1) {
            throw Exception{ErrorKind::render_error,
                            "only one line of after context supported. got " +
                                std::to_string(element.after.size())};
        }
        if (element.remove.empty() && element.add.empty()) {
            throw Exception{ErrorKind::render_error,
                            "cannot render empty diff element at " + to_string(element.path) +
                                " as JSON Patch"};
        }

        const auto pointer = to_json_pointer(element.path);
        const auto* idx = element.path.empty() ? nullptr : std::get_if<std::int64_t>(&element.path.back());
        const auto positional = idx != nullptr && *idx >= 0;
        const auto has_before = !element.before.empty() && !element.before.front().is_void();
        const auto has_after = !element.after.empty() && !element.after.front().is_void();

        if ((has_before || has_after) && !positional) {
            throw Exception{ErrorKind::render_error,
                            "context requires a list index at " + to_string(element.path)};
        }
        if (has_before) {
            if (*idx == 0) {
                throw Exception{ErrorKind::render_error,
                                "invalid diff. before context " + to_json_string(element.before.front()) +
                                    " out of bounds: -1"};
            }
            ops.push_back(patch_op("test", to_json_pointer(append(parent_of(element.path), index(*idx - 1))),
                                   element.before.front()));
        }
        if (has_after) {
            const auto at = *idx + static_cast<std::int64_t>(element.remove.size());
            ops.push_back(patch_op("test", to_json_pointer(append(parent_of(element.path), index(at))),
                                   element.after.front()));
        }

        for (const auto& value : element.remove) {
            ops.push_back(patch_op("test", pointer, value));
            ops.push_back(patch_op("remove", pointer, value));
        }
        for (std::size_t k = 0; k < element.add.size(); ++k) {
            auto add_pointer = positional
                ? to_json_pointer(append(parent_of(element.path), index(*idx + static_cast<std::int64_t>(k))))
                : pointer;
            ops.push_back(patch_op("add", std::move(add_pointer), element.add[k]));
        }
    }
    return compact(ops);
}

auto render_merge(const Diff& d) -> std::string {
    const auto merge_flags = effective_merge(d);
    auto coerced = Diff{};
    coerced.reserve(d.size());
    for (std::size_t i = 0; i < d.size(); ++i) {
        if (!merge_flags[i]) {
            throw Exception{ErrorKind::render_error, "cannot render non-merge element as merge"};
        }
        if (!d[i].remove.empty()) {
            throw Exception{ErrorKind::render_error,
                            "cannot render merge element with old values at " + to_string(d[i].path)};
        }
        for (const auto& segment : d[i].path) {
            if (std::holds_alternative<std::int64_t>(segment)) {
                throw Exception{ErrorKind::render_error,
                                "cannot render list index in merge element at " + to_string(d[i].path)};
            }
        }
        auto element = d[i];
        element.metadata = DiffMetadata{true};
        // Deletion is spelled as an explicit null in a merge patch.
        if (element.add.empty() || element.add.front().is_void()) element.add = {Node{Null{}}};
        coerced.push_back(std::move(element));
    }
    auto result = apply_patch(Node{}, coerced);
    if (result.is_void()) return "{}";
    return to_json_string(result);
}

auto render_raw(const Diff& d) -> std::string {
    auto j = nlohmann::ordered_json::array();
    for (const auto& element : d) j.push_back(detail::element_to_raw(element));
    return compact(j);
}

}  // namespace jd_cpp
