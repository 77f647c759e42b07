#include <jd-cpp/patch.hpp>

#include <jd-cpp/error.hpp>
#include <jd-cpp/json.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace jd_cpp {

namespace {

enum class Strategy : std::uint8_t { strict, merge };

/// The values of one hunk, shared by every level of the descent.
struct Hunk {
    const std::vector<Node>& before;
    const std::vector<Node>& remove;
    const std::vector<Node>& add;
    const std::vector<Node>& after;
    Strategy strategy;
};

using PathView = std::span<const PathSegment>;

// -- Errors -------------------------------------------------------------------

auto segment_string(const PathSegment& segment) -> std::string {
    return std::visit(overload{
        [](const std::string& k) { return k; },
        [](std::int64_t i) { return std::to_string(i); },
    }, segment);
}

[[noreturn]] void fail(ErrorKind kind, std::string message) {
    throw Exception{kind, std::move(message)};
}

[[noreturn]] void expected_collection(const Node& node, const PathSegment& segment) {
    auto expected = std::holds_alternative<std::string>(segment) ? "JSON object" : "JSON array";
    fail(ErrorKind::context_mismatch,
         "found " + to_json_string(node) + " at " + segment_string(segment) + ": expected " + expected);
}

[[noreturn]] void expected_value(const Node& expected, const Node& found, const Path& path) {
    fail(ErrorKind::context_mismatch,
         "found " + to_json_string(found) + " at " + to_string(path) + ": expected " +
             to_json_string(expected));
}

void check_single_values(const Hunk& h, const Path& path) {
    if (h.remove.size() > 1) {
        fail(ErrorKind::invalid_diff, "invalid diff: multiple removals from non-set at " + to_string(path));
    }
    if (h.add.size() > 1) {
        fail(ErrorKind::invalid_diff, "invalid diff: multiple additions to a non-set at " + to_string(path));
    }
}

auto single_value(const std::vector<Node>& values) -> Node {
    return values.empty() ? Node{} : values.front();
}

// -- Descent ------------------------------------------------------------------

auto patch_element(const Node& node, const Path& behind, PathView ahead, const Hunk& h) -> Node;

auto patch_scalar(const Node& node, const Path& behind, PathView ahead, const Hunk& h) -> Node {
    if (!ahead.empty()) expected_collection(node, ahead.front());
    check_single_values(h, behind);
    auto old_value = single_value(h.remove);
    if (h.strategy == Strategy::merge) {
        if (!old_value.is_void()) {
            fail(ErrorKind::strategy_error,
                 "patch with merge strategy at " + to_string(behind) + " has unnecessary old value " +
                     to_json_string(old_value));
        }
    } else if (node != old_value) {
        expected_value(old_value, node, behind);
    }
    return single_value(h.add);
}

auto patch_object(const Object& fields, const Path& behind, PathView ahead, const Hunk& h) -> Node {
    if (ahead.empty()) {
        check_single_values(h, behind);
        if (h.strategy == Strategy::merge) return single_value(h.add);
        auto old_value = single_value(h.remove);
        auto current = Node{fields};
        if (current != old_value) expected_value(old_value, current, behind);
        return single_value(h.add);
    }

    const auto* k = std::get_if<std::string>(&ahead.front());
    if (k == nullptr) {
        fail(ErrorKind::context_mismatch,
             "found " + to_json_string(Node{fields}) + " at " + to_string(behind) + ": expected JSON array");
    }
    auto rest = ahead.subspan(1);

    auto it = fields.find(*k);
    auto next = it != fields.end() ? it->second : Node{};

    auto patched = patch_element(next, append(behind, key(*k)), rest, h);

    auto result = fields;
    if (patched.is_void()) {
        result.erase(*k);
    } else {
        result.insert_or_assign(*k, std::move(patched));
    }
    return Node{std::move(result)};
}

auto patch_list(const Array& list, const Path& behind, PathView ahead, const Hunk& h) -> Node {
    if (h.strategy == Strategy::merge) return patch_scalar(Node{list}, behind, ahead, h);

    if (ahead.empty()) {
        if (h.remove.size() > 1 || h.add.size() > 1) {
            fail(ErrorKind::invalid_diff, "cannot replace list with multiple values");
        }
        if (h.remove.empty()) {
            fail(ErrorKind::invalid_diff, "invalid diff. must declare list to replace it");
        }
        auto current = Node{list};
        if (current != h.remove.front()) {
            fail(ErrorKind::context_mismatch,
                 "wanted " + to_json_string(h.remove.front()) + ". found " + to_json_string(current));
        }
        return single_value(h.add);
    }

    const auto* raw = std::get_if<std::int64_t>(&ahead.front());
    if (raw == nullptr) {
        fail(ErrorKind::context_mismatch, "invalid path element string: expected float64");
    }
    const auto idx = *raw;
    auto rest = ahead.subspan(1);
    const auto size = static_cast<std::int64_t>(list.size());

    // Path continues below this list: descend into one element.
    if (!rest.empty()) {
        if (idx < 0 || idx >= size) {
            fail(ErrorKind::context_mismatch, "patch index out of bounds: " + std::to_string(idx));
        }
        auto result = list;
        auto pos = static_cast<std::size_t>(idx);
        result[pos] = patch_element(list[pos], append(behind, index(idx)), rest, h);
        return Node{std::move(result)};
    }

    if (idx == -1) {
        if (!h.remove.empty()) {
            fail(ErrorKind::invalid_diff, "invalid patch. appending to -1 index. but want to remove values");
        }
        auto result = list;
        result.insert(result.end(), h.add.begin(), h.add.end());
        return Node{std::move(result)};
    }
    if (idx < 0) {
        fail(ErrorKind::context_mismatch, "patch index out of bounds: " + std::to_string(idx));
    }

    for (std::size_t offset = 0; offset < h.before.size(); ++offset) {
        const auto& context = h.before[offset];
        const auto check = idx - static_cast<std::int64_t>(h.before.size() - offset);
        if (check < 0 || check >= size) {
            if (check == -1 && context.is_void()) continue;
            fail(ErrorKind::context_mismatch,
                 "invalid patch. before context " + to_json_string(context) +
                     " out of bounds: " + std::to_string(check));
        }
        const auto& actual = list[static_cast<std::size_t>(check)];
        if (actual != context) {
            fail(ErrorKind::context_mismatch,
                 "invalid patch. expected " + to_json_string(context) + " before. got " +
                     to_json_string(actual));
        }
    }

    const auto pos = static_cast<std::size_t>(idx);
    auto working = list;
    if (!h.remove.empty()) {
        if (pos >= working.size()) {
            fail(ErrorKind::context_mismatch, "remove values out bounds: " + std::to_string(idx));
        }
        for (const auto& expected : h.remove) {
            if (pos >= working.size() || working[pos] != expected) {
                fail(ErrorKind::context_mismatch,
                     "invalid patch. wanted " + to_json_string(expected) + ". found " +
                         (pos < working.size() ? to_json_string(working[pos]) : std::string{}));
            }
            working.erase(working.begin() + static_cast<std::ptrdiff_t>(pos));
        }
    }
    if (pos > working.size()) {
        fail(ErrorKind::context_mismatch, "remove values out bounds: " + std::to_string(idx));
    }

    for (std::size_t offset = 0; offset < h.after.size(); ++offset) {
        const auto& context = h.after[offset];
        const auto check = pos + offset;
        if (check >= working.size()) {
            if (check == working.size() && context.is_void()) continue;
            fail(ErrorKind::context_mismatch,
                 "invalid patch. after context " + to_json_string(context) +
                     " out of bounds: " + std::to_string(check));
        }
        if (working[check] != context) {
            fail(ErrorKind::context_mismatch,
                 "invalid patch. expected " + to_json_string(context) + " after. got " +
                     to_json_string(working[check]));
        }
    }

    auto result = Array{};
    result.reserve(working.size() + h.add.size());
    result.insert(result.end(), working.begin(), working.begin() + static_cast<std::ptrdiff_t>(pos));
    result.insert(result.end(), h.add.begin(), h.add.end());
    result.insert(result.end(), working.begin() + static_cast<std::ptrdiff_t>(pos), working.end());
    return Node{std::move(result)};
}

/// Merge descent: every segment must be a key, and anything in the way
/// that is not an object is replaced by one.
auto patch_merge_descent(const Node& node, const Path& behind, PathView ahead, const Hunk& h) -> Node {
    const auto* k = std::get_if<std::string>(&ahead.front());
    if (k == nullptr) {
        fail(ErrorKind::strategy_error,
             "found " + to_json_string(node) + " at " + segment_string(ahead.front()) +
                 ": expected JSON object");
    }
    auto rest = ahead.subspan(1);
    auto seed = rest.empty() ? Node{} : Node{Object{}};

    auto result = Object{};
    auto existing = seed;
    if (node.is_object()) {
        result = node.as_object();
        if (auto it = result.find(*k); it != result.end()) {
            existing = it->second;
            result.erase(it);
        }
    }

    auto patched = patch_element(existing, append(behind, key(*k)), rest, h);
    if (!patched.is_void()) result.insert_or_assign(*k, std::move(patched));
    return Node{std::move(result)};
}

auto patch_element(const Node& node, const Path& behind, PathView ahead, const Hunk& h) -> Node {
    if (!ahead.empty() && h.strategy == Strategy::merge) {
        return patch_merge_descent(node, behind, ahead, h);
    }
    if (node.is_array()) return patch_list(node.as_array(), behind, ahead, h);
    if (node.is_object()) return patch_object(node.as_object(), behind, ahead, h);
    return patch_scalar(node, behind, ahead, h);
}

}  // anonymous namespace

auto apply_patch(const Node& base, const Diff& d) -> Node {
    const auto merge_flags = effective_merge(d);
    auto current = base;
    for (std::size_t i = 0; i < d.size(); ++i) {
        const auto& element = d[i];
        auto hunk = Hunk{element.before, element.remove, element.add, element.after,
                         merge_flags[i] ? Strategy::merge : Strategy::strict};
        current = patch_element(current, Path{}, PathView{element.path}, hunk);
    }
    return current;
}

auto reverse(const Diff& d) -> Diff {
    const auto merge_flags = effective_merge(d);
    for (std::size_t i = 0; i < d.size(); ++i) {
        if (merge_flags[i]) {
            throw Exception{ErrorKind::reverse_error,
                            "cannot reverse merge diff element at " + to_string(d[i].path)};
        }
    }
    auto reversed = Diff{};
    reversed.reserve(d.size());
    for (auto it = d.rbegin(); it != d.rend(); ++it) {
        auto element = *it;
        std::swap(element.remove, element.add);
        reversed.push_back(std::move(element));
    }
    return reversed;
}

}  // namespace jd_cpp
