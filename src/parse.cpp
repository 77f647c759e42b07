#include <jd-cpp/parse.hpp>

#include <jd-cpp/error.hpp>
#include <jd-cpp/json.hpp>

#include "raw_codec.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jd_cpp {

namespace {

template <typename Json = nlohmann::json>
auto parse_text(std::string_view text, std::string_view what) -> Json {
    try {
        return Json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw Exception{ErrorKind::parse_error,
                        "invalid " + std::string{what} + ": " + e.what()};
    }
}

// =============================================================================
// Native format
// =============================================================================

enum class Section : std::uint8_t { before, changes, after };

class NativeReader {
public:
    auto read(std::string_view text) -> Diff {
        auto pos = std::size_t{0};
        while (pos < text.size()) {
            auto end = text.find('\n', pos);
            if (end == std::string_view::npos) end = text.size();
            ++line_no_;
            read_line(text.substr(pos, end - pos));
            pos = end + 1;
        }
        flush();
        return std::move(diff_);
    }

private:
    [[noreturn]] void fail(const std::string& message) const {
        throw Exception{ErrorKind::parse_error, "line " + std::to_string(line_no_) + ": " + message};
    }

    auto parse_node(std::string_view json) const -> Node {
        try {
            return nlohmann::json::parse(json).get<Node>();
        } catch (const nlohmann::json::parse_error& e) {
            fail(std::string{"invalid JSON value: "} + e.what());
        }
    }

    void flush() {
        if (!current_) return;
        if (current_->remove.empty() && current_->add.empty()) {
            fail("hunk at " + to_string(current_->path) + " has no changes");
        }
        diff_.push_back(std::move(*current_));
        current_.reset();
    }

    auto hunk() -> DiffElement& {
        if (!current_) fail("expected a path line starting with '@'");
        return *current_;
    }

    void read_line(std::string_view line) {
        if (line.empty()) return;
        if (line.find('\x1b') != std::string_view::npos) fail("colorized diffs cannot be read");

        switch (line.front()) {
            case '^': read_metadata(line); return;
            case '@': read_path(line); return;
            case '[':
                if (line.size() != 1) break;
                if (hunk().remove.size() + hunk().add.size() > 0 || section_ != Section::before) {
                    fail("'[' must come before any change");
                }
                hunk().before.push_back(Node{});
                return;
            case ']':
                if (line.size() != 1) break;
                hunk().after.push_back(Node{});
                section_ = Section::after;
                return;
            case ' ':
                if (line.size() < 3 || line[1] != ' ') break;
                if (section_ == Section::before) {
                    hunk().before.push_back(parse_node(line.substr(2)));
                } else {
                    section_ = Section::after;
                    hunk().after.push_back(parse_node(line.substr(2)));
                }
                return;
            case '-':
            case '+': {
                auto& target = line.front() == '-' ? hunk().remove : hunk().add;
                if (section_ == Section::after) fail("change after trailing context");
                section_ = Section::changes;
                if (line.size() == 1) {
                    target.push_back(Node{});
                    return;
                }
                if (line.size() < 3 || line[1] != ' ') break;
                target.push_back(parse_node(line.substr(2)));
                return;
            }
            default:
                break;
        }
        fail("unexpected line: " + std::string{line});
    }

    void read_metadata(std::string_view line) {
        if (line.size() < 3 || line[1] != ' ') fail("malformed metadata line");
        flush();
        auto j = nlohmann::json{};
        try {
            j = nlohmann::json::parse(line.substr(2));
        } catch (const nlohmann::json::parse_error& e) {
            fail(std::string{"invalid metadata: "} + e.what());
        }
        if (!j.is_object()) fail("metadata must be a JSON object");
        if (auto it = j.find("Merge"); it != j.end()) {
            if (!it->is_boolean()) fail("metadata Merge must be a boolean");
            merge_ = it->get<bool>();
        }
        seen_metadata_ = true;
    }

    void read_path(std::string_view line) {
        if (line.size() < 3 || line[1] != ' ') fail("malformed path line");
        flush();
        auto j = nlohmann::json{};
        try {
            j = nlohmann::json::parse(line.substr(2));
        } catch (const nlohmann::json::parse_error& e) {
            fail(std::string{"invalid path: "} + e.what());
        }
        current_ = DiffElement{};
        if (seen_metadata_) current_->metadata = DiffMetadata{merge_};
        current_->path = path_from_json(j);
        section_ = Section::before;
    }

    Diff diff_;
    std::optional<DiffElement> current_;
    Section section_{Section::before};
    bool merge_{false};
    bool seen_metadata_{false};
    std::size_t line_no_{0};
};

// =============================================================================
// JSON Patch
// =============================================================================

struct PatchOp {
    std::string op;
    std::string pointer;
    Path path;
    Node value;
};

auto read_ops(const nlohmann::json& j) -> std::vector<PatchOp> {
    if (!j.is_array()) throw Exception{ErrorKind::parse_error, "JSON Patch must be an array"};
    auto ops = std::vector<PatchOp>{};
    ops.reserve(j.size());
    for (const auto& item : j) {
        if (!item.is_object()) {
            throw Exception{ErrorKind::parse_error, "JSON Patch operation must be an object: " + item.dump()};
        }
        auto op_it = item.find("op");
        auto path_it = item.find("path");
        if (op_it == item.end() || !op_it->is_string() || path_it == item.end() || !path_it->is_string()) {
            throw Exception{ErrorKind::parse_error, "JSON Patch operation needs string op and path: " + item.dump()};
        }
        auto op = PatchOp{};
        op.op = op_it->get<std::string>();
        if (op.op == "move" || op.op == "copy" || op.op == "replace") {
            throw Exception{ErrorKind::parse_error, "unsupported JSON Patch operation: " + op.op};
        }
        if (op.op != "test" && op.op != "remove" && op.op != "add") {
            throw Exception{ErrorKind::parse_error, "unknown JSON Patch operation: " + op.op};
        }
        auto value_it = item.find("value");
        if (value_it == item.end()) {
            throw Exception{ErrorKind::parse_error, op.op + " operation at " + path_it->get<std::string>() +
                                                        " is missing a value"};
        }
        op.pointer = path_it->get<std::string>();
        op.path = parse_json_pointer(op.pointer);
        op.value = value_it->get<Node>();
        ops.push_back(std::move(op));
    }
    return ops;
}

auto list_index(const Path& path) -> const std::int64_t* {
    return path.empty() ? nullptr : std::get_if<std::int64_t>(&path.back());
}

/// True if an add at `path` extends the adds already collected in `element`.
auto add_continues(const DiffElement& element, const Path& path) -> bool {
    if (element.add.empty()) return path == element.path;
    const auto* idx = list_index(element.path);
    if (idx == nullptr) return false;
    if (*idx == -1) return path == element.path;
    auto expected = element.path;
    expected.back() = index(*idx + static_cast<std::int64_t>(element.add.size()));
    return path == expected;
}

void attach_context(DiffElement& element, const PatchOp& test) {
    const auto* idx = list_index(element.path);
    const auto* at = list_index(test.path);
    const auto same_parent = idx != nullptr && at != nullptr && *idx >= 0 &&
        std::equal(element.path.begin(), element.path.end() - 1, test.path.begin(), test.path.end() - 1);
    if (same_parent) {
        if (*at == *idx - 1 && element.before.empty()) {
            element.before.push_back(test.value);
            return;
        }
        if (*at == *idx + static_cast<std::int64_t>(element.remove.size()) && element.after.empty()) {
            element.after.push_back(test.value);
            return;
        }
    }
    throw Exception{ErrorKind::parse_error,
                    "test at " + test.pointer + " is not context for the change at " +
                        to_string(element.path)};
}

// =============================================================================
// Merge Patch
// =============================================================================

void merge_hunks(const nlohmann::json& j, const Path& path, Diff& out) {
    for (const auto& [k, v] : j.items()) {
        auto child = append(path, key(k));
        if (v.is_object() && !v.empty()) {
            merge_hunks(v, child, out);
            continue;
        }
        auto element = DiffElement{};
        element.metadata = DiffMetadata{true};
        element.path = std::move(child);
        element.add.push_back(v.is_null() ? Node{} : v.get<Node>());
        out.push_back(std::move(element));
    }
}

}  // anonymous namespace

auto read_diff(std::string_view text) -> Diff {
    return NativeReader{}.read(text);
}

auto read_patch(std::string_view text) -> Diff {
    const auto ops = read_ops(parse_text(text, "JSON Patch"));
    const auto guards_remove = [&](std::size_t k) {
        return k + 1 < ops.size() && ops[k].op == "test" && ops[k + 1].op == "remove" &&
               ops[k].pointer == ops[k + 1].pointer && ops[k].value == ops[k + 1].value;
    };

    auto d = Diff{};
    auto i = std::size_t{0};
    while (i < ops.size()) {
        auto contexts = std::vector<const PatchOp*>{};
        while (i < ops.size() && ops[i].op == "test" && !guards_remove(i)) contexts.push_back(&ops[i++]);

        auto element = DiffElement{};
        auto have_path = false;
        while (i < ops.size() && guards_remove(i) && (!have_path || ops[i].path == element.path)) {
            if (!have_path) {
                element.path = ops[i].path;
                have_path = true;
            }
            element.remove.push_back(ops[i].value);
            i += 2;
        }
        while (i < ops.size() && ops[i].op == "add") {
            if (!have_path) {
                element.path = ops[i].path;
                have_path = true;
            } else if (!add_continues(element, ops[i].path)) {
                break;
            }
            element.add.push_back(ops[i].value);
            ++i;
        }

        if (!have_path) {
            if (i < ops.size() && ops[i].op == "remove") {
                throw Exception{ErrorKind::parse_error,
                                "remove at " + ops[i].pointer + " must be preceded by a test of the same value"};
            }
            throw Exception{ErrorKind::parse_error,
                            "test at " + contexts.front()->pointer + " does not guard any change"};
        }
        for (const auto* test : contexts) attach_context(element, *test);
        d.push_back(std::move(element));
    }
    return d;
}

auto read_merge(std::string_view text) -> Diff {
    const auto j = parse_text(text, "merge patch");
    auto d = Diff{};
    if (j.is_object()) {
        merge_hunks(j, Path{}, d);
        return d;
    }
    // A non-object merge patch replaces the whole document.
    auto element = DiffElement{};
    element.metadata = DiffMetadata{true};
    element.add.push_back(j.get<Node>());
    d.push_back(std::move(element));
    return d;
}

auto read_raw(std::string_view text) -> Diff {
    const auto j = parse_text<nlohmann::ordered_json>(text, "raw diff");
    if (!j.is_array()) throw Exception{ErrorKind::parse_error, "raw diff must be a JSON array"};
    auto d = Diff{};
    d.reserve(j.size());
    for (const auto& element : j) d.push_back(detail::element_from_raw(element));
    return d;
}

}  // namespace jd_cpp
