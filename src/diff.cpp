#include <jd-cpp/diff.hpp>

#include "lcs.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace jd_cpp {

namespace {

// Metadata is threaded explicitly through the recursion so nested hunks
// carry the same flags as the level that produced them.
struct DiffContext {
    const DiffOptions& options;
    std::optional<DiffMetadata> metadata;
};

struct HashedNode {
    std::uint64_t hash;
    const Node* node;
};

void diff_impl(const Node& lhs, const Node& rhs, const Path& path,
               const DiffContext& ctx, Diff& out);

auto make_element(const DiffContext& ctx, Path path) -> DiffElement {
    auto element = DiffElement{};
    element.metadata = ctx.metadata;
    element.path = std::move(path);
    return element;
}

// -- Primitives ---------------------------------------------------------------

void diff_replace(const Node& lhs, const Node& rhs, const Path& path,
                  const DiffContext& ctx, Diff& out) {
    auto element = make_element(ctx, path);
    if (ctx.options.merge) {
        // Merge hunks carry no prior value; a Void add deletes.
        element.add.push_back(rhs);
    } else {
        if (!lhs.is_void()) element.remove.push_back(lhs);
        if (!rhs.is_void()) element.add.push_back(rhs);
    }
    out.push_back(std::move(element));
}

// -- Objects ------------------------------------------------------------------

void diff_objects(const Object& lhs, const Object& rhs, const Path& path,
                  const DiffContext& ctx, Diff& out) {
    auto li = lhs.begin();
    auto ri = rhs.begin();
    while (li != lhs.end() || ri != rhs.end()) {
        if (ri == rhs.end() || (li != lhs.end() && li->first < ri->first)) {
            auto element = make_element(ctx, append(path, key(li->first)));
            if (ctx.options.merge) {
                element.add.push_back(Node{});
            } else {
                element.remove.push_back(li->second);
            }
            out.push_back(std::move(element));
            ++li;
        } else if (li == lhs.end() || ri->first < li->first) {
            auto element = make_element(ctx, append(path, key(ri->first)));
            element.add.push_back(ri->second);
            out.push_back(std::move(element));
            ++ri;
        } else {
            diff_impl(li->second, ri->second, append(path, key(li->first)), ctx, out);
            ++li;
            ++ri;
        }
    }
}

// -- Lists --------------------------------------------------------------------

auto hash_all(const Array& items) -> std::vector<HashedNode> {
    auto result = std::vector<HashedNode>{};
    result.reserve(items.size());
    for (const auto& item : items) result.push_back({hash_code(item), &item});
    return result;
}

auto same_container_type(const Node& lhs, const Node& rhs) -> bool {
    return (lhs.is_object() && rhs.is_object()) || (lhs.is_array() && rhs.is_array());
}

auto has_changes(const Diff& round) -> bool {
    return !round.empty() && (!round.front().add.empty() || !round.front().remove.empty());
}

/// Walks both lists in rounds. Each round opens one pending hunk at the
/// current output position, accumulates removals and additions until the
/// next common element (or a nested container diff), then flushes.
void diff_lists(const Array& lhs, const Array& rhs, const Path& path,
                const DiffContext& ctx, Diff& out) {
    const auto lhs_hashes = hash_all(lhs);
    const auto rhs_hashes = hash_all(rhs);
    const auto pairs = detail::longest_common_subsequence(
        lhs_hashes, rhs_hashes, [&](const HashedNode& a, const HashedNode& b) {
            return a.hash == b.hash && equals(*a.node, *b.node, ctx.options);
        });

    auto common = std::vector<std::uint64_t>{};
    common.reserve(pairs.size());
    for (const auto& [i, j] : pairs) common.push_back(lhs_hashes[i].hash);

    const auto n = lhs.size();
    const auto m = rhs.size();
    const auto list_depth = path.size() + 1;

    auto a = std::size_t{0};
    auto b = std::size_t{0};
    auto c = std::size_t{0};
    auto cursor = std::int64_t{0};
    auto previous = Node{};

    auto at_common = [&](const std::vector<HashedNode>& hashes, std::size_t i) {
        return i < hashes.size() && c < common.size() && hashes[i].hash == common[c];
    };

    while (true) {
        const auto c_start = c;
        auto after_context = [&]() -> std::vector<Node> {
            const auto idx = a - (c - c_start);
            if (idx >= n) return {Node{}};
            return {lhs[idx]};
        };

        auto round = Diff{};
        round.push_back(make_element(ctx, append(path, index(cursor))));
        round.front().before.push_back(previous);

        while (true) {
            if (a == n) {
                for (; b < m; ++b) {
                    round.front().add.push_back(rhs[b]);
                    cursor += 2;
                }
                break;
            }
            if (b == m) {
                for (; a < n; ++a) round.front().remove.push_back(lhs[a]);
                break;
            }
            const auto lhs_common = at_common(lhs_hashes, a);
            const auto rhs_common = at_common(rhs_hashes, b);
            if (lhs_common && rhs_common) {
                ++a;
                ++b;
                ++c;
                ++cursor;
                break;
            }
            if (lhs_common) {
                while (b < m && !at_common(rhs_hashes, b)) {
                    round.front().add.push_back(rhs[b]);
                    ++b;
                    ++cursor;
                }
                continue;
            }
            if (rhs_common) {
                while (a < n && !at_common(lhs_hashes, a)) {
                    round.front().remove.push_back(lhs[a]);
                    ++a;
                }
                continue;
            }
            if (same_container_type(lhs[a], rhs[b])) {
                auto sub = Diff{};
                diff_impl(lhs[a], rhs[b], append(path, index(cursor)), ctx, sub);
                if (has_changes(round)) {
                    round.front().after = after_context();
                    for (auto& e : sub) round.push_back(std::move(e));
                } else {
                    round = std::move(sub);
                }
                ++a;
                ++b;
                ++cursor;
                break;
            }
            round.front().remove.push_back(lhs[a]);
            round.front().add.push_back(rhs[b]);
            ++a;
            ++b;
            ++cursor;
        }

        if (!has_changes(round)) {
            round.clear();
        } else if (round.size() < 2 && round.front().path.size() <= list_depth) {
            round.front().after = after_context();
        }
        for (auto& e : round) out.push_back(std::move(e));

        if (a == n && b == m) break;
        previous = b == 0 ? Node{} : rhs[b - 1];
    }
}

// -- Dispatch -----------------------------------------------------------------

void diff_impl(const Node& lhs, const Node& rhs, const Path& path,
               const DiffContext& ctx, Diff& out) {
    if (equals(lhs, rhs, ctx.options)) return;

    if (lhs.is_object() && rhs.is_object()) {
        diff_objects(lhs.as_object(), rhs.as_object(), path, ctx, out);
    } else if (lhs.is_array() && rhs.is_array() && !ctx.options.merge) {
        // RFC 7386 replaces arrays wholesale, so merge mode skips this.
        diff_lists(lhs.as_array(), rhs.as_array(), path, ctx, out);
    } else {
        diff_replace(lhs, rhs, path, ctx, out);
    }
}

}  // anonymous namespace

auto diff(const Node& lhs, const Node& rhs, const DiffOptions& options) -> Diff {
    auto ctx = DiffContext{options, std::nullopt};
    if (options.merge) ctx.metadata = DiffMetadata{true};
    auto out = Diff{};
    diff_impl(lhs, rhs, Path{}, ctx, out);
    return out;
}

auto effective_merge(const Diff& d) -> std::vector<bool> {
    auto flags = std::vector<bool>{};
    flags.reserve(d.size());
    auto merge = false;
    for (const auto& element : d) {
        if (element.metadata) merge = element.metadata->merge;
        flags.push_back(merge);
    }
    return flags;
}

}  // namespace jd_cpp
