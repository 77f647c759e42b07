#include <jd-cpp/path.hpp>

#include <jd-cpp/error.hpp>
#include <jd-cpp/node.hpp>

#include <algorithm>
#include <charconv>
#include <optional>
#include <string>
#include <utility>

namespace jd_cpp {

namespace {

/// Try to parse a pointer token as a list index.
auto try_parse_index(std::string_view token) -> std::optional<std::int64_t> {
    if (token.empty()) return std::nullopt;
    // Leading zeros are not allowed per RFC 6901 (except "0" itself)
    if (token.size() > 1 && token[0] == '0') return std::nullopt;
    auto result = std::int64_t{0};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), result);
    if (ec == std::errc{} && ptr == token.data() + token.size() && result >= 0) return result;
    return std::nullopt;
}

/// True for an optionally signed run of decimal digits.
auto looks_like_number(std::string_view token) -> bool {
    if (!token.empty() && token[0] == '-') token.remove_prefix(1);
    if (token.empty()) return false;
    return std::all_of(token.begin(), token.end(), [](char c) { return c >= '0' && c <= '9'; });
}

auto escape_token(std::string_view token) -> std::string {
    auto out = std::string{};
    out.reserve(token.size());
    for (auto c : token) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
    return out;
}

auto unescape_token(std::string_view token) -> std::string {
    auto out = std::string{};
    out.reserve(token.size());
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (token[i] == '~' && i + 1 < token.size()) {
            if (token[i + 1] == '0') { out += '~'; ++i; continue; }
            if (token[i + 1] == '1') { out += '/'; ++i; continue; }
        }
        out += token[i];
    }
    return out;
}

}  // anonymous namespace

auto append(const Path& path, PathSegment segment) -> Path {
    auto result = Path{};
    result.reserve(path.size() + 1);
    result.insert(result.end(), path.begin(), path.end());
    result.push_back(std::move(segment));
    return result;
}

auto to_string(const Path& path) -> std::string {
    auto out = std::string{"["};
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += ' ';
        std::visit(overload{
            [&](const std::string& k) { out += k; },
            [&](std::int64_t idx) { out += std::to_string(idx); },
        }, path[i]);
    }
    out += ']';
    return out;
}

auto to_json_pointer(const Path& path) -> std::string {
    auto out = std::string{};
    for (const auto& segment : path) {
        out += '/';
        std::visit(overload{
            [&](const std::string& k) {
                auto escaped = escape_token(k);
                if (looks_like_number(escaped)) {
                    throw Exception{ErrorKind::render_error,
                                    "JSON Pointer does not support object keys that look like numbers: " +
                                        escaped};
                }
                out += escaped;
            },
            [&](std::int64_t idx) {
                if (idx == -1) {
                    out += '-';
                } else {
                    out += std::to_string(idx);
                }
            },
        }, segment);
    }
    return out;
}

auto parse_json_pointer(std::string_view pointer) -> Path {
    if (pointer.empty()) return {};
    if (pointer[0] != '/') {
        throw Exception{ErrorKind::parse_error,
                        "JSON Pointer must start with '/' or be empty: " + std::string{pointer}};
    }
    auto path = Path{};
    auto pos = std::size_t{1};
    while (pos <= pointer.size()) {
        auto next = pointer.find('/', pos);
        auto token = pointer.substr(pos, next == std::string_view::npos ? next : next - pos);
        if (token == "-") {
            path.push_back(index(-1));
        } else if (auto idx = try_parse_index(token)) {
            path.push_back(index(*idx));
        } else if (looks_like_number(token)) {
            throw Exception{ErrorKind::parse_error,
                            "JSON Pointer token is neither an index nor a key: " + std::string{token}};
        } else {
            path.push_back(key(unescape_token(token)));
        }
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return path;
}

}  // namespace jd_cpp
