#include <jd-cpp/json.hpp>

#include <jd-cpp/error.hpp>

#include "number_json.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace jd_cpp {

namespace {

auto is_blank(std::string_view text) -> bool {
    return std::all_of(text.begin(), text.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

}  // anonymous namespace

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, const Node& node) {
    std::visit(overload{
        [&](const Void&) {
            throw Exception{ErrorKind::invalid_document, "void cannot be represented as JSON"};
        },
        [&](const Null&) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](double d) { j = detail::number_json<nlohmann::json>(d); },
        [&](const std::string& s) { j = s; },
        [&](const Array& items) {
            j = nlohmann::json::array();
            for (const auto& item : items) j.push_back(nlohmann::json(item));
        },
        [&](const Object& fields) {
            j = nlohmann::json::object();
            for (const auto& [k, v] : fields) j[k] = nlohmann::json(v);
        },
    }, node.value());
}

void from_json(const nlohmann::json& j, Node& node) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            node = Node{Null{}};
            return;
        case nlohmann::json::value_t::boolean:
            node = Node{j.get<bool>()};
            return;
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            node = Node{j.get<double>()};
            return;
        case nlohmann::json::value_t::string:
            node = Node{j.get<std::string>()};
            return;
        case nlohmann::json::value_t::array: {
            auto items = Array{};
            items.reserve(j.size());
            for (const auto& item : j) items.push_back(item.get<Node>());
            node = Node{std::move(items)};
            return;
        }
        case nlohmann::json::value_t::object: {
            auto fields = Object{};
            for (const auto& [k, v] : j.items()) fields.emplace(k, v.get<Node>());
            node = Node{std::move(fields)};
            return;
        }
        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:
            break;
    }
    throw Exception{ErrorKind::invalid_document, "unsupported JSON value: " + std::string{j.type_name()}};
}

// =============================================================================
// Text
// =============================================================================

auto read_json(std::string_view text) -> Node {
    if (is_blank(text)) return Node{};
    auto j = nlohmann::json{};
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw Exception{ErrorKind::invalid_document, e.what()};
    }
    return j.get<Node>();
}

auto to_json_string(const Node& node) -> std::string {
    if (node.is_void()) return {};
    return nlohmann::json(node).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// =============================================================================
// Paths
// =============================================================================

auto path_to_json(const Path& path) -> nlohmann::json {
    auto j = nlohmann::json::array();
    for (const auto& segment : path) {
        std::visit([&](const auto& v) { j.push_back(nlohmann::json(v)); }, segment);
    }
    return j;
}

auto path_from_json(const nlohmann::json& j) -> Path {
    constexpr auto max_index = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    const auto out_of_range = [](const nlohmann::json& segment) {
        throw Exception{ErrorKind::parse_error, "path element " + segment.dump() + " is out of range"};
    };
    if (!j.is_array()) {
        throw Exception{ErrorKind::parse_error, "path must be a JSON array. got " + j.dump()};
    }
    auto path = Path{};
    path.reserve(j.size());
    for (const auto& segment : j) {
        if (segment.is_string()) {
            path.push_back(key(segment.get<std::string>()));
        } else if (segment.is_number_unsigned()) {
            if (segment.get<std::uint64_t>() > max_index) out_of_range(segment);
            path.push_back(index(static_cast<std::int64_t>(segment.get<std::uint64_t>())));
        } else if (segment.is_number_integer()) {
            path.push_back(index(segment.get<std::int64_t>()));
        } else if (segment.is_number_float() && std::trunc(segment.get<double>()) == segment.get<double>()) {
            // 2^63 is exact as a double; anything at or beyond it has no int64 value.
            const auto d = segment.get<double>();
            if (d < -0x1p63 || d >= 0x1p63) out_of_range(segment);
            path.push_back(index(static_cast<std::int64_t>(d)));
        } else {
            throw Exception{ErrorKind::parse_error,
                            "invalid path element " + segment.dump() + ": expected string or integer"};
        }
    }
    return path;
}

}  // namespace jd_cpp
