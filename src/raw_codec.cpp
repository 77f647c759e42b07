#include "raw_codec.hpp"

#include "number_json.hpp"

#include <jd-cpp/error.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace jd_cpp::detail {

namespace {

using ojson = nlohmann::ordered_json;

[[noreturn]] void malformed(const std::string& what, const ojson& j) {
    throw Exception{ErrorKind::parse_error,
                    "invalid raw " + what + ": " +
                        j.dump(-1, ' ', false, ojson::error_handler_t::replace)};
}

auto nodes_to_raw(const std::vector<Node>& nodes) -> ojson {
    auto j = ojson::array();
    for (const auto& node : nodes) j.push_back(node_to_raw(node));
    return j;
}

auto nodes_from_raw(const ojson& j) -> std::vector<Node> {
    if (!j.is_array()) malformed("node list", j);
    auto nodes = std::vector<Node>{};
    nodes.reserve(j.size());
    for (const auto& item : j) nodes.push_back(node_from_raw(item));
    return nodes;
}

auto path_to_raw(const Path& path) -> ojson {
    auto j = ojson::array();
    for (const auto& segment : path) {
        std::visit([&](const auto& v) { j.push_back(ojson(v)); }, segment);
    }
    return j;
}

auto path_from_raw(const ojson& j) -> Path {
    if (!j.is_array()) malformed("path", j);
    auto path = Path{};
    for (const auto& segment : j) {
        if (segment.is_string()) {
            path.push_back(key(segment.get<std::string>()));
        } else if (segment.is_number_unsigned()) {
            if (segment.get<std::uint64_t>() >
                static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                malformed("path element", segment);
            }
            path.push_back(index(static_cast<std::int64_t>(segment.get<std::uint64_t>())));
        } else if (segment.is_number_integer()) {
            path.push_back(index(segment.get<std::int64_t>()));
        } else {
            malformed("path element", segment);
        }
    }
    return path;
}

}  // anonymous namespace

auto node_to_raw(const Node& node) -> ojson {
    auto j = ojson::object();
    std::visit(overload{
        [&](const Void&) { j["type"] = "Void"; },
        [&](const Null&) { j["type"] = "Null"; },
        [&](bool b) {
            j["type"] = "Bool";
            j["value"] = b;
        },
        [&](double d) {
            j["type"] = "Number";
            j["value"] = number_json<ojson>(d);
        },
        [&](const std::string& s) {
            j["type"] = "String";
            j["value"] = s;
        },
        [&](const Array& items) {
            j["type"] = "Array";
            j["value"] = nodes_to_raw(items);
        },
        [&](const Object& fields) {
            j["type"] = "Object";
            auto value = ojson::object();
            for (const auto& [k, v] : fields) value[k] = node_to_raw(v);
            j["value"] = std::move(value);
        },
    }, node.value());
    return j;
}

auto node_from_raw(const ojson& j) -> Node {
    if (!j.is_object() || !j.contains("type") || !j.at("type").is_string()) malformed("node", j);
    const auto type = j.at("type").get<std::string>();
    if (type == "Void") return Node{};
    if (type == "Null") return Node{Null{}};

    if (!j.contains("value")) malformed("node", j);
    const auto& value = j.at("value");
    if (type == "Bool" && value.is_boolean()) return Node{value.get<bool>()};
    if (type == "Number" && value.is_number()) return Node{value.get<double>()};
    if (type == "String" && value.is_string()) return Node{value.get<std::string>()};
    if (type == "Array" && value.is_array()) return Node{nodes_from_raw(value)};
    if (type == "Object" && value.is_object()) {
        auto fields = Object{};
        for (const auto& [k, v] : value.items()) fields.emplace(k, node_from_raw(v));
        return Node{std::move(fields)};
    }
    malformed("node", j);
}

auto element_to_raw(const DiffElement& element) -> ojson {
    auto j = ojson::object();
    if (element.metadata) j["metadata"] = ojson{{"merge", element.metadata->merge}};
    j["path"] = path_to_raw(element.path);
    if (!element.before.empty()) j["before"] = nodes_to_raw(element.before);
    if (!element.remove.empty()) j["remove"] = nodes_to_raw(element.remove);
    if (!element.add.empty()) j["add"] = nodes_to_raw(element.add);
    if (!element.after.empty()) j["after"] = nodes_to_raw(element.after);
    return j;
}

auto element_from_raw(const ojson& j) -> DiffElement {
    if (!j.is_object()) malformed("diff element", j);
    auto element = DiffElement{};
    for (const auto& [field, value] : j.items()) {
        if (field == "metadata") {
            if (!value.is_object()) malformed("metadata", value);
            auto metadata = DiffMetadata{};
            if (value.contains("merge")) {
                if (!value.at("merge").is_boolean()) malformed("metadata", value);
                metadata.merge = value.at("merge").get<bool>();
            }
            element.metadata = metadata;
        } else if (field == "path") {
            element.path = path_from_raw(value);
        } else if (field == "before") {
            element.before = nodes_from_raw(value);
        } else if (field == "remove") {
            element.remove = nodes_from_raw(value);
        } else if (field == "add") {
            element.add = nodes_from_raw(value);
        } else if (field == "after") {
            element.after = nodes_from_raw(value);
        } else {
            throw Exception{ErrorKind::parse_error, "unknown raw diff field: " + field};
        }
    }
    return element;
}

}  // namespace jd_cpp::detail
