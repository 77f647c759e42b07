#include <jd-cpp/node.hpp>

#include <array>
#include <cmath>
#include <cstring>
#include <string>
#include <utility>

namespace jd_cpp {

namespace {

// -- Hashing constants --------------------------------------------------------
// Stored as little-endian u64s so hashes stay stable across versions.

constexpr auto fnv_offset_basis = std::uint64_t{0xcbf29ce484222325ULL};
constexpr auto fnv_prime = std::uint64_t{0x100000001b3ULL};

constexpr auto void_hash = std::uint64_t{0x968D2691216B97F3ULL};
constexpr auto null_hash = std::uint64_t{0x88E032E6CCAB73FEULL};
constexpr auto true_hash = std::uint64_t{0x1CDC59AFE4E36B24ULL};
constexpr auto false_hash = std::uint64_t{0xBF1F7E0AD17738C6ULL};
constexpr auto list_seed = std::uint64_t{0xF303C4A4710A18F5ULL};
constexpr auto object_seed = std::uint64_t{0xD5EA1018A4395D00ULL};

class Fnv1a {
public:
    void update(const unsigned char* data, std::size_t len) {
        for (std::size_t i = 0; i < len; ++i) {
            hash_ ^= static_cast<std::uint64_t>(data[i]);
            hash_ *= fnv_prime;
        }
    }

    void update(std::string_view s) {
        update(reinterpret_cast<const unsigned char*>(s.data()), s.size());
    }

    void update_u64(std::uint64_t v) {
        auto bytes = std::array<unsigned char, 8>{};
        for (std::size_t i = 0; i < 8; ++i) {
            bytes[i] = static_cast<unsigned char>(v >> (8 * i));
        }
        update(bytes.data(), bytes.size());
    }

    auto digest() const noexcept -> std::uint64_t { return hash_; }

private:
    std::uint64_t hash_{fnv_offset_basis};
};

auto hash_string(std::string_view s) -> std::uint64_t {
    auto h = Fnv1a{};
    h.update(s);
    return h.digest();
}

auto shared_void() -> const std::shared_ptr<const NodeValue>& {
    static const auto instance = std::make_shared<const NodeValue>(Void{});
    return instance;
}

auto check_finite(double d) -> double {
    if (!std::isfinite(d)) {
        throw Exception{ErrorKind::invalid_document,
                        "numbers must be finite. got " + std::to_string(d)};
    }
    return d;
}

}  // anonymous namespace

// =============================================================================
// Node
// =============================================================================

Node::Node() : value_{shared_void()} {}
Node::Node(Void) : value_{shared_void()} {}
Node::Node(Null) : value_{std::make_shared<const NodeValue>(std::in_place_type<Null>)} {}
Node::Node(bool b) : value_{std::make_shared<const NodeValue>(std::in_place_type<bool>, b)} {}
Node::Node(double d)
    : value_{std::make_shared<const NodeValue>(std::in_place_type<double>, check_finite(d))} {}
Node::Node(int i) : Node{static_cast<double>(i)} {}
Node::Node(std::int64_t i) : Node{static_cast<double>(i)} {}
Node::Node(const char* s) : Node{std::string{s}} {}
Node::Node(std::string s)
    : value_{std::make_shared<const NodeValue>(std::in_place_type<std::string>, std::move(s))} {}
Node::Node(Array items)
    : value_{std::make_shared<const NodeValue>(std::in_place_type<Array>, std::move(items))} {}
Node::Node(Object fields)
    : value_{std::make_shared<const NodeValue>(std::in_place_type<Object>, std::move(fields))} {}

auto Node::kind() const noexcept -> NodeKind {
    return static_cast<NodeKind>(value_->index());
}

auto Node::as_bool() const -> bool { return std::get<bool>(*value_); }
auto Node::as_number() const -> double { return std::get<double>(*value_); }
auto Node::as_string() const -> const std::string& { return std::get<std::string>(*value_); }
auto Node::as_array() const -> const Array& { return std::get<Array>(*value_); }
auto Node::as_object() const -> const Object& { return std::get<Object>(*value_); }

auto Node::value() const noexcept -> const NodeValue& { return *value_; }

auto Node::operator==(const Node& other) const -> bool {
    if (value_ == other.value_) return true;
    return *value_ == *other.value_;
}

// =============================================================================
// Tolerant equality
// =============================================================================

auto equals(const Node& lhs, const Node& rhs, const DiffOptions& options) -> bool {
    if (lhs.kind() != rhs.kind()) return false;
    switch (lhs.kind()) {
        case NodeKind::void_:
        case NodeKind::null:
            return true;
        case NodeKind::boolean:
            return lhs.as_bool() == rhs.as_bool();
        case NodeKind::number:
            return std::abs(lhs.as_number() - rhs.as_number()) <= options.precision;
        case NodeKind::string:
            return lhs.as_string() == rhs.as_string();
        case NodeKind::array: {
            const auto& a = lhs.as_array();
            const auto& b = rhs.as_array();
            if (a.size() != b.size()) return false;
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (!equals(a[i], b[i], options)) return false;
            }
            return true;
        }
        case NodeKind::object: {
            const auto& a = lhs.as_object();
            const auto& b = rhs.as_object();
            if (a.size() != b.size()) return false;
            auto it = b.begin();
            for (const auto& [key, value] : a) {
                if (it->first != key || !equals(value, it->second, options)) return false;
                ++it;
            }
            return true;
        }
    }
    return false;
}

// =============================================================================
// Hashing
// =============================================================================

auto hash_code(const Node& node) -> std::uint64_t {
    return std::visit(overload{
        [](const Void&) { return void_hash; },
        [](const Null&) { return null_hash; },
        [](bool b) { return b ? true_hash : false_hash; },
        [](double d) {
            if (d == 0.0) d = 0.0;  // -0.0 == 0.0, so they must hash alike
            auto bits = std::uint64_t{0};
            std::memcpy(&bits, &d, sizeof(bits));
            auto h = Fnv1a{};
            h.update_u64(bits);
            return h.digest();
        },
        [](const std::string& s) { return hash_string(s); },
        [](const Array& items) {
            auto h = Fnv1a{};
            h.update_u64(list_seed);
            for (const auto& item : items) h.update_u64(hash_code(item));
            return h.digest();
        },
        [](const Object& fields) {
            auto h = Fnv1a{};
            h.update_u64(object_seed);
            for (const auto& [key, value] : fields) {
                h.update_u64(hash_string(key));
                h.update_u64(hash_code(value));
            }
            return h.digest();
        },
    }, node.value());
}

}  // namespace jd_cpp
