// Fuzz target for diff() and apply_patch(): the input is split on the first
// newline into two JSON documents. Whenever both parse, the diff must apply,
// reverse and survive a native-format round trip.

#include <jd-cpp/jd.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

namespace jd = jd_cpp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view(reinterpret_cast<const char*>(data), size);
    const auto split = input.find('\n');
    if (split == std::string_view::npos) return 0;

    auto a = jd::Node{};
    auto b = jd::Node{};
    try {
        a = jd::read_json(input.substr(0, split));
        b = jd::read_json(input.substr(split + 1));
    } catch (const jd::Exception&) {
        return 0;  // not a pair of JSON documents
    }

    // Any failure from here on is a bug, so exceptions escape to the fuzzer.
    const auto d = jd::diff(a, b);
    if (jd::apply_patch(a, d) != b) std::abort();
    if (jd::apply_patch(b, jd::reverse(d)) != a) std::abort();
    if (jd::read_diff(jd::render_native(d)) != d) std::abort();
    if (jd::read_raw(jd::render_raw(d)) != d) std::abort();

    const auto m = jd::diff(a, b, jd::DiffOptions{}.with_merge());
    if (jd::apply_patch(a, m) != b) std::abort();
    return 0;
}
