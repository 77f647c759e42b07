// Fuzz target for the diff readers: arbitrary text must either parse or be
// rejected with a jd_cpp::Exception. Whatever parses is rendered back out.

#include <jd-cpp/jd.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace jd = jd_cpp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view(reinterpret_cast<const char*>(data), size);

    try {
        auto d = jd::read_diff(text);
        auto rendered = jd::render_raw(d);
        (void)rendered;
    } catch (const jd::Exception&) {
    }

    try {
        auto d = jd::read_patch(text);
        auto rendered = jd::render_native(d);
        (void)rendered;
    } catch (const jd::Exception&) {
    }

    try {
        auto d = jd::read_merge(text);
        auto rendered = jd::render_native(d);
        (void)rendered;
    } catch (const jd::Exception&) {
    }

    try {
        auto d = jd::read_raw(text);
        auto rendered = jd::render_raw(d);
        (void)rendered;
    } catch (const jd::Exception&) {
    }
    return 0;
}
