// basic_usage: demonstrates the core jd-cpp API
//
// Diffs two documents, prints the diff in every output format, applies it,
// reverses it, and reads a rendered diff back in.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <jd-cpp/jd.hpp>

#include <cstdio>
#include <string>

namespace jd = jd_cpp;

int main() {
    const auto a = jd::read_json(R"({"name":"jd","tags":["diff","patch"],"version":1})");
    const auto b = jd::read_json(R"({"name":"jd-cpp","tags":["diff","merge","patch"],"version":2})");

    // -- Structural diff ------------------------------------------------------
    const auto d = jd::diff(a, b);
    std::printf("Native (%zu hunks):\n%s\n", d.size(), jd::render_native(d).c_str());
    std::printf("Colored:\n%s\n", jd::render_native(d, jd::RenderOptions{.color = true}).c_str());
    std::printf("JSON Patch:\n%s\n\n", jd::render_patch(d).c_str());

    // -- Apply and reverse ----------------------------------------------------
    const auto patched = jd::apply_patch(a, d);
    std::printf("Patched: %s\n", jd::to_json_string(patched).c_str());

    const auto restored = jd::apply_patch(patched, jd::reverse(d));
    std::printf("Restored: %s\n", jd::to_json_string(restored).c_str());

    // -- Context checking -----------------------------------------------------
    try {
        (void)jd::apply_patch(jd::read_json(R"({"name":"other"})"), d);
    } catch (const jd::Exception& e) {
        std::printf("Rejected (%s): %s\n",
                    std::string{jd::to_string_view(e.error().kind)}.c_str(), e.what());
    }

    // -- Merge mode -----------------------------------------------------------
    const auto m = jd::diff(a, b, jd::DiffOptions{}.with_merge());
    std::printf("\nMerge Patch: %s\n", jd::render_merge(m).c_str());
    std::printf("Merge native:\n%s", jd::render_native(m).c_str());

    // -- Precision ------------------------------------------------------------
    const auto close = jd::diff(jd::read_json("[1.0, 2.0]"), jd::read_json("[1.0001, 2.0]"),
                                jd::DiffOptions{}.with_precision(0.001));
    std::printf("\nWithin precision: %s\n", close.empty() ? "equal" : "different");

    // -- Reading diffs back ---------------------------------------------------
    const auto parsed = jd::read_diff(jd::render_native(d));
    std::printf("Native round trip: %s\n", parsed == d ? "ok" : "mismatch");

    const auto from_patch = jd::read_patch(jd::render_patch(d));
    std::printf("JSON Patch applies: %s\n", jd::apply_patch(a, from_patch) == b ? "ok" : "mismatch");

    std::printf("Done.\n");
    return 0;
}
