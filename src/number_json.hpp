/// @file number_json.hpp
/// @brief Canonical JSON encoding of a Number node.
///
/// Internal header, not installed.

#pragma once

#include <cmath>
#include <cstdint>

namespace jd_cpp::detail {

/// Integral doubles within the int64 range become JSON integers so that
/// 1.0 serializes as `1`. Negative zero stays a float.
template <typename Json>
auto number_json(double d) -> Json {
    constexpr auto lo = -9223372036854775808.0;
    constexpr auto hi = 9223372036854775808.0;
    if (std::trunc(d) == d && d >= lo && d < hi && !(d == 0.0 && std::signbit(d))) {
        return Json(static_cast<std::int64_t>(d));
    }
    return Json(d);
}

}  // namespace jd_cpp::detail
