/// @file options.hpp
/// @brief DiffOptions: knobs that change how documents are compared.

#pragma once

#include <jd-cpp/error.hpp>

#include <cmath>
#include <string>

namespace jd_cpp {

/// Options for diff() and tolerant equality.
///
/// Plain value type, passed by const reference. Use the with_* helpers to
/// build a validated copy:
///
/// @code
/// auto opts = DiffOptions{}.with_precision(0.01).with_merge(true);
/// @endcode
struct DiffOptions {
    /// Two numbers compare equal when their absolute difference is at most
    /// this value. 0 means exact comparison.
    double precision{0.0};

    /// Produce merge-semantics hunks (RFC 7386) instead of strict ones.
    bool merge{false};

    /// Return a copy with the given precision.
    /// @throws Exception (invalid_options) if p is negative or not finite.
    auto with_precision(double p) const -> DiffOptions {
        if (!std::isfinite(p) || p < 0.0) {
            throw Exception{ErrorKind::invalid_options,
                            "precision must be a finite non-negative number. got " +
                                std::to_string(p)};
        }
        auto copy = *this;
        copy.precision = p;
        return copy;
    }

    /// Return a copy with merge semantics switched on or off.
    auto with_merge(bool m = true) const -> DiffOptions {
        auto copy = *this;
        copy.merge = m;
        return copy;
    }

    auto operator==(const DiffOptions&) const -> bool = default;
};

}  // namespace jd_cpp
