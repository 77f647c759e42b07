/// @file error.hpp
/// @brief Error types for the jd-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jd_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_document,   ///< A document value is malformed (non-finite number, bad JSON).
    invalid_options,    ///< A DiffOptions value is out of range.
    context_mismatch,   ///< A patch value or context did not match the target.
    strategy_error,     ///< A hunk is incompatible with its patch strategy.
    invalid_diff,       ///< A hunk is structurally malformed.
    render_error,       ///< A diff cannot be expressed in the requested format.
    reverse_error,      ///< A diff cannot be reversed.
    parse_error,        ///< Serialized diff text could not be read.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_document: return "invalid_document";
        case ErrorKind::invalid_options:  return "invalid_options";
        case ErrorKind::context_mismatch: return "context_mismatch";
        case ErrorKind::strategy_error:   return "strategy_error";
        case ErrorKind::invalid_diff:     return "invalid_diff";
        case ErrorKind::render_error:     return "render_error";
        case ErrorKind::reverse_error:    return "reverse_error";
        case ErrorKind::parse_error:      return "parse_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception thrown by every fallible jd-cpp operation.
///
/// what() returns the plain message; the category is available through
/// error().kind.
///
/// @code
/// try {
///     auto patched = jd_cpp::apply_patch(doc, d);
/// } catch (const jd_cpp::Exception& e) {
///     if (e.error().kind == jd_cpp::ErrorKind::context_mismatch) { ... }
/// }
/// @endcode
class Exception : public std::runtime_error {
public:
    explicit Exception(Error err)
        : std::runtime_error{err.message}, error_{std::move(err)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }

private:
    Error error_;
};

}  // namespace jd_cpp
