/// @file error.hpp
/// @brief Error types for the jsonpatch-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jsonpatch_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_patch,       ///< The patch document itself is malformed.
    invalid_pointer,     ///< A pointer string is syntactically malformed.
    pointer_resolution,  ///< A pointer does not resolve against the document.
    conflict,            ///< The document's shape contradicts an operation.
    test_failed,         ///< A test operation's value did not match.
    depth_exceeded,      ///< Diff recursion exceeded the configured depth.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_patch:      return "invalid_patch";
        case ErrorKind::invalid_pointer:    return "invalid_pointer";
        case ErrorKind::pointer_resolution: return "pointer_resolution";
        case ErrorKind::conflict:           return "conflict";
        case ErrorKind::test_failed:        return "test_failed";
        case ErrorKind::depth_exceeded:     return "depth_exceeded";
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

// -- Exceptions ---------------------------------------------------------------

/// Base class of every exception thrown by the library.
///
/// Catch this to handle all patch failures uniformly; catch one of the
/// derived types to distinguish e.g. a failed `test` from a conflict.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error err)
        : std::runtime_error{err.message}, error_{std::move(err)} {}

    /// The structured error carried by this exception.
    auto error() const noexcept -> const Error& { return error_; }

    /// Shorthand for `error().kind`.
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

/// The patch document is malformed (missing or unknown `op`, missing field,
/// or not a sequence of operation objects).
class InvalidPatch : public Exception {
public:
    explicit InvalidPatch(std::string msg)
        : Exception{Error{ErrorKind::invalid_patch, std::move(msg)}} {}
};

/// A pointer string is malformed (no leading '/', bad '~' escape).
class InvalidPointer : public Exception {
public:
    explicit InvalidPointer(std::string msg)
        : Exception{Error{ErrorKind::invalid_pointer, std::move(msg)}} {}
};

/// A pointer does not resolve (missing intermediate member, index into a
/// scalar, malformed array index).
class PointerResolutionError : public Exception {
public:
    explicit PointerResolutionError(std::string msg)
        : Exception{Error{ErrorKind::pointer_resolution, std::move(msg)}} {}
};

/// The document's shape contradicts what an operation requires.
class Conflict : public Exception {
public:
    explicit Conflict(std::string msg)
        : Exception{Error{ErrorKind::conflict, std::move(msg)}} {}
};

/// A `test` operation did not match the document.
class TestFailed : public Exception {
public:
    explicit TestFailed(std::string msg)
        : Exception{Error{ErrorKind::test_failed, std::move(msg)}} {}
};

/// Diff recursion went deeper than DiffOptions::max_depth.
class DepthExceeded : public Exception {
public:
    explicit DepthExceeded(std::string msg)
        : Exception{Error{ErrorKind::depth_exceeded, std::move(msg)}} {}
};

}  // namespace jsonpatch_cpp
