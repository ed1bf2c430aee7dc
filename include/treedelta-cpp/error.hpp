/// @file error.hpp
/// @brief Error types for the treedelta-cpp library.

#pragma once

#include <treedelta-cpp/path.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace treedelta_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    path_not_found,       ///< An operation addressed a location that does not exist.
    path_traversal,       ///< A path tried to descend into a scalar.
    shape_mismatch,       ///< A strict caller rejected a change of container shape.
    checksum_mismatch,    ///< A patched result does not match the expected digest.
    invalid_pointer,      ///< A pointer string is malformed.
    invalid_wire_format,  ///< Serialized change data could not be decoded.
    not_invertible,       ///< A change list lacks what is needed to undo it.
    limit_exceeded,       ///< A configured depth limit was exceeded.
    invalid_number,       ///< A number is NaN or infinite.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::path_not_found:      return "path_not_found";
        case ErrorKind::path_traversal:      return "path_traversal";
        case ErrorKind::shape_mismatch:      return "shape_mismatch";
        case ErrorKind::checksum_mismatch:   return "checksum_mismatch";
        case ErrorKind::invalid_pointer:     return "invalid_pointer";
        case ErrorKind::invalid_wire_format: return "invalid_wire_format";
        case ErrorKind::not_invertible:      return "not_invertible";
        case ErrorKind::limit_exceeded:      return "limit_exceeded";
        case ErrorKind::invalid_number:      return "invalid_number";
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

/// Base class of every exception thrown by the library.
class DeltaError : public std::runtime_error {
public:
    explicit DeltaError(Error err)
        : std::runtime_error{err.message}, error_{std::move(err)} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

/// A failure while applying a change list.
///
/// Carries the index of the failing operation within the list and the
/// path that could not be resolved, so the call can be replayed or
/// reported exactly.
class PatchError : public DeltaError {
public:
    PatchError(ErrorKind kind, std::size_t operation_index, Path path, std::string_view detail);

    auto operation_index() const noexcept -> std::size_t { return operation_index_; }
    auto path() const noexcept -> const Path& { return path_; }

private:
    std::size_t operation_index_;
    Path path_;
};

/// An operation addressed a path that does not exist (remove target,
/// move/copy source).
class PathNotFoundError : public PatchError {
public:
    PathNotFoundError(std::size_t operation_index, Path path, std::string_view detail = {})
        : PatchError{ErrorKind::path_not_found, operation_index, std::move(path), detail} {}
};

/// An intermediate segment resolved to a scalar, or a key segment
/// addressed a sequence.
class PathTraversalError : public PatchError {
public:
    PathTraversalError(std::size_t operation_index, Path path, std::string_view detail = {})
        : PatchError{ErrorKind::path_traversal, operation_index, std::move(path), detail} {}
};

/// For callers that treat a replace across container shapes as an error.
/// Never thrown by the default diff/apply pairing.
class ShapeMismatchError : public DeltaError {
public:
    ShapeMismatchError(Path path, std::string_view from_kind, std::string_view to_kind);

    auto path() const noexcept -> const Path& { return path_; }

private:
    Path path_;
};

/// A patched result does not hash to the checksum its change list carries.
class ChecksumMismatchError : public DeltaError {
public:
    ChecksumMismatchError(std::string expected, std::string actual);

    auto expected() const noexcept -> const std::string& { return expected_; }
    auto actual() const noexcept -> const std::string& { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

/// A pointer string could not be parsed.
class PointerError : public DeltaError {
public:
    explicit PointerError(std::string message)
        : DeltaError{Error{ErrorKind::invalid_pointer, std::move(message)}} {}
};

/// Serialized change data is malformed.
class WireFormatError : public DeltaError {
public:
    explicit WireFormatError(std::string message)
        : DeltaError{Error{ErrorKind::invalid_wire_format, std::move(message)}} {}
};

/// A configured resource limit was exceeded.
class LimitError : public DeltaError {
public:
    explicit LimitError(std::string message)
        : DeltaError{Error{ErrorKind::limit_exceeded, std::move(message)}} {}
};

/// A Value was built from a NaN or infinite number, which JSON cannot hold.
class NumberError : public DeltaError {
public:
    explicit NumberError(double number);

    auto number() const noexcept -> double { return number_; }

private:
    double number_;
};

}  // namespace treedelta_cpp
