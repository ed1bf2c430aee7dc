#include <treedelta-cpp/error.hpp>

namespace treedelta_cpp {

namespace {

auto describe(ErrorKind kind, std::size_t index, const Path& path, std::string_view detail)
    -> std::string {
    auto msg = std::string{to_string_view(kind)};
    msg += " at operation ";
    msg += std::to_string(index);
    msg += " (path \"";
    msg += path.to_pointer();
    msg += "\")";
    if (!detail.empty()) {
        msg += ": ";
        msg += detail;
    }
    return msg;
}

}  // anonymous namespace

PatchError::PatchError(ErrorKind kind, std::size_t operation_index, Path path,
                       std::string_view detail)
    : DeltaError{Error{kind, describe(kind, operation_index, path, detail)}},
      operation_index_{operation_index},
      path_{std::move(path)} {}

ShapeMismatchError::ShapeMismatchError(Path path, std::string_view from_kind,
                                       std::string_view to_kind)
    : DeltaError{Error{ErrorKind::shape_mismatch,
                       "shape change from " + std::string{from_kind} + " to " +
                       std::string{to_kind} + " at \"" + path.to_pointer() + "\""}},
      path_{std::move(path)} {}

ChecksumMismatchError::ChecksumMismatchError(std::string expected, std::string actual)
    : DeltaError{Error{ErrorKind::checksum_mismatch,
                       "expected checksum " + expected + ", got " + actual}},
      expected_{std::move(expected)},
      actual_{std::move(actual)} {}

NumberError::NumberError(double number)
    : DeltaError{Error{ErrorKind::invalid_number,
                       "number is not finite: " + std::to_string(number)}},
      number_{number} {}

}  // namespace treedelta_cpp
