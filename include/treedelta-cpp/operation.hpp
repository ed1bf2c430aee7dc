/// @file operation.hpp
/// @brief Operation types: one addressable edit of a Value tree.

#pragma once

#include <treedelta-cpp/path.hpp>
#include <treedelta-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace treedelta_cpp {

/// The kind of edit an operation performs.
enum class OpType : std::uint8_t {
    add,      ///< Set a value at a path that was absent.
    remove,   ///< Delete the value at a path.
    replace,  ///< Overwrite the value at a path.
    move,     ///< Relocate the value at `from` to `path`.
    copy,     ///< Duplicate the value at `from` into `path`.
};

/// Convert an OpType to its string representation (the wire tag).
constexpr auto to_string_view(OpType type) noexcept -> std::string_view {
    switch (type) {
        case OpType::add:     return "add";
        case OpType::remove:  return "remove";
        case OpType::replace: return "replace";
        case OpType::move:    return "move";
        case OpType::copy:    return "copy";
    }
    return "unknown";
}

/// Parse a wire tag back into an OpType.
constexpr auto parse_op_type(std::string_view tag) noexcept -> std::optional<OpType> {
    if (tag == "add")     return OpType::add;
    if (tag == "remove")  return OpType::remove;
    if (tag == "replace") return OpType::replace;
    if (tag == "move")    return OpType::move;
    if (tag == "copy")    return OpType::copy;
    return std::nullopt;
}

/// A single path-addressed edit.
///
/// Which optional fields are set depends on the action:
/// - add:     value
/// - remove:  old_value (advisory)
/// - replace: value, old_value (advisory)
/// - move:    from
/// - copy:    from
///
/// `old_value` is never needed to apply an operation; it serves conflict
/// display and inversion.
struct Operation {
    OpType action{OpType::add};          ///< The kind of edit.
    Path path;                           ///< Where the edit lands.
    std::optional<Value> value{};        ///< New value (add, replace).
    std::optional<Value> old_value{};    ///< Previous value (remove, replace).
    std::optional<Path> from{};          ///< Source location (move, copy).

    auto operator==(const Operation&) const -> bool = default;
};

// -- Factories ----------------------------------------------------------------

inline auto add_op(Path path, Value value) -> Operation {
    return Operation{OpType::add, std::move(path), std::move(value), std::nullopt, std::nullopt};
}

inline auto remove_op(Path path, std::optional<Value> old_value = std::nullopt) -> Operation {
    return Operation{OpType::remove, std::move(path), std::nullopt, std::move(old_value),
                     std::nullopt};
}

inline auto replace_op(Path path, Value value, std::optional<Value> old_value = std::nullopt)
    -> Operation {
    return Operation{OpType::replace, std::move(path), std::move(value), std::move(old_value),
                     std::nullopt};
}

inline auto move_op(Path path, Path from) -> Operation {
    return Operation{OpType::move, std::move(path), std::nullopt, std::nullopt, std::move(from)};
}

inline auto copy_op(Path path, Path from) -> Operation {
    return Operation{OpType::copy, std::move(path), std::nullopt, std::nullopt, std::move(from)};
}

}  // namespace treedelta_cpp
