/// @file path.hpp
/// @brief Path types: typed segments addressing a location in a Value tree.

#pragma once

#include <compare>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace treedelta_cpp {

/// A path segment: either a mapping key or a sequence index.
using PathSegment = std::variant<std::string, std::size_t>;

/// Create a key segment.
inline auto key_segment(std::string key) -> PathSegment { return PathSegment{std::move(key)}; }

/// Create an index segment.
inline auto index_segment(std::size_t idx) -> PathSegment { return PathSegment{idx}; }

/// Try to read a token as a sequence index.
///
/// Accepts canonical non-negative decimals only: "0", "17", but not "",
/// "-1", "01" or "1a".
auto parse_index(std::string_view token) -> std::optional<std::size_t>;

/// The textual form of a segment, without escaping.
auto segment_text(const PathSegment& seg) -> std::string;

/// The index a segment designates when applied to a Sequence, if any.
/// Key segments qualify when their text is a canonical index.
auto segment_index(const PathSegment& seg) -> std::optional<std::size_t>;

/// An ordered list of segments from the root down. Empty = root.
///
/// @code
/// auto p = Path{"users", std::size_t{3}, "name"};
/// p.to_pointer();  // "/users/3/name"
/// @endcode
class Path {
public:
    Path() = default;
    Path(std::initializer_list<PathSegment> segments) : segments_{segments} {}
    explicit Path(std::vector<PathSegment> segments) : segments_{std::move(segments)} {}

    /// Parse a slash-delimited pointer ("" is the root, "/" is the empty
    /// key). "~1" decodes to '/', "~0" to '~'. Canonical decimal tokens
    /// become index segments, everything else a key segment.
    /// @throws PointerError if the pointer is non-empty and does not start
    ///   with '/', or contains a '~' escape other than "~0" and "~1".
    static auto parse(std::string_view pointer) -> Path;

    /// Render as a pointer, escaping '~' and '/' inside keys.
    auto to_pointer() const -> std::string;

    auto is_root() const noexcept -> bool { return segments_.empty(); }
    auto size() const noexcept -> std::size_t { return segments_.size(); }
    auto segments() const noexcept -> const std::vector<PathSegment>& { return segments_; }
    auto operator[](std::size_t i) const -> const PathSegment& { return segments_[i]; }
    auto back() const -> const PathSegment& { return segments_.back(); }

    auto begin() const noexcept { return segments_.begin(); }
    auto end() const noexcept { return segments_.end(); }

    /// All segments but the last. The root's parent is the root.
    auto parent() const -> Path;

    /// A new path with one more segment.
    auto child(PathSegment seg) const -> Path;
    auto child(std::string key) const -> Path { return child(PathSegment{std::move(key)}); }
    auto child(std::size_t idx) const -> Path { return child(PathSegment{idx}); }

    /// True if this path equals other or lies beneath it.
    auto starts_with(const Path& other) const -> bool;

    void push_back(PathSegment seg) { segments_.push_back(std::move(seg)); }

    auto operator<=>(const Path&) const = default;
    auto operator==(const Path&) const -> bool = default;

private:
    std::vector<PathSegment> segments_;
};

/// Append a key segment: `Path{} / "users" / 3`.
inline auto operator/(const Path& p, std::string key) -> Path { return p.child(std::move(key)); }
inline auto operator/(const Path& p, const char* key) -> Path { return p.child(std::string{key}); }
inline auto operator/(const Path& p, std::size_t idx) -> Path { return p.child(idx); }
/// @throws PointerError if `idx` is negative.
auto operator/(const Path& p, int idx) -> Path;

}  // namespace treedelta_cpp
