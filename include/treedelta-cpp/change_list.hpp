/// @file change_list.hpp
/// @brief ChangeList, Conflict and MergeResult: the artifacts the engine
/// exchanges with its callers.

#pragma once

#include <treedelta-cpp/operation.hpp>
#include <treedelta-cpp/path.hpp>
#include <treedelta-cpp/value.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace treedelta_cpp {

/// A millisecond-precision timestamp.
struct Timestamp {
    std::int64_t millis_since_epoch{0};  ///< Milliseconds since Unix epoch.

    /// The current wall-clock time.
    static auto now() -> Timestamp;

    auto operator<=>(const Timestamp&) const = default;
    auto operator==(const Timestamp&) const -> bool = default;
};

/// An ordered list of operations describing a transformation.
///
/// Operations apply strictly in order; each one observes the effects of
/// those before it. The checksum, when present, is the digest of the value
/// the list produces.
struct ChangeList {
    std::vector<Operation> operations;     ///< The edits, in application order.
    Timestamp timestamp{};                 ///< When the list was created.
    std::optional<std::string> checksum;   ///< Digest of the post-apply value.

    auto empty() const noexcept -> bool { return operations.empty(); }
    auto size() const noexcept -> std::size_t { return operations.size(); }

    auto operator==(const ChangeList&) const -> bool = default;
};

/// A path where two change lists disagree on the resulting value.
///
/// A value is absent when that side removed the path.
struct Conflict {
    Path path;                           ///< The contested location.
    std::optional<Value> value_from_a;   ///< What the first list leaves there.
    std::optional<Value> value_from_b;   ///< What the second list leaves there.

    auto operator==(const Conflict&) const -> bool = default;
};

/// The outcome of a merge: a best-effort value plus every conflict found.
struct MergeResult {
    Value result;                     ///< Base with both lists applied, second wins.
    std::vector<Conflict> conflicts;  ///< Empty when the lists agree.

    auto has_conflicts() const noexcept -> bool { return !conflicts.empty(); }
};

}  // namespace treedelta_cpp
