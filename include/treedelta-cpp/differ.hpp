/// @file differ.hpp
/// @brief Compute the operations that turn one Value into another.

#pragma once

#include <treedelta-cpp/change_list.hpp>
#include <treedelta-cpp/checksum.hpp>
#include <treedelta-cpp/operation.hpp>
#include <treedelta-cpp/path.hpp>
#include <treedelta-cpp/value.hpp>

#include <cstddef>
#include <vector>

namespace treedelta_cpp {

/// Tuning knobs for diff().
struct DiffOptions {
    /// Maximum nesting depth to descend into. 0 = unlimited. Set this when
    /// diffing untrusted input; exceeding it throws LimitError.
    std::size_t max_depth{0};

    /// When set, a Sequence replaced by a Mapping (or the reverse) throws
    /// ShapeMismatchError instead of producing a replace.
    bool strict_shapes{false};

    /// When set, diff() stamps the ChangeList with the checksum of `after`.
    Hasher hasher{};
};

/// Compute the edits transforming `before` into `after`, rooted at
/// `base_path`.
///
/// Mappings are compared key by key in insertion order (removals of
/// vanished keys first, then additions and nested edits in `after`'s key
/// order). Sequences are compared position by position, not by longest
/// common subsequence: inserting in the middle yields a run of replaces
/// rather than one add. Trailing removals are emitted from the highest
/// index down so each one addresses an element that still exists.
///
/// At the top level Null stands for "absent" (an add or a remove of the
/// whole value). Below it, Null is an ordinary value and is replaced like
/// any other scalar.
///
/// Never fails unless `options.max_depth` is exceeded or
/// `options.strict_shapes` rejects a container shape change.
///
/// @code
/// auto ops = diff_operations(Mapping{{"age", 30}}, Mapping{{"age", 31}});
/// // [replace /age 31 (was 30)]
/// @endcode
auto diff_operations(const Value& before, const Value& after,
                     const Path& base_path = {},
                     const DiffOptions& options = {}) -> std::vector<Operation>;

/// diff_operations() packaged as a timestamped ChangeList.
auto diff(const Value& before, const Value& after,
          const DiffOptions& options = {}) -> ChangeList;

}  // namespace treedelta_cpp
