/// @file merger.hpp
/// @brief Reconcile two change lists computed against the same base.

#pragma once

#include <treedelta-cpp/change_list.hpp>
#include <treedelta-cpp/differ.hpp>
#include <treedelta-cpp/value.hpp>

namespace treedelta_cpp {

/// Merge two change lists that were both computed against `base`.
///
/// A path touched by only one list, with nothing above or below it touched
/// by the other, never conflicts. A path touched by both
/// conflicts unless the two operations leave the same value there (a
/// removal leaves no value; a move or copy leaves whatever `base` holds at
/// its source). When a list touches a path more than once, its last
/// operation on that path is the one compared. Conflicts are reported in
/// the order their paths first appear, `delta_a` before `delta_b`.
///
/// A path one list rewrites or removes while the other edits beneath it is
/// a conflict on the outer path, comparing what each list leaves there.
///
/// The merged value is `delta_a` applied to `base`, then `delta_b` applied
/// to that: on a conflicting path `delta_b` wins. Where both lists agree on
/// a path, `delta_b`'s operations on it are skipped so the edit lands once
/// (two identical removals do not fail). A subtree contested by nested
/// edits takes `delta_b`'s version whole. A `delta_b` operation that no
/// longer applies after `delta_a` is reported as a conflict and skipped,
/// except a removal whose target is already gone, which is dropped.
/// Callers wanting another policy inspect `conflicts` and adjust before
/// accepting the result.
///
/// Conflicts never throw. A PatchError only escapes when a list does not
/// apply to `base` on its own, which is an integration error in the caller.
///
/// @code
/// auto merged = merge(base, diff(base, mine), diff(base, theirs));
/// if (merged.has_conflicts()) { /* ask the user */ }
/// @endcode
auto merge(const Value& base, const ChangeList& delta_a, const ChangeList& delta_b)
    -> MergeResult;

/// merge(base, diff(base, local), diff(base, remote)).
auto three_way_merge(const Value& base, const Value& local, const Value& remote,
                     const DiffOptions& options = {}) -> MergeResult;

}  // namespace treedelta_cpp
