/// @file compactor.hpp
/// @brief Drop superseded operations from a change list.

#pragma once

#include <treedelta-cpp/change_list.hpp>

namespace treedelta_cpp {

/// Keep only the last operation on each distinct path, in original order.
///
/// Paths are compared by their pointer form, so a key segment "3" and an
/// index segment 3 count as the same path. The result applies to the same
/// final value as the input when every earlier operation on a path is
/// fully overwritten by the later one. Timestamp and checksum are kept.
///
/// Compaction discards history: an add followed by a remove collapses to
/// the remove, and the result generally cannot be inverted. Callers that
/// need undo must keep the uncompacted list.
///
/// Idempotent: optimize(optimize(l)) == optimize(l).
auto optimize(const ChangeList& changes) -> ChangeList;

}  // namespace treedelta_cpp
