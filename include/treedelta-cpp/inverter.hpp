/// @file inverter.hpp
/// @brief Build the change list that undoes another.

#pragma once

#include <treedelta-cpp/change_list.hpp>

namespace treedelta_cpp {

/// The list that takes a value produced by `changes` back to where it
/// started: operations in reverse order, each swapped for its opposite.
///
/// - add(p, v)           -> remove(p, v)
/// - remove(p, old)      -> add(p, old)
/// - replace(p, v, old)  -> replace(p, old, v)
/// - move(p, from)       -> move(from, p)
///
/// Relies on the advisory old values diff() records. For any d = diff(a, b),
/// apply(apply(a, d), invert(d)) == a. The inverse carries no checksum.
///
/// @throws DeltaError (ErrorKind::not_invertible) for a copy, or for a
///   remove or replace without an old value.
auto invert(const ChangeList& changes) -> ChangeList;

}  // namespace treedelta_cpp
