/// @file patcher.hpp
/// @brief Apply change lists to Values.

#pragma once

#include <treedelta-cpp/change_list.hpp>
#include <treedelta-cpp/checksum.hpp>
#include <treedelta-cpp/operation.hpp>
#include <treedelta-cpp/value.hpp>

#include <span>

namespace treedelta_cpp {

/// The value at path, or nullptr if any segment is missing or descends
/// into a scalar. Index segments address mappings by their decimal key.
auto value_at(const Value& root, const Path& path) -> const Value*;

/// Apply operations to a copy of `base`, strictly in order, each against
/// the result of the ones before it. `base` itself is never modified.
///
/// Missing intermediate containers are created on the way down: a Sequence
/// when the next segment is an index, a Mapping otherwise. Writing to a
/// sequence index at or past the end appends.
///
/// @throws PathNotFoundError   a remove target or move/copy source is absent.
/// @throws PathTraversalError  a path descends into a scalar, or addresses
///                             a sequence with a non-index key.
/// Both carry the failing operation's index and path. Nothing is returned
/// on failure; the caller still holds `base` and can retry or reject.
auto apply(const Value& base, std::span<const Operation> operations) -> Value;

/// Apply a ChangeList's operations.
auto apply(const Value& base, const ChangeList& changes) -> Value;

/// apply(), then check the result against the list's checksum if it has
/// one.
/// @throws ChecksumMismatchError if the result hashes differently.
auto apply_verified(const Value& base, const ChangeList& changes,
                    const Hasher& hasher = sha256_hasher()) -> Value;

}  // namespace treedelta_cpp
