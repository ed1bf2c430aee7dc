/// @file checksum.hpp
/// @brief Content digests of Values for staleness detection.
///
/// Before applying a change list produced elsewhere, compare the checksum
/// of the locally held base with the one the producer diffed against. A
/// mismatch means the list was computed against a stale base and the
/// caller should fall back to three_way_merge() instead of apply().

#pragma once

#include <treedelta-cpp/value.hpp>

#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace treedelta_cpp {

/// Raw digest bytes.
using Digest = std::vector<std::byte>;

/// A hashing capability: bytes in, digest out. Injected so tests and
/// callers can substitute their own function.
using Hasher = std::function<Digest(std::span<const std::byte>)>;

/// The library's SHA-256 as a Hasher.
auto sha256_hasher() -> Hasher;

/// The deterministic text a checksum is computed over: compact JSON with
/// mapping keys sorted, shortest round-trip number formatting and -0
/// written as 0. Values that compare equal have identical canonical forms.
auto canonical_form(const Value& value) -> std::string;

/// Lowercase hex digest of canonical_form(value).
auto checksum(const Value& value, const Hasher& hasher = sha256_hasher()) -> std::string;

/// True if value hashes to expected.
auto matches_checksum(const Value& value, std::string_view expected,
                      const Hasher& hasher = sha256_hasher()) -> bool;

/// Lowercase hex rendering of a byte string.
auto to_hex(std::span<const std::byte> bytes) -> std::string;

}  // namespace treedelta_cpp
