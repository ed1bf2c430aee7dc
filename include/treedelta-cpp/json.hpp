/// @file json.hpp
/// @brief nlohmann/json interoperability: the wire form of every public type.
///
/// Wire form of an operation:
/// @code
/// {"op": "replace", "path": "/users/3/name", "value": "Bo", "oldValue": "Al"}
/// {"op": "move", "path": "/b", "from": "/a"}
/// @endcode
/// A change list is `{"changes": [...], "timestamp": <ms>, "checksum": "..."}`
/// (checksum optional). Decoding also accepts a bare array of operations.
///
/// Overloads exist for both nlohmann::json and nlohmann::ordered_json. Use
/// ordered_json to keep mapping key order on the wire; nlohmann::json sorts
/// object keys.

#pragma once

#include <treedelta-cpp/change_list.hpp>
#include <treedelta-cpp/operation.hpp>
#include <treedelta-cpp/path.hpp>
#include <treedelta-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace treedelta_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================
//
// from_json throws WireFormatError on malformed input.

void to_json(nlohmann::json& j, const Value& v);
void from_json(const nlohmann::json& j, Value& v);
void to_json(nlohmann::ordered_json& j, const Value& v);
void from_json(const nlohmann::ordered_json& j, Value& v);

// -- Path (pointer string) ----------------------------------------------------

void to_json(nlohmann::json& j, const Path& p);
void from_json(const nlohmann::json& j, Path& p);
void to_json(nlohmann::ordered_json& j, const Path& p);
void from_json(const nlohmann::ordered_json& j, Path& p);

// -- Operation ----------------------------------------------------------------

void to_json(nlohmann::json& j, const Operation& op);
void from_json(const nlohmann::json& j, Operation& op);
void to_json(nlohmann::ordered_json& j, const Operation& op);
void from_json(const nlohmann::ordered_json& j, Operation& op);

// -- ChangeList ---------------------------------------------------------------

void to_json(nlohmann::json& j, const ChangeList& changes);
void from_json(const nlohmann::json& j, ChangeList& changes);
void to_json(nlohmann::ordered_json& j, const ChangeList& changes);
void from_json(const nlohmann::ordered_json& j, ChangeList& changes);

// -- Conflict / MergeResult (output only) -------------------------------------

void to_json(nlohmann::json& j, const Conflict& c);
void to_json(nlohmann::ordered_json& j, const Conflict& c);
void to_json(nlohmann::json& j, const MergeResult& m);
void to_json(nlohmann::ordered_json& j, const MergeResult& m);

// =============================================================================
// Text helpers
// =============================================================================

/// Parse JSON text into a Value, keeping object key order.
/// @throws WireFormatError on a syntax error.
auto parse_value(std::string_view text) -> Value;

/// Serialize a Value as compact JSON text, keeping mapping key order.
auto dump_value(const Value& v) -> std::string;

/// Parse the wire form of a change list.
/// @throws WireFormatError on a syntax error or a malformed change list.
auto parse_change_list(std::string_view text) -> ChangeList;

/// Serialize a change list to its wire form.
auto dump_change_list(const ChangeList& changes) -> std::string;

}  // namespace treedelta_cpp
