/// @file value.hpp
/// @brief The Value model: Null, Bool, Number, Text, Sequence, Mapping.

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace treedelta_cpp {

class Value;

/// Represents a JSON null value. Also stands for "absent" at the root.
struct Null {
    auto operator==(const Null&) const -> bool = default;
};

/// An ordered list of owned child values.
using Sequence = std::vector<Value>;

/// The six shapes a Value can take.
enum class ValueKind : std::uint8_t {
    null,
    boolean,
    number,
    text,
    sequence,
    mapping,
};

/// Convert a ValueKind to its string representation.
constexpr auto to_string_view(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::null:     return "null";
        case ValueKind::boolean:  return "boolean";
        case ValueKind::number:   return "number";
        case ValueKind::text:     return "text";
        case ValueKind::sequence: return "sequence";
        case ValueKind::mapping:  return "mapping";
    }
    return "unknown";
}

/// An insertion-ordered set of (key, Value) pairs with unique keys.
///
/// Iteration follows insertion order, which keeps diff output stable.
/// Equality ignores order: two mappings are equal when they hold the same
/// keys and each key maps to an equal value.
class Mapping {
public:
    using entry_type = std::pair<std::string, Value>;
    using const_iterator = std::vector<entry_type>::const_iterator;
    using iterator = std::vector<entry_type>::iterator;

    Mapping() = default;
    Mapping(std::initializer_list<entry_type> entries);

    auto size() const noexcept -> std::size_t;
    auto empty() const noexcept -> bool;

    auto begin() const noexcept -> const_iterator;
    auto end() const noexcept -> const_iterator;
    auto begin() noexcept -> iterator;
    auto end() noexcept -> iterator;

    auto contains(std::string_view key) const -> bool;

    /// Pointer to the value at key, or nullptr.
    auto find(std::string_view key) const -> const Value*;
    auto find(std::string_view key) -> Value*;

    /// Insert or overwrite. A new key is appended; an existing key keeps
    /// its position.
    auto set(std::string key, Value value) -> Value&;

    /// Remove a key. Returns false if it was not present.
    auto erase(std::string_view key) -> bool;

    /// Keys in insertion order.
    auto keys() const -> std::vector<std::string>;

    friend auto operator==(const Mapping& a, const Mapping& b) -> bool;

private:
    std::vector<entry_type> entries_;
};

/// A JSON-like value: a finite tree of scalars and owned containers.
///
/// Copying a Value is a deep copy; no subtree is ever shared, so a Value
/// cannot contain a cycle.
///
/// @code
/// auto v = Value{Mapping{{"name", "Alice"}, {"tags", Sequence{"a", "b"}}}};
/// auto* name = v.as_mapping()->find("name");
/// @endcode
class Value {
public:
    using variant_type = std::variant<Null, bool, double, std::string, Sequence, Mapping>;

    Value() : inner_{Null{}} {}
    Value(Null) : inner_{Null{}} {}
    Value(std::nullptr_t) : inner_{Null{}} {}
    Value(bool b) : inner_{b} {}
    /// @throws NumberError if `d` is NaN or infinite.
    Value(double d);
    Value(int i) : inner_{static_cast<double>(i)} {}
    Value(long i) : inner_{static_cast<double>(i)} {}
    Value(long long i) : inner_{static_cast<double>(i)} {}
    Value(unsigned int i) : inner_{static_cast<double>(i)} {}
    Value(unsigned long i) : inner_{static_cast<double>(i)} {}
    Value(unsigned long long i) : inner_{static_cast<double>(i)} {}
    Value(const char* s) : inner_{std::string{s}} {}
    Value(std::string s) : inner_{std::move(s)} {}
    Value(std::string_view s) : inner_{std::string{s}} {}
    Value(Sequence s) : inner_{std::move(s)} {}
    Value(Mapping m) : inner_{std::move(m)} {}

    auto kind() const noexcept -> ValueKind {
        return static_cast<ValueKind>(inner_.index());
    }

    auto is_null() const noexcept -> bool { return kind() == ValueKind::null; }
    auto is_bool() const noexcept -> bool { return kind() == ValueKind::boolean; }
    auto is_number() const noexcept -> bool { return kind() == ValueKind::number; }
    auto is_text() const noexcept -> bool { return kind() == ValueKind::text; }
    auto is_sequence() const noexcept -> bool { return kind() == ValueKind::sequence; }
    auto is_mapping() const noexcept -> bool { return kind() == ValueKind::mapping; }

    /// True for Sequence and Mapping.
    auto is_container() const noexcept -> bool {
        return is_sequence() || is_mapping();
    }

    auto as_bool() const -> std::optional<bool>;
    auto as_number() const -> std::optional<double>;
    auto as_text() const -> const std::string*;
    auto as_sequence() const -> const Sequence* { return std::get_if<Sequence>(&inner_); }
    auto as_sequence() -> Sequence* { return std::get_if<Sequence>(&inner_); }
    auto as_mapping() const -> const Mapping* { return std::get_if<Mapping>(&inner_); }
    auto as_mapping() -> Mapping* { return std::get_if<Mapping>(&inner_); }

    auto variant() const noexcept -> const variant_type& { return inner_; }
    auto variant() noexcept -> variant_type& { return inner_; }

    /// Number of nodes in the tree, this one included.
    auto node_count() const -> std::size_t;

    /// Depth of the tree; a scalar or empty container has depth 1.
    auto depth() const -> std::size_t;

    friend auto operator==(const Value& a, const Value& b) -> bool;

private:
    variant_type inner_;
};

// Defined here rather than in Mapping, where Value is still incomplete.
inline auto Mapping::size() const noexcept -> std::size_t { return entries_.size(); }
inline auto Mapping::empty() const noexcept -> bool { return entries_.empty(); }
inline auto Mapping::begin() const noexcept -> const_iterator { return entries_.begin(); }
inline auto Mapping::end() const noexcept -> const_iterator { return entries_.end(); }
inline auto Mapping::begin() noexcept -> iterator { return entries_.begin(); }
inline auto Mapping::end() noexcept -> iterator { return entries_.end(); }

/// Deep copy. Equivalent to the copy constructor; spelled out for call
/// sites that want to make the copy explicit.
inline auto clone(const Value& v) -> Value { return v; }

/// True if both values are containers of the same kind.
inline auto same_container_shape(const Value& a, const Value& b) noexcept -> bool {
    return a.is_container() && a.kind() == b.kind();
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace treedelta_cpp
