#include <treedelta-cpp/value.hpp>
#include <treedelta-cpp/error.hpp>

#include <algorithm>
#include <cmath>

namespace treedelta_cpp {

// -- Mapping ------------------------------------------------------------------

Mapping::Mapping(std::initializer_list<entry_type> entries) {
    entries_.reserve(entries.size());
    for (const auto& [key, value] : entries) {
        set(key, value);
    }
}

auto Mapping::contains(std::string_view key) const -> bool {
    return find(key) != nullptr;
}

auto Mapping::find(std::string_view key) const -> const Value* {
    auto it = std::ranges::find_if(entries_,
        [&](const entry_type& e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

auto Mapping::find(std::string_view key) -> Value* {
    auto it = std::ranges::find_if(entries_,
        [&](const entry_type& e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

auto Mapping::set(std::string key, Value value) -> Value& {
    if (auto* existing = find(key)) {
        *existing = std::move(value);
        return *existing;
    }
    entries_.emplace_back(std::move(key), std::move(value));
    return entries_.back().second;
}

auto Mapping::erase(std::string_view key) -> bool {
    auto it = std::ranges::find_if(entries_,
        [&](const entry_type& e) { return e.first == key; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

auto Mapping::keys() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(entries_.size());
    for (const auto& [key, value] : entries_) {
        result.push_back(key);
    }
    return result;
}

auto operator==(const Mapping& a, const Mapping& b) -> bool {
    if (a.size() != b.size()) return false;
    // Keys are unique on both sides, so equal size plus every key of a
    // matching in b means the key sets are identical.
    return std::ranges::all_of(a.entries_, [&](const Mapping::entry_type& e) {
        const auto* other = b.find(e.first);
        return other != nullptr && *other == e.second;
    });
}

// -- Value --------------------------------------------------------------------

Value::Value(double d) : inner_{d} {
    if (!std::isfinite(d)) throw NumberError{d};
}

auto Value::as_bool() const -> std::optional<bool> {
    if (const auto* b = std::get_if<bool>(&inner_)) return *b;
    return std::nullopt;
}

auto Value::as_number() const -> std::optional<double> {
    if (const auto* d = std::get_if<double>(&inner_)) return *d;
    return std::nullopt;
}

auto Value::as_text() const -> const std::string* {
    return std::get_if<std::string>(&inner_);
}

auto Value::node_count() const -> std::size_t {
    return std::visit(overload{
        [](const Sequence& seq) {
            auto n = std::size_t{1};
            for (const auto& child : seq) n += child.node_count();
            return n;
        },
        [](const Mapping& map) {
            auto n = std::size_t{1};
            for (const auto& [key, child] : map) n += child.node_count();
            return n;
        },
        [](const auto&) { return std::size_t{1}; },
    }, inner_);
}

auto Value::depth() const -> std::size_t {
    return std::visit(overload{
        [](const Sequence& seq) {
            auto deepest = std::size_t{0};
            for (const auto& child : seq) deepest = std::max(deepest, child.depth());
            return deepest + 1;
        },
        [](const Mapping& map) {
            auto deepest = std::size_t{0};
            for (const auto& [key, child] : map) deepest = std::max(deepest, child.depth());
            return deepest + 1;
        },
        [](const auto&) { return std::size_t{1}; },
    }, inner_);
}

auto operator==(const Value& a, const Value& b) -> bool {
    if (a.kind() != b.kind()) return false;
    return std::visit(overload{
        [](Null, Null) { return true; },
        [](bool x, bool y) { return x == y; },
        [](double x, double y) { return x == y; },
        [](const std::string& x, const std::string& y) { return x == y; },
        [](const Sequence& x, const Sequence& y) {
            return std::ranges::equal(x, y);
        },
        [](const Mapping& x, const Mapping& y) { return x == y; },
        [](const auto&, const auto&) { return false; },
    }, a.inner_, b.inner_);
}

}  // namespace treedelta_cpp
