// Fuzz target for the round-trip law. The input is two JSON documents
// separated by a NUL byte; when both parse, applying their diff to the
// first must yield the second, and the inverse must lead back.

#include <treedelta-cpp/treedelta.hpp>
#include <treedelta-cpp/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace td = treedelta_cpp;
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = input.find('\0');
    if (split == std::string_view::npos) return 0;

    auto before = td::Value{};
    auto after = td::Value{};
    try {
        before = td::parse_value(input.substr(0, split));
        after = td::parse_value(input.substr(split + 1));
    } catch (const td::WireFormatError&) {
        return 0;
    }

    auto options = td::DiffOptions{};
    options.max_depth = 256;
    try {
        const auto changes = td::diff(before, after, options);
        if (td::apply(before, changes) != after) __builtin_trap();
        if (td::apply(after, td::invert(changes)) != before) __builtin_trap();
    } catch (const td::LimitError&) {
        // Too deep for this run.
    }
    return 0;
}
