// Fuzz target for pointer parsing: every pointer that parses must render
// back to a pointer that parses to the same path.

#include <treedelta-cpp/error.hpp>
#include <treedelta-cpp/path.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace td = treedelta_cpp;
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    try {
        const auto path = td::Path::parse(text);
        const auto rendered = path.to_pointer();
        if (td::Path::parse(rendered) != path) __builtin_trap();
    } catch (const td::PointerError&) {
        // Rejected pointer.
    }
    return 0;
}
