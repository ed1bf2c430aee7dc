// Fuzz target for the change-list wire decoder and the Patcher. Any list
// that decodes is applied to a small fixed document and re-encoded.

#include <treedelta-cpp/treedelta.hpp>
#include <treedelta-cpp/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace td = treedelta_cpp;
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    static const auto base = td::Value{td::Mapping{
        {"name", "fuzz"},
        {"items", td::Sequence{1, 2, 3}},
        {"nested", td::Mapping{{"flag", true}, {"list", td::Sequence{}}}},
    }};

    try {
        auto changes = td::parse_change_list(text);
        auto encoded = td::dump_change_list(changes);
        (void)encoded;

        auto result = td::apply(base, changes);
        (void)result;
        auto compacted = td::optimize(changes);
        (void)compacted;
    } catch (const td::DeltaError&) {
        // Malformed input and unresolvable paths are expected rejections.
    }
    return 0;
}
