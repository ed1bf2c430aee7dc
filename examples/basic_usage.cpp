// basic_usage: demonstrates the core treedelta-cpp API
//
// Builds two versions of a document, diffs them, prints the change list,
// applies it, and checks the result with a checksum.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <treedelta-cpp/treedelta.hpp>
#include <treedelta-cpp/json.hpp>

#include <cstdio>
#include <string>

namespace td = treedelta_cpp;

int main() {
    // -- Build values with initializer lists ----------------------------------
    const auto before = td::Value{td::Mapping{
        {"title", "Shopping List"},
        {"items", td::Sequence{"Milk", "Eggs", "Bread"}},
        {"config", td::Mapping{{"theme", "dark"}, {"max_items", 100}}},
    }};

    // -- Or parse them from JSON text -----------------------------------------
    const auto after = td::parse_value(R"({
        "title": "Weekend Shopping",
        "items": ["Milk", "Eggs"],
        "config": {"theme": "light", "max_items": 100, "lang": "en"}
    })");

    // -- Diff -----------------------------------------------------------------
    auto options = td::DiffOptions{};
    options.hasher = td::sha256_hasher();
    const auto changes = td::diff(before, after, options);

    std::printf("Operations (%zu):\n", changes.size());
    for (const auto& op : changes.operations) {
        const auto action = td::to_string_view(op.action);
        std::printf("  %-8.*s %s\n", static_cast<int>(action.size()), action.data(),
                    op.path.to_pointer().c_str());
    }

    // -- Read values by path --------------------------------------------------
    if (auto* theme = td::value_at(after, td::Path{"config", "theme"})) {
        if (auto* s = theme->as_text()) {
            std::printf("New theme: %s\n", s->c_str());
        }
    }
    if (auto* first = td::value_at(after, td::Path{"items", std::size_t{0}})) {
        if (auto* s = first->as_text()) {
            std::printf("First item: %s\n", s->c_str());
        }
    }

    // -- Apply and verify -----------------------------------------------------
    const auto patched = td::apply_verified(before, changes);
    std::printf("Patched equals target: %s\n", patched == after ? "yes" : "no");
    std::printf("Checksum: %s\n", changes.checksum->c_str());

    // -- Wire form ------------------------------------------------------------
    const auto text = td::dump_change_list(changes);
    std::printf("Wire form: %zu bytes\n", text.size());
    const auto decoded = td::parse_change_list(text);
    std::printf("Decoded equals original: %s\n", decoded == changes ? "yes" : "no");

    // -- Errors are typed exceptions ------------------------------------------
    try {
        auto bad = td::ChangeList{};
        bad.operations = {td::remove_op(td::Path{"missing"})};
        (void)td::apply(before, bad);
    } catch (const td::PatchError& e) {
        std::printf("Rejected: %s\n", e.what());
    }

    std::printf("Done.\n");
    return 0;
}
