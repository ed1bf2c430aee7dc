// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <treedelta-cpp/treedelta.hpp>
#include <treedelta-cpp/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>

static void write_seed(const std::string& path, const std::string& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    namespace td = treedelta_cpp;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir);

    const auto before = td::parse_value(
        R"({"name":"fuzz","items":[1,2,3],"nested":{"flag":true,"list":[]}})");
    const auto after = td::parse_value(
        R"({"name":"fuzzed","items":[1],"nested":{"flag":false,"list":["x"]},"new":null})");

    // Seed 1: empty change list
    write_seed(dir + "/seed_empty.json", td::dump_change_list(td::ChangeList{}));

    // Seed 2: diff with replaces, removes and adds
    write_seed(dir + "/seed_diff.json", td::dump_change_list(td::diff(before, after)));

    // Seed 3: move and copy
    {
        auto changes = td::ChangeList{};
        changes.operations = {
            td::move_op(td::Path{"renamed"}, td::Path{"name"}),
            td::copy_op(td::Path{"nested", "list", std::size_t{0}}, td::Path{"items", std::size_t{1}}),
        };
        write_seed(dir + "/seed_move_copy.json", td::dump_change_list(changes));
    }

    // Seed 4: document pair for the round-trip target
    write_seed(dir + "/seed_pair.bin",
               td::dump_value(before) + std::string(1, '\0') + td::dump_value(after));

    // Seed 5: pointers
    write_seed(dir + "/seed_pointer.txt", "/a~1b/0/~0c");

    return 0;
}
