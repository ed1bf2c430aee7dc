// offline_sync: two replicas edit the same document while disconnected
//
// Each replica records its edits as a change list against the shared base.
// On reconnect the server tries a verified apply, notices the stale base,
// and falls back to a merge that reports conflicting fields.
//
// Build: cmake --build build
// Run:   ./build/examples/offline_sync

#include <treedelta-cpp/treedelta.hpp>
#include <treedelta-cpp/json.hpp>

#include <cstdio>
#include <string>

namespace td = treedelta_cpp;

namespace {

void print_conflicts(const td::MergeResult& merged) {
    for (const auto& c : merged.conflicts) {
        const auto a = c.value_from_a ? td::dump_value(*c.value_from_a) : std::string{"<removed>"};
        const auto b = c.value_from_b ? td::dump_value(*c.value_from_b) : std::string{"<removed>"};
        std::printf("  conflict at %s: %s vs %s\n",
                    c.path.to_pointer().c_str(), a.c_str(), b.c_str());
    }
}

}  // namespace

int main() {
    const auto base = td::parse_value(R"({
        "title": "Post",
        "status": "draft",
        "tags": ["cpp"],
        "stats": {"views": 0}
    })");

    auto options = td::DiffOptions{};
    options.hasher = td::sha256_hasher();

    // -- Laptop: edits the title and publishes --------------------------------
    auto laptop = base;
    laptop.as_mapping()->set("title", "Post, revised");
    laptop.as_mapping()->set("status", "published");
    const auto laptop_changes = td::optimize(td::diff(base, laptop, options));

    // -- Phone: tags the post and archives it ---------------------------------
    auto phone = base;
    phone.as_mapping()->find("tags")->as_sequence()->push_back("offline");
    phone.as_mapping()->set("status", "archived");
    const auto phone_changes = td::optimize(td::diff(base, phone, options));

    // -- The phone syncs first ------------------------------------------------
    const auto upload = td::dump_change_list(phone_changes);
    auto server = td::apply_verified(base, td::parse_change_list(upload));
    std::printf("Server after phone: %s\n", td::dump_value(server).c_str());

    // -- The laptop's list was made against the old base ----------------------
    try {
        server = td::apply_verified(server, laptop_changes);
    } catch (const td::ChecksumMismatchError& e) {
        std::printf("Laptop upload rejected: %s\n", e.what());

        const auto merged = td::merge(base, laptop_changes, phone_changes);
        std::printf("Merged with %zu conflict(s):\n", merged.conflicts.size());
        print_conflicts(merged);
        server = merged.result;
    }

    std::printf("Server now: %s\n", td::dump_value(server).c_str());
    std::printf("Server checksum: %s\n", td::checksum(server).c_str());
    return 0;
}
