// undo_redo: an edit history built from change lists
//
// Every edit is stored as the diff from the previous state. Undo applies
// the inverse of the newest entry, redo re-applies it.
//
// Build: cmake --build build
// Run:   ./build/examples/undo_redo

#include <treedelta-cpp/treedelta.hpp>
#include <treedelta-cpp/json.hpp>

#include <cstdio>
#include <utility>
#include <vector>

namespace td = treedelta_cpp;

namespace {

class History {
public:
    explicit History(td::Value initial) : current_{std::move(initial)} {}

    void commit(const td::Value& next) {
        undo_.push_back(td::diff(current_, next));
        redo_.clear();
        current_ = next;
    }

    auto undo() -> bool {
        if (undo_.empty()) return false;
        auto changes = std::move(undo_.back());
        undo_.pop_back();
        current_ = td::apply(current_, td::invert(changes));
        redo_.push_back(std::move(changes));
        return true;
    }

    auto redo() -> bool {
        if (redo_.empty()) return false;
        auto changes = std::move(redo_.back());
        redo_.pop_back();
        current_ = td::apply(current_, changes);
        undo_.push_back(std::move(changes));
        return true;
    }

    auto current() const -> const td::Value& { return current_; }

private:
    td::Value current_;
    std::vector<td::ChangeList> undo_;
    std::vector<td::ChangeList> redo_;
};

void show(const char* label, const History& h) {
    std::printf("%-10s %s\n", label, td::dump_value(h.current()).c_str());
}

}  // namespace

int main() {
    auto history = History{td::parse_value(R"({"text":"","cursor":0})")};
    show("initial", history);

    auto state = history.current();
    state.as_mapping()->set("text", "Hello");
    state.as_mapping()->set("cursor", 5);
    history.commit(state);
    show("typed", history);

    state.as_mapping()->set("text", "Hello, world");
    state.as_mapping()->set("cursor", 12);
    state.as_mapping()->set("bold", td::Sequence{0, 5});
    history.commit(state);
    show("typed", history);

    history.undo();
    show("undo", history);
    history.undo();
    show("undo", history);
    std::printf("undo again: %s\n", history.undo() ? "applied" : "nothing to undo");

    history.redo();
    show("redo", history);
    history.redo();
    show("redo", history);

    return 0;
}
