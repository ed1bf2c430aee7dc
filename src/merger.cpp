#include <treedelta-cpp/merger.hpp>
#include <treedelta-cpp/error.hpp>
#include <treedelta-cpp/log.hpp>
#include <treedelta-cpp/patcher.hpp>

#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace treedelta_cpp {

namespace {

// Last operation per path, plus the order in which paths first appeared.
// Paths are keyed by pointer so key "3" and index 3 meet.
struct PathIndex {
    std::unordered_map<std::string, const Operation*> by_path;
    std::vector<std::string> order;

    explicit PathIndex(const ChangeList& changes) {
        for (const auto& op : changes.operations) {
            auto key = op.path.to_pointer();
            auto [it, inserted] = by_path.insert_or_assign(key, &op);
            if (inserted) order.push_back(std::move(key));
        }
    }

    auto find(const std::string& key) const -> const Operation* {
        auto it = by_path.find(key);
        return it == by_path.end() ? nullptr : it->second;
    }

    auto contains(const std::string& key) const -> bool { return by_path.contains(key); }
};

// Strict ancestors of a pointer, outermost first: "/a/b" -> "", "/a".
auto ancestors_of(const std::string& key) -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    for (std::size_t i = 0; i < key.size(); ++i) {
        if (key[i] == '/') result.push_back(key.substr(0, i));
    }
    return result;
}

// Paths where one list edits inside a subtree that the other list rewrites
// or removes as a whole. Only the outermost of nested roots are kept.
auto nested_edit_roots(const PathIndex& a, const PathIndex& b)
    -> std::unordered_set<std::string> {
    auto roots = std::unordered_set<std::string>{};
    auto collect = [&](const PathIndex& inner, const PathIndex& outer) {
        for (const auto& key : inner.order) {
            for (auto& ancestor : ancestors_of(key)) {
                if (outer.contains(ancestor)) {
                    roots.insert(std::move(ancestor));
                    break;
                }
            }
        }
    };
    collect(a, b);
    collect(b, a);

    auto outermost = std::unordered_set<std::string>{};
    for (const auto& root : roots) {
        auto nested = false;
        for (const auto& ancestor : ancestors_of(root)) {
            if (roots.contains(ancestor)) {
                nested = true;
                break;
            }
        }
        if (!nested) outermost.insert(root);
    }
    return outermost;
}

// The root from `roots` that contains key, if any.
auto containing_root(const std::string& key, const std::unordered_set<std::string>& roots)
    -> std::optional<std::string> {
    if (roots.contains(key)) return key;
    for (auto& ancestor : ancestors_of(key)) {
        if (roots.contains(ancestor)) return std::move(ancestor);
    }
    return std::nullopt;
}

auto copy_of(const Value* v) -> std::optional<Value> {
    if (v == nullptr) return std::nullopt;
    return *v;
}

// What an operation leaves at its path.
auto resulting_value(const Value& base, const Operation& op) -> std::optional<Value> {
    switch (op.action) {
        case OpType::add:
        case OpType::replace:
            return op.value.value_or(Value{});
        case OpType::remove:
            return std::nullopt;
        case OpType::move:
        case OpType::copy:
            if (op.from) return copy_of(value_at(base, *op.from));
            return std::nullopt;
    }
    return std::nullopt;
}

// Apply delta_b's remaining operations on top of delta_a's result. An
// operation that no longer fits becomes a conflict instead of failing the
// merge; a removal whose target is already gone is dropped.
void replay(Value& current, const Value& base, const std::vector<Operation>& ops,
            MergeResult& merged) {
    if (ops.empty()) return;
    try {
        current = treedelta_cpp::apply(current, std::span<const Operation>{ops});
        return;
    } catch (const PatchError&) {
        // Fall through and replay one at a time to find the misfits.
    }
    for (const auto& op : ops) {
        try {
            current = treedelta_cpp::apply(current, std::span<const Operation>{&op, 1});
        } catch (const PatchError& e) {
            if (op.action == OpType::remove && e.kind() == ErrorKind::path_not_found) {
                logger()->debug("merge: {} already removed", op.path.to_pointer());
                continue;
            }
            logger()->debug("merge: cannot replay: {}", e.what());
            merged.conflicts.push_back(Conflict{op.path, copy_of(value_at(current, op.path)),
                                                resulting_value(base, op)});
        }
    }
}

// Put `value` (or nothing) at path, as the second list left it.
void overwrite(Value& current, const Path& path, const Value* value) {
    if (path.is_root()) {
        current = value != nullptr ? *value : Value{};
        return;
    }
    if (value == nullptr && value_at(current, path) == nullptr) return;
    const auto op = value != nullptr ? add_op(path, *value) : remove_op(path);
    try {
        current = treedelta_cpp::apply(current, std::span<const Operation>{&op, 1});
    } catch (const PatchError& e) {
        // The subtree is already reported as a conflict.
        logger()->debug("merge: cannot restore {}: {}", path.to_pointer(), e.what());
    }
}

}  // anonymous namespace

auto merge(const Value& base, const ChangeList& delta_a, const ChangeList& delta_b)
    -> MergeResult {
    const auto index_a = PathIndex{delta_a};
    const auto index_b = PathIndex{delta_b};
    const auto roots = nested_edit_roots(index_a, index_b);

    auto result_a = Value{};
    auto result_b = Value{};
    try {
        result_a = apply(base, delta_a);
        result_b = apply(base, delta_b);
    } catch (const PatchError& e) {
        logger()->error("merge: change list does not fit the base: {}", e.what());
        throw;
    }

    auto merged = MergeResult{};
    auto agreed = std::unordered_set<std::string>{};
    auto root_paths = std::vector<Path>{};
    auto reported = std::unordered_set<std::string>{};
    for (const auto& key : index_a.order) {
        if (auto root = containing_root(key, roots)) {
            if (!reported.insert(*root).second) continue;
            const auto* owner = index_a.contains(*root) ? index_a.find(*root)
                                                        : index_b.find(*root);
            const auto& path = owner->path;
            auto from_a = copy_of(value_at(result_a, path));
            auto from_b = copy_of(value_at(result_b, path));
            if (from_a != from_b) {
                merged.conflicts.push_back(Conflict{path, std::move(from_a), std::move(from_b)});
            }
            root_paths.push_back(path);
            continue;
        }
        const auto* op_b = index_b.find(key);
        if (op_b == nullptr) continue;
        const auto* op_a = index_a.find(key);
        auto from_a = resulting_value(base, *op_a);
        auto from_b = resulting_value(base, *op_b);
        if (from_a == from_b) {
            agreed.insert(key);
        } else {
            merged.conflicts.push_back(Conflict{op_a->path, std::move(from_a), std::move(from_b)});
        }
    }

    // delta_b replays on top of delta_a, minus the edits both made and the
    // subtrees where one list rewrote what the other edited inside. Those
    // subtrees take delta_b's version whole.
    auto remaining = std::vector<Operation>{};
    for (const auto& op : delta_b.operations) {
        auto key = op.path.to_pointer();
        if (agreed.contains(key) || containing_root(key, roots)) continue;
        remaining.push_back(op);
    }
    merged.result = std::move(result_a);
    replay(merged.result, base, remaining, merged);
    for (const auto& path : root_paths) {
        overwrite(merged.result, path, value_at(result_b, path));
    }

    if (merged.has_conflicts()) {
        logger()->info("merge: {} conflict(s)", merged.conflicts.size());
    } else {
        logger()->debug("merge: clean");
    }
    return merged;
}

auto three_way_merge(const Value& base, const Value& local, const Value& remote,
                     const DiffOptions& options) -> MergeResult {
    return merge(base, diff(base, local, options), diff(base, remote, options));
}

}  // namespace treedelta_cpp
