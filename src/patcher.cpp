#include <treedelta-cpp/patcher.hpp>
#include <treedelta-cpp/error.hpp>
#include <treedelta-cpp/log.hpp>

#include <cstddef>
#include <string>
#include <utility>

namespace treedelta_cpp {

namespace {

auto lookup(const Value& container, const PathSegment& seg) -> const Value* {
    if (const auto* map = container.as_mapping()) {
        return map->find(segment_text(seg));
    }
    if (const auto* seq = container.as_sequence()) {
        auto idx = segment_index(seg);
        if (!idx || *idx >= seq->size()) return nullptr;
        return &(*seq)[*idx];
    }
    return nullptr;
}

// An empty container of the kind a segment addresses.
auto container_for(const PathSegment& seg) -> Value {
    if (std::holds_alternative<std::size_t>(seg)) return Value{Sequence{}};
    return Value{Mapping{}};
}

// Applies one operation to the working value. Every failure is reported
// against the operation's index in the list.
class OperationApplier {
public:
    OperationApplier(Value& root, std::size_t index) : root_{root}, index_{index} {}

    void apply(const Operation& op) {
        switch (op.action) {
            case OpType::add:
            case OpType::replace:
                write(op.path, op.value.value_or(Value{}));
                break;
            case OpType::remove:
                erase(op.path);
                break;
            case OpType::move: {
                const auto& from = source_of(op);
                if (from == op.path) return;
                if (op.path.starts_with(from)) {
                    throw PathTraversalError{index_, op.path,
                                             "cannot move a value into its own descendant"};
                }
                auto moved = read(from);
                erase(from);
                write(op.path, std::move(moved));
                break;
            }
            case OpType::copy:
                write(op.path, read(source_of(op)));
                break;
        }
    }

private:
    auto source_of(const Operation& op) const -> const Path& {
        if (!op.from) {
            throw PathNotFoundError{index_, op.path, "operation has no source path"};
        }
        return *op.from;
    }

    // Copy of the value at path.
    auto read(const Path& path) const -> Value {
        const auto* found = value_at(root_, path);
        if (found == nullptr) {
            throw PathNotFoundError{index_, path, "source does not exist"};
        }
        return *found;
    }

    // Walk to the parent of the path's last segment, creating missing
    // containers. Only called for non-root paths.
    auto parent_of(const Path& path) -> Value& {
        if (root_.is_null()) {
            root_ = container_for(path[0]);
        }
        Value* current = &root_;
        for (std::size_t i = 0; i + 1 < path.size(); ++i) {
            current = &step(*current, path, i);
        }
        return *current;
    }

    auto step(Value& container, const Path& path, std::size_t i) -> Value& {
        const auto& seg = path[i];
        const auto& next = path[i + 1];
        if (auto* map = container.as_mapping()) {
            auto key = segment_text(seg);
            if (auto* child = map->find(key)) return *child;
            return map->set(std::move(key), container_for(next));
        }
        if (auto* seq = container.as_sequence()) {
            auto idx = segment_index(seg);
            if (!idx) {
                throw PathTraversalError{index_, path, "key segment addresses a sequence"};
            }
            if (*idx < seq->size()) return (*seq)[*idx];
            seq->push_back(container_for(next));
            return seq->back();
        }
        throw PathTraversalError{index_, path,
                                 "cannot descend into " +
                                 std::string{to_string_view(container.kind())}};
    }

    void write(const Path& path, Value value) {
        if (path.is_root()) {
            root_ = std::move(value);
            return;
        }
        auto& parent = parent_of(path);
        if (auto* map = parent.as_mapping()) {
            map->set(segment_text(path.back()), std::move(value));
        } else if (auto* seq = parent.as_sequence()) {
            auto idx = segment_index(path.back());
            if (!idx) {
                throw PathTraversalError{index_, path, "key segment addresses a sequence"};
            }
            if (*idx < seq->size()) {
                (*seq)[*idx] = std::move(value);
            } else {
                seq->push_back(std::move(value));
            }
        } else {
            throw PathTraversalError{index_, path,
                                     "cannot write into " +
                                     std::string{to_string_view(parent.kind())}};
        }
    }

    void erase(const Path& path) {
        if (path.is_root()) {
            root_ = Value{};
            return;
        }
        auto& parent = parent_of(path);
        if (auto* map = parent.as_mapping()) {
            if (!map->erase(segment_text(path.back()))) {
                throw PathNotFoundError{index_, path, "key does not exist"};
            }
        } else if (auto* seq = parent.as_sequence()) {
            auto idx = segment_index(path.back());
            if (!idx || *idx >= seq->size()) {
                throw PathNotFoundError{index_, path, "index out of range"};
            }
            seq->erase(seq->begin() + static_cast<std::ptrdiff_t>(*idx));
        } else {
            throw PathTraversalError{index_, path,
                                     "cannot remove from " +
                                     std::string{to_string_view(parent.kind())}};
        }
    }

    Value& root_;
    std::size_t index_;
};

}  // anonymous namespace

auto value_at(const Value& root, const Path& path) -> const Value* {
    const Value* current = &root;
    for (const auto& seg : path) {
        current = lookup(*current, seg);
        if (current == nullptr) return nullptr;
    }
    return current;
}

auto apply(const Value& base, std::span<const Operation> operations) -> Value {
    auto result = base;
    for (std::size_t i = 0; i < operations.size(); ++i) {
        try {
            OperationApplier{result, i}.apply(operations[i]);
        } catch (const PatchError& e) {
            logger()->debug("apply: aborted: {}", e.what());
            throw;
        }
    }
    logger()->debug("apply: {} operation(s) applied", operations.size());
    return result;
}

auto apply(const Value& base, const ChangeList& changes) -> Value {
    return apply(base, std::span<const Operation>{changes.operations});
}

auto apply_verified(const Value& base, const ChangeList& changes, const Hasher& hasher)
    -> Value {
    auto result = apply(base, changes);
    if (changes.checksum) {
        auto actual = checksum(result, hasher);
        if (actual != *changes.checksum) {
            logger()->warn("apply: checksum mismatch, expected {} got {}",
                           *changes.checksum, actual);
            throw ChecksumMismatchError{*changes.checksum, std::move(actual)};
        }
    }
    return result;
}

}  // namespace treedelta_cpp
