#include <treedelta-cpp/differ.hpp>
#include <treedelta-cpp/error.hpp>
#include <treedelta-cpp/log.hpp>

#include <algorithm>
#include <string>

namespace treedelta_cpp {

namespace {

class Differ {
public:
    Differ(const DiffOptions& options, std::vector<Operation>& out)
        : options_{options}, out_{out} {}

    // Top level: Null on either side means the whole value is absent.
    void diff_root(const Value& before, const Value& after, const Path& path) {
        if (before == after) return;
        if (before.is_null()) {
            out_.push_back(add_op(path, after));
        } else if (after.is_null()) {
            out_.push_back(remove_op(path, before));
        } else {
            diff_present(before, after, path, 1);
        }
    }

private:
    // Below the root a Null is an ordinary value, so any difference that is
    // not between two containers of the same shape is a replace.
    void diff_child(const Value& before, const Value& after, const Path& path,
                    std::size_t depth) {
        if (before == after) return;
        diff_present(before, after, path, depth);
    }

    // Both sides known to differ.
    void diff_present(const Value& before, const Value& after, const Path& path,
                      std::size_t depth) {
        if (!same_container_shape(before, after)) {
            if (options_.strict_shapes && before.is_container() && after.is_container()) {
                throw ShapeMismatchError{path, to_string_view(before.kind()),
                                         to_string_view(after.kind())};
            }
            out_.push_back(replace_op(path, after, before));
            return;
        }
        check_depth(path, depth);
        if (const auto* b = before.as_mapping()) {
            diff_mappings(*b, *after.as_mapping(), path, depth);
        } else {
            diff_sequences(*before.as_sequence(), *after.as_sequence(), path, depth);
        }
    }

    void diff_mappings(const Mapping& before, const Mapping& after, const Path& path,
                       std::size_t depth) {
        for (const auto& [key, old_child] : before) {
            if (!after.contains(key)) {
                out_.push_back(remove_op(path / key, old_child));
            }
        }
        for (const auto& [key, new_child] : after) {
            const auto* old_child = before.find(key);
            if (old_child == nullptr) {
                out_.push_back(add_op(path / key, new_child));
            } else {
                diff_child(*old_child, new_child, path / key, depth + 1);
            }
        }
    }

    void diff_sequences(const Sequence& before, const Sequence& after, const Path& path,
                        std::size_t depth) {
        const auto common = std::min(before.size(), after.size());
        for (std::size_t i = 0; i < common; ++i) {
            diff_child(before[i], after[i], path / i, depth + 1);
        }
        for (auto i = common; i < after.size(); ++i) {
            out_.push_back(add_op(path / i, after[i]));
        }
        for (auto i = before.size(); i > common; --i) {
            out_.push_back(remove_op(path / (i - 1), before[i - 1]));
        }
    }

    void check_depth(const Path& path, std::size_t depth) const {
        if (options_.max_depth != 0 && depth > options_.max_depth) {
            throw LimitError{"diff exceeded max depth " + std::to_string(options_.max_depth) +
                             " at \"" + path.to_pointer() + "\""};
        }
    }

    const DiffOptions& options_;
    std::vector<Operation>& out_;
};

}  // anonymous namespace

auto diff_operations(const Value& before, const Value& after, const Path& base_path,
                     const DiffOptions& options) -> std::vector<Operation> {
    auto ops = std::vector<Operation>{};
    Differ{options, ops}.diff_root(before, after, base_path);
    return ops;
}

auto diff(const Value& before, const Value& after, const DiffOptions& options) -> ChangeList {
    auto changes = ChangeList{};
    changes.operations = diff_operations(before, after, {}, options);
    changes.timestamp = Timestamp::now();
    if (options.hasher) {
        changes.checksum = checksum(after, options.hasher);
    }
    logger()->debug("diff: {} operation(s)", changes.operations.size());
    return changes;
}

}  // namespace treedelta_cpp
