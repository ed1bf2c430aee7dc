#include <treedelta-cpp/inverter.hpp>
#include <treedelta-cpp/error.hpp>

#include <string>

namespace treedelta_cpp {

namespace {

[[noreturn]] void not_invertible(std::size_t index, const Operation& op, const char* why) {
    throw DeltaError{Error{ErrorKind::not_invertible,
                           "operation " + std::to_string(index) + " (" +
                           std::string{to_string_view(op.action)} + " \"" +
                           op.path.to_pointer() + "\") " + why}};
}

auto inverse_of(std::size_t index, const Operation& op) -> Operation {
    switch (op.action) {
        case OpType::add:
            return remove_op(op.path, op.value);
        case OpType::remove:
            if (!op.old_value) not_invertible(index, op, "has no old value");
            return add_op(op.path, *op.old_value);
        case OpType::replace:
            if (!op.old_value) not_invertible(index, op, "has no old value");
            return replace_op(op.path, *op.old_value, op.value);
        case OpType::move:
            if (!op.from) not_invertible(index, op, "has no source path");
            return move_op(*op.from, op.path);
        case OpType::copy:
            not_invertible(index, op, "overwrites a value it does not record");
    }
    not_invertible(index, op, "has an unknown action");
}

}  // anonymous namespace

auto invert(const ChangeList& changes) -> ChangeList {
    auto result = ChangeList{};
    result.timestamp = Timestamp::now();
    const auto& ops = changes.operations;
    result.operations.reserve(ops.size());
    for (auto i = ops.size(); i > 0; --i) {
        result.operations.push_back(inverse_of(i - 1, ops[i - 1]));
    }
    return result;
}

}  // namespace treedelta_cpp
