#include <treedelta-cpp/json.hpp>
#include <treedelta-cpp/error.hpp>

#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace treedelta_cpp {

namespace {

// Integral numbers up to 2^53 are exact in a double; write them without a
// fractional part so the wire reads "31" rather than "31.0".
constexpr double max_exact_integer = 9007199254740992.0;

template <typename Json>
void value_to_json(Json& j, const Value& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](double d) {
            if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) <= max_exact_integer) {
                j = static_cast<std::int64_t>(d);
            } else {
                j = d;
            }
        },
        [&](const std::string& s) { j = s; },
        [&](const Sequence& seq) {
            j = Json::array();
            for (const auto& child : seq) {
                auto cj = Json{};
                value_to_json(cj, child);
                j.push_back(std::move(cj));
            }
        },
        [&](const Mapping& map) {
            j = Json::object();
            for (const auto& [key, child] : map) {
                auto cj = Json{};
                value_to_json(cj, child);
                j[key] = std::move(cj);
            }
        },
    }, v.variant());
}

template <typename Json>
auto value_from_json(const Json& j) -> Value {
    using value_t = nlohmann::json::value_t;
    switch (j.type()) {
        case value_t::null:
            return Value{};
        case value_t::boolean:
            return Value{j.template get<bool>()};
        case value_t::number_integer:
            return Value{static_cast<double>(j.template get<std::int64_t>())};
        case value_t::number_unsigned:
            return Value{static_cast<double>(j.template get<std::uint64_t>())};
        case value_t::number_float: {
            const auto d = j.template get<double>();
            if (!std::isfinite(d)) throw WireFormatError{"number out of range"};
            return Value{d};
        }
        case value_t::string:
            return Value{j.template get<std::string>()};
        case value_t::array: {
            auto seq = Sequence{};
            seq.reserve(j.size());
            for (const auto& element : j) seq.push_back(value_from_json(element));
            return Value{std::move(seq)};
        }
        case value_t::object: {
            auto map = Mapping{};
            for (auto& [key, element] : j.items()) {
                map.set(key, value_from_json(element));
            }
            return Value{std::move(map)};
        }
        case value_t::binary:
        case value_t::discarded:
            break;
    }
    throw WireFormatError{"unsupported JSON value type: " + std::string{j.type_name()}};
}

template <typename Json>
auto pointer_field(const Json& j, const char* name) -> Path {
    auto it = j.find(name);
    if (it == j.end() || !it->is_string()) {
        throw WireFormatError{std::string{"operation field \""} + name +
                              "\" must be a pointer string"};
    }
    try {
        return Path::parse(it->template get<std::string>());
    } catch (const PointerError& e) {
        throw WireFormatError{e.what()};
    }
}

template <typename Json>
void operation_to_json(Json& j, const Operation& op) {
    j = Json::object();
    j["op"] = std::string{to_string_view(op.action)};
    j["path"] = op.path.to_pointer();
    if (op.value) {
        auto vj = Json{};
        value_to_json(vj, *op.value);
        j["value"] = std::move(vj);
    }
    if (op.old_value) {
        auto oj = Json{};
        value_to_json(oj, *op.old_value);
        j["oldValue"] = std::move(oj);
    }
    if (op.from && (op.action == OpType::move || op.action == OpType::copy)) {
        j["from"] = op.from->to_pointer();
    }
}

template <typename Json>
auto operation_from_json(const Json& j) -> Operation {
    if (!j.is_object()) throw WireFormatError{"operation must be a JSON object"};

    auto tag = j.find("op");
    if (tag == j.end() || !tag->is_string()) {
        throw WireFormatError{"operation field \"op\" must be a string"};
    }
    auto action = parse_op_type(tag->template get<std::string>());
    if (!action) {
        throw WireFormatError{"unknown operation \"" + tag->template get<std::string>() + "\""};
    }

    auto op = Operation{};
    op.action = *action;
    op.path = pointer_field(j, "path");
    if (auto it = j.find("value"); it != j.end()) {
        op.value = value_from_json(*it);
    }
    if (auto it = j.find("oldValue"); it != j.end()) {
        op.old_value = value_from_json(*it);
    }

    switch (op.action) {
        case OpType::add:
        case OpType::replace:
            if (!op.value) {
                throw WireFormatError{std::string{to_string_view(op.action)} +
                                      " operation requires \"value\""};
            }
            break;
        case OpType::move:
        case OpType::copy:
            op.from = pointer_field(j, "from");
            break;
        case OpType::remove:
            break;
    }
    return op;
}

template <typename Json>
void change_list_to_json(Json& j, const ChangeList& changes) {
    auto ops = Json::array();
    for (const auto& op : changes.operations) {
        auto oj = Json{};
        operation_to_json(oj, op);
        ops.push_back(std::move(oj));
    }
    j = Json::object();
    j["changes"] = std::move(ops);
    j["timestamp"] = changes.timestamp.millis_since_epoch;
    if (changes.checksum) j["checksum"] = *changes.checksum;
}

template <typename Json>
auto change_list_from_json(const Json& j) -> ChangeList {
    auto changes = ChangeList{};
    const Json* ops = &j;
    if (j.is_object()) {
        auto it = j.find("changes");
        if (it == j.end() || !it->is_array()) {
            throw WireFormatError{"change list field \"changes\" must be an array"};
        }
        ops = &*it;
        if (auto ts = j.find("timestamp"); ts != j.end()) {
            if (!ts->is_number_integer()) {
                throw WireFormatError{"change list field \"timestamp\" must be an integer"};
            }
            changes.timestamp.millis_since_epoch = ts->template get<std::int64_t>();
        }
        if (auto cs = j.find("checksum"); cs != j.end() && !cs->is_null()) {
            if (!cs->is_string()) {
                throw WireFormatError{"change list field \"checksum\" must be a string"};
            }
            changes.checksum = cs->template get<std::string>();
        }
    } else if (!j.is_array()) {
        throw WireFormatError{"change list must be an object or an array of operations"};
    }

    changes.operations.reserve(ops->size());
    for (const auto& element : *ops) {
        changes.operations.push_back(operation_from_json(element));
    }
    return changes;
}

template <typename Json>
void conflict_to_json(Json& j, const Conflict& c) {
    j = Json::object();
    j["path"] = c.path.to_pointer();
    if (c.value_from_a) {
        auto aj = Json{};
        value_to_json(aj, *c.value_from_a);
        j["valueFromA"] = std::move(aj);
    }
    if (c.value_from_b) {
        auto bj = Json{};
        value_to_json(bj, *c.value_from_b);
        j["valueFromB"] = std::move(bj);
    }
}

template <typename Json>
void merge_result_to_json(Json& j, const MergeResult& m) {
    auto rj = Json{};
    value_to_json(rj, m.result);
    auto cj = Json::array();
    for (const auto& c : m.conflicts) {
        auto one = Json{};
        conflict_to_json(one, c);
        cj.push_back(std::move(one));
    }
    j = Json::object();
    j["result"] = std::move(rj);
    j["conflicts"] = std::move(cj);
}

auto parse_text(std::string_view text) -> nlohmann::ordered_json {
    try {
        return nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::ordered_json::parse_error& e) {
        throw WireFormatError{e.what()};
    } catch (const nlohmann::ordered_json::out_of_range& e) {
        // Number literals that overflow a double.
        throw WireFormatError{e.what()};
    }
}

}  // anonymous namespace

// =============================================================================
// ADL entry points
// =============================================================================

void to_json(nlohmann::json& j, const Value& v) { value_to_json(j, v); }
void from_json(const nlohmann::json& j, Value& v) { v = value_from_json(j); }
void to_json(nlohmann::ordered_json& j, const Value& v) { value_to_json(j, v); }
void from_json(const nlohmann::ordered_json& j, Value& v) { v = value_from_json(j); }

void to_json(nlohmann::json& j, const Path& p) { j = p.to_pointer(); }
void to_json(nlohmann::ordered_json& j, const Path& p) { j = p.to_pointer(); }

void from_json(const nlohmann::json& j, Path& p) {
    if (!j.is_string()) throw WireFormatError{"path must be a pointer string"};
    try {
        p = Path::parse(j.get<std::string>());
    } catch (const PointerError& e) {
        throw WireFormatError{e.what()};
    }
}

void from_json(const nlohmann::ordered_json& j, Path& p) {
    if (!j.is_string()) throw WireFormatError{"path must be a pointer string"};
    try {
        p = Path::parse(j.get<std::string>());
    } catch (const PointerError& e) {
        throw WireFormatError{e.what()};
    }
}

void to_json(nlohmann::json& j, const Operation& op) { operation_to_json(j, op); }
void from_json(const nlohmann::json& j, Operation& op) { op = operation_from_json(j); }
void to_json(nlohmann::ordered_json& j, const Operation& op) { operation_to_json(j, op); }
void from_json(const nlohmann::ordered_json& j, Operation& op) { op = operation_from_json(j); }

void to_json(nlohmann::json& j, const ChangeList& changes) { change_list_to_json(j, changes); }
void from_json(const nlohmann::json& j, ChangeList& changes) {
    changes = change_list_from_json(j);
}
void to_json(nlohmann::ordered_json& j, const ChangeList& changes) {
    change_list_to_json(j, changes);
}
void from_json(const nlohmann::ordered_json& j, ChangeList& changes) {
    changes = change_list_from_json(j);
}

void to_json(nlohmann::json& j, const Conflict& c) { conflict_to_json(j, c); }
void to_json(nlohmann::ordered_json& j, const Conflict& c) { conflict_to_json(j, c); }
void to_json(nlohmann::json& j, const MergeResult& m) { merge_result_to_json(j, m); }
void to_json(nlohmann::ordered_json& j, const MergeResult& m) { merge_result_to_json(j, m); }

// =============================================================================
// Text helpers
// =============================================================================

auto parse_value(std::string_view text) -> Value {
    return value_from_json(parse_text(text));
}

auto dump_value(const Value& v) -> std::string {
    auto j = nlohmann::ordered_json{};
    value_to_json(j, v);
    return j.dump();
}

auto parse_change_list(std::string_view text) -> ChangeList {
    return change_list_from_json(parse_text(text));
}

auto dump_change_list(const ChangeList& changes) -> std::string {
    auto j = nlohmann::ordered_json{};
    change_list_to_json(j, changes);
    return j.dump();
}

}  // namespace treedelta_cpp
