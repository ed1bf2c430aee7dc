#include <treedelta-cpp/value.hpp>
#include <treedelta-cpp/error.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace treedelta_cpp;

// -- ValueKind ----------------------------------------------------------------

TEST(ValueKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ValueKind::null),     "null");
    EXPECT_EQ(to_string_view(ValueKind::boolean),  "boolean");
    EXPECT_EQ(to_string_view(ValueKind::number),   "number");
    EXPECT_EQ(to_string_view(ValueKind::text),     "text");
    EXPECT_EQ(to_string_view(ValueKind::sequence), "sequence");
    EXPECT_EQ(to_string_view(ValueKind::mapping),  "mapping");
}

// -- Null ---------------------------------------------------------------------

TEST(Null, all_nulls_are_equal) {
    EXPECT_EQ(Null{}, Null{});
}

TEST(Null, default_value_is_null) {
    const auto v = Value{};
    EXPECT_TRUE(v.is_null());
    EXPECT_EQ(v, Value{nullptr});
    EXPECT_EQ(v, Value{Null{}});
}

// -- Scalars ------------------------------------------------------------------

TEST(Value, holds_bool) {
    const auto v = Value{true};
    EXPECT_EQ(v.kind(), ValueKind::boolean);
    EXPECT_EQ(v.as_bool(), true);
    EXPECT_FALSE(v.as_number().has_value());
}

TEST(Value, integers_are_stored_as_numbers) {
    EXPECT_EQ(Value{42}.as_number(), 42.0);
    EXPECT_EQ(Value{std::size_t{7}}.as_number(), 7.0);
    EXPECT_EQ(Value{-3L}.as_number(), -3.0);
}

TEST(Value, integer_and_double_compare_equal) {
    EXPECT_EQ(Value{1}, Value{1.0});
    EXPECT_NE(Value{1}, Value{1.5});
}

TEST(Value, holds_text) {
    const auto v = Value{"hello"};
    ASSERT_NE(v.as_text(), nullptr);
    EXPECT_EQ(*v.as_text(), "hello");
    EXPECT_EQ(v, Value{std::string{"hello"}});
}

TEST(Value, different_kinds_are_never_equal) {
    EXPECT_NE(Value{0}, Value{false});
    EXPECT_NE(Value{""}, Value{});
    EXPECT_NE(Value{Sequence{}}, Value{Mapping{}});
    EXPECT_NE(Value{"1"}, Value{1});
}

TEST(Value, non_finite_numbers_are_rejected) {
    EXPECT_THROW(Value{std::nan("")}, NumberError);
    EXPECT_THROW(Value{std::numeric_limits<double>::infinity()}, NumberError);
    EXPECT_THROW(Value{-std::numeric_limits<double>::infinity()}, NumberError);
    try {
        Value{std::nan("")};
        FAIL() << "expected NumberError";
    } catch (const NumberError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_number);
        EXPECT_TRUE(std::isnan(e.number()));
    }
}

TEST(Value, large_finite_numbers_are_accepted) {
    const auto big = Value{std::numeric_limits<double>::max()};
    EXPECT_EQ(big.as_number(), std::numeric_limits<double>::max());
}

// -- Sequence -----------------------------------------------------------------

TEST(Value, sequence_equality_is_ordered) {
    const auto a = Value{Sequence{1, 2, 3}};
    const auto b = Value{Sequence{1, 2, 3}};
    const auto c = Value{Sequence{3, 2, 1}};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(Value, sequence_length_matters) {
    EXPECT_NE((Value{Sequence{1, 2}}), (Value{Sequence{1, 2, 3}}));
}

// -- Mapping ------------------------------------------------------------------

TEST(Mapping, preserves_insertion_order) {
    auto m = Mapping{};
    m.set("zeta", 1);
    m.set("alpha", 2);
    m.set("mid", 3);
    EXPECT_EQ(m.keys(), (std::vector<std::string>{"zeta", "alpha", "mid"}));
}

TEST(Mapping, set_on_existing_key_keeps_position) {
    auto m = Mapping{{"a", 1}, {"b", 2}};
    m.set("a", 10);
    EXPECT_EQ(m.keys(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(*m.find("a"), Value{10});
    EXPECT_EQ(m.size(), 2u);
}

TEST(Mapping, duplicate_keys_in_initializer_collapse) {
    const auto m = Mapping{{"a", 1}, {"a", 2}};
    EXPECT_EQ(m.size(), 1u);
    EXPECT_EQ(*m.find("a"), Value{2});
}

TEST(Mapping, erase_reports_presence) {
    auto m = Mapping{{"a", 1}};
    EXPECT_TRUE(m.erase("a"));
    EXPECT_FALSE(m.erase("a"));
    EXPECT_TRUE(m.empty());
}

TEST(Mapping, find_missing_key_returns_nullptr) {
    const auto m = Mapping{{"a", 1}};
    EXPECT_EQ(m.find("b"), nullptr);
    EXPECT_FALSE(m.contains("b"));
    EXPECT_TRUE(m.contains("a"));
}

TEST(Mapping, equality_ignores_key_order) {
    const auto a = Mapping{{"x", 1}, {"y", 2}};
    const auto b = Mapping{{"y", 2}, {"x", 1}};
    EXPECT_EQ(a, b);
    EXPECT_EQ(Value{a}, Value{b});
}

TEST(Mapping, equality_compares_key_sets_and_values) {
    EXPECT_NE((Mapping{{"x", 1}}), (Mapping{{"x", 2}}));
    EXPECT_NE((Mapping{{"x", 1}}), (Mapping{{"y", 1}}));
    EXPECT_NE((Mapping{{"x", 1}}), (Mapping{{"x", 1}, {"y", 2}}));
}

// -- Deep copy ----------------------------------------------------------------

TEST(Value, clone_is_deep) {
    const auto original = Value{Mapping{{"list", Sequence{1, Mapping{{"k", "v"}}}}}};
    auto copy = clone(original);
    ASSERT_EQ(copy, original);

    auto* list = copy.as_mapping()->find("list")->as_sequence();
    list->push_back(99);
    (*list)[1].as_mapping()->set("k", "changed");

    EXPECT_NE(copy, original);
    const auto* original_list = original.as_mapping()->find("list")->as_sequence();
    EXPECT_EQ(original_list->size(), 2u);
    EXPECT_EQ(*(*original_list)[1].as_mapping()->find("k"), Value{"v"});
}

// -- Shape and size -----------------------------------------------------------

TEST(Value, same_container_shape) {
    EXPECT_TRUE(same_container_shape(Value{Sequence{}}, Value{Sequence{1}}));
    EXPECT_TRUE(same_container_shape(Value{Mapping{}}, Value{Mapping{{"a", 1}}}));
    EXPECT_FALSE(same_container_shape(Value{Sequence{}}, Value{Mapping{}}));
    EXPECT_FALSE(same_container_shape(Value{1}, Value{2}));
}

TEST(Value, node_count_and_depth) {
    EXPECT_EQ(Value{1}.node_count(), 1u);
    EXPECT_EQ(Value{1}.depth(), 1u);

    const auto tree = Value{Mapping{{"a", Sequence{1, 2}}, {"b", "x"}}};
    EXPECT_EQ(tree.node_count(), 5u);
    EXPECT_EQ(tree.depth(), 3u);
    EXPECT_EQ(Value{Sequence{}}.depth(), 1u);
}
