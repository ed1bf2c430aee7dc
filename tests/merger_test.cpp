#include <treedelta-cpp/error.hpp>
#include <treedelta-cpp/merger.hpp>
#include <treedelta-cpp/patcher.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <vector>

using namespace treedelta_cpp;

namespace {

auto changes_of(std::vector<Operation> ops) -> ChangeList {
    auto changes = ChangeList{};
    changes.operations = std::move(ops);
    return changes;
}

}  // namespace

TEST(Merge, empty_deltas_return_base) {
    const auto base = Value{Mapping{{"a", 1}}};
    const auto merged = merge(base, ChangeList{}, ChangeList{});
    EXPECT_FALSE(merged.has_conflicts());
    EXPECT_EQ(merged.result, base);
}

TEST(Merge, disjoint_paths_do_not_conflict) {
    const auto base = Value{Mapping{{"a", 1}, {"b", 1}}};
    const auto delta_a = changes_of({replace_op(Path{"a"}, 2, 1)});
    const auto delta_b = changes_of({replace_op(Path{"b"}, 3, 1)});

    const auto merged = merge(base, delta_a, delta_b);
    EXPECT_FALSE(merged.has_conflicts());
    EXPECT_EQ(merged.result, (Value{Mapping{{"a", 2}, {"b", 3}}}));

    // Disjoint deltas commute.
    EXPECT_EQ(merged.result, treedelta_cpp::apply(treedelta_cpp::apply(base, delta_b), delta_a));
    EXPECT_EQ(merge(base, delta_b, delta_a).result, merged.result);
}

TEST(Merge, same_path_different_values_conflict_and_second_wins) {
    const auto base = Value{Mapping{{"x", 0}}};
    const auto delta_a = changes_of({replace_op(Path{"x"}, 1, 0)});
    const auto delta_b = changes_of({replace_op(Path{"x"}, 2, 0)});

    const auto merged = merge(base, delta_a, delta_b);
    ASSERT_EQ(merged.conflicts.size(), 1u);
    EXPECT_EQ(merged.conflicts[0], (Conflict{Path{"x"}, Value{1}, Value{2}}));
    EXPECT_EQ(merged.result, (Value{Mapping{{"x", 2}}}));
}

TEST(Merge, identical_edits_agree) {
    const auto base = Value{Mapping{{"x", 0}}};
    const auto delta = changes_of({replace_op(Path{"x"}, 5, 0)});
    const auto merged = merge(base, delta, delta);
    EXPECT_FALSE(merged.has_conflicts());
    EXPECT_EQ(merged.result, (Value{Mapping{{"x", 5}}}));
}

TEST(Merge, remove_against_replace_conflicts_with_absent_side) {
    const auto base = Value{Mapping{{"x", 0}, {"y", 0}}};
    const auto delta_a = changes_of({remove_op(Path{"x"}, 0)});
    const auto delta_b = changes_of({replace_op(Path{"x"}, 9, 0)});

    const auto merged = merge(base, delta_a, delta_b);
    ASSERT_EQ(merged.conflicts.size(), 1u);
    EXPECT_FALSE(merged.conflicts[0].value_from_a.has_value());
    EXPECT_EQ(merged.conflicts[0].value_from_b, Value{9});
    // A removes x, then B's replace recreates it.
    EXPECT_EQ(merged.result, (Value{Mapping{{"y", 0}, {"x", 9}}}));
}

TEST(Merge, both_removing_the_same_key_agree_and_apply_once) {
    const auto base = Value{Mapping{{"x", 0}, {"y", 0}}};
    const auto delta = changes_of({remove_op(Path{"x"}, 0)});
    const auto merged = merge(base, delta, delta);
    EXPECT_FALSE(merged.has_conflicts());
    EXPECT_EQ(merged.result, (Value{Mapping{{"y", 0}}}));
}

TEST(Merge, identical_moves_apply_once) {
    const auto base = Value{Mapping{{"old", "v"}}};
    const auto delta = changes_of({move_op(Path{"new"}, Path{"old"})});
    const auto merged = merge(base, delta, delta);
    EXPECT_FALSE(merged.has_conflicts());
    EXPECT_EQ(merged.result, (Value{Mapping{{"new", "v"}}}));
}

TEST(Merge, identical_appends_add_one_element) {
    const auto base = Value{Mapping{{"items", Sequence{"a"}}}};
    const auto delta = changes_of({add_op(Path{"items", std::size_t{1}}, "b")});
    const auto merged = merge(base, delta, delta);
    EXPECT_FALSE(merged.has_conflicts());
    EXPECT_EQ(merged.result, (Value{Mapping{{"items", Sequence{"a", "b"}}}}));
}

TEST(Merge, last_operation_per_path_is_compared) {
    const auto base = Value{Mapping{{"x", 0}}};
    const auto delta_a = changes_of({replace_op(Path{"x"}, 7), replace_op(Path{"x"}, 3)});
    const auto delta_b = changes_of({replace_op(Path{"x"}, 3)});
    const auto merged = merge(base, delta_a, delta_b);
    EXPECT_FALSE(merged.has_conflicts());
}

TEST(Merge, copy_compares_the_value_found_in_base) {
    const auto base = Value{Mapping{{"src", "s"}, {"dst", "d"}}};
    const auto delta_a = changes_of({copy_op(Path{"dst"}, Path{"src"})});
    const auto delta_b = changes_of({replace_op(Path{"dst"}, "s")});
    const auto merged = merge(base, delta_a, delta_b);
    EXPECT_FALSE(merged.has_conflicts());
    EXPECT_EQ(merged.result, (Value{Mapping{{"src", "s"}, {"dst", "s"}}}));
}

TEST(Merge, conflicts_follow_first_delta_order) {
    const auto base = Value{Mapping{{"a", 0}, {"b", 0}, {"c", 0}}};
    const auto delta_a = changes_of({
        replace_op(Path{"c"}, 1), replace_op(Path{"a"}, 1), replace_op(Path{"b"}, 1),
    });
    const auto delta_b = changes_of({
        replace_op(Path{"a"}, 2), replace_op(Path{"b"}, 2), replace_op(Path{"c"}, 2),
    });
    const auto merged = merge(base, delta_a, delta_b);
    ASSERT_EQ(merged.conflicts.size(), 3u);
    EXPECT_EQ(merged.conflicts[0].path, Path{"c"});
    EXPECT_EQ(merged.conflicts[1].path, Path{"a"});
    EXPECT_EQ(merged.conflicts[2].path, Path{"b"});
}

TEST(Merge, index_and_key_spelling_of_a_path_meet) {
    const auto base = Value{Sequence{0}};
    const auto delta_a = changes_of({replace_op(Path{std::size_t{0}}, 1)});
    const auto delta_b = changes_of({replace_op(Path{"0"}, 2)});
    const auto merged = merge(base, delta_a, delta_b);
    ASSERT_EQ(merged.conflicts.size(), 1u);
    EXPECT_EQ(merged.result, (Value{Sequence{2}}));
}

// -- Nested edits -------------------------------------------------------------

TEST(Merge, replacing_a_parent_while_the_other_edits_inside_conflicts) {
    const auto base = Value{Mapping{{"a", Mapping{{"x", 1}}}}};
    const auto delta_a = changes_of({replace_op(Path{"a"}, 5)});
    const auto delta_b = changes_of({replace_op(Path{"a", "x"}, 2)});

    const auto merged = merge(base, delta_a, delta_b);
    ASSERT_EQ(merged.conflicts.size(), 1u);
    EXPECT_EQ(merged.conflicts[0], (Conflict{Path{"a"}, Value{5}, Value{Mapping{{"x", 2}}}}));
    EXPECT_EQ(merged.result, (Value{Mapping{{"a", Mapping{{"x", 2}}}}}));

    const auto reversed = merge(base, delta_b, delta_a);
    ASSERT_EQ(reversed.conflicts.size(), 1u);
    EXPECT_EQ(reversed.conflicts[0].path, Path{"a"});
    EXPECT_EQ(reversed.result, (Value{Mapping{{"a", 5}}}));
}

TEST(Merge, removing_a_parent_while_the_other_removes_inside_conflicts) {
    const auto base = Value{Mapping{{"a", Mapping{{"b", 1}}}}};
    const auto delta_a = changes_of({remove_op(Path{"a"})});
    const auto delta_b = changes_of({remove_op(Path{"a", "b"})});

    const auto merged = merge(base, delta_a, delta_b);
    ASSERT_EQ(merged.conflicts.size(), 1u);
    EXPECT_FALSE(merged.conflicts[0].value_from_a.has_value());
    EXPECT_EQ(merged.conflicts[0].value_from_b, Value{Mapping{}});
    EXPECT_EQ(merged.result, (Value{Mapping{{"a", Mapping{}}}}));

    const auto reversed = merge(base, delta_b, delta_a);
    ASSERT_EQ(reversed.conflicts.size(), 1u);
    EXPECT_EQ(reversed.result, Value{Mapping{}});
}

TEST(Merge, removed_element_edited_by_the_other_side_is_reported) {
    const auto base = Value{Mapping{{"s", Sequence{Mapping{{"v", 1}}, Mapping{{"v", 2}}}}}};
    const auto local = Value{Mapping{{"s", Sequence{Mapping{{"v", 1}}}}}};
    const auto remote = Value{Mapping{{"s", Sequence{Mapping{{"v", 1}}, Mapping{{"v", 3}}}}}};

    const auto merged = three_way_merge(base, local, remote);
    ASSERT_EQ(merged.conflicts.size(), 1u);
    EXPECT_EQ(merged.conflicts[0].path, (Path{"s", std::size_t{1}}));
    EXPECT_FALSE(merged.conflicts[0].value_from_a.has_value());
    EXPECT_EQ(merged.conflicts[0].value_from_b, (Value{Mapping{{"v", 3}}}));
    EXPECT_EQ(merged.result, remote);

    const auto reversed = three_way_merge(base, remote, local);
    ASSERT_EQ(reversed.conflicts.size(), 1u);
    EXPECT_EQ(reversed.result, local);
}

TEST(Merge, nested_edits_in_agreement_do_not_conflict) {
    const auto base = Value{Mapping{{"a", Mapping{{"b", 1}}}, {"k", 0}}};
    const auto delta_a = changes_of({remove_op(Path{"a"})});
    const auto delta_b = changes_of({remove_op(Path{"a", "b"}), remove_op(Path{"a"})});

    const auto merged = merge(base, delta_a, delta_b);
    EXPECT_FALSE(merged.has_conflicts());
    EXPECT_EQ(merged.result, (Value{Mapping{{"k", 0}}}));
}

TEST(Merge, edit_that_no_longer_applies_is_reported_and_skipped) {
    const auto base = Value{Mapping{{"s", Sequence{1, 2, 3}}}};
    const auto delta_a = changes_of({remove_op(Path{"s", std::size_t{2}})});
    const auto delta_b = changes_of({
        move_op(Path{"t"}, Path{"s", std::size_t{2}}),
        replace_op(Path{"u"}, true),
    });

    const auto merged = merge(base, delta_a, delta_b);
    ASSERT_EQ(merged.conflicts.size(), 1u);
    EXPECT_EQ(merged.conflicts[0], (Conflict{Path{"t"}, std::nullopt, Value{3}}));
    EXPECT_EQ(merged.result, (Value{Mapping{{"s", Sequence{1, 2}}, {"u", true}}}));
}

TEST(Merge, list_that_does_not_fit_the_base_throws) {
    const auto base = Value{Mapping{{"a", 1}}};
    const auto delta_a = changes_of({remove_op(Path{"missing"})});
    EXPECT_THROW(merge(base, delta_a, ChangeList{}), PathNotFoundError);
    EXPECT_THROW(merge(base, ChangeList{}, delta_a), PathNotFoundError);
}

// -- three_way_merge ----------------------------------------------------------

TEST(ThreeWayMerge, combines_independent_edits) {
    const auto base = Value{Mapping{{"title", "t"}, {"body", "b"}, {"tags", Sequence{}}}};
    const auto local = Value{Mapping{{"title", "T"}, {"body", "b"}, {"tags", Sequence{}}}};
    const auto remote = Value{Mapping{{"title", "t"}, {"body", "B"}, {"tags", Sequence{"x"}}}};

    const auto merged = three_way_merge(base, local, remote);
    EXPECT_FALSE(merged.has_conflicts());
    EXPECT_EQ(merged.result,
              (Value{Mapping{{"title", "T"}, {"body", "B"}, {"tags", Sequence{"x"}}}}));
}

TEST(ThreeWayMerge, reports_conflicting_edits) {
    const auto base = Value{Mapping{{"n", 1}}};
    const auto merged = three_way_merge(base, Value{Mapping{{"n", 2}}}, Value{Mapping{{"n", 3}}});
    ASSERT_EQ(merged.conflicts.size(), 1u);
    EXPECT_EQ(merged.conflicts[0], (Conflict{Path{"n"}, Value{2}, Value{3}}));
    EXPECT_EQ(merged.result, (Value{Mapping{{"n", 3}}}));
}

TEST(ThreeWayMerge, disjoint_edits_merge_cleanly_in_either_order) {
    struct Case {
        Value base;
        Value local;
        Value remote;
        Value expected;
    };
    const auto cases = std::vector<Case>{
        // Sibling keys.
        {Value{Mapping{{"a", 1}, {"b", 1}}}, Value{Mapping{{"a", 2}, {"b", 1}}},
         Value{Mapping{{"a", 1}, {"b", 2}}}, Value{Mapping{{"a", 2}, {"b", 2}}}},
        // Nested remove and add in different subtrees.
        {Value{Mapping{{"p", Mapping{{"x", 1}}}, {"q", Mapping{{"y", 1}}}}},
         Value{Mapping{{"p", Mapping{}}, {"q", Mapping{{"y", 1}}}}},
         Value{Mapping{{"p", Mapping{{"x", 1}}}, {"q", Mapping{{"y", 1}, {"z", 2}}}}},
         Value{Mapping{{"p", Mapping{}}, {"q", Mapping{{"y", 1}, {"z", 2}}}}}},
        // Different sequence elements.
        {Value{Mapping{{"s", Sequence{1, 2, 3}}}}, Value{Mapping{{"s", Sequence{9, 2, 3}}}},
         Value{Mapping{{"s", Sequence{1, 2, 8}}}}, Value{Mapping{{"s", Sequence{9, 2, 8}}}}},
        // Element edit against an append.
        {Value{Mapping{{"s", Sequence{Mapping{{"v", 1}}}}}},
         Value{Mapping{{"s", Sequence{Mapping{{"v", 2}}}}}},
         Value{Mapping{{"s", Sequence{Mapping{{"v", 1}}, Mapping{{"v", 5}}}}}},
         Value{Mapping{{"s", Sequence{Mapping{{"v", 2}}, Mapping{{"v", 5}}}}}}},
        // Trailing removal against an edit of an earlier element.
        {Value{Mapping{{"s", Sequence{1, 2, 3}}}}, Value{Mapping{{"s", Sequence{1, 2}}}},
         Value{Mapping{{"s", Sequence{5, 2, 3}}}}, Value{Mapping{{"s", Sequence{5, 2}}}}},
        // New subtrees on both sides.
        {Value{Mapping{}}, Value{Mapping{{"a", Mapping{{"b", 1}}}}},
         Value{Mapping{{"c", Sequence{1}}}},
         Value{Mapping{{"a", Mapping{{"b", 1}}}, {"c", Sequence{1}}}}},
    };
    for (const auto& c : cases) {
        auto forward = MergeResult{};
        auto backward = MergeResult{};
        ASSERT_NO_THROW(forward = three_way_merge(c.base, c.local, c.remote));
        ASSERT_NO_THROW(backward = three_way_merge(c.base, c.remote, c.local));
        EXPECT_FALSE(forward.has_conflicts());
        EXPECT_FALSE(backward.has_conflicts());
        EXPECT_EQ(forward.result, c.expected);
        EXPECT_EQ(backward.result, c.expected);
    }
}

TEST(ThreeWayMerge, overlapping_edits_never_throw_and_remote_wins) {
    struct Case {
        Value base;
        Value local;
        Value remote;
    };
    const auto cases = std::vector<Case>{
        {Value{Mapping{{"a", Mapping{{"b", 1}}}}}, Value{Mapping{}},
         Value{Mapping{{"a", Mapping{}}}}},
        {Value{Mapping{{"a", Mapping{{"x", 1}}}}}, Value{Mapping{{"a", 5}}},
         Value{Mapping{{"a", Mapping{{"x", 2}}}}}},
        {Value{Mapping{{"s", Sequence{Mapping{{"v", 1}}, Mapping{{"v", 2}}}}}},
         Value{Mapping{{"s", Sequence{Mapping{{"v", 1}}}}}},
         Value{Mapping{{"s", Sequence{Mapping{{"v", 1}}, Mapping{{"v", 3}}}}}}},
        {Value{Mapping{{"s", Sequence{1, 2}}}}, Value{Mapping{{"s", "flat"}}},
         Value{Mapping{{"s", Sequence{1, 2, 3}}}}},
        {Value{Mapping{{"m", Mapping{{"n", Mapping{{"o", 1}}}}}}},
         Value{Mapping{{"m", Mapping{{"n", Sequence{}}}}}},
         Value{Mapping{{"m", Mapping{{"n", Mapping{{"o", 2}, {"p", 3}}}}}}}},
    };
    for (const auto& c : cases) {
        auto forward = MergeResult{};
        auto backward = MergeResult{};
        ASSERT_NO_THROW(forward = three_way_merge(c.base, c.local, c.remote));
        ASSERT_NO_THROW(backward = three_way_merge(c.base, c.remote, c.local));
        EXPECT_TRUE(forward.has_conflicts());
        EXPECT_EQ(forward.conflicts.size(), backward.conflicts.size());
        EXPECT_EQ(forward.result, c.remote);
        EXPECT_EQ(backward.result, c.local);
    }
}
