// treedelta-cpp benchmarks: throughput of diff, apply, optimize, merge and
// checksum over generated documents.

#include <treedelta-cpp/treedelta.hpp>
#include <treedelta-cpp/json.hpp>

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <string>

using namespace treedelta_cpp;

// A list of n records, each a small mapping.
static auto make_records(std::size_t n, int revision) -> Value {
    auto records = Sequence{};
    records.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        records.push_back(Mapping{
            {"id", i},
            {"name", "user" + std::to_string(i)},
            {"score", static_cast<double>(i % 7 == 0 ? revision : 0)},
            {"tags", Sequence{"a", "b"}},
        });
    }
    return Mapping{{"records", std::move(records)}, {"revision", revision}};
}

// =============================================================================
// Differencer
// =============================================================================

static void bm_diff_identical(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto doc = make_records(n, 1);
    for (auto _ : state) {
        auto ops = diff_operations(doc, doc);
        benchmark::DoNotOptimize(ops);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_identical)->Range(10, 10000);

static void bm_diff_sparse_edits(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto before = make_records(n, 1);
    const auto after = make_records(n, 2);
    for (auto _ : state) {
        auto ops = diff_operations(before, after);
        benchmark::DoNotOptimize(ops);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_sparse_edits)->Range(10, 10000);

// =============================================================================
// Patcher
// =============================================================================

static void bm_apply_sparse_edits(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto before = make_records(n, 1);
    const auto changes = diff(before, make_records(n, 2));
    for (auto _ : state) {
        auto result = treedelta_cpp::apply(before, changes);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * changes.size()));
}
BENCHMARK(bm_apply_sparse_edits)->Range(10, 10000);

static void bm_apply_appends(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto changes = ChangeList{};
    for (std::size_t i = 0; i < n; ++i) {
        changes.operations.push_back(add_op(Path{"list", i}, static_cast<double>(i)));
    }
    const auto base = Value{Mapping{{"list", Sequence{}}}};
    for (auto _ : state) {
        auto result = treedelta_cpp::apply(base, changes);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_apply_appends)->Range(10, 10000);

// =============================================================================
// Compactor
// =============================================================================

static void bm_optimize_repeated_writes(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto changes = ChangeList{};
    for (std::size_t i = 0; i < n; ++i) {
        changes.operations.push_back(replace_op(Path{"k" + std::to_string(i % 16)}, i));
    }
    for (auto _ : state) {
        auto compacted = optimize(changes);
        benchmark::DoNotOptimize(compacted);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_optimize_repeated_writes)->Range(16, 16384);

// =============================================================================
// Merger
// =============================================================================

static void bm_three_way_merge(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto base = make_records(n, 1);
    const auto local = make_records(n, 2);
    auto remote = base;
    remote.as_mapping()->set("revision", 3);
    for (auto _ : state) {
        auto merged = three_way_merge(base, local, remote);
        benchmark::DoNotOptimize(merged);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_three_way_merge)->Range(10, 10000);

// =============================================================================
// Integrity and wire form
// =============================================================================

static void bm_checksum(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto doc = make_records(n, 1);
    for (auto _ : state) {
        auto digest = checksum(doc);
        benchmark::DoNotOptimize(digest);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_checksum)->Range(10, 10000);

static void bm_change_list_round_trip(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto changes = diff(make_records(n, 1), make_records(n, 2));
    for (auto _ : state) {
        auto decoded = parse_change_list(dump_change_list(changes));
        benchmark::DoNotOptimize(decoded);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * changes.size()));
}
BENCHMARK(bm_change_list_round_trip)->Range(10, 10000);
