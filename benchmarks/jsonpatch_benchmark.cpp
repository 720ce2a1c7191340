// jsonpatch-cpp benchmarks: measures throughput of apply and diff.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace jsonpatch_cpp;
using json = nlohmann::ordered_json;

// An object with `n` members, each holding a small record.
static auto make_records(std::size_t n) -> json {
    auto doc = json::object();
    for (std::size_t i = 0; i < n; ++i) {
        doc["key" + std::to_string(i)] = json{
            {"id", i},
            {"name", "item" + std::to_string(i)},
            {"tags", json::array({"a", "b"})},
        };
    }
    return doc;
}

static auto make_list(std::size_t n) -> json {
    auto list = json::array();
    for (std::size_t i = 0; i < n; ++i) list.push_back(static_cast<std::int64_t>(i));
    return list;
}

// =============================================================================
// Pointer
// =============================================================================

static void bm_pointer_parse(benchmark::State& state) {
    for (auto _ : state) {
        auto p = Pointer::parse("/users/12/address/street~1name");
        benchmark::DoNotOptimize(p);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_pointer_parse);

static void bm_pointer_resolve(benchmark::State& state) {
    const auto doc = make_records(100);
    const auto p = Pointer::parse("/key50/tags/1");
    for (auto _ : state) {
        const auto& v = resolve(doc, p);
        benchmark::DoNotOptimize(&v);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_pointer_resolve);

// =============================================================================
// Apply
// =============================================================================

static void bm_apply_add_batch(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto wire = json::array();
    for (std::size_t i = 0; i < n; ++i) {
        wire.push_back({{"op", "add"}, {"path", "/list/-"}, {"value", i}});
    }
    const auto patch = Patch::from_json(wire);
    const auto doc = json{{"list", json::array()}};

    for (auto _ : state) {
        auto out = patch.apply(doc);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_apply_add_batch)->Range(10, 1000);

static void bm_apply_in_place_replace(benchmark::State& state) {
    auto doc = make_records(100);
    const auto patch = Patch::from_string(R"([
        {"op": "test", "path": "/key10/id", "value": 10},
        {"op": "replace", "path": "/key10/name", "value": "renamed"},
        {"op": "replace", "path": "/key20/tags/0", "value": "z"}
    ])");
    for (auto _ : state) {
        patch.apply_in_place(doc);
    }
    state.SetItemsProcessed(state.iterations() * 3);
}
BENCHMARK(bm_apply_in_place_replace);

static void bm_patch_from_string(benchmark::State& state) {
    const auto text = std::string{R"([
        {"op": "add", "path": "/a/-", "value": {"x": [1, 2, 3]}},
        {"op": "move", "from": "/a/0", "path": "/b"},
        {"op": "copy", "from": "/b", "path": "/c"},
        {"op": "remove", "path": "/c/x/1"}
    ])"};
    for (auto _ : state) {
        auto p = Patch::from_string(text);
        benchmark::DoNotOptimize(p);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_patch_from_string);

// =============================================================================
// Diff
// =============================================================================

static void bm_diff_objects(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto src = make_records(n);
    auto dst = src;
    for (std::size_t i = 0; i < n; i += 10) {
        dst["key" + std::to_string(i)]["name"] = "changed";
    }
    for (auto _ : state) {
        auto p = make_patch(src, dst);
        benchmark::DoNotOptimize(p);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_objects)->Range(10, 1000);

static void bm_diff_renamed_members(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto src = make_records(n);
    auto dst = json::object();
    for (const auto& [key, value] : src.items()) dst["renamed_" + key] = value;
    for (auto _ : state) {
        auto p = make_patch(src, dst);
        benchmark::DoNotOptimize(p);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_renamed_members)->Range(10, 1000);

static void bm_diff_list_front_insert(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto src = make_list(n);
    auto dst = src;
    dst.insert(dst.begin(), -1);
    for (auto _ : state) {
        auto p = make_patch(src, dst);
        benchmark::DoNotOptimize(p);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_list_front_insert)->Range(10, 1000);
