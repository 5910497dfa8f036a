/**
 * @file propgraph_benchmark.cpp
 * @brief PropGraph schema construction and evaluation benchmark
 *
 * Benchmark categories:
 * 1. Schema Construction - Validation, cycle check and ordering
 * 2. Evaluation - Clause dispatch over the evaluation order
 * 3. Building Blocks - Value and record operations used per property
 */

#include <benchmark/benchmark.h>
#include "PropGraph/PropGraph.hpp"

#include <string>
#include <vector>

using namespace propgraph;

// ============================================================================
// Property Sets
// ============================================================================

static Schema ExampleSchema() {
    SchemaBuilder<int> builder;
    builder.property<int>("p")
        .clause([](int i, const Record&) { return i + 1; });
    builder.property<int>("q")
        .clause(Pattern().bind("p"),
                [](int, const Record& b) { return b.get<int>("p") > 0; },
                [](int i, const Record&) { return i * 5; })
        .clause(Pattern().equals("p", 3),
                [](int i, const Record&) { return i * 5; })
        .clause(Pattern().bind("p"),
                [](int i, const Record& r) { return r.get<int>("p") * i; });
    builder.property<int>("r")
        .clause(Pattern().bind("p").bind("q").bind("z"),
                [](int, const Record& r) { return r.get<int>("p") * r.get<int>("q"); });
    builder.property<int>("z")
        .clause(Pattern().bind("q"),
                [](int, const Record& r) { return r.get<int>("q") * 5; });
    return builder.build();
}

// Chain of n properties, each requiring its predecessor, declared in reverse
static std::vector<PropertyDeclaration> ChainDeclarations(int n) {
    std::vector<PropertyDeclaration> declarations;
    declarations.reserve(static_cast<std::size_t>(n));
    for (int i = n - 1; i >= 0; --i) {
        Clause clause;
        if (i > 0) {
            Pattern previous = Pattern().bind("v" + std::to_string(i - 1));
            clause.pattern = previous.predicate();
            clause.required_names = previous.referenced_names();
        }
        clause.body = [](const Value& input, const Record& partial) {
            return Value::create(input.get<int>() + static_cast<int>(partial.size()));
        };
        declarations.push_back(PropertyDeclaration{"v" + std::to_string(i), {std::move(clause)}});
    }
    return declarations;
}

// ============================================================================
// 1. Schema Construction Benchmarks
// ============================================================================

static void PropGraph_BuildSchema_Example(benchmark::State& state) {
    for (auto _ : state) {
        auto schema = ExampleSchema();
        benchmark::DoNotOptimize(schema);
    }
}
BENCHMARK(PropGraph_BuildSchema_Example);

static void PropGraph_BuildSchema_Chain(benchmark::State& state) {
    auto declarations = ChainDeclarations(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto schema = build_schema(declarations);
        benchmark::DoNotOptimize(schema);
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(PropGraph_BuildSchema_Chain)->RangeMultiplier(4)->Range(16, 4096)->Complexity();

static void PropGraph_CycleDetection(benchmark::State& state) {
    auto graph = build_graph(ChainDeclarations(static_cast<int>(state.range(0))));
    for (auto _ : state) {
        auto cycle = find_cycle(graph);
        benchmark::DoNotOptimize(cycle);
    }
}
BENCHMARK(PropGraph_CycleDetection)->Arg(256)->Arg(4096);

// ============================================================================
// 2. Evaluation Benchmarks
// ============================================================================

static void PropGraph_Evaluate_Example(benchmark::State& state) {
    auto schema = ExampleSchema();
    int input = 0;
    for (auto _ : state) {
        auto result = evaluate(schema, input++ % 1000);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(PropGraph_Evaluate_Example);

// Input already wrapped, skips the typed overload
static void PropGraph_Evaluate_PreparedInput(benchmark::State& state) {
    auto schema = ExampleSchema();
    const Value input = Value::create(2);
    for (auto _ : state) {
        auto result = evaluate(schema, input);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(PropGraph_Evaluate_PreparedInput);

static void PropGraph_Evaluate_Chain(benchmark::State& state) {
    auto schema = build_schema(ChainDeclarations(static_cast<int>(state.range(0))));
    const Value input = Value::create(1);
    for (auto _ : state) {
        auto result = evaluate(schema, input);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(PropGraph_Evaluate_Chain)->Arg(16)->Arg(256)->Arg(1024);

// ============================================================================
// 3. Building Block Benchmarks
// ============================================================================

static void PropGraph_Value_CreateSmall(benchmark::State& state) {
    int i = 0;
    for (auto _ : state) {
        auto v = Value::create(i++);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(PropGraph_Value_CreateSmall);

static void PropGraph_Value_CreateString(benchmark::State& state) {
    const std::string text(48, 'x');
    for (auto _ : state) {
        auto v = Value::create(text);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(PropGraph_Value_CreateString);

static void PropGraph_Record_Lookup(benchmark::State& state) {
    PartialResult record;
    for (int i = 0; i < 32; ++i) {
        record.bind("property" + std::to_string(i), Value::create(i));
    }
    std::string_view name = "property17";

    int sum = 0;
    for (auto _ : state) {
        sum += record.get<int>(name);
        benchmark::DoNotOptimize(sum);
    }
}
BENCHMARK(PropGraph_Record_Lookup);

static void PropGraph_Pattern_Match(benchmark::State& state) {
    PartialResult partial;
    partial.bind("p", Value::create(3));
    partial.bind("q", Value::create(10));
    const Pattern pattern = Pattern().equals("p", 3).bind("q");

    for (auto _ : state) {
        PartialResult bindings;
        bool matched = pattern.match(partial, bindings);
        benchmark::DoNotOptimize(matched);
    }
}
BENCHMARK(PropGraph_Pattern_Match);

BENCHMARK_MAIN();
