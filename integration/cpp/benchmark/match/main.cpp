#include "../classes.hpp"

constexpr bool key_on = true;
constexpr bool key_off = false;

#define BENCHMARK_FUNC(FUNC)                                                                                           \
    BENCHMARK(FUNC<key_off>)->Arg(1)->Arg(10)->Arg(100);                                                               \
    BENCHMARK(FUNC<key_on>)->Arg(1)->Arg(10)->Arg(100)

// the group literal sits on the key position only in the lookup table
pattern_t group_pattern(int group) {
    return tuple_pattern(group, var(1), any());
}

template<bool on_key>
void match_all(benchmark::State& state) {
    state.PauseTiming();
    auto& spaces = test_spaces::get();
    auto bag = termstore::bag_t::wrap_existing_or_throw(spaces.registry(), get_table_name<on_key>());
    state.ResumeTiming();
    for (auto _ : state) {
        auto results = bag.match_or_throw(spaces.actor(), group_pattern(7));
        benchmark::DoNotOptimize(results);
    }
}

template<bool on_key>
void match_paginated(benchmark::State& state) {
    state.PauseTiming();
    auto& spaces = test_spaces::get();
    auto bag = termstore::bag_t::wrap_existing_or_throw(spaces.registry(), get_table_name<on_key>());
    auto limit = static_cast<std::size_t>(state.range(0));
    state.ResumeTiming();
    for (auto _ : state) {
        auto page = bag.match_or_throw(spaces.actor(), group_pattern(7), limit);
        while (page.continuation) {
            page = bag.match_or_throw(spaces.actor(), page.continuation);
        }
        benchmark::DoNotOptimize(page);
    }
}

template<bool on_key>
void select_gt(benchmark::State& state) {
    state.PauseTiming();
    auto& spaces = test_spaces::get();
    auto bag = termstore::bag_t::wrap_existing_or_throw(spaces.registry(), get_table_name<on_key>());
    match_spec_t spec{{tuple_pattern(var(1), var(2), any()),
                       {make_compare_guard(guard_type::gt, bound(2), size_table - 100)},
                       body_t::variable(2)}};
    state.ResumeTiming();
    for (auto _ : state) {
        auto page = bag.select_or_throw(spaces.actor(), spec, static_cast<std::size_t>(state.range(0)));
        benchmark::DoNotOptimize(page);
    }
}

BENCHMARK_FUNC(match_all);
BENCHMARK_FUNC(match_paginated);
BENCHMARK_FUNC(select_gt);

int main(int argc, char** argv) {
    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) {
        return 1;
    }
    init_spaces();
    ::benchmark::RunSpecifiedBenchmarks();
    ::benchmark::Shutdown();
    return 0;
}
