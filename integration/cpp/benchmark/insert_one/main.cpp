#include "../classes.hpp"

void insert_one(benchmark::State& state) {
    state.PauseTiming();
    auto& spaces = test_spaces::get();
    auto set = termstore::set_t::create_or_throw(spaces.registry(), spaces.actor(), {});
    int n_row = 0;
    state.ResumeTiming();
    for (auto _ : state) {
        for (int i = 0; i < state.range(0); ++i) {
            set.put_or_throw(spaces.actor(), make_tuple(n_row++, atom("value")));
        }
    }
    state.PauseTiming();
    set.delete_table_or_throw(spaces.actor());
    state.ResumeTiming();
}
BENCHMARK(insert_one)->Arg(1)->Arg(10)->Arg(20)->Arg(100)->Arg(500)->Arg(1000);

void insert_many(benchmark::State& state) {
    state.PauseTiming();
    auto& spaces = test_spaces::get();
    auto set = termstore::set_t::create_or_throw(spaces.registry(), spaces.actor(), {});
    int n_row = 0;
    state.ResumeTiming();
    for (auto _ : state) {
        termstore::records_t batch;
        batch.reserve(static_cast<std::size_t>(state.range(0)));
        for (int i = 0; i < state.range(0); ++i) {
            batch.push_back(make_tuple(n_row++, atom("value")));
        }
        set.put_or_throw(spaces.actor(), batch);
    }
    state.PauseTiming();
    set.delete_table_or_throw(spaces.actor());
    state.ResumeTiming();
}
BENCHMARK(insert_many)->Arg(1)->Arg(10)->Arg(20)->Arg(100)->Arg(500)->Arg(1000);

int main(int argc, char** argv) {
    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) {
        return 1;
    }
    test_spaces::get();
    ::benchmark::RunSpecifiedBenchmarks();
    ::benchmark::Shutdown();
    return 0;
}
