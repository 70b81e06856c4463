// SPDX-License-Identifier: MIT
/**
 * @file lsm_performance.cc
 * @brief Benchmarks for path simulation, backward induction and the dual bound
 *
 * Run with: ./lsm_performance --benchmark_filter=BM_BackwardInduction
 */

#include "src/option/backward_induction.hpp"
#include "src/option/dual_upper_bound.hpp"
#include "src/option/lsm_pricer.hpp"
#include "src/simulation/path_simulator.hpp"
#include "src/simulation/random_source.hpp"
#include <benchmark/benchmark.h>
#include <cmath>

using namespace lsmc;

namespace {

constexpr double kRate = 0.05;
constexpr double kVol = 0.2;
constexpr size_t kTimesteps = 64;

double step() { return 1.0 / static_cast<double>(kTimesteps - 1); }

PathSimulator make_simulator() {
    return PathSimulator(GbmDynamics{.rate = kRate, .volatility = kVol, .dt = step()});
}

}  // namespace

static void BM_SimulatePaths(benchmark::State& state) {
    const auto n_path = static_cast<size_t>(state.range(0));
    auto sim = make_simulator();
    RandomSource rng(1);

    for (auto _ : state) {
        PathTensor x = sim.simulate(n_path, kTimesteps, 1.0, rng);
        benchmark::DoNotOptimize(x.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n_path * kTimesteps));
}
BENCHMARK(BM_SimulatePaths)->Arg(10000)->Arg(100000)->Unit(benchmark::kMillisecond);

static void BM_BackwardInduction(benchmark::State& state) {
    const auto n_path = static_cast<size_t>(state.range(0));
    const bool itm = state.range(1) != 0;
    auto sim = make_simulator();
    RandomSource rng(2);
    const PathTensor x = sim.simulate(n_path, kTimesteps, 1.0, rng);
    const Payoff put = Payoff::put(1.0);
    const double df = std::exp(-kRate * step());

    for (auto _ : state) {
        auto result = fit_and_value(x, put, df, RegressionConfig{.order = 3, .in_the_money_only = itm});
        if (!result.has_value()) {
            state.SkipWithError("backward induction failed");
            break;
        }
        benchmark::DoNotOptimize(result->npv);
    }
    state.SetLabel(itm ? "in-the-money" : "full cross-section");
}
BENCHMARK(BM_BackwardInduction)
    ->Args({10000, 0})
    ->Args({10000, 1})
    ->Args({100000, 0})
    ->Args({100000, 1})
    ->Unit(benchmark::kMillisecond);

static void BM_DualUpperBound(benchmark::State& state) {
    const auto n_minipath = static_cast<size_t>(state.range(0));
    LsmConfig config{.n_timestep = 16, .n_path = 2000, .seed = 3};
    auto pricer = LongstaffSchwartzPricer::create(config);
    if (!pricer.has_value()) {
        state.SkipWithError("invalid config");
        return;
    }
    auto lower = pricer->solve();
    if (!lower.has_value()) {
        state.SkipWithError("pricing failed");
        return;
    }

    for (auto _ : state) {
        auto upper = pricer->upper_bound(*lower, n_minipath);
        if (!upper.has_value()) {
            state.SkipWithError("upper bound failed");
            break;
        }
        benchmark::DoNotOptimize(upper->upper_bound);
    }
    state.counters["endpoints"] = static_cast<double>(15 * 2000 * n_minipath);
}
BENCHMARK(BM_DualUpperBound)->Arg(10)->Arg(100)->Unit(benchmark::kMillisecond);

static void BM_SolveReferenceScenario(benchmark::State& state) {
    LsmConfig config{.seed = 1, .use_independent_paths = true};
    LongstaffSchwartzPricer pricer(config);

    for (auto _ : state) {
        auto result = pricer.solve();
        if (!result.has_value()) {
            state.SkipWithError("pricing failed");
            break;
        }
        benchmark::DoNotOptimize(result->npv);
    }
}
BENCHMARK(BM_SolveReferenceScenario)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
