#include "engine/batch_runner.h"
#include "engine/hedging_engine.h"
#include "instruments/european_option.h"
#include "market/scenario_generator.h"
#include "utils/logger.h"
#include <benchmark/benchmark.h>
#include <random>
#include <vector>

using namespace hedging;

class HedgingEngineBenchmark : public benchmark::Fixture {
protected:
    Portfolio book;
    EngineConfig config;
    std::shared_ptr<const MarketFeed> feed;
    std::mt19937 rng{42};
    std::uniform_real_distribution<double> strike_dist{80.0, 120.0};
    std::uniform_real_distribution<double> qty_dist{-1000.0, 1000.0};
    std::uniform_int_distribution<int> tenor_dist{60, 720};
    std::uniform_int_distribution<int> type_dist{0, 1};

    void SetUp(const ::benchmark::State& state) override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);

        const Date start = Date::parse("2024-03-01");
        const int num_days = static_cast<int>(state.range(0));
        const int num_positions = static_cast<int>(state.range(1));

        // Random option book
        book = Portfolio();
        for (int i = 0; i < num_positions; ++i) {
            book.addPosition(std::make_shared<EuropeanOption>(
                                 strike_dist(rng), start.addDays(tenor_dist(rng)),
                                 type_dist(rng) == 0 ? OptionType::CALL : OptionType::PUT),
                             qty_dist(rng));
        }

        config = EngineConfig();
        config.gamma_hedge_instrument =
            std::make_shared<EuropeanOption>(100.0, start.addDays(90), OptionType::CALL);
        config.vega_hedge_instrument =
            std::make_shared<EuropeanOption>(100.0, start.addDays(5 * 365), OptionType::CALL);

        ScenarioGenerator generator;
        feed = std::make_shared<MarketFeed>(
            generator.simulate(start, num_days, {-0.20, 2.0, 0.005, 0.01}));
    }
};

BENCHMARK_DEFINE_F(HedgingEngineBenchmark, FullRun)(benchmark::State& state) {
    HedgingEngine engine(book, feed, config);

    for (auto _ : state) {
        const auto& rows = engine.run();
        benchmark::DoNotOptimize(rows.back().total_pnl);
    }

    state.SetItemsProcessed(state.iterations() * feed->size());
}

BENCHMARK_DEFINE_F(HedgingEngineBenchmark, CascadeRebalance)(benchmark::State& state) {
    HedgingEngine engine(book, feed, config);
    const RebalancingCascade& cascade = engine.getCascade();
    const MarketSnapshot& snapshot = feed->back();

    for (auto _ : state) {
        HedgeLedger ledger(engine.getInitialState());
        CascadeResult result = cascade.rebalance(snapshot, ledger);
        benchmark::DoNotOptimize(result);
    }
}

BENCHMARK_DEFINE_F(HedgingEngineBenchmark, PortfolioAggregation)(benchmark::State& state) {
    const MarketSnapshot& snapshot = feed->back();

    for (auto _ : state) {
        RiskVector risk = PortfolioAggregator::aggregate(book, snapshot);
        benchmark::DoNotOptimize(risk);
    }

    state.SetItemsProcessed(state.iterations() * book.size());
}

// All presets through the worker pool
static void BM_BatchRunnerPresets(benchmark::State& state) {
    Logger::getInstance().setLogLevel(LogLevel::ERROR);

    const Date start = Date::parse("2024-03-01");
    Portfolio book;
    book.addPosition(std::make_shared<EuropeanOption>(100.0, start.addDays(294), OptionType::CALL), -1000.0);
    book.addPosition(std::make_shared<EuropeanOption>(90.0, start.addDays(294), OptionType::PUT), 500.0);

    EngineConfig config;
    config.gamma_hedge_instrument =
        std::make_shared<EuropeanOption>(100.0, start.addDays(77), OptionType::CALL);
    config.vega_hedge_instrument =
        std::make_shared<EuropeanOption>(100.0, start.addDays(476), OptionType::CALL);

    ScenarioGenerator generator;
    std::vector<ScenarioRun> runs;
    for (const auto& preset : ScenarioGenerator::presets()) {
        runs.push_back({preset.name, book,
                        std::make_shared<MarketFeed>(
                            generator.simulatePreset(preset.name, start, 250)),
                        config});
    }

    BatchRunner runner(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        auto outcomes = runner.run(runs);
        benchmark::DoNotOptimize(outcomes);
    }

    state.SetItemsProcessed(state.iterations() * runs.size());
}

// Register benchmarks
BENCHMARK_REGISTER_F(HedgingEngineBenchmark, FullRun)
    ->Args({20, 2})
    ->Args({252, 2})
    ->Args({252, 50})
    ->Args({2520, 10})
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_REGISTER_F(HedgingEngineBenchmark, CascadeRebalance)
    ->Args({20, 2})
    ->Args({20, 50})
    ->Args({20, 500})
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_REGISTER_F(HedgingEngineBenchmark, PortfolioAggregation)
    ->Args({20, 10})
    ->Args({20, 100})
    ->Args({20, 1000});

BENCHMARK(BM_BatchRunnerPresets)
    ->Arg(1)
    ->Arg(2)
    ->Arg(4)
    ->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
