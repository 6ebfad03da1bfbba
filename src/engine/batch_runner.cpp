#include "engine/batch_runner.h"
#include "utils/logger.h"
#include <algorithm>
#include <atomic>
#include <thread>

namespace hedging {

BatchRunner::BatchRunner(size_t worker_count) : worker_count_(worker_count) {
    if (worker_count_ == 0) {
        worker_count_ = std::max(1u, std::thread::hardware_concurrency());
    }
}

std::vector<ScenarioOutcome> BatchRunner::run(const std::vector<ScenarioRun>& runs) const {
    std::vector<ScenarioOutcome> outcomes(runs.size());
    if (runs.empty()) {
        return outcomes;
    }

    const size_t threads = std::min(worker_count_, runs.size());
    LOG_INFO("Running " + std::to_string(runs.size()) + " scenario(s) on " +
             std::to_string(threads) + " worker(s)");

    // Each worker claims the next index; every outcome slot has one writer
    std::atomic<size_t> next_index{0};
    auto worker = [&]() {
        for (size_t i = next_index.fetch_add(1); i < runs.size(); i = next_index.fetch_add(1)) {
            outcomes[i] = runOne(runs[i]);
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (size_t t = 0; t < threads; ++t) {
        pool.emplace_back(worker);
    }
    for (auto& thread : pool) {
        thread.join();
    }

    const auto failures = std::count_if(outcomes.begin(), outcomes.end(),
                                        [](const ScenarioOutcome& o) { return !o.success; });
    if (failures > 0) {
        LOG_WARNING(std::to_string(failures) + " scenario(s) failed");
    }
    return outcomes;
}

ScenarioOutcome BatchRunner::runOne(const ScenarioRun& scenario) {
    ScenarioOutcome outcome;
    outcome.name = scenario.name;
    LogContext context(scenario.name);

    try {
        outcome.feed = scenario.feed;
        if (!outcome.feed && scenario.make_feed) {
            outcome.feed = scenario.make_feed();
        }
        HedgingEngine engine(scenario.portfolio, outcome.feed, scenario.config);
        outcome.rows = engine.run();
        outcome.summary = engine.getSummary();
        outcome.success = true;
    } catch (const std::exception& e) {
        outcome.error = e.what();
        LOG_ERROR("Scenario '" + scenario.name + "' failed: " + outcome.error);
    }
    return outcome;
}

} // namespace hedging
