#pragma once

#include "engine/hedging_engine.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hedging {

using FeedFactory = std::function<std::shared_ptr<const MarketFeed>()>;

// Inputs of one independent simulation. When `feed` is null it is built by
// `make_feed` on the worker, so a bad feed fails only this scenario.
struct ScenarioRun {
    std::string name;
    Portfolio portfolio;
    std::shared_ptr<const MarketFeed> feed;
    EngineConfig config;
    FeedFactory make_feed;
};

struct ScenarioOutcome {
    std::string name;
    bool success = false;
    std::string error;  // set when success is false
    std::shared_ptr<const MarketFeed> feed;  // feed the run used, null if it could not be built
    std::vector<ResultRow> rows;
    RunSummary summary;
};

// Runs independent scenarios on a pool of worker threads. Each run owns its
// engine and ledger; feeds and instruments are shared read-only.
class BatchRunner {
public:
    // 0 selects the hardware concurrency
    explicit BatchRunner(size_t worker_count = 0);

    // Outcomes are returned in the order of `runs`. A failing scenario is
    // reported in its outcome and does not stop the others.
    std::vector<ScenarioOutcome> run(const std::vector<ScenarioRun>& runs) const;

    size_t getWorkerCount() const { return worker_count_; }

private:
    static ScenarioOutcome runOne(const ScenarioRun& scenario);

    size_t worker_count_;
};

} // namespace hedging
