#pragma once

#include "engine/hedge_ledger.h"
#include "engine/portfolio.h"
#include "engine/rebalancing_cascade.h"
#include "engine/valuation_reporter.h"
#include "instruments/instrument.h"
#include "market/market_feed.h"
#include <memory>
#include <vector>

namespace hedging {

// Recognized engine options
struct EngineConfig {
    int rehedge_interval = 1;  // 1 = rehedge every step
    std::shared_ptr<const Instrument> gamma_hedge_instrument;  // optional
    std::shared_ptr<const Instrument> vega_hedge_instrument;   // optional
    double stock_spread_bps = 5.0;
    double option_spread_bps = 100.0;
};

// One hedging simulation over one market path. Construction performs the
// Day-0 neutralization on the first snapshot and fixes the base vol that
// friction costs scale against. run() replays the feed from that state, so
// an engine can be run more than once with identical results.
class HedgingEngine {
public:
    // Throws std::invalid_argument for a null feed, rehedge_interval < 1 or
    // negative spreads
    HedgingEngine(Portfolio base, std::shared_ptr<const MarketFeed> feed, EngineConfig config);

    const std::vector<ResultRow>& run();

    const std::vector<ResultRow>& getResults() const { return reporter_.rows(); }
    RunSummary getSummary() const { return reporter_.summarize(); }

    const HedgeState& getInitialState() const { return initial_state_; }
    const HedgeState& getState() const { return ledger_.state(); }

    const RebalancingCascade& getCascade() const { return cascade_; }
    const ValuationReporter& getReporter() const { return reporter_; }
    const MarketFeed& getFeed() const { return *feed_; }
    const EngineConfig& getConfig() const { return config_; }
    double getBaseVol() const { return cascade_.getCostModel().getBaseVol(); }

private:
    static const MarketFeed& requireFeed(const std::shared_ptr<const MarketFeed>& feed);
    static size_t requireInterval(int rehedge_interval);

    std::shared_ptr<const MarketFeed> feed_;
    EngineConfig config_;
    RebalancingCascade cascade_;
    HedgeState initial_state_;
    HedgeLedger ledger_;
    ValuationReporter reporter_;
};

} // namespace hedging
