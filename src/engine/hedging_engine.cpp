#include "engine/hedging_engine.h"
#include "utils/logger.h"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace hedging {

HedgingEngine::HedgingEngine(Portfolio base, std::shared_ptr<const MarketFeed> feed,
                             EngineConfig config)
    : feed_(std::move(feed)),
      config_(std::move(config)),
      cascade_(std::move(base),
               HedgeInstruments{config_.gamma_hedge_instrument, config_.vega_hedge_instrument},
               FrictionCostModel(requireFeed(feed_).front().vol,
                                 config_.stock_spread_bps, config_.option_spread_bps),
               requireInterval(config_.rehedge_interval)),
      initial_state_(cascade_.neutralize(feed_->front())),
      ledger_(initial_state_),
      reporter_(cascade_.getBasePortfolio(), cascade_.getHedgeInstruments()) {}

const MarketFeed& HedgingEngine::requireFeed(const std::shared_ptr<const MarketFeed>& feed) {
    if (!feed) {
        throw std::invalid_argument("HedgingEngine: market feed must not be null");
    }
    return *feed;
}

size_t HedgingEngine::requireInterval(int rehedge_interval) {
    if (rehedge_interval < 1) {
        throw std::invalid_argument("HedgingEngine: rehedge_interval must be >= 1");
    }
    return static_cast<size_t>(rehedge_interval);
}

const std::vector<ResultRow>& HedgingEngine::run() {
    PERF_LOG("HedgingEngine::run");

    std::ostringstream ss;
    ss << "Hedging run: " << feed_->size() << " steps "
       << feed_->front().date << " -> " << feed_->back().date
       << ", rehedge every " << cascade_.getRehedgeInterval() << " step(s), "
       << cascade_.getBasePortfolio().size() << " base position(s)";
    LOG_INFO(ss.str());

    ledger_ = HedgeLedger(initial_state_);
    reporter_.clear();

    size_t step = 0;
    for (const auto& snapshot : *feed_) {
        const StepReport report = cascade_.transition(snapshot, step, ledger_);
        reporter_.record(snapshot, ledger_.state(), report);
        ++step;
    }

    const RunSummary summary = reporter_.summarize();
    std::ostringstream done;
    done << "Hedging run complete: final P&L " << summary.final_pnl
         << ", transaction costs " << summary.total_transaction_cost
         << ", funding " << summary.total_funding_cost;
    LOG_INFO(done.str());

    return reporter_.rows();
}

} // namespace hedging
