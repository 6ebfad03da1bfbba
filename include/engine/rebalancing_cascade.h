#pragma once

#include "engine/friction_cost_model.h"
#include "engine/hedge_ledger.h"
#include "engine/portfolio.h"
#include "engine/portfolio_aggregator.h"
#include "market/market_feed.h"
#include <cstddef>
#include <memory>

namespace hedging {

// Optional option hedges; a null pointer means the leg is not traded
struct HedgeInstruments {
    std::shared_ptr<const Instrument> gamma;
    std::shared_ptr<const Instrument> vega;
};

// Outcome of one hedge stage
struct StageResult {
    bool executed = false;        // false if the leg is absent or degenerate
    double trade_quantity = 0.0;  // net units traded
    double unit_price = 0.0;
    double cost = 0.0;            // friction charged
};

struct CascadeResult {
    StageResult gamma;
    StageResult vega;
    StageResult delta;

    double totalCost() const { return gamma.cost + vega.cost + delta.cost; }
};

// What happened to the ledger on one feed element
struct StepReport {
    double funding = 0.0;
    bool rehedged = false;
    CascadeResult trades;

    double transactionCost() const { return trades.totalCost(); }
};

// Strict-priority hedging: gamma first (short-dated option), then vega
// (long-dated option) including the vega the gamma hedge brought in, then
// delta with the underlying including both option hedges' delta.
//
// The working risk view is passed between stages by reference; each stage
// folds its own trade into the view before the next stage sizes against it.
class RebalancingCascade {
public:
    // Unit Greeks at or below this are treated as degenerate
    static constexpr double kGreekEpsilon = 1e-9;
    // Notional per option unit used for friction
    static constexpr double kOptionContractMultiplier = 100.0;

    // Throws std::invalid_argument if rehedge_interval < 1
    RebalancingCascade(Portfolio base, HedgeInstruments hedges,
                       FrictionCostModel costs, size_t rehedge_interval = 1);

    // Day-0 pre-hedge: sizes all hedges to neutral and funds them in cash,
    // with no friction charged
    HedgeState neutralize(const MarketSnapshot& snapshot) const;

    // Funding accrual, then the cascade when the step is on the rehedge grid
    StepReport transition(const MarketSnapshot& snapshot, size_t step_index,
                          HedgeLedger& ledger) const;

    bool isRehedgeStep(size_t step_index) const { return step_index % rehedge_interval_ == 0; }

    // Base book plus the option hedges currently held
    RiskVector buildRiskView(const MarketSnapshot& snapshot, const HedgeState& state) const;

    CascadeResult rebalance(const MarketSnapshot& snapshot, HedgeLedger& ledger) const;

    StageResult rehedgeGamma(const MarketSnapshot& snapshot, RiskVector& view,
                             HedgeLedger& ledger) const;
    StageResult rehedgeVega(const MarketSnapshot& snapshot, RiskVector& view,
                            HedgeLedger& ledger) const;
    StageResult rehedgeDelta(const MarketSnapshot& snapshot, const RiskVector& view,
                             HedgeLedger& ledger) const;

    const Portfolio& getBasePortfolio() const { return base_; }
    const HedgeInstruments& getHedgeInstruments() const { return hedges_; }
    const FrictionCostModel& getCostModel() const { return costs_; }
    size_t getRehedgeInterval() const { return rehedge_interval_; }

private:
    StageResult rehedgeOptionLeg(HedgeLeg leg, const Instrument& instrument, double exposure,
                                 double unit_exposure, const MarketSnapshot& snapshot,
                                 RiskVector& view, HedgeLedger& ledger) const;

    Portfolio base_;
    HedgeInstruments hedges_;
    FrictionCostModel costs_;
    size_t rehedge_interval_;
};

} // namespace hedging
