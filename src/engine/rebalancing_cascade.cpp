#include "engine/rebalancing_cascade.h"
#include "utils/logger.h"
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace hedging {

constexpr double RebalancingCascade::kGreekEpsilon;
constexpr double RebalancingCascade::kOptionContractMultiplier;

RebalancingCascade::RebalancingCascade(Portfolio base, HedgeInstruments hedges,
                                       FrictionCostModel costs, size_t rehedge_interval)
    : base_(std::move(base)),
      hedges_(std::move(hedges)),
      costs_(costs),
      rehedge_interval_(rehedge_interval) {
    if (rehedge_interval_ < 1) {
        throw std::invalid_argument("RebalancingCascade: rehedge interval must be >= 1");
    }
}

HedgeState RebalancingCascade::neutralize(const MarketSnapshot& snapshot) const {
    const double S = snapshot.spot;
    const double r = snapshot.rate;
    const double vol = snapshot.vol;
    const Date& date = snapshot.date;

    const RiskVector base = PortfolioAggregator::aggregate(base_, snapshot);
    HedgeState state;

    // 1. Gamma
    if (hedges_.gamma) {
        const double unit_gamma = hedges_.gamma->gamma(S, date, r, vol);
        if (std::abs(unit_gamma) > kGreekEpsilon) {
            state.gamma_hedge_position = -base.gamma / unit_gamma;
        } else {
            LOG_DEBUG("Day-0 gamma hedge skipped: degenerate unit gamma " + std::to_string(unit_gamma));
        }
    }

    // 2. Vega, including what the gamma hedge just added
    if (hedges_.vega) {
        double added_vega = 0.0;
        if (hedges_.gamma) {
            added_vega = state.gamma_hedge_position * hedges_.gamma->vega(S, date, r, vol);
        }
        const double unit_vega = hedges_.vega->vega(S, date, r, vol);
        if (std::abs(unit_vega) > kGreekEpsilon) {
            state.vega_hedge_position = -(base.vega + added_vega) / unit_vega;
        } else {
            LOG_DEBUG("Day-0 vega hedge skipped: degenerate unit vega " + std::to_string(unit_vega));
        }
    }

    // 3. Delta of the base book and both option hedges
    double added_delta = 0.0;
    double cost_gamma = 0.0;
    double cost_vega = 0.0;
    if (hedges_.gamma) {
        added_delta += state.gamma_hedge_position * hedges_.gamma->delta(S, date, r, vol);
        cost_gamma = state.gamma_hedge_position * hedges_.gamma->price(S, date, r, vol);
    }
    if (hedges_.vega) {
        added_delta += state.vega_hedge_position * hedges_.vega->delta(S, date, r, vol);
        cost_vega = state.vega_hedge_position * hedges_.vega->price(S, date, r, vol);
    }
    state.stock_position = -(base.delta + added_delta);

    // 4. Hedges are financed in cash: borrowed for purchases, received for sales
    state.cash = -(cost_gamma + cost_vega + state.stock_position * S);

    std::ostringstream ss;
    ss << "Day-0 hedge on " << date << ": gamma_pos=" << state.gamma_hedge_position
       << " vega_pos=" << state.vega_hedge_position
       << " stock=" << state.stock_position << " cash=" << state.cash;
    LOG_DEBUG(ss.str());

    return state;
}

StepReport RebalancingCascade::transition(const MarketSnapshot& snapshot, size_t step_index,
                                          HedgeLedger& ledger) const {
    StepReport report;
    report.funding = ledger.accrueFunding(snapshot);

    if (isRehedgeStep(step_index)) {
        report.trades = rebalance(snapshot, ledger);
        report.rehedged = true;
    }
    return report;
}

RiskVector RebalancingCascade::buildRiskView(const MarketSnapshot& snapshot,
                                             const HedgeState& state) const {
    RiskVector view = PortfolioAggregator::aggregate(base_, snapshot);
    if (hedges_.gamma) {
        view += PortfolioAggregator::measure(*hedges_.gamma, state.gamma_hedge_position, snapshot);
    }
    if (hedges_.vega) {
        view += PortfolioAggregator::measure(*hedges_.vega, state.vega_hedge_position, snapshot);
    }
    return view;
}

CascadeResult RebalancingCascade::rebalance(const MarketSnapshot& snapshot,
                                            HedgeLedger& ledger) const {
    RiskVector view = buildRiskView(snapshot, ledger.state());

    CascadeResult result;
    result.gamma = rehedgeGamma(snapshot, view, ledger);
    result.vega = rehedgeVega(snapshot, view, ledger);
    result.delta = rehedgeDelta(snapshot, view, ledger);
    return result;
}

StageResult RebalancingCascade::rehedgeGamma(const MarketSnapshot& snapshot, RiskVector& view,
                                             HedgeLedger& ledger) const {
    if (!hedges_.gamma) {
        return {};
    }

    const double unit_gamma = hedges_.gamma->gamma(snapshot.spot, snapshot.date,
                                                   snapshot.rate, snapshot.vol);
    if (std::abs(unit_gamma) <= kGreekEpsilon) {
        LOG_DEBUG("Gamma stage skipped on " + snapshot.date.toString() + ": degenerate unit gamma");
        return {};
    }

    return rehedgeOptionLeg(HedgeLeg::GAMMA, *hedges_.gamma, view.gamma, unit_gamma,
                            snapshot, view, ledger);
}

StageResult RebalancingCascade::rehedgeVega(const MarketSnapshot& snapshot, RiskVector& view,
                                            HedgeLedger& ledger) const {
    if (!hedges_.vega) {
        return {};
    }

    const double unit_vega = hedges_.vega->vega(snapshot.spot, snapshot.date,
                                                snapshot.rate, snapshot.vol);
    if (std::abs(unit_vega) <= kGreekEpsilon) {
        LOG_DEBUG("Vega stage skipped on " + snapshot.date.toString() + ": degenerate unit vega");
        return {};
    }

    return rehedgeOptionLeg(HedgeLeg::VEGA, *hedges_.vega, view.vega, unit_vega,
                            snapshot, view, ledger);
}

StageResult RebalancingCascade::rehedgeOptionLeg(HedgeLeg leg, const Instrument& instrument,
                                                 double exposure, double unit_exposure,
                                                 const MarketSnapshot& snapshot,
                                                 RiskVector& view, HedgeLedger& ledger) const {
    StageResult stage;
    stage.executed = true;
    // Net trade on top of the units already held
    stage.trade_quantity = -exposure / unit_exposure;
    stage.unit_price = instrument.price(snapshot.spot, snapshot.date, snapshot.rate, snapshot.vol);
    stage.cost = costs_.cost(stage.trade_quantity * stage.unit_price * kOptionContractMultiplier,
                             snapshot.vol, TradeKind::OPTION);

    ledger.settleOptionTrade(leg, stage.trade_quantity, stage.unit_price, stage.cost);

    // The new units carry their own delta and vega into later stages
    view += PortfolioAggregator::measure(instrument, stage.trade_quantity, snapshot);
    return stage;
}

StageResult RebalancingCascade::rehedgeDelta(const MarketSnapshot& snapshot, const RiskVector& view,
                                             HedgeLedger& ledger) const {
    const double target_stock = -view.delta;

    StageResult stage;
    stage.executed = true;
    stage.trade_quantity = target_stock - ledger.getStockPosition();
    stage.unit_price = snapshot.spot;
    stage.cost = costs_.cost(stage.trade_quantity * snapshot.spot, snapshot.vol, TradeKind::STOCK);

    // Replaced to target rather than incremented
    ledger.settleStockTrade(target_stock, snapshot.spot, stage.cost);
    return stage;
}

} // namespace hedging
