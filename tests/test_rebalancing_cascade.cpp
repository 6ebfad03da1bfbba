#include <gtest/gtest.h>
#include "engine/rebalancing_cascade.h"
#include "instruments/european_option.h"
#include "test_helpers.h"
#include <cmath>
#include <memory>
#include <stdexcept>

using namespace hedging;
using hedging::testing_support::FixedGreeksInstrument;
using hedging::testing_support::makeSnapshot;

class RebalancingCascadeTest : public ::testing::Test {
protected:
    void SetUp() override {
        snapshot = makeSnapshot("2024-03-04", 100.0, 0.20, 0.04, 0.01);

        base.addPosition(std::make_shared<FixedGreeksInstrument>(10.0, 0.5, 0.04, 0.3), -100.0);
        gamma_hedge = std::make_shared<FixedGreeksInstrument>(2.0, 0.3, 0.08, 0.1);
        vega_hedge = std::make_shared<FixedGreeksInstrument>(8.0, 0.6, 0.01, 0.5);
    }

    RebalancingCascade makeCascade(HedgeInstruments hedges, size_t interval = 1) const {
        return RebalancingCascade(base, hedges, FrictionCostModel(0.20, 5.0, 100.0), interval);
    }

    double bookValue(const RebalancingCascade& cascade, const HedgeState& state) const {
        RiskVector view = cascade.buildRiskView(snapshot, state);
        return view.price + state.stock_position * snapshot.spot + state.cash;
    }

    MarketSnapshot snapshot;
    Portfolio base;
    std::shared_ptr<const Instrument> gamma_hedge;
    std::shared_ptr<const Instrument> vega_hedge;
};

TEST_F(RebalancingCascadeTest, DayZeroSizesHedgesInPriorityOrder) {
    auto cascade = makeCascade({gamma_hedge, vega_hedge});
    HedgeState state = cascade.neutralize(snapshot);

    // Base gamma -4 against 0.08 per unit
    EXPECT_NEAR(state.gamma_hedge_position, 50.0, 1e-12);
    // Base vega -30 plus 5 from the gamma hedge, against 0.5 per unit
    EXPECT_NEAR(state.vega_hedge_position, 50.0, 1e-12);
    // Base delta -50 plus 15 + 30 from the option hedges
    EXPECT_NEAR(state.stock_position, 5.0, 1e-12);
    EXPECT_NEAR(state.cash, -1000.0, 1e-9);
}

TEST_F(RebalancingCascadeTest, DayZeroNeutralityProperties) {
    auto cascade = makeCascade({gamma_hedge, vega_hedge});
    HedgeState state = cascade.neutralize(snapshot);

    RiskVector base_risk = PortfolioAggregator::aggregate(base, snapshot);
    RiskVector gamma_leg = PortfolioAggregator::measure(*gamma_hedge, state.gamma_hedge_position, snapshot);
    RiskVector vega_leg = PortfolioAggregator::measure(*vega_hedge, state.vega_hedge_position, snapshot);

    EXPECT_NEAR((base_risk + gamma_leg).gamma, 0.0, RebalancingCascade::kGreekEpsilon);
    EXPECT_NEAR((base_risk + gamma_leg + vega_leg).vega, 0.0, RebalancingCascade::kGreekEpsilon);
    EXPECT_NEAR((base_risk + gamma_leg + vega_leg).delta + state.stock_position, 0.0,
                RebalancingCascade::kGreekEpsilon);
}

TEST_F(RebalancingCascadeTest, DayZeroBookIsWorthNothing) {
    auto cascade = makeCascade({gamma_hedge, vega_hedge});
    HedgeState state = cascade.neutralize(snapshot);

    // Hedges are fully cash financed at mid, so only the base book carries value
    RiskVector base_risk = PortfolioAggregator::aggregate(base, snapshot);
    EXPECT_NEAR(bookValue(cascade, state), base_risk.price, 1e-9);
}

TEST_F(RebalancingCascadeTest, RebalanceNetsResidualExposure) {
    auto cascade = makeCascade({gamma_hedge, vega_hedge});
    HedgeLedger ledger(cascade.neutralize(snapshot));

    CascadeResult result = cascade.rebalance(snapshot, ledger);

    ASSERT_TRUE(result.gamma.executed);
    EXPECT_NEAR(result.gamma.trade_quantity, -6.25, 1e-12);
    EXPECT_NEAR(result.gamma.cost, 6.25, 1e-12);

    ASSERT_TRUE(result.vega.executed);
    EXPECT_NEAR(result.vega.trade_quantity, 1.25, 1e-12);
    EXPECT_NEAR(result.vega.cost, 5.0, 1e-12);

    ASSERT_TRUE(result.delta.executed);
    EXPECT_NEAR(result.delta.trade_quantity, 1.125, 1e-12);
    EXPECT_NEAR(result.delta.cost, 0.028125, 1e-12);
    EXPECT_NEAR(result.totalCost(), 11.278125, 1e-12);

    const HedgeState& state = ledger.state();
    EXPECT_NEAR(state.gamma_hedge_position, 43.75, 1e-12);
    EXPECT_NEAR(state.vega_hedge_position, 51.25, 1e-12);
    EXPECT_NEAR(state.stock_position, 6.125, 1e-12);
    EXPECT_NEAR(state.cash, -1121.278125, 1e-9);
}

TEST_F(RebalancingCascadeTest, RebalanceLosesExactlyTheFriction) {
    auto cascade = makeCascade({gamma_hedge, vega_hedge});
    HedgeState initial = cascade.neutralize(snapshot);
    HedgeLedger ledger(initial);

    const double before = bookValue(cascade, initial);
    CascadeResult result = cascade.rebalance(snapshot, ledger);
    const double after = bookValue(cascade, ledger.state());

    EXPECT_NEAR(before - after, result.totalCost(), 1e-9);
}

TEST_F(RebalancingCascadeTest, PostRebalanceViewIsVegaAndDeltaFlat) {
    auto cascade = makeCascade({gamma_hedge, vega_hedge});
    HedgeLedger ledger(cascade.neutralize(snapshot));
    cascade.rebalance(snapshot, ledger);

    RiskVector view = cascade.buildRiskView(snapshot, ledger.state());
    EXPECT_NEAR(view.delta + ledger.getStockPosition(), 0.0, 1e-9);
    EXPECT_NEAR(view.vega, 0.0, 1e-9);
}

TEST_F(RebalancingCascadeTest, DeltaOnlyWithoutOptionHedges) {
    auto cascade = makeCascade({nullptr, nullptr});
    HedgeState state = cascade.neutralize(snapshot);

    EXPECT_EQ(state.gamma_hedge_position, 0.0);
    EXPECT_EQ(state.vega_hedge_position, 0.0);
    EXPECT_NEAR(state.stock_position, 50.0, 1e-12);
    EXPECT_NEAR(state.cash, -5000.0, 1e-9);

    HedgeLedger ledger(state);
    CascadeResult result = cascade.rebalance(snapshot, ledger);
    EXPECT_FALSE(result.gamma.executed);
    EXPECT_FALSE(result.vega.executed);
    EXPECT_TRUE(result.delta.executed);
    EXPECT_NEAR(result.delta.trade_quantity, 0.0, 1e-12);
    EXPECT_NEAR(result.totalCost(), 0.0, 1e-12);
}

TEST_F(RebalancingCascadeTest, DegenerateGammaHedgeIsSkipped) {
    auto flat = std::make_shared<FixedGreeksInstrument>(1.0, 0.0, 0.0, 0.2);
    auto cascade = makeCascade({flat, vega_hedge});

    HedgeState state = cascade.neutralize(snapshot);
    EXPECT_EQ(state.gamma_hedge_position, 0.0);
    EXPECT_NEAR(state.vega_hedge_position, 60.0, 1e-12);

    HedgeLedger ledger(state);
    CascadeResult result = cascade.rebalance(snapshot, ledger);
    EXPECT_FALSE(result.gamma.executed);
    EXPECT_EQ(result.gamma.cost, 0.0);
    EXPECT_TRUE(result.vega.executed);
    EXPECT_TRUE(std::isfinite(ledger.getCash()));
}

TEST_F(RebalancingCascadeTest, DegenerateVegaHedgeIsSkippedAndHeld) {
    auto no_vega = std::make_shared<FixedGreeksInstrument>(5.0, 0.4, 0.02, 0.0);
    auto cascade = makeCascade({gamma_hedge, no_vega});

    HedgeState state = cascade.neutralize(snapshot);
    EXPECT_NEAR(state.gamma_hedge_position, 50.0, 1e-12);
    EXPECT_EQ(state.vega_hedge_position, 0.0);
    // Base delta -50 plus 15 from the gamma hedge
    EXPECT_NEAR(state.stock_position, 35.0, 1e-12);

    // Existing vega hedge units bring in gamma 0.8 and delta 16
    state.vega_hedge_position = 40.0;
    HedgeLedger ledger(state);
    CascadeResult result = cascade.rebalance(snapshot, ledger);

    EXPECT_TRUE(result.gamma.executed);
    EXPECT_NEAR(result.gamma.trade_quantity, -10.0, 1e-12);
    EXPECT_FALSE(result.vega.executed);
    EXPECT_EQ(result.vega.cost, 0.0);
    EXPECT_DOUBLE_EQ(ledger.getVegaHedgePosition(), 40.0);
    EXPECT_NEAR(ledger.getGammaHedgePosition(), 40.0, 1e-12);
    EXPECT_NEAR(ledger.getStockPosition(), 22.0, 1e-12);
}

TEST_F(RebalancingCascadeTest, ExpiredHedgeOptionStopsTrading) {
    auto expired = std::make_shared<EuropeanOption>(100.0, Date::parse("2024-03-01"), OptionType::CALL);
    auto cascade = makeCascade({expired, nullptr});

    HedgeLedger ledger(HedgeState{0.0, 0.0, 25.0, 0.0});
    CascadeResult result = cascade.rebalance(snapshot, ledger);

    EXPECT_FALSE(result.gamma.executed);
    EXPECT_DOUBLE_EQ(ledger.getGammaHedgePosition(), 25.0);
    EXPECT_TRUE(std::isfinite(ledger.getCash()));
}

TEST_F(RebalancingCascadeTest, TransitionFollowsRehedgeGrid) {
    auto cascade = makeCascade({gamma_hedge, vega_hedge}, 3);
    EXPECT_TRUE(cascade.isRehedgeStep(0));
    EXPECT_FALSE(cascade.isRehedgeStep(1));
    EXPECT_FALSE(cascade.isRehedgeStep(2));
    EXPECT_TRUE(cascade.isRehedgeStep(3));

    HedgeState initial = cascade.neutralize(snapshot);
    HedgeLedger ledger(initial);

    StepReport skip = cascade.transition(snapshot, 1, ledger);
    EXPECT_FALSE(skip.rehedged);
    EXPECT_EQ(skip.transactionCost(), 0.0);
    EXPECT_NEAR(skip.funding, initial.cash * 0.05 / 252.0, 1e-9);
    EXPECT_EQ(ledger.getStockPosition(), initial.stock_position);
    EXPECT_EQ(ledger.getGammaHedgePosition(), initial.gamma_hedge_position);

    StepReport hedge = cascade.transition(snapshot, 3, ledger);
    EXPECT_TRUE(hedge.rehedged);
    EXPECT_GT(hedge.transactionCost(), 0.0);
}

TEST_F(RebalancingCascadeTest, RejectsZeroInterval) {
    EXPECT_THROW(makeCascade({gamma_hedge, vega_hedge}, 0), std::invalid_argument);
}
