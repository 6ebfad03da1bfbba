#pragma once

#include "market/market_feed.h"

namespace hedging {

// Cash and hedge holdings of one run
struct HedgeState {
    double cash = 0.0;
    double stock_position = 0.0;
    double gamma_hedge_position = 0.0;
    double vega_hedge_position = 0.0;
};

enum class HedgeLeg {
    GAMMA,
    VEGA
};

// Owns the HedgeState for the lifetime of a run. All cash movements go
// through here so that the book always reconciles:
//   value = base + stock*S + gamma_pos*P_g + vega_pos*P_v + cash
class HedgeLedger {
public:
    static constexpr double kTradingDaysPerYear = 252.0;

    HedgeLedger() = default;
    explicit HedgeLedger(const HedgeState& initial) : state_(initial) {}

    // Accrues one trading day of interest on the cash balance: at rate + spread
    // while borrowing, at the risk-free rate otherwise. Returns the accrual.
    double accrueFunding(const MarketSnapshot& snapshot);

    // Net trade of `quantity` option units at `unit_price`, paying `cost`
    void settleOptionTrade(HedgeLeg leg, double quantity, double unit_price, double cost);

    // Moves the stock holding to `target_position`; returns the traded quantity
    double settleStockTrade(double target_position, double spot, double cost);

    const HedgeState& state() const { return state_; }
    double getCash() const { return state_.cash; }
    double getStockPosition() const { return state_.stock_position; }
    double getGammaHedgePosition() const { return state_.gamma_hedge_position; }
    double getVegaHedgePosition() const { return state_.vega_hedge_position; }

private:
    HedgeState state_;
};

} // namespace hedging
