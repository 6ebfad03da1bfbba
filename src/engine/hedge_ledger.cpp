#include "engine/hedge_ledger.h"

namespace hedging {

constexpr double HedgeLedger::kTradingDaysPerYear;

double HedgeLedger::accrueFunding(const MarketSnapshot& snapshot) {
    // Borrowing pays the desk's credit spread on top of the risk-free rate
    const double rate = state_.cash < 0.0 ? snapshot.rate + snapshot.credit_spread
                                          : snapshot.rate;
    const double funding = state_.cash * rate * (1.0 / kTradingDaysPerYear);
    state_.cash += funding;
    return funding;
}

void HedgeLedger::settleOptionTrade(HedgeLeg leg, double quantity, double unit_price, double cost) {
    state_.cash -= quantity * unit_price + cost;
    if (leg == HedgeLeg::GAMMA) {
        state_.gamma_hedge_position += quantity;
    } else {
        state_.vega_hedge_position += quantity;
    }
}

double HedgeLedger::settleStockTrade(double target_position, double spot, double cost) {
    const double trade = target_position - state_.stock_position;
    state_.cash -= trade * spot + cost;
    state_.stock_position = target_position;
    return trade;
}

} // namespace hedging
