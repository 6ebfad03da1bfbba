#include "engine/friction_cost_model.h"
#include <cmath>
#include <stdexcept>

namespace hedging {

FrictionCostModel::FrictionCostModel(double base_vol, double stock_spread_bps,
                                     double option_spread_bps)
    : base_vol_(base_vol),
      stock_spread_bps_(stock_spread_bps),
      option_spread_bps_(option_spread_bps) {
    if (!(base_vol > 0.0)) {
        throw std::invalid_argument("FrictionCostModel: base vol must be > 0");
    }
    if (stock_spread_bps < 0.0 || option_spread_bps < 0.0) {
        throw std::invalid_argument("FrictionCostModel: spreads must be non-negative");
    }
}

double FrictionCostModel::spreadFraction(double current_vol, TradeKind kind) const {
    const double multiplier = current_vol / base_vol_;
    const double base_bps = (kind == TradeKind::OPTION) ? option_spread_bps_ : stock_spread_bps_;
    return (base_bps * multiplier) / 10000.0;
}

double FrictionCostModel::cost(double notional, double current_vol, TradeKind kind) const {
    return std::abs(notional) * spreadFraction(current_vol, kind) / 2.0;
}

} // namespace hedging
