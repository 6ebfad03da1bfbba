#pragma once

namespace hedging {

enum class TradeKind {
    STOCK,
    OPTION
};

// Linear half-spread cost model. Spreads widen in proportion to the ratio of
// current vol to the vol at the start of the run.
class FrictionCostModel {
public:
    // Throws std::invalid_argument if base_vol <= 0 or a spread is negative
    FrictionCostModel(double base_vol, double stock_spread_bps = 5.0,
                      double option_spread_bps = 100.0);

    // |notional| * (spread_bps * current_vol / base_vol / 10000) / 2
    double cost(double notional, double current_vol, TradeKind kind) const;

    double spreadFraction(double current_vol, TradeKind kind) const;

    double getBaseVol() const { return base_vol_; }
    double getStockSpreadBps() const { return stock_spread_bps_; }
    double getOptionSpreadBps() const { return option_spread_bps_; }

private:
    double base_vol_;
    double stock_spread_bps_;
    double option_spread_bps_;
};

} // namespace hedging
