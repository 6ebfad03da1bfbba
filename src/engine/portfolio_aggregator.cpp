#include "engine/portfolio_aggregator.h"

namespace hedging {

RiskVector PortfolioAggregator::measure(const Instrument& instrument, double quantity,
                                        const MarketSnapshot& snapshot) {
    const double S = snapshot.spot;
    const double r = snapshot.rate;
    const double vol = snapshot.vol;

    RiskVector risk;
    risk.price = quantity * instrument.price(S, snapshot.date, r, vol);
    risk.delta = quantity * instrument.delta(S, snapshot.date, r, vol);
    risk.gamma = quantity * instrument.gamma(S, snapshot.date, r, vol);
    risk.vega = quantity * instrument.vega(S, snapshot.date, r, vol);
    return risk;
}

RiskVector PortfolioAggregator::aggregate(const std::vector<Position>& positions,
                                          const MarketSnapshot& snapshot) {
    RiskVector total;
    for (const auto& pos : positions) {
        total += measure(*pos.instrument, pos.quantity, snapshot);
    }
    return total;
}

} // namespace hedging
