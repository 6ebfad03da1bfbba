#pragma once

#include "engine/portfolio.h"
#include "market/market_feed.h"
#include <vector>

namespace hedging {

// Aggregate sensitivities of a set of positions at one snapshot. Only valid
// for the snapshot it was computed on.
struct RiskVector {
    double price = 0.0;
    double delta = 0.0;
    double gamma = 0.0;
    double vega = 0.0;

    RiskVector& operator+=(const RiskVector& other) {
        price += other.price;
        delta += other.delta;
        gamma += other.gamma;
        vega += other.vega;
        return *this;
    }
};

inline RiskVector operator+(RiskVector lhs, const RiskVector& rhs) {
    lhs += rhs;
    return lhs;
}

// Stateless risk aggregation: sum of quantity * metric over positions
class PortfolioAggregator {
public:
    // Sensitivities of `quantity` units of one instrument
    static RiskVector measure(const Instrument& instrument, double quantity,
                              const MarketSnapshot& snapshot);

    static RiskVector aggregate(const std::vector<Position>& positions,
                                const MarketSnapshot& snapshot);

    static RiskVector aggregate(const Portfolio& portfolio, const MarketSnapshot& snapshot) {
        return aggregate(portfolio.positions(), snapshot);
    }
};

} // namespace hedging
