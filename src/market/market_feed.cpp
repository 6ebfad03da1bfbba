#include "market/market_feed.h"
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace hedging {

MarketFeed::MarketFeed(std::vector<MarketSnapshot> snapshots)
    : snapshots_(std::move(snapshots)) {
    validate(snapshots_);
}

void MarketFeed::validate(const std::vector<MarketSnapshot>& snapshots) {
    if (snapshots.empty()) {
        throw std::invalid_argument("MarketFeed: at least one snapshot is required");
    }

    for (size_t i = 0; i < snapshots.size(); ++i) {
        const auto& snap = snapshots[i];
        const std::string where = " at " + snap.date.toString();

        if (!std::isfinite(snap.spot) || snap.spot <= 0.0) {
            throw std::invalid_argument("MarketFeed: spot must be > 0" + where);
        }
        if (!std::isfinite(snap.vol) || snap.vol <= 0.0) {
            throw std::invalid_argument("MarketFeed: vol must be > 0" + where);
        }
        if (!std::isfinite(snap.rate)) {
            throw std::invalid_argument("MarketFeed: rate must be finite" + where);
        }
        if (!std::isfinite(snap.credit_spread) || snap.credit_spread < 0.0) {
            throw std::invalid_argument("MarketFeed: credit spread must be >= 0" + where);
        }
        if (i > 0 && !(snapshots[i - 1].date < snap.date)) {
            throw std::invalid_argument("MarketFeed: dates must be strictly increasing" + where);
        }
    }
}

} // namespace hedging
