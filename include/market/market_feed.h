#pragma once

#include "core/date.h"
#include <cstddef>
#include <vector>

namespace hedging {

// One observation of the market risk factors
struct MarketSnapshot {
    Date date;
    double spot;           // S > 0
    double vol;            // sigma > 0
    double rate;           // risk-free (SOFR), annualized decimal
    double credit_spread;  // cs >= 0, added to the rate when borrowing
};

// Immutable, ordered sequence of market snapshots. Construction validates
// that the sequence is non-empty, strictly increasing by date and that
// every snapshot is within its domain.
class MarketFeed {
public:
    using const_iterator = std::vector<MarketSnapshot>::const_iterator;

    explicit MarketFeed(std::vector<MarketSnapshot> snapshots);

    const MarketSnapshot& front() const { return snapshots_.front(); }
    const MarketSnapshot& back() const { return snapshots_.back(); }
    const MarketSnapshot& operator[](size_t i) const { return snapshots_[i]; }
    const MarketSnapshot& at(size_t i) const { return snapshots_.at(i); }

    size_t size() const { return snapshots_.size(); }
    const_iterator begin() const { return snapshots_.begin(); }
    const_iterator end() const { return snapshots_.end(); }

    const std::vector<MarketSnapshot>& snapshots() const { return snapshots_; }

private:
    static void validate(const std::vector<MarketSnapshot>& snapshots);

    std::vector<MarketSnapshot> snapshots_;
};

} // namespace hedging
