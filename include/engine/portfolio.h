#pragma once

#include "instruments/instrument.h"
#include <memory>
#include <vector>

namespace hedging {

// A signed holding of one instrument
struct Position {
    std::shared_ptr<const Instrument> instrument;
    double quantity;
};

// Ordered collection of positions. The engine takes its own copy at
// construction, so the base book cannot change during a run.
class Portfolio {
public:
    Portfolio() = default;
    explicit Portfolio(std::vector<Position> positions);

    // Throws std::invalid_argument for a null instrument or non-finite quantity
    void addPosition(std::shared_ptr<const Instrument> instrument, double quantity);

    const std::vector<Position>& positions() const { return positions_; }
    size_t size() const { return positions_.size(); }
    bool empty() const { return positions_.empty(); }

private:
    std::vector<Position> positions_;
};

} // namespace hedging
