#include "engine/portfolio.h"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace hedging {

Portfolio::Portfolio(std::vector<Position> positions) {
    positions_.reserve(positions.size());
    for (auto& pos : positions) {
        addPosition(std::move(pos.instrument), pos.quantity);
    }
}

void Portfolio::addPosition(std::shared_ptr<const Instrument> instrument, double quantity) {
    if (!instrument) {
        throw std::invalid_argument("Portfolio: position instrument must not be null");
    }
    if (!std::isfinite(quantity)) {
        throw std::invalid_argument("Portfolio: position quantity must be finite");
    }
    positions_.push_back({std::move(instrument), quantity});
}

} // namespace hedging
