#pragma once

#include "instruments/instrument.h"

namespace hedging {

// One unit of the underlying asset
class Underlying : public Instrument {
public:
    double price(double spot, const Date&, double, double) const override { return spot; }
    double delta(double, const Date&, double, double) const override { return 1.0; }
    double gamma(double, const Date&, double, double) const override { return 0.0; }
    double vega(double, const Date&, double, double) const override { return 0.0; }

    std::string describe() const override { return "Underlying"; }
};

} // namespace hedging
