#pragma once

#include "core/date.h"
#include <string>

namespace hedging {

// Pricing and risk capability shared by every tradeable instrument.
// Implementations are stateless with respect to the market: each call is a
// pure function of (spot, valuation date, rate, vol) and must return finite
// values for any valid input, including dates on or past expiry.
class Instrument {
public:
    virtual ~Instrument() = default;

    virtual double price(double spot, const Date& date, double rate, double vol) const = 0;
    virtual double delta(double spot, const Date& date, double rate, double vol) const = 0;
    virtual double gamma(double spot, const Date& date, double rate, double vol) const = 0;
    // Per 1 vol point
    virtual double vega(double spot, const Date& date, double rate, double vol) const = 0;

    virtual std::string describe() const = 0;
};

} // namespace hedging
