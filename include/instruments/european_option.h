#pragma once

#include "instruments/instrument.h"
#include <string>

namespace hedging {

enum class OptionType {
    CALL,
    PUT
};

OptionType parseOptionType(const std::string& text);
std::string toString(OptionType type);

// European vanilla option priced with Black-Scholes (no dividends).
// Time to maturity is ACT/365 on whole calendar days. On or after expiry the
// option is worth its intrinsic value, with gamma and vega set to zero.
class EuropeanOption : public Instrument {
public:
    // Throws std::invalid_argument if strike <= 0
    EuropeanOption(double strike, const Date& expiry, OptionType type);

    double price(double spot, const Date& date, double rate, double vol) const override;
    double delta(double spot, const Date& date, double rate, double vol) const override;
    double gamma(double spot, const Date& date, double rate, double vol) const override;
    double vega(double spot, const Date& date, double rate, double vol) const override;

    std::string describe() const override;

    double timeToMaturity(const Date& date) const;

    double getStrike() const { return strike_; }
    const Date& getExpiry() const { return expiry_; }
    OptionType getType() const { return type_; }

private:
    struct D1D2 {
        double d1;
        double d2;
    };
    D1D2 computeD1D2(double spot, double T, double rate, double vol) const;

    double strike_;
    Date expiry_;
    OptionType type_;
};

} // namespace hedging
