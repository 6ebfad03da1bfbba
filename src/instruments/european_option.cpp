#include "instruments/european_option.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace hedging {

namespace {

constexpr double kDaysPerYear = 365.0;
constexpr double kExpiryEpsilon = 1e-6;
constexpr double kInvSqrt2 = 0.70710678118654752440;
constexpr double kInvSqrt2Pi = 0.39894228040143267794;

// Standard normal CDF via erfc for accuracy in the tails
inline double normCdf(double x) {
    return 0.5 * std::erfc(-x * kInvSqrt2);
}

inline double normPdf(double x) {
    return kInvSqrt2Pi * std::exp(-0.5 * x * x);
}

} // namespace

OptionType parseOptionType(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "call") return OptionType::CALL;
    if (lower == "put") return OptionType::PUT;
    throw std::invalid_argument("Unknown option type: " + text);
}

std::string toString(OptionType type) {
    return type == OptionType::CALL ? "call" : "put";
}

EuropeanOption::EuropeanOption(double strike, const Date& expiry, OptionType type)
    : strike_(strike), expiry_(expiry), type_(type) {
    if (!(strike > 0.0)) {
        throw std::invalid_argument("EuropeanOption: strike must be > 0");
    }
}

double EuropeanOption::timeToMaturity(const Date& date) const {
    const int64_t days_remaining = expiry_ - date;
    if (days_remaining <= 0) {
        return 0.0;
    }
    return static_cast<double>(days_remaining) / kDaysPerYear;
}

EuropeanOption::D1D2 EuropeanOption::computeD1D2(double spot, double T,
                                                 double rate, double vol) const {
    const double sig_sqrt_t = vol * std::sqrt(T);
    const double d1 = (std::log(spot / strike_) + (rate + 0.5 * vol * vol) * T) / sig_sqrt_t;
    return {d1, d1 - sig_sqrt_t};
}

double EuropeanOption::price(double spot, const Date& date, double rate, double vol) const {
    const double T = timeToMaturity(date);

    if (T <= kExpiryEpsilon) {
        // Intrinsic value at expiry
        return type_ == OptionType::CALL ? std::max(0.0, spot - strike_)
                                         : std::max(0.0, strike_ - spot);
    }

    const auto d = computeD1D2(spot, T, rate, vol);
    const double df = std::exp(-rate * T);

    if (type_ == OptionType::CALL) {
        return spot * normCdf(d.d1) - strike_ * df * normCdf(d.d2);
    }
    return strike_ * df * normCdf(-d.d2) - spot * normCdf(-d.d1);
}

double EuropeanOption::delta(double spot, const Date& date, double rate, double vol) const {
    const double T = timeToMaturity(date);

    if (T <= kExpiryEpsilon) {
        // Terminal delta: full exposure if in the money, none otherwise
        if (type_ == OptionType::CALL) {
            return spot > strike_ ? 1.0 : 0.0;
        }
        return spot < strike_ ? -1.0 : 0.0;
    }

    const auto d = computeD1D2(spot, T, rate, vol);
    return type_ == OptionType::CALL ? normCdf(d.d1) : normCdf(d.d1) - 1.0;
}

double EuropeanOption::gamma(double spot, const Date& date, double rate, double vol) const {
    const double T = timeToMaturity(date);

    // Set to zero at expiry; the ATM limit is unbounded
    if (T <= kExpiryEpsilon) {
        return 0.0;
    }

    const auto d = computeD1D2(spot, T, rate, vol);
    return normPdf(d.d1) / (spot * vol * std::sqrt(T));
}

double EuropeanOption::vega(double spot, const Date& date, double rate, double vol) const {
    const double T = timeToMaturity(date);

    if (T <= kExpiryEpsilon) {
        return 0.0;
    }

    const auto d = computeD1D2(spot, T, rate, vol);
    return spot * std::sqrt(T) * normPdf(d.d1) / 100.0;
}

std::string EuropeanOption::describe() const {
    std::ostringstream ss;
    ss << "European " << toString(type_) << " K=" << strike_ << " exp=" << expiry_;
    return ss.str();
}

} // namespace hedging
