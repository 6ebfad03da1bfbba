#pragma once

#include "core/date.h"
#include "market/market_feed.h"
#include <string>
#include <vector>

namespace hedging {

// Total moves applied linearly (rates) or geometrically (spot) over a scenario
struct ScenarioShock {
    double spot_ret;   // total spot return, e.g. -0.10 for -10%
    double vol_mult;   // vol sensitivity to the drawdown from the starting spot
    double d_sofr;     // total change in the risk-free rate
    double d_spread;   // total change in the credit spread
};

// Historical stress template
struct ScenarioPreset {
    std::string name;
    std::string narrative;
    int default_days;
    ScenarioShock shock;
};

// Generates daily business-day market paths under a stress shock. The
// volatility path is driven by the spot drawdown (leverage effect).
class ScenarioGenerator {
public:
    explicit ScenarioGenerator(double spot_start = 100.0,
                               double vol_start = 0.20,
                               double sofr_start = 0.04,
                               double spread_start = 0.01);

    // Produces num_days + 1 snapshots starting at start_date (rolled forward
    // to a business day). Throws std::invalid_argument if num_days < 1.
    MarketFeed simulate(const Date& start_date, int num_days,
                        const ScenarioShock& shock) const;

    // days <= 0 uses the preset's default horizon
    MarketFeed simulatePreset(const std::string& preset_name,
                              const Date& start_date, int days = 0) const;

    static const std::vector<ScenarioPreset>& presets();
    // Throws std::invalid_argument for an unknown name
    static const ScenarioPreset& findPreset(const std::string& name);

    double spotStart() const { return spot0_; }
    double volStart() const { return sigma0_; }
    double sofrStart() const { return r0_; }
    double spreadStart() const { return cs0_; }

private:
    double spot0_;
    double sigma0_;
    double r0_;
    double cs0_;
};

} // namespace hedging
