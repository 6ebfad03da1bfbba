#include "market/scenario_generator.h"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace hedging {

ScenarioGenerator::ScenarioGenerator(double spot_start, double vol_start,
                                     double sofr_start, double spread_start)
    : spot0_(spot_start), sigma0_(vol_start), r0_(sofr_start), cs0_(spread_start) {
    if (spot0_ <= 0.0) {
        throw std::invalid_argument("ScenarioGenerator: starting spot must be > 0");
    }
    if (sigma0_ <= 0.0) {
        throw std::invalid_argument("ScenarioGenerator: starting vol must be > 0");
    }
}

MarketFeed ScenarioGenerator::simulate(const Date& start_date, int num_days,
                                       const ScenarioShock& shock) const {
    if (num_days < 1) {
        throw std::invalid_argument("ScenarioGenerator: num_days must be >= 1");
    }

    const size_t steps = static_cast<size_t>(num_days) + 1;
    std::vector<MarketSnapshot> path;
    path.reserve(steps);

    // Daily increments
    const double spot_daily_ret = shock.spot_ret / num_days;
    const double sofr_step = shock.d_sofr / num_days;
    const double spread_step = shock.d_spread / num_days;

    Date date = start_date.rollForward();
    path.push_back({date, spot0_, sigma0_, r0_, cs0_});

    double spot = spot0_;
    for (size_t i = 1; i < steps; ++i) {
        date = date.nextBusinessDay();
        const MarketSnapshot& prev = path.back();

        spot *= (1.0 + spot_daily_ret);

        // Drawdown from the onset drives vol up; a rally lets it decay
        double vol;
        const double pct_drop = (spot0_ - spot) / spot0_;
        if (pct_drop > 0.0) {
            vol = sigma0_ * (1.0 + pct_drop * shock.vol_mult);
        } else {
            vol = std::max(0.05, sigma0_ * 0.95);
        }

        path.push_back({date, spot, vol, prev.rate + sofr_step,
                        prev.credit_spread + spread_step});
    }

    return MarketFeed(std::move(path));
}

MarketFeed ScenarioGenerator::simulatePreset(const std::string& preset_name,
                                             const Date& start_date, int days) const {
    const ScenarioPreset& preset = findPreset(preset_name);
    return simulate(start_date, days > 0 ? days : preset.default_days, preset.shock);
}

const std::vector<ScenarioPreset>& ScenarioGenerator::presets() {
    static const std::vector<ScenarioPreset> kPresets = {
        {"taper_tantrum_2013",
         "Bear steepener: overnight rates anchored, funding spreads widen",
         20, {-0.05, 1.5, 0.0000, 0.0050}},
        {"trump_reflation_2016",
         "Bullish steepener: equities rally, spreads tighten",
         20, {0.10, 0.0, 0.0000, -0.0010}},
        {"repo_crisis_2019",
         "Reserve scarcity: repo rates spike violently",
         5, {-0.02, 2.0, 0.0500, 0.0300}},
        {"covid_crash_2020",
         "Dash for cash: equities crash, rates to zero, credit blows out",
         20, {-0.30, 4.0, -0.0150, 0.0400}},
        {"inflation_shock_2022",
         "Bear flattener: hiking cycle, growth equities sell off",
         20, {-0.15, 1.5, 0.0150, 0.0050}},
        {"liberation_day_2025",
         "Tariff stagflation: equities drop, spreads widen",
         10, {-0.15, 2.0, 0.0025, 0.0200}},
    };
    return kPresets;
}

const ScenarioPreset& ScenarioGenerator::findPreset(const std::string& name) {
    const auto& all = presets();
    auto it = std::find_if(all.begin(), all.end(),
                           [&name](const ScenarioPreset& p) { return p.name == name; });
    if (it == all.end()) {
        throw std::invalid_argument("Unknown scenario preset: " + name);
    }
    return *it;
}

} // namespace hedging
