#pragma once

#include "core/date.h"
#include "engine/batch_runner.h"
#include "engine/hedging_engine.h"
#include "instruments/european_option.h"
#include "market/scenario_generator.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace hedging {

struct InstrumentSpec {
    enum class Kind { OPTION, UNDERLYING };

    Kind kind = Kind::UNDERLYING;
    double strike = 0.0;
    Date expiry;
    OptionType option_type = OptionType::CALL;
};

struct PositionSpec {
    InstrumentSpec instrument;
    double quantity = 0.0;
};

struct ScenarioSpec {
    enum class Source { PRESET, CSV, CUSTOM };

    std::string name;
    Source source = Source::PRESET;
    std::string preset;
    std::string csv_path;
    Date start_date;
    int days = 0;  // 0 = preset default
    ScenarioShock shock{0.0, 0.0, 0.0, 0.0};
};

struct MarketInitialConditions {
    double spot = 100.0;
    double vol = 0.20;
    double sofr = 0.04;
    double credit_spread = 0.01;
};

// Full simulation configuration as read from JSON
struct SimulationConfig {
    // Engine
    int rehedge_interval = 1;
    double stock_spread_bps = 5.0;
    double option_spread_bps = 100.0;
    size_t workers = 0;  // 0 = hardware concurrency

    // Market
    MarketInitialConditions initial;
    std::vector<ScenarioSpec> scenarios;

    // Book
    std::vector<PositionSpec> portfolio;
    std::optional<InstrumentSpec> gamma_hedge;
    std::optional<InstrumentSpec> vega_hedge;

    // Output
    std::string output_path = "hedging_results.csv";
    std::string output_format = "csv";

    // Logging
    std::string log_level = "info";
    std::string log_file;

    // Validates first; throws std::runtime_error listing every validation error
    static SimulationConfig fromJson(const nlohmann::json& json);
    static SimulationConfig fromFile(const std::string& path);
};

std::shared_ptr<const Instrument> makeInstrument(const InstrumentSpec& instrument);
Portfolio makePortfolio(const SimulationConfig& config);
EngineConfig makeEngineConfig(const SimulationConfig& config);
std::shared_ptr<const MarketFeed> makeFeed(const ScenarioSpec& scenario,
                                           const MarketInitialConditions& initial);

// One ScenarioRun per configured scenario, sharing instruments across runs.
// Feeds are left to each run's make_feed.
std::vector<ScenarioRun> makeScenarioRuns(const SimulationConfig& config);

} // namespace hedging
