#include "config/simulation_config.h"
#include "instruments/underlying.h"
#include "market/feed_csv.h"
#include "utils/config_validator.h"
#include "utils/logger.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace hedging {

namespace {

InstrumentSpec parseInstrument(const nlohmann::json& j) {
    InstrumentSpec parsed;
    if (j.value("type", std::string("option")) == "underlying") {
        parsed.kind = InstrumentSpec::Kind::UNDERLYING;
        return parsed;
    }
    parsed.kind = InstrumentSpec::Kind::OPTION;
    parsed.strike = j.at("strike").get<double>();
    parsed.expiry = Date::parse(j.at("expiry").get<std::string>());
    parsed.option_type = parseOptionType(j.at("option_type").get<std::string>());
    return parsed;
}

ScenarioSpec parseScenario(const nlohmann::json& j) {
    ScenarioSpec parsed;
    parsed.name = j.at("name").get<std::string>();

    if (j.contains("csv")) {
        parsed.source = ScenarioSpec::Source::CSV;
        parsed.csv_path = j.at("csv").get<std::string>();
        return parsed;
    }

    parsed.start_date = Date::parse(j.at("start_date").get<std::string>());
    parsed.days = j.value("days", 0);

    if (j.contains("preset")) {
        parsed.source = ScenarioSpec::Source::PRESET;
        parsed.preset = j.at("preset").get<std::string>();
    } else {
        parsed.source = ScenarioSpec::Source::CUSTOM;
        parsed.shock.spot_ret = j.at("spot_ret").get<double>();
        parsed.shock.vol_mult = j.at("vol_mult").get<double>();
        parsed.shock.d_sofr = j.at("d_sofr").get<double>();
        parsed.shock.d_spread = j.at("d_spread").get<double>();
    }
    return parsed;
}

} // namespace

SimulationConfig SimulationConfig::fromJson(const nlohmann::json& json) {
    // Validate configuration
    auto validation = ConfigValidator::validateConfig(json);
    if (!validation.is_valid) {
        std::stringstream ss;
        ss << "Configuration validation failed:\n";
        for (const auto& error : validation.errors) {
            ss << "  ERROR: " << error << "\n";
        }
        throw std::runtime_error(ss.str());
    }

    // Log warnings
    for (const auto& warning : validation.warnings) {
        LOG_WARNING("Config warning: " + warning);
    }

    SimulationConfig config;
    try {
        if (json.contains("engine")) {
            const auto& engine = json["engine"];
            config.rehedge_interval = engine.value("rehedge_interval", config.rehedge_interval);
            config.stock_spread_bps = engine.value("stock_spread_bps", config.stock_spread_bps);
            config.option_spread_bps = engine.value("option_spread_bps", config.option_spread_bps);
            config.workers = engine.value("workers", config.workers);
        }

        const auto& market = json["market"];
        if (market.contains("initial")) {
            const auto& initial = market["initial"];
            config.initial.spot = initial.value("spot", config.initial.spot);
            config.initial.vol = initial.value("vol", config.initial.vol);
            config.initial.sofr = initial.value("sofr", config.initial.sofr);
            config.initial.credit_spread = initial.value("credit_spread", config.initial.credit_spread);
        }
        for (const auto& scenario : market["scenarios"]) {
            config.scenarios.push_back(parseScenario(scenario));
        }

        for (const auto& pos : json["portfolio"]) {
            config.portfolio.push_back({parseInstrument(pos), pos.at("quantity").get<double>()});
        }

        if (json.contains("hedges")) {
            const auto& hedges = json["hedges"];
            if (hedges.contains("gamma") && !hedges["gamma"].is_null()) {
                config.gamma_hedge = parseInstrument(hedges["gamma"]);
            }
            if (hedges.contains("vega") && !hedges["vega"].is_null()) {
                config.vega_hedge = parseInstrument(hedges["vega"]);
            }
        }

        if (json.contains("output")) {
            const auto& output = json["output"];
            config.output_path = output.value("path", config.output_path);
            config.output_format = output.value("format", config.output_format);
        }

        if (json.contains("logging")) {
            const auto& logging = json["logging"];
            config.log_level = logging.value("level", config.log_level);
            config.log_file = logging.value("file", config.log_file);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to read configuration: " + std::string(e.what()));
    }

    return config;
}

SimulationConfig SimulationConfig::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file: " + std::string(e.what()));
    }

    return fromJson(json);
}

std::shared_ptr<const Instrument> makeInstrument(const InstrumentSpec& instrument) {
    if (instrument.kind == InstrumentSpec::Kind::UNDERLYING) {
        return std::make_shared<Underlying>();
    }
    return std::make_shared<EuropeanOption>(instrument.strike, instrument.expiry, instrument.option_type);
}

Portfolio makePortfolio(const SimulationConfig& config) {
    Portfolio portfolio;
    for (const auto& pos : config.portfolio) {
        portfolio.addPosition(makeInstrument(pos.instrument), pos.quantity);
    }
    return portfolio;
}

EngineConfig makeEngineConfig(const SimulationConfig& config) {
    EngineConfig engine;
    engine.rehedge_interval = config.rehedge_interval;
    engine.stock_spread_bps = config.stock_spread_bps;
    engine.option_spread_bps = config.option_spread_bps;
    if (config.gamma_hedge) {
        engine.gamma_hedge_instrument = makeInstrument(*config.gamma_hedge);
    }
    if (config.vega_hedge) {
        engine.vega_hedge_instrument = makeInstrument(*config.vega_hedge);
    }
    return engine;
}

std::shared_ptr<const MarketFeed> makeFeed(const ScenarioSpec& scenario,
                                           const MarketInitialConditions& initial) {
    switch (scenario.source) {
        case ScenarioSpec::Source::CSV:
            return std::make_shared<MarketFeed>(loadFeedCsv(scenario.csv_path));
        case ScenarioSpec::Source::PRESET: {
            ScenarioGenerator generator(initial.spot, initial.vol, initial.sofr, initial.credit_spread);
            return std::make_shared<MarketFeed>(
                generator.simulatePreset(scenario.preset, scenario.start_date, scenario.days));
        }
        case ScenarioSpec::Source::CUSTOM: {
            ScenarioGenerator generator(initial.spot, initial.vol, initial.sofr, initial.credit_spread);
            return std::make_shared<MarketFeed>(
                generator.simulate(scenario.start_date, scenario.days, scenario.shock));
        }
    }
    throw std::logic_error("Unhandled scenario source for " + scenario.name);
}

std::vector<ScenarioRun> makeScenarioRuns(const SimulationConfig& config) {
    // Instruments are immutable, so one set is shared by every run
    const Portfolio portfolio = makePortfolio(config);
    const EngineConfig engine = makeEngineConfig(config);

    std::vector<ScenarioRun> runs;
    runs.reserve(config.scenarios.size());
    const MarketInitialConditions initial = config.initial;
    for (const auto& scenario : config.scenarios) {
        // Built on the worker so a feed error fails only this scenario
        runs.push_back({scenario.name, portfolio, nullptr, engine,
                        [scenario, initial]() { return makeFeed(scenario, initial); }});
    }
    return runs;
}

} // namespace hedging
