#include "utils/config_validator.h"
#include "core/date.h"
#include "market/scenario_generator.h"
#include <limits>
#include <set>
#include <stdexcept>

namespace hedging {

ConfigValidator::ValidationResult ConfigValidator::validateConfig(const nlohmann::json& config) {
    ValidationResult result;
    result.is_valid = true;

    if (!config.is_object()) {
        addError(result, "Configuration root must be a JSON object");
        return result;
    }

    // Validate required sections
    validateRequiredSections(config, result);

    // Validate each section
    if (config.contains("engine")) {
        validateEngineConfig(config["engine"], result);
    }

    if (config.contains("market")) {
        validateMarketConfig(config["market"], result);
    }

    if (config.contains("portfolio")) {
        validatePortfolioConfig(config["portfolio"], result);
    }

    if (config.contains("hedges")) {
        validateHedgesConfig(config["hedges"], result);
    }

    if (config.contains("output")) {
        validateOutputConfig(config["output"], result);
    }

    if (config.contains("logging")) {
        validateLoggingConfig(config["logging"], result);
    }

    return result;
}

void ConfigValidator::validateRequiredSections(const nlohmann::json& config, ValidationResult& result) {
    const std::vector<std::string> required_sections = {"market", "portfolio"};

    for (const auto& section : required_sections) {
        if (!config.contains(section)) {
            addError(result, "Missing required '" + section + "' configuration section");
        }
    }

    if (!config.contains("engine")) {
        result.warnings.push_back("Missing 'engine' section, using defaults");
    }
}

void ConfigValidator::validateEngineConfig(const nlohmann::json& engine, ValidationResult& result) {
    if (!engine.is_object()) {
        addError(result, "'engine' must be an object");
        return;
    }

    if (engine.contains("rehedge_interval")) {
        const auto& interval = engine["rehedge_interval"];
        if (!interval.is_number_integer() || interval.get<long long>() < 1 ||
            interval.get<long long>() > std::numeric_limits<int>::max()) {
            addError(result, "engine.rehedge_interval must be an integer between 1 and " +
                                 std::to_string(std::numeric_limits<int>::max()));
        } else if (interval.get<long long>() > 20) {
            result.warnings.push_back(
                "engine.rehedge_interval of " + std::to_string(interval.get<long long>()) +
                " steps leaves the book unhedged for most of a typical stress window");
        }
    }

    for (const auto& field : {"stock_spread_bps", "option_spread_bps"}) {
        if (engine.contains(field)) {
            const auto& value = engine[field];
            if (!value.is_number() || value.get<double>() < 0.0) {
                addError(result, std::string("engine.") + field + " must be a non-negative number");
            }
        }
    }

    if (engine.contains("stock_spread_bps") && engine.contains("option_spread_bps") &&
        engine["stock_spread_bps"].is_number() && engine["option_spread_bps"].is_number() &&
        engine["option_spread_bps"].get<double>() < engine["stock_spread_bps"].get<double>()) {
        result.warnings.push_back("engine.option_spread_bps is tighter than engine.stock_spread_bps");
    }

    if (engine.contains("workers")) {
        const auto& workers = engine["workers"];
        if (!workers.is_number_integer() || workers.get<long long>() < 1) {
            addError(result, "engine.workers must be an integer >= 1");
        }
    }
}

void ConfigValidator::validateMarketConfig(const nlohmann::json& market, ValidationResult& result) {
    if (!market.is_object()) {
        addError(result, "'market' must be an object");
        return;
    }

    // Starting spread the generated paths move away from
    double initial_spread = 0.01;
    if (market.contains("initial")) {
        const auto& initial = market["initial"];
        if (!initial.is_object()) {
            addError(result, "market.initial must be an object");
        } else {
            for (const auto& field : {"spot", "vol", "sofr", "credit_spread"}) {
                if (initial.contains(field) && !initial[field].is_number()) {
                    addError(result, std::string("market.initial.") + field + " must be a number");
                }
            }
            if (initial.contains("spot") && initial["spot"].is_number() &&
                initial["spot"].get<double>() <= 0.0) {
                addError(result, "market.initial.spot must be > 0");
            }
            if (initial.contains("vol") && initial["vol"].is_number()) {
                double vol = initial["vol"].get<double>();
                if (vol <= 0.0) {
                    addError(result, "market.initial.vol must be > 0");
                } else if (vol > 2.0) {
                    result.warnings.push_back("market.initial.vol above 200% looks like a percentage, expected a decimal");
                }
            }
            if (initial.contains("credit_spread") && initial["credit_spread"].is_number()) {
                initial_spread = initial["credit_spread"].get<double>();
                if (initial_spread < 0.0) {
                    addError(result, "market.initial.credit_spread must be >= 0");
                }
            }
        }
    }

    if (!market.contains("scenarios")) {
        addError(result, "market.scenarios is required");
        return;
    }

    const auto& scenarios = market["scenarios"];
    if (!scenarios.is_array() || scenarios.empty()) {
        addError(result, "market.scenarios must be a non-empty array");
        return;
    }

    std::set<std::string> names;
    for (size_t i = 0; i < scenarios.size(); ++i) {
        const std::string label = "market.scenarios[" + std::to_string(i) + "]";
        const auto& scenario = scenarios[i];
        validateScenario(scenario, label, initial_spread, result);

        if (scenario.is_object() && scenario.contains("name") && scenario["name"].is_string()) {
            const std::string name = scenario["name"].get<std::string>();
            if (!names.insert(name).second) {
                addError(result, label + ": duplicate scenario name '" + name + "'");
            }
        }
    }
}

void ConfigValidator::validateScenario(const nlohmann::json& scenario, const std::string& label,
                                       double initial_spread, ValidationResult& result) {
    if (!scenario.is_object()) {
        addError(result, label + " must be an object");
        return;
    }

    if (!scenario.contains("name") || !scenario["name"].is_string() ||
        scenario["name"].get<std::string>().empty()) {
        addError(result, label + ": name must be a non-empty string");
    } else {
        // Names end up in result and feed file names
        const std::string name = scenario["name"].get<std::string>();
        if (name.find_first_of("/\\") != std::string::npos || name.find("..") != std::string::npos) {
            addError(result, label + ": name '" + name + "' must not contain path separators or '..'");
        }
    }

    const bool has_preset = scenario.contains("preset");
    const bool has_csv = scenario.contains("csv");
    const bool has_custom = scenario.contains("spot_ret");
    const int sources = static_cast<int>(has_preset) + static_cast<int>(has_csv) +
                        static_cast<int>(has_custom);
    if (sources != 1) {
        addError(result, label + ": specify exactly one of 'preset', 'csv' or a custom shock");
        return;
    }

    if (has_csv) {
        if (!scenario["csv"].is_string() || scenario["csv"].get<std::string>().empty()) {
            addError(result, label + ".csv must be a file path");
        }
        return;
    }

    if (has_preset) {
        if (!scenario["preset"].is_string()) {
            addError(result, label + ".preset must be a string");
        } else {
            try {
                const ScenarioPreset& preset =
                    ScenarioGenerator::findPreset(scenario["preset"].get<std::string>());
                if (initial_spread + preset.shock.d_spread < 0.0) {
                    addError(result, label + ": preset '" + preset.name +
                                         "' takes the credit spread below zero from market.initial");
                }
            } catch (const std::invalid_argument& e) {
                addError(result, label + ": " + e.what());
            }
        }
    } else {
        for (const auto& field : {"spot_ret", "vol_mult", "d_sofr", "d_spread"}) {
            if (!scenario.contains(field) || !scenario[field].is_number()) {
                addError(result, label + ": custom shock requires numeric '" + field + "'");
            }
        }
        if (!scenario.contains("days")) {
            addError(result, label + ": custom shock requires 'days'");
        }
        if (scenario.contains("spot_ret") && scenario["spot_ret"].is_number() &&
            scenario["spot_ret"].get<double>() <= -1.0) {
            addError(result, label + ".spot_ret must be > -1");
        }
        if (scenario.contains("d_spread") && scenario["d_spread"].is_number() &&
            initial_spread + scenario["d_spread"].get<double>() < 0.0) {
            addError(result, label + ".d_spread takes the credit spread below zero");
        }
    }

    if (!scenario.contains("start_date")) {
        addError(result, label + ": start_date is required");
    } else {
        validateDateField(scenario, "start_date", label, result);
    }

    if (scenario.contains("days")) {
        const auto& days = scenario["days"];
        if (!days.is_number_integer() || days.get<long long>() < 1) {
            addError(result, label + ".days must be an integer >= 1");
        } else if (days.get<long long>() > 2520) {
            result.warnings.push_back(label + ".days spans more than ten years of business days");
        }
    }
}

void ConfigValidator::validatePortfolioConfig(const nlohmann::json& portfolio, ValidationResult& result) {
    if (!portfolio.is_array()) {
        addError(result, "'portfolio' must be an array of positions");
        return;
    }

    if (portfolio.empty()) {
        result.warnings.push_back("Portfolio is empty; only hedges and cash will be simulated");
    }

    for (size_t i = 0; i < portfolio.size(); ++i) {
        const std::string label = "portfolio[" + std::to_string(i) + "]";
        const auto& pos = portfolio[i];
        if (!pos.is_object()) {
            addError(result, label + " must be an object");
            continue;
        }

        if (!pos.contains("quantity") || !pos["quantity"].is_number()) {
            addError(result, label + ": quantity must be a number");
        } else if (pos["quantity"].get<double>() == 0.0) {
            result.warnings.push_back(label + ": zero quantity position has no effect");
        }

        if (!pos.contains("type") || !pos["type"].is_string()) {
            addError(result, label + ": type must be 'option' or 'underlying'");
            continue;
        }

        const std::string type = pos["type"].get<std::string>();
        if (type == "option") {
            validateOptionFields(pos, label, result);
        } else if (type != "underlying") {
            addError(result, label + ": unknown position type '" + type + "'");
        }
    }
}

void ConfigValidator::validateHedgesConfig(const nlohmann::json& hedges, ValidationResult& result) {
    if (!hedges.is_object()) {
        addError(result, "'hedges' must be an object");
        return;
    }

    for (const auto& leg : {"gamma", "vega"}) {
        if (!hedges.contains(leg) || hedges[leg].is_null()) {
            continue;
        }
        const std::string label = std::string("hedges.") + leg;
        if (!hedges[leg].is_object()) {
            addError(result, label + " must be an object");
            continue;
        }
        validateOptionFields(hedges[leg], label, result);
    }

    // A gamma hedge should be shorter-dated than the vega hedge
    if (hedges.contains("gamma") && hedges.contains("vega") &&
        hedges["gamma"].is_object() && hedges["vega"].is_object() &&
        hedges["gamma"].contains("expiry") && hedges["vega"].contains("expiry") &&
        hedges["gamma"]["expiry"].is_string() && hedges["vega"]["expiry"].is_string()) {
        try {
            Date gamma_expiry = Date::parse(hedges["gamma"]["expiry"].get<std::string>());
            Date vega_expiry = Date::parse(hedges["vega"]["expiry"].get<std::string>());
            if (gamma_expiry >= vega_expiry) {
                result.warnings.push_back("hedges.gamma expires on or after hedges.vega; "
                                          "gamma hedges are usually the shorter-dated leg");
            }
        } catch (const std::invalid_argument&) {
            // Malformed dates are already reported by validateOptionFields
        }
    }
}

void ConfigValidator::validateOutputConfig(const nlohmann::json& output, ValidationResult& result) {
    if (!output.is_object()) {
        addError(result, "'output' must be an object");
        return;
    }

    if (output.contains("format")) {
        if (!output["format"].is_string()) {
            addError(result, "output.format must be a string");
        } else {
            const std::string format = output["format"].get<std::string>();
            if (format != "csv" && format != "json") {
                addError(result, "Invalid output.format: " + format);
            }
        }
    }

    if (output.contains("path") &&
        (!output["path"].is_string() || output["path"].get<std::string>().empty())) {
        addError(result, "output.path must be a non-empty string");
    }
}

void ConfigValidator::validateLoggingConfig(const nlohmann::json& logging, ValidationResult& result) {
    if (!logging.is_object()) {
        addError(result, "'logging' must be an object");
        return;
    }

    if (logging.contains("level")) {
        const auto& level = logging["level"];
        static const std::set<std::string> kLevels = {
            "debug", "info", "warning", "warn", "error", "critical"
        };
        if (!level.is_string() || kLevels.count(level.get<std::string>()) == 0) {
            addError(result, "logging.level must be one of debug, info, warning, error, critical");
        }
    }

    if (logging.contains("file") && !logging["file"].is_string()) {
        addError(result, "logging.file must be a string");
    }
}

void ConfigValidator::validateOptionFields(const nlohmann::json& entry, const std::string& label,
                                           ValidationResult& result) {
    if (!entry.contains("strike") || !entry["strike"].is_number() ||
        entry["strike"].get<double>() <= 0.0) {
        addError(result, label + ": strike must be a number > 0");
    }

    if (!entry.contains("expiry")) {
        addError(result, label + ": expiry is required");
    } else {
        validateDateField(entry, "expiry", label, result);
    }

    if (!entry.contains("option_type") || !entry["option_type"].is_string()) {
        addError(result, label + ": option_type must be 'call' or 'put'");
    } else {
        const std::string type = entry["option_type"].get<std::string>();
        if (type != "call" && type != "put") {
            addError(result, label + ": option_type must be 'call' or 'put' (got '" + type + "')");
        }
    }
}

void ConfigValidator::validateDateField(const nlohmann::json& entry, const std::string& field,
                                        const std::string& label, ValidationResult& result) {
    if (!entry[field].is_string()) {
        addError(result, label + "." + field + " must be a YYYY-MM-DD string");
        return;
    }
    try {
        Date::parse(entry[field].get<std::string>());
    } catch (const std::invalid_argument& e) {
        addError(result, label + "." + field + ": " + e.what());
    }
}

void ConfigValidator::addError(ValidationResult& result, const std::string& message) {
    result.errors.push_back(message);
    result.is_valid = false;
}

} // namespace hedging
