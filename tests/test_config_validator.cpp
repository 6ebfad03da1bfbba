#include <gtest/gtest.h>
#include "utils/config_validator.h"
#include <algorithm>
#include <nlohmann/json.hpp>

using namespace hedging;
using json = nlohmann::json;

class ConfigValidatorTest : public ::testing::Test {
protected:
    json createValidConfig() {
        return json::parse(R"({
            "engine": {
                "rehedge_interval": 1,
                "stock_spread_bps": 5.0,
                "option_spread_bps": 100.0,
                "workers": 2
            },
            "market": {
                "initial": {
                    "spot": 100.0,
                    "vol": 0.20,
                    "sofr": 0.04,
                    "credit_spread": 0.01
                },
                "scenarios": [
                    { "name": "covid", "preset": "covid_crash_2020", "start_date": "2024-03-01" },
                    { "name": "history", "csv": "data/spx_2020.csv" },
                    { "name": "slow_bleed", "start_date": "2024-03-01", "days": 40,
                      "spot_ret": -0.12, "vol_mult": 1.0, "d_sofr": 0.0, "d_spread": 0.01 }
                ]
            },
            "portfolio": [
                { "type": "option", "strike": 100.0, "expiry": "2024-12-20",
                  "option_type": "call", "quantity": -1000 },
                { "type": "underlying", "quantity": 250 }
            ],
            "hedges": {
                "gamma": { "strike": 100.0, "expiry": "2024-05-17", "option_type": "call" },
                "vega": { "strike": 100.0, "expiry": "2025-06-20", "option_type": "call" }
            },
            "output": {
                "path": "results.csv",
                "format": "csv"
            },
            "logging": {
                "level": "info",
                "file": "hedging.log"
            }
        })");
    }

    static bool hasMessage(const std::vector<std::string>& messages, const std::string& fragment) {
        return std::any_of(messages.begin(), messages.end(),
            [&fragment](const std::string& message) {
                return message.find(fragment) != std::string::npos;
            });
    }
};

TEST_F(ConfigValidatorTest, ValidConfigPasses) {
    auto config = createValidConfig();
    auto result = ConfigValidator::validateConfig(config);

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(ConfigValidatorTest, MissingRequiredSections) {
    auto config = createValidConfig();
    config.erase("portfolio");

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.errors, "Missing required 'portfolio'"));
}

TEST_F(ConfigValidatorTest, MissingEngineSectionIsOnlyAWarning) {
    auto config = createValidConfig();
    config.erase("engine");

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.warnings, "Missing 'engine' section"));
}

TEST_F(ConfigValidatorTest, NonObjectRoot) {
    auto result = ConfigValidator::validateConfig(json::array());
    EXPECT_FALSE(result.is_valid);
}

TEST_F(ConfigValidatorTest, InvalidRehedgeInterval) {
    auto config = createValidConfig();
    config["engine"]["rehedge_interval"] = 0;
    auto result = ConfigValidator::validateConfig(config);
    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.errors, "rehedge_interval"));

    config["engine"]["rehedge_interval"] = 2.5;
    result = ConfigValidator::validateConfig(config);
    EXPECT_FALSE(result.is_valid);
}

TEST_F(ConfigValidatorTest, RehedgeIntervalBeyondIntRange) {
    auto config = createValidConfig();
    config["engine"]["rehedge_interval"] = 3000000000LL;

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.errors, "rehedge_interval"));
}

TEST_F(ConfigValidatorTest, LongRehedgeIntervalWarning) {
    auto config = createValidConfig();
    config["engine"]["rehedge_interval"] = 30;

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.warnings, "rehedge_interval"));
}

TEST_F(ConfigValidatorTest, NegativeSpread) {
    auto config = createValidConfig();
    config["engine"]["option_spread_bps"] = -1.0;

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.errors, "option_spread_bps"));
}

TEST_F(ConfigValidatorTest, InvalidInitialMarket) {
    auto config = createValidConfig();
    config["market"]["initial"]["vol"] = 0.0;
    config["market"]["initial"]["spot"] = -10.0;

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.errors, "market.initial.vol"));
    EXPECT_TRUE(hasMessage(result.errors, "market.initial.spot"));
}

TEST_F(ConfigValidatorTest, PercentageVolWarning) {
    auto config = createValidConfig();
    config["market"]["initial"]["vol"] = 20.0;

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.warnings, "percentage"));
}

TEST_F(ConfigValidatorTest, EmptyScenarioList) {
    auto config = createValidConfig();
    config["market"]["scenarios"] = json::array();

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.errors, "non-empty array"));
}

TEST_F(ConfigValidatorTest, UnknownPreset) {
    auto config = createValidConfig();
    config["market"]["scenarios"][0]["preset"] = "black_monday_1987";

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.errors, "black_monday_1987"));
}

TEST_F(ConfigValidatorTest, DuplicateScenarioNames) {
    auto config = createValidConfig();
    config["market"]["scenarios"][1]["name"] = "covid";

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.errors, "duplicate scenario name"));
}

TEST_F(ConfigValidatorTest, ScenarioNameMustBeFileSafe) {
    for (const char* name : {"../escape", "nested/name", "back\\slash", ".."}) {
        auto config = createValidConfig();
        config["market"]["scenarios"][0]["name"] = name;

        auto result = ConfigValidator::validateConfig(config);

        EXPECT_FALSE(result.is_valid) << name;
        EXPECT_TRUE(hasMessage(result.errors, "path separators")) << name;
    }
}

TEST_F(ConfigValidatorTest, CustomShockDrivingSpreadNegative) {
    auto config = createValidConfig();
    config["market"]["scenarios"][2]["d_spread"] = -0.02;

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.errors, "market.scenarios[2].d_spread"));

    // Same shock is fine from a wider starting spread
    config["market"]["initial"]["credit_spread"] = 0.03;
    result = ConfigValidator::validateConfig(config);
    EXPECT_TRUE(result.is_valid);
}

TEST_F(ConfigValidatorTest, PresetDrivingSpreadNegative) {
    auto config = createValidConfig();
    config["market"]["initial"]["credit_spread"] = 0.0005;
    config["market"]["scenarios"][0]["preset"] = "trump_reflation_2016";

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.errors, "trump_reflation_2016"));
}

TEST_F(ConfigValidatorTest, AmbiguousScenarioSource) {
    auto config = createValidConfig();
    config["market"]["scenarios"][0]["csv"] = "data/spx.csv";

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.errors, "exactly one of"));
}

TEST_F(ConfigValidatorTest, IncompleteCustomShock) {
    auto config = createValidConfig();
    config["market"]["scenarios"][2].erase("vol_mult");
    config["market"]["scenarios"][2].erase("days");

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.errors, "vol_mult"));
    EXPECT_TRUE(hasMessage(result.errors, "requires 'days'"));
}

TEST_F(ConfigValidatorTest, InvalidStartDate) {
    auto config = createValidConfig();
    config["market"]["scenarios"][0]["start_date"] = "2024-02-30";

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.errors, "start_date"));
}

TEST_F(ConfigValidatorTest, MissingStartDate) {
    auto config = createValidConfig();
    config["market"]["scenarios"][0].erase("start_date");

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.errors, "start_date is required"));
}

TEST_F(ConfigValidatorTest, InvalidPosition) {
    auto config = createValidConfig();
    config["portfolio"][0]["strike"] = 0.0;
    config["portfolio"][0]["option_type"] = "straddle";
    config["portfolio"][1]["type"] = "future";

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.errors, "portfolio[0]: strike"));
    EXPECT_TRUE(hasMessage(result.errors, "straddle"));
    EXPECT_TRUE(hasMessage(result.errors, "unknown position type 'future'"));
}

TEST_F(ConfigValidatorTest, EmptyPortfolioWarning) {
    auto config = createValidConfig();
    config["portfolio"] = json::array();

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.warnings, "Portfolio is empty"));
}

TEST_F(ConfigValidatorTest, HedgeLegsAreOptional) {
    auto config = createValidConfig();
    config["hedges"]["gamma"] = nullptr;
    config["hedges"].erase("vega");

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_TRUE(result.is_valid);
}

TEST_F(ConfigValidatorTest, InvertedHedgeTenorsWarning) {
    auto config = createValidConfig();
    config["hedges"]["gamma"]["expiry"] = "2026-01-16";

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.warnings, "shorter-dated"));
}

TEST_F(ConfigValidatorTest, InvalidOutputFormat) {
    auto config = createValidConfig();
    config["output"]["format"] = "parquet";

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.errors, "Invalid output.format"));
}

TEST_F(ConfigValidatorTest, InvalidLogLevel) {
    auto config = createValidConfig();
    config["logging"]["level"] = "verbose";

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(hasMessage(result.errors, "logging.level"));
}
