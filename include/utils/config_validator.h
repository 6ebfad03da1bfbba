#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hedging {

class ConfigValidator {
public:
    struct ValidationResult {
        bool is_valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    static ValidationResult validateConfig(const nlohmann::json& config);

private:
    static void validateRequiredSections(const nlohmann::json& config, ValidationResult& result);
    static void validateEngineConfig(const nlohmann::json& engine, ValidationResult& result);
    static void validateMarketConfig(const nlohmann::json& market, ValidationResult& result);
    static void validateScenario(const nlohmann::json& scenario, const std::string& label,
                                 double initial_spread, ValidationResult& result);
    static void validatePortfolioConfig(const nlohmann::json& portfolio, ValidationResult& result);
    static void validateHedgesConfig(const nlohmann::json& hedges, ValidationResult& result);
    static void validateOutputConfig(const nlohmann::json& output, ValidationResult& result);
    static void validateLoggingConfig(const nlohmann::json& logging, ValidationResult& result);

    // Shared by portfolio entries and hedge legs
    static void validateOptionFields(const nlohmann::json& entry, const std::string& label,
                                     ValidationResult& result);
    static void validateDateField(const nlohmann::json& entry, const std::string& field,
                                  const std::string& label, ValidationResult& result);

    static void addError(ValidationResult& result, const std::string& message);
};

} // namespace hedging
