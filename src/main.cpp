#include "config/simulation_config.h"
#include "engine/batch_runner.h"
#include "engine/valuation_reporter.h"
#include "market/feed_csv.h"
#include "market/scenario_generator.h"
#include "utils/logger.h"

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace fs = std::filesystem;
using namespace hedging;

namespace {

// With several scenarios each result file gets the scenario name appended
std::string outputPathFor(const std::string& base_path, const std::string& scenario_name,
                          size_t scenario_count) {
    if (scenario_count <= 1) {
        return base_path;
    }
    fs::path path(base_path);
    fs::path stem = path.stem();
    stem += "_" + scenario_name;
    return (path.parent_path() / stem).string() + path.extension().string();
}

void writeOutcome(const ScenarioOutcome& outcome, const std::string& path, const std::string& format) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Cannot write results file: " + path);
    }

    if (format == "json") {
        ofs << resultsToJson(outcome.name, outcome.rows, outcome.summary).dump(2) << std::endl;
    } else {
        writeResultsCsv(outcome.rows, ofs);
    }
    LOG_INFO("Wrote " + std::to_string(outcome.rows.size()) + " rows to " + path);
}

void printSummary(const std::vector<ScenarioOutcome>& outcomes) {
    std::cout << "\n=== Hedging Simulation Results ===" << std::endl;
    std::cout << std::left << std::setw(24) << "Scenario"
              << std::right << std::setw(16) << "Final P&L"
              << std::setw(14) << "Txn Costs"
              << std::setw(14) << "Funding"
              << std::setw(14) << "Max DD" << std::endl;

    for (const auto& outcome : outcomes) {
        std::cout << std::left << std::setw(24) << outcome.name << std::right;
        if (!outcome.success) {
            std::cout << "  FAILED: " << outcome.error << std::endl;
            continue;
        }
        std::cout << std::fixed << std::setprecision(2)
                  << std::setw(16) << outcome.summary.final_pnl
                  << std::setw(14) << outcome.summary.total_transaction_cost
                  << std::setw(14) << outcome.summary.total_funding_cost
                  << std::setw(14) << outcome.summary.max_drawdown << std::endl;
    }
}

void listPresets() {
    std::cout << "Available scenario presets:" << std::endl;
    for (const auto& preset : ScenarioGenerator::presets()) {
        std::cout << "  " << std::left << std::setw(24) << preset.name
                  << preset.default_days << " days  " << preset.narrative << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        namespace po = boost::program_options;
        po::options_description desc("Dynamic Hedging Simulator Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("config,c", po::value<std::string>(), "Simulation configuration file (JSON)")
            ("output,o", po::value<std::string>(), "Results file (overrides output.path)")
            ("format,f", po::value<std::string>(), "Results format: csv or json (overrides output.format)")
            ("workers,w", po::value<size_t>(), "Worker threads for multi-scenario runs")
            ("log-level", po::value<std::string>(), "debug, info, warning, error or critical")
            ("dump-feed", po::value<std::string>(), "Directory to write each scenario's market feed as CSV")
            ("list-presets", po::bool_switch()->default_value(false), "List stress scenario presets and exit");

        po::variables_map vm;
        try {
            po::store(po::parse_command_line(argc, argv, desc), vm);

            if (vm.count("help")) {
                std::cout << desc << std::endl;
                return 0;
            }

            po::notify(vm);
        } catch (const po::error& e) {
            std::cerr << "Error: " << e.what() << "\n\n";
            std::cerr << desc << std::endl;
            return 1;
        }

        if (vm["list-presets"].as<bool>()) {
            listPresets();
            return 0;
        }

        if (!vm.count("config")) {
            std::cerr << "Error: --config is required\n\n" << desc << std::endl;
            return 1;
        }

        // Console-only logger until the configuration is known
        const LogLevel cli_level = vm.count("log-level")
            ? Logger::parseLevel(vm["log-level"].as<std::string>()) : LogLevel::INFO;
        Logger::initialize(cli_level, "");

        SimulationConfig config = SimulationConfig::fromFile(vm["config"].as<std::string>());

        if (vm.count("output")) {
            config.output_path = vm["output"].as<std::string>();
        }
        if (vm.count("format")) {
            config.output_format = vm["format"].as<std::string>();
            if (config.output_format != "csv" && config.output_format != "json") {
                throw std::invalid_argument("Invalid --format: " + config.output_format);
            }
        }
        if (vm.count("workers")) {
            config.workers = vm["workers"].as<size_t>();
        }

        Logger::initialize(vm.count("log-level") ? cli_level : Logger::parseLevel(config.log_level),
                           config.log_file);
        LOG_INFO("Starting hedging simulation with " + std::to_string(config.scenarios.size()) +
                 " scenario(s)");

        std::vector<ScenarioRun> runs = makeScenarioRuns(config);

        BatchRunner runner(config.workers);
        std::vector<ScenarioOutcome> outcomes = runner.run(runs);

        if (vm.count("dump-feed")) {
            fs::path dir(vm["dump-feed"].as<std::string>());
            fs::create_directories(dir);
            for (const auto& outcome : outcomes) {
                if (!outcome.feed) {
                    continue;
                }
                const std::string feed_path = (dir / (outcome.name + "_feed.csv")).string();
                saveFeedCsv(*outcome.feed, feed_path);
                LOG_INFO("Wrote market feed for '" + outcome.name + "' to " + feed_path);
            }
        }

        bool all_succeeded = true;
        for (const auto& outcome : outcomes) {
            if (!outcome.success) {
                all_succeeded = false;
                continue;
            }
            writeOutcome(outcome, outputPathFor(config.output_path, outcome.name, outcomes.size()),
                         config.output_format);
        }

        printSummary(outcomes);

        if (!all_succeeded) {
            LOG_ERROR("One or more scenarios failed");
            Logger::getInstance().flush();
            return 1;
        }

        LOG_INFO("Hedging simulation completed successfully");

    } catch (const std::exception& e) {
        LOG_ERROR("Hedging simulation failed: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
