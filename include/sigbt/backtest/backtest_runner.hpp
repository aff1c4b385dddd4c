// include/sigbt/backtest/backtest_runner.hpp
#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "sigbt/backtest/performance_analyzer.hpp"
#include "sigbt/backtest/position_simulator.hpp"
#include "sigbt/backtest/simulation_config.hpp"
#include "sigbt/core/config_base.hpp"
#include "sigbt/core/error.hpp"
#include "sigbt/core/logger.hpp"
#include "sigbt/core/types.hpp"

namespace sigbt {
namespace backtest {

/**
 * @brief Contents of a run file for the command-line backtester
 */
struct BacktestRunConfig : public ConfigBase {
    SimulationConfig simulation;
    AnalyzerConfig analysis;
    LoggerConfig logger;
    std::string data_path;
    std::string signal_column{"signal"};
    std::string output_directory{"results"};
    std::string output_prefix{"backtest"};
    bool clean_input{false};  // Sanitise bars before simulating instead of rejecting them

    Result<void> validate() const;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["simulation"] = simulation.to_json();
        j["analysis"] = analysis.to_json();
        j["logger"] = logger.to_json();
        j["data_path"] = data_path;
        j["signal_column"] = signal_column;
        j["output_directory"] = output_directory;
        j["output_prefix"] = output_prefix;
        j["clean_input"] = clean_input;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("simulation"))
            simulation.from_json(j.at("simulation"));
        if (j.contains("analysis"))
            analysis.from_json(j.at("analysis"));
        if (j.contains("logger"))
            logger.from_json(j.at("logger"));
        if (j.contains("data_path"))
            data_path = j.at("data_path").get<std::string>();
        if (j.contains("signal_column"))
            signal_column = j.at("signal_column").get<std::string>();
        if (j.contains("output_directory"))
            output_directory = j.at("output_directory").get<std::string>();
        if (j.contains("output_prefix"))
            output_prefix = j.at("output_prefix").get<std::string>();
        if (j.contains("clean_input"))
            clean_input = j.at("clean_input").get<bool>();
    }
};

/**
 * @brief Simulation output together with its performance summary
 */
struct BacktestReport {
    SimulationResult result;
    Metrics metrics;
};

/**
 * @brief Result of one configuration in a parameter sweep
 */
struct SweepOutcome {
    size_t index;  // Position of the configuration in the sweep input
    SimulationConfig config;
    Result<BacktestReport> report;
};

/**
 * @brief Runs the simulator and analyzer back to back
 *
 * Bars and configurations are only read, so a sweep shares them between
 * worker threads without copying.
 */
class BacktestRunner {
public:
    BacktestRunner() = default;

    /**
     * @brief Simulate one configuration and summarize it
     * @return Report, or the simulator's INVALID_CONFIG / INVALID_DATA error
     */
    Result<BacktestReport> run(const std::vector<Bar>& bars, const SimulationConfig& sim_config,
                               const AnalyzerConfig& analyzer_config) const;

    /**
     * @brief Run independent configurations concurrently
     * @param bars Shared input bars
     * @param configs Configurations to evaluate
     * @param analyzer_config Annualization parameters shared by every run
     * @param max_workers Upper bound on worker threads, 0 for hardware concurrency
     * @return One outcome per configuration, in input order
     */
    std::vector<SweepOutcome> run_sweep(const std::vector<Bar>& bars,
                                        const std::vector<SimulationConfig>& configs,
                                        const AnalyzerConfig& analyzer_config,
                                        size_t max_workers = 0) const;

private:
    PositionSimulator simulator_;
};

}  // namespace backtest
}  // namespace sigbt
