#include <iomanip>
#include <iostream>
#include "sigbt/data/csv_bar_loader.hpp"
#include "sigbt/backtest/backtest_runner.hpp"
#include "sigbt/backtest/results_exporter.hpp"
#include "sigbt/data/bar_series_validator.hpp"
#include "sigbt/core/logger.hpp"
#include "sigbt/core/time_utils.hpp"

using namespace sigbt;
using namespace sigbt::backtest;

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <run_config.json>" << std::endl;
        return 1;
    }

    try {
        BacktestRunConfig run_config;
        auto load_result = run_config.load_from_file(argv[1]);
        if (load_result.is_error()) {
            std::cerr << "Failed to load run config: " << load_result.error()->to_string()
                      << std::endl;
            return 1;
        }

        auto& logger = Logger::instance();
        logger.initialize(run_config.logger);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }

        Logger::register_component("sigbt_backtest");

        auto valid = run_config.validate();
        if (valid.is_error()) {
            ERROR("Invalid run config: " << valid.error()->to_string());
            return 1;
        }

        CsvBarLoader loader(run_config.signal_column);
        auto bars_result = loader.load(run_config.data_path);
        if (bars_result.is_error()) {
            ERROR("Failed to load bars: " << bars_result.error()->to_string());
            return 1;
        }
        std::vector<Bar> bars = bars_result.take_value();

        if (run_config.clean_input) {
            auto report = BarSeriesValidator::clean(std::move(bars));
            if (report.total_dropped() > 0) {
                WARN("Dropped " << report.total_dropped() << " bars while cleaning input");
            }
            bars = std::move(report.bars);
        }

        if (!bars.empty()) {
            INFO("Backtesting " << bars.size() << " bars from "
                                << core::format_timestamp(bars.front().timestamp) << " to "
                                << core::format_timestamp(bars.back().timestamp));
        }

        BacktestRunner runner;
        auto run_result = runner.run(bars, run_config.simulation, run_config.analysis);
        if (run_result.is_error()) {
            ERROR("Backtest failed: " << run_result.error()->to_string());
            return 1;
        }
        const BacktestReport& report = run_result.value();
        const Metrics& metrics = report.metrics;

        Logger::register_component("sigbt_backtest");
        INFO("======== Backtest Summary ========");
        INFO(std::fixed << std::setprecision(4) << "Total return:          "
                        << metrics.total_return * 100.0 << "%");
        INFO(std::fixed << std::setprecision(4) << "Annualized return:     "
                        << metrics.annualized_return * 100.0 << "%");
        INFO(std::fixed << std::setprecision(4) << "Annualized volatility: "
                        << metrics.annualized_volatility * 100.0 << "%");
        INFO(std::fixed << std::setprecision(4) << "Sharpe ratio:          "
                        << metrics.sharpe_ratio);
        INFO(std::fixed << std::setprecision(4) << "Max drawdown:          "
                        << metrics.max_drawdown * 100.0 << "%");
        INFO(std::fixed << std::setprecision(4) << "Calmar ratio:          "
                        << metrics.calmar_ratio);
        INFO("Trades:                " << metrics.total_trades << " (" << metrics.winning_trades
                                       << " won, " << metrics.losing_trades << " lost)");
        INFO(std::fixed << std::setprecision(2) << "Win rate:              "
                        << metrics.win_rate * 100.0 << "%");
        INFO(std::fixed << std::setprecision(4) << "Profit factor:         "
                        << metrics.profit_factor);
        INFO(std::fixed << std::setprecision(2) << "Avg holding period:    "
                        << metrics.avg_holding_period << " bars");
        INFO("Max consecutive wins:  " << metrics.max_consecutive_wins);
        INFO("Max consecutive losses: " << metrics.max_consecutive_losses);

        ResultsExporter exporter(run_config.output_directory);
        auto export_result =
            exporter.export_all(bars, report.result, metrics, run_config.output_prefix);
        if (export_result.is_error()) {
            ERROR("Failed to export results: " << export_result.error()->to_string());
            return 1;
        }

        INFO("Results written to " << run_config.output_directory);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
