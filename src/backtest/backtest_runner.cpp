// src/backtest/backtest_runner.cpp
#include "sigbt/backtest/backtest_runner.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <thread>

namespace sigbt {
namespace backtest {

Result<void> BacktestRunConfig::validate() const {
    if (data_path.empty()) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "data_path is required",
                                "BacktestRunConfig");
    }
    if (signal_column.empty()) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "signal_column must not be empty",
                                "BacktestRunConfig");
    }
    if (output_prefix.empty()) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "output_prefix must not be empty",
                                "BacktestRunConfig");
    }
    auto sim_result = simulation.validate();
    if (sim_result.is_error()) {
        return sim_result;
    }
    return analysis.validate();
}

Result<BacktestReport> BacktestRunner::run(const std::vector<Bar>& bars,
                                           const SimulationConfig& sim_config,
                                           const AnalyzerConfig& analyzer_config) const {
    auto analyzer_valid = analyzer_config.validate();
    if (analyzer_valid.is_error()) {
        return forward_error<BacktestReport>(*analyzer_valid.error(), "BacktestRunner");
    }

    auto sim_result = simulator_.run(bars, sim_config);
    if (sim_result.is_error()) {
        return forward_error<BacktestReport>(*sim_result.error(), "BacktestRunner");
    }

    BacktestReport report;
    report.result = sim_result.take_value();
    report.metrics = PerformanceAnalyzer(analyzer_config).summarize(report.result);
    return Result<BacktestReport>(std::move(report));
}

std::vector<SweepOutcome> BacktestRunner::run_sweep(const std::vector<Bar>& bars,
                                                    const std::vector<SimulationConfig>& configs,
                                                    const AnalyzerConfig& analyzer_config,
                                                    size_t max_workers) const {
    Logger::register_component("BacktestRunner");

    std::vector<SweepOutcome> outcomes;
    if (configs.empty()) {
        return outcomes;
    }

    if (max_workers == 0) {
        max_workers = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    const size_t worker_count = std::min(max_workers, configs.size());

    INFO("Running sweep of " << configs.size() << " configurations on " << worker_count
                             << " workers");

    // One slot per configuration; each index is claimed by exactly one worker
    std::vector<std::unique_ptr<Result<BacktestReport>>> slots(configs.size());
    std::atomic<size_t> next_index{0};

    auto worker = [&]() {
        for (size_t i = next_index.fetch_add(1); i < configs.size();
             i = next_index.fetch_add(1)) {
            try {
                slots[i] = std::make_unique<Result<BacktestReport>>(
                    run(bars, configs[i], analyzer_config));
            } catch (const std::exception& e) {
                // An exception escaping a std::thread would terminate the process
                slots[i] = std::make_unique<Result<BacktestReport>>(make_error<BacktestReport>(
                    ErrorCode::UNKNOWN_ERROR,
                    std::string("Sweep configuration threw: ") + e.what(), "BacktestRunner"));
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(worker_count);
    for (size_t t = 0; t < worker_count; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    outcomes.reserve(configs.size());
    size_t failed = 0;
    for (size_t i = 0; i < configs.size(); ++i) {
        if (slots[i]->is_error()) {
            WARN("Sweep configuration " << i << " failed: " << slots[i]->error()->what());
            failed++;
        }
        outcomes.push_back(SweepOutcome{i, configs[i], std::move(*slots[i])});
    }

    INFO("Sweep finished: " << (configs.size() - failed) << " succeeded, " << failed
                            << " failed");
    return outcomes;
}

}  // namespace backtest
}  // namespace sigbt
