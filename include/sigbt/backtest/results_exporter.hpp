// include/sigbt/backtest/results_exporter.hpp
#pragma once

#include <string>
#include <vector>
#include "sigbt/backtest/performance_analyzer.hpp"
#include "sigbt/backtest/trade_record.hpp"
#include "sigbt/core/error.hpp"
#include "sigbt/core/types.hpp"

namespace sigbt {
namespace backtest {

/**
 * @brief Completed trades only, in chronological order
 */
std::vector<Trade> trade_summary(const std::vector<Trade>& trades);

/**
 * @brief Writes run output as CSV files into one directory
 *
 * Files are named <prefix>_results.csv, <prefix>_trades.csv and
 * <prefix>_metrics.csv. The directory is created on first write.
 */
class ResultsExporter {
public:
    explicit ResultsExporter(std::string output_directory);

    /**
     * @brief One line per bar: the input bar followed by every result column
     * @param bars Bars the run was simulated on
     * @param result Output of that run; rows must align with bars
     * @param prefix File name prefix
     */
    Result<void> export_results(const std::vector<Bar>& bars, const SimulationResult& result,
                                const std::string& prefix) const;

    /**
     * @brief One line per completed trade; no file is written when there are none
     */
    Result<void> export_trades(const std::vector<Trade>& trades, const std::string& prefix) const;

    /**
     * @brief Single-row metrics table with named columns
     */
    Result<void> export_metrics(const Metrics& metrics, const std::string& prefix) const;

    Result<void> export_all(const std::vector<Bar>& bars, const SimulationResult& result,
                            const Metrics& metrics, const std::string& prefix) const;

    std::string file_path(const std::string& prefix, const std::string& suffix) const;

    const std::string& output_directory() const {
        return output_directory_;
    }

private:
    Result<void> ensure_directory() const;

    std::string output_directory_;
};

}  // namespace backtest
}  // namespace sigbt
