// include/sigbt/backtest/performance_analyzer.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <utility>
#include <vector>
#include "sigbt/backtest/simulation_config.hpp"
#include "sigbt/backtest/trade_record.hpp"

namespace sigbt {
namespace backtest {

/**
 * @brief Summary statistics of one simulation run
 *
 * Every ratio that would divide by zero or by a degenerate sample is 0;
 * inspect the sample counts (total_trades, observations) to tell a computed
 * zero from an undefined one.
 */
struct Metrics {
    // Returns and risk
    double total_return = 0.0;
    double annualized_return = 0.0;
    double annualized_volatility = 0.0;
    double sharpe_ratio = 0.0;
    double max_drawdown = 0.0;  // <= 0, e.g. -0.25 for a 25% peak-to-trough decline
    double calmar_ratio = 0.0;

    // Completed-trade statistics
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;  // <= 0
    double profit_factor = 0.0;
    double avg_holding_period = 0.0;  // Bars
    int max_consecutive_wins = 0;
    int max_consecutive_losses = 0;

    size_t observations = 0;  // Number of per-bar returns used

    nlohmann::json to_json() const;
};

/**
 * @brief Stateless calculator turning a ResultSeries and trade list into Metrics
 *
 * All methods are const and free of side effects, so one analyzer can be
 * shared between threads. Returns are per bar; annualization uses
 * trading_periods_per_year from AnalyzerConfig.
 */
class PerformanceAnalyzer {
public:
    PerformanceAnalyzer() = default;
    explicit PerformanceAnalyzer(AnalyzerConfig config) : config_(std::move(config)) {}

    /**
     * @brief Compute every metric for a finished run
     * @param result Rows and trades produced by PositionSimulator
     * @return Metrics; an empty result yields all zeros
     */
    Metrics summarize(const SimulationResult& result) const;

    /**
     * @brief One-shot summary with explicit annualization parameters
     * @param result Rows produced by PositionSimulator
     * @param trades Trade list of the same run
     * @param risk_free_rate Annual risk-free rate as decimal
     * @param trading_periods_per_year Bars per year
     */
    static Metrics summarize(const SimulationResult& result, const std::vector<Trade>& trades,
                             double risk_free_rate, int trading_periods_per_year);

    /**
     * @brief Compute every metric from the raw series
     * @param equity Per-bar equity
     * @param returns Per-bar returns
     * @param trades Trade list; open trades are ignored
     * @param initial_capital Capital at run start
     */
    Metrics summarize(const std::vector<double>& equity, const std::vector<double>& returns,
                      const std::vector<Trade>& trades, double initial_capital) const;

    const AnalyzerConfig& config() const {
        return config_;
    }

    // ========== Return Calculations ==========

    /**
     * @brief final_equity / initial_capital - 1, or 0 when initial_capital <= 0
     */
    double calculate_total_return(double initial_capital, double final_equity) const;

    /**
     * @brief Geometric annualization: (1 + total)^(1 / years) - 1
     * @param total_return Total return as decimal
     * @param observations Number of per-bar returns
     * @return 0 when years is 0 or the total loss exceeds 100%
     */
    double calculate_annualized_return(double total_return, size_t observations) const;

    // ========== Risk Calculations ==========

    /**
     * @brief Sample standard deviation of returns scaled by sqrt(periods per year)
     * @return 0 with fewer than two observations
     */
    double calculate_volatility(const std::vector<double>& returns) const;

    /**
     * @brief Annualized excess return per unit of volatility
     *
     * The annual risk-free rate is converted to a per-bar rate
     * (1 + rf)^(1 / periods) - 1 before subtracting it from the mean return.
     */
    double calculate_sharpe_ratio(const std::vector<double>& returns) const;

    /**
     * @brief Per-bar drawdown cum_i / running_max_i - 1 with cum = equity / initial_capital
     */
    std::vector<double> calculate_drawdowns(const std::vector<double>& equity,
                                            double initial_capital) const;

    /**
     * @brief Most negative drawdown, 0 for an empty or never-declining curve
     */
    double calculate_max_drawdown(const std::vector<double>& equity,
                                  double initial_capital) const;

    double calculate_calmar_ratio(double annualized_return, double max_drawdown) const;

    // ========== Trade Statistics ==========

    struct TradeStatistics {
        int total_trades = 0;
        int winning_trades = 0;  // profit > 0
        int losing_trades = 0;   // profit <= 0
        double win_rate = 0.0;
        double avg_win = 0.0;
        double avg_loss = 0.0;
        double gross_profit = 0.0;
        double gross_loss = 0.0;  // Absolute value
        double profit_factor = 0.0;
        double avg_holding_period = 0.0;
        int max_consecutive_wins = 0;
        int max_consecutive_losses = 0;
    };

    /**
     * @brief Statistics over completed trades only
     */
    TradeStatistics calculate_trade_statistics(const std::vector<Trade>& trades) const;

    /**
     * @brief Longest win and loss streaks in one forward scan
     * @return (max_consecutive_wins, max_consecutive_losses)
     */
    std::pair<int, int> calculate_consecutive_streaks(const std::vector<Trade>& trades) const;

private:
    double calculate_mean(const std::vector<double>& values) const;
    double calculate_sample_std_dev(const std::vector<double>& values, double mean) const;

    AnalyzerConfig config_;
};

}  // namespace backtest
}  // namespace sigbt
