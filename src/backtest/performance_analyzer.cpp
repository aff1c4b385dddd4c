// src/backtest/performance_analyzer.cpp
#include "sigbt/backtest/performance_analyzer.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace sigbt {
namespace backtest {

nlohmann::json Metrics::to_json() const {
    nlohmann::json j;
    j["total_return"] = total_return;
    j["annualized_return"] = annualized_return;
    j["annualized_volatility"] = annualized_volatility;
    j["sharpe_ratio"] = sharpe_ratio;
    j["max_drawdown"] = max_drawdown;
    j["calmar_ratio"] = calmar_ratio;
    j["total_trades"] = total_trades;
    j["winning_trades"] = winning_trades;
    j["losing_trades"] = losing_trades;
    j["win_rate"] = win_rate;
    j["avg_win"] = avg_win;
    j["avg_loss"] = avg_loss;
    j["profit_factor"] = profit_factor;
    j["avg_holding_period"] = avg_holding_period;
    j["max_consecutive_wins"] = max_consecutive_wins;
    j["max_consecutive_losses"] = max_consecutive_losses;
    j["observations"] = observations;
    return j;
}

Metrics PerformanceAnalyzer::summarize(const SimulationResult& result) const {
    return summarize(result.equity_curve(), result.returns(), result.trades,
                     result.initial_capital);
}

Metrics PerformanceAnalyzer::summarize(const SimulationResult& result,
                                       const std::vector<Trade>& trades, double risk_free_rate,
                                       int trading_periods_per_year) {
    AnalyzerConfig config;
    config.risk_free_rate = risk_free_rate;
    config.trading_periods_per_year = trading_periods_per_year;
    PerformanceAnalyzer analyzer(config);
    return analyzer.summarize(result.equity_curve(), result.returns(), trades,
                              result.initial_capital);
}

Metrics PerformanceAnalyzer::summarize(const std::vector<double>& equity,
                                       const std::vector<double>& returns,
                                       const std::vector<Trade>& trades,
                                       double initial_capital) const {
    Metrics metrics;
    metrics.observations = returns.size();

    if (!equity.empty()) {
        metrics.total_return = calculate_total_return(initial_capital, equity.back());
    }
    metrics.annualized_return =
        calculate_annualized_return(metrics.total_return, returns.size());
    metrics.annualized_volatility = calculate_volatility(returns);
    metrics.sharpe_ratio = calculate_sharpe_ratio(returns);
    metrics.max_drawdown = calculate_max_drawdown(equity, initial_capital);
    metrics.calmar_ratio = calculate_calmar_ratio(metrics.annualized_return, metrics.max_drawdown);

    auto stats = calculate_trade_statistics(trades);
    metrics.total_trades = stats.total_trades;
    metrics.winning_trades = stats.winning_trades;
    metrics.losing_trades = stats.losing_trades;
    metrics.win_rate = stats.win_rate;
    metrics.avg_win = stats.avg_win;
    metrics.avg_loss = stats.avg_loss;
    metrics.profit_factor = stats.profit_factor;
    metrics.avg_holding_period = stats.avg_holding_period;
    metrics.max_consecutive_wins = stats.max_consecutive_wins;
    metrics.max_consecutive_losses = stats.max_consecutive_losses;

    return metrics;
}

// ========== Return Calculations ==========

double PerformanceAnalyzer::calculate_total_return(double initial_capital,
                                                   double final_equity) const {
    if (initial_capital <= 0.0) {
        return 0.0;
    }
    return final_equity / initial_capital - 1.0;
}

double PerformanceAnalyzer::calculate_annualized_return(double total_return,
                                                        size_t observations) const {
    if (observations == 0 || config_.trading_periods_per_year <= 0) {
        return 0.0;
    }
    double years =
        static_cast<double>(observations) / static_cast<double>(config_.trading_periods_per_year);
    double growth = 1.0 + total_return;
    if (years <= 0.0 || growth < 0.0) {
        return 0.0;
    }
    return std::pow(growth, 1.0 / years) - 1.0;
}

// ========== Risk Calculations ==========

double PerformanceAnalyzer::calculate_volatility(const std::vector<double>& returns) const {
    if (returns.size() < 2 || config_.trading_periods_per_year <= 0) {
        return 0.0;
    }
    double mean_return = calculate_mean(returns);
    return calculate_sample_std_dev(returns, mean_return) *
           std::sqrt(static_cast<double>(config_.trading_periods_per_year));
}

double PerformanceAnalyzer::calculate_sharpe_ratio(const std::vector<double>& returns) const {
    if (returns.size() < 2 || config_.trading_periods_per_year <= 0) {
        return 0.0;
    }

    double mean_return = calculate_mean(returns);
    double std_dev = calculate_sample_std_dev(returns, mean_return);
    if (std_dev <= 0.0) {
        return 0.0;
    }

    const double periods = static_cast<double>(config_.trading_periods_per_year);
    double rf_periodic = std::pow(1.0 + config_.risk_free_rate, 1.0 / periods) - 1.0;

    return (mean_return - rf_periodic) / std_dev * std::sqrt(periods);
}

std::vector<double> PerformanceAnalyzer::calculate_drawdowns(const std::vector<double>& equity,
                                                             double initial_capital) const {
    std::vector<double> drawdowns;
    if (equity.empty() || initial_capital <= 0.0) {
        return drawdowns;
    }
    drawdowns.reserve(equity.size());

    double peak = equity.front() / initial_capital;
    for (double value : equity) {
        double cumulative = value / initial_capital;
        peak = std::max(peak, cumulative);
        // A non-positive running peak has no meaningful relative decline
        drawdowns.push_back(peak > 0.0 ? cumulative / peak - 1.0 : 0.0);
    }

    return drawdowns;
}

double PerformanceAnalyzer::calculate_max_drawdown(const std::vector<double>& equity,
                                                   double initial_capital) const {
    auto drawdowns = calculate_drawdowns(equity, initial_capital);
    if (drawdowns.empty()) {
        return 0.0;
    }
    return std::min(0.0, *std::min_element(drawdowns.begin(), drawdowns.end()));
}

double PerformanceAnalyzer::calculate_calmar_ratio(double annualized_return,
                                                   double max_drawdown) const {
    if (max_drawdown == 0.0) {
        return 0.0;
    }
    return annualized_return / std::abs(max_drawdown);
}

// ========== Trade Statistics ==========

PerformanceAnalyzer::TradeStatistics PerformanceAnalyzer::calculate_trade_statistics(
    const std::vector<Trade>& trades) const {
    TradeStatistics stats;

    double loss_sum = 0.0;
    long long holding_sum = 0;

    for (const auto& trade : trades) {
        if (!trade.is_completed()) {
            continue;
        }
        const TradeExit& exit = *trade.exit;

        stats.total_trades++;
        holding_sum += exit.holding_periods;

        if (exit.profit > 0.0) {
            stats.winning_trades++;
            stats.gross_profit += exit.profit;
        } else {
            stats.losing_trades++;
            loss_sum += exit.profit;
        }
    }

    if (stats.total_trades == 0) {
        return stats;
    }

    stats.gross_loss = std::abs(loss_sum);
    stats.win_rate = static_cast<double>(stats.winning_trades) / stats.total_trades;
    stats.avg_win = stats.winning_trades > 0 ? stats.gross_profit / stats.winning_trades : 0.0;
    stats.avg_loss = stats.losing_trades > 0 ? loss_sum / stats.losing_trades : 0.0;
    stats.profit_factor = stats.gross_loss > 0.0 ? stats.gross_profit / stats.gross_loss : 0.0;
    stats.avg_holding_period = static_cast<double>(holding_sum) / stats.total_trades;

    auto streaks = calculate_consecutive_streaks(trades);
    stats.max_consecutive_wins = streaks.first;
    stats.max_consecutive_losses = streaks.second;

    return stats;
}

std::pair<int, int> PerformanceAnalyzer::calculate_consecutive_streaks(
    const std::vector<Trade>& trades) const {
    int max_wins = 0;
    int max_losses = 0;
    int current_wins = 0;
    int current_losses = 0;

    for (const auto& trade : trades) {
        if (!trade.is_completed()) {
            continue;
        }
        if (trade.exit->profit > 0.0) {
            current_wins++;
            current_losses = 0;
            max_wins = std::max(max_wins, current_wins);
        } else {
            current_losses++;
            current_wins = 0;
            max_losses = std::max(max_losses, current_losses);
        }
    }

    return {max_wins, max_losses};
}

// ========== Helpers ==========

double PerformanceAnalyzer::calculate_mean(const std::vector<double>& values) const {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double PerformanceAnalyzer::calculate_sample_std_dev(const std::vector<double>& values,
                                                     double mean) const {
    if (values.size() < 2) {
        return 0.0;
    }
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / (values.size() - 1));
}

}  // namespace backtest
}  // namespace sigbt
