// src/backtest/results_exporter.cpp
#include "sigbt/backtest/results_exporter.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <utility>
#include "sigbt/core/logger.hpp"
#include "sigbt/core/time_utils.hpp"

namespace sigbt {
namespace backtest {

namespace {

const char* const kComponent = "ResultsExporter";

std::string optional_date(const std::optional<Timestamp>& ts) {
    return ts ? core::format_timestamp(*ts) : std::string();
}

void set_precision(std::ofstream& out) {
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
}

}  // namespace

std::vector<Trade> trade_summary(const std::vector<Trade>& trades) {
    std::vector<Trade> completed;
    for (const auto& trade : trades) {
        if (trade.is_completed()) {
            completed.push_back(trade);
        }
    }
    return completed;
}

ResultsExporter::ResultsExporter(std::string output_directory)
    : output_directory_(std::move(output_directory)) {}

std::string ResultsExporter::file_path(const std::string& prefix,
                                       const std::string& suffix) const {
    return (std::filesystem::path(output_directory_) / (prefix + "_" + suffix + ".csv")).string();
}

Result<void> ResultsExporter::ensure_directory() const {
    std::error_code ec;
    std::filesystem::create_directories(output_directory_, ec);
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Cannot create output directory " + output_directory_ + ": " +
                                    ec.message(),
                                kComponent);
    }
    return Result<void>();
}

Result<void> ResultsExporter::export_results(const std::vector<Bar>& bars,
                                             const SimulationResult& result,
                                             const std::string& prefix) const {
    Logger::register_component(kComponent);

    if (bars.size() != result.rows.size()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Bar count " + std::to_string(bars.size()) +
                                    " does not match result row count " +
                                    std::to_string(result.rows.size()),
                                kComponent);
    }

    auto dir_result = ensure_directory();
    if (dir_result.is_error()) {
        return dir_result;
    }

    const std::string path = file_path(prefix, "results");
    std::ofstream out(path);
    if (!out.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to open " + path + " for writing",
                                kComponent);
    }
    set_precision(out);

    out << "timestamp,open,high,low,close,volume,signal,position,entry_price,entry_date,"
        << "exit_price,exit_date,holding_periods,exit_reason,capital,equity,returns,"
        << "trade_profit,commission,shares,trade_value,unrealized_profit\n";

    for (size_t i = 0; i < bars.size(); ++i) {
        const Bar& bar = bars[i];
        const ResultRow& row = result.rows[i];
        out << core::format_timestamp(bar.timestamp) << ',' << bar.open << ',' << bar.high << ','
            << bar.low << ',' << bar.close << ',' << bar.volume << ',' << bar.signal << ','
            << row.position << ',' << row.entry_price << ',' << optional_date(row.entry_date)
            << ',' << row.exit_price << ',' << optional_date(row.exit_date) << ','
            << row.holding_periods << ',' << exit_reason_to_string(row.exit_reason) << ','
            << row.capital << ',' << row.equity << ',' << row.returns << ',' << row.trade_profit
            << ',' << row.commission << ',' << row.shares << ',' << row.trade_value << ','
            << row.unrealized_profit << '\n';
    }

    if (!out) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing " + path, kComponent);
    }

    INFO("Wrote " << bars.size() << " result rows to " << path);
    return Result<void>();
}

Result<void> ResultsExporter::export_trades(const std::vector<Trade>& trades,
                                            const std::string& prefix) const {
    Logger::register_component(kComponent);

    auto completed = trade_summary(trades);
    if (completed.empty()) {
        INFO("No completed trades, skipping trade export");
        return Result<void>();
    }

    auto dir_result = ensure_directory();
    if (dir_result.is_error()) {
        return dir_result;
    }

    const std::string path = file_path(prefix, "trades");
    std::ofstream out(path);
    if (!out.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to open " + path + " for writing",
                                kComponent);
    }
    set_precision(out);

    out << "entry_date,entry_price,direction,shares,trade_value,entry_commission,"
        << "exit_date,exit_price,exit_reason,profit,return_pct,holding_periods,exit_commission\n";

    for (const auto& trade : completed) {
        const TradeEntry& entry = trade.entry;
        const TradeExit& exit = *trade.exit;
        out << core::format_timestamp(entry.entry_date) << ',' << entry.entry_price << ','
            << position_side_to_string(entry.direction) << ',' << entry.shares << ','
            << entry.trade_value << ',' << entry.commission << ','
            << core::format_timestamp(exit.exit_date) << ',' << exit.exit_price << ','
            << exit_reason_to_string(exit.reason) << ',' << exit.profit << ',' << exit.return_pct
            << ',' << exit.holding_periods << ',' << exit.commission << '\n';
    }

    if (!out) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing " + path, kComponent);
    }

    INFO("Wrote " << completed.size() << " trades to " << path);
    return Result<void>();
}

Result<void> ResultsExporter::export_metrics(const Metrics& metrics,
                                             const std::string& prefix) const {
    Logger::register_component(kComponent);

    auto dir_result = ensure_directory();
    if (dir_result.is_error()) {
        return dir_result;
    }

    const std::string path = file_path(prefix, "metrics");
    std::ofstream out(path);
    if (!out.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to open " + path + " for writing",
                                kComponent);
    }
    set_precision(out);

    out << "total_return,annualized_return,annualized_volatility,sharpe_ratio,max_drawdown,"
        << "calmar_ratio,total_trades,winning_trades,losing_trades,win_rate,avg_win,avg_loss,"
        << "profit_factor,avg_holding_period,max_consecutive_wins,max_consecutive_losses\n";
    out << metrics.total_return << ',' << metrics.annualized_return << ','
        << metrics.annualized_volatility << ',' << metrics.sharpe_ratio << ','
        << metrics.max_drawdown << ',' << metrics.calmar_ratio << ',' << metrics.total_trades
        << ',' << metrics.winning_trades << ',' << metrics.losing_trades << ','
        << metrics.win_rate << ',' << metrics.avg_win << ',' << metrics.avg_loss << ','
        << metrics.profit_factor << ',' << metrics.avg_holding_period << ','
        << metrics.max_consecutive_wins << ',' << metrics.max_consecutive_losses << '\n';

    if (!out) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing " + path, kComponent);
    }

    INFO("Wrote metrics to " << path);
    return Result<void>();
}

Result<void> ResultsExporter::export_all(const std::vector<Bar>& bars,
                                         const SimulationResult& result, const Metrics& metrics,
                                         const std::string& prefix) const {
    auto results_written = export_results(bars, result, prefix);
    if (results_written.is_error()) {
        return results_written;
    }
    auto trades_written = export_trades(result.trades, prefix);
    if (trades_written.is_error()) {
        return trades_written;
    }
    return export_metrics(metrics, prefix);
}

}  // namespace backtest
}  // namespace sigbt
