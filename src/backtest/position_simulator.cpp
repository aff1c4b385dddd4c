// src/backtest/position_simulator.cpp
#include "sigbt/backtest/position_simulator.hpp"
#include <cmath>
#include <iomanip>
#include "sigbt/core/logger.hpp"
#include "sigbt/core/time_utils.hpp"
#include "sigbt/data/bar_series_validator.hpp"

namespace sigbt {
namespace backtest {

Result<SimulationResult> PositionSimulator::run(const std::vector<Bar>& bars,
                                                const SimulationConfig& config) const {
    Logger::register_component("PositionSimulator");

    auto config_result = config.validate();
    if (config_result.is_error()) {
        ERROR("Rejecting simulation config: " << config_result.error()->what());
        return forward_error<SimulationResult>(*config_result.error(), "PositionSimulator");
    }

    auto data_result = BarSeriesValidator::validate(bars);
    if (data_result.is_error()) {
        ERROR("Rejecting bar series: " << data_result.error()->what());
        return forward_error<SimulationResult>(*data_result.error(), "PositionSimulator");
    }

    INFO("Starting simulation over " << bars.size() << " bars, capital="
                                     << config.initial_capital
                                     << ", position_size=" << config.position_size
                                     << ", compound=" << (config.enable_compound ? "on" : "off"));

    const ExecutionCostModel costs(config);

    SimulationResult result;
    result.initial_capital = config.initial_capital;
    result.rows.reserve(bars.size());

    TradeState state;
    state.current_capital = config.initial_capital;
    state.current_equity = config.initial_capital;

    double previous_equity = config.initial_capital;

    for (size_t i = 0; i < bars.size(); ++i) {
        const Bar& bar = bars[i];

        ResultRow row;
        row.timestamp = bar.timestamp;

        if (!state.is_flat()) {
            state.holding_periods++;
        }

        ExitReason trigger = check_exit_conditions(state, bar.close, config);

        if (!state.is_flat() && (trigger != ExitReason::NONE ||
                                 bar.signal == -to_int(state.position) || bar.signal == 0)) {
            close_position(state, bar,
                           trigger != ExitReason::NONE ? trigger : ExitReason::SIGNAL, costs, row,
                           result.trades);
        }

        if (state.is_flat() && bar.signal != 0) {
            open_position(state, bar, static_cast<PositionSide>(bar.signal), config, costs, row,
                          result.trades);
        }

        double unrealized = unrealized_profit(state, bar.close);
        state.current_equity = state.current_capital + unrealized;

        row.position = to_int(state.position);
        row.shares = state.shares;
        row.holding_periods = state.holding_periods;
        row.capital = state.current_capital;
        row.equity = state.current_equity;
        row.unrealized_profit = unrealized;

        if (i > 0 && previous_equity > 0.0) {
            row.returns = state.current_equity / previous_equity - 1.0;
        }
        previous_equity = state.current_equity;

        result.rows.push_back(std::move(row));
    }

    INFO("Simulation finished: " << result.trades.size() << " trades, final capital="
                                 << std::fixed << std::setprecision(2) << state.current_capital
                                 << ", final equity=" << state.current_equity);

    return Result<SimulationResult>(std::move(result));
}

ExitReason PositionSimulator::check_exit_conditions(const TradeState& state, Price close,
                                                    const SimulationConfig& config) {
    if (state.is_flat()) {
        return ExitReason::NONE;
    }

    const bool is_long = state.position == PositionSide::LONG;

    if (config.stop_loss_pct) {
        if (is_long && close <= state.entry_price * (1.0 - *config.stop_loss_pct)) {
            return ExitReason::STOP_LOSS;
        }
        if (!is_long && close >= state.entry_price * (1.0 + *config.stop_loss_pct)) {
            return ExitReason::STOP_LOSS;
        }
    }

    if (config.take_profit_pct) {
        if (is_long && close >= state.entry_price * (1.0 + *config.take_profit_pct)) {
            return ExitReason::TAKE_PROFIT;
        }
        if (!is_long && close <= state.entry_price * (1.0 - *config.take_profit_pct)) {
            return ExitReason::TAKE_PROFIT;
        }
    }

    if (config.max_holding_periods && state.holding_periods >= *config.max_holding_periods) {
        return ExitReason::MAX_HOLDING_PERIOD;
    }

    return ExitReason::NONE;
}

double PositionSimulator::unrealized_profit(const TradeState& state, Price close) {
    if (state.is_flat()) {
        return 0.0;
    }
    double current_value = static_cast<double>(state.shares) * close;
    return state.position == PositionSide::LONG ? current_value - state.entry_value
                                                : state.entry_value - current_value;
}

void PositionSimulator::close_position(TradeState& state, const Bar& bar, ExitReason reason,
                                       const ExecutionCostModel& costs, ResultRow& row,
                                       std::vector<Trade>& trades) const {
    const Price exit_price = costs.exit_fill_price(bar.close, state.position);
    const double exit_value = static_cast<double>(state.shares) * exit_price;
    const double commission = costs.commission(exit_value);

    double profit = 0.0;
    if (state.position == PositionSide::LONG) {
        // Selling the long credits the proceeds
        state.current_capital += exit_value - commission;
        profit = exit_value - state.entry_value - commission;
    } else {
        // Buying back the short debits the cost
        state.current_capital -= exit_value + commission;
        profit = state.entry_value - exit_value - commission;
    }

    row.exit_price = exit_price;
    row.exit_date = bar.timestamp;
    row.exit_reason = reason;
    row.trade_profit = profit;
    row.commission += commission;

    if (!trades.empty() && trades.back().is_open()) {
        TradeExit exit;
        exit.exit_date = bar.timestamp;
        exit.exit_price = exit_price;
        exit.reason = reason;
        exit.profit = profit;
        exit.return_pct = state.entry_value > 0.0 ? profit / state.entry_value : 0.0;
        exit.holding_periods = state.holding_periods;
        exit.commission = commission;
        trades.back().exit = exit;
    }

    DEBUG("Close " << position_side_to_string(state.position) << " at "
                   << core::format_timestamp(bar.timestamp) << ": price=" << exit_price
                   << ", shares=" << state.shares << ", profit=" << profit
                   << ", reason=" << exit_reason_to_string(reason));

    state.reset_position();
}

void PositionSimulator::open_position(TradeState& state, const Bar& bar, PositionSide side,
                                      const SimulationConfig& config,
                                      const ExecutionCostModel& costs, ResultRow& row,
                                      std::vector<Trade>& trades) const {
    const Price entry_price = costs.entry_fill_price(bar.close, side);

    const double sizing_capital =
        config.enable_compound ? state.current_capital : config.initial_capital;
    const double target_value = sizing_capital * config.position_size;

    // No fractional shares; a degenerate fill price or exhausted capital buys nothing
    long long shares = 0;
    if (entry_price > 0.0 && target_value > 0.0) {
        shares = static_cast<long long>(std::floor(target_value / entry_price));
    }
    const double entry_value = static_cast<double>(shares) * entry_price;
    const double commission = costs.commission(entry_value);

    if (side == PositionSide::LONG) {
        state.current_capital -= entry_value + commission;
    } else {
        // Short sale proceeds are credited to cash
        state.current_capital += entry_value - commission;
    }

    state.position = side;
    state.entry_price = entry_price;
    state.entry_date = bar.timestamp;
    state.holding_periods = 0;
    state.shares = shares;
    state.entry_value = entry_value;

    row.entry_price = entry_price;
    row.entry_date = bar.timestamp;
    row.trade_value = entry_value;
    row.commission += commission;

    Trade trade;
    trade.entry.entry_date = bar.timestamp;
    trade.entry.entry_price = entry_price;
    trade.entry.direction = side;
    trade.entry.shares = shares;
    trade.entry.trade_value = entry_value;
    trade.entry.commission = commission;
    trades.push_back(trade);

    DEBUG("Open " << position_side_to_string(side) << " at "
                  << core::format_timestamp(bar.timestamp) << ": price=" << entry_price
                  << ", shares=" << shares << ", commission=" << commission);
}

}  // namespace backtest
}  // namespace sigbt
