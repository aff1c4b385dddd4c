// include/sigbt/backtest/position_simulator.hpp
#pragma once

#include <optional>
#include <vector>
#include "sigbt/backtest/execution_cost_model.hpp"
#include "sigbt/backtest/simulation_config.hpp"
#include "sigbt/backtest/trade_record.hpp"
#include "sigbt/core/error.hpp"
#include "sigbt/core/types.hpp"

namespace sigbt {
namespace backtest {

/**
 * @brief Mutable position and cash state of a single run
 *
 * Created flat at run start, mutated once per bar, discarded at run end.
 */
struct TradeState {
    PositionSide position{PositionSide::FLAT};
    Price entry_price{0.0};
    std::optional<Timestamp> entry_date;
    int holding_periods{0};  // Bars elapsed since entry
    long long shares{0};
    double entry_value{0.0};  // Capital committed at entry, post-slippage
    double current_capital{0.0};
    double current_equity{0.0};

    bool is_flat() const {
        return position == PositionSide::FLAT;
    }

    void reset_position() {
        position = PositionSide::FLAT;
        entry_price = 0.0;
        entry_date.reset();
        holding_periods = 0;
        shares = 0;
        entry_value = 0.0;
    }
};

/**
 * @brief Bar-by-bar replay of a signal against a single instrument
 *
 * Each bar runs, in order:
 *   1. advance the holding counter of an open position
 *   2. evaluate exit triggers (stop loss, take profit, max holding; first match wins)
 *   3. close on a trigger, an opposite signal or a flat signal
 *   4. open when flat and the signal is non-zero (covers same-bar re-entry)
 *   5. mark the position to the bar close
 *   6. compute the bar return from the equity change
 *
 * The loop is inherently sequential. The simulator itself holds no state
 * between runs, so independent runs may execute concurrently on one instance.
 */
class PositionSimulator {
public:
    PositionSimulator() = default;
    ~PositionSimulator() = default;

    /**
     * @brief Replay the bars under the given configuration
     * @param bars Time-ascending bars carrying the signal
     * @param config Simulation parameters
     * @return One row per bar plus the trade list, or INVALID_CONFIG / INVALID_DATA
     *         before any bar is processed
     */
    Result<SimulationResult> run(const std::vector<Bar>& bars,
                                 const SimulationConfig& config) const;

    /**
     * @brief First exit trigger satisfied at the given close, if any
     * @return ExitReason::NONE when flat or when no configured threshold fires
     */
    static ExitReason check_exit_conditions(const TradeState& state, Price close,
                                            const SimulationConfig& config);

    /**
     * @brief Profit of the open position valued at the given close; 0 when flat
     */
    static double unrealized_profit(const TradeState& state, Price close);

private:
    void close_position(TradeState& state, const Bar& bar, ExitReason reason,
                        const ExecutionCostModel& costs, ResultRow& row,
                        std::vector<Trade>& trades) const;

    void open_position(TradeState& state, const Bar& bar, PositionSide side,
                       const SimulationConfig& config, const ExecutionCostModel& costs,
                       ResultRow& row, std::vector<Trade>& trades) const;
};

}  // namespace backtest
}  // namespace sigbt
