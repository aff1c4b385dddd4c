// include/sigbt/backtest/execution_cost_model.hpp
#pragma once

#include <algorithm>
#include "sigbt/backtest/simulation_config.hpp"
#include "sigbt/core/types.hpp"

namespace sigbt {
namespace backtest {

/**
 * @brief Percentage slippage plus floored percentage commission
 *
 * Slippage always works against the party taking the fill:
 *   - opening a long buys at close * (1 + slippage)
 *   - opening a short sells at close * (1 - slippage)
 *   - closing a long sells at close * (1 - slippage)
 *   - closing a short buys at close * (1 + slippage)
 */
class ExecutionCostModel {
public:
    ExecutionCostModel(double commission_pct, double min_commission, double slippage_pct)
        : commission_pct_(commission_pct),
          min_commission_(min_commission),
          slippage_pct_(slippage_pct) {}

    explicit ExecutionCostModel(const SimulationConfig& config)
        : ExecutionCostModel(config.commission_pct, config.min_commission, config.slippage_pct) {}

    /**
     * @brief Fill price for opening a position on the given side
     */
    Price entry_fill_price(Price close, PositionSide side) const {
        return side == PositionSide::LONG ? close * (1.0 + slippage_pct_)
                                          : close * (1.0 - slippage_pct_);
    }

    /**
     * @brief Fill price for closing a position held on the given side
     */
    Price exit_fill_price(Price close, PositionSide side) const {
        return side == PositionSide::LONG ? close * (1.0 - slippage_pct_)
                                          : close * (1.0 + slippage_pct_);
    }

    /**
     * @brief Commission for one fill of the given notional
     */
    double commission(double notional) const {
        return std::max(notional * commission_pct_, min_commission_);
    }

private:
    double commission_pct_;
    double min_commission_;
    double slippage_pct_;
};

}  // namespace backtest
}  // namespace sigbt
