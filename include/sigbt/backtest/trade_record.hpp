// include/sigbt/backtest/trade_record.hpp
#pragma once

#include <optional>
#include <vector>
#include "sigbt/core/types.hpp"

namespace sigbt {
namespace backtest {

/**
 * @brief Fill details recorded when a position opens
 */
struct TradeEntry {
    Timestamp entry_date;
    Price entry_price{0.0};  // Post-slippage fill
    PositionSide direction{PositionSide::FLAT};
    long long shares{0};
    double trade_value{0.0};  // shares * entry_price
    double commission{0.0};   // Charged on entry
};

/**
 * @brief Fill details recorded when a position closes
 */
struct TradeExit {
    Timestamp exit_date;
    Price exit_price{0.0};  // Post-slippage fill
    ExitReason reason{ExitReason::SIGNAL};
    double profit{0.0};      // Net of the exit commission
    double return_pct{0.0};  // profit / trade_value, 0 when trade_value is 0
    int holding_periods{0};
    double commission{0.0};  // Charged on exit
};

/**
 * @brief One round trip; open until its exit part is populated
 */
struct Trade {
    TradeEntry entry;
    std::optional<TradeExit> exit;

    bool is_open() const {
        return !exit.has_value();
    }

    bool is_completed() const {
        return exit.has_value();
    }
};

/**
 * @brief Simulator output for one input bar
 *
 * position, shares and holding_periods describe the state after the bar.
 * Entry fields are set only on the bar that opened a position, exit fields
 * only on the bar that closed one.
 */
struct ResultRow {
    Timestamp timestamp;
    int position{0};
    Price entry_price{0.0};
    std::optional<Timestamp> entry_date;
    Price exit_price{0.0};
    std::optional<Timestamp> exit_date;
    int holding_periods{0};
    ExitReason exit_reason{ExitReason::NONE};
    double capital{0.0};
    double equity{0.0};
    double returns{0.0};
    double trade_profit{0.0};
    double commission{0.0};  // Exit plus entry commission charged on this bar
    long long shares{0};
    double trade_value{0.0};
    double unrealized_profit{0.0};
};

/**
 * @brief Everything one run produces
 */
struct SimulationResult {
    double initial_capital{0.0};
    std::vector<ResultRow> rows;  // Exactly one per input bar, same order
    std::vector<Trade> trades;    // Chronological by entry

    std::vector<double> equity_curve() const {
        std::vector<double> equity;
        equity.reserve(rows.size());
        for (const auto& row : rows) {
            equity.push_back(row.equity);
        }
        return equity;
    }

    std::vector<double> returns() const {
        std::vector<double> values;
        values.reserve(rows.size());
        for (const auto& row : rows) {
            values.push_back(row.returns);
        }
        return values;
    }
};

}  // namespace backtest
}  // namespace sigbt
