#include <gtest/gtest.h>
#include <cmath>
#include "backtest/test_utils.hpp"
#include "core/test_base.hpp"
#include "sigbt/backtest/position_simulator.hpp"

using namespace sigbt;
using namespace sigbt::backtest;
using namespace sigbt::testing;

class PositionSimulatorTest : public TestBase {
protected:
    SimulationResult run_ok(const std::vector<Bar>& bars, const SimulationConfig& config) {
        auto result = simulator.run(bars, config);
        EXPECT_TRUE(result.is_ok()) << (result.is_error() ? result.error()->what() : "");
        return result.is_ok() ? result.take_value() : SimulationResult{};
    }

    PositionSimulator simulator;
};

TEST_F(PositionSimulatorTest, LongRoundTripOnSignal) {
    auto bars = make_bars({100.0, 110.0}, {1, 0});
    auto result = run_ok(bars, frictionless_config());

    ASSERT_EQ(result.rows.size(), 2u);
    ASSERT_EQ(result.trades.size(), 1u);

    const Trade& trade = result.trades[0];
    EXPECT_EQ(trade.entry.direction, PositionSide::LONG);
    EXPECT_EQ(trade.entry.shares, 1000);
    EXPECT_DOUBLE_EQ(trade.entry.entry_price, 100.0);

    ASSERT_TRUE(trade.is_completed());
    EXPECT_EQ(trade.exit->reason, ExitReason::SIGNAL);
    EXPECT_DOUBLE_EQ(trade.exit->exit_price, 110.0);
    EXPECT_DOUBLE_EQ(trade.exit->profit, 10000.0);
    EXPECT_DOUBLE_EQ(trade.exit->return_pct, 0.1);
    EXPECT_EQ(trade.exit->holding_periods, 1);

    EXPECT_DOUBLE_EQ(result.rows[1].capital, 110000.0);
    EXPECT_DOUBLE_EQ(result.rows[1].equity, 110000.0);
    EXPECT_EQ(result.rows[1].position, 0);
    EXPECT_EQ(exit_reason_to_string(result.rows[1].exit_reason), "Signal");
}

TEST_F(PositionSimulatorTest, StopLossFiresAtCloseWithoutSlippage) {
    auto config = frictionless_config();
    config.stop_loss_pct = 0.05;

    auto result = run_ok(make_bars({100.0, 90.0}, {1, 0}), config);

    ASSERT_EQ(result.trades.size(), 1u);
    ASSERT_TRUE(result.trades[0].is_completed());
    EXPECT_EQ(result.trades[0].exit->reason, ExitReason::STOP_LOSS);
    EXPECT_DOUBLE_EQ(result.trades[0].exit->exit_price, 90.0);
    EXPECT_DOUBLE_EQ(result.trades[0].exit->profit, -10000.0);
    EXPECT_EQ(exit_reason_to_string(result.rows[1].exit_reason), "Stop Loss");
}

TEST_F(PositionSimulatorTest, CommissionFloorApplies) {
    auto config = frictionless_config(1000.0);
    config.commission_pct = 0.001;
    config.min_commission = 50.0;

    auto result = run_ok(make_bars({100.0, 100.0}, {1, 1}), config);

    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_DOUBLE_EQ(result.trades[0].entry.trade_value, 1000.0);
    EXPECT_DOUBLE_EQ(result.trades[0].entry.commission, 50.0);
    EXPECT_DOUBLE_EQ(result.rows[0].commission, 50.0);
    EXPECT_DOUBLE_EQ(result.rows[0].capital, 1000.0 - 1000.0 - 50.0);
}

TEST_F(PositionSimulatorTest, NonCompoundSizesFromInitialCapital) {
    auto config = frictionless_config();
    config.enable_compound = false;

    // Two winning trades: 100 -> 110, then 110 -> 121
    auto result = run_ok(make_bars({100.0, 110.0, 110.0, 121.0}, {1, 0, 1, 0}), config);

    ASSERT_EQ(result.trades.size(), 2u);
    // floor(100000 / 110) = 909 shares, not floor(110000 / 110) = 1000
    EXPECT_EQ(result.trades[1].entry.shares, 909);
    EXPECT_DOUBLE_EQ(result.trades[1].entry.trade_value, 909 * 110.0);
    EXPECT_DOUBLE_EQ(result.rows[2].trade_value, 909 * 110.0);
}

TEST_F(PositionSimulatorTest, CompoundSizesFromCurrentCapital) {
    auto result = run_ok(make_bars({100.0, 110.0, 110.0, 121.0}, {1, 0, 1, 0}),
                         frictionless_config());

    ASSERT_EQ(result.trades.size(), 2u);
    EXPECT_EQ(result.trades[1].entry.shares, 1000);
}

TEST_F(PositionSimulatorTest, ShortStopLossOnRise) {
    auto config = frictionless_config();
    config.stop_loss_pct = 0.05;

    auto result = run_ok(make_bars({100.0, 106.0}, {-1, -1}), config);

    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(result.trades[0].entry.direction, PositionSide::SHORT);
    ASSERT_TRUE(result.trades[0].is_completed());
    EXPECT_EQ(result.trades[0].exit->reason, ExitReason::STOP_LOSS);
    EXPECT_DOUBLE_EQ(result.trades[0].exit->exit_price, 106.0);
    EXPECT_DOUBLE_EQ(result.trades[0].exit->profit, -6000.0);
    EXPECT_EQ(result.rows[1].position, 0);
}

TEST_F(PositionSimulatorTest, ShortTakeProfitOnlyOnDecline) {
    auto config = frictionless_config();
    config.take_profit_pct = 0.05;

    // A rise is the wrong direction for a short take-profit
    auto rising = run_ok(make_bars({100.0, 106.0, 106.0}, {-1, -1, -1}), config);
    ASSERT_EQ(rising.trades.size(), 1u);
    EXPECT_TRUE(rising.trades[0].is_open());
    EXPECT_EQ(rising.rows[2].position, -1);

    auto falling = run_ok(make_bars({100.0, 94.0}, {-1, -1}), config);
    ASSERT_EQ(falling.trades.size(), 1u);
    ASSERT_TRUE(falling.trades[0].is_completed());
    EXPECT_EQ(falling.trades[0].exit->reason, ExitReason::TAKE_PROFIT);
    EXPECT_DOUBLE_EQ(falling.trades[0].exit->profit, 1000 * 100.0 - 1000 * 94.0);
}

TEST_F(PositionSimulatorTest, ShortCashFlowsAndMarking) {
    auto result = run_ok(make_bars({100.0, 90.0, 80.0}, {-1, -1, 0}), frictionless_config());

    // Short sale proceeds are credited
    EXPECT_DOUBLE_EQ(result.rows[0].capital, 200000.0);
    EXPECT_DOUBLE_EQ(result.rows[0].equity, 200000.0);
    EXPECT_DOUBLE_EQ(result.rows[1].unrealized_profit, 10000.0);
    EXPECT_DOUBLE_EQ(result.rows[1].equity, 210000.0);

    // Covering debits the buy-back cost
    EXPECT_DOUBLE_EQ(result.rows[2].capital, 120000.0);
    EXPECT_DOUBLE_EQ(result.rows[2].trade_profit, 20000.0);
}

TEST_F(PositionSimulatorTest, StopLossTakesPrecedenceOverOtherTriggers) {
    auto config = frictionless_config();
    config.stop_loss_pct = 0.05;
    config.max_holding_periods = 1;

    // Bar 1 breaches the stop and reaches the holding limit at once
    auto result = run_ok(make_bars({100.0, 90.0}, {1, 1}), config);
    ASSERT_TRUE(result.trades[0].is_completed());
    EXPECT_EQ(result.trades[0].exit->reason, ExitReason::STOP_LOSS);

    TradeState state;
    state.position = PositionSide::LONG;
    state.entry_price = 100.0;
    SimulationConfig both = frictionless_config();
    both.stop_loss_pct = 0.05;
    both.take_profit_pct = -0.5;  // Unvalidated, so the take-profit level 50 is also reached
    EXPECT_EQ(PositionSimulator::check_exit_conditions(state, 90.0, both), ExitReason::STOP_LOSS);

    both.stop_loss_pct.reset();
    EXPECT_EQ(PositionSimulator::check_exit_conditions(state, 90.0, both),
              ExitReason::TAKE_PROFIT);
}

TEST_F(PositionSimulatorTest, MaxHoldingPeriodCloses) {
    auto config = frictionless_config();
    config.max_holding_periods = 2;

    auto result = run_ok(make_bars({100.0, 101.0, 102.0, 103.0}, {1, 1, 1, 1}), config);

    ASSERT_GE(result.trades.size(), 1u);
    ASSERT_TRUE(result.trades[0].is_completed());
    EXPECT_EQ(result.trades[0].exit->reason, ExitReason::MAX_HOLDING_PERIOD);
    EXPECT_EQ(result.trades[0].exit->holding_periods, 2);

    // Signal is still long, so a new trade opens on the same bar
    ASSERT_EQ(result.trades.size(), 2u);
    EXPECT_EQ(result.trades[1].entry.entry_date, day(2));
    EXPECT_EQ(result.rows[2].position, 1);
    EXPECT_EQ(result.rows[2].holding_periods, 0);
}

TEST_F(PositionSimulatorTest, ReversalClosesAndReopensOnSameBar) {
    auto config = frictionless_config();
    config.commission_pct = 0.0;
    config.min_commission = 10.0;

    auto result = run_ok(make_bars({100.0, 110.0, 100.0}, {1, -1, 0}), config);

    ASSERT_EQ(result.trades.size(), 2u);
    EXPECT_EQ(result.trades[0].entry.direction, PositionSide::LONG);
    ASSERT_TRUE(result.trades[0].is_completed());
    EXPECT_EQ(result.trades[0].exit->exit_date, day(1));
    EXPECT_EQ(result.trades[1].entry.direction, PositionSide::SHORT);
    EXPECT_EQ(result.trades[1].entry.entry_date, day(1));

    const ResultRow& row = result.rows[1];
    EXPECT_EQ(row.position, -1);
    EXPECT_DOUBLE_EQ(row.exit_price, 110.0);
    EXPECT_DOUBLE_EQ(row.entry_price, 110.0);
    // Exit and entry commission on the same bar
    EXPECT_DOUBLE_EQ(row.commission, 20.0);
}

TEST_F(PositionSimulatorTest, NeutralSignalClosesPosition) {
    auto result = run_ok(make_bars({100.0, 100.0, 100.0}, {1, 0, 0}), frictionless_config());
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_TRUE(result.trades[0].is_completed());
    EXPECT_EQ(result.rows[1].position, 0);
    EXPECT_EQ(result.rows[2].exit_reason, ExitReason::NONE);
}

TEST_F(PositionSimulatorTest, SlippageMovesFillsAgainstHolder) {
    auto config = frictionless_config();
    config.slippage_pct = 0.01;

    auto result = run_ok(make_bars({100.0, 100.0}, {1, 0}), config);

    const Trade& trade = result.trades[0];
    EXPECT_DOUBLE_EQ(trade.entry.entry_price, 101.0);
    EXPECT_EQ(trade.entry.shares, static_cast<long long>(std::floor(100000.0 / 101.0)));
    EXPECT_DOUBLE_EQ(trade.exit->exit_price, 99.0);
    EXPECT_LT(trade.exit->profit, 0.0);
}

TEST_F(PositionSimulatorTest, CapitalChangesOnlyOnFills) {
    auto config = frictionless_config();
    config.commission_pct = 0.001;
    config.min_commission = 1.0;
    config.slippage_pct = 0.002;

    auto bars = make_bars({100.0, 103.0, 99.0, 97.0, 101.0, 104.0, 104.0},
                          {1, 1, -1, -1, 0, 1, 0});
    auto result = run_ok(bars, config);

    for (size_t i = 1; i < result.rows.size(); ++i) {
        const ResultRow& row = result.rows[i];
        bool filled = row.entry_date.has_value() || row.exit_date.has_value();
        if (!filled) {
            EXPECT_DOUBLE_EQ(row.capital, result.rows[i - 1].capital) << "bar " << i;
        }
        EXPECT_NEAR(row.equity, row.capital + row.unrealized_profit, 1e-9);
        EXPECT_GE(row.shares, 0);
        if (row.position == 0) {
            EXPECT_DOUBLE_EQ(row.unrealized_profit, 0.0);
        }
    }
}

TEST_F(PositionSimulatorTest, FirstReturnIsZeroAndReturnsFollowEquity) {
    auto result = run_ok(make_bars({100.0, 100.0, 110.0, 110.0}, {0, 0, 0, 0}),
                         frictionless_config());
    for (const auto& row : result.rows) {
        EXPECT_DOUBLE_EQ(row.returns, 0.0);
        EXPECT_DOUBLE_EQ(row.equity, 100000.0);
    }
    EXPECT_TRUE(result.trades.empty());
}

TEST_F(PositionSimulatorTest, ReturnsAreFiniteWhenEquityDropsToZero) {
    // A full long entry leaves cash at zero, so equity is zero on the entry bar
    auto result = run_ok(make_bars({100.0, 100.0, 120.0}, {1, 1, 1}), frictionless_config());
    EXPECT_DOUBLE_EQ(result.rows[0].equity, 0.0);
    EXPECT_DOUBLE_EQ(result.rows[1].returns, 0.0);
    for (const auto& row : result.rows) {
        EXPECT_TRUE(std::isfinite(row.returns));
    }
}

TEST_F(PositionSimulatorTest, RunIsDeterministic) {
    auto config = frictionless_config();
    config.commission_pct = 0.001;
    config.slippage_pct = 0.001;
    config.stop_loss_pct = 0.03;
    auto bars = make_bars({100.0, 97.0, 95.0, 99.0, 104.0, 101.0}, {1, 1, -1, 1, 1, 0});

    auto first = run_ok(bars, config);
    auto second = run_ok(bars, config);

    ASSERT_EQ(first.rows.size(), second.rows.size());
    for (size_t i = 0; i < first.rows.size(); ++i) {
        const ResultRow& a = first.rows[i];
        const ResultRow& b = second.rows[i];
        EXPECT_EQ(a.position, b.position) << "row " << i;
        EXPECT_EQ(a.shares, b.shares) << "row " << i;
        EXPECT_EQ(a.capital, b.capital) << "row " << i;
        EXPECT_EQ(a.equity, b.equity) << "row " << i;
        EXPECT_EQ(a.returns, b.returns) << "row " << i;
        EXPECT_EQ(a.entry_price, b.entry_price) << "row " << i;
        EXPECT_TRUE(a.entry_date == b.entry_date) << "row " << i;
        EXPECT_EQ(a.exit_price, b.exit_price) << "row " << i;
        EXPECT_TRUE(a.exit_date == b.exit_date) << "row " << i;
        EXPECT_EQ(a.exit_reason, b.exit_reason) << "row " << i;
        EXPECT_EQ(a.trade_profit, b.trade_profit) << "row " << i;
        EXPECT_EQ(a.commission, b.commission) << "row " << i;
    }

    ASSERT_EQ(first.trades.size(), second.trades.size());
    for (size_t i = 0; i < first.trades.size(); ++i) {
        const Trade& a = first.trades[i];
        const Trade& b = second.trades[i];
        EXPECT_TRUE(a.entry.entry_date == b.entry.entry_date) << "trade " << i;
        EXPECT_EQ(a.entry.entry_price, b.entry.entry_price) << "trade " << i;
        EXPECT_EQ(a.entry.direction, b.entry.direction) << "trade " << i;
        EXPECT_EQ(a.entry.shares, b.entry.shares) << "trade " << i;
        EXPECT_EQ(a.entry.commission, b.entry.commission) << "trade " << i;
        ASSERT_EQ(a.exit.has_value(), b.exit.has_value()) << "trade " << i;
        if (a.exit) {
            EXPECT_TRUE(a.exit->exit_date == b.exit->exit_date) << "trade " << i;
            EXPECT_EQ(a.exit->exit_price, b.exit->exit_price) << "trade " << i;
            EXPECT_EQ(a.exit->reason, b.exit->reason) << "trade " << i;
            EXPECT_EQ(a.exit->profit, b.exit->profit) << "trade " << i;
            EXPECT_EQ(a.exit->holding_periods, b.exit->holding_periods) << "trade " << i;
        }
    }
}

TEST_F(PositionSimulatorTest, TinyCapitalBuysNoShares) {
    auto result = run_ok(make_bars({100.0, 100.0}, {1, 0}), frictionless_config(50.0));
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(result.trades[0].entry.shares, 0);
    EXPECT_DOUBLE_EQ(result.trades[0].exit->return_pct, 0.0);
}

TEST_F(PositionSimulatorTest, RejectsInvalidConfig) {
    auto config = frictionless_config();
    config.position_size = 1.5;

    auto result = simulator.run(make_bars({100.0}, {1}), config);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_CONFIG);
}

TEST_F(PositionSimulatorTest, RejectsEmptyBars) {
    auto result = simulator.run({}, frictionless_config());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_CONFIG);
}

TEST_F(PositionSimulatorTest, RejectsBadSignal) {
    auto bars = make_bars({100.0, 101.0}, {1, 2});
    auto result = simulator.run(bars, frictionless_config());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(PositionSimulatorTest, RejectsNonIncreasingTimestamps) {
    auto bars = make_bars({100.0, 101.0}, {1, 0});
    bars[1].timestamp = bars[0].timestamp;
    auto result = simulator.run(bars, frictionless_config());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}
