// include/sigbt/core/types.hpp

#pragma once

#include <chrono>
#include <string>

namespace sigbt {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Direction of the single simulated position
 * The underlying value doubles as the signal encoding (-1, 0, 1)
 */
enum class PositionSide : int {
    SHORT = -1,
    FLAT = 0,
    LONG = 1
};

inline int to_int(PositionSide side) {
    return static_cast<int>(side);
}

inline std::string position_side_to_string(PositionSide side) {
    switch (side) {
        case PositionSide::SHORT:
            return "SHORT";
        case PositionSide::LONG:
            return "LONG";
        default:
            return "FLAT";
    }
}

/**
 * @brief Why a position was closed
 * Triggers are listed in evaluation priority order.
 */
enum class ExitReason {
    NONE,
    STOP_LOSS,
    TAKE_PROFIT,
    MAX_HOLDING_PERIOD,
    SIGNAL
};

inline std::string exit_reason_to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::STOP_LOSS:
            return "Stop Loss";
        case ExitReason::TAKE_PROFIT:
            return "Take Profit";
        case ExitReason::MAX_HOLDING_PERIOD:
            return "Max Holding Period";
        case ExitReason::SIGNAL:
            return "Signal";
        default:
            return "";
    }
}

/**
 * @brief Market data bar with its precomputed trading signal
 * Represents OHLCV data for one period of a single instrument
 */
struct Bar {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    int signal{0};  // -1 short-entry/flip, 0 flat/close, 1 long-entry/flip

    Bar() = default;
    Bar(Timestamp ts, Price o, Price h, Price l, Price c, double v, int sig)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v), signal(sig) {}
};

}  // namespace sigbt
