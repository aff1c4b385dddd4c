// include/sigbt/data/bar_series_validator.hpp
#pragma once

#include <cstddef>
#include <vector>
#include "sigbt/core/error.hpp"
#include "sigbt/core/types.hpp"

namespace sigbt {

/**
 * @brief Outcome of sanitising a raw bar series
 */
struct CleanReport {
    std::vector<Bar> bars;  // Surviving bars, strictly time-ascending
    size_t dropped_non_finite = 0;
    size_t dropped_non_positive = 0;
    size_t dropped_inconsistent = 0;  // OHLC ordering violated
    size_t dropped_bad_signal = 0;
    size_t dropped_duplicate_timestamps = 0;

    size_t total_dropped() const {
        return dropped_non_finite + dropped_non_positive + dropped_inconsistent +
               dropped_bad_signal + dropped_duplicate_timestamps;
    }
};

/**
 * @brief Contract checks for the simulator's input bars
 *
 * validate() is the simulator-side gate: it never repairs anything and
 * reports the first violation. clean() is the provider-side sanitiser that
 * drops offending rows, sorts by time and removes duplicated timestamps.
 */
class BarSeriesValidator {
public:
    /**
     * @brief Check a whole series
     * @param bars Bars in replay order
     * @return INVALID_CONFIG for an empty series, INVALID_DATA naming the
     *         first offending bar otherwise
     */
    static Result<void> validate(const std::vector<Bar>& bars);

    /**
     * @brief Check one bar's values (not its ordering)
     * @param bar Bar to check
     * @param index Position used in the error message
     */
    static Result<void> validate_bar(const Bar& bar, size_t index);

    /**
     * @brief Drop invalid rows, sort by time and keep the first bar per timestamp
     * @param bars Raw bars, in any order
     * @return Surviving bars plus per-category drop counts
     */
    static CleanReport clean(std::vector<Bar> bars);

    static bool is_valid_signal(int signal) {
        return signal == -1 || signal == 0 || signal == 1;
    }
};

}  // namespace sigbt
