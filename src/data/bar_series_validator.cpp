// src/data/bar_series_validator.cpp
#include "sigbt/data/bar_series_validator.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>
#include <string>
#include "sigbt/core/logger.hpp"
#include "sigbt/core/time_utils.hpp"

namespace sigbt {

namespace {

enum class BarDefect { NONE, NON_FINITE, NON_POSITIVE, INCONSISTENT, BAD_SIGNAL };

BarDefect classify(const Bar& bar) {
    if (!std::isfinite(bar.open) || !std::isfinite(bar.high) || !std::isfinite(bar.low) ||
        !std::isfinite(bar.close) || !std::isfinite(bar.volume)) {
        return BarDefect::NON_FINITE;
    }
    if (bar.open <= 0.0 || bar.high <= 0.0 || bar.low <= 0.0 || bar.close <= 0.0 ||
        bar.volume < 0.0) {
        return BarDefect::NON_POSITIVE;
    }
    if (bar.high < bar.low || bar.high < std::max(bar.open, bar.close) ||
        bar.low > std::min(bar.open, bar.close)) {
        return BarDefect::INCONSISTENT;
    }
    if (!BarSeriesValidator::is_valid_signal(bar.signal)) {
        return BarDefect::BAD_SIGNAL;
    }
    return BarDefect::NONE;
}

std::string describe(const Bar& bar, size_t index) {
    std::ostringstream ss;
    ss << "bar " << index << " (" << core::format_timestamp(bar.timestamp) << ", open=" << bar.open
       << ", high=" << bar.high << ", low=" << bar.low << ", close=" << bar.close
       << ", volume=" << bar.volume << ", signal=" << bar.signal << ")";
    return ss.str();
}

}  // namespace

Result<void> BarSeriesValidator::validate_bar(const Bar& bar, size_t index) {
    switch (classify(bar)) {
        case BarDefect::NONE:
            return Result<void>();
        case BarDefect::NON_FINITE:
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Non-finite value in " + describe(bar, index),
                                    "BarSeriesValidator");
        case BarDefect::NON_POSITIVE:
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Non-positive price or negative volume in " +
                                        describe(bar, index),
                                    "BarSeriesValidator");
        case BarDefect::INCONSISTENT:
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Inconsistent OHLC in " + describe(bar, index),
                                    "BarSeriesValidator");
        case BarDefect::BAD_SIGNAL:
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Signal outside {-1, 0, 1} in " + describe(bar, index),
                                    "BarSeriesValidator");
    }
    return Result<void>();
}

Result<void> BarSeriesValidator::validate(const std::vector<Bar>& bars) {
    if (bars.empty()) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "Bar series is empty",
                                "BarSeriesValidator");
    }

    for (size_t i = 0; i < bars.size(); ++i) {
        auto bar_result = validate_bar(bars[i], i);
        if (bar_result.is_error()) {
            return bar_result;
        }
        if (i > 0 && bars[i].timestamp <= bars[i - 1].timestamp) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Timestamps not strictly increasing at " +
                                        describe(bars[i], i),
                                    "BarSeriesValidator");
        }
    }

    return Result<void>();
}

CleanReport BarSeriesValidator::clean(std::vector<Bar> bars) {
    CleanReport report;
    report.bars.reserve(bars.size());

    for (auto& bar : bars) {
        switch (classify(bar)) {
            case BarDefect::NONE:
                report.bars.push_back(std::move(bar));
                break;
            case BarDefect::NON_FINITE:
                report.dropped_non_finite++;
                break;
            case BarDefect::NON_POSITIVE:
                report.dropped_non_positive++;
                break;
            case BarDefect::INCONSISTENT:
                report.dropped_inconsistent++;
                break;
            case BarDefect::BAD_SIGNAL:
                report.dropped_bad_signal++;
                break;
        }
    }

    // Stable so that the first occurrence of a duplicated timestamp survives
    std::stable_sort(report.bars.begin(), report.bars.end(),
                     [](const Bar& a, const Bar& b) { return a.timestamp < b.timestamp; });

    auto last = std::unique(report.bars.begin(), report.bars.end(),
                            [](const Bar& a, const Bar& b) { return a.timestamp == b.timestamp; });
    report.dropped_duplicate_timestamps =
        static_cast<size_t>(std::distance(last, report.bars.end()));
    report.bars.erase(last, report.bars.end());

    if (report.dropped_non_finite > 0)
        WARN("Dropped " << report.dropped_non_finite << " bars with non-finite values");
    if (report.dropped_non_positive > 0)
        WARN("Dropped " << report.dropped_non_positive
                        << " bars with non-positive prices or negative volume");
    if (report.dropped_inconsistent > 0)
        WARN("Dropped " << report.dropped_inconsistent << " bars with inconsistent OHLC");
    if (report.dropped_bad_signal > 0)
        WARN("Dropped " << report.dropped_bad_signal << " bars with a signal outside {-1, 0, 1}");
    if (report.dropped_duplicate_timestamps > 0)
        WARN("Dropped " << report.dropped_duplicate_timestamps
                        << " bars with duplicated timestamps");

    INFO("Bar cleaning kept " << report.bars.size() << " of " << bars.size() << " bars");

    return report;
}

}  // namespace sigbt
