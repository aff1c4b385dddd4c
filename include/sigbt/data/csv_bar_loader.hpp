// include/sigbt/data/csv_bar_loader.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "sigbt/core/error.hpp"
#include "sigbt/core/types.hpp"

namespace sigbt {

/**
 * @brief Reads signal-annotated OHLCV bars from a CSV file
 *
 * The file is parsed with Arrow's CSV reader into a table and then converted
 * row by row. Expected header columns are a time column (timestamp, datetime
 * or date, first match wins), open, high, low, close, an optional volume and
 * the signal column. Bars are returned in file order without validation; run
 * them through BarSeriesValidator before simulating.
 */
class CsvBarLoader {
public:
    explicit CsvBarLoader(std::string signal_column = "signal")
        : signal_column_(std::move(signal_column)) {}

    /**
     * @brief Load every row of the file
     * @param path CSV file path
     * @return Bars, FILE_NOT_FOUND when the file cannot be opened, INVALID_DATA
     *         for missing columns, null cells or unparsable values
     */
    Result<std::vector<Bar>> load(const std::string& path) const;

    /**
     * @brief Convert an already parsed table
     * @param table Table with the columns described above
     * @return Bars in table order
     */
    Result<std::vector<Bar>> table_to_bars(const std::shared_ptr<arrow::Table>& table) const;

    const std::string& signal_column() const {
        return signal_column_;
    }

    static const std::vector<std::string>& time_column_candidates();

private:
    static Result<std::string> find_time_column(const std::shared_ptr<arrow::Table>& table);

    static Result<Timestamp> extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                               int64_t index);

    static Result<double> extract_double(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index);

    std::string signal_column_;
};

}  // namespace sigbt
