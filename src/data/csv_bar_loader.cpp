// src/data/csv_bar_loader.cpp
#include "sigbt/data/csv_bar_loader.hpp"
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <arrow/result.h>
#include <arrow/status.h>
#include <cmath>
#include <filesystem>
#include "sigbt/core/logger.hpp"
#include "sigbt/core/time_utils.hpp"

namespace sigbt {

namespace {

const char* const kComponent = "CsvBarLoader";

std::shared_ptr<arrow::Array> single_chunk(const std::shared_ptr<arrow::Table>& table,
                                           const std::string& name) {
    auto column = table->GetColumnByName(name);
    if (column == nullptr || column->num_chunks() == 0) {
        return nullptr;
    }
    return column->chunk(0);
}

}  // namespace

const std::vector<std::string>& CsvBarLoader::time_column_candidates() {
    static const std::vector<std::string> candidates = {"timestamp", "datetime", "date"};
    return candidates;
}

Result<std::vector<Bar>> CsvBarLoader::load(const std::string& path) const {
    Logger::register_component(kComponent);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        ERROR("Bar file not found: " << path);
        return make_error<std::vector<Bar>>(ErrorCode::FILE_NOT_FOUND,
                                            "Bar file not found: " + path, kComponent);
    }

    auto file_result = arrow::io::ReadableFile::Open(path);
    if (!file_result.ok()) {
        return make_error<std::vector<Bar>>(
            ErrorCode::FILE_NOT_FOUND,
            "Cannot open " + path + ": " + file_result.status().ToString(), kComponent);
    }
    std::shared_ptr<arrow::io::ReadableFile> input = *file_result;

    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();

    // Pin column types so integer-looking prices and signals still arrive as doubles
    for (const auto& name : {"open", "high", "low", "close", "volume"}) {
        convert_options.column_types[name] = arrow::float64();
    }
    convert_options.column_types[signal_column_] = arrow::float64();
    for (const auto& name : time_column_candidates()) {
        convert_options.column_types[name] = arrow::utf8();
    }

    auto reader_result = arrow::csv::TableReader::Make(arrow::io::default_io_context(), input,
                                                       read_options, parse_options,
                                                       convert_options);
    if (!reader_result.ok()) {
        return make_error<std::vector<Bar>>(
            ErrorCode::FILE_IO_ERROR,
            "Cannot create CSV reader for " + path + ": " + reader_result.status().ToString(),
            kComponent);
    }

    auto table_result = (*reader_result)->Read();
    if (!table_result.ok()) {
        return make_error<std::vector<Bar>>(
            ErrorCode::INVALID_DATA,
            "Failed to parse " + path + ": " + table_result.status().ToString(), kComponent);
    }

    auto combined = (*table_result)->CombineChunks(arrow::default_memory_pool());
    if (!combined.ok()) {
        return make_error<std::vector<Bar>>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to combine chunks of " + path + ": " + combined.status().ToString(),
            kComponent);
    }

    auto bars = table_to_bars(*combined);
    if (bars.is_error()) {
        ERROR("Failed to convert " << path << ": " << bars.error()->what());
        return bars;
    }

    INFO("Loaded " << bars.value().size() << " bars from " << path);
    return bars;
}

Result<std::vector<Bar>> CsvBarLoader::table_to_bars(
    const std::shared_ptr<arrow::Table>& table) const {
    if (!table) {
        return make_error<std::vector<Bar>>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                            kComponent);
    }

    auto time_column = find_time_column(table);
    if (time_column.is_error()) {
        return forward_error<std::vector<Bar>>(*time_column.error(), kComponent);
    }

    std::vector<std::string> required_columns = {"open", "high", "low", "close", signal_column_};
    for (const auto& col : required_columns) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<std::vector<Bar>>(ErrorCode::INVALID_DATA,
                                                "Missing required column: " + col, kComponent);
        }
    }

    std::vector<Bar> bars;
    if (table->num_rows() == 0) {
        return Result<std::vector<Bar>>(std::move(bars));
    }
    bars.reserve(static_cast<size_t>(table->num_rows()));

    auto time_array = single_chunk(table, time_column.value());
    auto open_array = single_chunk(table, "open");
    auto high_array = single_chunk(table, "high");
    auto low_array = single_chunk(table, "low");
    auto close_array = single_chunk(table, "close");
    auto signal_array = single_chunk(table, signal_column_);
    auto volume_array = single_chunk(table, "volume");  // Optional

    if (time_array->type_id() != arrow::Type::STRING) {
        return make_error<std::vector<Bar>>(ErrorCode::CONVERSION_ERROR,
                                            "Time column must be text, got " +
                                                time_array->type()->ToString(),
                                            kComponent);
    }
    for (const auto& array : {open_array, high_array, low_array, close_array, signal_array}) {
        if (array->type_id() != arrow::Type::DOUBLE) {
            return make_error<std::vector<Bar>>(ErrorCode::CONVERSION_ERROR,
                                                "Numeric column has type " +
                                                    array->type()->ToString(),
                                                kComponent);
        }
    }
    if (volume_array && volume_array->type_id() != arrow::Type::DOUBLE) {
        return make_error<std::vector<Bar>>(ErrorCode::CONVERSION_ERROR,
                                            "Volume column has type " +
                                                volume_array->type()->ToString(),
                                            kComponent);
    }

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        auto ts_result = extract_timestamp(time_array, i);
        if (ts_result.is_error()) {
            return forward_error<std::vector<Bar>>(*ts_result.error(), kComponent);
        }

        auto open_result = extract_double(open_array, i);
        auto high_result = extract_double(high_array, i);
        auto low_result = extract_double(low_array, i);
        auto close_result = extract_double(close_array, i);
        auto signal_result = extract_double(signal_array, i);

        if (open_result.is_error() || high_result.is_error() || low_result.is_error() ||
            close_result.is_error() || signal_result.is_error()) {
            return make_error<std::vector<Bar>>(
                ErrorCode::INVALID_DATA,
                "Missing price or signal value at row " + std::to_string(i), kComponent);
        }

        double volume = 0.0;
        if (volume_array) {
            auto volume_result = extract_double(volume_array, i);
            if (volume_result.is_error()) {
                return make_error<std::vector<Bar>>(
                    ErrorCode::INVALID_DATA, "Missing volume value at row " + std::to_string(i),
                    kComponent);
            }
            volume = volume_result.value();
        }

        double raw_signal = signal_result.value();
        // Range check before the cast; out-of-range double to int is undefined
        if (!std::isfinite(raw_signal) || std::abs(raw_signal) > 1.0 ||
            raw_signal != std::round(raw_signal)) {
            return make_error<std::vector<Bar>>(
                ErrorCode::INVALID_DATA,
                "Signal " + std::to_string(raw_signal) + " at row " + std::to_string(i) +
                    " is not one of -1, 0, 1",
                kComponent);
        }

        bars.emplace_back(ts_result.value(), open_result.value(), high_result.value(),
                          low_result.value(), close_result.value(), volume,
                          static_cast<int>(raw_signal));
    }

    return Result<std::vector<Bar>>(std::move(bars));
}

Result<std::string> CsvBarLoader::find_time_column(const std::shared_ptr<arrow::Table>& table) {
    for (const auto& name : time_column_candidates()) {
        if (table->GetColumnByName(name) != nullptr) {
            return Result<std::string>(name);
        }
    }
    return make_error<std::string>(ErrorCode::INVALID_DATA,
                                   "Missing required column: timestamp, datetime or date",
                                   kComponent);
}

Result<Timestamp> CsvBarLoader::extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                                  int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                     kComponent);
    }

    auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
    if (string_array->IsNull(index)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Null timestamp value at row " + std::to_string(index),
                                     kComponent);
    }

    std::string text = string_array->GetString(index);
    auto parsed = core::parse_timestamp(text);
    if (!parsed) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Unparsable timestamp '" + text + "' at row " +
                                         std::to_string(index),
                                     kComponent);
    }
    return Result<Timestamp>(*parsed);
}

Result<double> CsvBarLoader::extract_double(const std::shared_ptr<arrow::Array>& array,
                                            int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                  kComponent);
    }

    auto double_array = std::static_pointer_cast<arrow::DoubleArray>(array);
    if (double_array->IsNull(index)) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Null double value at row " + std::to_string(index),
                                  kComponent);
    }
    return Result<double>(double_array->Value(index));
}

}  // namespace sigbt
