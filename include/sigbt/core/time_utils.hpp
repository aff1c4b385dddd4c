// include/sigbt/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include "sigbt/core/types.hpp"

namespace sigbt {
namespace core {

// Reentrant localtime/gmtime/timegm. The converters return nullptr when the
// time_t cannot be represented.
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    return localtime_s(result, time) == 0 ? result : nullptr;
#else
    return localtime_r(time, result);
#endif
}

inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

inline std::time_t safe_timegm(std::tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

/**
 * @brief Wall-clock time rendered with a strftime pattern
 * @param local Local time when true (log lines), UTC otherwise
 */
inline std::string format_now(const char* pattern, bool local = true) {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm parts{};
    std::tm* ok = local ? safe_localtime(&now, &parts) : safe_gmtime(&now, &parts);
    if (ok == nullptr) {
        return "";
    }

    char buffer[64];
    size_t written = std::strftime(buffer, sizeof(buffer), pattern, &parts);
    return std::string(buffer, written);
}

/**
 * @brief Format a bar timestamp as UTC "YYYY-MM-DD HH:MM:SS"
 * Date-only bars (midnight) are rendered as "YYYY-MM-DD".
 */
inline std::string format_timestamp(const Timestamp& ts) {
    auto time_t_value = std::chrono::system_clock::to_time_t(ts);
    std::tm tm;
    if (safe_gmtime(&time_t_value, &tm) == nullptr) {
        return "";
    }

    char buffer[32];
    if (tm.tm_hour == 0 && tm.tm_min == 0 && tm.tm_sec == 0) {
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
    } else {
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    }
    return std::string(buffer);
}

/**
 * @brief Parse "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS" as UTC
 * @return Parsed timestamp, or nullopt if the text is not in a supported format,
 *         has trailing characters, or names a calendar date that does not exist
 */
inline std::optional<Timestamp> parse_timestamp(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char sep = ' ';
    int consumed = -1;
    const int length = static_cast<int>(text.size());

    int fields = std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n", &year, &month, &day,
                             &sep, &hour, &minute, &second, &consumed);
    if (fields == 7 && consumed == length) {
        if (sep != ' ' && sep != 'T') {
            return std::nullopt;
        }
    } else {
        consumed = -1;
        hour = minute = second = 0;
        fields = std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed);
        if (fields != 3 || consumed != length) {
            return std::nullopt;
        }
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour < 0 || hour > 23 || minute < 0 ||
        minute > 59 || second < 0 || second > 59) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    std::time_t t = safe_timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    // timegm normalizes out-of-range days (Feb 31 becomes Mar 2); reject those
    std::tm check{};
    if (safe_gmtime(&t, &check) == nullptr || check.tm_year != year - 1900 ||
        check.tm_mon != month - 1 || check.tm_mday != day || check.tm_hour != hour ||
        check.tm_min != minute || check.tm_sec != second) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

}  // namespace core
}  // namespace sigbt
