// include/options_ngin/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <optional>
#include <string>
#include "options_ngin/core/types.hpp"

namespace options_ngin {
namespace core {

/**
 * @brief Expiration cutoff in exchange-local time (16:00 US/Eastern)
 * Every expiration date is normalized to this time so that repeated
 * time-to-expiry computations on the same date agree.
 */
constexpr int EXPIRY_CUTOFF_HOUR_LOCAL = 16;

/**
 * @brief UTC offset of US/Eastern in hours, standard and daylight time
 */
constexpr int EASTERN_STANDARD_UTC_OFFSET = -5;
constexpr int EASTERN_DAYLIGHT_UTC_OFFSET = -4;

/**
 * @brief Seconds in the 365-day year used for year fractions
 */
constexpr double SECONDS_PER_YEAR = 365.0 * 24.0 * 3600.0;

/**
 * @brief Thread-safe wrapper for localtime
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date
 */
long long days_from_civil(int year, unsigned month, unsigned day);

/**
 * @brief Day of week for a civil date, 0 = Sunday
 */
unsigned weekday_from_days(long long days);

/**
 * @brief Build a UTC timestamp from calendar fields
 */
Timestamp make_utc_timestamp(int year, unsigned month, unsigned day, int hour = 0,
                             int minute = 0, int second = 0);

/**
 * @brief Whether US daylight saving time is in effect on a date
 *
 * Uses the US rule in force since 2007: from the second Sunday of March to
 * the first Sunday of November. The switch happens at 02:00 local, well
 * before the 16:00 cutoff, so a date-level answer is exact for expirations.
 */
bool is_us_eastern_dst(int year, unsigned month, unsigned day);

/**
 * @brief Expiration instant for a calendar date: 16:00 US/Eastern in UTC
 */
Timestamp expiry_cutoff_utc(int year, unsigned month, unsigned day);

/**
 * @brief Parse "YYYY-MM-DD" into the normalized expiration instant
 */
std::optional<Timestamp> parse_expiration_date(const std::string& text);

/**
 * @brief Parse ISO-8601 timestamps
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM[:SS[.fff]]" (also with a space
 * separator), optionally followed by "Z" or a "+HH:MM"/"-HH:MM" offset.
 * Times without an offset are taken as UTC.
 */
std::optional<Timestamp> parse_iso8601(const std::string& text);

/**
 * @brief Format a timestamp as "YYYY-MM-DDTHH:MM:SSZ"
 */
std::string format_iso8601(const Timestamp& ts);

/**
 * @brief Format the UTC calendar date of a timestamp as "YYYY-MM-DD"
 */
std::string format_date(const Timestamp& ts);

/**
 * @brief Year fraction between two instants, clamped at zero
 */
double year_fraction(const Timestamp& from, const Timestamp& to);

/**
 * @brief Get current time as a string with specified format
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

}  // namespace core
}  // namespace options_ngin
