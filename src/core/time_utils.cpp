// src/core/time_utils.cpp
#include "options_ngin/core/time_utils.hpp"
#include <algorithm>
#include <cctype>

namespace options_ngin {
namespace core {

namespace {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static const unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool read_digits(const std::string& text, size_t pos, size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

bool parse_date_part(const std::string& text, int& year, int& month, int& day) {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return false;
    }
    if (!read_digits(text, 0, 4, year) || !read_digits(text, 5, 2, month) ||
        !read_digits(text, 8, 2, day)) {
        return false;
    }
    if (month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && static_cast<unsigned>(day) <= days_in_month(year, month);
}

// n-th Sunday (1-based) of a month as days since epoch
long long nth_sunday(int year, unsigned month, int n) {
    long long first = days_from_civil(year, month, 1);
    unsigned wd = weekday_from_days(first);
    long long first_sunday = first + static_cast<long long>((7 - wd) % 7);
    return first_sunday + 7LL * (n - 1);
}

}  // namespace

long long days_from_civil(int year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const long long era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

unsigned weekday_from_days(long long days) {
    return static_cast<unsigned>(days >= -4 ? (days + 4) % 7 : (days + 5) % 7 + 6);
}

Timestamp make_utc_timestamp(int year, unsigned month, unsigned day, int hour, int minute,
                             int second) {
    long long seconds = days_from_civil(year, month, day) * 86400LL + hour * 3600LL +
                        minute * 60LL + second;
    return Timestamp(
        std::chrono::duration_cast<Timestamp::duration>(std::chrono::seconds(seconds)));
}

bool is_us_eastern_dst(int year, unsigned month, unsigned day) {
    long long date = days_from_civil(year, month, day);
    return date >= nth_sunday(year, 3, 2) && date < nth_sunday(year, 11, 1);
}

Timestamp expiry_cutoff_utc(int year, unsigned month, unsigned day) {
    int offset = is_us_eastern_dst(year, month, day) ? EASTERN_DAYLIGHT_UTC_OFFSET
                                                     : EASTERN_STANDARD_UTC_OFFSET;
    return make_utc_timestamp(year, month, day, EXPIRY_CUTOFF_HOUR_LOCAL - offset);
}

std::optional<Timestamp> parse_expiration_date(const std::string& text) {
    int year = 0, month = 0, day = 0;
    // Tolerate a trailing time component; only the calendar date matters
    if (!parse_date_part(text, year, month, day)) {
        return std::nullopt;
    }
    return expiry_cutoff_utc(year, month, day);
}

std::optional<Timestamp> parse_iso8601(const std::string& raw) {
    std::string text = raw;
    text.erase(text.begin(), std::find_if(text.begin(), text.end(),
                                          [](unsigned char c) { return !std::isspace(c); }));
    text.erase(std::find_if(text.rbegin(), text.rend(),
                            [](unsigned char c) { return !std::isspace(c); })
                   .base(),
               text.end());

    int year = 0, month = 0, day = 0;
    if (!parse_date_part(text, year, month, day)) {
        return std::nullopt;
    }
    if (text.size() == 10) {
        return make_utc_timestamp(year, month, day);
    }

    if (text[10] != 'T' && text[10] != ' ') {
        return std::nullopt;
    }

    int hour = 0, minute = 0, second = 0;
    if (!read_digits(text, 11, 2, hour) || text.size() < 16 || text[13] != ':' ||
        !read_digits(text, 14, 2, minute)) {
        return std::nullopt;
    }
    size_t pos = 16;
    if (pos < text.size() && text[pos] == ':') {
        if (!read_digits(text, pos + 1, 2, second)) {
            return std::nullopt;
        }
        pos += 3;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                ++pos;
            }
        }
    }
    if (hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    int offset_minutes = 0;
    if (pos < text.size()) {
        char designator = text[pos];
        if (designator == 'Z' || designator == 'z') {
            ++pos;
        } else if (designator == '+' || designator == '-') {
            int off_h = 0, off_m = 0;
            if (!read_digits(text, pos + 1, 2, off_h)) {
                return std::nullopt;
            }
            size_t next = pos + 3;
            if (next < text.size() && text[next] == ':') {
                ++next;
            }
            if (!read_digits(text, next, 2, off_m)) {
                return std::nullopt;
            }
            pos = next + 2;
            offset_minutes = (off_h * 60 + off_m) * (designator == '-' ? -1 : 1);
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    return make_utc_timestamp(year, month, day, hour, minute, second) -
           std::chrono::minutes(offset_minutes);
}

std::string format_iso8601(const Timestamp& ts) {
    std::time_t time = std::chrono::system_clock::to_time_t(ts);
    std::tm tm_utc;
    if (!safe_gmtime(&time, &tm_utc)) {
        return "";
    }
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return std::string(buffer);
}

std::string format_date(const Timestamp& ts) {
    std::time_t time = std::chrono::system_clock::to_time_t(ts);
    std::tm tm_utc;
    if (!safe_gmtime(&time, &tm_utc)) {
        return "";
    }
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm_utc);
    return std::string(buffer);
}

double year_fraction(const Timestamp& from, const Timestamp& to) {
    double seconds = std::chrono::duration<double>(to - from).count();
    return std::max(0.0, seconds) / SECONDS_PER_YEAR;
}

}  // namespace core
}  // namespace options_ngin
