#include <gtest/gtest.h>
#include <atomic>
#include <ctime>
#include <regex>
#include <thread>
#include <vector>
#include "options_ngin/core/time_utils.hpp"

using namespace options_ngin;
using namespace options_ngin::core;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, SafeGmtimeEpochTime) {
    std::time_t epoch = 0;
    std::tm result;

    std::tm* ret = safe_gmtime(&epoch, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret, &result);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
}

TEST_F(TimeUtilsTest, GetFormattedTimeGMT) {
    std::string time_str = get_formatted_time("%Y-%m-%d %H:%M:%S", false);

    std::regex pattern(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})");
    EXPECT_TRUE(std::regex_match(time_str, pattern));
}

TEST_F(TimeUtilsTest, SafeGmtimeThreadSafety) {
    const int num_threads = 8;
    const int iterations = 100;
    std::vector<std::thread> threads;
    std::atomic<int> success_count{0};

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&success_count, iterations]() {
            for (int j = 0; j < iterations; ++j) {
                std::time_t now = std::time(nullptr);
                std::tm result;
                if (safe_gmtime(&now, &result) != nullptr) {
                    success_count++;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(success_count.load(), num_threads * iterations);
}

TEST_F(TimeUtilsTest, CivilDayArithmetic) {
    EXPECT_EQ(days_from_civil(1970, 1, 1), 0);
    EXPECT_EQ(days_from_civil(2000, 3, 1), 11017);
    EXPECT_EQ(days_from_civil(1969, 12, 31), -1);

    EXPECT_EQ(weekday_from_days(0), 4u);  // Thursday
    EXPECT_EQ(weekday_from_days(days_from_civil(2025, 1, 17)), 5u);  // Friday
    EXPECT_EQ(weekday_from_days(-1), 3u);
}

TEST_F(TimeUtilsTest, DaylightSavingBoundaries) {
    // 2025: second Sunday of March is the 9th, first Sunday of November the 2nd
    EXPECT_FALSE(is_us_eastern_dst(2025, 3, 8));
    EXPECT_TRUE(is_us_eastern_dst(2025, 3, 9));
    EXPECT_TRUE(is_us_eastern_dst(2025, 11, 1));
    EXPECT_FALSE(is_us_eastern_dst(2025, 11, 2));
    EXPECT_FALSE(is_us_eastern_dst(2025, 1, 17));
    EXPECT_TRUE(is_us_eastern_dst(2025, 6, 20));
}

TEST_F(TimeUtilsTest, ExpirationNormalizedToFourPmEastern) {
    auto winter = parse_expiration_date("2025-01-17");
    ASSERT_TRUE(winter.has_value());
    EXPECT_EQ(*winter, make_utc_timestamp(2025, 1, 17, 21));

    auto summer = parse_expiration_date("2025-06-20");
    ASSERT_TRUE(summer.has_value());
    EXPECT_EQ(*summer, make_utc_timestamp(2025, 6, 20, 20));

    // A time component does not move the cutoff
    auto with_time = parse_expiration_date("2025-01-17T00:00:00Z");
    ASSERT_TRUE(with_time.has_value());
    EXPECT_EQ(*with_time, *winter);
}

TEST_F(TimeUtilsTest, ExpirationRejectsBadDates) {
    EXPECT_FALSE(parse_expiration_date("").has_value());
    EXPECT_FALSE(parse_expiration_date("2025-02-30").has_value());
    EXPECT_FALSE(parse_expiration_date("2025-13-01").has_value());
    EXPECT_FALSE(parse_expiration_date("17/01/2025").has_value());
    EXPECT_TRUE(parse_expiration_date("2024-02-29").has_value());
    EXPECT_FALSE(parse_expiration_date("2025-02-29").has_value());
}

TEST_F(TimeUtilsTest, ParseIso8601Variants) {
    const Timestamp expected = make_utc_timestamp(2025, 1, 10, 21, 0, 0);

    auto zulu = parse_iso8601("2025-01-10T21:00:00Z");
    ASSERT_TRUE(zulu.has_value());
    EXPECT_EQ(*zulu, expected);

    auto offset = parse_iso8601("2025-01-10T16:00:00-05:00");
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(*offset, expected);

    auto compact_offset = parse_iso8601("2025-01-10T22:00:00+0100");
    ASSERT_TRUE(compact_offset.has_value());
    EXPECT_EQ(*compact_offset, expected);

    auto space = parse_iso8601("  2025-01-10 21:00  ");
    ASSERT_TRUE(space.has_value());
    EXPECT_EQ(*space, expected);

    auto fractional = parse_iso8601("2025-01-10T21:00:00.250Z");
    ASSERT_TRUE(fractional.has_value());
    EXPECT_EQ(*fractional, expected);

    auto date_only = parse_iso8601("2025-01-10");
    ASSERT_TRUE(date_only.has_value());
    EXPECT_EQ(*date_only, make_utc_timestamp(2025, 1, 10));
}

TEST_F(TimeUtilsTest, ParseIso8601Rejects) {
    EXPECT_FALSE(parse_iso8601("2025-01-10T25:00:00Z").has_value());
    EXPECT_FALSE(parse_iso8601("2025-01-10X21:00").has_value());
    EXPECT_FALSE(parse_iso8601("2025-01-10T21:00:00 PST").has_value());
    EXPECT_FALSE(parse_iso8601("yesterday").has_value());
}

TEST_F(TimeUtilsTest, FormatTimestamps) {
    Timestamp ts = make_utc_timestamp(2025, 1, 10, 21, 5, 9);
    EXPECT_EQ(format_iso8601(ts), "2025-01-10T21:05:09Z");
    EXPECT_EQ(format_date(ts), "2025-01-10");
}

TEST_F(TimeUtilsTest, YearFractionUsesCalendarYear) {
    Timestamp quote_time = make_utc_timestamp(2025, 1, 10, 21);
    Timestamp expiry = *parse_expiration_date("2025-01-17");

    EXPECT_NEAR(year_fraction(quote_time, expiry), 7.0 / 365.0, 1e-12);
    EXPECT_DOUBLE_EQ(year_fraction(expiry, quote_time), 0.0);
    EXPECT_DOUBLE_EQ(year_fraction(quote_time, quote_time), 0.0);
}
