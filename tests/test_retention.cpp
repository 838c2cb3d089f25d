#include <gtest/gtest.h>
#include <core/retention.hpp>
#include <set>

TEST(Retention, YearlyOnNewYearsDay) {
    EXPECT_EQ(retention_suffix({2024, 1, 1}), "yearly_2024");
    EXPECT_EQ(retention_suffix({1999, 1, 1}), "yearly_1999");
}

TEST(Retention, MonthlyOnFirstOfMonth) {
    EXPECT_EQ(retention_suffix({2024, 3, 1}), "monthly_03");
    EXPECT_EQ(retention_suffix({2024, 12, 1}), "monthly_12");
}

TEST(Retention, DailyUsesMondayBasedWeekday) {
    EXPECT_EQ(retention_suffix({2024, 1, 15}), "daily_0");   // Monday
    EXPECT_EQ(retention_suffix({2024, 1, 21}), "daily_6");   // Sunday
    EXPECT_EQ(retention_suffix({2024, 1, 2}), "daily_1");
}

TEST(Retention, WeekdayAcrossLeapYears) {
    EXPECT_EQ(weekday_index({2024, 2, 29}), 3);   // Thursday
    EXPECT_EQ(weekday_index({2000, 2, 29}), 1);   // Tuesday, 400-year leap
    EXPECT_EQ(weekday_index({2100, 2, 28}), 6);   // Sunday, century non-leap
}

TEST(Retention, WeekdayAtYearBoundary) {
    EXPECT_EQ(weekday_index({2023, 12, 31}), 6);
    EXPECT_EQ(weekday_index({1999, 12, 31}), 4);
    EXPECT_EQ(weekday_index({2000, 1, 1}), 5);
}

TEST(Retention, FullYearOfSlots) {
    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int yearly = 0, monthly = 0, daily = 0;
    std::set<std::string> distinct;

    for (int m = 1; m <= 12; ++m) {
        for (int d = 1; d <= days_in_month[m - 1]; ++d) {
            std::string s = retention_suffix({2023, m, d});
            distinct.insert(s);
            if (s.rfind("yearly_", 0) == 0) ++yearly;
            else if (s.rfind("monthly_", 0) == 0) ++monthly;
            else if (s.rfind("daily_", 0) == 0) ++daily;
        }
    }

    EXPECT_EQ(yearly, 1);
    EXPECT_EQ(monthly, 11);
    EXPECT_EQ(daily, 353);
    // yearly + 11 monthly + 7 daily slots
    EXPECT_EQ(distinct.size(), 19u);
}

TEST(Retention, LocalDateOfTimestamp) {
    struct tm tm_buf = {};
    tm_buf.tm_year = 2024 - 1900;
    tm_buf.tm_mon = 6;
    tm_buf.tm_mday = 4;
    tm_buf.tm_hour = 12;
    tm_buf.tm_isdst = -1;
    std::time_t t = mktime(&tm_buf);

    CalendarDate date = local_date(t);
    EXPECT_EQ(date.year, 2024);
    EXPECT_EQ(date.month, 7);
    EXPECT_EQ(date.day, 4);
}
