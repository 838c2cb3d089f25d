#pragma once

#include <string>
#include <ctime>

struct CalendarDate {
    int year;
    int month;   // 1-12
    int day;     // 1-31
};

// Local calendar date of a point in time.
CalendarDate local_date(std::time_t t);

// Weekday index, Monday = 0 ... Sunday = 6. Proleptic Gregorian, no locale
// or time zone involved.
int weekday_index(const CalendarDate& date);

// Retention slot for a run on the given date:
//   Jan 1           -> "yearly_YYYY"
//   1st of a month  -> "monthly_MM"
//   any other day   -> "daily_N" (weekday index)
// Run once per backup run; every artifact of the run shares the result.
std::string retention_suffix(const CalendarDate& date);
