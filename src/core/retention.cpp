#include "retention.hpp"
#include <fmt/format.h>

CalendarDate local_date(std::time_t t) {
    struct tm tm_buf = {};
    localtime_r(&t, &tm_buf);
    return CalendarDate{tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday};
}

int weekday_index(const CalendarDate& date) {
    // Sakamoto's method yields Sunday = 0; shift so Monday = 0.
    static const int offsets[] = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
    int y = date.year;
    if (date.month < 3) y -= 1;
    int sunday_based = (y + y / 4 - y / 100 + y / 400 + offsets[date.month - 1] + date.day) % 7;
    return (sunday_based + 6) % 7;
}

std::string retention_suffix(const CalendarDate& date) {
    if (date.day == 1 && date.month == 1) {
        return fmt::format("yearly_{}", date.year);
    }
    if (date.day == 1) {
        return fmt::format("monthly_{:02d}", date.month);
    }
    return fmt::format("daily_{}", weekday_index(date));
}
