#pragma once

#include <boost/system/error_code.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace report {

struct CivilDate {
    int year = 1970;
    int month = 1;
    int day = 1;
};

bool operator==(const CivilDate& a, const CivilDate& b);
bool operator!=(const CivilDate& a, const CivilDate& b);
bool operator<(const CivilDate& a, const CivilDate& b);

struct LocalTimestamp {
    CivilDate date;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int microsecond = 0;
};

bool operator==(const LocalTimestamp& a, const LocalTimestamp& b);
bool operator<(const LocalTimestamp& a, const LocalTimestamp& b);

// Closed interval in business civil time, always whole days:
// start at 00:00:00.000000 of the first day, end at 23:59:59.999999 of the last.
struct TimestampWindow {
    LocalTimestamp start;
    LocalTimestamp end;

    static TimestampWindow for_days(const CivilDate& first, const CivilDate& last);
    static TimestampWindow for_day(const CivilDate& day) { return for_days(day, day); }
};

bool operator==(const TimestampWindow& a, const TimestampWindow& b);

struct ResolvedRange {
    TimestampWindow window;
    bool single_day = false;
    std::optional<CivilDate> reference_date;
};

bool is_leap_year(int year);
int days_in_month(int year, int month);

// strict YYYY-MM-DD, calendar-checked
std::optional<CivilDate> parse_civil_date(std::string_view s);

std::string format_date(const CivilDate& d);
// YYYY-MM-DD HH:MM:SS
std::string format_seconds(const LocalTimestamp& ts);
// YYYY-MM-DD HH:MM:SS.ffffff
std::string format_micros(const LocalTimestamp& ts);

TimestampWindow month_window(const CivilDate& reference);

// civil date at the given fixed offset from UTC
CivilDate civil_date_at(std::chrono::system_clock::time_point tp, int utc_offset_min);
// YYYY-MM-DDTHH:MM:SS.ffffff in civil time at the given offset
std::string iso_local_timestamp(std::chrono::system_clock::time_point tp, int utc_offset_min);

boost::system::error_code resolve_date_range(const std::optional<std::string>& data,
                                             const std::optional<std::string>& data_inicio,
                                             const std::optional<std::string>& data_fim,
                                             const CivilDate& today,
                                             ResolvedRange& out);

}
