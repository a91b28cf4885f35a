#include "DateRange.h"
#include "Errors.h"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <tuple>

namespace report {

bool operator==(const CivilDate& a, const CivilDate& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const CivilDate& a, const CivilDate& b) { return !(a == b); }

bool operator<(const CivilDate& a, const CivilDate& b) {
    return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
}

bool operator==(const LocalTimestamp& a, const LocalTimestamp& b) {
    return a.date == b.date && a.hour == b.hour && a.minute == b.minute && a.second == b.second && a.microsecond == b.microsecond;
}

bool operator<(const LocalTimestamp& a, const LocalTimestamp& b) {
    if (a.date != b.date) return a.date < b.date;
    return std::tie(a.hour, a.minute, a.second, a.microsecond) < std::tie(b.hour, b.minute, b.second, b.microsecond);
}

bool operator==(const TimestampWindow& a, const TimestampWindow& b) {
    return a.start == b.start && a.end == b.end;
}

TimestampWindow TimestampWindow::for_days(const CivilDate& first, const CivilDate& last) {
    TimestampWindow w;
    w.start.date = first;
    w.end.date = last;
    w.end.hour = 23; w.end.minute = 59; w.end.second = 59; w.end.microsecond = 999999;
    return w;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = {31,28,31,30,31,30,31,31,30,31,30,31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return days[month - 1];
}

std::optional<CivilDate> parse_civil_date(std::string_view s) {
    if (s.size() != 10) return std::nullopt;
    for (size_t i : {0u, 1u, 2u, 3u, 5u, 6u, 8u, 9u}) {
        if (!std::isdigit((unsigned char)s[i])) return std::nullopt;
    }
    if (s[4] != '-' || s[7] != '-') return std::nullopt;
    CivilDate d;
    d.year = (s[0]-'0')*1000 + (s[1]-'0')*100 + (s[2]-'0')*10 + (s[3]-'0');
    d.month = (s[5]-'0')*10 + (s[6]-'0');
    d.day = (s[8]-'0')*10 + (s[9]-'0');
    if (d.year < 1 || d.month < 1 || d.month > 12) return std::nullopt;
    if (d.day < 1 || d.day > days_in_month(d.year, d.month)) return std::nullopt;
    return d;
}

std::string format_date(const CivilDate& d) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
    return std::string(buf);
}

std::string format_seconds(const LocalTimestamp& ts) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
        ts.date.year, ts.date.month, ts.date.day, ts.hour, ts.minute, ts.second);
    return std::string(buf);
}

std::string format_micros(const LocalTimestamp& ts) {
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%06d",
        ts.date.year, ts.date.month, ts.date.day, ts.hour, ts.minute, ts.second, ts.microsecond);
    return std::string(buf);
}

TimestampWindow month_window(const CivilDate& reference) {
    CivilDate first{reference.year, reference.month, 1};
    CivilDate last{reference.year, reference.month, days_in_month(reference.year, reference.month)};
    return TimestampWindow::for_days(first, last);
}

static std::tm shifted_tm(std::chrono::system_clock::time_point tp, int utc_offset_min) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp) + static_cast<std::time_t>(utc_offset_min) * 60;
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

CivilDate civil_date_at(std::chrono::system_clock::time_point tp, int utc_offset_min) {
    std::tm tm = shifted_tm(tp, utc_offset_min);
    return CivilDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

std::string iso_local_timestamp(std::chrono::system_clock::time_point tp, int utc_offset_min) {
    std::tm tm = shifted_tm(tp, utc_offset_min);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count() % 1000000;
    if (us < 0) us += 1000000;
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06d",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(us));
    return std::string(buf);
}

boost::system::error_code resolve_date_range(const std::optional<std::string>& data,
                                             const std::optional<std::string>& data_inicio,
                                             const std::optional<std::string>& data_fim,
                                             const CivilDate& today,
                                             ResolvedRange& out) {
    if (data_inicio.has_value() && data_fim.has_value()) {
        auto first = parse_civil_date(*data_inicio);
        auto last = parse_civil_date(*data_fim);
        if (!first.has_value() || !last.has_value()) return errc::invalid_date_format;
        if (*last < *first) return errc::invalid_range;
        out.window = TimestampWindow::for_days(*first, *last);
        out.single_day = false;
        out.reference_date.reset();
        return {};
    }
    if (data_inicio.has_value() || data_fim.has_value()) return errc::incomplete_range;

    CivilDate day = today;
    if (data.has_value()) {
        auto parsed = parse_civil_date(*data);
        if (!parsed.has_value()) return errc::invalid_date_format;
        day = *parsed;
    }
    out.window = TimestampWindow::for_day(day);
    out.single_day = true;
    out.reference_date = day;
    return {};
}

}
