#include <iostream>
#include <optional>
#include <string>
#include "report/DateRange.h"
#include "report/Errors.h"

using namespace report;

static std::optional<std::string> none() { return std::nullopt; }
static std::optional<std::string> s(const char* v) { return std::string(v); }

int main() {
    const CivilDate today{2024, 3, 15};

    {
        ResolvedRange r;
        auto ec = resolve_date_range(none(), none(), none(), today, r);
        if (ec) { std::cerr << "no params failed: " << ec.message() << "\n"; return 1; }
        if (!r.single_day || !r.reference_date || *r.reference_date != today) { std::cerr << "no params should give today as single day\n"; return 1; }
        if (format_micros(r.window.start) != "2024-03-15 00:00:00.000000") { std::cerr << "start mismatch: " << format_micros(r.window.start) << "\n"; return 1; }
        if (format_micros(r.window.end) != "2024-03-15 23:59:59.999999") { std::cerr << "end mismatch: " << format_micros(r.window.end) << "\n"; return 1; }
    }

    {
        ResolvedRange r;
        auto ec = resolve_date_range(s("2024-02-29"), none(), none(), today, r);
        if (ec) { std::cerr << "leap day rejected\n"; return 1; }
        if (!r.single_day || r.reference_date->month != 2 || r.reference_date->day != 29) { std::cerr << "data param not applied\n"; return 1; }
    }

    {
        ResolvedRange r;
        auto ec = resolve_date_range(none(), s("2024-03-01"), s("2024-03-01"), today, r);
        if (ec) { std::cerr << "same-day range rejected\n"; return 1; }
        if (r.single_day || r.reference_date.has_value()) { std::cerr << "explicit range must not be single_day\n"; return 1; }
        if (!(r.window == TimestampWindow::for_day(CivilDate{2024, 3, 1}))) { std::cerr << "same-day range window mismatch\n"; return 1; }
    }

    {
        ResolvedRange r;
        auto ec = resolve_date_range(none(), s("2024-03-10"), s("2024-03-01"), today, r);
        if (ec != errc::invalid_range) { std::cerr << "reversed range expected invalid_range got " << ec.message() << "\n"; return 1; }
    }

    {
        ResolvedRange r;
        if (resolve_date_range(none(), s("2024-03-01"), none(), today, r) != errc::incomplete_range) { std::cerr << "data_inicio alone should be incomplete\n"; return 1; }
        if (resolve_date_range(none(), none(), s("2024-03-01"), today, r) != errc::incomplete_range) { std::cerr << "data_fim alone should be incomplete\n"; return 1; }
        if (resolve_date_range(s("2024-03-05"), s("2024-03-01"), none(), today, r) != errc::incomplete_range) { std::cerr << "incomplete range with data should still fail\n"; return 1; }
    }

    {
        ResolvedRange r;
        if (resolve_date_range(s("2024-13-40"), none(), none(), today, r) != errc::invalid_date_format) { std::cerr << "2024-13-40 should be invalid format\n"; return 1; }
        if (resolve_date_range(none(), s("2024-03-01"), s("2024-3-5"), today, r) != errc::invalid_date_format) { std::cerr << "short fields should be invalid format\n"; return 1; }
        if (!is_client_error(errc::invalid_date_format) || is_client_error(errc::query_failed)) { std::cerr << "client error classification wrong\n"; return 1; }
    }

    {
        ResolvedRange r;
        auto ec = resolve_date_range(s("2024-01-01"), s("2024-03-01"), s("2024-03-31"), today, r);
        if (ec || r.single_day) { std::cerr << "range params should take precedence over data\n"; return 1; }
        if (r.window.start.date != (CivilDate{2024, 3, 1})) { std::cerr << "range precedence start mismatch\n"; return 1; }
    }

    const char* bad[] = {"", "2024-02-30", "2023-02-29", "2024-00-10", "20240315", "2024/03/15", "2024-03-15 ", "abcd-ef-gh", "2024-04-31"};
    for (auto b : bad) {
        if (parse_civil_date(b).has_value()) { std::cerr << "parse_civil_date accepted '" << b << "'\n"; return 1; }
    }
    if (!parse_civil_date("2000-02-29").has_value()) { std::cerr << "2000 is a leap year\n"; return 1; }
    if (parse_civil_date("1900-02-29").has_value()) { std::cerr << "1900 is not a leap year\n"; return 1; }

    {
        auto feb = month_window(CivilDate{2024, 2, 10});
        if (format_seconds(feb.start) != "2024-02-01 00:00:00" || format_micros(feb.end) != "2024-02-29 23:59:59.999999") { std::cerr << "leap february window wrong\n"; return 1; }
        auto dec = month_window(CivilDate{2023, 12, 31});
        if (format_seconds(dec.end) != "2023-12-31 23:59:59") { std::cerr << "december window wrong\n"; return 1; }
    }

    {
        // 2024-03-15T02:00:00Z is still the 14th at UTC-3
        std::chrono::system_clock::time_point tp{std::chrono::seconds(1710468000)};
        auto d = civil_date_at(tp, -180);
        if (d != (CivilDate{2024, 3, 14})) { std::cerr << "civil_date_at offset wrong: " << format_date(d) << "\n"; return 1; }
        auto iso = iso_local_timestamp(tp, -180);
        if (iso.rfind("2024-03-14T23:00:00", 0) != 0) { std::cerr << "iso_local_timestamp wrong: " << iso << "\n"; return 1; }
    }

    std::cout << "date_range_unit ok\n";
    return 0;
}
