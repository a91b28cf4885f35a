
#include <iostream>
#include <string>
#include <optional>
#include "cache/CacheKeys.h"
#include "report/DateRange.h"

using namespace report;

int main() {
    const std::string prefix = "vendas_realtime";

    auto w = TimestampWindow::for_days(CivilDate{2024, 3, 1}, CivilDate{2024, 3, 31});
    auto k1 = cache::cache_key_for_window(prefix, w);
    auto k2 = cache::cache_key_for_window(prefix, w);
    if (k1 != k2) { std::cerr << "cache_key_for_window not deterministic\n"; return 1; }
    if (k1 != "vendas_realtime:2024-03-01 00:00:00:2024-03-31 23:59:59") { std::cerr << "unexpected key layout: " << k1 << "\n"; return 1; }

    
    ResolvedRange single, range;
    if (resolve_date_range(std::string("2024-03-15"), std::nullopt, std::nullopt, CivilDate{2024, 1, 1}, single)) { std::cerr << "resolve single failed\n"; return 1; }
    if (resolve_date_range(std::nullopt, std::string("2024-03-15"), std::string("2024-03-15"), CivilDate{2024, 1, 1}, range)) { std::cerr << "resolve range failed\n"; return 1; }
    if (cache::cache_key_for_window(prefix, single.window) != cache::cache_key_for_window(prefix, range.window)) {
        std::cerr << "single day and D..D range must share a key\n"; return 1;
    }

    
    ResolvedRange today;
    if (resolve_date_range(std::nullopt, std::nullopt, std::nullopt, CivilDate{2024, 3, 15}, today)) { std::cerr << "resolve today failed\n"; return 1; }
    if (cache::cache_key_for_window(prefix, today.window) != cache::cache_key_for_window(prefix, single.window)) {
        std::cerr << "today and explicit date must share a key\n"; return 1;
    }

    
    auto shifted = w;
    shifted.end.microsecond = 0;
    if (cache::cache_key_for_window(prefix, shifted) != k1) { std::cerr << "sub-second difference changed the key\n"; return 1; }
    shifted.end.second = 58;
    if (cache::cache_key_for_window(prefix, shifted) == k1) { std::cerr << "different second produced the same key\n"; return 1; }

    
    auto other = cache::cache_key_for_window(prefix, TimestampWindow::for_day(CivilDate{2024, 3, 2}));
    if (other == k1) { std::cerr << "different windows collided\n"; return 1; }

    
    auto ns = cache::cache_key_namespace(prefix, "pacotes");
    if (ns != "vendas_realtime:pacotes") { std::cerr << "namespace layout wrong: " << ns << "\n"; return 1; }
    auto pk = cache::cache_key_for_window(ns, w);
    if (pk == k1 || pk.rfind(prefix + ":", 0) != 0) { std::cerr << "package key must differ and stay under the main prefix\n"; return 1; }

    std::cout << "cache_keys_unit ok\n";
    return 0;
}
