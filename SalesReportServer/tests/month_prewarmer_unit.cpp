#include <boost/asio.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include "cache/MemoryCacheStore.h"
#include "cache/MonthPrewarmer.h"
#include "cache/TaskDispatcher.h"
#include "cache/WindowCache.h"
#include "observability/Logging.h"
#include "test_fakes.h"

using namespace report;

int main() {
    observability::set_log_level(4);
    const std::string prefix = "vendas_realtime";

    {
        auto store = std::make_shared<cache::MemoryCacheStore>();
        auto agg = std::make_shared<FakeAggregator>();
        agg->rows = {make_row("001", "Centro", 10.0, 4.0)};
        auto wc = std::make_shared<cache::WindowCache>(store, agg, prefix, 300, -180);
        auto dispatcher = std::make_shared<ManualTaskDispatcher>();
        cache::MonthPrewarmer warm(wc, dispatcher);

        warm.trigger(CivilDate{2024, 3, 15});
        if (agg->calls != 0 || dispatcher->pending() != 1) { std::cerr << "trigger must only dispatch\n"; return 1; }
        if (dispatcher->run_pending() != 1) { std::cerr << "expected one task\n"; return 1; }
        if (agg->calls != 1) { std::cerr << "month not queried\n"; return 1; }
        const auto& w = agg->windows.at(0);
        if (format_micros(w.start) != "2024-03-01 00:00:00.000000" || format_micros(w.end) != "2024-03-31 23:59:59.999999") {
            std::cerr << "month window wrong: " << format_micros(w.start) << " .. " << format_micros(w.end) << "\n"; return 1;
        }
        std::optional<std::string> got;
        store->async_get("vendas_realtime:2024-03-01 00:00:00:2024-03-31 23:59:59",
                         [&got](const boost::system::error_code&, std::optional<std::string> v) { got = std::move(v); });
        if (!got || !deserialize_cached_result(*got)) { std::cerr << "month entry not populated\n"; return 1; }

        
        warm.trigger(CivilDate{2024, 3, 2});
        dispatcher->run_pending();
        if (agg->calls != 1) { std::cerr << "cached month queried again\n"; return 1; }

        
        warm.trigger(CivilDate{2024, 2, 29});
        dispatcher->run_pending();
        if (agg->calls != 2 || format_micros(agg->windows.at(1).end) != "2024-02-29 23:59:59.999999") { std::cerr << "leap february window wrong\n"; return 1; }
    }

    
    {
        auto store = std::make_shared<cache::MemoryCacheStore>();
        auto agg = std::make_shared<FakeAggregator>();
        agg->fail = errc::store_unavailable;
        auto wc = std::make_shared<cache::WindowCache>(store, agg, prefix, 300, -180);
        auto dispatcher = std::make_shared<ManualTaskDispatcher>();
        cache::MonthPrewarmer warm(wc, dispatcher);
        warm.trigger(CivilDate{2024, 4, 1});
        dispatcher->run_pending();
        if (agg->calls != 1 || store->size() != 0) { std::cerr << "failed prewarm left state behind\n"; return 1; }
    }

    
    {
        auto failing = std::make_shared<FailingCacheStore>();
        auto agg = std::make_shared<FakeAggregator>();
        auto wc = std::make_shared<cache::WindowCache>(failing, agg, prefix, 300, -180);
        auto dispatcher = std::make_shared<ManualTaskDispatcher>();
        cache::MonthPrewarmer warm(wc, dispatcher);
        warm.trigger(CivilDate{2024, 5, 20});
        dispatcher->run_pending();
        if (agg->calls != 1 || failing->sets != 1) { std::cerr << "prewarm with failing store should still query and try to write\n"; return 1; }
    }

    
    {
        auto store = std::make_shared<cache::MemoryCacheStore>();
        auto agg = std::make_shared<FakeAggregator>();
        auto wc = std::make_shared<cache::WindowCache>(store, agg, prefix, 300, -180);
        auto dispatcher = std::make_shared<ManualTaskDispatcher>();
        cache::MonthPrewarmer warm(wc, dispatcher);
        warm.trigger(CivilDate{2024, 6, 3});
        warm.trigger(CivilDate{2024, 6, 4});
        dispatcher->run_pending();
        if (agg->calls != 1) { std::cerr << "sequential triggers should see the first entry, calls=" << agg->calls << "\n"; return 1; }
    }

    {
        auto store = std::make_shared<cache::MemoryCacheStore>();
        auto agg = std::make_shared<FakeAggregator>();
        agg->rows = {make_row("001", "Centro", 10.0, 4.0)};
        agg->hold = true;
        auto wc = std::make_shared<cache::WindowCache>(store, agg, prefix, 300, -180);
        auto dispatcher = std::make_shared<ManualTaskDispatcher>();
        cache::MonthPrewarmer warm(wc, dispatcher);
        warm.trigger(CivilDate{2024, 8, 5});
        warm.trigger(CivilDate{2024, 8, 20});
        dispatcher->run_pending();
        if (agg->calls != 2) { std::cerr << "overlapping triggers for one month should both query, calls=" << agg->calls << "\n"; return 1; }
        if (format_micros(agg->windows.at(0).start) != format_micros(agg->windows.at(1).start)) { std::cerr << "overlapping triggers built different windows\n"; return 1; }
        agg->release_all();
        if (store->size() != 1) { std::cerr << "both month writes should land on one key\n"; return 1; }
        warm.trigger(CivilDate{2024, 8, 31});
        dispatcher->run_pending();
        if (agg->calls != 2) { std::cerr << "month should be cached once the racing builds finished\n"; return 1; }
    }

    {
        boost::asio::io_context io;
        auto store = std::make_shared<cache::MemoryCacheStore>();
        auto agg = std::make_shared<FakeAggregator>();
        auto wc = std::make_shared<cache::WindowCache>(store, agg, prefix, 300, -180);
        auto warm = std::make_shared<cache::MonthPrewarmer>(wc, std::make_shared<cache::AsioTaskDispatcher>(io));
        warm->trigger(CivilDate{2024, 7, 9});
        warm.reset();
        if (agg->calls != 0) { std::cerr << "asio dispatcher ran inline\n"; return 1; }
        io.run();
        if (agg->calls != 1 || store->size() != 1) { std::cerr << "posted prewarm did not run\n"; return 1; }

        
        auto dispatcher = std::make_shared<cache::AsioTaskDispatcher>(io);
        bool after = false;
        dispatcher->dispatch([]{ throw std::runtime_error("boom"); });
        dispatcher->dispatch([&after]{ after = true; });
        io.restart();
        io.run();
        if (!after) { std::cerr << "throwing task stopped the loop\n"; return 1; }
    }

    std::cout << "month_prewarmer_unit ok\n";
    return 0;
}
