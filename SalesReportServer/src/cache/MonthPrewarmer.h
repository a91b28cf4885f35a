#pragma once

#include "TaskDispatcher.h"
#include "WindowCache.h"
#include "report/DateRange.h"
#include <memory>

namespace cache {

// After a single-day query, fills the cache entry for the whole calendar month
// containing that day unless it is already present. Fire-and-forget: trigger()
// only dispatches, and failures are logged and dropped.
//
// Two requests for days of the same month that race each other will both build
// the month entry.
class MonthPrewarmer {
public:
    MonthPrewarmer(std::shared_ptr<WindowCache> cache, std::shared_ptr<TaskDispatcher> dispatcher);

    void trigger(const report::CivilDate& reference_date);

private:
    static void run(std::shared_ptr<WindowCache> cache, report::TimestampWindow window);

    std::shared_ptr<WindowCache> cache_;
    std::shared_ptr<TaskDispatcher> dispatcher_;
};

}
