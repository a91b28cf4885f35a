#pragma once

#include "CacheStore.h"
#include "report/DateRange.h"
#include "report/SalesAggregator.h"
#include "report/SalesReport.h"
#include <boost/system/error_code.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace cache {

// Read-through cache of aggregated reports keyed by window.
//
// A hit returns the stored result verbatim with Source::cache. Anything else
// (absent key, store error, unreadable payload) is a miss: the aggregator runs,
// the result is written back with the configured TTL and returned with
// Source::database. Aggregator errors reach the caller; cache errors never do.
//
// Concurrent misses on one window each query the aggregator and each write the
// entry; the last write wins.
class WindowCache : public std::enable_shared_from_this<WindowCache> {
public:
    using ResolveCb = std::function<void(const boost::system::error_code&, report::ResolvedReport)>;
    using Now = std::function<std::chrono::system_clock::time_point()>;

    WindowCache(std::shared_ptr<CacheStore> store,
                std::shared_ptr<report::SalesAggregator> aggregator,
                std::string prefix,
                int ttl_sec,
                int utc_offset_min,
                Now now = []{ return std::chrono::system_clock::now(); });

    std::string key_for(const report::TimestampWindow& window) const;
    const std::string& prefix() const { return prefix_; }
    int ttl_sec() const { return ttl_sec_; }

    void async_resolve(const report::TimestampWindow& window, ResolveCb cb);
    // true only when a readable entry is stored; store errors count as absent
    void async_is_cached(const report::TimestampWindow& window, std::function<void(bool)> cb);
    // removes every entry under prefix(); an unreachable store reports report::errc::cache_unavailable
    void async_clear(CacheStore::CountCb cb);

private:
    void load_and_store(const report::TimestampWindow& window, const std::string& key, ResolveCb cb);

    std::shared_ptr<CacheStore> store_;
    std::shared_ptr<report::SalesAggregator> aggregator_;
    std::string prefix_;
    int ttl_sec_;
    int utc_offset_min_;
    Now now_;
};

}
