#pragma once

#include "DateRange.h"
#include "SalesReport.h"
#include <boost/system/error_code.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace db { struct DbResult; class DbPool; }

namespace report {

using AggregateCb = std::function<void(const boost::system::error_code&, std::vector<SalesAggregate>)>;

// Source of truth for aggregated sales. Fails with errc::store_unavailable or
// errc::query_failed.
class SalesAggregator {
public:
    virtual ~SalesAggregator() = default;
    virtual void async_query(const TimestampWindow& window, AggregateCb cb) = 0;
};

enum class Grouping { store, store_package };

std::string aggregation_sql(Grouping g);

// NULL numerics become 0, NULL identifiers become ""; CMV is derived here.
std::vector<SalesAggregate> map_aggregate_rows(const db::DbResult& r);

class PgSalesAggregator : public SalesAggregator {
public:
    PgSalesAggregator(std::shared_ptr<db::DbPool> db, Grouping grouping);
    void async_query(const TimestampWindow& window, AggregateCb cb) override;
private:
    std::shared_ptr<db::DbPool> db_;
    std::string sql_;
};

}
