#include "WindowCache.h"
#include "CacheKeys.h"
#include "observability/Logging.h"
#include "observability/Metrics.h"
#include "report/Errors.h"
#include <boost/asio/error.hpp>
#include <stdexcept>

namespace cache {

using observability::log_debug;
using observability::log_error;
using observability::log_info;
using observability::log_warn;

namespace {

// the store could not be reached at all, as opposed to a command it rejected
bool is_connection_failure(const boost::system::error_code& ec) {
    namespace ae = boost::asio::error;
    return ec == ae::not_connected || ec == ae::connection_refused || ec == ae::connection_reset ||
           ec == ae::connection_aborted || ec == ae::broken_pipe || ec == ae::host_unreachable ||
           ec == ae::network_unreachable || ec == ae::timed_out || ec == ae::eof ||
           ec == ae::access_denied || ec == ae::host_not_found || ec == report::errc::cache_unavailable;
}

}

WindowCache::WindowCache(std::shared_ptr<CacheStore> store,
                         std::shared_ptr<report::SalesAggregator> aggregator,
                         std::string prefix,
                         int ttl_sec,
                         int utc_offset_min,
                         Now now)
    : store_(std::move(store)), aggregator_(std::move(aggregator)), prefix_(std::move(prefix)),
      ttl_sec_(ttl_sec), utc_offset_min_(utc_offset_min), now_(std::move(now)) {
    if (!store_ || !aggregator_) throw std::invalid_argument("WindowCache requires a store and an aggregator");
    if (ttl_sec_ <= 0) throw std::invalid_argument("WindowCache ttl must be positive");
}

std::string WindowCache::key_for(const report::TimestampWindow& window) const {
    return cache_key_for_window(prefix_, window);
}

void WindowCache::async_resolve(const report::TimestampWindow& window, ResolveCb cb) {
    auto self = shared_from_this();
    std::string key = key_for(window);
    store_->async_get(key, [self, window, key, cb](const boost::system::error_code& ec, std::optional<std::string> val) {
        auto& metrics = observability::Metrics::instance();
        if (ec) {
            metrics.inc_cache_lookup("error");
            log_warn("window_cache.get_failed", {{"key", key}, {"err", ec.message()}});
        } else if (val.has_value()) {
            auto stored = report::deserialize_cached_result(*val);
            if (stored.has_value()) {
                metrics.inc_cache_lookup("hit");
                log_debug("window_cache.hit", {{"key", key}});
                cb({}, report::ResolvedReport{std::move(*stored), report::Source::cache});
                return;
            }
            metrics.inc_cache_lookup("error");
            log_warn("window_cache.unreadable_entry", {{"key", key}, {"bytes", int64_t(val->size())}});
        } else {
            metrics.inc_cache_lookup("miss");
            log_debug("window_cache.miss", {{"key", key}});
        }
        self->load_and_store(window, key, cb);
    });
}

void WindowCache::load_and_store(const report::TimestampWindow& window, const std::string& key, ResolveCb cb) {
    auto self = shared_from_this();
    aggregator_->async_query(window, [self, window, key, cb](const boost::system::error_code& ec, std::vector<report::SalesAggregate> rows) {
        if (ec) {
            log_error("window_cache.aggregate_failed", {{"key", key}, {"err", ec.message()}});
            cb(ec, report::ResolvedReport{});
            return;
        }
        auto result = report::make_cached_result(window, report::iso_local_timestamp(self->now_(), self->utc_offset_min_), std::move(rows));
        auto payload = report::serialize_cached_result(result);
        self->store_->async_setex(key, self->ttl_sec_, payload, [key](const boost::system::error_code& ec2) {
            if (ec2) log_warn("window_cache.set_failed", {{"key", key}, {"err", ec2.message()}});
            else log_debug("window_cache.set_ok", {{"key", key}});
        });
        log_info("window_cache.loaded", {{"key", key}, {"rows", int64_t(result.vendas.size())}});
        cb({}, report::ResolvedReport{std::move(result), report::Source::database});
    });
}

void WindowCache::async_is_cached(const report::TimestampWindow& window, std::function<void(bool)> cb) {
    std::string key = key_for(window);
    store_->async_get(key, [key, cb](const boost::system::error_code& ec, std::optional<std::string> val) {
        if (ec) {
            log_warn("window_cache.probe_failed", {{"key", key}, {"err", ec.message()}});
            cb(false);
            return;
        }
        cb(val.has_value() && report::deserialize_cached_result(*val).has_value());
    });
}

void WindowCache::async_clear(CacheStore::CountCb cb) {
    std::string match = prefix_ + ":";
    store_->async_delete_matching(match, [match, cb](const boost::system::error_code& ec, int64_t removed) {
        if (ec && is_connection_failure(ec)) {
            log_warn("window_cache.clear_unreachable", {{"prefix", match}, {"err", ec.message()}});
            cb(report::errc::cache_unavailable, removed);
            return;
        }
        if (ec) log_warn("window_cache.clear_failed", {{"prefix", match}, {"err", ec.message()}, {"removed", removed}});
        else log_info("window_cache.cleared", {{"prefix", match}, {"removed", removed}});
        cb(ec, removed);
    });
}

}
