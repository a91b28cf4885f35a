#include "MonthPrewarmer.h"
#include "observability/Logging.h"
#include <stdexcept>

namespace cache {

MonthPrewarmer::MonthPrewarmer(std::shared_ptr<WindowCache> cache, std::shared_ptr<TaskDispatcher> dispatcher)
    : cache_(std::move(cache)), dispatcher_(std::move(dispatcher)) {
    if (!cache_ || !dispatcher_) throw std::invalid_argument("MonthPrewarmer requires a cache and a dispatcher");
}

void MonthPrewarmer::trigger(const report::CivilDate& reference_date) {
    auto window = report::month_window(reference_date);
    auto cache = cache_;
    dispatcher_->dispatch([cache, window]{ run(cache, window); });
}

void MonthPrewarmer::run(std::shared_ptr<WindowCache> cache, report::TimestampWindow window) {
    std::string key = cache->key_for(window);
    cache->async_is_cached(window, [cache, window, key](bool cached) {
        if (cached) {
            observability::log_debug("prewarm.already_cached", {{"key", key}});
            return;
        }
        cache->async_resolve(window, [key](const boost::system::error_code& ec, report::ResolvedReport r) {
            if (ec) {
                observability::log_warn("prewarm.failed", {{"key", key}, {"err", ec.message()}});
                return;
            }
            observability::log_info("prewarm.done", {{"key", key}, {"rows", int64_t(r.result.vendas.size())}, {"source", std::string(report::source_name(r.source))}});
        });
    });
}

}
