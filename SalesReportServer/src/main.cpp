#include <boost/asio.hpp>
#include <iostream>
#include <string>
#include <memory>
#include "net/Router.h"
#include "net/HttpServer.h"
#include "net/SalesApi.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include "config/Config.h"
#include "db/DbPool.h"
#include "cache/CacheKeys.h"
#include "cache/MemoryCacheStore.h"
#include "cache/MonthPrewarmer.h"
#include "cache/RedisCacheStore.h"
#include "cache/RedisClient.h"
#include "cache/TaskDispatcher.h"
#include "cache/WindowCache.h"
#include "report/SalesAggregator.h"

using config::Config;
using observability::log_info;
using observability::log_warn;
using observability::log_error;
using observability::set_log_level;

int main(int argc, char** argv) {
    auto cfg = Config::from_env(argc, argv);
    set_log_level(cfg.log_level_number());

    try {
        boost::asio::io_context io;

        if (cfg.secret_key.empty()) log_warn("secret_key_not_configured", {});
        if (!cfg.database_configured()) log_warn("db_not_configured", {});
        auto dbpool = std::make_shared<db::DbPool>(io, cfg.conninfo(), cfg.db_workers);

        std::shared_ptr<RedisClient> redis_client;
        std::shared_ptr<cache::CacheStore> store;
        if (!cfg.redis_host.empty()) {
            redis_client = std::make_shared<RedisClient>(io, cfg.redis_host, cfg.redis_port, cfg.redis_password, cfg.redis_db);
            redis_client->start();
            store = std::make_shared<cache::RedisCacheStore>(redis_client);
            log_info("cache_backend", {{"backend", std::string("redis")}, {"host", cfg.redis_host}, {"port", int64_t(cfg.redis_port)}});
        } else {
            store = std::make_shared<cache::MemoryCacheStore>();
            log_info("cache_backend", {{"backend", std::string("memory")}});
        }

        auto dispatcher = std::make_shared<cache::AsioTaskDispatcher>(io);
        const std::string prefix = Config::cache_key_prefix;

        auto store_cache = std::make_shared<cache::WindowCache>(
            store, std::make_shared<report::PgSalesAggregator>(dbpool, report::Grouping::store),
            prefix, Config::cache_ttl_sec, Config::business_utc_offset_min);
        auto package_cache = std::make_shared<cache::WindowCache>(
            store, std::make_shared<report::PgSalesAggregator>(dbpool, report::Grouping::store_package),
            cache::cache_key_namespace(prefix, "pacotes"), Config::cache_ttl_sec, Config::business_utc_offset_min);

        ReportEndpoint stores{store_cache, std::make_shared<cache::MonthPrewarmer>(store_cache, dispatcher)};
        ReportEndpoint packages{package_cache, std::make_shared<cache::MonthPrewarmer>(package_cache, dispatcher)};

        Router router;
        SalesApi api(cfg.secret_key, Config::business_utc_offset_min, stores, packages,
                     [redis_client]{ return redis_client && redis_client->connected(); });
        api.register_routes(router);

        if (cfg.metrics_enabled) {
            router.add_route("GET", "/metrics", [](const Request& req) {
                Response res{boost::beast::http::status::ok, req.version()};
                res.set(boost::beast::http::field::content_type, "text/plain; version=0.0.4");
                res.keep_alive(req.keep_alive());
                res.body() = observability::Metrics::instance().scrape();
                res.prepare_payload();
                return res;
            });
        }

        HttpServer server(io, cfg.port, router, cfg.metrics_enabled, cfg.access_log);
        log_info("server_start", {{"port", int64_t(server.port())}});
        server.run();

        for (;;) {
            try {
                io.run();
                break;
            } catch (const std::exception& e) {
                log_error("io_handler_exception", {{"err", std::string(e.what())}});
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
