#pragma once

#include "Router.h"
#include "cache/MonthPrewarmer.h"
#include "cache/WindowCache.h"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// One cached report endpoint: its cache and the prewarmer fed by single-day queries.
struct ReportEndpoint {
    std::shared_ptr<cache::WindowCache> cache;
    std::shared_ptr<cache::MonthPrewarmer> prewarmer;
};

// HTTP surface of the sales report:
//   GET    /vendas-realtime           per-store report
//   GET    /vendas-realtime/pacotes   per-store, per-package report
//   DELETE /cache                     drops every cached report
//   GET    /, GET /health
// The first three require the X-Secret-Key header.
class SalesApi {
public:
    using Now = std::function<std::chrono::system_clock::time_point()>;

    SalesApi(std::string secret_key,
             int utc_offset_min,
             ReportEndpoint stores,
             ReportEndpoint packages,
             std::function<bool()> redis_connected,
             Now now = []{ return std::chrono::system_clock::now(); });

    void register_routes(Router& router);

    // last occurrence wins; values are percent-decoded
    static std::map<std::string, std::string> parse_query(std::string_view target);
    static std::string url_decode(std::string_view s);

private:
    std::optional<Response> check_secret(const Request& req) const;
    void handle_report(const Request& req, Router::Reply reply, const ReportEndpoint& ep) const;
    void handle_clear(const Request& req, Router::Reply reply) const;
    Response handle_health(const Request& req) const;

    std::string secret_key_;
    int utc_offset_min_;
    ReportEndpoint stores_;
    ReportEndpoint packages_;
    std::function<bool()> redis_connected_;
    Now now_;
};
