#include "SalesApi.h"
#include "MiniJson.h"
#include "observability/Logging.h"
#include "report/DateRange.h"
#include "report/Errors.h"
#include "report/SalesReport.h"
#include <boost/beast/http.hpp>
#include <stdexcept>

namespace http = boost::beast::http;

namespace {

Response json_response(http::status st, unsigned version, bool keep_alive, std::string body) {
    Response res{st, version};
    res.set(http::field::content_type, "application/json; charset=utf-8");
    res.keep_alive(keep_alive);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

Response detail_response(http::status st, unsigned version, bool keep_alive, const std::string& detail) {
    return json_response(st, version, keep_alive, "{\"detail\":\"" + json_escape_resp(detail) + "\"}");
}

std::optional<std::string> param(const std::map<std::string, std::string>& q, const std::string& name) {
    auto it = q.find(name);
    if (it == q.end()) return std::nullopt;
    return it->second;
}

}

SalesApi::SalesApi(std::string secret_key,
                   int utc_offset_min,
                   ReportEndpoint stores,
                   ReportEndpoint packages,
                   std::function<bool()> redis_connected,
                   Now now)
    : secret_key_(std::move(secret_key)), utc_offset_min_(utc_offset_min), stores_(std::move(stores)),
      packages_(std::move(packages)), redis_connected_(std::move(redis_connected)), now_(std::move(now)) {
    if (!stores_.cache) throw std::invalid_argument("SalesApi requires the store report cache");
}

void SalesApi::register_routes(Router& router) {
    router.add_route("GET", "/", [](const Request& req) {
        return json_response(http::status::ok, req.version(), req.keep_alive(),
                             "{\"message\":\"API Vendas Real Time\",\"status\":\"online\"}");
    });
    router.add_route("GET", "/health", [this](const Request& req) { return handle_health(req); });
    router.add_async_route("GET", "/vendas-realtime", [this](const Request& req, Router::Reply reply) {
        handle_report(req, std::move(reply), stores_);
    });
    if (packages_.cache) {
        router.add_async_route("GET", "/vendas-realtime/pacotes", [this](const Request& req, Router::Reply reply) {
            handle_report(req, std::move(reply), packages_);
        });
    }
    router.add_async_route("DELETE", "/cache", [this](const Request& req, Router::Reply reply) {
        handle_clear(req, std::move(reply));
    });
}

std::string SalesApi::url_decode(std::string_view s) {
    std::string out; out.reserve(s.size());
    auto hex = [](char h)->int {
        if (h >= '0' && h <= '9') return h - '0';
        if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
        if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
        return -1;
    };
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%') {
            if (i + 2 >= s.size()) return out;
            int hi = hex(s[i+1]); int lo = hex(s[i+2]); if (hi < 0 || lo < 0) return out;
            out.push_back(char((hi << 4) | lo)); i += 2;
        } else if (c == '+') out.push_back(' ');
        else out.push_back(c);
    }
    return out;
}

std::map<std::string, std::string> SalesApi::parse_query(std::string_view target) {
    std::map<std::string, std::string> out;
    auto qpos = target.find('?');
    if (qpos == std::string_view::npos) return out;
    std::string_view q = target.substr(qpos + 1);
    while (!q.empty()) {
        auto amp = q.find('&');
        std::string_view part = q.substr(0, amp);
        q = (amp == std::string_view::npos) ? std::string_view() : q.substr(amp + 1);
        if (part.empty()) continue;
        auto eq = part.find('=');
        std::string key = url_decode(part.substr(0, eq));
        std::string val = (eq == std::string_view::npos) ? std::string() : url_decode(part.substr(eq + 1));
        out[key] = val;
    }
    return out;
}

std::optional<Response> SalesApi::check_secret(const Request& req) const {
    if (secret_key_.empty()) {
        observability::log_error("auth.secret_not_configured");
        return detail_response(http::status::internal_server_error, req.version(), req.keep_alive(),
                               "SECRET_KEY não configurada no servidor");
    }
    auto it = req.find("X-Secret-Key");
    if (it == req.end() || std::string(it->value().data(), it->value().size()) != secret_key_) {
        observability::log_warn("auth.rejected", {{"path", Router::path_of(req)}, {"header_present", int64_t(it != req.end())}});
        return detail_response(http::status::unauthorized, req.version(), req.keep_alive(), "Secret Key inválida");
    }
    return std::nullopt;
}

void SalesApi::handle_report(const Request& req, Router::Reply reply, const ReportEndpoint& ep) const {
    if (auto denied = check_secret(req)) { reply(std::move(*denied), nullptr); return; }

    auto target = req.target();
    auto q = parse_query(std::string_view(target.data(), target.size()));
    report::ResolvedRange range;
    auto today = report::civil_date_at(now_(), utc_offset_min_);
    auto ec = report::resolve_date_range(param(q, "data"), param(q, "data_inicio"), param(q, "data_fim"), today, range);
    if (ec) {
        observability::log_info("report.bad_params", {{"target", std::string(target.data(), target.size())}, {"err", ec.message()}});
        reply(detail_response(http::status::bad_request, req.version(), req.keep_alive(), ec.message()), nullptr);
        return;
    }

    unsigned version = req.version();
    bool keep_alive = req.keep_alive();
    auto prewarmer = ep.prewarmer;
    ep.cache->async_resolve(range.window, [reply, version, keep_alive, range, prewarmer](const boost::system::error_code& ec2, report::ResolvedReport r) {
        if (ec2) {
            auto st = report::is_client_error(ec2) ? http::status::bad_request : http::status::internal_server_error;
            reply(detail_response(st, version, keep_alive, ec2.message()), nullptr);
            return;
        }
        std::optional<Response> res;
        try {
            res = json_response(http::status::ok, version, keep_alive, report::render_report_json(r));
        } catch (const std::exception& e) {
            observability::log_error("report.render_failed", {{"err", std::string(e.what())}});
            reply(detail_response(http::status::internal_server_error, version, keep_alive, "Erro ao consultar vendas"), nullptr);
            return;
        }
        Router::AfterSend after_send;
        if (range.single_day && range.reference_date.has_value() && prewarmer) {
            auto day = *range.reference_date;
            after_send = [prewarmer, day]{ prewarmer->trigger(day); };
        }
        reply(std::move(*res), std::move(after_send));
    });
}

void SalesApi::handle_clear(const Request& req, Router::Reply reply) const {
    if (auto denied = check_secret(req)) { reply(std::move(*denied), nullptr); return; }

    unsigned version = req.version();
    bool keep_alive = req.keep_alive();
    stores_.cache->async_clear([reply, version, keep_alive](const boost::system::error_code& ec, int64_t removed) {
        if (ec == report::errc::cache_unavailable) {
            reply(json_response(http::status::ok, version, keep_alive,
                                "{\"message\":\"Redis não disponível, nada a limpar\",\"removidos\":0}"), nullptr);
            return;
        }
        if (ec) {
            reply(detail_response(http::status::internal_server_error, version, keep_alive,
                                  "Erro ao limpar cache: " + ec.message()), nullptr);
            return;
        }
        reply(json_response(http::status::ok, version, keep_alive,
                            "{\"message\":\"Cache limpo com sucesso\",\"removidos\":" + std::to_string(removed) + "}"), nullptr);
    });
}

Response SalesApi::handle_health(const Request& req) const {
    bool redis_up = redis_connected_ && redis_connected_();
    std::string body = "{\"status\":\"healthy\",\"timestamp\":\"" + report::iso_local_timestamp(now_(), utc_offset_min_) +
                       "\",\"redis\":\"" + (redis_up ? "connected" : "disconnected") + "\"}";
    return json_response(http::status::ok, req.version(), req.keep_alive(), std::move(body));
}
