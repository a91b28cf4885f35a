#include "Router.h"
#include <boost/beast/http.hpp>

namespace {

Response json_status(boost::beast::http::status st, const Request& req, const char* body) {
    Response res{st, req.version()};
    res.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

}

void Router::add_route(std::string method, std::string path, Handler h) {
    add_async_route(std::move(method), std::move(path), [h = std::move(h)](const Request& req, Reply reply) {
        reply(h(req), nullptr);
    });
}

void Router::add_async_route(std::string method, std::string path, AsyncHandler h) {
    Key k{std::move(method), std::move(path)};
    routes_[std::move(k)] = std::move(h);
}

std::string Router::path_of(const Request& req) {
    std::string target = std::string(req.target());
    auto qpos = target.find('?');
    if (qpos != std::string::npos) target.erase(qpos);
    return target;
}

void Router::dispatch(const Request& req, Reply reply) const {
    Key k{std::string(req.method_string()), path_of(req)};
    auto it = routes_.find(k);
    if (it == routes_.end()) {
        bool path_exists = false;
        for (const auto& p : routes_) {
            if (p.first.path == k.path) { path_exists = true; break; }
        }
        if (path_exists) {
            reply(json_status(boost::beast::http::status::method_not_allowed, req, "{\"detail\":\"Method Not Allowed\"}"), nullptr);
            return;
        }
        reply(json_status(boost::beast::http::status::not_found, req, "{\"detail\":\"Not Found\"}"), nullptr);
        return;
    }
    it->second(req, std::move(reply));
}
