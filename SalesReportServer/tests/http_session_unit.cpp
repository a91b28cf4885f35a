#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include "http_test_util.h"
#include "net/HttpServer.h"
#include "net/Router.h"
#include "observability/Logging.h"
#include "observability/Metrics.h"

static Response text(const Request& req, http::status st, const std::string& body) {
    Response res{st, req.version()};
    res.set(http::field::content_type, "text/plain");
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

int main() {
    observability::set_log_level(4);
    asio::io_context io;
    Router router;
    std::atomic<int> hook_runs{0};
    std::atomic<int> seen_query_routes{0};
    std::atomic<int> loop_exceptions{0};

    router.add_route("GET", "/ping", [&seen_query_routes](const Request& req) {
        if (std::string(req.target()).find('?') != std::string::npos) ++seen_query_routes;
        return text(req, http::status::ok, "pong");
    });
    router.add_route("GET", "/boom", [](const Request&) -> Response { throw std::runtime_error("handler failed"); });
    router.add_async_route("GET", "/deferred", [&io, &hook_runs](const Request& req, Router::Reply reply) {
        auto res = text(req, http::status::ok, "later");
        asio::post(io, [reply, res, &hook_runs]() mutable {
            reply(std::move(res), [&hook_runs]{ ++hook_runs; });
        });
    });

    router.add_async_route("GET", "/lost", [&io](const Request&, Router::Reply reply) {
        asio::post(io, [reply]() -> void { throw std::runtime_error("completion failed before replying"); });
    });

    HttpServer server(io, 0, router, true, false, std::chrono::milliseconds(200));
    server.run();
    unsigned short port = server.port();
    std::thread t([&io, &loop_exceptions]{
        for (;;) {
            try {
                io.run();
                break;
            } catch (const std::exception&) {
                ++loop_exceptions;
            }
        }
    });

    int rc = 0;
    try {
        auto r1 = request(port, http::verb::get, "/ping?data=2024-03-15");
        if (r1.result() != http::status::ok || r1.body() != "pong") { std::cerr << "query string broke routing\n"; rc = 1; }
        if (seen_query_routes != 1) { std::cerr << "handler should still see the full target\n"; rc = 1; }
        if (r1["Access-Control-Allow-Origin"] != "*") { std::cerr << "cors header missing\n"; rc = 1; }

        auto r2 = request(port, http::verb::get, "/boom");
        if (r2.result() != http::status::internal_server_error || r2.body().find("\"detail\"") == std::string::npos) { std::cerr << "throwing handler should be 500, got " << r2.result_int() << "\n"; rc = 1; }

        auto r3 = request(port, http::verb::get, "/deferred");
        if (r3.result() != http::status::ok || r3.body() != "later") { std::cerr << "deferred reply lost\n"; rc = 1; }
        for (int i = 0; i < 200 && hook_runs == 0; ++i) std::this_thread::sleep_for(std::chrono::milliseconds(10));
        if (hook_runs != 1) { std::cerr << "after-send hook ran " << hook_runs << " times\n"; rc = 1; }

        auto lost = request(port, http::verb::get, "/lost");
        if (lost.result() != http::status::internal_server_error || lost.body().find("\"detail\"") == std::string::npos) { std::cerr << "request with a failed completion should get 500, got " << lost.result_int() << "\n"; rc = 1; }
        if (loop_exceptions != 1) { std::cerr << "completion exception should reach the io loop once\n"; rc = 1; }
        auto still = request(port, http::verb::get, "/deferred");
        if (still.result() != http::status::ok) { std::cerr << "server stopped answering after a failed completion\n"; rc = 1; }

        auto r4 = request(port, http::verb::get, "/missing");
        if (r4.result() != http::status::not_found) { std::cerr << "expected 404\n"; rc = 1; }

        auto r5 = request(port, http::verb::options, "/ping");
        if (r5.result() != http::status::no_content) { std::cerr << "OPTIONS should be 204\n"; rc = 1; }

        auto after = observability::Metrics::instance().scrape();
        if (after.find("http_requests_total{path=\"/ping\",method=\"GET\",code=\"200\"} 1") == std::string::npos) { std::cerr << "request not counted under the stripped path\n"; rc = 1; }
        if (after.find("path=\"/boom\",method=\"GET\",code=\"500\"") == std::string::npos) { std::cerr << "500 not counted\n"; rc = 1; }
    } catch (const std::exception& e) {
        std::cerr << "http_session_unit: " << e.what() << "\n";
        rc = 1;
    }

    io.stop();
    t.join();
    if (rc == 0) std::cout << "http_session_unit ok\n";
    return rc;
}
