#include "HttpServer.h"
#include "Request.h"
#include "Response.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include <array>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

namespace {

const std::size_t MAX_HEADER_BYTES = 8 * 1024;
const std::size_t MAX_BODY_BYTES = 1 * 1024 * 1024;
const char* const INTERNAL_ERROR_BODY = "{\"detail\":\"Internal Server Error\"}";

std::optional<std::size_t> declared_content_length(const Request& req) {
    auto it = req.find(http::field::content_length);
    if (it == req.end()) return std::size_t(0);
    std::size_t n = 0;
    for (char c : it->value()) {
        if (c < '0' || c > '9') return std::nullopt;
        if (n > (MAX_BODY_BYTES * 1024)) return n;
        n = n * 10 + std::size_t(c - '0');
    }
    return n;
}

}

struct Session : std::enable_shared_from_this<Session> {
    net::ip::tcp::socket socket;
    beast::flat_buffer buffer;
    net::steady_timer read_timer;
    net::steady_timer reply_timer;
    Router& router;
    unsigned http_version = 11;
    Request req;
    bool replied_ = false;
    uint64_t request_seq_ = 0;
    bool draining_ = false;
    std::array<char, 4096> drain_buf_{};
    int drain_seconds_ = 5;
    std::chrono::steady_clock::time_point start_ts;
    bool metrics_enabled;
    bool access_log;
    std::chrono::milliseconds reply_timeout;

    Session(net::ip::tcp::socket&& s, Router& r, bool me, bool al, std::chrono::milliseconds rt)
        : socket(std::move(s)), buffer(), read_timer(socket.get_executor()), reply_timer(socket.get_executor()), router(r),
          metrics_enabled(me), access_log(al), reply_timeout(rt) {}

    void run() { do_read(); }

    void do_read() {
        auto self = shared_from_this();
        req = {};
        http_version = 11;
        replied_ = false;
        ++request_seq_;
        start_ts = std::chrono::steady_clock::now();

        auto parser = std::make_shared<http::request_parser<http::string_body>>();
        parser->header_limit(MAX_HEADER_BYTES);
        parser->body_limit(MAX_BODY_BYTES);

        read_timer.expires_after(std::chrono::seconds(5));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (!ec) self->close_socket();
        });

        http::async_read_header(socket, buffer, *parser, [self, parser](beast::error_code ec, std::size_t) {
            self->read_timer.cancel();

            if (ec) {
                if (ec == http::error::end_of_stream) {
                    self->close_socket();
                    return;
                }
                if (ec == http::error::header_limit) {
                    self->reply_json_error(http::status::request_header_fields_too_large, "{\"detail\":\"header too large\"}", true, "(header)");
                    return;
                }
                if (ec == http::error::bad_target || ec == http::error::bad_method || ec == http::error::bad_version ||
                    ec == http::error::bad_field) {
                    self->reply_json_error(http::status::bad_request, "{\"detail\":\"bad request\"}", true, "(parse)");
                    return;
                }
                self->close_socket();
                return;
            }

            self->http_version = parser->get().version();

            auto content_len = declared_content_length(parser->get());
            if (!content_len.has_value()) {
                self->reply_json_error(http::status::bad_request, "{\"detail\":\"bad request\"}", true, "(header)");
                return;
            }
            if (*content_len > MAX_BODY_BYTES) {
                observability::log_info("http.oversized_body", {{"len", int64_t(*content_len)}});
                self->drain_seconds_ = std::min(10, std::max(5, int(*content_len / (256 * 1024))));
                self->reply_json_error(http::status::payload_too_large, "{\"detail\":\"body too large\"}", true, "(body)");
                return;
            }
            if (*content_len == 0) self->read_timer.expires_after(std::chrono::seconds(10));
            else if (*content_len <= 128 * 1024) self->read_timer.expires_after(std::chrono::seconds(20));
            else self->read_timer.expires_after(std::chrono::seconds(60));
            self->read_timer.async_wait([self](const boost::system::error_code& ec) {
                if (!ec) self->close_socket();
            });

            http::async_read(self->socket, self->buffer, *parser, [self, parser](beast::error_code ec2, std::size_t) {
                self->read_timer.cancel();

                if (ec2) {
                    if (ec2 == http::error::end_of_stream) { self->close_socket(); return; }
                    if (ec2 == http::error::body_limit) {
                        self->reply_json_error(http::status::payload_too_large, "{\"detail\":\"body too large\"}", true, "(body)");
                        return;
                    }
                    self->close_socket();
                    return;
                }

                self->req = parser->release();
                self->start_ts = std::chrono::steady_clock::now();
                self->handle_request();
            });
        });
    }

    void handle_request() {
        std::string cleaned_target = Router::path_of(req);
        auto self = shared_from_this();

        if (req.method() == http::verb::options) {
            auto res = std::make_shared<Response>(http::status::no_content, req.version());
            res->set("Access-Control-Allow-Methods", "GET, DELETE, OPTIONS");
            res->set("Access-Control-Allow-Headers", "Content-Type, X-Secret-Key");
            res->keep_alive(req.keep_alive());
            res->prepare_payload();
            send_response(res, cleaned_target, nullptr);
            return;
        }

        uint64_t seq = request_seq_;
        try {
            router.dispatch(req, [self, cleaned_target, seq](Response res, Router::AfterSend after_send) {
                if (self->replied_ || self->request_seq_ != seq) {
                    observability::log_error("http.duplicate_reply", {{"path", cleaned_target}});
                    return;
                }
                self->replied_ = true;
                self->reply_timer.cancel();
                try {
                    self->send_response(std::make_shared<Response>(std::move(res)), cleaned_target, std::move(after_send));
                } catch (const std::exception& e) {
                    observability::log_error("http.reply_exception", {{"path", cleaned_target}, {"err", std::string(e.what())}});
                    self->reply_json_error(http::status::internal_server_error, INTERNAL_ERROR_BODY, true, cleaned_target);
                }
            });
        } catch (const std::exception& e) {
            observability::log_error("http.handler_exception", {{"path", cleaned_target}, {"err", std::string(e.what())}});
            if (!replied_) {
                replied_ = true;
                reply_json_error(http::status::internal_server_error, INTERNAL_ERROR_BODY, false, cleaned_target);
            }
        }
        if (!replied_) arm_reply_deadline(seq, cleaned_target);
    }

    // a handler whose completion throws or is dropped never replies; answer for it
    void arm_reply_deadline(uint64_t seq, const std::string& cleaned_target) {
        auto self = shared_from_this();
        reply_timer.expires_after(reply_timeout);
        reply_timer.async_wait([self, seq, cleaned_target](const boost::system::error_code& ec) {
            if (ec || self->replied_ || self->request_seq_ != seq) return;
            observability::log_error("http.reply_timeout", {{"path", cleaned_target}, {"ms", int64_t(self->reply_timeout.count())}});
            self->replied_ = true;
            self->reply_json_error(http::status::internal_server_error, INTERNAL_ERROR_BODY, true, cleaned_target);
        });
    }

    void record(const Response& res, const std::string& cleaned_target) {
        std::string method = std::string(req.method_string());
        auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_ts).count();
        if (metrics_enabled) {
            auto& m = observability::Metrics::instance();
            m.inc(cleaned_target, method, res.result_int());
            m.observe_latency(cleaned_target, method, elapsed);
        }
        if (access_log) {
            observability::log_info("http.access", {{"method", method}, {"path", cleaned_target}, {"code", int64_t(res.result_int())}, {"ms", elapsed}});
        }
    }

    void set_cors(Response& res) {
        auto it = req.find(http::field::origin);
        if (it != req.end()) res.set("Access-Control-Allow-Origin", std::string(it->value())); else res.set("Access-Control-Allow-Origin", "*");
        res.set("Access-Control-Allow-Credentials", "true");
    }

    void send_response(std::shared_ptr<Response> sp, const std::string& cleaned_target, Router::AfterSend after_send) {
        auto self = shared_from_this();
        if (sp->find(http::field::connection) == sp->end()) {
            sp->keep_alive(req.keep_alive());
        }
        set_cors(*sp);
        record(*sp, cleaned_target);

        http::async_write(socket, *sp, [self, sp, cleaned_target, after_send = std::move(after_send)](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("http.write_error", {{"path", cleaned_target}, {"err", ec.message()}});
                self->close_socket();
                return;
            }
            if (after_send) {
                try {
                    after_send();
                } catch (const std::exception& e) {
                    observability::log_error("http.after_send_exception", {{"path", cleaned_target}, {"err", std::string(e.what())}});
                }
            }
            if (sp->keep_alive()) self->do_read();
            else self->graceful_close_after_write();
        });
    }

    void close_socket(bool hard_shutdown = true) {
        boost::system::error_code ignored;
        read_timer.cancel();
        reply_timer.cancel();
        socket.cancel(ignored);
        if (hard_shutdown) socket.shutdown(net::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    void start_drain_timer() {
        auto self = shared_from_this();
        read_timer.expires_after(std::chrono::seconds(drain_seconds_));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (ec) return;
            self->close_socket(false);
        });
    }

    void do_drain_read() {
        auto self = shared_from_this();
        socket.async_read_some(net::buffer(drain_buf_), [self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec == net::error::operation_aborted) return;
                self->read_timer.cancel();
                self->close_socket(false);
                return;
            }
            self->do_drain_read();
        });
    }

    void graceful_close_after_write() {
        if (draining_) return;
        draining_ = true;
        boost::system::error_code ignored;
        socket.shutdown(net::ip::tcp::socket::shutdown_send, ignored);
        start_drain_timer();
        do_drain_read();
    }

    void reply_json_error(http::status st, const std::string& body, bool close_conn, const std::string& cleaned_target) {
        auto res = std::make_shared<Response>(st, http_version);
        res->set(http::field::content_type, "application/json; charset=utf-8");
        res->keep_alive(!close_conn && req.keep_alive());
        res->body() = body;
        res->prepare_payload();
        if (close_conn) res->set(http::field::connection, "close");
        send_response(res, cleaned_target, nullptr);
    }
};

HttpServer::HttpServer(net::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log,
                       std::chrono::milliseconds reply_timeout)
    : ioc_(ioc), acceptor_(ioc, net::ip::tcp::endpoint(net::ip::address_v4::any(), port)), router_(router),
      metrics_enabled_(metrics_enabled), access_log_(access_log), reply_timeout_(reply_timeout) {}

void HttpServer::run() { do_accept(); }

unsigned short HttpServer::port() const { return acceptor_.local_endpoint().port(); }

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, net::ip::tcp::socket socket) {
        if (!ec) {
            std::make_shared<Session>(std::move(socket), router_, metrics_enabled_, access_log_, reply_timeout_)->run();
        } else observability::log_warn("http.accept_error", {{"err", ec.message()}});

        do_accept();
    });
}
