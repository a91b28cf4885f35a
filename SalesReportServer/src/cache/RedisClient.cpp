#include "RedisClient.h"
#include "observability/Logging.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

using cache::RespType;
using cache::RespValue;

RedisClient::RedisClient(IoContext& ioc, std::string host, uint16_t port, std::string pass, int db)
    : ioc_(ioc), host_(std::move(host)), port_(port), redis_pass_(std::move(pass)), redis_db_(db), socket_(ioc) {}

void RedisClient::start() {
    do_connect();
}

void RedisClient::do_connect() {
    if (connecting_ || connected_) return;
    connecting_ = true;
    auto resolver = std::make_shared<boost::asio::ip::tcp::resolver>(ioc_);
    resolver->async_resolve(host_, std::to_string(port_), [self = shared_from_this(), resolver](const boost::system::error_code& ec, boost::asio::ip::tcp::resolver::results_type eps) {
        if (ec) {
            self->connecting_ = false;
            observability::log_warn("redis.resolve_error", {{"host", self->host_}, {"err", ec.message()}});
            return;
        }
        boost::system::error_code ig; self->socket_.close(ig);
        boost::asio::async_connect(self->socket_, eps, [self](const boost::system::error_code& ec2, const boost::asio::ip::tcp::endpoint&) {
            self->connecting_ = false;
            if (ec2) {
                observability::log_warn("redis.connect_error", {{"host", self->host_}, {"err", ec2.message()}});
                return;
            }
            self->on_connected();
        });
    });
}

void RedisClient::on_connected() {
    connected_ = true;
    read_buf_.clear();
    observability::log_info("redis.connected", {{"host", host_}, {"port", int64_t(port_)}});
    auto self = shared_from_this();
    auto handshake_check = [self](const char* what) {
        return [self, what](boost::system::error_code ec, RespValue v) {
            if (ec || v.type == RespType::Error) {
                observability::log_error("redis.handshake_failed", {{"step", std::string(what)}, {"reply", v.str}});
                self->reset_connection(boost::asio::error::access_denied, false);
            }
        };
    };
    // handshake goes ahead of anything queued while connecting
    if (redis_db_ != 0) queue_.push_front(Pending{cache::resp_encode({"SELECT", std::to_string(redis_db_)}), handshake_check("select")});
    if (!redis_pass_.empty()) queue_.push_front(Pending{cache::resp_encode({"AUTH", redis_pass_}), handshake_check("auth")});
    do_write_next();
}

void RedisClient::async_command(std::vector<std::string> args, ReplyCb cb) {
    if (!connected_) {
        do_connect();
        boost::asio::post(ioc_, [cb = std::move(cb)]() { if (cb) cb(boost::asio::error::not_connected, RespValue{}); });
        return;
    }
    if (queue_.size() >= MAX_QUEUE) {
        boost::asio::post(ioc_, [cb = std::move(cb)]() { if (cb) cb(boost::asio::error::no_buffer_space, RespValue{}); });
        return;
    }
    queue_.push_back(Pending{cache::resp_encode(args), std::move(cb)});
    do_write_next();
}

void RedisClient::async_get(const std::string& key, std::function<void(boost::system::error_code, std::optional<std::string>)> cb) {
    async_command({"GET", key}, [cb = std::move(cb)](boost::system::error_code ec, RespValue v) {
        if (ec) { cb(ec, std::nullopt); return; }
        if (v.type == RespType::BulkString) { cb({}, std::move(v.str)); return; }
        if (v.type == RespType::Null) { cb({}, std::nullopt); return; }
        cb(boost::asio::error::fault, std::nullopt);
    });
}

void RedisClient::async_setex(const std::string& key, int ttl_sec, const std::string& value, std::function<void(boost::system::error_code, bool)> cb) {
    async_command({"SETEX", key, std::to_string(ttl_sec), value}, [cb = std::move(cb)](boost::system::error_code ec, RespValue v) {
        if (ec) { cb(ec, false); return; }
        if (v.type == RespType::Error) { cb(boost::asio::error::fault, false); return; }
        cb({}, v.type == RespType::SimpleString);
    });
}

void RedisClient::async_del(const std::vector<std::string>& keys, std::function<void(boost::system::error_code, int64_t)> cb) {
    if (keys.empty()) {
        boost::asio::post(ioc_, [cb = std::move(cb)]() { cb({}, 0); });
        return;
    }
    std::vector<std::string> args;
    args.reserve(keys.size() + 1);
    args.emplace_back("DEL");
    args.insert(args.end(), keys.begin(), keys.end());
    async_command(std::move(args), [cb = std::move(cb)](boost::system::error_code ec, RespValue v) {
        if (ec) { cb(ec, 0); return; }
        if (v.type != RespType::Integer) { cb(boost::asio::error::fault, 0); return; }
        cb({}, v.integer);
    });
}

void RedisClient::async_scan(const std::string& cursor, const std::string& pattern, int count,
                             std::function<void(boost::system::error_code, std::string, std::vector<std::string>)> cb) {
    async_command({"SCAN", cursor, "MATCH", pattern, "COUNT", std::to_string(count)}, [cb = std::move(cb)](boost::system::error_code ec, RespValue v) {
        if (ec) { cb(ec, std::string("0"), {}); return; }
        if (v.type != RespType::Array || v.arr.size() != 2 || v.arr[0].type != RespType::BulkString || v.arr[1].type != RespType::Array) {
            cb(boost::asio::error::fault, std::string("0"), {});
            return;
        }
        std::vector<std::string> keys;
        keys.reserve(v.arr[1].arr.size());
        for (auto& k : v.arr[1].arr) {
            if (k.type == RespType::BulkString) keys.push_back(std::move(k.str));
        }
        cb({}, v.arr[0].str, std::move(keys));
    });
}

void RedisClient::do_write_next() {
    if (busy_ || !connected_ || queue_.empty()) return;
    busy_ = true;
    current_ = std::move(queue_.front());
    queue_.pop_front();
    boost::asio::async_write(socket_, boost::asio::buffer(current_->cmd), [self = shared_from_this()](const boost::system::error_code& ec, std::size_t) {
        if (ec) { self->reset_connection(ec); return; }
        self->parse_buffered();
    });
}

void RedisClient::do_read() {
    socket_.async_read_some(boost::asio::buffer(chunk_), [self = shared_from_this()](const boost::system::error_code& ec, std::size_t n) {
        if (ec) { self->reset_connection(ec); return; }
        self->read_buf_.append(self->chunk_.data(), n);
        self->parse_buffered();
    });
}

void RedisClient::parse_buffered() {
    std::size_t consumed = 0;
    std::optional<RespValue> reply;
    try {
        reply = cache::resp_parse_prefix(read_buf_, consumed);
    } catch (const std::exception& e) {
        observability::log_error("redis.protocol_error", {{"err", std::string(e.what())}});
        reset_connection(boost::asio::error::fault);
        return;
    }
    if (!reply.has_value()) { do_read(); return; }
    read_buf_.erase(0, consumed);
    complete_current({}, std::move(*reply));
}

void RedisClient::complete_current(const boost::system::error_code& ec, RespValue v) {
    std::optional<Pending> p = std::move(current_);
    current_.reset();
    busy_ = false;
    if (p.has_value() && p->cb) p->cb(ec, std::move(v));
    do_write_next();
}

void RedisClient::fail_all(const boost::system::error_code& ec) {
    if (current_.has_value()) {
        auto p = std::move(*current_);
        current_.reset();
        if (p.cb) p.cb(ec, RespValue{});
    }
    while (!queue_.empty()) {
        auto qp = std::move(queue_.front()); queue_.pop_front();
        if (qp.cb) qp.cb(boost::asio::error::not_connected, RespValue{});
    }
}

void RedisClient::reset_connection(const boost::system::error_code& ec, bool reconnect) {
    if (!connected_ && !busy_ && queue_.empty()) return;
    observability::log_warn("redis.connection_reset", {{"err", ec.message()}});
    connected_ = false;
    busy_ = false;
    read_buf_.clear();
    boost::system::error_code ig;
    socket_.close(ig);
    fail_all(ec);
    if (reconnect) do_connect();
}
