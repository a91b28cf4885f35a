#pragma once

#include "Resp.h"
#include <boost/asio.hpp>
#include <array>
#include <functional>
#include <string>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

// Single-connection RESP2 client driven by the application io_context. Commands
// are sent one at a time in submission order. While disconnected every command
// fails immediately with boost::asio::error::not_connected and a reconnect starts.
class RedisClient : public std::enable_shared_from_this<RedisClient> {
public:
    using IoContext = boost::asio::io_context;
    using ReplyCb = std::function<void(boost::system::error_code, cache::RespValue)>;

    RedisClient(IoContext& ioc, std::string host, uint16_t port, std::string pass = std::string(), int db = 0);
    void start();
    bool connected() const { return connected_; }

    void async_command(std::vector<std::string> args, ReplyCb cb);

    void async_get(const std::string& key,
                   std::function<void(boost::system::error_code, std::optional<std::string>)> cb);
    void async_setex(const std::string& key, int ttl_sec, const std::string& value,
                     std::function<void(boost::system::error_code, bool)> cb);
    void async_del(const std::vector<std::string>& keys,
                   std::function<void(boost::system::error_code, int64_t)> cb);
    // one SCAN step; next cursor "0" means the iteration is complete
    void async_scan(const std::string& cursor, const std::string& pattern, int count,
                    std::function<void(boost::system::error_code, std::string, std::vector<std::string>)> cb);

private:
    struct Pending {
        std::string cmd;
        ReplyCb cb;
    };

    void do_connect();
    void on_connected();
    void do_write_next();
    void do_read();
    void parse_buffered();
    void fail_all(const boost::system::error_code& ec);
    // a failed handshake does not reconnect on its own; the next command retries
    void reset_connection(const boost::system::error_code& ec, bool reconnect = true);
    void complete_current(const boost::system::error_code& ec, cache::RespValue v);

    IoContext& ioc_;
    std::string host_;
    uint16_t port_;
    std::string redis_pass_;
    int redis_db_;
    boost::asio::ip::tcp::socket socket_;
    std::string read_buf_;
    std::array<char, 8192> chunk_{};
    std::deque<Pending> queue_;
    std::optional<Pending> current_;
    bool busy_ = false;
    bool connected_ = false;
    bool connecting_ = false;

    static constexpr std::size_t MAX_QUEUE = 10000;
};
