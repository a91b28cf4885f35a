#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include "Router.h"
#include <chrono>
#include <string>

class HttpServer {
public:
    // reply_timeout bounds how long a routed request may go without a reply before it gets a 500
    HttpServer(boost::asio::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log,
               std::chrono::milliseconds reply_timeout = std::chrono::seconds(60));
    void run();
    unsigned short port() const;
private:
    void do_accept();
    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    Router& router_;
    bool metrics_enabled_;
    bool access_log_;
    std::chrono::milliseconds reply_timeout_;
};
