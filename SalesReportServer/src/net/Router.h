#pragma once

#include "Request.h"
#include "Response.h"
#include <string>
#include <functional>
#include <unordered_map>
#include <vector>

class Router {
public:
    // after_send runs once the response has been fully written to the peer
    using AfterSend = std::function<void()>;
    using Reply = std::function<void(Response, AfterSend)>;
    using Handler = std::function<Response(const Request&)>;
    using AsyncHandler = std::function<void(const Request&, Reply)>;

    void add_route(std::string method, std::string path, Handler h);
    void add_async_route(std::string method, std::string path, AsyncHandler h);
    // matches on method and path with the query string removed; 404/405 otherwise
    void dispatch(const Request& req, Reply reply) const;

    static std::string path_of(const Request& req);
private:
    struct Key { std::string method; std::string path; };
    struct KeyHash {
        size_t operator()(Key const& k) const noexcept { return std::hash<std::string>()(k.method + "#" + k.path); }
    };
    struct KeyEq { bool operator()(Key const& a, Key const& b) const noexcept { return a.method==b.method && a.path==b.path; } };
    std::unordered_map<Key, AsyncHandler, KeyHash, KeyEq> routes_;
};
