#include "RedisCacheStore.h"
#include "RedisClient.h"
#include "observability/Logging.h"
#include <stdexcept>

namespace cache {

namespace {

constexpr int SCAN_COUNT = 100;

struct ClearOp : std::enable_shared_from_this<ClearOp> {
    std::shared_ptr<RedisClient> client;
    std::string pattern;
    CacheStore::CountCb cb;
    int64_t removed = 0;

    void step(const std::string& cursor) {
        auto self = shared_from_this();
        client->async_scan(cursor, pattern, SCAN_COUNT, [self](boost::system::error_code ec, std::string next, std::vector<std::string> keys) {
            if (ec) { self->cb(ec, self->removed); return; }
            client_del(self, std::move(next), std::move(keys));
        });
    }

    static void client_del(std::shared_ptr<ClearOp> self, std::string next, std::vector<std::string> keys) {
        self->client->async_del(keys, [self, next](boost::system::error_code ec, int64_t n) {
            if (ec) { self->cb(ec, self->removed); return; }
            self->removed += n;
            if (next == "0") { self->cb({}, self->removed); return; }
            self->step(next);
        });
    }
};

}

std::string glob_for_prefix(const std::string& prefix) {
    std::string out;
    out.reserve(prefix.size() + 2);
    for (char c : prefix) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('*');
    return out;
}

RedisCacheStore::RedisCacheStore(std::shared_ptr<RedisClient> client) : client_(std::move(client)) {
    if (!client_) throw std::invalid_argument("RedisCacheStore requires a client");
}

void RedisCacheStore::async_get(const std::string& key, GetCb cb) {
    client_->async_get(key, [cb = std::move(cb)](boost::system::error_code ec, std::optional<std::string> v) {
        cb(ec, std::move(v));
    });
}

void RedisCacheStore::async_setex(const std::string& key, int ttl_sec, const std::string& value, SetCb cb) {
    client_->async_setex(key, ttl_sec, value, [cb = std::move(cb)](boost::system::error_code ec, bool ok) {
        if (!ec && !ok) ec = boost::asio::error::fault;
        cb(ec);
    });
}

void RedisCacheStore::async_delete_matching(const std::string& prefix, CountCb cb) {
    auto op = std::make_shared<ClearOp>();
    op->client = client_;
    op->pattern = glob_for_prefix(prefix);
    op->cb = std::move(cb);
    observability::log_debug("redis_store.clear_start", {{"pattern", op->pattern}});
    op->step("0");
}

}
