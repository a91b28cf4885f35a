#pragma once

#include "CacheStore.h"
#include <memory>

class RedisClient;

namespace cache {

class RedisCacheStore : public CacheStore {
public:
    explicit RedisCacheStore(std::shared_ptr<RedisClient> client);

    void async_get(const std::string& key, GetCb cb) override;
    void async_setex(const std::string& key, int ttl_sec, const std::string& value, SetCb cb) override;
    void async_delete_matching(const std::string& prefix, CountCb cb) override;

private:
    std::shared_ptr<RedisClient> client_;
};

// SCAN MATCH pattern selecting keys that start with prefix
std::string glob_for_prefix(const std::string& prefix);

}
