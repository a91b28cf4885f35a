#pragma once

#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace cache {

// Opaque key/value store with per-key TTL. Knows nothing about report windows.
class CacheStore {
public:
    using GetCb = std::function<void(const boost::system::error_code&, std::optional<std::string>)>;
    using SetCb = std::function<void(const boost::system::error_code&)>;
    using CountCb = std::function<void(const boost::system::error_code&, int64_t)>;

    virtual ~CacheStore() = default;

    virtual void async_get(const std::string& key, GetCb cb) = 0;
    virtual void async_setex(const std::string& key, int ttl_sec, const std::string& value, SetCb cb) = 0;
    // removes every key starting with prefix, reports how many were removed
    virtual void async_delete_matching(const std::string& prefix, CountCb cb) = 0;
};

}
