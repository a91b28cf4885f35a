#pragma once

#include "CacheStore.h"
#include <chrono>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace cache {

// In-process store used when no Redis host is configured. Completes callbacks
// inline on the calling thread.
class MemoryCacheStore : public CacheStore {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    MemoryCacheStore();
    explicit MemoryCacheStore(Clock clock);

    void async_get(const std::string& key, GetCb cb) override;
    void async_setex(const std::string& key, int ttl_sec, const std::string& value, SetCb cb) override;
    void async_delete_matching(const std::string& prefix, CountCb cb) override;

    // live (unexpired) entries
    std::size_t size() const;

private:
    struct Entry {
        std::string value;
        std::chrono::steady_clock::time_point expires_at;
    };

    void sweep_locked(std::chrono::steady_clock::time_point now) const;

    Clock clock_;
    mutable std::mutex mu_;
    mutable std::unordered_map<std::string, Entry> entries_;
};

}
