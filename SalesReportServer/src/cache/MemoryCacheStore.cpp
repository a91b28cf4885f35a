#include "MemoryCacheStore.h"

namespace cache {

MemoryCacheStore::MemoryCacheStore() : MemoryCacheStore([]{ return std::chrono::steady_clock::now(); }) {}

MemoryCacheStore::MemoryCacheStore(Clock clock) : clock_(std::move(clock)) {}

void MemoryCacheStore::sweep_locked(std::chrono::steady_clock::time_point now) const {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at <= now) it = entries_.erase(it);
        else ++it;
    }
}

void MemoryCacheStore::async_get(const std::string& key, GetCb cb) {
    std::optional<std::string> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            if (it->second.expires_at <= clock_()) entries_.erase(it);
            else out = it->second.value;
        }
    }
    cb({}, std::move(out));
}

void MemoryCacheStore::async_setex(const std::string& key, int ttl_sec, const std::string& value, SetCb cb) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto now = clock_();
        sweep_locked(now);
        entries_[key] = Entry{value, now + std::chrono::seconds(ttl_sec)};
    }
    cb({});
}

void MemoryCacheStore::async_delete_matching(const std::string& prefix, CountCb cb) {
    int64_t removed = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        sweep_locked(clock_());
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->first.compare(0, prefix.size(), prefix) == 0) { it = entries_.erase(it); ++removed; }
            else ++it;
        }
    }
    cb({}, removed);
}

std::size_t MemoryCacheStore::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    sweep_locked(clock_());
    return entries_.size();
}

}
