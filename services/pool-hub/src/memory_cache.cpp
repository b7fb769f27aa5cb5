#include "../include/memory_cache.hpp"
#include <algorithm>

static const int64_t kSweepIntervalMs = 1000;

MemoryCache::MemoryCache(Clock clock) : clock_(std::move(clock)) {}

void MemoryCache::sweep_expired(int64_t now) {
    if (now - last_sweep_ < kSweepIntervalMs) return;
    last_sweep_ = now;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at != 0 && now >= it->second.expires_at) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

MemoryCache::Entry* MemoryCache::live(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) return nullptr;
    if (it->second.expires_at != 0 && clock_() >= it->second.expires_at) {
        entries_.erase(it);
        return nullptr;
    }
    return &it->second;
}

MemoryCache::Entry& MemoryCache::upsert(const std::string& key) {
    sweep_expired(clock_());
    if (Entry* e = live(key)) return *e;
    return entries_[key];
}

void MemoryCache::hset(const std::string& key, const std::map<std::string, std::string>& fields) {
    std::lock_guard<std::mutex> lock(mtx_);
    Entry& e = upsert(key);
    for (const auto& kv : fields) e.hash[kv.first] = kv.second;
}

std::map<std::string, std::string> MemoryCache::hgetall(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    Entry* e = live(key);
    return e ? e->hash : std::map<std::string, std::string>{};
}

void MemoryCache::zadd(const std::string& key, const std::string& member, double score) {
    std::lock_guard<std::mutex> lock(mtx_);
    upsert(key).zset[member] = score;
}

std::optional<double> MemoryCache::zscore(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(mtx_);
    Entry* e = live(key);
    if (!e) return std::nullopt;
    auto it = e->zset.find(member);
    if (it == e->zset.end()) return std::nullopt;
    return it->second;
}

void MemoryCache::zrem(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(mtx_);
    Entry* e = live(key);
    if (!e) return;
    e->zset.erase(member);
    if (e->zset.empty() && e->hash.empty() && e->list.empty()) entries_.erase(key);
}

std::vector<std::string> MemoryCache::zrangebyscore_upto(const std::string& key, double max) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::pair<std::string, double>> hits;
    Entry* e = live(key);
    if (!e) return {};
    for (const auto& kv : e->zset) {
        if (kv.second <= max) hits.emplace_back(kv.first, kv.second);
    }
    std::sort(hits.begin(), hits.end(), [](const auto& a, const auto& b){
        if (a.second != b.second) return a.second < b.second;
        return a.first < b.first;
    });
    std::vector<std::string> out;
    for (auto& h : hits) out.push_back(std::move(h.first));
    return out;
}

// Redis-style inclusive range with negative indexes counting from the end.
static bool clamp_range(long long size, long long& start, long long& stop) {
    if (start < 0) start += size;
    if (stop < 0) stop += size;
    if (start < 0) start = 0;
    if (stop >= size) stop = size - 1;
    return size > 0 && start <= stop;
}

std::vector<std::pair<std::string, double>> MemoryCache::zrevrange(const std::string& key, long long start, long long stop) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::pair<std::string, double>> out;
    Entry* e = live(key);
    if (!e) return out;
    std::vector<std::pair<std::string, double>> all(e->zset.begin(), e->zset.end());
    std::sort(all.begin(), all.end(), [](const auto& a, const auto& b){
        if (a.second != b.second) return a.second > b.second;
        return a.first > b.first;
    });
    if (!clamp_range((long long)all.size(), start, stop)) return out;
    out.assign(all.begin() + start, all.begin() + stop + 1);
    return out;
}

void MemoryCache::rpush(const std::string& key, const std::vector<std::string>& values) {
    std::lock_guard<std::mutex> lock(mtx_);
    Entry& e = upsert(key);
    for (const auto& v : values) e.list.push_back(v);
}

std::vector<std::string> MemoryCache::lrange(const std::string& key, long long start, long long stop) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> out;
    Entry* e = live(key);
    if (!e || !clamp_range((long long)e->list.size(), start, stop)) return out;
    out.assign(e->list.begin() + start, e->list.begin() + stop + 1);
    return out;
}

std::optional<std::string> MemoryCache::lpop(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    Entry* e = live(key);
    if (!e || e->list.empty()) return std::nullopt;
    std::string v = e->list.front();
    e->list.pop_front();
    if (e->list.empty() && e->hash.empty() && e->zset.empty()) entries_.erase(key);
    return v;
}

void MemoryCache::ltrim_tail(const std::string& key, long long keep) {
    std::lock_guard<std::mutex> lock(mtx_);
    Entry* e = live(key);
    if (!e) return;
    if (keep <= 0) {
        entries_.erase(key);
        return;
    }
    while ((long long)e->list.size() > keep) e->list.pop_front();
}

void MemoryCache::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.erase(key);
}

void MemoryCache::expire(const std::string& key, long long seconds) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (Entry* e = live(key)) e->expires_at = clock_() + seconds * 1000;
}

long long MemoryCache::ttl(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    Entry* e = live(key);
    if (!e) return -2;
    if (e->expires_at == 0) return -1;
    int64_t left_ms = e->expires_at - clock_();
    return (left_ms + 999) / 1000;
}

void MemoryCache::publish(const std::string& channel, const std::string& message) {
    std::vector<Subscriber> subs;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = subscribers_.find(channel);
        if (it != subscribers_.end()) subs = it->second;
    }
    for (auto& fn : subs) fn(channel, message);
}

void MemoryCache::subscribe(const std::string& channel, Subscriber fn) {
    std::lock_guard<std::mutex> lock(mtx_);
    subscribers_[channel].push_back(std::move(fn));
}

std::size_t MemoryCache::key_count() {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size();
}
