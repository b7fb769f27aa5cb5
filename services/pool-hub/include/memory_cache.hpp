#pragma once
#include <deque>
#include <functional>
#include <mutex>
#include <unordered_map>
#include "cache.hpp"
#include "util.hpp"

// In-process CacheBackend for single-node deployments without Redis.
// Honors expiry against the supplied clock; expired keys are swept on writes.
// Publish delivers only to subscribers registered at that moment.
class MemoryCache : public CacheBackend {
public:
    using Subscriber = std::function<void(const std::string& channel, const std::string& message)>;

    explicit MemoryCache(Clock clock = now_ms);

    void hset(const std::string& key, const std::map<std::string, std::string>& fields) override;
    std::map<std::string, std::string> hgetall(const std::string& key) override;
    void zadd(const std::string& key, const std::string& member, double score) override;
    std::optional<double> zscore(const std::string& key, const std::string& member) override;
    void zrem(const std::string& key, const std::string& member) override;
    std::vector<std::string> zrangebyscore_upto(const std::string& key, double max) override;
    std::vector<std::pair<std::string, double>> zrevrange(const std::string& key, long long start, long long stop) override;
    void rpush(const std::string& key, const std::vector<std::string>& values) override;
    std::vector<std::string> lrange(const std::string& key, long long start, long long stop) override;
    std::optional<std::string> lpop(const std::string& key) override;
    void ltrim_tail(const std::string& key, long long keep) override;
    void del(const std::string& key) override;
    void expire(const std::string& key, long long seconds) override;
    long long ttl(const std::string& key) override;
    void publish(const std::string& channel, const std::string& message) override;
    bool ping() override { return true; }

    void subscribe(const std::string& channel, Subscriber fn);

    // Keys held, including expired ones not swept yet.
    std::size_t key_count();

private:
    struct Entry {
        std::map<std::string, std::string> hash;
        std::map<std::string, double> zset;
        std::deque<std::string> list;
        int64_t expires_at{0}; // 0: no expiry
    };

    Entry* live(const std::string& key);
    Entry& upsert(const std::string& key);
    void sweep_expired(int64_t now);

    Clock clock_;
    std::mutex mtx_;
    std::unordered_map<std::string, Entry> entries_;
    int64_t last_sweep_{0};
    std::unordered_map<std::string, std::vector<Subscriber>> subscribers_;
};
