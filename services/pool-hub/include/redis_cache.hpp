#pragma once
#include <memory>
#include <string>
#include "cache.hpp"

namespace sw { namespace redis { class Redis; } }

// CacheBackend over a redis++ connection pool, e.g. "tcp://127.0.0.1:6379/4".
class RedisCache : public CacheBackend {
public:
    explicit RedisCache(const std::string& url);
    ~RedisCache() override;

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
    bool ping() override;

private:
    std::unique_ptr<sw::redis::Redis> redis_;
};
