#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// The subset of Redis the pool hub mirrors into. Implementations throw on
// transport failure; callers treat every call as best effort.
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    virtual void hset(const std::string& key, const std::map<std::string, std::string>& fields) = 0;
    virtual std::map<std::string, std::string> hgetall(const std::string& key) = 0;

    virtual void zadd(const std::string& key, const std::string& member, double score) = 0;
    virtual std::optional<double> zscore(const std::string& key, const std::string& member) = 0;
    virtual void zrem(const std::string& key, const std::string& member) = 0;
    // Members scored at most max, lowest first, as in ZRANGEBYSCORE -inf max.
    virtual std::vector<std::string> zrangebyscore_upto(const std::string& key, double max) = 0;
    // Highest score first, inclusive indexes as in ZREVRANGE.
    virtual std::vector<std::pair<std::string, double>> zrevrange(const std::string& key, long long start, long long stop) = 0;

    virtual void rpush(const std::string& key, const std::vector<std::string>& values) = 0;
    virtual std::vector<std::string> lrange(const std::string& key, long long start, long long stop) = 0;
    virtual std::optional<std::string> lpop(const std::string& key) = 0;
    // Keeps only the newest `keep` elements of the list.
    virtual void ltrim_tail(const std::string& key, long long keep) = 0;

    virtual void del(const std::string& key) = 0;
    virtual void expire(const std::string& key, long long seconds) = 0;
    // Seconds left; -1 without expiry, -2 when the key is absent.
    virtual long long ttl(const std::string& key) = 0;

    virtual void publish(const std::string& channel, const std::string& message) = 0;
    virtual bool ping() = 0;
};
