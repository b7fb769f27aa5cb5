#include "../include/redis_cache.hpp"
#include "errors.hpp"
#include <sw/redis++/redis++.h>
#include <chrono>
#include <iostream>
#include <iterator>

RedisCache::RedisCache(const std::string& url) {
    try {
        redis_ = std::make_unique<sw::redis::Redis>(url);
    } catch (const sw::redis::Error& e) {
        throw InfrastructureError(std::string("redis connect failed: ") + e.what());
    }
}

RedisCache::~RedisCache() = default;

void RedisCache::hset(const std::string& key, const std::map<std::string, std::string>& fields) {
    if (fields.empty()) return;
    redis_->hset(key, fields.begin(), fields.end());
}

std::map<std::string, std::string> RedisCache::hgetall(const std::string& key) {
    std::map<std::string, std::string> out;
    redis_->hgetall(key, std::inserter(out, out.end()));
    return out;
}

void RedisCache::zadd(const std::string& key, const std::string& member, double score) {
    redis_->zadd(key, member, score);
}

std::optional<double> RedisCache::zscore(const std::string& key, const std::string& member) {
    auto r = redis_->zscore(key, member);
    if (!r) return std::nullopt;
    return *r;
}

void RedisCache::zrem(const std::string& key, const std::string& member) {
    redis_->zrem(key, member);
}

std::vector<std::string> RedisCache::zrangebyscore_upto(const std::string& key, double max) {
    std::vector<std::string> out;
    redis_->zrangebyscore(key, sw::redis::RightBoundedInterval<double>(max, sw::redis::BoundType::CLOSED),
                          std::back_inserter(out));
    return out;
}

std::vector<std::pair<std::string, double>> RedisCache::zrevrange(const std::string& key, long long start, long long stop) {
    std::vector<std::pair<std::string, double>> out;
    redis_->zrevrange(key, start, stop, std::back_inserter(out));
    return out;
}

void RedisCache::rpush(const std::string& key, const std::vector<std::string>& values) {
    if (values.empty()) return;
    redis_->rpush(key, values.begin(), values.end());
}

std::vector<std::string> RedisCache::lrange(const std::string& key, long long start, long long stop) {
    std::vector<std::string> out;
    redis_->lrange(key, start, stop, std::back_inserter(out));
    return out;
}

std::optional<std::string> RedisCache::lpop(const std::string& key) {
    auto r = redis_->lpop(key);
    if (!r) return std::nullopt;
    return *r;
}

void RedisCache::ltrim_tail(const std::string& key, long long keep) {
    if (keep <= 0) {
        redis_->del(key);
        return;
    }
    redis_->ltrim(key, -keep, -1);
}

void RedisCache::del(const std::string& key) {
    redis_->del(key);
}

void RedisCache::expire(const std::string& key, long long seconds) {
    redis_->expire(key, std::chrono::seconds(seconds));
}

long long RedisCache::ttl(const std::string& key) {
    return redis_->ttl(key);
}

void RedisCache::publish(const std::string& channel, const std::string& message) {
    redis_->publish(channel, message);
}

bool RedisCache::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        std::cerr << "[pool-hub] redis ping failed: " << e.what() << std::endl;
        return false;
    }
}
