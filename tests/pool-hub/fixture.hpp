#pragma once
#include <stdexcept>
#include <gtest/gtest.h>
#include "../test_clock.hpp"
#include "feedback_repository.hpp"
#include "matcher.hpp"
#include "memory_cache.hpp"

// Cache whose writes fail as if Redis were unreachable. Reads still work.
class UnreachableCache : public MemoryCache {
public:
    using MemoryCache::MemoryCache;
    void hset(const std::string&, const std::map<std::string, std::string>&) override { fail(); }
    void zadd(const std::string&, const std::string&, double) override { fail(); }
    void rpush(const std::string&, const std::vector<std::string>&) override { fail(); }
    void publish(const std::string&, const std::string&) override { fail(); }
    bool ping() override { fail(); return false; }

private:
    static void fail() { throw std::runtime_error("connection refused"); }
};

template <typename Cache>
class PoolHubTestBase : public ::testing::Test {
protected:
    ManualClock clock;
    Database db{":memory:"};
    Cache cache{clock.fn()};
    PoolHubSettings settings;
    PoolHubMetrics metrics;
    MinerRepository miners{db, cache, settings, metrics, clock.fn()};
    MatchRepository matches{db, cache, settings, metrics, clock.fn()};
    FeedbackRepository feedback{db, cache, miners, metrics, clock.fn()};
    Matcher matcher{miners, matches, metrics};

    static MinerRegistrationInput gpu_box(double vram_gb, double price, std::optional<std::string> region = std::nullopt) {
        MinerRegistrationInput in;
        in.addr = "10.0.0.1:9000";
        in.gpu_vram_gb = vram_gb;
        in.gpu_name = "A100";
        in.cpu_cores = 32;
        in.ram_gb = 128;
        in.max_parallel = 2;
        in.base_price = price;
        in.capabilities = {"llama3-8b", "sdxl"};
        in.region = std::move(region);
        return in;
    }
};

using PoolHubTest = PoolHubTestBase<MemoryCache>;
