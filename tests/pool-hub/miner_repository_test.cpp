#include "fixture.hpp"
#include "errors.hpp"
#include "redis_keys.hpp"

class MinerRepositoryTest : public PoolHubTest {};

TEST_F(MinerRepositoryTest, RegisterPersistsAndMirrors) {
    PoolMiner m = miners.register_miner("miner-1", "secret", gpu_box(40, 2.0, std::string("eu-west")));
    EXPECT_EQ(m.api_key_hash, sha256_hex("secret"));
    EXPECT_DOUBLE_EQ(m.trust_score, 0.5);
    EXPECT_EQ(*m.region, "eu-west");

    auto status = miners.get_status("miner-1");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->queue_len, 0);
    EXPECT_FALSE(status->busy);

    auto hash = cache.hgetall(redis_keys::miner_hash("miner-1"));
    EXPECT_EQ(hash.at("addr"), "10.0.0.1:9000");
    EXPECT_EQ(hash.at("region"), "eu-west");

    double expected = miners.score(m, status);
    EXPECT_DOUBLE_EQ(*cache.zscore("rankings:eu-west", "miner-1"), expected);
    EXPECT_DOUBLE_EQ(*cache.zscore(redis_keys::global_rankings(), "miner-1"), expected);
    EXPECT_EQ(metrics.cache_mirror_failures.load(), 0u);
}

TEST_F(MinerRepositoryTest, RankingEntryLivesForTheCacheWindow) {
    miners.register_miner("miner-1", "secret", gpu_box(40, 2.0));
    long long window = settings.session_ttl_seconds + settings.heartbeat_grace_seconds;

    long long ttl = cache.ttl(redis_keys::global_rankings());
    EXPECT_GT(ttl, 0);
    EXPECT_LE(ttl, window);
    EXPECT_LE(cache.ttl(redis_keys::miner_hash("miner-1")), window);

    clock.advance_seconds(window);
    EXPECT_FALSE(cache.zscore(redis_keys::global_rankings(), "miner-1").has_value());
    EXPECT_TRUE(cache.hgetall(redis_keys::miner_hash("miner-1")).empty());
}

TEST_F(MinerRepositoryTest, SilentMinerLeavesSharedRankingsWhileOthersReport) {
    miners.register_miner("stale", "k", gpu_box(40, 2.0, std::string("eu")));
    miners.register_miner("live", "k", gpu_box(40, 2.0, std::string("eu")));

    for (int i = 0; i < 4; ++i) {
        clock.advance_seconds(100);
        ASSERT_TRUE(miners.touch_heartbeat("live"));
    }

    EXPECT_TRUE(cache.hgetall(redis_keys::miner_hash("stale")).empty());
    EXPECT_FALSE(cache.zscore("rankings:eu", "stale").has_value());
    EXPECT_FALSE(cache.zscore(redis_keys::global_rankings(), "stale").has_value());
    EXPECT_TRUE(cache.zscore("rankings:eu", "live").has_value());
    EXPECT_TRUE(cache.zscore(redis_keys::global_rankings(), "live").has_value());
}

TEST_F(MinerRepositoryTest, RegionChangeLeavesOldRegionRanking) {
    miners.register_miner("m", "k", gpu_box(40, 2.0, std::string("eu")));
    ASSERT_TRUE(cache.zscore("rankings:eu", "m").has_value());

    miners.register_miner("m", "k", gpu_box(40, 2.0, std::string("us")));
    EXPECT_FALSE(cache.zscore("rankings:eu", "m").has_value());
    EXPECT_TRUE(cache.zscore("rankings:us", "m").has_value());
    EXPECT_TRUE(cache.zscore(redis_keys::global_rankings(), "m").has_value());
    EXPECT_EQ(metrics.cache_mirror_failures.load(), 0u);
}

TEST_F(MinerRepositoryTest, HeartbeatRefreshesTheWindow) {
    miners.register_miner("miner-1", "secret", gpu_box(40, 2.0));
    clock.advance_seconds(100);
    ASSERT_TRUE(miners.touch_heartbeat("miner-1"));
    clock.advance_seconds(150);
    EXPECT_TRUE(cache.zscore(redis_keys::global_rankings(), "miner-1").has_value());
    EXPECT_EQ(miners.count_active(), 1);

    EXPECT_FALSE(miners.touch_heartbeat("ghost"));
}

TEST_F(MinerRepositoryTest, StatusUpdatePatchesProvidedFields) {
    miners.register_miner("miner-1", "secret", gpu_box(40, 2.0));
    StatusUpdate u;
    u.queue_len = 2;
    u.avg_latency_ms = 350;
    miners.update_status("miner-1", u);

    StatusUpdate only_temp;
    only_temp.temp_c = 71;
    miners.update_status("miner-1", only_temp);

    auto s = miners.get_status("miner-1");
    EXPECT_EQ(s->queue_len, 2);
    EXPECT_EQ(*s->avg_latency_ms, 350);
    EXPECT_EQ(*s->temp_c, 71);
    EXPECT_FALSE(s->mem_free_gb.has_value());
    EXPECT_EQ(cache.hgetall(redis_keys::miner_hash("miner-1")).at("queue_len"), "2");

    EXPECT_THROW(miners.update_status("ghost", u), NotFoundError);
}

TEST_F(MinerRepositoryTest, ActiveListDropsSilentMiners) {
    miners.register_miner("old", "k", gpu_box(40, 2.0));
    clock.advance_seconds(200);
    miners.register_miner("new", "k", gpu_box(40, 2.0));

    auto active = miners.list_active_miners();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].miner.miner_id, "new");
    EXPECT_TRUE(active[0].status.has_value());
    EXPECT_EQ(miners.iter_miners().size(), 2u);
}

TEST_F(MinerRepositoryTest, TrustMovesTowardOutcomes) {
    miners.register_miner("miner-1", "secret", gpu_box(40, 2.0));
    EXPECT_NEAR(miners.update_trust("miner-1", true), 0.55, 1e-9);
    EXPECT_NEAR(miners.update_trust("miner-1", false), 0.495, 1e-9);
    EXPECT_NEAR(miners.get_miner("miner-1")->trust_score, 0.495, 1e-9);

    double score = miners.score(*miners.get_miner("miner-1"), miners.get_status("miner-1"));
    EXPECT_DOUBLE_EQ(*cache.zscore(redis_keys::global_rankings(), "miner-1"), score);
    EXPECT_THROW(miners.update_trust("ghost", true), NotFoundError);
}

TEST_F(MinerRepositoryTest, ReRegisterKeepsReputation) {
    miners.register_miner("miner-1", "secret", gpu_box(40, 2.0));
    miners.update_trust("miner-1", true);
    PoolMiner again = miners.register_miner("miner-1", "secret", gpu_box(80, 3.0));
    EXPECT_DOUBLE_EQ(again.gpu_vram_gb, 80);
    EXPECT_NEAR(again.trust_score, 0.55, 1e-9);
}

TEST_F(MinerRepositoryTest, RejectsInvalidRegistration) {
    MinerRegistrationInput in = gpu_box(40, 2.0);
    in.max_parallel = 0;
    EXPECT_THROW(miners.register_miner("miner-1", "k", in), ValidationError);
    in = gpu_box(40, 2.0);
    in.trust_score = 1.5;
    EXPECT_THROW(miners.register_miner("miner-1", "k", in), ValidationError);
    EXPECT_FALSE(miners.get_miner("miner-1").has_value());
}

class UnreachableCacheTest : public PoolHubTestBase<UnreachableCache> {};

TEST_F(UnreachableCacheTest, DatabaseWriteSurvivesMirrorFailure) {
    PoolMiner m = miners.register_miner("miner-1", "secret", gpu_box(40, 2.0));
    EXPECT_EQ(m.miner_id, "miner-1");
    EXPECT_TRUE(miners.get_miner("miner-1").has_value());
    EXPECT_EQ(metrics.cache_mirror_failures.load(), 1u);

    StatusUpdate u;
    u.queue_len = 1;
    EXPECT_NO_THROW(miners.update_status("miner-1", u));
    EXPECT_EQ(miners.get_status("miner-1")->queue_len, 1);
    EXPECT_EQ(metrics.cache_mirror_failures.load(), 2u);
}
