#include "fixture.hpp"
#include "errors.hpp"
#include "redis_keys.hpp"

using json = nlohmann::json;

class MatcherTest : public PoolHubTest {
protected:
    // Default weights: price 1.0 -> 0.825 + 0.1 = 0.925 vs 0.825 at price 2.0.
    void register_three() {
        miners.register_miner("cheap", "k", gpu_box(40, 1.0));
        miners.register_miner("mid", "k", gpu_box(40, 2.0));
        miners.register_miner("pricey", "k", gpu_box(40, 4.0));
    }
};

TEST_F(MatcherTest, ReturnsTopCandidatesBestFirst) {
    register_three();
    MatchResponse res = matcher.match("job-1", json::object(), json::object(), 2);
    EXPECT_EQ(res.job_id, "job-1");
    ASSERT_EQ(res.candidates.size(), 2u);
    EXPECT_EQ(res.candidates[0].miner_id, "cheap");
    EXPECT_EQ(res.candidates[1].miner_id, "mid");
    EXPECT_GT(res.candidates[0].score, res.candidates[1].score);
    EXPECT_EQ(res.candidates[0].addr, "10.0.0.1:9000");
    EXPECT_EQ(res.candidates[0].proto, "http");
    EXPECT_DOUBLE_EQ(res.candidates[0].price, 1.0);
    EXPECT_EQ(metrics.match_requests.load(), 1u);
    EXPECT_EQ(metrics.candidates_returned.load(), 2u);
}

TEST_F(MatcherTest, HardFiltersExcludeMiners) {
    register_three();
    MinerRegistrationInput big = gpu_box(80, 4.0);
    big.capabilities = {"llama3-70b"};
    miners.register_miner("big", "k", big);

    MatchResponse res = matcher.match("job-1", {{"min_vram_gb", 48}}, json::object(), 5);
    ASSERT_EQ(res.candidates.size(), 1u);
    EXPECT_EQ(res.candidates[0].miner_id, "big");

    res = matcher.match("job-2", {{"capabilities", {"sdxl"}}}, json::object(), 5);
    EXPECT_EQ(res.candidates.size(), 3u);
    for (const auto& c : res.candidates) EXPECT_NE(c.miner_id, "big");
}

TEST_F(MatcherTest, RegionHintSkipsOtherRegions) {
    miners.register_miner("eu", "k", gpu_box(40, 2.0, std::string("eu-west")));
    miners.register_miner("us", "k", gpu_box(40, 1.0, std::string("us-east")));
    miners.register_miner("anywhere", "k", gpu_box(40, 3.0));

    MatchResponse res = matcher.match("job-1", json::object(), {{"region", "eu-west"}}, 5);
    ASSERT_EQ(res.candidates.size(), 2u);
    EXPECT_EQ(res.candidates[0].miner_id, "eu");
    EXPECT_EQ(res.candidates[1].miner_id, "anywhere");
}

TEST_F(MatcherTest, NoEligibleMinersIsAnEmptyResult) {
    MatchResponse res = matcher.match("job-1", json::object(), json::object(), 3);
    EXPECT_TRUE(res.candidates.empty());
    EXPECT_EQ(metrics.match_failures.load(), 0u);
    EXPECT_EQ(matches.list_recent_requests().size(), 1u);
}

TEST_F(MatcherTest, ValidatesArguments) {
    EXPECT_THROW(matcher.match("job-1", json::object(), json::object(), 0), ValidationError);
    EXPECT_THROW(matcher.match("job-1", json::object(), json::object(), kMaxTopK + 1), ValidationError);
    EXPECT_THROW(matcher.match("", json::object(), json::object(), 1), ValidationError);
    EXPECT_THROW(matcher.match("job-1", {{"min_vram_gb", "big"}}, json::object(), 1), ValidationError);
    EXPECT_TRUE(matches.list_recent_requests().empty());
}

TEST_F(MatcherTest, ResultsArePersistedMirroredAndPublished) {
    register_three();
    std::vector<std::string> events;
    cache.subscribe(redis_keys::match_results_channel("job-1"),
                    [&events](const std::string&, const std::string& msg){ events.push_back(msg); });

    matcher.match("job-1", json::object(), {{"region", "eu-west"}}, 2);

    auto stored = matches.list_results_for_job("job-1");
    ASSERT_EQ(stored.size(), 2u);
    EXPECT_EQ(stored[0].miner_id, "cheap");
    EXPECT_EQ(stored[1].miner_id, "mid");

    std::string key = redis_keys::match_results("job-1");
    auto mirrored = cache.lrange(key, 0, -1);
    ASSERT_EQ(mirrored.size(), 2u);
    EXPECT_EQ(json::parse(mirrored[0])["miner_id"], "cheap");
    EXPECT_GT(cache.ttl(key), 0);
    EXPECT_LE(cache.ttl(key), 300);
    EXPECT_EQ(events.size(), 2u);

    auto queued = cache.lrange(redis_keys::match_requests(), 0, -1);
    ASSERT_EQ(queued.size(), 1u);
    json request = json::parse(queued[0]);
    EXPECT_EQ(request["job_id"], "job-1");
    EXPECT_EQ(request["hints"]["region"], "eu-west");
    EXPECT_EQ(request["top_k"], 2);

    clock.advance_seconds(300);
    EXPECT_TRUE(cache.lrange(key, 0, -1).empty());
    EXPECT_EQ(matches.list_results_for_job("job-1").size(), 2u);
}

TEST_F(MatcherTest, RematchReplacesMirroredList) {
    register_three();
    matcher.match("job-1", json::object(), json::object(), 3);
    matcher.match("job-1", json::object(), json::object(), 1);
    EXPECT_EQ(cache.lrange(redis_keys::match_results("job-1"), 0, -1).size(), 1u);

    auto latest = matches.list_results_for_job("job-1", 1);
    ASSERT_EQ(latest.size(), 1u);
    EXPECT_EQ(latest[0].miner_id, "cheap");
    auto requests = matches.list_recent_requests(10);
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].top_k, 1);
    EXPECT_TRUE(matches.get_request(requests[1].id).has_value());
    EXPECT_FALSE(matches.get_request("missing").has_value());
}

TEST_F(MatcherTest, CacheFootprintStaysBounded) {
    register_three();
    settings.match_request_backlog = 3;
    for (int i = 1; i <= 5; ++i) {
        matcher.match("job-" + std::to_string(i), json::object(), json::object(), 1);
    }
    auto queued = cache.lrange(redis_keys::match_requests(), 0, -1);
    ASSERT_EQ(queued.size(), 3u);
    EXPECT_EQ(json::parse(queued.front())["job_id"], "job-3");
    EXPECT_EQ(json::parse(queued.back())["job_id"], "job-5");

    // Per-job result lists and miner mirrors lapse; only the request queue remains.
    clock.advance_seconds(3600);
    matcher.match("job-6", json::object(), json::object(), 1);
    EXPECT_EQ(cache.key_count(), 1u);
    EXPECT_EQ(matches.list_recent_requests(10).size(), 6u);
}

class UnreachableMatchTest : public PoolHubTestBase<UnreachableCache> {};

TEST_F(UnreachableMatchTest, MatchSucceedsWithoutTheCache) {
    miners.register_miner("a", "k", gpu_box(40, 1.0));
    miners.register_miner("b", "k", gpu_box(40, 2.0));
    uint64_t before = metrics.cache_mirror_failures.load();

    MatchResponse res = matcher.match("job-1", json::object(), json::object(), 2);
    EXPECT_EQ(res.candidates.size(), 2u);
    EXPECT_EQ(matches.list_results_for_job("job-1").size(), 2u);
    // request queue and results list
    EXPECT_EQ(metrics.cache_mirror_failures.load(), before + 2);
    EXPECT_EQ(metrics.publish_failures.load(), 2u);
    EXPECT_EQ(metrics.match_failures.load(), 0u);
}
