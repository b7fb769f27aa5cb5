#include "fixture.hpp"
#include "hub_routes.hpp"

using json = nlohmann::json;

class HubRoutesTest : public PoolHubTest {
protected:
    PoolHubContext ctx{db, cache, miners, matches, feedback, matcher, metrics};

    HttpResponse call(const std::string& method, const std::string& path, const json& body = nullptr,
                      std::map<std::string, std::string> headers = {}) {
        HttpRequest req;
        req.method = method;
        req.path = path;
        if (!body.is_null()) req.body = body.dump();
        req.headers = std::move(headers);
        return handle_pool_hub_request(ctx, req);
    }

    HttpResponse register_miner(const std::string& id, double price) {
        json body = {{"miner_id", id}, {"addr", id + ".local:9000"}, {"gpu_vram_gb", 40}, {"ram_gb", 64},
                     {"max_parallel", 2}, {"base_price", price}, {"capabilities", {"sdxl"}}};
        return call("POST", "/miners/register", body, {{"x-api-key", "secret"}});
    }
};

TEST_F(HubRoutesTest, RegisterAndInspectMiner) {
    auto reg = register_miner("miner-1", 2.0);
    ASSERT_EQ(reg.status, 200);
    EXPECT_EQ(json::parse(reg.body)["miner_id"], "miner-1");

    auto status = call("POST", "/miners/miner-1/status", {{"queue_len", 1}, {"avg_latency_ms", 200}});
    ASSERT_EQ(status.status, 200);
    EXPECT_EQ(json::parse(status.body)["queue_len"], 1);

    auto read = call("GET", "/miners/miner-1");
    ASSERT_EQ(read.status, 200);
    json m = json::parse(read.body);
    EXPECT_EQ(m["status"]["avg_latency_ms"], 200);
    EXPECT_TRUE(m["score"].is_number());
    EXPECT_FALSE(m.contains("api_key_hash"));

    EXPECT_EQ(call("POST", "/miners/miner-1/heartbeat").status, 200);
    EXPECT_EQ(call("POST", "/miners/ghost/heartbeat").status, 404);
    EXPECT_EQ(call("GET", "/miners/ghost").status, 404);
}

TEST_F(HubRoutesTest, RegistrationNeedsKeyAndAddress) {
    json body = {{"miner_id", "miner-1"}, {"addr", "x:1"}};
    EXPECT_EQ(call("POST", "/miners/register", body).status, 422);
    body.erase("addr");
    EXPECT_EQ(call("POST", "/miners/register", body, {{"x-api-key", "k"}}).status, 422);
    json typed = {{"miner_id", "miner-1"}, {"addr", "x:1"}, {"gpu_vram_gb", "lots"}};
    EXPECT_EQ(call("POST", "/miners/register", typed, {{"x-api-key", "k"}}).status, 422);
}

TEST_F(HubRoutesTest, MatchAndReadBackResults) {
    register_miner("a", 1.0);
    register_miner("b", 2.0);
    register_miner("c", 4.0);

    auto res = call("POST", "/match", {{"job_id", "job-1"}, {"requirements", {{"min_vram_gb", 16}}}, {"top_k", 2}});
    ASSERT_EQ(res.status, 200);
    json body = json::parse(res.body);
    EXPECT_EQ(body["job_id"], "job-1");
    ASSERT_EQ(body["candidates"].size(), 2u);
    EXPECT_EQ(body["candidates"][0]["miner_id"], "a");
    EXPECT_EQ(body["candidates"][1]["miner_id"], "b");
    EXPECT_TRUE(body["candidates"][0]["explain"].get<std::string>().rfind("score=", 0) == 0);

    auto stored = call("GET", "/match/job-1/results");
    ASSERT_EQ(stored.status, 200);
    EXPECT_EQ(json::parse(stored.body)["results"].size(), 2u);

    EXPECT_EQ(call("POST", "/match", {{"job_id", "job-2"}, {"top_k", 51}}).status, 422);
    EXPECT_EQ(call("POST", "/match", {{"top_k", 1}}).status, 422);
}

TEST_F(HubRoutesTest, FeedbackRoundTrip) {
    register_miner("miner-1", 2.0);
    auto created = call("POST", "/feedback", {{"job_id", "job-1"}, {"miner_id", "miner-1"}, {"outcome", "success"},
                                              {"latency_ms", 900}});
    ASSERT_EQ(created.status, 201);
    EXPECT_EQ(call("POST", "/feedback", {{"job_id", "job-1"}, {"miner_id", "ghost"}, {"outcome", "success"}}).status,
              404);

    auto listed = call("GET", "/miners/miner-1/feedback");
    ASSERT_EQ(listed.status, 200);
    json body = json::parse(listed.body);
    ASSERT_EQ(body["feedback"].size(), 1u);
    EXPECT_EQ(body["feedback"][0]["latency_ms"], 900);

    HttpRequest bad_limit;
    bad_limit.method = "GET";
    bad_limit.path = "/miners/miner-1/feedback";
    bad_limit.query = {{"limit", "abc"}};
    EXPECT_EQ(handle_pool_hub_request(ctx, bad_limit).status, 422);
}

TEST_F(HubRoutesTest, HealthAndStats) {
    register_miner("miner-1", 2.0);
    auto health = call("GET", "/health");
    ASSERT_EQ(health.status, 200);
    json h = json::parse(health.body);
    EXPECT_EQ(h["status"], "ok");
    EXPECT_EQ(h["db"], true);
    EXPECT_EQ(h["redis"], true);
    EXPECT_EQ(h["miners_online"], 1);

    call("POST", "/match", {{"job_id", "job-1"}, {"top_k", 1}});
    json stats = json::parse(call("GET", "/stats").body);
    EXPECT_EQ(stats["match_requests_total"], 1);
    EXPECT_EQ(stats["match_candidates_returned"], 1);
    EXPECT_EQ(stats["cache_mirror_failures_total"], 0);

    EXPECT_EQ(call("DELETE", "/miners/miner-1").status, 404);
}
