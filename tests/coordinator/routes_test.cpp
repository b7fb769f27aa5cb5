#include "fixture.hpp"
#include "routes.hpp"

using json = nlohmann::json;

class CoordinatorRoutesTest : public CoordinatorTest {
protected:
    CoordinatorContext ctx{db, jobs, miners, dispatcher, nullptr, 900};

    HttpResponse call(const std::string& method, const std::string& path, const json& body = nullptr,
                      std::map<std::string, std::string> headers = {}) {
        HttpRequest req;
        req.method = method;
        req.path = path;
        if (!body.is_null()) req.body = body.dump();
        req.headers = std::move(headers);
        return handle_coordinator_request(ctx, req);
    }

    static std::map<std::string, std::string> client(const std::string& id = "client-1") {
        return {{"x-client-id", id}};
    }
    static std::map<std::string, std::string> miner(const std::string& id = "miner-1") {
        return {{"x-miner-id", id}};
    }
};

TEST_F(CoordinatorRoutesTest, SubmitAndReadJob) {
    auto created = call("POST", "/jobs", {{"payload", {{"prompt", "hi"}}}, {"ttl_seconds", 120}}, client());
    ASSERT_EQ(created.status, 201);
    json job = json::parse(created.body);
    EXPECT_EQ(job["state"], "QUEUED");
    EXPECT_TRUE(job.contains("requested_at"));
    EXPECT_TRUE(job.contains("expires_at"));

    std::string id = job["job_id"].get<std::string>();
    auto read = call("GET", "/jobs/" + id, nullptr, client());
    EXPECT_EQ(read.status, 200);
    EXPECT_EQ(call("GET", "/jobs/" + id, nullptr, client("client-2")).status, 404);
    EXPECT_EQ(jobs.get_job(id).ttl_seconds, 120);
}

TEST_F(CoordinatorRoutesTest, JobReadRequiresClientId) {
    auto created = call("POST", "/jobs", {{"payload", {{"prompt", "secret"}}}}, client());
    std::string id = json::parse(created.body)["job_id"].get<std::string>();

    auto anonymous = call("GET", "/jobs/" + id);
    EXPECT_EQ(anonymous.status, 422);
    EXPECT_EQ(anonymous.body.find("secret"), std::string::npos);
    EXPECT_EQ(anonymous.body.find(id), std::string::npos);
    EXPECT_EQ(call("GET", "/jobs/" + id + "/result").status, 422);
}

TEST_F(CoordinatorRoutesTest, OversizedIntegersAreRejected) {
    EXPECT_EQ(call("POST", "/jobs", {{"payload", json::object()}, {"ttl_seconds", 3000000000LL}}, client()).status, 422);
    EXPECT_EQ(call("POST", "/jobs", {{"payload", json::object()}, {"ttl_seconds", -3000000000LL}}, client()).status, 422);
    EXPECT_EQ(call("POST", "/jobs", {{"payload", json::object()},
                                     {"constraints", {{"min_vram_gb", 5000000000LL}}}}, client()).status, 422);
    EXPECT_EQ(call("POST", "/jobs", {{"payload", json::object()},
                                     {"constraints", {{"min_vram_gb", 18446744073709551615ULL}}}}, client()).status, 422);
    EXPECT_TRUE(jobs.count_by_state().empty());

    auto ok = call("POST", "/jobs", {{"payload", json::object()}, {"ttl_seconds", 2147483647}}, client());
    EXPECT_EQ(ok.status, 201);
}

TEST_F(CoordinatorRoutesTest, MissingTtlUsesDefault) {
    auto created = call("POST", "/jobs", {{"payload", json::object()}}, client());
    ASSERT_EQ(created.status, 201);
    std::string id = json::parse(created.body)["job_id"].get<std::string>();
    EXPECT_EQ(jobs.get_job(id).ttl_seconds, 900);
}

TEST_F(CoordinatorRoutesTest, RejectsBadSubmissions) {
    EXPECT_EQ(call("POST", "/jobs", {{"payload", json::object()}}).status, 422);
    EXPECT_EQ(call("POST", "/jobs", {{"payload", "text"}}, client()).status, 422);
    EXPECT_EQ(call("POST", "/jobs", {{"payload", json::object()}, {"constraints", {{"colour", "red"}}}},
                   client()).status, 422);
    EXPECT_EQ(call("POST", "/jobs", {{"payload", json::object()}, {"ttl_seconds", "soon"}}, client()).status, 422);

    HttpRequest req;
    req.method = "POST";
    req.path = "/jobs";
    req.body = "{not json";
    req.headers = client();
    HttpResponse bad = handle_coordinator_request(ctx, req);
    EXPECT_EQ(bad.status, 400);
    json err = json::parse(bad.body);
    EXPECT_EQ(err["error"]["code"], "BAD_REQUEST");
    EXPECT_EQ(err["error"]["status"], 400);
}

TEST_F(CoordinatorRoutesTest, MinerWorkflowOverHttp) {
    json caps = {{"gpus", {{{"name", "A100"}, {"memory_mb", 40960}}}}, {"cuda", "12.2"}, {"models", json::array()}};
    auto reg = call("POST", "/miners/register", {{"capabilities", caps}, {"concurrency", 1}}, miner());
    ASSERT_EQ(reg.status, 200);
    EXPECT_FALSE(json::parse(reg.body)["session_token"].get<std::string>().empty());

    EXPECT_EQ(call("POST", "/miners/poll", {{"max_wait_seconds", 0}}, miner()).status, 204);

    auto created = call("POST", "/jobs", {{"payload", {{"prompt", "hi"}}},
                                          {"constraints", {{"gpu", "A100"}, {"min_vram_gb", 40}}}}, client());
    std::string id = json::parse(created.body)["job_id"].get<std::string>();

    auto polled = call("POST", "/miners/poll", json::object(), miner());
    ASSERT_EQ(polled.status, 200);
    json assigned = json::parse(polled.body);
    EXPECT_EQ(assigned["job_id"], id);
    EXPECT_EQ(assigned["payload"]["prompt"], "hi");
    EXPECT_EQ(assigned["constraints"]["gpu"], "A100");

    EXPECT_EQ(call("GET", "/jobs/" + id + "/result", nullptr, client()).status, 409);

    auto done = call("POST", "/miners/" + id + "/result",
                     {{"result", {{"text", "hello"}}}, {"metrics", {{"duration_ms", 42}}}}, miner());
    EXPECT_EQ(done.status, 200);

    auto result = call("GET", "/jobs/" + id + "/result", nullptr, client());
    ASSERT_EQ(result.status, 200);
    EXPECT_EQ(json::parse(result.body)["result"]["text"], "hello");

    EXPECT_EQ(call("POST", "/jobs/" + id + "/cancel", json::object(), client()).status, 409);
    EXPECT_EQ(call("POST", "/miners/" + id + "/fail", {{"error_code", "X"}}, miner()).status, 409);
}

TEST_F(CoordinatorRoutesTest, HeartbeatRequiresRegistration) {
    EXPECT_EQ(call("POST", "/miners/heartbeat", {{"inflight", 0}}, miner("ghost")).status, 404);
    EXPECT_EQ(call("POST", "/miners/poll", json::object(), miner("ghost")).status, 404);
    EXPECT_EQ(call("POST", "/miners/poll", json::object()).status, 422);
}

TEST_F(CoordinatorRoutesTest, HealthAndStats) {
    register_miner("miner-1", a100_caps());
    jobs.create_job("client-1", payload(), Constraints{}, 60);

    auto health = call("GET", "/health");
    ASSERT_EQ(health.status, 200);
    json h = json::parse(health.body);
    EXPECT_EQ(h["status"], "ok");
    EXPECT_EQ(h["miners_online"], 1);

    auto stats = call("GET", "/stats");
    ASSERT_EQ(stats.status, 200);
    json s = json::parse(stats.body);
    EXPECT_EQ(s["jobs"]["QUEUED"], 1);
    EXPECT_EQ(s["miners_online"], 1);

    auto listed = call("GET", "/miners");
    EXPECT_EQ(json::parse(listed.body)["miners"].size(), 1u);
    EXPECT_EQ(call("GET", "/nowhere").status, 404);
}
