#include "fixture.hpp"
#include "errors.hpp"
#include "redis_keys.hpp"

using json = nlohmann::json;

class FeedbackRepositoryTest : public PoolHubTest {
protected:
    void SetUp() override { miners.register_miner("miner-1", "k", gpu_box(40, 2.0)); }

    FeedbackInput outcome(const std::string& job_id, const std::string& result) {
        FeedbackInput in;
        in.job_id = job_id;
        in.miner_id = "miner-1";
        in.outcome = result;
        return in;
    }
};

TEST_F(FeedbackRepositoryTest, RecordsAndPublishesOutcome) {
    std::vector<std::string> events;
    cache.subscribe(redis_keys::feedback_channel(),
                    [&events](const std::string&, const std::string& msg){ events.push_back(msg); });
    FeedbackInput in = outcome("job-1", "success");
    in.latency_ms = 840;
    in.tokens_spent = 512;
    Feedback f = feedback.add_feedback(in);
    EXPECT_FALSE(f.id.empty());
    EXPECT_EQ(*f.latency_ms, 840);

    ASSERT_EQ(events.size(), 1u);
    json event = json::parse(events[0]);
    EXPECT_EQ(event["job_id"], "job-1");
    EXPECT_EQ(event["outcome"], "success");
    EXPECT_EQ(metrics.feedback_events.load(), 1u);
}

TEST_F(FeedbackRepositoryTest, OutcomesAdjustTrust) {
    feedback.add_feedback(outcome("job-1", "success"));
    EXPECT_NEAR(miners.get_miner("miner-1")->trust_score, 0.55, 1e-9);
    FeedbackInput failed = outcome("job-2", "failure");
    failed.fail_code = "OOM";
    feedback.add_feedback(failed);
    EXPECT_NEAR(miners.get_miner("miner-1")->trust_score, 0.495, 1e-9);
}

TEST_F(FeedbackRepositoryTest, ListsByMinerAndJobNewestFirst) {
    feedback.add_feedback(outcome("job-1", "success"));
    clock.advance_seconds(1);
    feedback.add_feedback(outcome("job-2", "timeout"));

    auto by_miner = feedback.list_feedback_for_miner("miner-1");
    ASSERT_EQ(by_miner.size(), 2u);
    EXPECT_EQ(by_miner[0].job_id, "job-2");
    EXPECT_EQ(by_miner[1].job_id, "job-1");
    EXPECT_EQ(feedback.list_feedback_for_miner("miner-1", 1).size(), 1u);

    auto by_job = feedback.list_feedback_for_job("job-1");
    ASSERT_EQ(by_job.size(), 1u);
    EXPECT_EQ(by_job[0].outcome, "success");
}

TEST_F(FeedbackRepositoryTest, RejectsUnknownMinerAndMissingFields) {
    FeedbackInput ghost = outcome("job-1", "success");
    ghost.miner_id = "ghost";
    EXPECT_THROW(feedback.add_feedback(ghost), NotFoundError);
    EXPECT_THROW(feedback.add_feedback(outcome("job-1", "")), ValidationError);
    EXPECT_TRUE(feedback.list_feedback_for_job("job-1").empty());
}

class UnreachableFeedbackTest : public PoolHubTestBase<UnreachableCache> {};

TEST_F(UnreachableFeedbackTest, FeedbackIsKeptWhenPublishFails) {
    miners.register_miner("miner-1", "k", gpu_box(40, 2.0));
    FeedbackInput in;
    in.job_id = "job-1";
    in.miner_id = "miner-1";
    in.outcome = "success";
    EXPECT_NO_THROW(feedback.add_feedback(in));
    EXPECT_EQ(feedback.list_feedback_for_job("job-1").size(), 1u);
    EXPECT_EQ(metrics.publish_failures.load(), 1u);
}
