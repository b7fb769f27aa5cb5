#include "fixture.hpp"
#include "reaper.hpp"

class ReaperTest : public CoordinatorTest {};

TEST_F(ReaperTest, SweepExpiresJobsAndMarksSilentMiners) {
    Job overdue = jobs.create_job("client-1", payload(), Constraints{}, 5);
    Job fresh = jobs.create_job("client-1", payload(), Constraints{}, 600);
    register_miner("miner-1", a100_caps());

    Reaper reaper(jobs, miners, ReaperConfig{5, 30}, clock.fn());
    clock.advance_seconds(10);
    ReapStats first = reaper.run_once();
    EXPECT_EQ(first.expired_jobs, 1u);
    EXPECT_EQ(first.stale_miners, 0u);

    clock.advance_seconds(30);
    ReapStats second = reaper.run_once();
    EXPECT_EQ(second.expired_jobs, 0u);
    EXPECT_EQ(second.stale_miners, 1u);

    EXPECT_EQ(jobs.get_job(overdue.id).state, JobState::Expired);
    EXPECT_EQ(jobs.get_job(fresh.id).state, JobState::Queued);
    EXPECT_EQ(miners.get("miner-1").status, "OFFLINE");
    EXPECT_EQ(reaper.total_expired(), 1u);
    EXPECT_EQ(reaper.total_stale(), 1u);
}

TEST_F(ReaperTest, RegisterBringsMinerBackOnline) {
    register_miner("miner-1", a100_caps());
    Reaper reaper(jobs, miners, ReaperConfig{5, 30}, clock.fn());
    clock.advance_seconds(31);
    reaper.run_once();
    ASSERT_EQ(miners.get("miner-1").status, "OFFLINE");
    register_miner("miner-1", a100_caps());
    EXPECT_EQ(miners.get("miner-1").status, "ONLINE");
}

TEST_F(ReaperTest, PollBringsMinerBackOnline) {
    register_miner("miner-1", a100_caps());
    Reaper reaper(jobs, miners, ReaperConfig{5, 30}, clock.fn());
    clock.advance_seconds(31);
    reaper.run_once();
    ASSERT_EQ(miners.online_count(), 0);

    Job job = jobs.create_job("client-1", payload(), Constraints{}, 60);
    auto assigned = dispatcher.poll("miner-1");
    ASSERT_TRUE(assigned.has_value());
    EXPECT_EQ(assigned->id, job.id);
    EXPECT_EQ(miners.get("miner-1").status, "ONLINE");
    EXPECT_EQ(miners.online_count(), 1);
}

TEST_F(ReaperTest, StartAndStopAreIdempotent) {
    Reaper reaper(jobs, miners, ReaperConfig{1, 30}, clock.fn());
    reaper.start();
    reaper.start();
    reaper.stop();
    reaper.stop();
    SUCCEED();
}
