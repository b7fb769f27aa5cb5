#include "../include/feedback_repository.hpp"
#include "../include/redis_keys.hpp"
#include "errors.hpp"
#include <iostream>

using json = nlohmann::json;

FeedbackRepository::FeedbackRepository(Database& db, CacheBackend& cache, MinerRepository& miners,
                                       PoolHubMetrics& metrics, Clock clock)
    : db_(db), cache_(cache), miners_(miners), metrics_(metrics), clock_(std::move(clock)) {
    init();
}

void FeedbackRepository::init() {
    auto guard = db_.lock();
    db_.exec("CREATE TABLE IF NOT EXISTS feedback (\n"
             "  id TEXT PRIMARY KEY,\n"
             "  job_id TEXT NOT NULL,\n"
             "  miner_id TEXT NOT NULL REFERENCES miners(miner_id) ON DELETE CASCADE,\n"
             "  outcome TEXT NOT NULL,\n"
             "  latency_ms INTEGER,\n"
             "  fail_code TEXT,\n"
             "  tokens_spent REAL,\n"
             "  created_at INTEGER NOT NULL,\n"
             "  seq INTEGER NOT NULL\n"
             ");");
    db_.exec("CREATE INDEX IF NOT EXISTS idx_feedback_miner ON feedback(miner_id);");
    db_.exec("CREATE INDEX IF NOT EXISTS idx_feedback_job ON feedback(job_id);");
}

Feedback FeedbackRepository::read_row(const Statement& st) const {
    Feedback f;
    f.id = st.text(0);
    f.job_id = st.text(1);
    f.miner_id = st.text(2);
    f.outcome = st.text(3);
    f.latency_ms = st.opt_int64(4);
    f.fail_code = st.opt_text(5);
    f.tokens_spent = st.opt_real(6);
    f.created_at = st.int64(7);
    return f;
}

Feedback FeedbackRepository::add_feedback(const FeedbackInput& in) {
    if (in.job_id.empty() || in.outcome.empty()) throw ValidationError("job_id and outcome are required");
    if (!miners_.get_miner(in.miner_id)) throw NotFoundError("miner not registered");

    Feedback f;
    f.id = gen_id();
    f.job_id = in.job_id;
    f.miner_id = in.miner_id;
    f.outcome = in.outcome;
    f.latency_ms = in.latency_ms;
    f.fail_code = in.fail_code;
    f.tokens_spent = in.tokens_spent;
    f.created_at = clock_();
    {
        auto guard = db_.lock();
        auto st = db_.prepare("INSERT INTO feedback (id, job_id, miner_id, outcome, latency_ms, fail_code, tokens_spent, "
                              "created_at, seq) VALUES (?, ?, ?, ?, ?, ?, ?, ?, "
                              "(SELECT COALESCE(MAX(seq), 0) + 1 FROM feedback));");
        st.bind(1, f.id).bind(2, f.job_id).bind(3, f.miner_id).bind(4, f.outcome).bind(5, f.latency_ms)
          .bind(6, f.fail_code).bind(7, f.tokens_spent).bind(8, f.created_at);
        st.run();
    }
    metrics_.feedback_events++;
    miners_.update_trust(f.miner_id, f.outcome == "success");

    try {
        cache_.publish(redis_keys::feedback_channel(), to_json(f).dump());
    } catch (const std::exception& e) {
        metrics_.publish_failures++;
        std::cerr << "[pool-hub] failed to publish feedback event for job " << f.job_id << ": " << e.what() << std::endl;
    }
    return f;
}

std::vector<Feedback> FeedbackRepository::list_where(const char* column, const std::string& value, int limit) {
    auto guard = db_.lock();
    auto st = db_.prepare(std::string("SELECT id, job_id, miner_id, outcome, latency_ms, fail_code, tokens_spent, "
                                      "created_at FROM feedback WHERE ") + column +
                          " = ? ORDER BY created_at DESC, seq DESC LIMIT ?;");
    st.bind(1, value).bind(2, limit);
    std::vector<Feedback> out;
    while (st.step()) out.push_back(read_row(st));
    return out;
}

std::vector<Feedback> FeedbackRepository::list_feedback_for_miner(const std::string& miner_id, int limit) {
    return list_where("miner_id", miner_id, limit);
}

std::vector<Feedback> FeedbackRepository::list_feedback_for_job(const std::string& job_id, int limit) {
    return list_where("job_id", job_id, limit);
}
