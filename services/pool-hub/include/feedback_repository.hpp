#pragma once
#include <optional>
#include <string>
#include <vector>
#include "cache.hpp"
#include "db.hpp"
#include "metrics.hpp"
#include "miner_repository.hpp"
#include "models.hpp"
#include "util.hpp"

struct FeedbackInput {
    std::string job_id;
    std::string miner_id;
    std::string outcome;
    std::optional<int64_t> latency_ms;
    std::optional<std::string> fail_code;
    std::optional<double> tokens_spent;
};

// Append-only job outcomes. Each row nudges the miner's trust score and is
// announced on feedback:events when the cache is reachable.
class FeedbackRepository {
public:
    FeedbackRepository(Database& db, CacheBackend& cache, MinerRepository& miners,
                       PoolHubMetrics& metrics, Clock clock = now_ms);

    Feedback add_feedback(const FeedbackInput& in);
    std::vector<Feedback> list_feedback_for_miner(const std::string& miner_id, int limit = 50);
    std::vector<Feedback> list_feedback_for_job(const std::string& job_id, int limit = 50);

private:
    void init();
    Feedback read_row(const Statement& st) const;
    std::vector<Feedback> list_where(const char* column, const std::string& value, int limit);

    Database& db_;
    CacheBackend& cache_;
    MinerRepository& miners_;
    PoolHubMetrics& metrics_;
    Clock clock_;
};
