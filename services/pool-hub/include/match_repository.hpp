#pragma once
#include <optional>
#include <string>
#include <vector>
#include "cache.hpp"
#include "db.hpp"
#include "metrics.hpp"
#include "models.hpp"
#include "settings.hpp"
#include "util.hpp"

// Match request log and ranked results. Results are mirrored into
// match-results:{job_id} and announced on the job's channel after commit.
class MatchRepository {
public:
    MatchRepository(Database& db, CacheBackend& cache, const PoolHubSettings& settings,
                    PoolHubMetrics& metrics, Clock clock = now_ms);

    // enqueue also pushes the request onto the match-requests list.
    MatchRequest create_request(const std::string& job_id, const nlohmann::json& requirements,
                                const nlohmann::json& hints, int top_k, bool enqueue = true);

    std::vector<MatchResult> add_results(const std::string& request_id,
                                         const std::vector<MatchCandidate>& candidates, bool publish = true);

    std::optional<MatchRequest> get_request(const std::string& request_id);
    std::vector<MatchRequest> list_recent_requests(int limit = 20);
    std::vector<MatchResult> list_results_for_job(const std::string& job_id, int limit = 10);

private:
    void init();
    MatchRequest read_request(const Statement& st) const;
    MatchResult read_result(const Statement& st) const;

    Database& db_;
    CacheBackend& cache_;
    const PoolHubSettings& settings_;
    PoolHubMetrics& metrics_;
    Clock clock_;
};
