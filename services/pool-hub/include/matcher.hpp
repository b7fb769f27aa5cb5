#pragma once
#include <string>
#include <vector>
#include "match_repository.hpp"
#include "miner_repository.hpp"
#include "scoring.hpp"

constexpr int kMaxTopK = 50;

struct MatchResponse {
    std::string job_id;
    std::vector<MatchCandidate> candidates;
};

nlohmann::json to_json(const MatchResponse& r);

// Logs the request, ranks the live miners and records the ranked candidates.
class Matcher {
public:
    Matcher(MinerRepository& miners, MatchRepository& matches, PoolHubMetrics& metrics)
        : miners_(miners), matches_(matches), metrics_(metrics) {}

    MatchResponse match(const std::string& job_id, const nlohmann::json& requirements,
                        const nlohmann::json& hints, int top_k);

private:
    MinerRepository& miners_;
    MatchRepository& matches_;
    PoolHubMetrics& metrics_;
};
