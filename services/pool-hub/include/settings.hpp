#pragma once
#include <string>

struct ScoreWeights {
    double capability{0.40};
    double price{0.20};
    double latency{0.20};
    double trust{0.15};
    double load{0.05};
};

struct PoolHubSettings {
    int port{8203};
    std::string db_path{"./data/poolhub.db"};
    std::string redis_url; // empty: in-process cache
    unsigned int http_threads{8};
    int session_ttl_seconds{60};
    int heartbeat_grace_seconds{120};
    int match_results_ttl_seconds{300};
    int match_request_backlog{1000}; // newest entries kept on match-requests
    ScoreWeights weights;
    double latency_ref_ms{1000.0};
    double trust_alpha{0.10};

    // Lifetime of the miner hash and ranking entries after the last update.
    int cache_ttl_seconds() const { return session_ttl_seconds + heartbeat_grace_seconds; }
};

// POOLHUB_* environment variables over the defaults above.
PoolHubSettings load_pool_hub_settings();
