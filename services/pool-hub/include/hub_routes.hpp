#pragma once
#include "http_server.hpp"
#include "feedback_repository.hpp"
#include "matcher.hpp"

struct PoolHubContext {
    Database& db;
    CacheBackend& cache;
    MinerRepository& miners;
    MatchRepository& matches;
    FeedbackRepository& feedback;
    Matcher& matcher;
    PoolHubMetrics& metrics;
};

// Miner registration and status, matching, feedback and health endpoints.
// Miners authenticate with the X-Api-Key header on registration only.
HttpResponse handle_pool_hub_request(PoolHubContext& ctx, const HttpRequest& req);
