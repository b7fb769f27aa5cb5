#include "../include/settings.hpp"
#include "errors.hpp"
#include "util.hpp"

PoolHubSettings load_pool_hub_settings() {
    PoolHubSettings s;
    s.port = getenv_int("POOLHUB_PORT", s.port);
    s.db_path = getenv_or("POOLHUB_DB_PATH", s.db_path);
    s.redis_url = getenv_or("POOLHUB_REDIS_URL", s.redis_url);
    s.http_threads = (unsigned int)getenv_int("POOLHUB_HTTP_THREADS", (int)s.http_threads);
    s.session_ttl_seconds = getenv_int("POOLHUB_SESSION_TTL_SECONDS", s.session_ttl_seconds);
    s.heartbeat_grace_seconds = getenv_int("POOLHUB_HEARTBEAT_GRACE_SECONDS", s.heartbeat_grace_seconds);
    s.match_request_backlog = getenv_int("POOLHUB_MATCH_REQUEST_BACKLOG", s.match_request_backlog);
    s.weights.capability = getenv_double("POOLHUB_WEIGHT_CAP", s.weights.capability);
    s.weights.price = getenv_double("POOLHUB_WEIGHT_PRICE", s.weights.price);
    s.weights.latency = getenv_double("POOLHUB_WEIGHT_LATENCY", s.weights.latency);
    s.weights.trust = getenv_double("POOLHUB_WEIGHT_TRUST", s.weights.trust);
    s.weights.load = getenv_double("POOLHUB_WEIGHT_LOAD", s.weights.load);
    s.latency_ref_ms = getenv_double("POOLHUB_LATENCY_REF_MS", s.latency_ref_ms);
    s.trust_alpha = getenv_double("POOLHUB_TRUST_ALPHA", s.trust_alpha);
    if (s.cache_ttl_seconds() < 1) throw ValidationError("session ttl plus heartbeat grace must be positive");
    if (s.match_request_backlog < 1) throw ValidationError("POOLHUB_MATCH_REQUEST_BACKLOG must be at least 1");
    if (s.latency_ref_ms <= 0) throw ValidationError("POOLHUB_LATENCY_REF_MS must be positive");
    if (s.trust_alpha < 0 || s.trust_alpha > 1) throw ValidationError("POOLHUB_TRUST_ALPHA must be within [0,1]");
    return s;
}
