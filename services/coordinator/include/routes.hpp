#pragma once
#include "http_server.hpp"
#include "dispatcher.hpp"
#include "reaper.hpp"

struct CoordinatorContext {
    Database& db;
    JobStore& jobs;
    MinerRegistry& miners;
    Dispatcher& dispatcher;
    Reaper* reaper{nullptr};
    int default_ttl_seconds{900};
};

// Client and miner endpoints. Callers identify through X-Client-Id and
// X-Miner-Id headers.
HttpResponse handle_coordinator_request(CoordinatorContext& ctx, const HttpRequest& req);
