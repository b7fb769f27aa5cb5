#pragma once
#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>

struct PoolHubMetrics {
    std::atomic<uint64_t> match_requests{0};
    std::atomic<uint64_t> match_failures{0};
    std::atomic<uint64_t> candidates_returned{0};
    std::atomic<uint64_t> cache_mirror_failures{0};
    std::atomic<uint64_t> publish_failures{0};
    std::atomic<uint64_t> feedback_events{0};

    nlohmann::json to_json() const {
        return {
            {"match_requests_total", match_requests.load()},
            {"match_failures_total", match_failures.load()},
            {"match_candidates_returned", candidates_returned.load()},
            {"cache_mirror_failures_total", cache_mirror_failures.load()},
            {"publish_failures_total", publish_failures.load()},
            {"feedback_events_total", feedback_events.load()}
        };
    }
};
