#include "../include/redis_keys.hpp"

namespace redis_keys {

std::string miner_hash(const std::string& miner_id) {
    return "miner:" + miner_id;
}

std::string miner_rankings(const std::optional<std::string>& region) {
    if (!region || region->empty()) return global_rankings();
    return "rankings:" + *region;
}

std::string global_rankings() {
    return "rankings:global";
}

std::string miner_last_seen() {
    return "rankings:last-seen";
}

std::string match_requests() {
    return "match-requests";
}

std::string match_results(const std::string& job_id) {
    return "match-results:" + job_id;
}

std::string match_results_channel(const std::string& job_id) {
    return "match-results:" + job_id + ":events";
}

std::string feedback_channel() {
    return "feedback:events";
}

}
