#pragma once
#include <optional>
#include <string>

namespace redis_keys {

std::string miner_hash(const std::string& miner_id);          // miner:{id}
std::string miner_rankings(const std::optional<std::string>& region); // rankings:{region|global}
std::string global_rankings();
std::string miner_last_seen();                                 // rankings:last-seen
std::string match_requests();                                  // match-requests
std::string match_results(const std::string& job_id);          // match-results:{job_id}
std::string match_results_channel(const std::string& job_id);  // match-results:{job_id}:events
std::string feedback_channel();                                // feedback:events

}
