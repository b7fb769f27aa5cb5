#include "../include/matcher.hpp"
#include "errors.hpp"
#include <iostream>

using json = nlohmann::json;

json to_json(const MatchResponse& r) {
    json arr = json::array();
    for (const auto& c : r.candidates) arr.push_back(to_json(c));
    return {{"job_id", r.job_id}, {"candidates", arr}};
}

MatchResponse Matcher::match(const std::string& job_id, const json& requirements, const json& hints, int top_k) {
    if (job_id.empty()) throw ValidationError("job_id is required");
    if (top_k < 1 || top_k > kMaxTopK) {
        throw ValidationError("top_k must be between 1 and " + std::to_string(kMaxTopK));
    }
    MatchRequirements req = requirements_from_json(requirements);
    MatchHints h = hints_from_json(hints);

    metrics_.match_requests++;
    try {
        MatchRequest request = matches_.create_request(job_id, requirements, hints, top_k);
        auto active = miners_.list_active_miners();
        MatchResponse out;
        out.job_id = job_id;
        out.candidates = select_candidates(req, h, active, top_k);
        matches_.add_results(request.id, out.candidates);
        metrics_.candidates_returned += out.candidates.size();
        return out;
    } catch (const std::exception& e) {
        metrics_.match_failures++;
        std::cerr << "[pool-hub] match for job " << job_id << " failed: " << e.what() << std::endl;
        throw;
    }
}
