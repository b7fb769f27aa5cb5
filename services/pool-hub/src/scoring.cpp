#include "../include/scoring.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstdio>
#include <unordered_set>

using json = nlohmann::json;

static double number_field(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return 0.0;
    if (!j[key].is_number()) throw ValidationError(std::string("requirements.") + key + " must be a number");
    return j[key].get<double>();
}

MatchRequirements requirements_from_json(const json& j) {
    MatchRequirements r;
    if (j.is_null()) return r;
    if (!j.is_object()) throw ValidationError("requirements must be an object");
    r.min_vram_gb = number_field(j, "min_vram_gb");
    r.min_ram_gb = number_field(j, "min_ram_gb");
    for (const char* key : {"capabilities", "capabilities_any"}) {
        if (!j.contains(key) || j[key].is_null()) continue;
        if (!j[key].is_array()) throw ValidationError(std::string("requirements.") + key + " must be a list");
        for (const auto& c : j[key]) r.capabilities.push_back(c.get<std::string>());
    }
    return r;
}

MatchHints hints_from_json(const json& j) {
    MatchHints h;
    if (j.is_object() && j.contains("region") && j["region"].is_string() && !j["region"].get<std::string>().empty()) {
        h.region = j["region"].get<std::string>();
    }
    return h;
}

double compute_score(const PoolMiner& miner, const std::optional<MinerStatus>& status,
                     const ScoreWeights& w, double latency_ref_ms) {
    double load_factor = 1.0;
    if (status && miner.max_parallel > 0) {
        double utilization = std::min((double)status->queue_len / (double)std::max(miner.max_parallel, 1), 1.0);
        load_factor = 1.0 - utilization;
    }
    double price_factor = miner.base_price > 0 ? 1.0 / miner.base_price : 1.0;
    double trust_factor = std::max(miner.trust_score, 0.0);
    double latency_factor = 1.0;
    if (status && status->avg_latency_ms && latency_ref_ms > 0) {
        latency_factor = 1.0 - std::min((double)*status->avg_latency_ms / latency_ref_ms, 1.0);
    }
    return w.capability * 1.0 + w.price * price_factor + w.load * load_factor +
           w.trust * trust_factor + w.latency * latency_factor;
}

bool passes_hard_filters(const PoolMiner& miner, const MatchRequirements& req, const MatchHints& hints) {
    if (miner.gpu_vram_gb < req.min_vram_gb) return false;
    if (miner.ram_gb < req.min_ram_gb) return false;
    if (!req.capabilities.empty()) {
        std::unordered_set<std::string> have(miner.capabilities.begin(), miner.capabilities.end());
        for (const auto& c : req.capabilities) {
            if (!have.count(c)) return false;
        }
    }
    if (hints.region && miner.region && !miner.region->empty() && *miner.region != *hints.region) {
        return false;
    }
    return true;
}

std::string compose_explain(double score, const std::optional<MinerStatus>& status) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", score);
    std::string latency = (status && status->avg_latency_ms) ? std::to_string(*status->avg_latency_ms) : "n/a";
    return std::string("score=") + buf + " load=" + std::to_string(status ? status->queue_len : 0) +
           " latency=" + latency;
}

std::vector<MatchCandidate> select_candidates(const MatchRequirements& req, const MatchHints& hints,
                                              const std::vector<ActiveMiner>& active, int top_k) {
    std::vector<MatchCandidate> ranked;
    for (const auto& am : active) {
        if (!passes_hard_filters(am.miner, req, hints)) continue;
        MatchCandidate c;
        c.miner_id = am.miner.miner_id;
        c.addr = am.miner.addr;
        c.proto = am.miner.proto;
        c.score = am.score;
        c.explain = compose_explain(am.score, am.status);
        if (am.status) c.eta_ms = am.status->avg_latency_ms;
        c.price = am.miner.base_price;
        ranked.push_back(std::move(c));
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const MatchCandidate& a, const MatchCandidate& b){
        return a.score > b.score;
    });
    if ((int)ranked.size() > top_k) ranked.resize(std::max(top_k, 0));
    return ranked;
}
