#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "models.hpp"
#include "settings.hpp"

struct MatchRequirements {
    double min_vram_gb{0.0};
    double min_ram_gb{0.0};
    std::vector<std::string> capabilities; // all required
};

struct MatchHints {
    std::optional<std::string> region;
};

MatchRequirements requirements_from_json(const nlohmann::json& j);
MatchHints hints_from_json(const nlohmann::json& j);

// cap*1 + price*(1/price or 1) + load*(1 - min(queue/max_parallel, 1))
//   + trust*trust_score + latency*(1 - min(avg_latency/latency_ref, 1))
double compute_score(const PoolMiner& miner, const std::optional<MinerStatus>& status,
                     const ScoreWeights& w, double latency_ref_ms);

bool passes_hard_filters(const PoolMiner& miner, const MatchRequirements& req, const MatchHints& hints);

std::string compose_explain(double score, const std::optional<MinerStatus>& status);

// Survivors of the hard filters, best score first (ties keep input order),
// at most top_k.
std::vector<MatchCandidate> select_candidates(const MatchRequirements& req, const MatchHints& hints,
                                              const std::vector<ActiveMiner>& active, int top_k);
