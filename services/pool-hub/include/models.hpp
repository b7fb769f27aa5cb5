#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct PoolMiner {
    std::string miner_id;
    std::string api_key_hash;
    std::string addr;
    std::string proto;
    double gpu_vram_gb{0.0};
    std::optional<std::string> gpu_name;
    int cpu_cores{0};
    double ram_gb{0.0};
    int max_parallel{1};
    double base_price{0.0};
    std::map<std::string, std::string> tags;
    std::vector<std::string> capabilities;
    double trust_score{0.5}; // [0,1]
    std::optional<std::string> region;
    int64_t created_at{0};
    int64_t last_seen_at{0};
};

struct MinerStatus {
    std::string miner_id;
    int queue_len{0};
    bool busy{false};
    std::optional<int64_t> avg_latency_ms;
    std::optional<int> temp_c;
    std::optional<double> mem_free_gb;
    int64_t updated_at{0};
};

struct ActiveMiner {
    PoolMiner miner;
    std::optional<MinerStatus> status;
    double score{0.0};
};

struct MatchRequest {
    std::string id;
    std::string job_id;
    nlohmann::json requirements = nlohmann::json::object();
    nlohmann::json hints = nlohmann::json::object();
    int top_k{1};
    int64_t created_at{0};
};

struct MatchCandidate {
    std::string miner_id;
    std::string addr;
    std::string proto;
    double score{0.0};
    std::string explain;
    std::optional<int64_t> eta_ms;
    double price{0.0};
};

struct MatchResult {
    std::string id;
    std::string request_id;
    std::string miner_id;
    double score{0.0};
    std::optional<std::string> explain;
    std::optional<int64_t> eta_ms;
    std::optional<double> price;
    int64_t created_at{0};
};

struct Feedback {
    std::string id;
    std::string job_id;
    std::string miner_id;
    std::string outcome; // "success" | "failure" | "timeout" ...
    std::optional<int64_t> latency_ms;
    std::optional<std::string> fail_code;
    std::optional<double> tokens_spent;
    int64_t created_at{0};
};

nlohmann::json to_json(const PoolMiner& m);
nlohmann::json to_json(const MinerStatus& s);
nlohmann::json to_json(const MatchCandidate& c);
nlohmann::json to_json(const MatchResult& r);
nlohmann::json to_json(const Feedback& f);
