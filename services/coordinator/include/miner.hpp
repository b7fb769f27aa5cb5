#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "job.hpp"

struct GpuSpec {
    std::string name;
    int64_t memory_mb{0};
};

// Hardware a miner advertises at registration.
struct Capabilities {
    std::vector<GpuSpec> gpus;
    std::optional<std::string> cuda;
    std::vector<std::string> models;
    std::optional<double> price;

    // Region is checked by Miner::satisfies; everything else here.
    bool satisfies(const Constraints& c) const;
};

Capabilities capabilities_from_json(const nlohmann::json& j);
nlohmann::json to_json(const Capabilities& caps);

struct Miner {
    std::string id;
    Capabilities capabilities;
    int concurrency{1};
    int inflight{0};
    std::optional<std::string> region;
    std::string status{"ONLINE"};
    std::string session_token;
    nlohmann::json metadata = nlohmann::json::object();
    int64_t last_heartbeat{0};
    std::optional<int64_t> last_job_at;
    int64_t jobs_completed{0};
    int64_t jobs_failed{0};
    int64_t total_job_duration_ms{0};
    double average_job_duration_ms{0.0};
    std::optional<std::string> last_receipt_id;

    bool satisfies(const Constraints& c) const;
    bool has_capacity() const { return inflight < concurrency; }
};

nlohmann::json miner_view(const Miner& m);
