#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class JobState {
    Queued,
    Running,
    Completed,
    Failed,
    Canceled,
    Expired,
};

std::string to_string(JobState s);
JobState job_state_from_string(const std::string& s);
bool is_terminal(JobState s);

// QUEUED->RUNNING|EXPIRED|CANCELED, RUNNING->COMPLETED|FAILED|CANCELED.
bool can_transition(JobState from, JobState to);

struct Constraints {
    std::optional<std::string> gpu;
    std::optional<std::string> cuda;
    std::optional<int> min_vram_gb;
    std::optional<std::vector<std::string>> models;
    std::optional<std::string> region;
    std::optional<double> max_price;

    bool empty() const;
};

// Throws ValidationError on unknown fields or mistyped values.
Constraints constraints_from_json(const nlohmann::json& j);
nlohmann::json to_json(const Constraints& c);

struct Job {
    std::string id;
    std::string client_id;
    JobState state{JobState::Queued};
    nlohmann::json payload = nlohmann::json::object();
    Constraints constraints;
    int ttl_seconds{0};
    int64_t requested_at{0}; // epoch ms
    int64_t expires_at{0};   // requested_at + ttl_seconds * 1000
    std::optional<std::string> assigned_miner_id;
    std::optional<nlohmann::json> result;
    std::optional<nlohmann::json> receipt;
    std::optional<std::string> error;
};

nlohmann::json job_view(const Job& job);
nlohmann::json assigned_job_view(const Job& job);
