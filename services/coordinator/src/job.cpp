#include "../include/job.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <limits>

using json = nlohmann::json;

std::string to_string(JobState s) {
    switch (s) {
        case JobState::Queued: return "QUEUED";
        case JobState::Running: return "RUNNING";
        case JobState::Completed: return "COMPLETED";
        case JobState::Failed: return "FAILED";
        case JobState::Canceled: return "CANCELED";
        case JobState::Expired: return "EXPIRED";
    }
    return "UNKNOWN";
}

JobState job_state_from_string(const std::string& s) {
    if (s == "QUEUED") return JobState::Queued;
    if (s == "RUNNING") return JobState::Running;
    if (s == "COMPLETED") return JobState::Completed;
    if (s == "FAILED") return JobState::Failed;
    if (s == "CANCELED") return JobState::Canceled;
    if (s == "EXPIRED") return JobState::Expired;
    throw std::invalid_argument("unknown job state: " + s);
}

bool is_terminal(JobState s) {
    return s == JobState::Completed || s == JobState::Failed ||
           s == JobState::Canceled || s == JobState::Expired;
}

bool can_transition(JobState from, JobState to) {
    switch (from) {
        case JobState::Queued:
            return to == JobState::Running || to == JobState::Expired || to == JobState::Canceled;
        case JobState::Running:
            return to == JobState::Completed || to == JobState::Failed || to == JobState::Canceled;
        default:
            return false;
    }
}

bool Constraints::empty() const {
    return !gpu && !cuda && !min_vram_gb && !models && !region && !max_price;
}

Constraints constraints_from_json(const json& j) {
    Constraints c;
    if (j.is_null()) return c;
    if (!j.is_object()) throw ValidationError("constraints must be an object");
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const json& v = it.value();
        if (v.is_null()) continue;
        if (key == "gpu" || key == "cuda" || key == "region") {
            if (!v.is_string()) throw ValidationError("constraints." + key + " must be a string");
            if (key == "gpu") c.gpu = v.get<std::string>();
            else if (key == "cuda") c.cuda = v.get<std::string>();
            else c.region = v.get<std::string>();
        } else if (key == "min_vram_gb") {
            bool fits = v.is_number_unsigned()
                ? v.get<uint64_t>() <= (uint64_t)std::numeric_limits<int>::max()
                : v.is_number_integer() && v.get<int64_t>() >= 0 && v.get<int64_t>() <= std::numeric_limits<int>::max();
            if (!fits) {
                throw ValidationError("constraints.min_vram_gb must be a non-negative integer");
            }
            c.min_vram_gb = v.get<int>();
        } else if (key == "models") {
            if (!v.is_array()) throw ValidationError("constraints.models must be a list of strings");
            std::vector<std::string> models;
            for (const auto& m : v) {
                if (!m.is_string()) throw ValidationError("constraints.models must be a list of strings");
                models.push_back(m.get<std::string>());
            }
            c.models = std::move(models);
        } else if (key == "max_price") {
            if (!v.is_number()) throw ValidationError("constraints.max_price must be a number");
            c.max_price = v.get<double>();
        } else {
            throw ValidationError("unknown constraint: " + key);
        }
    }
    return c;
}

json to_json(const Constraints& c) {
    json j = json::object();
    if (c.gpu) j["gpu"] = *c.gpu;
    if (c.cuda) j["cuda"] = *c.cuda;
    if (c.min_vram_gb) j["min_vram_gb"] = *c.min_vram_gb;
    if (c.models) j["models"] = *c.models;
    if (c.region) j["region"] = *c.region;
    if (c.max_price) j["max_price"] = *c.max_price;
    return j;
}

json job_view(const Job& job) {
    return {
        {"job_id", job.id},
        {"state", to_string(job.state)},
        {"assigned_miner_id", job.assigned_miner_id ? json(*job.assigned_miner_id) : json(nullptr)},
        {"requested_at", format_timestamp(job.requested_at)},
        {"expires_at", format_timestamp(job.expires_at)},
        {"error", job.error ? json(*job.error) : json(nullptr)}
    };
}

json assigned_job_view(const Job& job) {
    return {
        {"job_id", job.id},
        {"payload", job.payload},
        {"constraints", to_json(job.constraints)}
    };
}
