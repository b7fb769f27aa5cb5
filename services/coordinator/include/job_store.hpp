#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "job.hpp"
#include "db.hpp"
#include "util.hpp"

// Authoritative job records. Every state change goes through a conditional
// UPDATE on the current state so concurrent writers cannot both win.
class JobStore {
public:
    explicit JobStore(Database& db, Clock clock = now_ms);

    Job create_job(const std::string& client_id, nlohmann::json payload, Constraints constraints, int ttl_seconds);

    // NotFoundError when absent or owned by another client. A QUEUED job past
    // its deadline is moved to EXPIRED before being returned.
    Job get_job(const std::string& id, const std::optional<std::string>& client_id = std::nullopt);

    // QUEUED jobs, oldest first.
    std::vector<Job> list_queued();

    // QUEUED -> RUNNING with assigned_miner_id set. false when another poller
    // got there first or the job is no longer queued.
    bool try_assign(const std::string& job_id, const std::string& miner_id);

    // RUNNING -> COMPLETED|FAILED for the assigned miner only.
    Job complete_job(const std::string& id, const std::string& miner_id,
                     const nlohmann::json& result, const std::optional<nlohmann::json>& receipt);
    Job fail_job(const std::string& id, const std::string& miner_id, const std::string& error);

    // QUEUED|RUNNING -> CANCELED, ConflictError from a terminal state.
    Job cancel_job(const std::string& id, const std::string& client_id);

    // Expires every QUEUED job whose deadline has passed.
    std::size_t expire_due();

    Job ensure_not_expired(Job job);
    std::map<std::string, int64_t> count_by_state();

private:
    void init();
    std::optional<Job> find(const std::string& id);
    Job load(const std::string& id);
    Job read_row(const Statement& st) const;
    bool transition(const std::string& id, JobState from, JobState to, const std::optional<std::string>& error);

    Database& db_;
    Clock clock_;
};
