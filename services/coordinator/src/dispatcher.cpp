#include "../include/dispatcher.hpp"
#include "errors.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

using json = nlohmann::json;

Dispatcher::Dispatcher(Database& db, JobStore& jobs, MinerRegistry& miners, Clock clock)
    : db_(db), jobs_(jobs), miners_(miners), clock_(std::move(clock)) {}

std::optional<Job> Dispatcher::acquire_next_job(const Miner& miner) {
    for (auto& queued : jobs_.list_queued()) {
        Job job = jobs_.ensure_not_expired(std::move(queued));
        if (job.state != JobState::Queued) continue;
        if (!miner.satisfies(job.constraints)) continue;
        if (!jobs_.try_assign(job.id, miner.id)) continue;
        job.state = JobState::Running;
        job.assigned_miner_id = miner.id;
        return job;
    }
    return std::nullopt;
}

Dispatcher::PollOutcome Dispatcher::poll_once(const std::string& miner_id, std::optional<Job>& out) {
    Transaction tx(db_);
    Miner miner = miners_.get(miner_id);
    miners_.touch(miner_id);
    if (!miner.has_capacity()) {
        tx.commit();
        return PollOutcome::AtCapacity;
    }
    auto job = acquire_next_job(miner);
    if (!job) {
        tx.commit();
        return PollOutcome::NoMatch;
    }
    if (!miners_.try_acquire_slot(miner_id)) {
        // Rolls back the assignment with the transaction.
        throw ConflictError("miner " + miner_id + " lost its free slot during assignment");
    }
    tx.commit();
    out = std::move(job);
    return PollOutcome::Assigned;
}

std::optional<Job> Dispatcher::poll(const std::string& miner_id, int max_wait_seconds) {
    metrics_.polls++;
    int wait = std::min(std::max(max_wait_seconds, 0), kMaxPollWaitSeconds);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(wait);
    for (;;) {
        std::optional<Job> job;
        PollOutcome outcome = poll_once(miner_id, job);
        if (outcome == PollOutcome::Assigned) {
            metrics_.assigned++;
            return job;
        }
        if (outcome == PollOutcome::AtCapacity) {
            metrics_.backpressure++;
            return std::nullopt;
        }
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
}

Job Dispatcher::submit_result(const std::string& job_id, const std::string& miner_id,
                              const json& result, const json& metrics) {
    Transaction tx(db_);
    miners_.get(miner_id);
    Job job;
    try {
        job = jobs_.complete_job(job_id, miner_id, result, std::nullopt);
    } catch (const ConflictError&) {
        metrics_.rejected_callbacks++;
        throw;
    }
    std::optional<int64_t> duration_ms;
    if (metrics.is_object() && metrics.contains("duration_ms") && metrics["duration_ms"].is_number()) {
        duration_ms = metrics["duration_ms"].get<int64_t>();
    } else {
        duration_ms = clock_() - job.requested_at;
    }
    std::optional<std::string> receipt_id;
    if (metrics.is_object() && metrics.contains("receipt_id") && metrics["receipt_id"].is_string()) {
        receipt_id = metrics["receipt_id"].get<std::string>();
    }
    miners_.release(miner_id, true, duration_ms, receipt_id);
    tx.commit();
    metrics_.completed++;
    return job;
}

Job Dispatcher::submit_failure(const std::string& job_id, const std::string& miner_id,
                               const std::string& error_code, const std::string& error_message,
                               const json& /*metrics*/) {
    Transaction tx(db_);
    miners_.get(miner_id);
    Job job;
    try {
        job = jobs_.fail_job(job_id, miner_id, error_code + ": " + error_message);
    } catch (const ConflictError&) {
        metrics_.rejected_callbacks++;
        throw;
    }
    miners_.release(miner_id, false);
    tx.commit();
    metrics_.failed++;
    return job;
}

Job Dispatcher::cancel_job(const std::string& job_id, const std::string& client_id) {
    // Settle read-triggered expiry first so a rejected cancel does not roll it back.
    jobs_.get_job(job_id, client_id);
    Transaction tx(db_);
    Job before = jobs_.get_job(job_id, client_id);
    Job job = jobs_.cancel_job(job_id, client_id);
    if (before.state == JobState::Running && before.assigned_miner_id) {
        miners_.release(*before.assigned_miner_id, std::nullopt);
        std::cout << "[coordinator] job " << job_id << " canceled while running on "
                  << *before.assigned_miner_id << std::endl;
    }
    tx.commit();
    metrics_.canceled++;
    return job;
}
