#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include "job_store.hpp"
#include "miner_registry.hpp"

struct DispatchMetrics {
    std::atomic<uint64_t> polls{0};
    std::atomic<uint64_t> backpressure{0};
    std::atomic<uint64_t> assigned{0};
    std::atomic<uint64_t> completed{0};
    std::atomic<uint64_t> failed{0};
    std::atomic<uint64_t> canceled{0};
    std::atomic<uint64_t> rejected_callbacks{0};
};

// Pairs queued jobs with polling miners. Assignment and the miner's slot
// increment commit in one transaction, so inflight never exceeds concurrency
// and a job is handed to at most one miner.
class Dispatcher {
public:
    Dispatcher(Database& db, JobStore& jobs, MinerRegistry& miners, Clock clock = now_ms);

    // First fit over the queue in requested_at order. Does not touch the
    // miner's counters; poll() does.
    std::optional<Job> acquire_next_job(const Miner& miner);

    // nullopt when the miner is at capacity or nothing queued fits.
    // With max_wait_seconds > 0 keeps retrying until something fits or the
    // wait elapses (capped at kMaxPollWaitSeconds).
    std::optional<Job> poll(const std::string& miner_id, int max_wait_seconds = 0);

    Job submit_result(const std::string& job_id, const std::string& miner_id,
                      const nlohmann::json& result, const nlohmann::json& metrics);
    Job submit_failure(const std::string& job_id, const std::string& miner_id,
                       const std::string& error_code, const std::string& error_message,
                       const nlohmann::json& metrics);

    // A canceled RUNNING job gives its slot back; the miner finds out when its
    // late result is rejected.
    Job cancel_job(const std::string& job_id, const std::string& client_id);

    const DispatchMetrics& metrics() const { return metrics_; }

    static constexpr int kMaxPollWaitSeconds = 30;

private:
    enum class PollOutcome { Assigned, AtCapacity, NoMatch };
    PollOutcome poll_once(const std::string& miner_id, std::optional<Job>& out);

    Database& db_;
    JobStore& jobs_;
    MinerRegistry& miners_;
    Clock clock_;
    DispatchMetrics metrics_;
};
