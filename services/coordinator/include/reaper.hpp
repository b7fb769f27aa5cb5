#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include "job_store.hpp"
#include "miner_registry.hpp"

struct ReaperConfig {
    int interval_seconds{5};
    int heartbeat_timeout_seconds{30};
};

struct ReapStats {
    std::size_t expired_jobs{0};
    std::size_t stale_miners{0};
};

// Timer-driven sweep expiring overdue queued jobs and marking silent miners
// OFFLINE. Reads still expire jobs lazily in between sweeps.
class Reaper {
public:
    Reaper(JobStore& jobs, MinerRegistry& miners, ReaperConfig cfg, Clock clock = now_ms);
    ~Reaper();
    Reaper(const Reaper&) = delete;
    Reaper& operator=(const Reaper&) = delete;

    void start();
    void stop();
    ReapStats run_once();

    uint64_t total_expired() const { return total_expired_.load(); }
    uint64_t total_stale() const { return total_stale_.load(); }

private:
    void loop();

    JobStore& jobs_;
    MinerRegistry& miners_;
    ReaperConfig cfg_;
    Clock clock_;
    std::thread worker_;
    std::mutex mtx_;
    std::condition_variable cv_;
    bool running_ {false};
    std::atomic<uint64_t> total_expired_ {0};
    std::atomic<uint64_t> total_stale_ {0};
};
