#include "../include/reaper.hpp"
#include <chrono>
#include <iostream>

Reaper::Reaper(JobStore& jobs, MinerRegistry& miners, ReaperConfig cfg, Clock clock)
    : jobs_(jobs), miners_(miners), cfg_(cfg), clock_(std::move(clock)) {}

Reaper::~Reaper() {
    stop();
}

void Reaper::start() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (running_) return;
    running_ = true;
    worker_ = std::thread([this]{ loop(); });
}

void Reaper::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

ReapStats Reaper::run_once() {
    ReapStats stats;
    stats.expired_jobs = jobs_.expire_due();
    int64_t cutoff = clock_() - (int64_t)cfg_.heartbeat_timeout_seconds * 1000;
    stats.stale_miners = miners_.mark_stale(cutoff);
    total_expired_ += stats.expired_jobs;
    total_stale_ += stats.stale_miners;
    if (stats.expired_jobs || stats.stale_miners) {
        std::cout << "[coordinator] reaper expired " << stats.expired_jobs << " job(s), marked "
                  << stats.stale_miners << " miner(s) offline" << std::endl;
    }
    return stats;
}

void Reaper::loop() {
    std::unique_lock<std::mutex> lock(mtx_);
    while (running_) {
        cv_.wait_for(lock, std::chrono::seconds(cfg_.interval_seconds), [this]{ return !running_; });
        if (!running_) break;
        lock.unlock();
        try {
            run_once();
        } catch (const std::exception& e) {
            std::cerr << "[coordinator] reaper sweep failed: " << e.what() << std::endl;
        }
        lock.lock();
    }
}
