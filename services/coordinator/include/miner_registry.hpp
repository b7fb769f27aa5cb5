#pragma once
#include <optional>
#include <string>
#include <vector>
#include "miner.hpp"
#include "db.hpp"
#include "util.hpp"

struct MinerRegistration {
    Capabilities capabilities;
    int concurrency{1};
    std::optional<std::string> region;
};

struct MinerHeartbeat {
    int inflight{0};
    std::string status{"ONLINE"};
    nlohmann::json metadata = nlohmann::json::object();
};

// Capability, concurrency and heartbeat bookkeeping per miner.
class MinerRegistry {
public:
    explicit MinerRegistry(Database& db, Clock clock = now_ms);

    // Upsert; resets inflight, issues a fresh session token, status ONLINE.
    Miner register_miner(const std::string& miner_id, const MinerRegistration& reg);
    Miner heartbeat(const std::string& miner_id, const MinerHeartbeat& hb);

    Miner get(const std::string& miner_id);
    std::vector<Miner> list();
    int64_t online_count();

    // inflight+1 guarded by inflight < concurrency; false at capacity.
    bool try_acquire_slot(const std::string& miner_id);

    // inflight-1 (floor 0). success: true counts a completion and folds
    // duration_ms into the average, false counts a failure, nullopt neither.
    void release(const std::string& miner_id, std::optional<bool> success,
                 std::optional<int64_t> duration_ms = std::nullopt,
                 const std::optional<std::string>& receipt_id = std::nullopt);

    void touch(const std::string& miner_id);

    // ONLINE miners silent since before cutoff become OFFLINE.
    std::size_t mark_stale(int64_t cutoff_ms);

private:
    void init();
    std::optional<Miner> find(const std::string& miner_id);
    Miner read_row(const Statement& st) const;

    Database& db_;
    Clock clock_;
};
