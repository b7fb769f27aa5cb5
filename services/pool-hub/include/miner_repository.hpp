#pragma once
#include <optional>
#include <string>
#include <vector>
#include "cache.hpp"
#include "db.hpp"
#include "metrics.hpp"
#include "models.hpp"
#include "settings.hpp"
#include "util.hpp"

struct MinerRegistrationInput {
    std::string addr;
    std::string proto{"http"};
    double gpu_vram_gb{0.0};
    std::optional<std::string> gpu_name;
    int cpu_cores{0};
    double ram_gb{0.0};
    int max_parallel{1};
    double base_price{0.0};
    std::map<std::string, std::string> tags;
    std::vector<std::string> capabilities;
    std::optional<std::string> region;
    std::optional<double> trust_score; // defaults to 0.5 for new miners
};

struct StatusUpdate {
    std::optional<int> queue_len;
    std::optional<bool> busy;
    std::optional<int64_t> avg_latency_ms;
    std::optional<int> temp_c;
    std::optional<double> mem_free_gb;
};

// Miner records live in SQLite. After each committed mutation the miner is
// mirrored into miner:{id} and the rankings sorted sets; a failed mirror is
// logged and counted but never undoes the write. rankings:last-seen tracks
// when each ranked miner was last seen so silent miners can be dropped from
// the shared ranking sets.
class MinerRepository {
public:
    MinerRepository(Database& db, CacheBackend& cache, const PoolHubSettings& settings,
                    PoolHubMetrics& metrics, Clock clock = now_ms);

    PoolMiner register_miner(const std::string& miner_id, const std::string& api_key, const MinerRegistrationInput& in);

    // Patches only the provided fields. NotFoundError for unknown miners.
    void update_status(const std::string& miner_id, const StatusUpdate& update);

    // false for unknown miners.
    bool touch_heartbeat(const std::string& miner_id);

    // Exponential moving average toward 1 on success, 0 otherwise.
    double update_trust(const std::string& miner_id, bool success);

    std::optional<PoolMiner> get_miner(const std::string& miner_id);
    std::optional<MinerStatus> get_status(const std::string& miner_id);
    std::vector<PoolMiner> iter_miners();

    // Miners seen within the cache window, scored, in registration order.
    std::vector<ActiveMiner> list_active_miners();
    int64_t count_active();

    double score(const PoolMiner& miner, const std::optional<MinerStatus>& status) const;

    bool sync_miner_to_cache(const std::string& miner_id);

    // Removes miners silent for the whole cache window from the ranking sets.
    // Returns how many were dropped.
    std::size_t prune_stale_rankings();

private:
    void init();
    PoolMiner read_miner(const Statement& st, int offset) const;
    MinerStatus read_status(const Statement& st, int offset) const;
    void drop_from_rankings(const std::string& miner_id, const std::optional<std::string>& region);

    Database& db_;
    CacheBackend& cache_;
    const PoolHubSettings& settings_;
    PoolHubMetrics& metrics_;
    Clock clock_;
};
