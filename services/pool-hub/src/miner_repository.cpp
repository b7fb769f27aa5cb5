#include "../include/miner_repository.hpp"
#include "../include/redis_keys.hpp"
#include "../include/scoring.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iostream>

using json = nlohmann::json;

static const char* kMinerColumns =
    "m.miner_id, m.api_key_hash, m.addr, m.proto, m.gpu_vram_gb, m.gpu_name, m.cpu_cores, m.ram_gb, "
    "m.max_parallel, m.base_price, m.tags, m.capabilities, m.trust_score, m.region, m.created_at, m.last_seen_at";
static const int kMinerColumnCount = 16;
static const char* kStatusColumns =
    "s.miner_id, s.queue_len, s.busy, s.avg_latency_ms, s.temp_c, s.mem_free_gb, s.updated_at";

MinerRepository::MinerRepository(Database& db, CacheBackend& cache, const PoolHubSettings& settings,
                                 PoolHubMetrics& metrics, Clock clock)
    : db_(db), cache_(cache), settings_(settings), metrics_(metrics), clock_(std::move(clock)) {
    init();
}

void MinerRepository::init() {
    auto guard = db_.lock();
    db_.exec("CREATE TABLE IF NOT EXISTS miners (\n"
             "  miner_id TEXT PRIMARY KEY,\n"
             "  api_key_hash TEXT NOT NULL,\n"
             "  addr TEXT NOT NULL,\n"
             "  proto TEXT NOT NULL,\n"
             "  gpu_vram_gb REAL NOT NULL,\n"
             "  gpu_name TEXT,\n"
             "  cpu_cores INTEGER NOT NULL,\n"
             "  ram_gb REAL NOT NULL,\n"
             "  max_parallel INTEGER NOT NULL,\n"
             "  base_price REAL NOT NULL,\n"
             "  tags TEXT NOT NULL DEFAULT '{}',\n"
             "  capabilities TEXT NOT NULL DEFAULT '[]',\n"
             "  trust_score REAL NOT NULL DEFAULT 0.5,\n"
             "  region TEXT,\n"
             "  created_at INTEGER NOT NULL,\n"
             "  last_seen_at INTEGER NOT NULL,\n"
             "  seq INTEGER NOT NULL\n"
             ");");
    db_.exec("CREATE TABLE IF NOT EXISTS miner_status (\n"
             "  miner_id TEXT PRIMARY KEY REFERENCES miners(miner_id) ON DELETE CASCADE,\n"
             "  queue_len INTEGER NOT NULL DEFAULT 0,\n"
             "  busy INTEGER NOT NULL DEFAULT 0,\n"
             "  avg_latency_ms INTEGER,\n"
             "  temp_c INTEGER,\n"
             "  mem_free_gb REAL,\n"
             "  updated_at INTEGER NOT NULL\n"
             ");");
    db_.exec("CREATE INDEX IF NOT EXISTS idx_miners_last_seen ON miners(last_seen_at);");
}

PoolMiner MinerRepository::read_miner(const Statement& st, int o) const {
    PoolMiner m;
    m.miner_id = st.text(o + 0);
    m.api_key_hash = st.text(o + 1);
    m.addr = st.text(o + 2);
    m.proto = st.text(o + 3);
    m.gpu_vram_gb = st.real(o + 4);
    m.gpu_name = st.opt_text(o + 5);
    m.cpu_cores = (int)st.int64(o + 6);
    m.ram_gb = st.real(o + 7);
    m.max_parallel = (int)st.int64(o + 8);
    m.base_price = st.real(o + 9);
    m.tags = json::parse(st.text(o + 10)).get<std::map<std::string, std::string>>();
    m.capabilities = json::parse(st.text(o + 11)).get<std::vector<std::string>>();
    m.trust_score = st.real(o + 12);
    m.region = st.opt_text(o + 13);
    m.created_at = st.int64(o + 14);
    m.last_seen_at = st.int64(o + 15);
    return m;
}

MinerStatus MinerRepository::read_status(const Statement& st, int o) const {
    MinerStatus s;
    s.miner_id = st.text(o + 0);
    s.queue_len = (int)st.int64(o + 1);
    s.busy = st.int64(o + 2) != 0;
    s.avg_latency_ms = st.opt_int64(o + 3);
    if (auto t = st.opt_int64(o + 4)) s.temp_c = (int)*t;
    s.mem_free_gb = st.opt_real(o + 5);
    s.updated_at = st.int64(o + 6);
    return s;
}

PoolMiner MinerRepository::register_miner(const std::string& miner_id, const std::string& api_key,
                                          const MinerRegistrationInput& in) {
    if (miner_id.empty()) throw ValidationError("miner_id required");
    if (in.max_parallel < 1) throw ValidationError("max_parallel must be at least 1");
    if (in.gpu_vram_gb < 0 || in.ram_gb < 0 || in.base_price < 0) {
        throw ValidationError("gpu_vram_gb, ram_gb and base_price must be non-negative");
    }
    if (in.trust_score && (*in.trust_score < 0 || *in.trust_score > 1)) {
        throw ValidationError("trust_score must be within [0,1]");
    }
    int64_t now = clock_();
    std::optional<PoolMiner> previous;
    {
        Transaction tx(db_);
        previous = get_miner(miner_id);
        auto st = db_.prepare(
            "INSERT INTO miners (miner_id, api_key_hash, addr, proto, gpu_vram_gb, gpu_name, cpu_cores, ram_gb, "
            "max_parallel, base_price, tags, capabilities, trust_score, region, created_at, last_seen_at, seq) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, (SELECT COALESCE(MAX(seq), 0) + 1 FROM miners)) "
            "ON CONFLICT(miner_id) DO UPDATE SET addr = excluded.addr, proto = excluded.proto, "
            "gpu_vram_gb = excluded.gpu_vram_gb, gpu_name = excluded.gpu_name, cpu_cores = excluded.cpu_cores, "
            "ram_gb = excluded.ram_gb, max_parallel = excluded.max_parallel, base_price = excluded.base_price, "
            "tags = excluded.tags, capabilities = excluded.capabilities, region = excluded.region, "
            "last_seen_at = excluded.last_seen_at;");
        st.bind(1, miner_id).bind(2, sha256_hex(api_key)).bind(3, in.addr).bind(4, in.proto)
          .bind(5, in.gpu_vram_gb).bind(6, in.gpu_name).bind(7, in.cpu_cores).bind(8, in.ram_gb)
          .bind(9, in.max_parallel).bind(10, in.base_price).bind(11, json(in.tags).dump())
          .bind(12, json(in.capabilities).dump()).bind(13, in.trust_score.value_or(0.5))
          .bind(14, in.region).bind(15, now).bind(16, now);
        st.run();
        auto status = db_.prepare("INSERT OR IGNORE INTO miner_status (miner_id, updated_at) VALUES (?, ?);");
        status.bind(1, miner_id).bind(2, now);
        status.run();
        tx.commit();
    }
    if (previous && redis_keys::miner_rankings(previous->region) != redis_keys::miner_rankings(in.region)) {
        try {
            cache_.zrem(redis_keys::miner_rankings(previous->region), miner_id);
        } catch (const std::exception& e) {
            metrics_.cache_mirror_failures++;
            std::cerr << "[pool-hub] failed to drop miner " << miner_id << " from its old region ranking: "
                      << e.what() << std::endl;
        }
    }
    sync_miner_to_cache(miner_id);
    return *get_miner(miner_id);
}

void MinerRepository::update_status(const std::string& miner_id, const StatusUpdate& u) {
    int64_t now = clock_();
    {
        Transaction tx(db_);
        if (!get_miner(miner_id)) throw NotFoundError("miner not registered");
        auto st = db_.prepare(
            "UPDATE miner_status SET queue_len = COALESCE(?, queue_len), busy = COALESCE(?, busy), "
            "avg_latency_ms = COALESCE(?, avg_latency_ms), temp_c = COALESCE(?, temp_c), "
            "mem_free_gb = COALESCE(?, mem_free_gb), updated_at = ? WHERE miner_id = ?;");
        if (u.queue_len) st.bind(1, *u.queue_len); else st.bind_null(1);
        if (u.busy) st.bind(2, *u.busy); else st.bind_null(2);
        st.bind(3, u.avg_latency_ms);
        if (u.temp_c) st.bind(4, *u.temp_c); else st.bind_null(4);
        st.bind(5, u.mem_free_gb).bind(6, now).bind(7, miner_id);
        st.run();
        auto seen = db_.prepare("UPDATE miners SET last_seen_at = ? WHERE miner_id = ?;");
        seen.bind(1, now).bind(2, miner_id);
        seen.run();
        tx.commit();
    }
    sync_miner_to_cache(miner_id);
}

bool MinerRepository::touch_heartbeat(const std::string& miner_id) {
    {
        auto guard = db_.lock();
        auto st = db_.prepare("UPDATE miners SET last_seen_at = ? WHERE miner_id = ?;");
        st.bind(1, clock_()).bind(2, miner_id);
        st.run();
        if (db_.changes() != 1) return false;
    }
    sync_miner_to_cache(miner_id);
    return true;
}

double MinerRepository::update_trust(const std::string& miner_id, bool success) {
    double trust = 0.0;
    {
        Transaction tx(db_);
        auto miner = get_miner(miner_id);
        if (!miner) throw NotFoundError("miner not registered");
        double alpha = settings_.trust_alpha;
        trust = (1.0 - alpha) * miner->trust_score + alpha * (success ? 1.0 : 0.0);
        trust = std::min(1.0, std::max(0.0, trust));
        auto st = db_.prepare("UPDATE miners SET trust_score = ? WHERE miner_id = ?;");
        st.bind(1, trust).bind(2, miner_id);
        st.run();
        tx.commit();
    }
    sync_miner_to_cache(miner_id);
    return trust;
}

std::optional<PoolMiner> MinerRepository::get_miner(const std::string& miner_id) {
    auto guard = db_.lock();
    auto st = db_.prepare(std::string("SELECT ") + kMinerColumns + " FROM miners m WHERE m.miner_id = ?;");
    st.bind(1, miner_id);
    if (!st.step()) return std::nullopt;
    return read_miner(st, 0);
}

std::optional<MinerStatus> MinerRepository::get_status(const std::string& miner_id) {
    auto guard = db_.lock();
    auto st = db_.prepare(std::string("SELECT ") + kStatusColumns + " FROM miner_status s WHERE s.miner_id = ?;");
    st.bind(1, miner_id);
    if (!st.step()) return std::nullopt;
    return read_status(st, 0);
}

std::vector<PoolMiner> MinerRepository::iter_miners() {
    auto guard = db_.lock();
    auto st = db_.prepare(std::string("SELECT ") + kMinerColumns + " FROM miners m ORDER BY m.seq;");
    std::vector<PoolMiner> out;
    while (st.step()) out.push_back(read_miner(st, 0));
    return out;
}

std::vector<ActiveMiner> MinerRepository::list_active_miners() {
    int64_t cutoff = clock_() - (int64_t)settings_.cache_ttl_seconds() * 1000;
    auto guard = db_.lock();
    auto st = db_.prepare(std::string("SELECT ") + kMinerColumns + ", " + kStatusColumns +
                          " FROM miners m LEFT JOIN miner_status s ON s.miner_id = m.miner_id "
                          "WHERE m.last_seen_at > ? ORDER BY m.seq;");
    st.bind(1, cutoff);
    std::vector<ActiveMiner> out;
    while (st.step()) {
        ActiveMiner am;
        am.miner = read_miner(st, 0);
        if (!st.is_null(kMinerColumnCount)) am.status = read_status(st, kMinerColumnCount);
        am.score = score(am.miner, am.status);
        out.push_back(std::move(am));
    }
    return out;
}

int64_t MinerRepository::count_active() {
    int64_t cutoff = clock_() - (int64_t)settings_.cache_ttl_seconds() * 1000;
    auto guard = db_.lock();
    auto st = db_.prepare("SELECT COUNT(*) FROM miners WHERE last_seen_at > ?;");
    st.bind(1, cutoff);
    st.step();
    return st.int64(0);
}

double MinerRepository::score(const PoolMiner& miner, const std::optional<MinerStatus>& status) const {
    return compute_score(miner, status, settings_.weights, settings_.latency_ref_ms);
}

bool MinerRepository::sync_miner_to_cache(const std::string& miner_id) {
    auto miner = get_miner(miner_id);
    if (!miner) return false;
    auto status = get_status(miner_id);

    std::map<std::string, std::string> payload = {
        {"miner_id", miner->miner_id},
        {"addr", miner->addr},
        {"proto", miner->proto},
        {"region", miner->region.value_or("")},
        {"gpu_vram_gb", std::to_string(miner->gpu_vram_gb)},
        {"ram_gb", std::to_string(miner->ram_gb)},
        {"max_parallel", std::to_string(miner->max_parallel)},
        {"base_price", std::to_string(miner->base_price)},
        {"trust_score", std::to_string(miner->trust_score)},
        {"queue_len", std::to_string(status ? status->queue_len : 0)},
        {"busy", (status && status->busy) ? "true" : "false"},
    };
    double s = score(*miner, status);
    long long ttl = settings_.cache_ttl_seconds();

    // The database lock is released here; cache calls never run under it.
    try {
        std::string hash_key = redis_keys::miner_hash(miner_id);
        cache_.hset(hash_key, payload);
        cache_.expire(hash_key, ttl);

        std::string ranking_key = redis_keys::miner_rankings(miner->region);
        cache_.zadd(ranking_key, miner_id, s);
        cache_.expire(ranking_key, ttl);
        if (ranking_key != redis_keys::global_rankings()) {
            cache_.zadd(redis_keys::global_rankings(), miner_id, s);
            cache_.expire(redis_keys::global_rankings(), ttl);
        }
        cache_.zadd(redis_keys::miner_last_seen(), miner_id, (double)miner->last_seen_at);
        cache_.expire(redis_keys::miner_last_seen(), ttl);
    } catch (const std::exception& e) {
        metrics_.cache_mirror_failures++;
        std::cerr << "[pool-hub] cache mirror failed for miner " << miner_id << ": " << e.what() << std::endl;
        return false;
    }
    prune_stale_rankings();
    return true;
}

void MinerRepository::drop_from_rankings(const std::string& miner_id, const std::optional<std::string>& region) {
    cache_.zrem(redis_keys::miner_rankings(region), miner_id);
    cache_.zrem(redis_keys::global_rankings(), miner_id);
    cache_.zrem(redis_keys::miner_last_seen(), miner_id);
}

std::size_t MinerRepository::prune_stale_rankings() {
    int64_t cutoff = clock_() - (int64_t)settings_.cache_ttl_seconds() * 1000;
    std::vector<std::string> stale;
    try {
        stale = cache_.zrangebyscore_upto(redis_keys::miner_last_seen(), (double)cutoff);
    } catch (const std::exception& e) {
        metrics_.cache_mirror_failures++;
        std::cerr << "[pool-hub] failed to read miner last-seen set: " << e.what() << std::endl;
        return 0;
    }
    std::size_t dropped = 0;
    for (const auto& id : stale) {
        auto miner = get_miner(id);
        // A miner seen again whose mirror failed stays ranked until its next sync.
        if (miner && miner->last_seen_at > cutoff) continue;
        try {
            drop_from_rankings(id, miner ? miner->region : std::nullopt);
            ++dropped;
        } catch (const std::exception& e) {
            metrics_.cache_mirror_failures++;
            std::cerr << "[pool-hub] failed to drop stale miner " << id << " from rankings: " << e.what() << std::endl;
        }
    }
    return dropped;
}
