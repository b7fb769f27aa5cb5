#include "../include/miner_registry.hpp"
#include "errors.hpp"
#include <algorithm>

using json = nlohmann::json;

static const char* kMinerColumns =
    "id, capabilities, concurrency, inflight, region, status, session_token, metadata, last_heartbeat, "
    "last_job_at, jobs_completed, jobs_failed, total_job_duration_ms, average_job_duration_ms, last_receipt_id";

MinerRegistry::MinerRegistry(Database& db, Clock clock) : db_(db), clock_(std::move(clock)) {
    init();
}

void MinerRegistry::init() {
    auto guard = db_.lock();
    db_.exec("CREATE TABLE IF NOT EXISTS miners (\n"
             "  id TEXT PRIMARY KEY,\n"
             "  capabilities TEXT NOT NULL,\n"
             "  concurrency INTEGER NOT NULL,\n"
             "  inflight INTEGER NOT NULL DEFAULT 0,\n"
             "  region TEXT,\n"
             "  status TEXT NOT NULL,\n"
             "  session_token TEXT NOT NULL,\n"
             "  metadata TEXT NOT NULL DEFAULT '{}',\n"
             "  last_heartbeat INTEGER NOT NULL,\n"
             "  last_job_at INTEGER,\n"
             "  jobs_completed INTEGER NOT NULL DEFAULT 0,\n"
             "  jobs_failed INTEGER NOT NULL DEFAULT 0,\n"
             "  total_job_duration_ms INTEGER NOT NULL DEFAULT 0,\n"
             "  average_job_duration_ms REAL NOT NULL DEFAULT 0,\n"
             "  last_receipt_id TEXT,\n"
             "  CHECK (inflight >= 0 AND inflight <= concurrency)\n"
             ");");
}

Miner MinerRegistry::read_row(const Statement& st) const {
    Miner m;
    m.id = st.text(0);
    m.capabilities = capabilities_from_json(json::parse(st.text(1)));
    m.concurrency = (int)st.int64(2);
    m.inflight = (int)st.int64(3);
    m.region = st.opt_text(4);
    m.status = st.text(5);
    m.session_token = st.text(6);
    m.metadata = json::parse(st.text(7));
    m.last_heartbeat = st.int64(8);
    m.last_job_at = st.opt_int64(9);
    m.jobs_completed = st.int64(10);
    m.jobs_failed = st.int64(11);
    m.total_job_duration_ms = st.int64(12);
    m.average_job_duration_ms = st.real(13);
    m.last_receipt_id = st.opt_text(14);
    return m;
}

std::optional<Miner> MinerRegistry::find(const std::string& miner_id) {
    auto guard = db_.lock();
    auto st = db_.prepare(std::string("SELECT ") + kMinerColumns + " FROM miners WHERE id = ?;");
    st.bind(1, miner_id);
    if (!st.step()) return std::nullopt;
    return read_row(st);
}

Miner MinerRegistry::get(const std::string& miner_id) {
    auto m = find(miner_id);
    if (!m) throw NotFoundError("miner not registered");
    return *m;
}

Miner MinerRegistry::register_miner(const std::string& miner_id, const MinerRegistration& reg) {
    if (miner_id.empty()) throw ValidationError("miner id required");
    if (reg.concurrency < 1) throw ValidationError("concurrency must be at least 1");
    auto guard = db_.lock();
    auto st = db_.prepare(
        "INSERT INTO miners (id, capabilities, concurrency, inflight, region, status, session_token, last_heartbeat) "
        "VALUES (?, ?, ?, 0, ?, 'ONLINE', ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET capabilities = excluded.capabilities, concurrency = excluded.concurrency, "
        "inflight = 0, region = excluded.region, status = 'ONLINE', session_token = excluded.session_token, "
        "last_heartbeat = excluded.last_heartbeat;");
    st.bind(1, miner_id).bind(2, to_json(reg.capabilities).dump()).bind(3, reg.concurrency)
      .bind(4, reg.region).bind(5, gen_id()).bind(6, clock_());
    st.run();
    return get(miner_id);
}

Miner MinerRegistry::heartbeat(const std::string& miner_id, const MinerHeartbeat& hb) {
    auto guard = db_.lock();
    Miner m = get(miner_id);
    int inflight = std::min(std::max(hb.inflight, 0), m.concurrency);
    auto st = db_.prepare("UPDATE miners SET inflight = ?, status = ?, metadata = ?, last_heartbeat = ? WHERE id = ?;");
    st.bind(1, inflight).bind(2, hb.status).bind(3, hb.metadata.dump()).bind(4, clock_()).bind(5, miner_id);
    st.run();
    return get(miner_id);
}

std::vector<Miner> MinerRegistry::list() {
    auto guard = db_.lock();
    auto st = db_.prepare(std::string("SELECT ") + kMinerColumns + " FROM miners ORDER BY id;");
    std::vector<Miner> out;
    while (st.step()) out.push_back(read_row(st));
    return out;
}

int64_t MinerRegistry::online_count() {
    auto guard = db_.lock();
    auto st = db_.prepare("SELECT COUNT(*) FROM miners WHERE status = 'ONLINE';");
    st.step();
    return st.int64(0);
}

bool MinerRegistry::try_acquire_slot(const std::string& miner_id) {
    auto guard = db_.lock();
    int64_t now = clock_();
    auto st = db_.prepare("UPDATE miners SET inflight = inflight + 1, last_job_at = ?, last_heartbeat = ?, "
                          "status = CASE WHEN status = 'OFFLINE' THEN 'ONLINE' ELSE status END "
                          "WHERE id = ? AND inflight < concurrency;");
    st.bind(1, now).bind(2, now).bind(3, miner_id);
    st.run();
    return db_.changes() == 1;
}

void MinerRegistry::release(const std::string& miner_id, std::optional<bool> success,
                            std::optional<int64_t> duration_ms, const std::optional<std::string>& receipt_id) {
    auto guard = db_.lock();
    auto found = find(miner_id);
    if (!found) return;
    Miner m = *found;
    m.inflight = std::max(0, m.inflight - 1);
    if (success && *success) {
        m.jobs_completed += 1;
        if (duration_ms) m.total_job_duration_ms += std::max<int64_t>(0, *duration_ms);
        m.average_job_duration_ms = (double)m.total_job_duration_ms / (double)m.jobs_completed;
    } else if (success) {
        m.jobs_failed += 1;
    }
    if (receipt_id) m.last_receipt_id = receipt_id;
    auto st = db_.prepare("UPDATE miners SET inflight = ?, jobs_completed = ?, jobs_failed = ?, "
                          "total_job_duration_ms = ?, average_job_duration_ms = ?, last_receipt_id = ? WHERE id = ?;");
    st.bind(1, m.inflight).bind(2, m.jobs_completed).bind(3, m.jobs_failed)
      .bind(4, m.total_job_duration_ms).bind(5, m.average_job_duration_ms)
      .bind(6, m.last_receipt_id).bind(7, miner_id);
    st.run();
}

void MinerRegistry::touch(const std::string& miner_id) {
    auto guard = db_.lock();
    auto st = db_.prepare("UPDATE miners SET last_heartbeat = ?, "
                          "status = CASE WHEN status = 'OFFLINE' THEN 'ONLINE' ELSE status END WHERE id = ?;");
    st.bind(1, clock_()).bind(2, miner_id);
    st.run();
}

std::size_t MinerRegistry::mark_stale(int64_t cutoff_ms) {
    auto guard = db_.lock();
    auto st = db_.prepare("UPDATE miners SET status = 'OFFLINE' WHERE status = 'ONLINE' AND last_heartbeat < ?;");
    st.bind(1, cutoff_ms);
    st.run();
    return (std::size_t)db_.changes();
}
