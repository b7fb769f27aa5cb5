#include "../include/job_store.hpp"
#include "errors.hpp"
#include <algorithm>

using json = nlohmann::json;

static const char* kJobColumns =
    "id, client_id, state, payload, constraints, ttl_seconds, requested_at, expires_at, "
    "assigned_miner_id, result, receipt, error";

JobStore::JobStore(Database& db, Clock clock) : db_(db), clock_(std::move(clock)) {
    init();
}

void JobStore::init() {
    auto guard = db_.lock();
    db_.exec("CREATE TABLE IF NOT EXISTS jobs (\n"
             "  id TEXT PRIMARY KEY,\n"
             "  client_id TEXT NOT NULL,\n"
             "  state TEXT NOT NULL,\n"
             "  payload TEXT NOT NULL,\n"
             "  constraints TEXT NOT NULL,\n"
             "  ttl_seconds INTEGER NOT NULL,\n"
             "  requested_at INTEGER NOT NULL,\n"
             "  expires_at INTEGER NOT NULL,\n"
             "  assigned_miner_id TEXT,\n"
             "  result TEXT,\n"
             "  receipt TEXT,\n"
             "  error TEXT,\n"
             "  seq INTEGER NOT NULL\n"
             ");");
    db_.exec("CREATE INDEX IF NOT EXISTS idx_jobs_state_requested ON jobs(state, requested_at, seq);");
    db_.exec("CREATE INDEX IF NOT EXISTS idx_jobs_client ON jobs(client_id);");
    db_.exec("CREATE INDEX IF NOT EXISTS idx_jobs_miner ON jobs(assigned_miner_id);");
}

Job JobStore::read_row(const Statement& st) const {
    Job j;
    j.id = st.text(0);
    j.client_id = st.text(1);
    j.state = job_state_from_string(st.text(2));
    j.payload = json::parse(st.text(3));
    j.constraints = constraints_from_json(json::parse(st.text(4)));
    j.ttl_seconds = (int)st.int64(5);
    j.requested_at = st.int64(6);
    j.expires_at = st.int64(7);
    j.assigned_miner_id = st.opt_text(8);
    if (auto r = st.opt_text(9)) j.result = json::parse(*r);
    if (auto r = st.opt_text(10)) j.receipt = json::parse(*r);
    j.error = st.opt_text(11);
    return j;
}

Job JobStore::create_job(const std::string& client_id, json payload, Constraints constraints, int ttl_seconds) {
    if (client_id.empty()) throw ValidationError("client id required");
    if (!payload.is_object()) throw ValidationError("payload must be an object");
    int ttl = std::max(ttl_seconds, 1);
    Job job;
    job.id = gen_id();
    job.client_id = client_id;
    job.state = JobState::Queued;
    job.payload = std::move(payload);
    job.constraints = std::move(constraints);
    job.ttl_seconds = ttl;
    job.requested_at = clock_();
    job.expires_at = job.requested_at + (int64_t)ttl * 1000;

    auto guard = db_.lock();
    auto st = db_.prepare(std::string("INSERT INTO jobs (") + kJobColumns + ", seq) "
                          "VALUES (?, ?, ?, ?, ?, ?, ?, ?, NULL, NULL, NULL, NULL, "
                          "(SELECT COALESCE(MAX(seq), 0) + 1 FROM jobs));");
    st.bind(1, job.id).bind(2, job.client_id).bind(3, to_string(job.state))
      .bind(4, job.payload.dump()).bind(5, to_json(job.constraints).dump())
      .bind(6, job.ttl_seconds).bind(7, job.requested_at).bind(8, job.expires_at);
    st.run();
    return job;
}

std::optional<Job> JobStore::find(const std::string& id) {
    auto guard = db_.lock();
    auto st = db_.prepare(std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id = ?;");
    st.bind(1, id);
    if (!st.step()) return std::nullopt;
    return read_row(st);
}

Job JobStore::load(const std::string& id) {
    auto job = find(id);
    if (!job) throw NotFoundError("job not found");
    return *job;
}

Job JobStore::get_job(const std::string& id, const std::optional<std::string>& client_id) {
    auto job = find(id);
    if (!job || (client_id && job->client_id != *client_id)) {
        throw NotFoundError("job not found");
    }
    return ensure_not_expired(std::move(*job));
}

bool JobStore::transition(const std::string& id, JobState from, JobState to, const std::optional<std::string>& error) {
    if (!can_transition(from, to)) return false;
    auto guard = db_.lock();
    auto st = db_.prepare("UPDATE jobs SET state = ?, error = ? WHERE id = ? AND state = ?;");
    st.bind(1, to_string(to)).bind(2, error).bind(3, id).bind(4, to_string(from));
    st.run();
    return db_.changes() == 1;
}

Job JobStore::ensure_not_expired(Job job) {
    if (job.state == JobState::Queued && clock_() >= job.expires_at) {
        // Losing the race means someone assigned or canceled it first; reload.
        if (transition(job.id, JobState::Queued, JobState::Expired, std::string("job expired"))) {
            job.state = JobState::Expired;
            job.error = "job expired";
        } else {
            return load(job.id);
        }
    }
    return job;
}

std::vector<Job> JobStore::list_queued() {
    auto guard = db_.lock();
    auto st = db_.prepare(std::string("SELECT ") + kJobColumns +
                          " FROM jobs WHERE state = 'QUEUED' ORDER BY requested_at ASC, seq ASC;");
    std::vector<Job> out;
    while (st.step()) out.push_back(read_row(st));
    return out;
}

bool JobStore::try_assign(const std::string& job_id, const std::string& miner_id) {
    auto guard = db_.lock();
    auto st = db_.prepare("UPDATE jobs SET state = 'RUNNING', assigned_miner_id = ? "
                          "WHERE id = ? AND state = 'QUEUED' AND assigned_miner_id IS NULL AND expires_at > ?;");
    st.bind(1, miner_id).bind(2, job_id).bind(3, clock_());
    st.run();
    return db_.changes() == 1;
}

Job JobStore::complete_job(const std::string& id, const std::string& miner_id,
                           const json& result, const std::optional<json>& receipt) {
    auto guard = db_.lock();
    auto st = db_.prepare("UPDATE jobs SET state = 'COMPLETED', result = ?, receipt = ?, error = NULL "
                          "WHERE id = ? AND state = 'RUNNING' AND assigned_miner_id = ?;");
    st.bind(1, result.dump());
    if (receipt) st.bind(2, receipt->dump()); else st.bind_null(2);
    st.bind(3, id).bind(4, miner_id);
    st.run();
    if (db_.changes() != 1) {
        Job current = load(id);
        throw ConflictError("job " + id + " is " + to_string(current.state) + " and not running on this miner");
    }
    return load(id);
}

Job JobStore::fail_job(const std::string& id, const std::string& miner_id, const std::string& error) {
    auto guard = db_.lock();
    auto st = db_.prepare("UPDATE jobs SET state = 'FAILED', error = ? "
                          "WHERE id = ? AND state = 'RUNNING' AND assigned_miner_id = ?;");
    st.bind(1, error).bind(2, id).bind(3, miner_id);
    st.run();
    if (db_.changes() != 1) {
        Job current = load(id);
        throw ConflictError("job " + id + " is " + to_string(current.state) + " and not running on this miner");
    }
    return load(id);
}

Job JobStore::cancel_job(const std::string& id, const std::string& client_id) {
    auto guard = db_.lock();
    Job job = get_job(id, client_id);
    if (job.state != JobState::Queued && job.state != JobState::Running) {
        throw ConflictError("job is " + to_string(job.state) + " and cannot be canceled");
    }
    if (!transition(id, job.state, JobState::Canceled, std::string("canceled by client"))) {
        throw ConflictError("job changed state while canceling");
    }
    job.state = JobState::Canceled;
    job.error = "canceled by client";
    return job;
}

std::size_t JobStore::expire_due() {
    auto guard = db_.lock();
    auto st = db_.prepare("UPDATE jobs SET state = 'EXPIRED', error = 'job expired' "
                          "WHERE state = 'QUEUED' AND expires_at <= ?;");
    st.bind(1, clock_());
    st.run();
    return (std::size_t)db_.changes();
}

std::map<std::string, int64_t> JobStore::count_by_state() {
    auto guard = db_.lock();
    auto st = db_.prepare("SELECT state, COUNT(*) FROM jobs GROUP BY state;");
    std::map<std::string, int64_t> out;
    while (st.step()) out[st.text(0)] = st.int64(1);
    return out;
}
