#include "../include/match_repository.hpp"
#include "../include/redis_keys.hpp"
#include "errors.hpp"
#include <iostream>

using json = nlohmann::json;

MatchRepository::MatchRepository(Database& db, CacheBackend& cache, const PoolHubSettings& settings,
                                 PoolHubMetrics& metrics, Clock clock)
    : db_(db), cache_(cache), settings_(settings), metrics_(metrics), clock_(std::move(clock)) {
    init();
}

void MatchRepository::init() {
    auto guard = db_.lock();
    db_.exec("CREATE TABLE IF NOT EXISTS match_requests (\n"
             "  id TEXT PRIMARY KEY,\n"
             "  job_id TEXT NOT NULL,\n"
             "  requirements TEXT NOT NULL,\n"
             "  hints TEXT NOT NULL DEFAULT '{}',\n"
             "  top_k INTEGER NOT NULL DEFAULT 1,\n"
             "  created_at INTEGER NOT NULL,\n"
             "  seq INTEGER NOT NULL\n"
             ");");
    db_.exec("CREATE TABLE IF NOT EXISTS match_results (\n"
             "  id TEXT PRIMARY KEY,\n"
             "  request_id TEXT NOT NULL REFERENCES match_requests(id) ON DELETE CASCADE,\n"
             "  miner_id TEXT NOT NULL,\n"
             "  score REAL NOT NULL,\n"
             "  explain TEXT,\n"
             "  eta_ms INTEGER,\n"
             "  price REAL,\n"
             "  created_at INTEGER NOT NULL,\n"
             "  rank INTEGER NOT NULL\n"
             ");");
    db_.exec("CREATE INDEX IF NOT EXISTS idx_match_requests_job ON match_requests(job_id);");
    db_.exec("CREATE INDEX IF NOT EXISTS idx_match_results_request ON match_results(request_id);");
}

MatchRequest MatchRepository::read_request(const Statement& st) const {
    MatchRequest r;
    r.id = st.text(0);
    r.job_id = st.text(1);
    r.requirements = json::parse(st.text(2));
    r.hints = json::parse(st.text(3));
    r.top_k = (int)st.int64(4);
    r.created_at = st.int64(5);
    return r;
}

MatchResult MatchRepository::read_result(const Statement& st) const {
    MatchResult r;
    r.id = st.text(0);
    r.request_id = st.text(1);
    r.miner_id = st.text(2);
    r.score = st.real(3);
    r.explain = st.opt_text(4);
    r.eta_ms = st.opt_int64(5);
    r.price = st.opt_real(6);
    r.created_at = st.int64(7);
    return r;
}

MatchRequest MatchRepository::create_request(const std::string& job_id, const json& requirements,
                                             const json& hints, int top_k, bool enqueue) {
    MatchRequest req;
    req.id = gen_id();
    req.job_id = job_id;
    req.requirements = requirements.is_null() ? json::object() : requirements;
    req.hints = hints.is_null() ? json::object() : hints;
    req.top_k = top_k;
    req.created_at = clock_();
    {
        auto guard = db_.lock();
        auto st = db_.prepare("INSERT INTO match_requests (id, job_id, requirements, hints, top_k, created_at, seq) "
                              "VALUES (?, ?, ?, ?, ?, ?, (SELECT COALESCE(MAX(seq), 0) + 1 FROM match_requests));");
        st.bind(1, req.id).bind(2, req.job_id).bind(3, req.requirements.dump()).bind(4, req.hints.dump())
          .bind(5, req.top_k).bind(6, req.created_at);
        st.run();
    }
    if (enqueue) {
        json payload = {
            {"request_id", req.id},
            {"job_id", req.job_id},
            {"requirements", req.requirements},
            {"hints", req.hints},
            {"top_k", req.top_k}
        };
        try {
            cache_.rpush(redis_keys::match_requests(), {payload.dump()});
            cache_.ltrim_tail(redis_keys::match_requests(), settings_.match_request_backlog);
        } catch (const std::exception& e) {
            metrics_.cache_mirror_failures++;
            std::cerr << "[pool-hub] failed to queue match request " << req.id << ": " << e.what() << std::endl;
        }
    }
    return req;
}

std::vector<MatchResult> MatchRepository::add_results(const std::string& request_id,
                                                      const std::vector<MatchCandidate>& candidates, bool publish) {
    std::vector<MatchResult> results;
    std::string job_id;
    int64_t created_at = clock_();
    {
        Transaction tx(db_);
        auto req = get_request(request_id);
        if (!req) throw NotFoundError("match request not found");
        job_id = req->job_id;
        int rank = 0;
        for (const auto& c : candidates) {
            MatchResult r;
            r.id = gen_id();
            r.request_id = request_id;
            r.miner_id = c.miner_id;
            r.score = c.score;
            r.explain = c.explain;
            r.eta_ms = c.eta_ms;
            r.price = c.price;
            r.created_at = created_at;
            auto st = db_.prepare("INSERT INTO match_results (id, request_id, miner_id, score, explain, eta_ms, price, "
                                  "created_at, rank) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
            st.bind(1, r.id).bind(2, r.request_id).bind(3, r.miner_id).bind(4, r.score).bind(5, r.explain)
              .bind(6, r.eta_ms).bind(7, r.price).bind(8, r.created_at).bind(9, rank++);
            st.run();
            results.push_back(std::move(r));
        }
        tx.commit();
    }
    if (!publish) return results;

    std::vector<std::string> payloads;
    for (const auto& r : results) payloads.push_back(to_json(r).dump());
    std::string key = redis_keys::match_results(job_id);
    try {
        cache_.del(key);
        if (!payloads.empty()) {
            cache_.rpush(key, payloads);
            cache_.expire(key, settings_.match_results_ttl_seconds);
        }
    } catch (const std::exception& e) {
        metrics_.cache_mirror_failures++;
        std::cerr << "[pool-hub] failed to mirror match results for job " << job_id << ": " << e.what() << std::endl;
    }
    std::string channel = redis_keys::match_results_channel(job_id);
    for (const auto& p : payloads) {
        try {
            cache_.publish(channel, p);
        } catch (const std::exception& e) {
            metrics_.publish_failures++;
            std::cerr << "[pool-hub] failed to publish match result for job " << job_id << ": " << e.what() << std::endl;
        }
    }
    return results;
}

std::optional<MatchRequest> MatchRepository::get_request(const std::string& request_id) {
    auto guard = db_.lock();
    auto st = db_.prepare("SELECT id, job_id, requirements, hints, top_k, created_at FROM match_requests WHERE id = ?;");
    st.bind(1, request_id);
    if (!st.step()) return std::nullopt;
    return read_request(st);
}

std::vector<MatchRequest> MatchRepository::list_recent_requests(int limit) {
    auto guard = db_.lock();
    auto st = db_.prepare("SELECT id, job_id, requirements, hints, top_k, created_at FROM match_requests "
                          "ORDER BY created_at DESC, seq DESC LIMIT ?;");
    st.bind(1, limit);
    std::vector<MatchRequest> out;
    while (st.step()) out.push_back(read_request(st));
    return out;
}

std::vector<MatchResult> MatchRepository::list_results_for_job(const std::string& job_id, int limit) {
    auto guard = db_.lock();
    auto st = db_.prepare("SELECT r.id, r.request_id, r.miner_id, r.score, r.explain, r.eta_ms, r.price, r.created_at "
                          "FROM match_results r JOIN match_requests q ON q.id = r.request_id "
                          "WHERE q.job_id = ? ORDER BY q.seq DESC, r.rank ASC LIMIT ?;");
    st.bind(1, job_id).bind(2, limit);
    std::vector<MatchResult> out;
    while (st.step()) out.push_back(read_result(st));
    return out;
}
