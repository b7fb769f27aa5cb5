#include "../include/hub_routes.hpp"
#include "errors.hpp"
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

static json parse_body(const HttpRequest& req) {
    if (req.body.empty()) return json::object();
    auto j = json::parse(req.body);
    if (!j.is_object()) throw ValidationError("request body must be a JSON object");
    return j;
}

template <typename T>
static std::optional<T> opt_field(const json& body, const char* key) {
    if (!body.contains(key) || body[key].is_null()) return std::nullopt;
    try {
        return body[key].get<T>();
    } catch (const json::exception&) {
        throw ValidationError(std::string(key) + " has the wrong type");
    }
}

static int limit_param(const HttpRequest& req, int def) {
    std::string v = req.query_param("limit");
    if (v.empty()) return def;
    try {
        int n = std::stoi(v);
        if (n < 1 || n > 500) throw ValidationError("limit must be between 1 and 500");
        return n;
    } catch (const std::logic_error&) {
        throw ValidationError("limit must be an integer");
    }
}

static HttpResponse register_miner(PoolHubContext& ctx, const HttpRequest& req) {
    json body = parse_body(req);
    std::string miner_id = opt_field<std::string>(body, "miner_id").value_or("");
    if (miner_id.empty()) throw ValidationError("miner_id is required");
    std::string api_key = req.header("X-Api-Key");
    if (api_key.empty()) api_key = opt_field<std::string>(body, "api_key").value_or("");
    if (api_key.empty()) throw ValidationError("api key is required");

    MinerRegistrationInput in;
    in.addr = opt_field<std::string>(body, "addr").value_or("");
    if (in.addr.empty()) throw ValidationError("addr is required");
    in.proto = opt_field<std::string>(body, "proto").value_or("http");
    in.gpu_vram_gb = opt_field<double>(body, "gpu_vram_gb").value_or(0.0);
    in.gpu_name = opt_field<std::string>(body, "gpu_name");
    in.cpu_cores = opt_field<int>(body, "cpu_cores").value_or(0);
    in.ram_gb = opt_field<double>(body, "ram_gb").value_or(0.0);
    in.max_parallel = opt_field<int>(body, "max_parallel").value_or(1);
    in.base_price = opt_field<double>(body, "base_price").value_or(0.0);
    in.tags = opt_field<std::map<std::string, std::string>>(body, "tags").value_or(std::map<std::string, std::string>{});
    in.capabilities = opt_field<std::vector<std::string>>(body, "capabilities").value_or(std::vector<std::string>{});
    in.region = opt_field<std::string>(body, "region");
    in.trust_score = opt_field<double>(body, "trust_score");

    PoolMiner m = ctx.miners.register_miner(miner_id, api_key, in);
    std::cout << "[pool-hub] miner " << miner_id << " registered at " << m.addr << std::endl;
    return json_response(200, to_json(m));
}

static HttpResponse update_status(PoolHubContext& ctx, const HttpRequest& req, const std::string& miner_id) {
    json body = parse_body(req);
    StatusUpdate u;
    u.queue_len = opt_field<int>(body, "queue_len");
    u.busy = opt_field<bool>(body, "busy");
    u.avg_latency_ms = opt_field<int64_t>(body, "avg_latency_ms");
    u.temp_c = opt_field<int>(body, "temp_c");
    u.mem_free_gb = opt_field<double>(body, "mem_free_gb");
    if (u.queue_len && *u.queue_len < 0) throw ValidationError("queue_len must be non-negative");
    ctx.miners.update_status(miner_id, u);
    auto status = ctx.miners.get_status(miner_id);
    return json_response(200, status ? to_json(*status) : json::object());
}

static HttpResponse get_miner(PoolHubContext& ctx, const std::string& miner_id) {
    auto m = ctx.miners.get_miner(miner_id);
    if (!m) throw NotFoundError("miner not found");
    json out = to_json(*m);
    auto status = ctx.miners.get_status(miner_id);
    out["status"] = status ? to_json(*status) : json(nullptr);
    out["score"] = ctx.miners.score(*m, status);
    return json_response(200, out);
}

static HttpResponse match(PoolHubContext& ctx, const HttpRequest& req) {
    json body = parse_body(req);
    std::string job_id = opt_field<std::string>(body, "job_id").value_or("");
    int top_k = opt_field<int>(body, "top_k").value_or(1);
    MatchResponse res = ctx.matcher.match(job_id, body.value("requirements", json::object()),
                                          body.value("hints", json::object()), top_k);
    return json_response(200, to_json(res));
}

static HttpResponse add_feedback(PoolHubContext& ctx, const HttpRequest& req) {
    json body = parse_body(req);
    FeedbackInput in;
    in.job_id = opt_field<std::string>(body, "job_id").value_or("");
    in.miner_id = opt_field<std::string>(body, "miner_id").value_or("");
    in.outcome = opt_field<std::string>(body, "outcome").value_or("");
    in.latency_ms = opt_field<int64_t>(body, "latency_ms");
    in.fail_code = opt_field<std::string>(body, "fail_code");
    in.tokens_spent = opt_field<double>(body, "tokens_spent");
    Feedback f = ctx.feedback.add_feedback(in);
    return json_response(201, to_json(f));
}

static json list_json(const std::vector<Feedback>& rows) {
    json arr = json::array();
    for (const auto& f : rows) arr.push_back(to_json(f));
    return arr;
}

static HttpResponse health(PoolHubContext& ctx) {
    bool db_ok = ctx.db.ping();
    bool redis_ok = false;
    try {
        redis_ok = ctx.cache.ping();
    } catch (const std::exception& e) {
        std::cerr << "[pool-hub] cache ping failed: " << e.what() << std::endl;
    }
    json out = {
        {"status", db_ok && redis_ok ? "ok" : "degraded"},
        {"db", db_ok},
        {"redis", redis_ok},
        {"miners_online", db_ok ? ctx.miners.count_active() : 0}
    };
    return json_response(200, out);
}

HttpResponse handle_pool_hub_request(PoolHubContext& ctx, const HttpRequest& req) {
    return guarded([&]() -> HttpResponse {
        auto parts = split_path(req.path);
        const std::string& method = req.method;

        if (method == "POST" && parts.size() == 2 && parts[0] == "miners" && parts[1] == "register") {
            return register_miner(ctx, req);
        }
        if (method == "POST" && parts.size() == 3 && parts[0] == "miners") {
            if (parts[2] == "status") return update_status(ctx, req, parts[1]);
            if (parts[2] == "heartbeat") {
                if (!ctx.miners.touch_heartbeat(parts[1])) throw NotFoundError("miner not found");
                return json_response(200, {{"status", "ok"}});
            }
        }
        if (method == "GET" && parts.size() == 2 && parts[0] == "miners") {
            return get_miner(ctx, parts[1]);
        }
        if (method == "GET" && parts.size() == 3 && parts[0] == "miners" && parts[2] == "feedback") {
            return json_response(200, {{"miner_id", parts[1]},
                                       {"feedback", list_json(ctx.feedback.list_feedback_for_miner(parts[1], limit_param(req, 50)))}});
        }
        if (method == "POST" && parts.size() == 1 && parts[0] == "match") {
            return match(ctx, req);
        }
        if (method == "GET" && parts.size() == 3 && parts[0] == "match" && parts[2] == "results") {
            json arr = json::array();
            for (const auto& r : ctx.matches.list_results_for_job(parts[1], limit_param(req, 10))) arr.push_back(to_json(r));
            return json_response(200, {{"job_id", parts[1]}, {"results", arr}});
        }
        if (method == "POST" && parts.size() == 1 && parts[0] == "feedback") {
            return add_feedback(ctx, req);
        }
        if (method == "GET" && parts.size() == 1 && parts[0] == "health") {
            return health(ctx);
        }
        if (method == "GET" && parts.size() == 1 && parts[0] == "stats") {
            return json_response(200, ctx.metrics.to_json());
        }
        return error_response(404, "NOT_FOUND", "not found");
    });
}
