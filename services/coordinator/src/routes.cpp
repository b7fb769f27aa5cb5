#include "../include/routes.hpp"
#include "errors.hpp"
#include <iostream>
#include <limits>

using json = nlohmann::json;

static json parse_body(const HttpRequest& req) {
    if (req.body.empty()) return json::object();
    auto j = json::parse(req.body);
    if (!j.is_object()) throw ValidationError("request body must be a JSON object");
    return j;
}

static std::string require_header(const HttpRequest& req, const char* name) {
    std::string v = req.header(name);
    if (v.empty()) throw ValidationError(std::string(name) + " header required");
    return v;
}

static int int_field(const json& body, const char* key, int def) {
    if (!body.contains(key) || body[key].is_null()) return def;
    const json& v = body[key];
    if (!v.is_number_integer()) throw ValidationError(std::string(key) + " must be an integer");
    bool fits = v.is_number_unsigned()
        ? v.get<uint64_t>() <= (uint64_t)std::numeric_limits<int>::max()
        : v.get<int64_t>() >= std::numeric_limits<int>::min() && v.get<int64_t>() <= std::numeric_limits<int>::max();
    if (!fits) throw ValidationError(std::string(key) + " is out of range");
    return v.get<int>();
}

static HttpResponse create_job(CoordinatorContext& ctx, const HttpRequest& req) {
    std::string client_id = require_header(req, "X-Client-Id");
    json body = parse_body(req);
    if (!body.contains("payload") || !body["payload"].is_object()) {
        throw ValidationError("payload must be an object");
    }
    Constraints constraints = constraints_from_json(body.value("constraints", json::object()));
    int ttl = int_field(body, "ttl_seconds", ctx.default_ttl_seconds);
    Job job = ctx.jobs.create_job(client_id, body["payload"], constraints, ttl);
    return json_response(201, job_view(job));
}

static HttpResponse register_miner(CoordinatorContext& ctx, const HttpRequest& req) {
    std::string miner_id = require_header(req, "X-Miner-Id");
    json body = parse_body(req);
    MinerRegistration reg;
    reg.capabilities = capabilities_from_json(body.value("capabilities", json::object()));
    reg.concurrency = int_field(body, "concurrency", 1);
    if (body.contains("region") && body["region"].is_string()) reg.region = body["region"].get<std::string>();
    Miner m = ctx.miners.register_miner(miner_id, reg);
    std::cout << "[coordinator] miner " << miner_id << " registered (concurrency " << m.concurrency << ")" << std::endl;
    return json_response(200, {{"status", "ok"}, {"session_token", m.session_token}});
}

static HttpResponse heartbeat(CoordinatorContext& ctx, const HttpRequest& req) {
    std::string miner_id = require_header(req, "X-Miner-Id");
    json body = parse_body(req);
    MinerHeartbeat hb;
    hb.inflight = int_field(body, "inflight", 0);
    hb.status = body.value("status", std::string("ONLINE"));
    hb.metadata = body.value("metadata", json::object());
    ctx.miners.heartbeat(miner_id, hb);
    return json_response(200, {{"status", "ok"}});
}

static HttpResponse poll(CoordinatorContext& ctx, const HttpRequest& req) {
    std::string miner_id = require_header(req, "X-Miner-Id");
    json body = parse_body(req);
    int wait = int_field(body, "max_wait_seconds", 0);
    auto job = ctx.dispatcher.poll(miner_id, wait);
    if (!job) return no_content();
    return json_response(200, assigned_job_view(*job));
}

static HttpResponse submit_result(CoordinatorContext& ctx, const HttpRequest& req, const std::string& job_id) {
    std::string miner_id = require_header(req, "X-Miner-Id");
    json body = parse_body(req);
    Job job = ctx.dispatcher.submit_result(job_id, miner_id, body.value("result", json::object()),
                                           body.value("metrics", json::object()));
    return json_response(200, {{"status", "ok"}, {"job", job_view(job)}, {"receipt", nullptr}});
}

static HttpResponse submit_failure(CoordinatorContext& ctx, const HttpRequest& req, const std::string& job_id) {
    std::string miner_id = require_header(req, "X-Miner-Id");
    json body = parse_body(req);
    ctx.dispatcher.submit_failure(job_id, miner_id,
                                  body.value("error_code", std::string("ERROR")),
                                  body.value("error_message", std::string()),
                                  body.value("metrics", json::object()));
    return json_response(200, {{"status", "ok"}});
}

static HttpResponse stats(CoordinatorContext& ctx) {
    const auto& m = ctx.dispatcher.metrics();
    json out = {
        {"jobs", ctx.jobs.count_by_state()},
        {"miners_online", ctx.miners.online_count()},
        {"polls", m.polls.load()},
        {"polls_backpressure", m.backpressure.load()},
        {"jobs_assigned", m.assigned.load()},
        {"jobs_completed", m.completed.load()},
        {"jobs_failed", m.failed.load()},
        {"jobs_canceled", m.canceled.load()},
        {"rejected_callbacks", m.rejected_callbacks.load()},
        {"reaped_jobs", ctx.reaper ? ctx.reaper->total_expired() : 0},
        {"stale_miners", ctx.reaper ? ctx.reaper->total_stale() : 0}
    };
    return json_response(200, out);
}

HttpResponse handle_coordinator_request(CoordinatorContext& ctx, const HttpRequest& req) {
    return guarded([&]() -> HttpResponse {
        auto parts = split_path(req.path);
        const std::string& method = req.method;

        if (method == "POST" && parts.size() == 1 && parts[0] == "jobs") {
            return create_job(ctx, req);
        }
        if (method == "GET" && parts.size() == 2 && parts[0] == "jobs") {
            return json_response(200, job_view(ctx.jobs.get_job(parts[1], require_header(req, "X-Client-Id"))));
        }
        if (method == "GET" && parts.size() == 3 && parts[0] == "jobs" && parts[2] == "result") {
            Job job = ctx.jobs.get_job(parts[1], require_header(req, "X-Client-Id"));
            if (job.state != JobState::Completed) {
                throw ConflictError("job is " + to_string(job.state) + ", no result available");
            }
            return json_response(200, {{"result", job.result ? *job.result : json(nullptr)},
                                       {"receipt", job.receipt ? *job.receipt : json(nullptr)}});
        }
        if (method == "POST" && parts.size() == 3 && parts[0] == "jobs" && parts[2] == "cancel") {
            Job job = ctx.dispatcher.cancel_job(parts[1], require_header(req, "X-Client-Id"));
            return json_response(200, job_view(job));
        }
        if (method == "POST" && parts.size() == 2 && parts[0] == "miners") {
            if (parts[1] == "register") return register_miner(ctx, req);
            if (parts[1] == "heartbeat") return heartbeat(ctx, req);
            if (parts[1] == "poll") return poll(ctx, req);
        }
        if (method == "POST" && parts.size() == 3 && parts[0] == "miners") {
            if (parts[2] == "result") return submit_result(ctx, req, parts[1]);
            if (parts[2] == "fail") return submit_failure(ctx, req, parts[1]);
        }
        if (method == "GET" && parts.size() == 1 && parts[0] == "miners") {
            json arr = json::array();
            for (const auto& m : ctx.miners.list()) arr.push_back(miner_view(m));
            return json_response(200, {{"miners", arr}});
        }
        if (method == "GET" && parts.size() == 1 && parts[0] == "health") {
            bool db_ok = ctx.db.ping();
            json out = {{"status", db_ok ? "ok" : "degraded"}, {"db", db_ok ? "ok" : "error"}};
            out["miners_online"] = db_ok ? ctx.miners.online_count() : 0;
            return json_response(db_ok ? 200 : 503, out);
        }
        if (method == "GET" && parts.size() == 1 && parts[0] == "stats") {
            return stats(ctx);
        }
        return error_response(404, "NOT_FOUND", "not found");
    });
}
