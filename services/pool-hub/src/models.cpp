#include "../include/models.hpp"
#include "util.hpp"

using json = nlohmann::json;

template <typename T>
static json opt(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

json to_json(const PoolMiner& m) {
    return {
        {"miner_id", m.miner_id},
        {"addr", m.addr},
        {"proto", m.proto},
        {"gpu_vram_gb", m.gpu_vram_gb},
        {"gpu_name", opt(m.gpu_name)},
        {"cpu_cores", m.cpu_cores},
        {"ram_gb", m.ram_gb},
        {"max_parallel", m.max_parallel},
        {"base_price", m.base_price},
        {"tags", m.tags},
        {"capabilities", m.capabilities},
        {"trust_score", m.trust_score},
        {"region", opt(m.region)},
        {"last_seen_at", format_timestamp(m.last_seen_at)}
    };
}

json to_json(const MinerStatus& s) {
    return {
        {"queue_len", s.queue_len},
        {"busy", s.busy},
        {"avg_latency_ms", opt(s.avg_latency_ms)},
        {"temp_c", opt(s.temp_c)},
        {"mem_free_gb", opt(s.mem_free_gb)},
        {"updated_at", format_timestamp(s.updated_at)}
    };
}

json to_json(const MatchCandidate& c) {
    return {
        {"miner_id", c.miner_id},
        {"addr", c.addr},
        {"proto", c.proto},
        {"score", c.score},
        {"explain", c.explain},
        {"eta_ms", opt(c.eta_ms)},
        {"price", c.price}
    };
}

json to_json(const MatchResult& r) {
    return {
        {"request_id", r.request_id},
        {"miner_id", r.miner_id},
        {"score", r.score},
        {"explain", opt(r.explain)},
        {"eta_ms", opt(r.eta_ms)},
        {"price", opt(r.price)},
        {"created_at", format_timestamp(r.created_at)}
    };
}

json to_json(const Feedback& f) {
    return {
        {"job_id", f.job_id},
        {"miner_id", f.miner_id},
        {"outcome", f.outcome},
        {"latency_ms", opt(f.latency_ms)},
        {"fail_code", opt(f.fail_code)},
        {"tokens_spent", opt(f.tokens_spent)},
        {"created_at", format_timestamp(f.created_at)}
    };
}
