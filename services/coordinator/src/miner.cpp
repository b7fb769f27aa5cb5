#include "../include/miner.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <unordered_set>

using json = nlohmann::json;

bool Capabilities::satisfies(const Constraints& c) const {
    if (c.gpu) {
        bool found = std::any_of(gpus.begin(), gpus.end(), [&](const GpuSpec& g){ return g.name == *c.gpu; });
        if (!found) return false;
    }
    if (c.min_vram_gb && *c.min_vram_gb > 0) {
        int64_t required_mb = (int64_t)*c.min_vram_gb * 1024;
        int64_t best = 0;
        for (const auto& g : gpus) best = std::max(best, g.memory_mb);
        if (best < required_mb) return false;
    }
    if (c.cuda && !c.cuda->empty()) {
        if (!cuda || cuda->find(*c.cuda) == std::string::npos) return false;
    }
    if (c.models && !c.models->empty()) {
        std::unordered_set<std::string> have(models.begin(), models.end());
        for (const auto& m : *c.models) {
            if (!have.count(m)) return false;
        }
    }
    if (c.max_price) {
        if (!price || *price > *c.max_price) return false;
    }
    return true;
}

bool Miner::satisfies(const Constraints& c) const {
    if (c.region && !c.region->empty()) {
        if (!region || *region != *c.region) return false;
    }
    return capabilities.satisfies(c);
}

Capabilities capabilities_from_json(const json& j) {
    Capabilities caps;
    if (j.is_null()) return caps;
    if (!j.is_object()) throw ValidationError("capabilities must be an object");
    if (j.contains("gpus") && !j["gpus"].is_null()) {
        if (!j["gpus"].is_array()) throw ValidationError("capabilities.gpus must be a list");
        for (const auto& g : j["gpus"]) {
            if (!g.is_object()) throw ValidationError("capabilities.gpus entries must be objects");
            GpuSpec spec;
            spec.name = g.value("name", std::string());
            if (g.contains("memory_mb") && g["memory_mb"].is_number()) {
                spec.memory_mb = g["memory_mb"].get<int64_t>();
            }
            caps.gpus.push_back(std::move(spec));
        }
    }
    if (j.contains("cuda") && !j["cuda"].is_null()) {
        // Accept "12.2" as well as 12.2
        caps.cuda = j["cuda"].is_string() ? j["cuda"].get<std::string>() : j["cuda"].dump();
    }
    if (j.contains("models") && !j["models"].is_null()) {
        if (!j["models"].is_array()) throw ValidationError("capabilities.models must be a list");
        for (const auto& m : j["models"]) caps.models.push_back(m.get<std::string>());
    }
    if (j.contains("price") && !j["price"].is_null()) {
        const auto& p = j["price"];
        if (p.is_number()) {
            caps.price = p.get<double>();
        } else if (p.is_string()) {
            try {
                caps.price = std::stod(p.get<std::string>());
            } catch (const std::exception&) {
                throw ValidationError("capabilities.price is not a number");
            }
        } else {
            throw ValidationError("capabilities.price is not a number");
        }
    }
    return caps;
}

json to_json(const Capabilities& caps) {
    json gpus = json::array();
    for (const auto& g : caps.gpus) gpus.push_back({{"name", g.name}, {"memory_mb", g.memory_mb}});
    json j = {{"gpus", gpus}, {"models", caps.models}};
    if (caps.cuda) j["cuda"] = *caps.cuda;
    if (caps.price) j["price"] = *caps.price;
    return j;
}

json miner_view(const Miner& m) {
    return {
        {"miner_id", m.id},
        {"status", m.status},
        {"region", m.region ? json(*m.region) : json(nullptr)},
        {"capabilities", to_json(m.capabilities)},
        {"concurrency", m.concurrency},
        {"inflight", m.inflight},
        {"last_heartbeat", format_timestamp(m.last_heartbeat)},
        {"jobs_completed", m.jobs_completed},
        {"jobs_failed", m.jobs_failed},
        {"average_job_duration_ms", m.average_job_duration_ms},
        {"metadata", m.metadata}
    };
}
