#include <iostream>
#include <thread>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "miner_client.hpp"

using json = nlohmann::json;

static std::string getenv_or(const char* k, const std::string& def) {
    const char* v = std::getenv(k);
    return v ? std::string(v) : def;
}

// Reference workload: echo the payload back.
static json process_job(const AssignedJob& job) {
    if (!job.payload.is_object()) throw std::runtime_error("payload must be an object");
    std::cout << "[miner-worker] Processing job " << job.job_id << " with keys: ";
    bool first = true;
    for (auto it = job.payload.begin(); it != job.payload.end(); ++it) {
        if (!first) std::cout << ", ";
        std::cout << it.key();
        first = false;
    }
    std::cout << std::endl;
    return {{"echo", job.payload}};
}

int main(int argc, char** argv) {
    std::string coordinator_url = getenv_or("COORDINATOR_URL", "http://localhost:8011");
    std::string miner_id = getenv_or("MINER_ID", "miner-local");
    std::string region = getenv_or("MINER_REGION", "");
    std::string gpu = getenv_or("MINER_GPU", "");
    int vram_mb = 0;
    int concurrency = 1;
    int wait_seconds = 10;
    bool once = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--once") once = true;
        else if (a == "--url" && i + 1 < argc) coordinator_url = argv[++i];
        else if (a == "--id" && i + 1 < argc) miner_id = argv[++i];
        else if (a == "--region" && i + 1 < argc) region = argv[++i];
        else if (a == "--gpu" && i + 1 < argc) gpu = argv[++i];
        else if (a == "--vram-mb" && i + 1 < argc) vram_mb = std::stoi(argv[++i]);
        else if (a == "--concurrency" && i + 1 < argc) concurrency = std::stoi(argv[++i]);
        else if (a == "--wait" && i + 1 < argc) wait_seconds = std::stoi(argv[++i]);
    }

    json caps = {{"gpus", json::array()}, {"models", json::array()}};
    if (!gpu.empty()) caps["gpus"].push_back({{"name", gpu}, {"memory_mb", vram_mb}});
    std::string cuda = getenv_or("MINER_CUDA", "");
    if (!cuda.empty()) caps["cuda"] = cuda;

    MinerClient client(coordinator_url, miner_id);
    std::cout << "[miner-worker] Starting. COORDINATOR_URL=" << coordinator_url << " id=" << miner_id
              << (once ? " once" : " loop") << std::endl;
    if (!client.register_miner(caps, concurrency, region)) {
        std::cerr << "[miner-worker] Registration failed" << std::endl;
        return 1;
    }

    int inflight = 0;
    do {
        if (!client.heartbeat(inflight)) {
            std::cerr << "[miner-worker] Heartbeat failed" << std::endl;
        }
        std::optional<AssignedJob> job;
        try {
            job = client.poll(once ? 0 : wait_seconds);
        } catch (const std::exception& e) {
            std::cerr << "[miner-worker] Malformed poll response: " << e.what() << std::endl;
        }
        if (!job) {
            if (!once) std::this_thread::sleep_for(std::chrono::seconds(1));
            continue;
        }
        ++inflight;
        auto started = std::chrono::steady_clock::now();
        try {
            json result = process_job(*job);
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count();
            if (!client.submit_result(job->job_id, result, {{"duration_ms", elapsed}})) {
                std::cerr << "[miner-worker] Result for job " << job->job_id << " was rejected" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[miner-worker] Error: " << e.what() << std::endl;
            if (!client.submit_failure(job->job_id, "PROCESSING_ERROR", e.what())) {
                std::cerr << "[miner-worker] Failure report for job " << job->job_id << " was rejected" << std::endl;
            }
        }
        --inflight;
    } while (!once);
    return 0;
}
