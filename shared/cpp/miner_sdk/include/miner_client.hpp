#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

struct AssignedJob {
    std::string job_id;
    nlohmann::json payload;
    nlohmann::json constraints;
};

struct HttpResult {
    long status{0}; // 0 when the transport failed
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Blocking JSON-over-HTTP helper for the miner client below.
class CoordinatorHttp {
public:
    explicit CoordinatorHttp(std::string base_url, long timeout_seconds = 40);
    HttpResult post(const std::string& path, const nlohmann::json& body,
                    const std::string& id_header, const std::string& id) const;

private:
    HttpResult perform(const std::string& path, const std::string& body,
                       const std::string& id_header, const std::string& id) const;

    std::string base_;
    long timeout_seconds_;
};

// Miner side of the coordinator API. Requests carry X-Miner-Id.
class MinerClient {
public:
    MinerClient(std::string base_url, std::string miner_id);

    // Returns the session token.
    std::optional<std::string> register_miner(const nlohmann::json& capabilities, int concurrency,
                                              const std::string& region = {});
    bool heartbeat(int inflight, const std::string& status = "ONLINE",
                   const nlohmann::json& metadata = nlohmann::json::object());
    std::optional<AssignedJob> poll(int max_wait_seconds = 0);
    bool submit_result(const std::string& job_id, const nlohmann::json& result, const nlohmann::json& metrics);
    bool submit_failure(const std::string& job_id, const std::string& error_code,
                        const std::string& error_message, const nlohmann::json& metrics = nlohmann::json::object());

    const std::string& miner_id() const { return miner_id_; }

private:
    CoordinatorHttp http_;
    std::string miner_id_;
};
