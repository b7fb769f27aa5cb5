#include "../include/miner_client.hpp"
#include <curl/curl.h>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace {
static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

static std::optional<json> parse_ok(const HttpResult& r) {
    if (!r.ok() || r.body.empty()) return std::nullopt;
    try {
        return json::parse(r.body);
    } catch (const json::exception& e) {
        std::cerr << "[miner-sdk] malformed response: " << e.what() << std::endl;
        return std::nullopt;
    }
}
}

CoordinatorHttp::CoordinatorHttp(std::string base_url, long timeout_seconds)
    : base_(std::move(base_url)), timeout_seconds_(timeout_seconds) {
    if (!base_.empty() && base_.back() == '/') base_.pop_back();
}

HttpResult CoordinatorHttp::perform(const std::string& path, const std::string& body,
                                    const std::string& id_header, const std::string& id) const {
    CurlHandle c;
    std::string url = base_ + path;
    std::string id_line = id_header + ": " + id;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, id_line.c_str());
    HttpResult out;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)body.size());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &out.body);
    CURLcode code = curl_easy_perform(c.h);
    curl_slist_free_all(headers);
    if (code != CURLE_OK) {
        std::cerr << "[miner-sdk] " << url << ": " << curl_easy_strerror(code) << std::endl;
        return HttpResult{};
    }
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &out.status);
    if (!out.ok()) std::cerr << "[miner-sdk] " << url << " returned " << out.status << ": " << out.body << std::endl;
    return out;
}

HttpResult CoordinatorHttp::post(const std::string& path, const json& body,
                                 const std::string& id_header, const std::string& id) const {
    std::string body_str = body.dump();
    return perform(path, body_str, id_header, id);
}

MinerClient::MinerClient(std::string base_url, std::string miner_id)
    : http_(std::move(base_url)), miner_id_(std::move(miner_id)) {}

std::optional<std::string> MinerClient::register_miner(const json& capabilities, int concurrency,
                                                       const std::string& region) {
    json body = {{"capabilities", capabilities}, {"concurrency", concurrency}};
    if (!region.empty()) body["region"] = region;
    auto j = parse_ok(http_.post("/miners/register", body, "X-Miner-Id", miner_id_));
    if (!j || !j->contains("session_token")) return std::nullopt;
    return (*j)["session_token"].get<std::string>();
}

bool MinerClient::heartbeat(int inflight, const std::string& status, const json& metadata) {
    json body = {{"inflight", inflight}, {"status", status}, {"metadata", metadata}};
    return http_.post("/miners/heartbeat", body, "X-Miner-Id", miner_id_).ok();
}

std::optional<AssignedJob> MinerClient::poll(int max_wait_seconds) {
    HttpResult r = http_.post("/miners/poll", {{"max_wait_seconds", max_wait_seconds}}, "X-Miner-Id", miner_id_);
    if (r.status == 204) return std::nullopt;
    auto j = parse_ok(r);
    if (!j) return std::nullopt;
    AssignedJob job;
    job.job_id = j->at("job_id").get<std::string>();
    job.payload = j->value("payload", json::object());
    job.constraints = j->value("constraints", json::object());
    return job;
}

bool MinerClient::submit_result(const std::string& job_id, const json& result, const json& metrics) {
    json body = {{"result", result}, {"metrics", metrics}};
    return http_.post("/miners/" + job_id + "/result", body, "X-Miner-Id", miner_id_).ok();
}

bool MinerClient::submit_failure(const std::string& job_id, const std::string& error_code,
                                 const std::string& error_message, const json& metrics) {
    json body = {{"error_code", error_code}, {"error_message", error_message}, {"metrics", metrics}};
    return http_.post("/miners/" + job_id + "/fail", body, "X-Miner-Id", miner_id_).ok();
}
