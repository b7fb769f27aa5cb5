#include "../include/http_server.hpp"
#include "../include/errors.hpp"
#include <microhttpd.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>
#include <stdexcept>

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

using json = nlohmann::json;

std::string HttpRequest::header(const std::string& name) const {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    auto it = headers.find(key);
    return it == headers.end() ? std::string() : it->second;
}

std::string HttpRequest::query_param(const std::string& name) const {
    auto it = query.find(name);
    return it == query.end() ? std::string() : it->second;
}

HttpResponse json_response(int status, const json& body) {
    return HttpResponse{status, body.dump(), "application/json"};
}

HttpResponse no_content() {
    return HttpResponse{204, "", "text/plain"};
}

HttpResponse error_response(int status, const std::string& code, const std::string& message) {
    json err = {{"error", {{"code", code}, {"message", message}, {"status", status}}}};
    return json_response(status, err);
}

HttpResponse guarded(const std::function<HttpResponse()>& fn) {
    try {
        return fn();
    } catch (const NotFoundError& e) {
        return error_response(404, "NOT_FOUND", e.what());
    } catch (const ConflictError& e) {
        return error_response(409, "CONFLICT", e.what());
    } catch (const ValidationError& e) {
        return error_response(422, "VALIDATION_ERROR", e.what());
    } catch (const json::exception& e) {
        return error_response(400, "BAD_REQUEST", e.what());
    } catch (const InfrastructureError& e) {
        std::cerr << "[http] infrastructure error: " << e.what() << std::endl;
        return error_response(503, "UNAVAILABLE", e.what());
    } catch (const std::exception& e) {
        std::cerr << "[http] internal error: " << e.what() << std::endl;
        return error_response(500, "INTERNAL_ERROR", e.what());
    }
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::size_t pos = 0;
    while (pos <= path.size()) {
        std::size_t next = path.find('/', pos);
        if (next == std::string::npos) next = path.size();
        if (next > pos) parts.push_back(path.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

namespace {
struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

MhdResult collect_value(void* cls, enum MHD_ValueKind, const char* key, const char* val) {
    auto* m = static_cast<std::map<std::string, std::string>*>(cls);
    (*m)[key ? key : ""] = val ? val : "";
    return MHD_YES;
}

MhdResult collect_header(void* cls, enum MHD_ValueKind, const char* key, const char* val) {
    auto* m = static_cast<std::map<std::string, std::string>*>(cls);
    std::string k = key ? key : "";
    std::transform(k.begin(), k.end(), k.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    (*m)[k] = val ? val : "";
    return MHD_YES;
}

MhdResult send_response(struct MHD_Connection* conn, const HttpResponse& r) {
    struct MHD_Response* resp = MHD_create_response_from_buffer(r.body.size(), (void*)r.body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, r.content_type.c_str());
    MhdResult ret = MHD_queue_response(conn, (unsigned int)r.status, resp);
    MHD_destroy_response(resp);
    return ret;
}

void request_completed(void*, struct MHD_Connection*, void** con_cls, enum MHD_RequestTerminationCode) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}
}

struct HttpServerAccess {
    static MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                             const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
        auto* server = static_cast<HttpServer*>(cls);
        ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
        if (!ci) {
            ci = new ConnInfo{method, url, {}};
            *con_cls = ci;
            return MHD_YES;
        }

        if (*upload_data_size) {
            ci->body.append(upload_data, *upload_data_size);
            *upload_data_size = 0;
            return MHD_YES;
        }

        HttpRequest req;
        req.method = ci->method;
        req.path = ci->url;
        req.body = std::move(ci->body);
        MHD_get_connection_values(connection, MHD_GET_ARGUMENT_KIND, &collect_value, &req.query);
        MHD_get_connection_values(connection, MHD_HEADER_KIND, &collect_header, &req.headers);

        HttpResponse resp = guarded([&]{ return server->handler_(req); });
        return send_response(connection, resp);
    }
};

HttpServer::HttpServer(int port, HttpHandler handler, unsigned int threads)
    : port_(port), threads_(threads == 0 ? 1 : threads), handler_(std::move(handler)) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (daemon_) return;
    daemon_ = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, (uint16_t)port_, nullptr, nullptr,
                               &HttpServerAccess::handler, this,
                               MHD_OPTION_THREAD_POOL_SIZE, threads_,
                               MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                               MHD_OPTION_END);
    if (!daemon_) {
        throw std::runtime_error("Failed to start HTTP server on port " + std::to_string(port_));
    }
}

void HttpServer::stop() {
    if (daemon_) {
        MHD_stop_daemon(daemon_);
        daemon_ = nullptr;
    }
}
