#pragma once
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct MHD_Daemon;

struct HttpRequest {
    std::string method;
    std::string path;
    std::string body;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers; // keys lowercased

    std::string header(const std::string& name) const;
    std::string query_param(const std::string& name) const;
};

struct HttpResponse {
    int status{200};
    std::string body;
    std::string content_type{"application/json"};
};

using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

HttpResponse json_response(int status, const nlohmann::json& body);
HttpResponse no_content();
HttpResponse error_response(int status, const std::string& code, const std::string& message);

// Runs fn and turns the typed errors from errors.hpp into their HTTP statuses.
HttpResponse guarded(const std::function<HttpResponse()>& fn);

// Splits "/a/b/c" into {"a","b","c"}.
std::vector<std::string> split_path(const std::string& path);

// Embedded libmicrohttpd daemon dispatching complete requests to one handler.
class HttpServer {
public:
    HttpServer(int port, HttpHandler handler, unsigned int threads = 8);
    ~HttpServer();
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void start();
    void stop();
    bool running() const { return daemon_ != nullptr; }
    int port() const { return port_; }

private:
    int port_;
    unsigned int threads_;
    HttpHandler handler_;
    MHD_Daemon* daemon_ {nullptr};

    friend struct HttpServerAccess;
};
